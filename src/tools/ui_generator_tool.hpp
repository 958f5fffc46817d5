#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "process/process_supervisor.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/repository_context.hpp"

namespace deploypilot::tools {

enum class UiAction {
    ScanApps,
    GenerateUi,
    StopUi,
    ListSessions
};

struct UiGeneratorOptions {
    std::chrono::milliseconds grace_period{3000};
    std::uint32_t install_timeout_ms = 600000;
    std::string python_command = "python3";
};

struct AppCandidate {
    std::filesystem::path relative_path;
    std::string app_type;      // streamlit, flask, express, static, ...
    std::string description;
};

// Finds runnable entry points in the checkout and runs them as preview
// servers bound to the loopback interface.
class UiGeneratorTool : public protocol::ToolHandler {
public:
    UiGeneratorTool(const RepositoryContext& context, process::ProcessSupervisor& supervisor,
                    UiGeneratorOptions options = {});

    protocol::ToolCallResult execute(const nlohmann::json& arguments) override;
    static nlohmann::json input_schema();

    static std::vector<AppCandidate> scan(const std::filesystem::path& root);
    // Framework sniffed from file content.
    static std::string classify(const std::filesystem::path& file);
    static std::string extract_description(const std::filesystem::path& file);

private:
    protocol::ToolCallResult scan_apps();
    protocol::ToolCallResult generate_ui(const nlohmann::json& arguments);
    protocol::ToolCallResult stop_ui(const nlohmann::json& arguments);
    protocol::ToolCallResult list_sessions();

    const RepositoryContext& context_;
    process::ProcessSupervisor& supervisor_;
    UiGeneratorOptions options_;
};

}  // namespace deploypilot::tools
