#pragma once

#include <cstdint>
#include <string>
#include "protocol/tool_contract.hpp"
#include "tools/repository_context.hpp"

namespace deploypilot::tools {

enum class RepositoryAction {
    Clone,
    ListFiles,
    ReadFile,
    GetRepoInfo
};

class RepositoryTool : public protocol::ToolHandler {
public:
    RepositoryTool(RepositoryContext& context, std::uint32_t clone_timeout_ms = 300000);

    protocol::ToolCallResult execute(const nlohmann::json& arguments) override;
    static nlohmann::json input_schema();

private:
    protocol::ToolCallResult clone(const nlohmann::json& arguments);
    protocol::ToolCallResult list_files(const nlohmann::json& arguments);
    protocol::ToolCallResult read_file(const nlohmann::json& arguments);
    protocol::ToolCallResult get_repo_info();

    RepositoryContext& context_;
    std::uint32_t clone_timeout_ms_;
};

}  // namespace deploypilot::tools
