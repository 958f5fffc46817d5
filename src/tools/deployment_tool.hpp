#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "core/errors/pilot_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/repository_context.hpp"

namespace deploypilot::tools {

enum class DeployAction {
    Autodeploy,
    GenerateDeploymentFiles,
    Deploy,
    Stop
};

// What the checkout looks like from a container's point of view.
struct ProjectProfile {
    std::string runtime;     // node, python, static, custom
    std::string framework;   // express, next, react, flask, fastapi, django, streamlit, ...
    std::string entry_point; // relative to the repository root; may be empty
    std::uint16_t container_port = 0;
    bool has_start_script = false;
};

struct DeploymentRecord {
    std::string deployment_id;
    std::filesystem::path working_directory;
    std::string framework;
    std::uint16_t host_port = 0;
    std::string url;
};

struct DeploymentOptions {
    // Split on whitespace; "-p <id> up -d --build" is appended.
    std::string compose_command = "docker compose";
    std::uint32_t deploy_timeout_ms = 900000;
    std::uint32_t teardown_timeout_ms = 120000;
};

// Builds container definitions for the checkout and drives docker compose.
// Every published port is bound to the loopback interface.
class DeploymentTool : public protocol::ToolHandler {
public:
    explicit DeploymentTool(const RepositoryContext& context, DeploymentOptions options = {});
    ~DeploymentTool() override;

    DeploymentTool(const DeploymentTool&) = delete;
    DeploymentTool& operator=(const DeploymentTool&) = delete;

    protocol::ToolCallResult execute(const nlohmann::json& arguments) override;
    static nlohmann::json input_schema();

    // Error code: unsupported_project.
    static core::errors::Result<ProjectProfile> detect(const std::filesystem::path& root);
    static std::string render_dockerfile(const ProjectProfile& profile);
    static std::string render_dockerignore(const ProjectProfile& profile);
    static std::string render_compose(const ProjectProfile& profile, std::uint16_t host_port);

    std::vector<DeploymentRecord> deployments() const;

    // Brings every tracked deployment down; returns how many were stopped.
    std::size_t shutdown();

private:
    struct GeneratedFiles {
        ProjectProfile profile;
        std::uint16_t host_port = 0;
        std::vector<std::string> written;
        std::vector<std::string> kept;
    };

    core::errors::Result<GeneratedFiles> generate_files(const std::filesystem::path& root) const;
    core::errors::Result<DeploymentRecord> bring_up(const std::filesystem::path& root,
                                                    const GeneratedFiles& files);
    core::errors::Result<bool> bring_down(const DeploymentRecord& record) const;
    std::vector<std::string> compose_argv(const std::string& project) const;
    std::string allocate_deployment_id() const;

    protocol::ToolCallResult autodeploy();
    protocol::ToolCallResult generate_deployment_files();
    protocol::ToolCallResult deploy();
    protocol::ToolCallResult stop(const nlohmann::json& arguments);

    const RepositoryContext& context_;
    DeploymentOptions options_;
    mutable std::mutex mutex_;
    std::map<std::string, DeploymentRecord> deployments_;
};

}  // namespace deploypilot::tools
