#pragma once

#include <memory>
#include "core/config/settings.hpp"
#include "core/errors/pilot_errors.hpp"
#include "process/process_supervisor.hpp"
#include "tools/deployment_tool.hpp"
#include "tools/repository_context.hpp"
#include "tools/tool_registry.hpp"

namespace deploypilot::server {

// Owns the state shared by the built-in tools: the repository context, the
// preview process supervisor and the deployment table.
class ServerRuntime {
public:
    // Registers the built-in tools in their advertised order.
    static core::errors::Result<std::unique_ptr<ServerRuntime>> create(
        const core::config::ServerConfig& config);

    ~ServerRuntime();

    ServerRuntime(const ServerRuntime&) = delete;
    ServerRuntime& operator=(const ServerRuntime&) = delete;

    const tools::ToolRegistry& registry() const { return registry_; }
    tools::RepositoryContext& repository() { return repository_; }
    process::ProcessSupervisor& supervisor() { return supervisor_; }

    // Stops preview sessions, tears down deployments and removes the
    // checkout. Safe to call more than once.
    void shutdown();

private:
    explicit ServerRuntime(const core::config::ServerConfig& config);
    core::errors::Result<std::size_t> register_builtin_tools();

    core::config::ServerConfig config_;
    tools::RepositoryContext repository_;
    process::ProcessSupervisor supervisor_;
    std::shared_ptr<tools::DeploymentTool> deployment_tool_;
    tools::ToolRegistry registry_;
};

}  // namespace deploypilot::server
