#include "server/server_runtime.hpp"

#include <chrono>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "tools/code_analysis_tool.hpp"
#include "tools/command_tool.hpp"
#include "tools/repository_guard.hpp"
#include "tools/repository_tool.hpp"
#include "tools/ui_generator_tool.hpp"
#include "tools/utility_tools.hpp"

namespace deploypilot::server {

using protocol::ToolDescriptor;

ServerRuntime::ServerRuntime(const core::config::ServerConfig& config)
    : config_(config), supervisor_(std::chrono::milliseconds(config.stop_timeout_ms)) {}

ServerRuntime::~ServerRuntime() {
    shutdown();
}

core::errors::Result<std::unique_ptr<ServerRuntime>> ServerRuntime::create(
    const core::config::ServerConfig& config) {
    std::unique_ptr<ServerRuntime> runtime(new ServerRuntime(config));
    auto registered = runtime->register_builtin_tools();
    if (core::errors::is_error(registered)) {
        return core::errors::get_error(registered);
    }
    LOG_INFO("ServerRuntime: registered " + std::to_string(core::errors::get_value(registered)) +
             " tools");
    return std::move(runtime);
}

core::errors::Result<std::size_t> ServerRuntime::register_builtin_tools() {
    tools::UiGeneratorOptions ui_options;
    ui_options.grace_period = std::chrono::milliseconds(config_.preview_grace_ms);
    ui_options.install_timeout_ms = config_.install_timeout_ms;

    tools::DeploymentOptions deploy_options;
    deploy_options.compose_command = config_.compose_command;
    deploy_options.deploy_timeout_ms = config_.deploy_timeout_ms;
    deployment_tool_ = std::make_shared<tools::DeploymentTool>(repository_, deploy_options);

    auto ui_tool = std::make_shared<tools::UiGeneratorTool>(repository_, supervisor_, ui_options);
    auto analysis_tool = std::make_shared<tools::CodeAnalysisTool>(repository_);

    tools::GuardRequirements ui_guard;
    ui_guard.exempt_actions = {"stop_ui", "list_sessions"};
    tools::GuardRequirements analysis_guard;
    analysis_guard.require_git_work_tree = true;
    tools::GuardRequirements deploy_guard;
    deploy_guard.exempt_actions = {"stop"};

    std::vector<ToolDescriptor> descriptors = {
        {"get_time", "Get the current time", tools::TimeTool::input_schema(),
         std::make_shared<tools::TimeTool>()},
        {"calculate", "Perform a simple calculation", tools::CalculatorTool::input_schema(),
         std::make_shared<tools::CalculatorTool>()},
        {"get_weather", "Get weather information for a location", tools::WeatherTool::input_schema(),
         std::make_shared<tools::WeatherTool>()},
        {"github_repo", "Clone and interact with GitHub repositories",
         tools::RepositoryTool::input_schema(),
         std::make_shared<tools::RepositoryTool>(repository_, config_.clone_timeout_ms)},
        {"execute_command",
         "Execute a shell command, by default inside the cloned repository. WARNING: the command "
         "runs unrestricted with the server's privileges; only connect trusted clients.",
         tools::CommandTool::input_schema(), std::make_shared<tools::CommandTool>(repository_)},
        {"ui_generator",
         "Find runnable apps in the cloned repository and start them as local preview servers "
         "(scan_apps, generate_ui, stop_ui, list_sessions)",
         tools::UiGeneratorTool::input_schema(),
         std::make_shared<tools::RepositoryGuard>(ui_tool, repository_, ui_guard)},
        {"code_analysis",
         "Analyze the cloned repository: summary, per-file metrics, pattern search and dependencies",
         tools::CodeAnalysisTool::input_schema(),
         std::make_shared<tools::RepositoryGuard>(analysis_tool, repository_, analysis_guard)},
        {"auto_deploy",
         "Detect the project type, generate a Dockerfile and docker-compose.yml and deploy with "
         "docker compose. WARNING: builds and runs repository code with the server's privileges; "
         "only connect trusted clients.",
         tools::DeploymentTool::input_schema(),
         std::make_shared<tools::RepositoryGuard>(deployment_tool_, repository_, deploy_guard)},
    };

    for (auto& descriptor : descriptors) {
        auto registered = registry_.register_tool(std::move(descriptor));
        if (core::errors::is_error(registered)) {
            return core::errors::get_error(registered);
        }
    }
    return registry_.size();
}

void ServerRuntime::shutdown() {
    const std::size_t stopped = supervisor_.stop_all();
    if (stopped > 0) {
        LOG_INFO("ServerRuntime: stopped " + std::to_string(stopped) + " preview sessions");
    }
    if (deployment_tool_) {
        deployment_tool_->shutdown();
    }
    repository_.clear();
}

}  // namespace deploypilot::server
