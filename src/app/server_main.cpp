#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <unistd.h>
#include "app/cli_parser.hpp"
#include "core/config/settings.hpp"
#include "core/errors/pilot_errors.hpp"
#include "core/logging/logger.hpp"
#include "server/dispatcher.hpp"
#include "server/server_runtime.hpp"

namespace {

// Closing stdin turns a termination request into an ordinary end of input,
// so the normal shutdown path (sessions, deployments, checkout) still runs.
void request_shutdown(int) {
    static_cast<void>(close(STDIN_FILENO));
}

void install_signal_handlers() {
    struct sigaction action {};
    action.sa_handler = request_shutdown;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;  // no SA_RESTART: the blocked read must return
    static_cast<void>(sigaction(SIGTERM, &action, nullptr));
    static_cast<void>(sigaction(SIGINT, &action, nullptr));
    static_cast<void>(std::signal(SIGPIPE, SIG_IGN));
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace config = deploypilot::core::config;
    namespace errors = deploypilot::core::errors;
    deploypilot::core::logging::Logger::get().set_scope("server");

    // 1. Parse CLI input and return normalized input errors
    auto parsed = deploypilot::app::cli::parse_server_command_line(argc, argv);
    if (errors::is_error(parsed)) {
        const auto& err = errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& command_line = errors::get_value(parsed);
    if (command_line.show_help) {
        // stdout belongs to the protocol channel.
        std::cerr << deploypilot::app::cli::server_usage() << std::endl;
        return 0;
    }

    // 2. Layer the configuration: defaults, .env, environment, flags
    config::ServerConfig server_config;
    const auto env_file = command_line.env_file.value_or(server_config.env_file);
    auto loaded = config::load_env_file(env_file);
    if (errors::is_error(loaded)) {
        if (command_line.env_file.has_value()) {
            const auto& err = errors::get_error(loaded);
            LOG_ERROR("Input error [" + err.code + "]: " + err.message);
            return 2;
        }
        LOG_DEBUG("No environment file at " + env_file.string());
    }
    config::apply_environment(server_config);
    deploypilot::app::cli::apply(command_line, server_config);
    deploypilot::core::logging::Logger::get().set_level(server_config.log_level);

    install_signal_handlers();

    // 3. Build the tool set and serve until end of input
    auto created = deploypilot::server::ServerRuntime::create(server_config);
    if (errors::is_error(created)) {
        const auto& err = errors::get_error(created);
        LOG_ERROR("Failed to register tools [" + err.code + "]: " + err.message);
        return 1;
    }
    auto& runtime = std::get<std::unique_ptr<deploypilot::server::ServerRuntime>>(created);

    LOG_INFO("Tool server ready on stdio");
    deploypilot::server::Dispatcher dispatcher(runtime->registry());
    dispatcher.run(std::cin, std::cout);

    // 4. Tear down everything started on the client's behalf
    runtime->shutdown();
    LOG_INFO("Tool server stopped");
    return 0;
}
