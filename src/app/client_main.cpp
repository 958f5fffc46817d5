#include <chrono>
#include <iostream>
#include <string>
#include <vector>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "client/anthropic_provider.hpp"
#include "client/client_session.hpp"
#include "core/config/settings.hpp"
#include "core/errors/pilot_errors.hpp"
#include "core/logging/logger.hpp"

namespace {

namespace client = deploypilot::client;

void print_tools(const std::vector<deploypilot::protocol::ToolSummary>& tools) {
    std::cout << "Connected. Available tools:" << std::endl;
    for (const auto& tool : tools) {
        std::cout << "  - " << tool.name << ": " << tool.description << std::endl;
    }
}

void print_conversation(const client::ConversationResult& result) {
    if (!result.text.empty()) {
        std::cout << result.text << std::endl;
    }
    for (const auto& used : result.tools_used) {
        std::cout << "[tool " << used.name << " " << used.arguments.dump() << "]" << std::endl;
    }
}

// One query per line until end of input or "quit".
void run_interactive(client::ClientSession& session, client::LlmProvider& provider) {
    deploypilot::protocol::ConversationHistory history;
    std::string line;
    std::cout << "Type a query, 'clear' to reset the conversation, 'quit' to exit." << std::endl;
    while (true) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        if (line == "quit" || line == "exit") {
            break;
        }
        if (line == "clear") {
            history.clear();
            std::cout << "Conversation cleared." << std::endl;
            continue;
        }

        auto answered = session.converse(provider, line, history);
        if (deploypilot::core::errors::is_error(answered)) {
            const auto& err = deploypilot::core::errors::get_error(answered);
            std::cout << "Error: " << err.message << std::endl;
            if (!err.hint.empty()) {
                std::cout << "Hint: " << err.hint << std::endl;
            }
            continue;
        }
        print_conversation(deploypilot::core::errors::get_value(answered));
        if (!session.connected()) {
            break;
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace config = deploypilot::core::config;
    namespace errors = deploypilot::core::errors;
    deploypilot::core::logging::Logger::get().set_scope("client");

    // 1. Parse CLI input and return normalized input errors
    auto parsed = deploypilot::app::cli::parse_client_command_line(argc, argv);
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
        std::cout << deploypilot::app::cli::client_usage() << std::endl;
        return 0;
    }

    // 2. Layer the configuration: defaults, .env, environment, flags
    config::ClientConfig client_config;
    const auto env_file = command_line.env_file.value_or(client_config.env_file);
    auto loaded = config::load_env_file(env_file);
    if (errors::is_error(loaded)) {
        if (command_line.env_file.has_value()) {
            const auto& err = errors::get_error(loaded);
            LOG_ERROR("Input error [" + err.code + "]: " + err.message);
            return 2;
        }
        LOG_DEBUG("No environment file at " + env_file.string());
    }
    config::apply_environment(client_config);
    deploypilot::app::cli::apply(command_line, client_config);
    deploypilot::core::logging::Logger::get().set_level(client_config.log_level);

    // 3. Connect: spawn the server and complete the handshake
    client::SessionOptions options;
    options.handshake_timeout = std::chrono::milliseconds(client_config.handshake_timeout_ms);
    options.call_timeout = std::chrono::milliseconds(client_config.call_timeout_ms);
    options.max_rounds = client_config.max_rounds;
    client::ClientSession session(options);

    auto started = session.start(client_config.server_command);
    if (errors::is_error(started)) {
        const auto& err = errors::get_error(started);
        LOG_ERROR("Connection error [" + err.code + "]: " + err.message);
        return 3;
    }
    auto handshake = session.handshake();
    if (errors::is_error(handshake)) {
        const auto& err = errors::get_error(handshake);
        LOG_ERROR("Connection error [" + err.code + "]: " + err.message);
        return 3;
    }

    // 4a. Single tool call without a model
    if (client_config.call_tool) {
        const auto arguments = nlohmann::json::parse(client_config.call_arguments, nullptr, false);
        std::cout << session.call(*client_config.call_tool,
                                  arguments.is_object() ? arguments : nlohmann::json::object())
                  << std::endl;
        session.cleanup();
        return 0;
    }

    // 4b. Model-driven conversation
    print_tools(session.tools());
    curl_global_init(CURL_GLOBAL_ALL);
    client::AnthropicOptions provider_options;
    provider_options.api_key = client_config.api_key;
    provider_options.api_url = client_config.api_url;
    provider_options.model = client_config.model;
    provider_options.max_tokens = client_config.max_tokens;
    {
        client::AnthropicProvider provider(provider_options);
        run_interactive(session, provider);
    }
    session.cleanup();
    curl_global_cleanup();
    return 0;
}
