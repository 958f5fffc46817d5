#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/settings.hpp"
#include "core/errors/pilot_errors.hpp"
#include "core/logging/logger.hpp"

namespace deploypilot::app::cli {

    // Validated flags; unset fields leave the configured value alone.
    struct ServerCommandLine {
        bool show_help = false;
        std::optional<core::logging::LogLevel> log_level;
        std::optional<std::filesystem::path> env_file;
        std::optional<std::uint32_t> preview_grace_ms;
        std::optional<std::uint32_t> stop_timeout_ms;
    };

    struct ClientCommandLine {
        bool show_help = false;
        std::string server;
        std::optional<core::logging::LogLevel> log_level;
        std::optional<std::filesystem::path> env_file;
        std::optional<std::string> model;
        std::optional<std::uint32_t> max_tokens;
        std::optional<std::uint32_t> max_rounds;
        std::optional<std::string> call_tool;
        std::optional<nlohmann::json> call_arguments;
    };

    // Error codes: missing_value, unknown_argument, invalid_integer,
    // bounds_error, invalid_value, missing_required_flag, conflicting_flags.
    core::errors::Result<ServerCommandLine> parse_server_command_line(int argc, char* argv[]);
    core::errors::Result<ClientCommandLine> parse_client_command_line(int argc, char* argv[]);

    void apply(const ServerCommandLine& command_line, core::config::ServerConfig& config);
    void apply(const ClientCommandLine& command_line, core::config::ClientConfig& config);

    std::string server_usage();
    std::string client_usage();

} // namespace deploypilot::app::cli
