#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/pilot_errors.hpp"
#include "core/logging/logger.hpp"

namespace deploypilot::core::config {

struct ServerConfig {
    logging::LogLevel log_level = logging::LogLevel::INFO;
    std::filesystem::path env_file = ".env";
    std::uint32_t preview_grace_ms = 3000;
    std::uint32_t stop_timeout_ms = 5000;
    std::uint32_t clone_timeout_ms = 300000;
    std::uint32_t install_timeout_ms = 600000;
    std::uint32_t deploy_timeout_ms = 900000;
    std::string compose_command = "docker compose";
};

struct ClientConfig {
    std::string server_command;
    logging::LogLevel log_level = logging::LogLevel::INFO;
    std::filesystem::path env_file = ".env";
    std::string api_key;
    std::string api_url = "https://api.anthropic.com/v1/messages";
    std::string model = "claude-3-5-sonnet-20241022";
    std::uint32_t max_tokens = 4000;
    std::uint32_t max_rounds = 10;
    std::uint32_t handshake_timeout_ms = 5000;
    std::uint32_t call_timeout_ms = 300000;
    std::optional<std::string> call_tool;
    std::string call_arguments = "{}";
};

// Reads KEY=VALUE lines into the process environment. Variables that are
// already set win over the file. Returns the number of variables applied.
errors::Result<std::size_t> load_env_file(const std::filesystem::path& path);

std::optional<std::string> env_value(const std::string& key);

// Environment overlays, applied before command-line flags.
void apply_environment(ServerConfig& config);
void apply_environment(ClientConfig& config);

}  // namespace deploypilot::core::config
