#include "core/config/settings.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>

namespace deploypilot::core::config {

using errors::ErrorCategory;
using errors::PilotError;

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string strip_quotes(const std::string& value) {
    if (value.size() >= 2) {
        const char front = value.front();
        const char back = value.back();
        if ((front == '"' && back == '"') || (front == '\'' && back == '\'')) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

}  // namespace

errors::Result<std::size_t> load_env_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return PilotError{ErrorCategory::Input,
                          "Environment file not found: " + path.string(),
                          "env_file_not_found"};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return PilotError{ErrorCategory::Input,
                          "Unable to open environment file: " + path.string(),
                          "env_file_unreadable"};
    }

    std::size_t applied = 0;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        const std::string key = trim(line.substr(0, eq));
        const std::string value = strip_quotes(trim(line.substr(eq + 1)));
        if (key.empty()) {
            continue;
        }
        if (setenv(key.c_str(), value.c_str(), 0) == 0) {
            ++applied;
        }
    }
    return applied;
}

std::optional<std::string> env_value(const std::string& key) {
    const char* raw = std::getenv(key.c_str());
    if (raw == nullptr || *raw == '\0') {
        return std::nullopt;
    }
    return std::string(raw);
}

void apply_environment(ServerConfig& config) {
    if (const auto level = env_value("DEPLOYPILOT_LOG_LEVEL")) {
        if (const auto parsed = logging::parse_log_level(*level)) {
            config.log_level = *parsed;
        }
    }
    if (const auto compose = env_value("DEPLOYPILOT_COMPOSE_COMMAND")) {
        config.compose_command = *compose;
    }
}

void apply_environment(ClientConfig& config) {
    if (const auto level = env_value("DEPLOYPILOT_LOG_LEVEL")) {
        if (const auto parsed = logging::parse_log_level(*level)) {
            config.log_level = *parsed;
        }
    }
    if (const auto key = env_value("ANTHROPIC_API_KEY")) {
        config.api_key = *key;
    }
    if (const auto model = env_value("DEPLOYPILOT_MODEL")) {
        config.model = *model;
    }
}

}  // namespace deploypilot::core::config
