#pragma once
#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace deploypilot::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_log_level(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn" || text == "warning") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // 2. Global Logger Setup
    // Everything goes to stderr: the server's stdout carries the protocol channel.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_scope(const std::string& scope) {
            std::lock_guard<std::mutex> lock(mutex_);
            scope_ = scope;
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            threshold_ = level;
        }

        LogLevel level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return threshold_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(threshold_)) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (scope_.empty() ? "" : "[" + scope_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string scope_;
        LogLevel threshold_ = LogLevel::INFO;

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros
    #define LOG_DEBUG(msg) deploypilot::core::logging::Logger::get().log(deploypilot::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  deploypilot::core::logging::Logger::get().log(deploypilot::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  deploypilot::core::logging::Logger::get().log(deploypilot::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) deploypilot::core::logging::Logger::get().log(deploypilot::core::logging::LogLevel::ERROR, msg)

} // namespace deploypilot::core::logging
