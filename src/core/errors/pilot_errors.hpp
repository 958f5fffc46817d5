#pragma once
#include <string>
#include <variant>

namespace deploypilot::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,       // E.g., bad CLI flag or malformed tool arguments
        Execution,   // E.g., an external process could not be run
        Provider,    // E.g., the language-model API failed or timed out
        Connection,  // E.g., server process failed to start or handshake timed out
        Protocol,    // E.g., a wire message could not be decoded
        Internal     // E.g., pipe/fork failure or a logic bug
    };

    // The standardized error payload
    struct PilotError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. Propagation strategy: a Result holds either a value of type T or a PilotError.
    template <typename T>
    using Result = std::variant<T, PilotError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<PilotError>(result);
    }

    template <typename T>
    const PilotError& get_error(const Result<T>& result) {
        return std::get<PilotError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:      return "input";
            case ErrorCategory::Execution:  return "execution";
            case ErrorCategory::Provider:   return "provider";
            case ErrorCategory::Connection: return "connection";
            case ErrorCategory::Protocol:   return "protocol";
            case ErrorCategory::Internal:   return "internal";
            default: return "unknown";
        }
    }

} // namespace deploypilot::core::errors
