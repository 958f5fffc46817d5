#pragma once
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace deploypilot::protocol {

    // How a caller asks the server to run a tool
    struct ToolCallRequest {
        std::string name;
        nlohmann::json arguments = nlohmann::json::object();
    };

    // Handlers encode structured output as text; problems are reported here
    // too rather than thrown.
    struct ToolCallResult {
        std::string content;
    };

    // Every tool implements this single operation.
    class ToolHandler {
    public:
        virtual ~ToolHandler() = default;
        virtual ToolCallResult execute(const nlohmann::json& arguments) = 0;
    };

    // What handshake and listing responses expose (never the handler).
    struct ToolSummary {
        std::string name;
        std::string description;
        nlohmann::json input_schema = nlohmann::json::object();
    };

    struct ToolDescriptor {
        std::string name;
        std::string description;
        nlohmann::json input_schema = nlohmann::json::object();
        std::shared_ptr<ToolHandler> handler;
    };

} // namespace deploypilot::protocol
