#include "protocol/wire_messages.hpp"

namespace deploypilot::protocol {

using core::errors::ErrorCategory;
using core::errors::PilotError;
using nlohmann::json;

namespace {

json tools_to_json(const std::vector<ToolSummary>& tools) {
    json out = json::array();
    for (const auto& tool : tools) {
        out.push_back(summary_to_json(tool));
    }
    return out;
}

std::string describe_type(const json& message) {
    if (!message.is_object() || !message.contains("type")) {
        return "None";
    }
    const auto& type = message["type"];
    return type.is_string() ? type.get<std::string>() : type.dump();
}

}  // namespace

core::errors::Result<WireRequest> decode_request(const std::string& line) {
    json message;
    try {
        message = json::parse(line);
    } catch (const json::parse_error& e) {
        return PilotError{ErrorCategory::Protocol, std::string("Invalid JSON: ") + e.what(),
                          "invalid_json"};
    }

    const std::string type = describe_type(message);
    WireRequest request;
    if (type == "initialize") {
        request.type = RequestType::Initialize;
        return request;
    }
    if (type == "list_tools") {
        request.type = RequestType::ListTools;
        return request;
    }
    if (type != "execute_tool") {
        return PilotError{ErrorCategory::Protocol, "Unknown request type: " + type,
                          "unknown_request_type"};
    }

    request.type = RequestType::ExecuteTool;
    if (!message.contains("name") || !message["name"].is_string()) {
        return PilotError{ErrorCategory::Protocol,
                          "execute_tool request requires a string 'name'",
                          "invalid_request"};
    }
    request.call.name = message["name"].get<std::string>();

    if (message.contains("arguments") && !message["arguments"].is_null()) {
        if (!message["arguments"].is_object()) {
            return PilotError{ErrorCategory::Protocol,
                              "execute_tool 'arguments' must be an object",
                              "invalid_request"};
        }
        request.call.arguments = message["arguments"];
    }
    return request;
}

json summary_to_json(const ToolSummary& summary) {
    return json{{"name", summary.name},
                {"description", summary.description},
                {"inputSchema", summary.input_schema}};
}

json make_initialize_result(const std::vector<ToolSummary>& tools) {
    return json{{"type", "initialize_result"},
                {"supportedVersions", supported_versions()},
                {"tools", tools_to_json(tools)}};
}

json make_list_tools_result(const std::vector<ToolSummary>& tools) {
    return json{{"type", "list_tools_result"}, {"tools", tools_to_json(tools)}};
}

json make_execute_tool_result(const std::string& content) {
    return json{{"type", "execute_tool_result"}, {"content", content}};
}

json make_error(const std::string& message) {
    return json{{"type", "error"}, {"message", message}};
}

std::string encode_line(const json& message) {
    return message.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

json make_initialize_request() {
    return json{{"type", "initialize"}};
}

json make_list_tools_request() {
    return json{{"type", "list_tools"}};
}

json make_execute_tool_request(const std::string& name, const json& arguments) {
    return json{{"type", "execute_tool"},
                {"name", name},
                {"arguments", arguments.is_null() ? json::object() : arguments}};
}

core::errors::Result<WireResponse> decode_response(const std::string& line) {
    json message;
    try {
        message = json::parse(line);
    } catch (const json::parse_error& e) {
        return PilotError{ErrorCategory::Protocol,
                          std::string("Invalid JSON from server: ") + e.what(),
                          "invalid_json"};
    }
    if (!message.is_object() || !message.contains("type") || !message["type"].is_string()) {
        return PilotError{ErrorCategory::Protocol, "Server response has no 'type'",
                          "invalid_response"};
    }
    return WireResponse{message["type"].get<std::string>(), message};
}

core::errors::Result<std::vector<ToolSummary>> decode_tool_summaries(const json& body) {
    if (!body.contains("tools") || !body["tools"].is_array()) {
        return PilotError{ErrorCategory::Protocol, "Response is missing a 'tools' array",
                          "invalid_response"};
    }
    std::vector<ToolSummary> tools;
    for (const auto& entry : body["tools"]) {
        if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
            return PilotError{ErrorCategory::Protocol, "Tool entry without a name",
                              "invalid_response"};
        }
        ToolSummary summary;
        summary.name = entry["name"].get<std::string>();
        summary.description = entry.value("description", "");
        summary.input_schema = entry.value("inputSchema", json::object());
        tools.push_back(std::move(summary));
    }
    return tools;
}

}  // namespace deploypilot::protocol
