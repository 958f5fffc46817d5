#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/pilot_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace deploypilot::protocol {

inline const std::vector<std::string>& supported_versions() {
    static const std::vector<std::string> versions = {"0.1.0"};
    return versions;
}

enum class RequestType {
    Initialize,
    ListTools,
    ExecuteTool
};

struct WireRequest {
    RequestType type = RequestType::Initialize;
    ToolCallRequest call;  // ExecuteTool only
};

// Server side. Error codes: invalid_json, unknown_request_type, invalid_request.
core::errors::Result<WireRequest> decode_request(const std::string& line);

nlohmann::json summary_to_json(const ToolSummary& summary);
nlohmann::json make_initialize_result(const std::vector<ToolSummary>& tools);
nlohmann::json make_list_tools_result(const std::vector<ToolSummary>& tools);
nlohmann::json make_execute_tool_result(const std::string& content);
nlohmann::json make_error(const std::string& message);

// One line, '\n'-terminated. Invalid UTF-8 in payloads is replaced rather
// than thrown so a response is always produced.
std::string encode_line(const nlohmann::json& message);

// Client side.
nlohmann::json make_initialize_request();
nlohmann::json make_list_tools_request();
nlohmann::json make_execute_tool_request(const std::string& name,
                                         const nlohmann::json& arguments);

struct WireResponse {
    std::string type;
    nlohmann::json body;
};

core::errors::Result<WireResponse> decode_response(const std::string& line);
core::errors::Result<std::vector<ToolSummary>> decode_tool_summaries(const nlohmann::json& body);

}  // namespace deploypilot::protocol
