#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "client/llm_provider.hpp"
#include "client/server_channel.hpp"
#include "core/errors/pilot_errors.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/tool_contract.hpp"
#include "protocol/wire_messages.hpp"

namespace deploypilot::client {

struct SessionOptions {
    std::chrono::milliseconds handshake_timeout{5000};
    std::chrono::milliseconds call_timeout{300000};
    std::chrono::milliseconds shutdown_grace{5000};
    std::size_t max_rounds = 10;
};

struct ToolInvocation {
    std::string name;
    nlohmann::json arguments;
    std::string result;
};

struct ConversationResult {
    std::string text;
    std::vector<ToolInvocation> tools_used;
};

// One connection to a tool server plus the model-driven tool loop.
class ClientSession {
public:
    static constexpr const char* kNoResponse = "Error: no response from server";
    static constexpr const char* kInvalidResponse = "Error: invalid response from server";

    explicit ClientSession(SessionOptions options = {});
    ~ClientSession();

    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    // ".py" -> python3 <path>, ".js" -> node <path>, otherwise executed directly.
    static std::vector<std::string> server_argv(const std::string& server_path);

    // Error category Connection.
    core::errors::Result<bool> start(const std::string& server_path);
    core::errors::Result<std::vector<protocol::ToolSummary>> handshake();

    const std::vector<protocol::ToolSummary>& tools() const { return tools_; }
    bool connected() const { return channel_ != nullptr; }

    // Tool output, the server's error prefixed with "Error: ", or one of the
    // placeholders above.
    std::string call(const std::string& name, const nlohmann::json& arguments);

    // Appends the user turn, assistant turns and tool results to `history`.
    // When the model call fails the turn is removed again and the error has
    // category Provider.
    core::errors::Result<ConversationResult> converse(LlmProvider& provider, const std::string& query,
                                                      protocol::ConversationHistory& history);

    void cleanup();

private:
    core::errors::Result<protocol::WireResponse> exchange(const nlohmann::json& request,
                                                          std::chrono::milliseconds timeout);

    SessionOptions options_;
    std::unique_ptr<ServerChannel> channel_;
    std::vector<protocol::ToolSummary> tools_;
    // Responses still owed for requests that timed out; discarded on arrival.
    std::size_t stale_responses_ = 0;
};

}  // namespace deploypilot::client
