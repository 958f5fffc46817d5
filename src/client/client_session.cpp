#include "client/client_session.hpp"

#include <cstddef>
#include <utility>
#include <variant>
#include "core/logging/logger.hpp"

namespace deploypilot::client {

using core::errors::ErrorCategory;
using core::errors::PilotError;
using nlohmann::json;

namespace {

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

PilotError connection_error(const std::string& message, const std::string& code) {
    return PilotError{ErrorCategory::Connection, message, code};
}

}  // namespace

ClientSession::ClientSession(SessionOptions options) : options_(std::move(options)) {}

ClientSession::~ClientSession() {
    cleanup();
}

std::vector<std::string> ClientSession::server_argv(const std::string& server_path) {
    if (ends_with(server_path, ".py")) {
        return {"python3", server_path};
    }
    if (ends_with(server_path, ".js")) {
        return {"node", server_path};
    }
    return {server_path};
}

core::errors::Result<bool> ClientSession::start(const std::string& server_path) {
    cleanup();
    auto spawned = ServerChannel::spawn(server_argv(server_path));
    if (core::errors::is_error(spawned)) {
        return core::errors::get_error(spawned);
    }
    channel_ = std::move(std::get<std::unique_ptr<ServerChannel>>(spawned));
    LOG_INFO("ClientSession: started server " + server_path + " (pid " + std::to_string(channel_->pid()) + ")");
    return true;
}

core::errors::Result<protocol::WireResponse> ClientSession::exchange(const json& request,
                                                                     const std::chrono::milliseconds timeout) {
    if (!channel_) {
        return connection_error("Not connected to a server.", "not_connected");
    }
    auto sent = channel_->send_line(protocol::encode_line(request));
    if (core::errors::is_error(sent)) {
        return core::errors::get_error(sent);
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string line;
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        const auto status = channel_->read_line(line, remaining.count() > 0 ? remaining : std::chrono::milliseconds(0));
        if (status == ReadStatus::Timeout) {
            ++stale_responses_;
            return connection_error("Timed out waiting for the server after " +
                                        std::to_string(timeout.count()) + " ms",
                                    "no_response");
        }
        if (status == ReadStatus::Closed) {
            return connection_error("Server closed the connection.", "no_response");
        }
        if (is_blank(line)) {
            continue;
        }
        if (stale_responses_ > 0) {
            --stale_responses_;
            LOG_DEBUG("ClientSession: discarded late response");
            continue;
        }
        return protocol::decode_response(line);
    }
}

core::errors::Result<std::vector<protocol::ToolSummary>> ClientSession::handshake() {
    auto initialized = exchange(protocol::make_initialize_request(), options_.handshake_timeout);
    if (core::errors::is_error(initialized)) {
        return connection_error("Handshake failed: " + core::errors::get_error(initialized).message,
                                "handshake_failed");
    }
    if (core::errors::get_value(initialized).type != "initialize_result") {
        return connection_error("Handshake failed: unexpected response type '" +
                                    core::errors::get_value(initialized).type + "'",
                                "handshake_failed");
    }

    auto listed = exchange(protocol::make_list_tools_request(), options_.handshake_timeout);
    if (core::errors::is_error(listed)) {
        return connection_error("Tool listing failed: " + core::errors::get_error(listed).message,
                                "handshake_failed");
    }
    const auto& response = core::errors::get_value(listed);
    if (response.type != "list_tools_result") {
        return connection_error("Tool listing failed: unexpected response type '" + response.type + "'",
                                "handshake_failed");
    }
    auto summaries = protocol::decode_tool_summaries(response.body);
    if (core::errors::is_error(summaries)) {
        return connection_error("Tool listing failed: " + core::errors::get_error(summaries).message,
                                "handshake_failed");
    }

    tools_ = core::errors::get_value(summaries);
    LOG_INFO("ClientSession: connected, " + std::to_string(tools_.size()) + " tools available");
    return tools_;
}

std::string ClientSession::call(const std::string& name, const json& arguments) {
    auto exchanged = exchange(protocol::make_execute_tool_request(name, arguments), options_.call_timeout);
    if (core::errors::is_error(exchanged)) {
        const auto& err = core::errors::get_error(exchanged);
        LOG_WARN("ClientSession: call to " + name + " failed [" + err.code + "]: " + err.message);
        return err.category == ErrorCategory::Protocol ? kInvalidResponse : kNoResponse;
    }

    const auto& response = core::errors::get_value(exchanged);
    if (response.type == "error") {
        const auto it = response.body.find("message");
        const std::string message =
            it != response.body.end() && it->is_string() ? it->get<std::string>() : "unknown error";
        return "Error: " + message;
    }
    if (response.type == "execute_tool_result") {
        const auto it = response.body.find("content");
        if (it != response.body.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return kInvalidResponse;
}

core::errors::Result<ConversationResult> ClientSession::converse(LlmProvider& provider, const std::string& query,
                                                                 protocol::ConversationHistory& history) {
    const auto turn_start = static_cast<std::ptrdiff_t>(history.size());
    history.push_back(protocol::Message::user_text(query));

    ConversationResult result;
    for (std::size_t round = 0; round < options_.max_rounds; ++round) {
        auto completed = provider.complete(history, tools_);
        if (core::errors::is_error(completed)) {
            // Drop the partial turn so the history stays well-formed.
            history.erase(history.begin() + turn_start, history.end());
            auto err = core::errors::get_error(completed);
            err.category = ErrorCategory::Provider;
            return err;
        }
        const auto& reply = core::errors::get_value(completed);

        for (const auto& block : reply.content) {
            if (block.type == protocol::BlockType::Text && !block.text.empty()) {
                if (!result.text.empty()) {
                    result.text += "\n";
                }
                result.text += block.text;
            }
        }
        if (!reply.content.empty()) {
            history.push_back(protocol::Message{protocol::Role::Assistant, reply.content});
        }
        if (!reply.has_tool_use()) {
            return result;
        }

        protocol::Message tool_results{protocol::Role::User, {}};
        for (const auto& block : reply.content) {
            if (block.type != protocol::BlockType::ToolUse) {
                continue;
            }
            LOG_INFO("ClientSession: model requested tool " + block.name);
            std::string output = call(block.name, block.input);
            result.tools_used.push_back(ToolInvocation{block.name, block.input, output});
            tool_results.content.push_back(protocol::ContentBlock::make_tool_result(block.id, std::move(output)));
        }
        history.push_back(std::move(tool_results));
    }

    LOG_WARN("ClientSession: stopped after " + std::to_string(options_.max_rounds) + " tool rounds");
    return result;
}

void ClientSession::cleanup() {
    if (!channel_) {
        return;
    }
    const auto outcome = channel_->close(options_.shutdown_grace);
    LOG_INFO("ClientSession: server stopped (" + process::to_string(outcome) + ")");
    channel_.reset();
    tools_.clear();
    stale_responses_ = 0;
}

}  // namespace deploypilot::client
