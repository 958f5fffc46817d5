#pragma once

#include <string>
#include <vector>
#include "core/errors/pilot_errors.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace deploypilot::client {

struct LlmReply {
    std::vector<protocol::ContentBlock> content;
    std::string stop_reason;

    bool has_tool_use() const {
        for (const auto& block : content) {
            if (block.type == protocol::BlockType::ToolUse) {
                return true;
            }
        }
        return false;
    }
};

// A language model that can answer with text and tool-use requests.
class LlmProvider {
public:
    virtual ~LlmProvider() = default;

    // Failures carry ErrorCategory::Provider.
    virtual core::errors::Result<LlmReply> complete(
        const protocol::ConversationHistory& messages,
        const std::vector<protocol::ToolSummary>& tools) = 0;
};

}  // namespace deploypilot::client
