#pragma once
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace deploypilot::protocol {

    enum class Role {
        User,
        Assistant
    };

    inline std::string to_string(const Role role) {
        return role == Role::User ? "user" : "assistant";
    }

    enum class BlockType {
        Text,
        ToolUse,     // assistant asks for a tool
        ToolResult   // user-side reply carrying a tool's output
    };

    struct ContentBlock {
        BlockType type = BlockType::Text;

        // Text / ToolResult payload
        std::string text;

        // ToolUse
        std::string id;
        std::string name;
        nlohmann::json input = nlohmann::json::object();

        // ToolResult: the ToolUse.id it answers
        std::string tool_use_id;

        static ContentBlock make_text(std::string value) {
            ContentBlock block;
            block.type = BlockType::Text;
            block.text = std::move(value);
            return block;
        }

        static ContentBlock make_tool_use(std::string use_id, std::string tool_name,
                                          nlohmann::json tool_input) {
            ContentBlock block;
            block.type = BlockType::ToolUse;
            block.id = std::move(use_id);
            block.name = std::move(tool_name);
            block.input = std::move(tool_input);
            return block;
        }

        static ContentBlock make_tool_result(std::string use_id, std::string content) {
            ContentBlock block;
            block.type = BlockType::ToolResult;
            block.tool_use_id = std::move(use_id);
            block.text = std::move(content);
            return block;
        }
    };

    struct Message {
        Role role = Role::User;
        std::vector<ContentBlock> content;

        static Message user_text(std::string text) {
            return Message{Role::User, {ContentBlock::make_text(std::move(text))}};
        }

        static Message assistant_text(std::string text) {
            return Message{Role::Assistant, {ContentBlock::make_text(std::move(text))}};
        }
    };

    // Append-only for the duration of a session.
    using ConversationHistory = std::vector<Message>;

} // namespace deploypilot::protocol
