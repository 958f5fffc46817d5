#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "client/anthropic_provider.hpp"
#include "core/errors/pilot_errors.hpp"

namespace {

using deploypilot::client::AnthropicOptions;
using deploypilot::client::AnthropicProvider;
using deploypilot::core::errors::ErrorCategory;
using deploypilot::core::errors::get_error;
using deploypilot::core::errors::get_value;
using deploypilot::core::errors::is_error;
using deploypilot::protocol::BlockType;
using deploypilot::protocol::ContentBlock;
using deploypilot::protocol::ConversationHistory;
using deploypilot::protocol::Message;
using deploypilot::protocol::Role;
using deploypilot::protocol::ToolSummary;
using nlohmann::json;

TEST(AnthropicProviderTest, BuildsRequestWithToolsAndBlocks) {
    AnthropicOptions options;
    options.model = "test-model";
    options.max_tokens = 123;

    ConversationHistory history;
    history.push_back(Message::user_text("what is 3+4?"));
    history.push_back(Message{Role::Assistant,
                              {ContentBlock::make_text("Let me check."),
                               ContentBlock::make_tool_use("tu_1", "calculate",
                                                           json{{"expression", "add(3, 4)"}})}});
    history.push_back(Message{Role::User, {ContentBlock::make_tool_result("tu_1", "7")}});

    const std::vector<ToolSummary> tools = {
        ToolSummary{"calculate", "Perform a simple calculation",
                    json{{"type", "object"}, {"required", json::array({"expression"})}}}};

    const json body = AnthropicProvider::build_request_body(options, history, tools);
    EXPECT_EQ(body.at("model"), "test-model");
    EXPECT_EQ(body.at("max_tokens"), 123);
    ASSERT_EQ(body.at("messages").size(), 3u);
    EXPECT_EQ(body["messages"][0],
              (json{{"role", "user"}, {"content", json::array({{{"type", "text"}, {"text", "what is 3+4?"}}})}}));
    EXPECT_EQ(body["messages"][1]["role"], "assistant");
    EXPECT_EQ(body["messages"][1]["content"][1],
              (json{{"type", "tool_use"},
                    {"id", "tu_1"},
                    {"name", "calculate"},
                    {"input", {{"expression", "add(3, 4)"}}}}));
    EXPECT_EQ(body["messages"][2]["content"][0],
              (json{{"type", "tool_result"}, {"tool_use_id", "tu_1"}, {"content", "7"}}));
    ASSERT_EQ(body.at("tools").size(), 1u);
    EXPECT_EQ(body["tools"][0]["name"], "calculate");
    EXPECT_EQ(body["tools"][0]["input_schema"]["type"], "object");
}

TEST(AnthropicProviderTest, OmitsToolsWhenNoneAvailable) {
    const json body =
        AnthropicProvider::build_request_body(AnthropicOptions{}, {Message::user_text("hi")}, {});
    EXPECT_FALSE(body.contains("tools"));
    EXPECT_EQ(body.at("model"), "claude-3-5-sonnet-20241022");
    EXPECT_EQ(body.at("max_tokens"), 4000);
}

TEST(AnthropicProviderTest, ParsesTextAndToolUse) {
    const std::string body = R"({
        "id": "msg_1",
        "stop_reason": "tool_use",
        "content": [
            {"type": "text", "text": "Cloning now."},
            {"type": "tool_use", "id": "tu_9", "name": "github_repo",
             "input": {"action": "clone", "repo_url": "https://github.com/a/b"}},
            {"type": "thinking", "thinking": "ignored"}
        ]
    })";

    auto parsed = AnthropicProvider::parse_response(200, body);
    ASSERT_FALSE(is_error(parsed));
    const auto& reply = get_value(parsed);
    EXPECT_EQ(reply.stop_reason, "tool_use");
    ASSERT_EQ(reply.content.size(), 2u);
    EXPECT_EQ(reply.content[0].type, BlockType::Text);
    EXPECT_EQ(reply.content[0].text, "Cloning now.");
    EXPECT_EQ(reply.content[1].type, BlockType::ToolUse);
    EXPECT_EQ(reply.content[1].id, "tu_9");
    EXPECT_EQ(reply.content[1].input.at("action"), "clone");
    EXPECT_TRUE(reply.has_tool_use());
}

TEST(AnthropicProviderTest, HttpErrorUsesApiMessage) {
    auto parsed = AnthropicProvider::parse_response(
        401, R"({"type":"error","error":{"type":"authentication_error","message":"invalid x-api-key"}})");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).category, ErrorCategory::Provider);
    EXPECT_EQ(get_error(parsed).code, "provider_http_error");
    EXPECT_EQ(get_error(parsed).message, "API request failed with status 401: invalid x-api-key");

    auto raw = AnthropicProvider::parse_response(502, "Bad Gateway");
    ASSERT_TRUE(is_error(raw));
    EXPECT_EQ(get_error(raw).message, "API request failed with status 502: Bad Gateway");
}

TEST(AnthropicProviderTest, RejectsMalformedBody) {
    for (const std::string body : {"not json", R"({"content":"text"})", "[]"}) {
        auto parsed = AnthropicProvider::parse_response(200, body);
        ASSERT_TRUE(is_error(parsed)) << body;
        EXPECT_EQ(get_error(parsed).code, "provider_bad_response");
    }
}

TEST(AnthropicProviderTest, MissingApiKeyFailsBeforeRequest) {
    AnthropicOptions options;
    options.api_url = "http://127.0.0.1:1/unreachable";
    AnthropicProvider provider(options);

    auto reply = provider.complete({Message::user_text("hello")}, {});
    ASSERT_TRUE(is_error(reply));
    EXPECT_EQ(get_error(reply).code, "missing_api_key");
    EXPECT_EQ(get_error(reply).category, ErrorCategory::Provider);
    EXPECT_FALSE(get_error(reply).hint.empty());
}

}  // namespace
