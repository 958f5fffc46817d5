#include "client/anthropic_provider.hpp"

#include <memory>
#include <utility>
#include <curl/curl.h>
#include "core/logging/logger.hpp"

namespace deploypilot::client {

using core::errors::ErrorCategory;
using core::errors::PilotError;
using nlohmann::json;

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

struct CurlHandleDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

json block_to_json(const protocol::ContentBlock& block) {
    switch (block.type) {
        case protocol::BlockType::Text:
            return json{{"type", "text"}, {"text", block.text}};
        case protocol::BlockType::ToolUse:
            return json{{"type", "tool_use"}, {"id", block.id}, {"name", block.name},
                        {"input", block.input}};
        case protocol::BlockType::ToolResult:
            return json{{"type", "tool_result"}, {"tool_use_id", block.tool_use_id},
                        {"content", block.text}};
    }
    return json::object();
}

PilotError provider_error(const std::string& message, const std::string& code) {
    return PilotError{ErrorCategory::Provider, message, code};
}

}  // namespace

AnthropicProvider::AnthropicProvider(AnthropicOptions options) : options_(std::move(options)) {}

json AnthropicProvider::build_request_body(const AnthropicOptions& options,
                                           const protocol::ConversationHistory& messages,
                                           const std::vector<protocol::ToolSummary>& tools) {
    json wire_messages = json::array();
    for (const auto& message : messages) {
        json content = json::array();
        for (const auto& block : message.content) {
            content.push_back(block_to_json(block));
        }
        wire_messages.push_back(json{{"role", protocol::to_string(message.role)}, {"content", content}});
    }

    json body{{"model", options.model}, {"max_tokens", options.max_tokens}, {"messages", wire_messages}};
    if (!tools.empty()) {
        json wire_tools = json::array();
        for (const auto& tool : tools) {
            wire_tools.push_back(json{{"name", tool.name},
                                      {"description", tool.description},
                                      {"input_schema", tool.input_schema}});
        }
        body["tools"] = wire_tools;
    }
    return body;
}

core::errors::Result<LlmReply> AnthropicProvider::parse_response(const long http_status,
                                                                 const std::string& body) {
    const auto parsed = json::parse(body, nullptr, false);
    if (http_status < 200 || http_status >= 300) {
        std::string detail = body;
        if (parsed.is_object() && parsed.contains("error") && parsed["error"].is_object() &&
            parsed["error"].contains("message") && parsed["error"]["message"].is_string()) {
            detail = parsed["error"]["message"].get<std::string>();
        }
        return provider_error("API request failed with status " + std::to_string(http_status) + ": " +
                                  detail,
                              "provider_http_error");
    }
    if (!parsed.is_object() || !parsed.contains("content") || !parsed["content"].is_array()) {
        return provider_error("API response has no content array", "provider_bad_response");
    }

    LlmReply reply;
    if (parsed.contains("stop_reason") && parsed["stop_reason"].is_string()) {
        reply.stop_reason = parsed["stop_reason"].get<std::string>();
    }
    for (const auto& block : parsed["content"]) {
        const std::string type = block.value("type", "");
        if (type == "text") {
            reply.content.push_back(protocol::ContentBlock::make_text(block.value("text", "")));
        } else if (type == "tool_use") {
            json input = block.contains("input") ? block["input"] : json::object();
            reply.content.push_back(protocol::ContentBlock::make_tool_use(
                block.value("id", ""), block.value("name", ""), std::move(input)));
        }
    }
    return reply;
}

core::errors::Result<LlmReply> AnthropicProvider::complete(const protocol::ConversationHistory& messages,
                                                           const std::vector<protocol::ToolSummary>& tools) {
    if (options_.api_key.empty()) {
        return PilotError{ErrorCategory::Provider, "ANTHROPIC_API_KEY is not set", "missing_api_key",
                          "Set it in the environment or in the .env file."};
    }

    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) {
        return provider_error("Failed to initialize libcurl", "provider_unavailable");
    }

    curl_slist* raw_headers = nullptr;
    raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
    raw_headers = curl_slist_append(raw_headers, ("x-api-key: " + options_.api_key).c_str());
    raw_headers = curl_slist_append(raw_headers, (std::string("anthropic-version: ") + kApiVersion).c_str());
    std::unique_ptr<curl_slist, CurlListDeleter> headers(raw_headers);

    const std::string payload = build_request_body(options_, messages, tools)
                                    .dump(-1, ' ', false, json::error_handler_t::replace);
    std::string response;

    curl_easy_setopt(curl.get(), CURLOPT_URL, options_.api_url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options_.timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    LOG_DEBUG("AnthropicProvider: POST " + options_.api_url + " (" + std::to_string(messages.size()) +
              " messages)");
    const CURLcode code = curl_easy_perform(curl.get());
    if (code != CURLE_OK) {
        return provider_error(std::string("API request failed: ") + curl_easy_strerror(code),
                              "provider_unavailable");
    }

    long http_status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);
    return parse_response(http_status, response);
}

}  // namespace deploypilot::client
