#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "client/llm_provider.hpp"

namespace deploypilot::client {

struct AnthropicOptions {
    std::string api_key;
    std::string api_url = "https://api.anthropic.com/v1/messages";
    std::string model = "claude-3-5-sonnet-20241022";
    std::uint32_t max_tokens = 4000;
    long timeout_seconds = 120;
};

// Messages API over libcurl. curl_global_init is the caller's job.
class AnthropicProvider : public LlmProvider {
public:
    static constexpr const char* kApiVersion = "2023-06-01";

    explicit AnthropicProvider(AnthropicOptions options);

    core::errors::Result<LlmReply> complete(
        const protocol::ConversationHistory& messages,
        const std::vector<protocol::ToolSummary>& tools) override;

    static nlohmann::json build_request_body(const AnthropicOptions& options,
                                             const protocol::ConversationHistory& messages,
                                             const std::vector<protocol::ToolSummary>& tools);

    // Error codes: provider_bad_response, provider_http_error.
    static core::errors::Result<LlmReply> parse_response(long http_status, const std::string& body);

private:
    AnthropicOptions options_;
};

}  // namespace deploypilot::client
