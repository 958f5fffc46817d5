#pragma once

#include <cstdint>
#include "protocol/tool_contract.hpp"
#include "tools/repository_context.hpp"

namespace deploypilot::tools {

// Runs an arbitrary shell command with the server's privileges. There is no
// allow/deny list; callers are trusted.
class CommandTool : public protocol::ToolHandler {
public:
    static constexpr double kDefaultTimeoutSeconds = 30.0;

    explicit CommandTool(const RepositoryContext& context);

    protocol::ToolCallResult execute(const nlohmann::json& arguments) override;
    static nlohmann::json input_schema();

    // Non-positive or non-finite values fall back to the default; large ones
    // are clamped to what the runner can represent.
    static double normalize_timeout(double seconds);
    static std::uint32_t timeout_ms(double seconds);

private:
    const RepositoryContext& context_;
};

}  // namespace deploypilot::tools
