#pragma once

#include <memory>
#include <set>
#include <string>
#include "protocol/tool_contract.hpp"
#include "tools/repository_context.hpp"

namespace deploypilot::tools {

struct GuardRequirements {
    bool require_git_work_tree = false;
    // Actions that never touch the checkout (stopping a session, listing)
    // pass straight through.
    std::set<std::string> exempt_actions;
};

// Decorates a handler with a precondition on the shared repository context.
// When the check fails the wrapped handler is not invoked.
class RepositoryGuard : public protocol::ToolHandler {
public:
    RepositoryGuard(std::shared_ptr<protocol::ToolHandler> inner, const RepositoryContext& context,
                    GuardRequirements requirements = {});

    protocol::ToolCallResult execute(const nlohmann::json& arguments) override;

private:
    std::shared_ptr<protocol::ToolHandler> inner_;
    const RepositoryContext& context_;
    GuardRequirements requirements_;
};

}  // namespace deploypilot::tools
