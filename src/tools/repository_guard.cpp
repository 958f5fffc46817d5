#include "tools/repository_guard.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "tools/tool_args.hpp"

namespace deploypilot::tools {

RepositoryGuard::RepositoryGuard(std::shared_ptr<protocol::ToolHandler> inner,
                                 const RepositoryContext& context, GuardRequirements requirements)
    : inner_(std::move(inner)), context_(context), requirements_(std::move(requirements)) {}

protocol::ToolCallResult RepositoryGuard::execute(const nlohmann::json& arguments) {
    const std::string action = string_arg(arguments, "action").value_or("");
    if (requirements_.exempt_actions.count(action) > 0) {
        return inner_->execute(arguments);
    }

    auto checked = context_.require(requirements_.require_git_work_tree);
    if (core::errors::is_error(checked)) {
        const auto& error = core::errors::get_error(checked);
        LOG_DEBUG("RepositoryGuard: rejected '" + action + "' (" + error.code + ")");
        return {"Error: " + error.message};
    }
    return inner_->execute(arguments);
}

}  // namespace deploypilot::tools
