#include "tools/tool_registry.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace deploypilot::tools {

using core::errors::ErrorCategory;
using core::errors::PilotError;

core::errors::Result<std::size_t> ToolRegistry::register_tool(protocol::ToolDescriptor descriptor) {
    if (descriptor.name.empty() || !descriptor.handler) {
        return PilotError{ErrorCategory::Input, "Tool needs a name and a handler.",
                          "invalid_tool"};
    }
    for (const auto& existing : tools_) {
        if (existing.name == descriptor.name) {
            return PilotError{ErrorCategory::Input,
                              "Tool already registered: " + descriptor.name,
                              "duplicate_tool_name"};
        }
    }

    LOG_DEBUG("ToolRegistry: registered " + descriptor.name);
    tools_.push_back(std::move(descriptor));
    return tools_.size();
}

std::vector<protocol::ToolSummary> ToolRegistry::describe_all() const {
    std::vector<protocol::ToolSummary> out;
    out.reserve(tools_.size());
    for (const auto& tool : tools_) {
        out.push_back({tool.name, tool.description, tool.input_schema});
    }
    return out;
}

core::errors::Result<std::shared_ptr<protocol::ToolHandler>> ToolRegistry::resolve(
    const std::string& name) const {
    for (const auto& tool : tools_) {
        if (tool.name == name) {
            return tool.handler;
        }
    }
    return PilotError{ErrorCategory::Input, "Tool '" + name + "' not found",
                      "tool_not_found"};
}

}  // namespace deploypilot::tools
