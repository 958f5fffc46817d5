#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/pilot_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace deploypilot::tools {

// Ordered set of tools. Registration order is the order advertised to
// clients, which surface tool names positionally.
class ToolRegistry {
public:
    // Error codes: duplicate_tool_name, invalid_tool.
    core::errors::Result<std::size_t> register_tool(protocol::ToolDescriptor descriptor);

    std::vector<protocol::ToolSummary> describe_all() const;

    // Error code: tool_not_found.
    core::errors::Result<std::shared_ptr<protocol::ToolHandler>> resolve(
        const std::string& name) const;

    std::size_t size() const { return tools_.size(); }

private:
    std::vector<protocol::ToolDescriptor> tools_;
};

}  // namespace deploypilot::tools
