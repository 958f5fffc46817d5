#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "protocol/wire_messages.hpp"
#include "tools/tool_registry.hpp"

namespace deploypilot::server {

// Maps request lines to response messages. One request is handled to
// completion before the next line is read.
class Dispatcher {
public:
    explicit Dispatcher(const tools::ToolRegistry& registry);

    // nullopt for blank lines; every other line yields exactly one response.
    std::optional<nlohmann::json> handle_line(const std::string& line);

    // Reads until end of input, writing and flushing one line per response.
    // Returns the number of requests handled.
    std::size_t run(std::istream& in, std::ostream& out);

private:
    nlohmann::json handle_request(const protocol::WireRequest& request);

    const tools::ToolRegistry& registry_;
};

}  // namespace deploypilot::server
