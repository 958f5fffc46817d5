#include "server/dispatcher.hpp"

#include <exception>
#include <istream>
#include <ostream>
#include "core/logging/logger.hpp"

namespace deploypilot::server {

using nlohmann::json;

namespace {

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

Dispatcher::Dispatcher(const tools::ToolRegistry& registry) : registry_(registry) {}

std::optional<json> Dispatcher::handle_line(const std::string& line) {
    if (is_blank(line)) {
        return std::nullopt;
    }

    try {
        auto decoded = protocol::decode_request(line);
        if (core::errors::is_error(decoded)) {
            const auto& err = core::errors::get_error(decoded);
            LOG_WARN("Dispatcher: rejected request [" + err.code + "]: " + err.message);
            return protocol::make_error(err.message);
        }
        return handle_request(core::errors::get_value(decoded));
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Dispatcher: handler raised: ") + e.what());
        return protocol::make_error(std::string("Server error: ") + e.what());
    } catch (...) {
        LOG_ERROR("Dispatcher: handler raised a non-standard exception");
        return protocol::make_error("Server error: unknown exception");
    }
}

json Dispatcher::handle_request(const protocol::WireRequest& request) {
    switch (request.type) {
        case protocol::RequestType::Initialize:
            LOG_INFO("Dispatcher: initialize (" + std::to_string(registry_.size()) + " tools)");
            return protocol::make_initialize_result(registry_.describe_all());
        case protocol::RequestType::ListTools:
            return protocol::make_list_tools_result(registry_.describe_all());
        case protocol::RequestType::ExecuteTool:
            break;
    }

    auto handler = registry_.resolve(request.call.name);
    if (core::errors::is_error(handler)) {
        return protocol::make_error(core::errors::get_error(handler).message);
    }

    LOG_INFO("Dispatcher: execute_tool " + request.call.name);
    LOG_DEBUG("Dispatcher: arguments " + request.call.arguments.dump());
    const auto result = core::errors::get_value(handler)->execute(request.call.arguments);
    return protocol::make_execute_tool_result(result.content);
}

std::size_t Dispatcher::run(std::istream& in, std::ostream& out) {
    std::size_t handled = 0;
    std::string line;
    while (std::getline(in, line)) {
        const auto response = handle_line(line);
        if (!response) {
            continue;
        }
        ++handled;
        out << protocol::encode_line(*response) << std::flush;
        if (!out) {
            LOG_ERROR("Dispatcher: output channel closed, stopping");
            break;
        }
    }
    LOG_INFO("Dispatcher: end of input after " + std::to_string(handled) + " requests");
    return handled;
}

}  // namespace deploypilot::server
