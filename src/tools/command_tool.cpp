#include "tools/command_tool.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <system_error>
#include "core/logging/logger.hpp"
#include "policy/policy_guard.hpp"
#include "process/command_runner.hpp"
#include "tools/tool_args.hpp"

namespace deploypilot::tools {

using nlohmann::json;
using protocol::ToolCallResult;

namespace {

std::string format_seconds(const double seconds) {
    std::ostringstream out;
    if (std::floor(seconds) == seconds) {
        out << static_cast<long long>(seconds);
    } else {
        out << seconds;
    }
    return out.str();
}

void append_streams(std::ostringstream& out, const process::ProcessCapture& capture) {
    if (!capture.stdout_text.empty()) {
        out << "\nSTDOUT:\n" << capture.stdout_text;
    }
    if (!capture.stderr_text.empty()) {
        out << "\nSTDERR:\n" << capture.stderr_text;
    }
}

}  // namespace

CommandTool::CommandTool(const RepositoryContext& context) : context_(context) {}

double CommandTool::normalize_timeout(const double seconds) {
    if (!std::isfinite(seconds) || !(seconds > 0.0)) {
        return kDefaultTimeoutSeconds;
    }
    const double max_seconds = std::numeric_limits<std::uint32_t>::max() / 1000.0;
    return seconds > max_seconds ? max_seconds : seconds;
}

std::uint32_t CommandTool::timeout_ms(const double seconds) {
    const double ms = std::ceil(normalize_timeout(seconds) * 1000.0);
    const double max_ms = std::numeric_limits<std::uint32_t>::max();
    return ms >= max_ms ? std::numeric_limits<std::uint32_t>::max() : static_cast<std::uint32_t>(ms);
}

ToolCallResult CommandTool::execute(const json& arguments) {
    const std::string command = string_arg(arguments, "command").value_or("");
    const policy::PolicyGuard policy_guard;
    auto validated = policy_guard.validate_command(command);
    if (core::errors::is_error(validated)) {
        return {"Error: Command not provided"};
    }

    std::filesystem::path working_dir = std::filesystem::current_path();
    if (const auto snapshot = context_.current()) {
        working_dir = snapshot->path;
    }
    if (const auto requested = string_arg(arguments, "working_dir")) {
        working_dir = *requested;
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(working_dir, ec) || ec) {
        return {"Error: Working directory does not exist: " + working_dir.string()};
    }

    const double timeout_seconds =
        normalize_timeout(number_arg(arguments, "timeout").value_or(kDefaultTimeoutSeconds));

    process::CommandSpec spec;
    spec.argv = process::shell_argv(core::errors::get_value(validated));
    spec.working_directory = working_dir;
    spec.timeout_ms = timeout_ms(timeout_seconds);

    LOG_INFO("CommandTool: running in " + working_dir.string() + ": " + command);
    auto capture_result = process::run_process(spec);
    if (core::errors::is_error(capture_result)) {
        return {"Error: Failed to run command: " + core::errors::get_error(capture_result).message};
    }
    const auto& capture = core::errors::get_value(capture_result);

    std::ostringstream out;
    if (capture.timed_out) {
        LOG_WARN("CommandTool: command timed out after " + format_seconds(timeout_seconds) + "s");
        out << "Command timed out after " << format_seconds(timeout_seconds) << " seconds.";
        append_streams(out, capture);
        return {out.str()};
    }

    if (capture.exit_code != 0) {
        out << "Command failed with exit code " << capture.exit_code << ".";
        append_streams(out, capture);
        return {out.str()};
    }

    out << "Command executed successfully.";
    append_streams(out, capture);
    return {out.str()};
}

json CommandTool::input_schema() {
    return json{
        {"type", "object"},
        {"properties",
         {{"command",
           {{"type", "string"}, {"description", "The shell command to execute"}}},
          {"working_dir",
           {{"type", "string"},
            {"description",
             "Directory to run in (defaults to the cloned repository, else the server's directory)"}}},
          {"timeout",
           {{"type", "number"},
            {"description", "Timeout in seconds (default 30); the command is killed on expiry"}}}}},
        {"required", json::array({"command"})}};
}

}  // namespace deploypilot::tools
