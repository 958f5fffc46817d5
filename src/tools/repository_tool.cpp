#include "tools/repository_tool.hpp"

#include <cstdlib>
#include <sstream>
#include <system_error>
#include "core/logging/logger.hpp"
#include "policy/policy_guard.hpp"
#include "process/command_runner.hpp"
#include "tools/file_utils.hpp"
#include "tools/tool_args.hpp"

namespace deploypilot::tools {

using nlohmann::json;
using protocol::ToolCallResult;

namespace {

constexpr ActionTable<RepositoryAction, 4> kActions = {{
    {"clone", RepositoryAction::Clone},
    {"list_files", RepositoryAction::ListFiles},
    {"read_file", RepositoryAction::ReadFile},
    {"get_repo_info", RepositoryAction::GetRepoInfo},
}};

const std::string kNoRepository = "Error: No repository is currently cloned";

core::errors::Result<std::filesystem::path> make_checkout_dir() {
    std::error_code ec;
    const auto base = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return core::errors::PilotError{core::errors::ErrorCategory::Internal,
                                        "No temporary directory available: " + ec.message(),
                                        "temp_dir_failed"};
    }
    std::string templ = (base / "deploypilot-repo-XXXXXX").string();
    if (mkdtemp(templ.data()) == nullptr) {
        return core::errors::PilotError{core::errors::ErrorCategory::Internal,
                                        "Unable to create temporary directory in " + base.string(),
                                        "temp_dir_failed"};
    }
    return std::filesystem::path(templ);
}

std::string git_output(const std::vector<std::string>& argv, const std::filesystem::path& cwd) {
    process::CommandSpec spec;
    spec.argv = argv;
    spec.working_directory = cwd;
    spec.timeout_ms = 15000;
    auto capture = process::run_process(spec);
    if (core::errors::is_error(capture)) {
        return "";
    }
    std::string out = core::errors::get_value(capture).stdout_text;
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) {
        out.pop_back();
    }
    return out;
}

}  // namespace

RepositoryTool::RepositoryTool(RepositoryContext& context, const std::uint32_t clone_timeout_ms)
    : context_(context), clone_timeout_ms_(clone_timeout_ms) {}

ToolCallResult RepositoryTool::execute(const json& arguments) {
    const std::string action_text = string_arg(arguments, "action").value_or("");
    const auto action = parse_action(action_text, kActions);
    if (!action) {
        return {unknown_action_message(action_text, kActions)};
    }

    switch (*action) {
        case RepositoryAction::Clone:
            return clone(arguments);
        case RepositoryAction::ListFiles:
            return list_files(arguments);
        case RepositoryAction::ReadFile:
            return read_file(arguments);
        case RepositoryAction::GetRepoInfo:
            return get_repo_info();
    }
    return {unknown_action_message(action_text, kActions)};
}

ToolCallResult RepositoryTool::clone(const json& arguments) {
    const auto repo_url = string_arg(arguments, "repo_url");
    if (!repo_url) {
        return {"Error: Repository URL not provided"};
    }

    // At most one checkout is live: the previous one goes before cloning.
    context_.clear();

    auto created = make_checkout_dir();
    if (core::errors::is_error(created)) {
        return {"Error cloning repository: " + core::errors::get_error(created).message};
    }
    const auto checkout = core::errors::get_value(created);

    process::CommandSpec spec;
    spec.argv = {"git", "clone", "--", *repo_url, checkout.string()};
    spec.working_directory = checkout.parent_path();
    spec.timeout_ms = clone_timeout_ms_;
    spec.environment = {{"GIT_TERMINAL_PROMPT", "0"}};

    LOG_INFO("RepositoryTool: cloning " + *repo_url);
    auto capture = process::run_process(spec);

    bool failed = true;
    std::string failure;
    if (core::errors::is_error(capture)) {
        failure = core::errors::get_error(capture).message;
    } else if (core::errors::get_value(capture).timed_out) {
        failure = "git clone timed out after " + std::to_string(clone_timeout_ms_ / 1000) + " seconds";
    } else if (core::errors::get_value(capture).exit_code != 0) {
        failure = core::errors::get_value(capture).combined_output();
    } else {
        failed = false;
    }

    if (failed) {
        std::error_code ec;
        std::filesystem::remove_all(checkout, ec);
        LOG_WARN("RepositoryTool: clone of " + *repo_url + " failed");
        return {"Error cloning repository: " + failure};
    }

    context_.commit({checkout, *repo_url, RepositoryContext::derive_name(*repo_url)});
    return {"Successfully cloned repository: " + *repo_url + " to " + checkout.string()};
}

ToolCallResult RepositoryTool::list_files(const json& arguments) {
    const auto snapshot = context_.current();
    if (!snapshot) {
        return {kNoRepository};
    }

    const std::string sub_path = string_arg(arguments, "path").value_or("");
    const policy::PolicyGuard guard;
    auto resolved = guard.validate_path_in_root(snapshot->path, sub_path);
    std::error_code ec;
    if (core::errors::is_error(resolved) ||
        !std::filesystem::exists(core::errors::get_value(resolved), ec)) {
        return {"Error: Path " + sub_path + " does not exist in the repository"};
    }
    const auto root = std::filesystem::weakly_canonical(snapshot->path, ec);

    std::ostringstream out;
    out << "Files in repository " << snapshot->name << ":\n\n";
    const auto entries = walk_repository(root, core::errors::get_value(resolved), {".git"});
    for (const auto& entry : entries) {
        out << (entry.is_directory ? "[DIR]  " : "[FILE] ") << entry.relative_path.generic_string()
            << "\n";
    }
    return {out.str()};
}

ToolCallResult RepositoryTool::read_file(const json& arguments) {
    const auto snapshot = context_.current();
    if (!snapshot) {
        return {kNoRepository};
    }
    const auto file_path = string_arg(arguments, "file_path");
    if (!file_path) {
        return {"Error: File path not provided"};
    }

    const std::string not_found = "Error: File " + *file_path + " does not exist in the repository";
    const policy::PolicyGuard guard;
    auto resolved = guard.validate_path_in_root(snapshot->path, *file_path);
    if (core::errors::is_error(resolved)) {
        return {not_found};
    }
    const auto full_path = core::errors::get_value(resolved);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(full_path, ec) || ec) {
        return {not_found};
    }
    if (is_probably_binary(full_path)) {
        return {"Error: File " + *file_path + " is a binary file"};
    }

    const auto content = read_text_file(full_path);
    if (!content) {
        return {"Error reading file: unable to open " + *file_path};
    }
    return {"Contents of " + *file_path + ":\n\n```\n" + *content + "\n```"};
}

ToolCallResult RepositoryTool::get_repo_info() {
    const auto snapshot = context_.current();
    if (!snapshot) {
        return {kNoRepository};
    }

    std::uintmax_t total_size = 0;
    std::size_t file_count = 0;
    for (const auto& entry : walk_repository(snapshot->path, snapshot->path, {".git"})) {
        if (entry.is_directory) {
            continue;
        }
        ++file_count;
        total_size += entry.size;
    }

    const std::string branch = git_output({"git", "branch", "--show-current"}, snapshot->path);
    const std::string last_commit =
        git_output({"git", "log", "-1", "--pretty=format:%h - %s (%cr)"}, snapshot->path);

    std::ostringstream out;
    out << "Repository Information:\n\n"
        << "name: " << snapshot->name << "\n"
        << "url: " << snapshot->url << "\n"
        << "branch: " << branch << "\n"
        << "last_commit: " << last_commit << "\n"
        << "file_count: " << file_count << "\n"
        << "size: " << format_size(total_size);
    return {out.str()};
}

json RepositoryTool::input_schema() {
    return json{
        {"type", "object"},
        {"properties",
         {{"action",
           {{"type", "string"},
            {"description", "The action to perform (clone, list_files, read_file, get_repo_info)"},
            {"enum", action_enum(kActions)}}},
          {"repo_url",
           {{"type", "string"},
            {"description", "The URL of the GitHub repository (required for 'clone' action)"}}},
          {"path",
           {{"type", "string"},
            {"description", "The path within the repository (for 'list_files' action)"}}},
          {"file_path",
           {{"type", "string"},
            {"description", "The path to the file to read (for 'read_file' action)"}}}}},
        {"required", json::array({"action"})}};
}

}  // namespace deploypilot::tools
