#include "tools/ui_generator_tool.hpp"

#include <algorithm>
#include <sstream>
#include <system_error>
#include "core/logging/logger.hpp"
#include "policy/policy_guard.hpp"
#include "process/command_runner.hpp"
#include "process/port_allocator.hpp"
#include "tools/file_utils.hpp"
#include "tools/tool_args.hpp"

namespace deploypilot::tools {

using nlohmann::json;
using protocol::ToolCallResult;

namespace {

constexpr ActionTable<UiAction, 4> kActions = {{
    {"scan_apps", UiAction::ScanApps},
    {"generate_ui", UiAction::GenerateUi},
    {"stop_ui", UiAction::StopUi},
    {"list_sessions", UiAction::ListSessions},
}};

constexpr std::size_t kSniffBytes = 64 * 1024;
constexpr std::size_t kMaxDescription = 200;

const std::vector<std::string>& candidate_names() {
    static const std::vector<std::string> names = {
        "app.py", "main.py", "server.py", "run.py", "streamlit_app.py", "dashboard.py",
        "index.js", "app.js", "server.js", "main.js", "index.html"};
    return names;
}

bool contains_any(const std::string& haystack, const std::vector<std::string>& needles) {
    for (const auto& needle : needles) {
        if (haystack.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string collapse(const std::string& text) {
    std::string out;
    bool space = false;
    for (const char c : text) {
        if (c == '\n' || c == '\r' || c == '\t' || c == ' ') {
            space = !out.empty();
            continue;
        }
        if (space) {
            out.push_back(' ');
            space = false;
        }
        out.push_back(c);
    }
    return trim_line(out, kMaxDescription);
}

std::string python_description(std::istringstream& in) {
    std::string line;
    std::string comments;
    while (std::getline(in, line)) {
        const std::string t = trim(line);
        if (t.empty()) {
            if (!comments.empty()) break;
            continue;
        }
        // Shebang and encoding declarations.
        if (t.rfind("#!", 0) == 0 || t.rfind("# -*-", 0) == 0) {
            continue;
        }
        if (t.rfind("\"\"\"", 0) == 0 || t.rfind("'''", 0) == 0) {
            const std::string quote = t.substr(0, 3);
            std::string body = t.substr(3);
            const auto close = body.find(quote);
            if (close != std::string::npos) {
                return body.substr(0, close);
            }
            while (std::getline(in, line)) {
                const auto end = line.find(quote);
                if (end != std::string::npos) {
                    body += "\n" + line.substr(0, end);
                    break;
                }
                body += "\n" + line;
            }
            return body;
        }
        if (t[0] == '#') {
            comments += t.substr(1) + "\n";
            continue;
        }
        break;
    }
    return comments;
}

std::string js_description(std::istringstream& in) {
    std::string line;
    std::string comments;
    bool in_block = false;
    while (std::getline(in, line)) {
        std::string t = trim(line);
        if (in_block) {
            const auto end = t.find("*/");
            if (end != std::string::npos) {
                comments += t.substr(0, end);
                break;
            }
            if (!t.empty() && t[0] == '*') t = t.substr(1);
            comments += t + "\n";
            continue;
        }
        if (t.empty()) {
            if (!comments.empty()) break;
            continue;
        }
        if (t.rfind("#!", 0) == 0) continue;
        if (t.rfind("//", 0) == 0) {
            comments += t.substr(2) + "\n";
            continue;
        }
        if (t.rfind("/*", 0) == 0) {
            std::string rest = t.substr(2);
            if (!rest.empty() && rest[0] == '*') rest = rest.substr(1);
            const auto end = rest.find("*/");
            if (end != std::string::npos) {
                comments += rest.substr(0, end);
                break;
            }
            comments += rest + "\n";
            in_block = true;
            continue;
        }
        break;
    }
    return comments;
}

std::string html_description(const std::string& content) {
    const std::string lowered = to_lower(content);
    const auto open = lowered.find("<title>");
    if (open == std::string::npos) {
        return "";
    }
    const auto close = lowered.find("</title>", open);
    if (close == std::string::npos) {
        return "";
    }
    return content.substr(open + 7, close - open - 7);
}

struct LaunchPlan {
    std::vector<std::string> argv;
    std::vector<std::pair<std::string, std::string>> environment;
    std::filesystem::path working_directory;
    std::vector<process::CommandSpec> install_steps;
};

}  // namespace

UiGeneratorTool::UiGeneratorTool(const RepositoryContext& context,
                                 process::ProcessSupervisor& supervisor,
                                 UiGeneratorOptions options)
    : context_(context), supervisor_(supervisor), options_(std::move(options)) {}

ToolCallResult UiGeneratorTool::execute(const json& arguments) {
    const std::string action_text = string_arg(arguments, "action").value_or("");
    const auto action = parse_action(action_text, kActions);
    if (!action) {
        return {unknown_action_message(action_text, kActions)};
    }

    switch (*action) {
        case UiAction::ScanApps:
            return scan_apps();
        case UiAction::GenerateUi:
            return generate_ui(arguments);
        case UiAction::StopUi:
            return stop_ui(arguments);
        case UiAction::ListSessions:
            return list_sessions();
    }
    return {unknown_action_message(action_text, kActions)};
}

std::string UiGeneratorTool::classify(const std::filesystem::path& file) {
    const std::string ext = to_lower(file.extension().string());
    if (ext == ".html" || ext == ".htm") {
        return "static";
    }
    const std::string content = to_lower(read_text_file(file, kSniffBytes).value_or(""));
    if (ext == ".py") {
        if (content.find("streamlit") != std::string::npos) return "streamlit";
        if (content.find("gradio") != std::string::npos) return "gradio";
        if (contains_any(content, {"import dash", "from dash"})) return "dash";
        if (content.find("fastapi") != std::string::npos) return "fastapi";
        if (content.find("flask") != std::string::npos) return "flask";
        return "python";
    }
    if (ext == ".js") {
        if (content.find("express") != std::string::npos) return "express";
        if (contains_any(content, {"from 'next", "from \"next", "require('next", "require(\"next"})) {
            return "next";
        }
        if (content.find("react") != std::string::npos) return "react";
        return "node";
    }
    return "unknown";
}

std::string UiGeneratorTool::extract_description(const std::filesystem::path& file) {
    const std::string content = read_text_file(file, kSniffBytes).value_or("");
    const std::string ext = to_lower(file.extension().string());
    std::istringstream in(content);
    std::string description;
    if (ext == ".py") {
        description = python_description(in);
    } else if (ext == ".js") {
        description = js_description(in);
    } else if (ext == ".html" || ext == ".htm") {
        description = html_description(content);
    }
    description = collapse(description);
    return description.empty() ? "No description available" : description;
}

std::vector<AppCandidate> UiGeneratorTool::scan(const std::filesystem::path& root) {
    std::vector<AppCandidate> apps;
    const auto& names = candidate_names();
    for (const auto& entry : walk_repository(root, root, default_skip_dirs())) {
        if (entry.is_directory) {
            continue;
        }
        const std::string leaf = entry.relative_path.filename().string();
        if (std::find(names.begin(), names.end(), leaf) == names.end()) {
            continue;
        }
        const auto full = root / entry.relative_path;
        apps.push_back({entry.relative_path, classify(full), extract_description(full)});
    }
    return apps;
}

ToolCallResult UiGeneratorTool::scan_apps() {
    const auto snapshot = context_.current();
    if (!snapshot) {
        return {"Error: No repository is currently cloned"};
    }
    const auto apps = scan(snapshot->path);
    if (apps.empty()) {
        return {"No runnable applications found in repository " + snapshot->name + "."};
    }

    std::ostringstream out;
    out << "Found " << apps.size() << " potential application(s):\n";
    for (const auto& app : apps) {
        out << "\n- " << app.relative_path.generic_string() << " [" << app.app_type << "]\n"
            << "  " << app.description << "\n";
    }
    return {out.str()};
}

ToolCallResult UiGeneratorTool::generate_ui(const json& arguments) {
    const auto snapshot = context_.current();
    if (!snapshot) {
        return {"Error: No repository is currently cloned"};
    }
    const auto app_path = string_arg(arguments, "app_path");
    if (!app_path) {
        return {"Error: app_path not provided"};
    }

    const policy::PolicyGuard guard;
    auto resolved = guard.validate_path_in_root(snapshot->path, *app_path);
    std::error_code ec;
    if (core::errors::is_error(resolved) ||
        !std::filesystem::is_regular_file(core::errors::get_value(resolved), ec)) {
        return {"Error: App file " + *app_path + " does not exist in the repository"};
    }
    const auto file = core::errors::get_value(resolved);
    const auto app_dir = file.parent_path();
    const std::string ext = to_lower(file.extension().string());
    const std::string app_type = classify(file);

    // Dead previews are dropped before a new one is tracked.
    static_cast<void>(supervisor_.reap_exited());

    auto port_result = process::allocate_free_port();
    if (core::errors::is_error(port_result)) {
        return {"Error: " + core::errors::get_error(port_result).message};
    }
    const std::uint16_t port = core::errors::get_value(port_result);
    const std::string port_text = std::to_string(port);

    LaunchPlan plan;
    plan.working_directory = app_dir;
    plan.environment.push_back({"PORT", port_text});

    if (ext == ".py") {
        auto requirements = app_dir / "requirements.txt";
        if (!std::filesystem::is_regular_file(requirements, ec)) {
            requirements = snapshot->path / "requirements.txt";
        }
        if (std::filesystem::is_regular_file(requirements, ec)) {
            process::CommandSpec install;
            install.argv = {options_.python_command, "-m", "pip", "install", "-r", requirements.string()};
            install.working_directory = app_dir;
            install.timeout_ms = options_.install_timeout_ms;
            plan.install_steps.push_back(install);
        }

        const std::string script = file.filename().string();
        if (app_type == "streamlit") {
            plan.argv = {options_.python_command, "-m", "streamlit", "run", script,
                         "--server.port", port_text, "--server.address", "127.0.0.1",
                         "--server.headless", "true"};
        } else if (app_type == "flask") {
            plan.argv = {options_.python_command, "-m", "flask", "--app", script, "run",
                         "--port", port_text, "--host", "127.0.0.1"};
        } else if (app_type == "fastapi") {
            plan.argv = {options_.python_command, "-m", "uvicorn", file.stem().string() + ":app",
                         "--port", port_text, "--host", "127.0.0.1"};
        } else {
            if (app_type == "gradio") {
                plan.environment.push_back({"GRADIO_SERVER_PORT", port_text});
                plan.environment.push_back({"GRADIO_SERVER_NAME", "127.0.0.1"});
            }
            plan.argv = {options_.python_command, script};
        }
    } else if (ext == ".js") {
        const auto manifest = app_dir / "package.json";
        bool has_start_script = false;
        if (std::filesystem::is_regular_file(manifest, ec)) {
            process::CommandSpec install;
            install.argv = {"npm", "install"};
            install.working_directory = app_dir;
            install.timeout_ms = options_.install_timeout_ms;
            plan.install_steps.push_back(install);

            const json package = json::parse(read_text_file(manifest).value_or("{}"), nullptr, false);
            has_start_script = package.is_object() && package.contains("scripts") &&
                               package["scripts"].is_object() &&
                               package["scripts"].contains("start");
        }
        plan.environment.push_back({"HOST", "127.0.0.1"});
        if (has_start_script) {
            plan.argv = {"npm", "start"};
        } else {
            plan.argv = {"node", file.filename().string()};
        }
    } else if (ext == ".html" || ext == ".htm") {
        plan.argv = {options_.python_command, "-m", "http.server", port_text, "--bind", "127.0.0.1"};
    } else {
        return {"Error: Unsupported app type '" + ext + "'. Supported: .py, .js, .html"};
    }

    for (const auto& step : plan.install_steps) {
        LOG_INFO("UiGeneratorTool: installing dependencies with " + step.argv.front());
        auto installed = process::run_process(step);
        if (core::errors::is_error(installed)) {
            return {"Error: Dependency installation failed: " +
                    core::errors::get_error(installed).message};
        }
        const auto& capture = core::errors::get_value(installed);
        if (!capture.succeeded()) {
            return {"Error: Dependency installation failed (exit code " +
                    std::to_string(capture.exit_code) + "):\n" + capture.combined_output()};
        }
    }

    process::LaunchRequest request;
    request.id_prefix = "ui";
    request.app_path_or_kind = *app_path + " (" + app_type + ")";
    request.argv = plan.argv;
    request.working_directory = plan.working_directory;
    request.environment = plan.environment;
    request.port = port;
    request.url = "http://localhost:" + port_text;
    request.grace_period = options_.grace_period;

    auto launched = supervisor_.launch(request);
    if (core::errors::is_error(launched)) {
        return {"Error: Failed to start UI for " + *app_path + ": " +
                core::errors::get_error(launched).message};
    }
    const auto& session = core::errors::get_value(launched);

    std::ostringstream out;
    out << "UI started successfully.\n"
        << "session_id: " << session.session_id << "\n"
        << "url: " << session.url << "\n"
        << "port: " << session.port << "\n"
        << "app: " << *app_path << "\n"
        << "type: " << app_type;
    return {out.str()};
}

ToolCallResult UiGeneratorTool::stop_ui(const json& arguments) {
    const auto session_id = string_arg(arguments, "session_id");
    if (!session_id) {
        return {"Error: session_id not provided"};
    }
    auto stopped = supervisor_.stop(*session_id);
    if (core::errors::is_error(stopped)) {
        return {"Error: UI session " + *session_id + " not found"};
    }
    return {"Stopped UI session " + *session_id + " (" +
            process::to_string(core::errors::get_value(stopped).outcome) + ")"};
}

ToolCallResult UiGeneratorTool::list_sessions() {
    const auto reaped = supervisor_.reap_exited();
    const auto sessions = supervisor_.list();

    std::ostringstream out;
    if (sessions.empty()) {
        out << "No UI sessions are running.";
    } else {
        out << "Running UI sessions:\n";
        for (const auto& session : sessions) {
            out << "\n- " << session.session_id << ": " << session.app_path_or_kind << " at "
                << session.url << " (pid " << session.pid << ")";
        }
    }
    if (!reaped.empty()) {
        out << "\n\nRemoved " << reaped.size() << " session(s) whose process had exited.";
    }
    return {out.str()};
}

json UiGeneratorTool::input_schema() {
    return json{
        {"type", "object"},
        {"properties",
         {{"action",
           {{"type", "string"},
            {"description", "The action to perform (scan_apps, generate_ui, stop_ui, list_sessions)"},
            {"enum", action_enum(kActions)}}},
          {"app_path",
           {{"type", "string"},
            {"description", "Path of the app entry point in the repository (for 'generate_ui')"}}},
          {"session_id",
           {{"type", "string"},
            {"description", "Session ID returned by 'generate_ui' (for 'stop_ui')"}}}}},
        {"required", json::array({"action"})}};
}

}  // namespace deploypilot::tools
