#include "tools/deployment_tool.hpp"

#include <algorithm>
#include <initializer_list>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include "core/config/session_id.hpp"
#include "core/logging/logger.hpp"
#include "process/command_runner.hpp"
#include "process/port_allocator.hpp"
#include "tools/file_utils.hpp"
#include "tools/tool_args.hpp"

namespace deploypilot::tools {

using nlohmann::json;
using protocol::ToolCallResult;
using core::errors::ErrorCategory;
using core::errors::PilotError;

namespace {

constexpr ActionTable<DeployAction, 4> kActions = {{
    {"autodeploy", DeployAction::Autodeploy},
    {"generate_deployment_files", DeployAction::GenerateDeploymentFiles},
    {"deploy", DeployAction::Deploy},
    {"stop", DeployAction::Stop},
}};

constexpr int kMaxIdAttempts = 16;
constexpr std::uint16_t kDefaultCustomPort = 8000;

const std::string kNoRepository = "Error: No repository is currently cloned";

bool file_exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && !ec;
}

std::string first_existing(const std::filesystem::path& root, const std::vector<std::string>& names) {
    for (const auto& name : names) {
        if (file_exists(root / name)) {
            return name;
        }
    }
    return "";
}

// Distribution names from requirements.txt, lowercased, without specifiers.
std::vector<std::string> requirement_names(const std::string& content) {
    std::vector<std::string> names;
    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        const auto start = line.find_first_not_of(" \t");
        if (start == std::string::npos || line[start] == '#' || line[start] == '-') {
            continue;
        }
        const auto end = line.find_first_of("=<>!~;[ \t\r", start);
        names.push_back(to_lower(line.substr(start, end == std::string::npos ? std::string::npos : end - start)));
    }
    return names;
}

std::uint16_t exposed_port(const std::string& dockerfile) {
    std::istringstream in(dockerfile);
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream words(line);
        std::string keyword;
        std::string value;
        if ((words >> keyword >> value) && to_lower(keyword) == "expose") {
            try {
                const int port = std::stoi(value);
                if (port > 0 && port < 65536) {
                    return static_cast<std::uint16_t>(port);
                }
            } catch (const std::exception&) {
                continue;
            }
        }
    }
    return kDefaultCustomPort;
}

std::string python_module(const std::string& entry) {
    std::string module = entry;
    if (module.size() > 3 && module.compare(module.size() - 3, 3, ".py") == 0) {
        module.resize(module.size() - 3);
    }
    std::replace(module.begin(), module.end(), '/', '.');
    return module;
}

std::string exec_form(const std::vector<std::string>& argv) {
    return json(argv).dump();
}

PilotError unsupported(const std::string& message) {
    return PilotError{ErrorCategory::Input, message, "unsupported_project"};
}

}  // namespace

DeploymentTool::DeploymentTool(const RepositoryContext& context, DeploymentOptions options)
    : context_(context), options_(std::move(options)) {}

DeploymentTool::~DeploymentTool() {
    shutdown();
}

ToolCallResult DeploymentTool::execute(const json& arguments) {
    const std::string action_text = string_arg(arguments, "action").value_or("");
    const auto action = parse_action(action_text, kActions);
    if (!action) {
        return {unknown_action_message(action_text, kActions)};
    }

    switch (*action) {
        case DeployAction::Autodeploy:
            return autodeploy();
        case DeployAction::GenerateDeploymentFiles:
            return generate_deployment_files();
        case DeployAction::Deploy:
            return deploy();
        case DeployAction::Stop:
            return stop(arguments);
    }
    return {unknown_action_message(action_text, kActions)};
}

core::errors::Result<ProjectProfile> DeploymentTool::detect(const std::filesystem::path& root) {
    ProjectProfile profile;

    if (const auto package = read_text_file(root / "package.json")) {
        auto manifest = json::parse(*package, nullptr, false);
        if (!manifest.is_object()) {
            manifest = json::object();
        }
        auto has_dependency = [&manifest](const std::string& name) {
            for (const char* section : {"dependencies", "devDependencies"}) {
                const auto it = manifest.find(section);
                if (it != manifest.end() && it->is_object() && it->contains(name)) {
                    return true;
                }
            }
            return false;
        };

        profile.runtime = "node";
        profile.container_port = 3000;
        if (has_dependency("next")) {
            profile.framework = "next";
        } else if (has_dependency("express")) {
            profile.framework = "express";
        } else if (has_dependency("react")) {
            profile.framework = "react";
        } else {
            profile.framework = "node";
        }

        const auto scripts = manifest.find("scripts");
        profile.has_start_script = scripts != manifest.end() && scripts->is_object() &&
                                   scripts->contains("start") && (*scripts)["start"].is_string();

        const auto main = manifest.find("main");
        if (main != manifest.end() && main->is_string() && file_exists(root / main->get<std::string>())) {
            profile.entry_point = main->get<std::string>();
        } else {
            profile.entry_point = first_existing(root, {"server.js", "app.js", "index.js"});
        }

        const bool builds_itself = profile.framework == "next" || profile.framework == "react";
        if (!builds_itself && profile.entry_point.empty() && !profile.has_start_script) {
            return unsupported(
                "No Node.js entry point found (main, server.js, app.js, index.js) and no start script");
        }
        return profile;
    }

    if (const auto requirements = read_text_file(root / "requirements.txt")) {
        const auto names = requirement_names(*requirements);
        auto requires_package = [&names](const std::string& name) {
            return std::find(names.begin(), names.end(), name) != names.end();
        };

        profile.runtime = "python";
        if (requires_package("streamlit")) {
            profile.framework = "streamlit";
            profile.container_port = 8501;
        } else if (requires_package("fastapi")) {
            profile.framework = "fastapi";
            profile.container_port = 8000;
        } else if (requires_package("flask")) {
            profile.framework = "flask";
            profile.container_port = 5000;
        } else if (requires_package("django")) {
            profile.framework = "django";
            profile.container_port = 8000;
        } else {
            profile.framework = "python";
            profile.container_port = 8000;
        }

        if (profile.framework == "django") {
            profile.entry_point = first_existing(root, {"manage.py"});
        } else {
            profile.entry_point = first_existing(root, {"app.py", "main.py", "manage.py", "streamlit_app.py"});
        }
        if (profile.entry_point.empty()) {
            return unsupported(
                "No Python entry point found (app.py, main.py, manage.py, streamlit_app.py)");
        }
        return profile;
    }

    if (file_exists(root / "index.html")) {
        profile.runtime = "static";
        profile.framework = "static";
        profile.entry_point = "index.html";
        profile.container_port = 80;
        return profile;
    }

    if (const auto dockerfile = read_text_file(root / "Dockerfile")) {
        profile.runtime = "custom";
        profile.framework = "dockerfile";
        profile.container_port = exposed_port(*dockerfile);
        return profile;
    }

    return unsupported(
        "Unable to detect the project type (expected package.json, requirements.txt, index.html or a Dockerfile)");
}

std::string DeploymentTool::render_dockerfile(const ProjectProfile& profile) {
    const std::string port = std::to_string(profile.container_port);
    std::ostringstream out;

    if (profile.runtime == "node") {
        out << "FROM node:18-alpine\n"
            << "WORKDIR /app\n"
            << "COPY package*.json ./\n"
            << "RUN npm install\n"
            << "COPY . .\n";
        std::vector<std::string> command;
        if (profile.framework == "next") {
            out << "RUN npm run build\n";
            command = {"npm", "start"};
        } else if (profile.framework == "react") {
            out << "RUN npm run build\n";
            command = {"npx", "serve", "-s", "build", "-l", port};
        } else if (!profile.entry_point.empty()) {
            command = {"node", profile.entry_point};
        } else {
            command = {"npm", "start"};
        }
        out << "ENV PORT=" << port << "\n"
            << "EXPOSE " << port << "\n"
            << "CMD " << exec_form(command) << "\n";
        return out.str();
    }

    if (profile.runtime == "python") {
        out << "FROM python:3.11-slim\n"
            << "WORKDIR /app\n"
            << "COPY requirements.txt ./\n"
            << "RUN pip install --no-cache-dir -r requirements.txt\n"
            << "COPY . .\n";
        std::vector<std::string> command;
        if (profile.framework == "streamlit") {
            command = {"streamlit", "run", profile.entry_point, "--server.port", port,
                       "--server.address", "0.0.0.0", "--server.headless", "true"};
        } else if (profile.framework == "fastapi") {
            command = {"uvicorn", python_module(profile.entry_point) + ":app", "--host", "0.0.0.0",
                       "--port", port};
        } else if (profile.framework == "flask") {
            command = {"python", "-m", "flask", "--app", profile.entry_point, "run", "--host", "0.0.0.0",
                       "--port", port};
        } else if (profile.framework == "django") {
            command = {"python", profile.entry_point, "runserver", "0.0.0.0:" + port};
        } else {
            command = {"python", profile.entry_point};
        }
        out << "ENV PORT=" << port << "\n"
            << "EXPOSE " << port << "\n"
            << "CMD " << exec_form(command) << "\n";
        return out.str();
    }

    out << "FROM nginx:alpine\n"
        << "COPY . /usr/share/nginx/html\n"
        << "EXPOSE 80\n";
    return out.str();
}

// Keeps version control and the deployment files themselves out of the image.
std::string DeploymentTool::render_dockerignore(const ProjectProfile& profile) {
    std::ostringstream out;
    out << ".git\n"
        << ".dockerignore\n"
        << "Dockerfile\n"
        << "docker-compose.yml\n";
    if (profile.runtime == "node") {
        out << "node_modules\n";
    } else if (profile.runtime == "python") {
        out << "__pycache__\n"
            << "venv\n"
            << ".venv\n";
    }
    return out.str();
}

std::string DeploymentTool::render_compose(const ProjectProfile& profile, const std::uint16_t host_port) {
    std::ostringstream out;
    out << "services:\n"
        << "  app:\n"
        << "    build: .\n"
        << "    ports:\n"
        << "      - \"127.0.0.1:" << host_port << ":" << profile.container_port << "\"\n";
    if (profile.runtime == "node" || profile.runtime == "python") {
        out << "    environment:\n"
            << "      - PORT=" << profile.container_port << "\n";
    }
    out << "    restart: unless-stopped\n";
    return out.str();
}

std::vector<DeploymentRecord> DeploymentTool::deployments() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DeploymentRecord> records;
    records.reserve(deployments_.size());
    for (const auto& entry : deployments_) {
        records.push_back(entry.second);
    }
    return records;
}

std::size_t DeploymentTool::shutdown() {
    std::map<std::string, DeploymentRecord> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(deployments_);
    }
    std::size_t stopped = 0;
    for (const auto& [id, record] : pending) {
        auto result = bring_down(record);
        if (core::errors::is_error(result)) {
            LOG_WARN("DeploymentTool: teardown of " + id + " failed: " +
                     core::errors::get_error(result).message);
            continue;
        }
        ++stopped;
    }
    if (!pending.empty()) {
        LOG_INFO("DeploymentTool: tore down " + std::to_string(stopped) + " of " +
                 std::to_string(pending.size()) + " deployments");
    }
    return stopped;
}

core::errors::Result<DeploymentTool::GeneratedFiles> DeploymentTool::generate_files(
    const std::filesystem::path& root) const {
    auto detected = detect(root);
    if (core::errors::is_error(detected)) {
        return core::errors::get_error(detected);
    }

    GeneratedFiles files;
    files.profile = core::errors::get_value(detected);

    auto port = process::allocate_free_port();
    if (core::errors::is_error(port)) {
        return core::errors::get_error(port);
    }
    files.host_port = core::errors::get_value(port);

    if (file_exists(root / "Dockerfile")) {
        files.kept.push_back("Dockerfile");
    } else {
        if (!write_text_file(root / "Dockerfile", render_dockerfile(files.profile))) {
            return PilotError{ErrorCategory::Internal, "Unable to write Dockerfile", "file_write_failed"};
        }
        files.written.push_back("Dockerfile");
    }

    if (files.profile.runtime != "custom") {
        if (file_exists(root / ".dockerignore")) {
            files.kept.push_back(".dockerignore");
        } else {
            if (!write_text_file(root / ".dockerignore", render_dockerignore(files.profile))) {
                return PilotError{ErrorCategory::Internal, "Unable to write .dockerignore", "file_write_failed"};
            }
            files.written.push_back(".dockerignore");
        }
    }

    if (!write_text_file(root / "docker-compose.yml", render_compose(files.profile, files.host_port))) {
        return PilotError{ErrorCategory::Internal, "Unable to write docker-compose.yml", "file_write_failed"};
    }
    files.written.push_back("docker-compose.yml");

    LOG_INFO("DeploymentTool: generated files for " + files.profile.framework + " project, host port " +
             std::to_string(files.host_port));
    return files;
}

std::vector<std::string> DeploymentTool::compose_argv(const std::string& project) const {
    std::vector<std::string> argv;
    std::istringstream words(options_.compose_command);
    std::string word;
    while (words >> word) {
        argv.push_back(word);
    }
    argv.push_back("-p");
    argv.push_back(project);
    return argv;
}

std::string DeploymentTool::allocate_deployment_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = core::config::generate_session_id("deploy");
    for (int attempt = 1; attempt < kMaxIdAttempts && deployments_.count(id) > 0; ++attempt) {
        id = core::config::generate_session_id("deploy");
    }
    return id;
}

core::errors::Result<DeploymentRecord> DeploymentTool::bring_up(const std::filesystem::path& root,
                                                                const GeneratedFiles& files) {
    const std::string id = allocate_deployment_id();

    process::CommandSpec spec;
    spec.argv = compose_argv(id);
    spec.argv.insert(spec.argv.end(), {"up", "-d", "--build"});
    spec.working_directory = root;
    spec.timeout_ms = options_.deploy_timeout_ms;

    LOG_INFO("DeploymentTool: starting deployment " + id);
    auto capture_result = process::run_process(spec);
    if (core::errors::is_error(capture_result)) {
        return core::errors::get_error(capture_result);
    }
    const auto& capture = core::errors::get_value(capture_result);
    if (capture.timed_out || capture.exit_code != 0) {
        PilotError failure{ErrorCategory::Execution, capture.combined_output(), "deploy_failed"};
        if (capture.timed_out) {
            failure.message = "Deployment timed out after " +
                              std::to_string(options_.deploy_timeout_ms / 1000) + " seconds.\n" +
                              failure.message;
            failure.code = "deploy_timeout";
        } else {
            LOG_WARN("DeploymentTool: deployment " + id + " failed with exit code " +
                     std::to_string(capture.exit_code));
        }

        // A partial "up" can leave networks and containers behind.
        DeploymentRecord partial;
        partial.deployment_id = id;
        partial.working_directory = root;
        auto torn_down = bring_down(partial);
        if (core::errors::is_error(torn_down)) {
            LOG_WARN("DeploymentTool: cleanup of failed deployment " + id + " failed");
            if (!failure.message.empty() && failure.message.back() != '\n') {
                failure.message += "\n";
            }
            failure.message += "Cleanup failed:\n" + core::errors::get_error(torn_down).message;
        }
        return failure;
    }

    DeploymentRecord record;
    record.deployment_id = id;
    record.working_directory = root;
    record.framework = files.profile.framework;
    record.host_port = files.host_port;
    record.url = "http://localhost:" + std::to_string(files.host_port);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deployments_[id] = record;
    }
    LOG_INFO("DeploymentTool: deployment " + id + " -> RUNNING at " + record.url);
    return record;
}

core::errors::Result<bool> DeploymentTool::bring_down(const DeploymentRecord& record) const {
    process::CommandSpec spec;
    spec.argv = compose_argv(record.deployment_id);
    spec.argv.push_back("down");
    std::error_code ec;
    spec.working_directory = std::filesystem::is_directory(record.working_directory, ec)
                                 ? record.working_directory
                                 : std::filesystem::temp_directory_path(ec);
    spec.timeout_ms = options_.teardown_timeout_ms;

    auto capture_result = process::run_process(spec);
    if (core::errors::is_error(capture_result)) {
        return core::errors::get_error(capture_result);
    }
    const auto& capture = core::errors::get_value(capture_result);
    if (!capture.succeeded()) {
        return PilotError{ErrorCategory::Execution,
                          capture.timed_out ? "docker compose down timed out" : capture.combined_output(),
                          "teardown_failed"};
    }
    LOG_INFO("DeploymentTool: deployment " + record.deployment_id + " -> STOPPED");
    return true;
}

ToolCallResult DeploymentTool::generate_deployment_files() {
    const auto snapshot = context_.current();
    if (!snapshot) {
        return {kNoRepository};
    }
    auto generated = generate_files(snapshot->path);
    if (core::errors::is_error(generated)) {
        return {"Error generating deployment files: " + core::errors::get_error(generated).message};
    }
    const auto& files = core::errors::get_value(generated);

    std::ostringstream out;
    out << "Generated deployment files for " << snapshot->name << " (" << files.profile.framework << "):\n";
    for (const auto& name : files.written) {
        out << "  " << name << " (written)\n";
    }
    for (const auto& name : files.kept) {
        out << "  " << name << " (kept existing)\n";
    }
    out << "container_port: " << files.profile.container_port << "\n"
        << "host_port: 127.0.0.1:" << files.host_port;
    return {out.str()};
}

ToolCallResult DeploymentTool::deploy() {
    const auto snapshot = context_.current();
    if (!snapshot) {
        return {kNoRepository};
    }
    auto generated = generate_files(snapshot->path);
    if (core::errors::is_error(generated)) {
        return {"Error generating deployment files: " + core::errors::get_error(generated).message};
    }
    auto deployed = bring_up(snapshot->path, core::errors::get_value(generated));
    if (core::errors::is_error(deployed)) {
        return {"Deployment failed:\n" + core::errors::get_error(deployed).message};
    }
    const auto& record = core::errors::get_value(deployed);
    return {"Deployment started successfully.\ndeployment_id: " + record.deployment_id +
            "\nurl: " + record.url + "\nframework: " + record.framework};
}

ToolCallResult DeploymentTool::autodeploy() {
    const auto snapshot = context_.current();
    if (!snapshot) {
        return {kNoRepository};
    }
    auto generated = generate_files(snapshot->path);
    if (core::errors::is_error(generated)) {
        return {"Error: " + core::errors::get_error(generated).message};
    }
    const auto& files = core::errors::get_value(generated);

    std::ostringstream out;
    out << "Detected " << files.profile.runtime << " project (framework: " << files.profile.framework;
    if (!files.profile.entry_point.empty()) {
        out << ", entry: " << files.profile.entry_point;
    }
    out << ")\n";
    for (const auto& name : files.written) {
        out << "Wrote " << name << "\n";
    }
    for (const auto& name : files.kept) {
        out << "Kept existing " << name << "\n";
    }

    auto deployed = bring_up(snapshot->path, files);
    if (core::errors::is_error(deployed)) {
        out << "Deployment failed:\n" << core::errors::get_error(deployed).message;
        return {out.str()};
    }
    const auto& record = core::errors::get_value(deployed);
    out << "Deployment started successfully.\n"
        << "deployment_id: " << record.deployment_id << "\n"
        << "url: " << record.url;
    return {out.str()};
}

ToolCallResult DeploymentTool::stop(const json& arguments) {
    const auto id = string_arg(arguments, "deployment_id");
    if (!id) {
        return {"Error: Deployment ID not provided"};
    }

    DeploymentRecord record;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = deployments_.find(*id);
        if (it == deployments_.end()) {
            return {"Error: Deployment " + *id + " not found"};
        }
        record = it->second;
    }

    auto result = bring_down(record);
    if (core::errors::is_error(result)) {
        return {"Error stopping deployment " + *id + ":\n" + core::errors::get_error(result).message};
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deployments_.erase(*id);
    }
    return {"Stopped deployment " + *id};
}

json DeploymentTool::input_schema() {
    return json{
        {"type", "object"},
        {"properties",
         {{"action",
           {{"type", "string"},
            {"description", "The action to perform (autodeploy, generate_deployment_files, deploy, stop)"},
            {"enum", action_enum(kActions)}}},
          {"deployment_id",
           {{"type", "string"}, {"description", "The deployment to stop (for 'stop' action)"}}}}},
        {"required", json::array({"action"})}};
}

}  // namespace deploypilot::tools
