#include "tools/repository_context.hpp"

#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"
#include "process/command_runner.hpp"

namespace deploypilot::tools {

using core::errors::ErrorCategory;
using core::errors::PilotError;

namespace {

void remove_checkout(const std::filesystem::path& path) {
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        LOG_WARN("RepositoryContext: failed to remove " + path.string() + ": " + ec.message());
    } else {
        LOG_DEBUG("RepositoryContext: removed checkout " + path.string());
    }
}

}  // namespace

RepositoryContext::~RepositoryContext() {
    clear();
}

void RepositoryContext::commit(RepositorySnapshot snapshot) {
    if (snapshot_.has_value() && snapshot_->path != snapshot.path) {
        remove_checkout(snapshot_->path);
    }
    LOG_INFO("RepositoryContext: active repository " + snapshot.name + " at " +
             snapshot.path.string());
    snapshot_ = std::move(snapshot);
}

void RepositoryContext::clear() {
    if (!snapshot_.has_value()) {
        return;
    }
    remove_checkout(snapshot_->path);
    snapshot_.reset();
}

core::errors::Result<RepositorySnapshot> RepositoryContext::require(
    const bool require_git_work_tree) const {
    if (!snapshot_.has_value()) {
        return PilotError{ErrorCategory::Input, "No repository is currently cloned",
                          "no_repository"};
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(snapshot_->path, ec) || ec) {
        return PilotError{ErrorCategory::Input,
                          "Repository directory no longer exists: " + snapshot_->path.string(),
                          "repository_missing"};
    }

    if (require_git_work_tree) {
        process::CommandSpec spec;
        spec.argv = {"git", "rev-parse", "--is-inside-work-tree"};
        spec.working_directory = snapshot_->path;
        spec.timeout_ms = 10000;
        auto capture = process::run_process(spec);
        if (core::errors::is_error(capture)) {
            return core::errors::get_error(capture);
        }
        const auto& result = core::errors::get_value(capture);
        if (!result.succeeded() || result.stdout_text.rfind("true", 0) != 0) {
            return PilotError{ErrorCategory::Input,
                              "Not a git working tree: " + snapshot_->path.string(),
                              "not_a_git_repository"};
        }
    }
    return *snapshot_;
}

std::string RepositoryContext::derive_name(const std::string& url) {
    std::string trimmed = url;
    while (!trimmed.empty() && (trimmed.back() == '/' || trimmed.back() == '\\')) {
        trimmed.pop_back();
    }
    const auto slash = trimmed.find_last_of("/:");
    std::string name = slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
    const std::string suffix = ".git";
    if (name.size() > suffix.size() &&
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
        name.resize(name.size() - suffix.size());
    }
    return name;
}

}  // namespace deploypilot::tools
