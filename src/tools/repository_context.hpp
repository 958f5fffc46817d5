#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/pilot_errors.hpp"

namespace deploypilot::tools {

struct RepositorySnapshot {
    std::filesystem::path path;
    std::string url;
    std::string name;
};

// The single record of which checkout is active. One instance per server,
// shared by reference with every repository-aware handler. Only the clone
// action writes it (through commit/clear). The checkout directory is owned
// here and removed on the next clone and on destruction.
class RepositoryContext {
public:
    RepositoryContext() = default;
    ~RepositoryContext();

    RepositoryContext(const RepositoryContext&) = delete;
    RepositoryContext& operator=(const RepositoryContext&) = delete;

    std::optional<RepositorySnapshot> current() const { return snapshot_; }
    bool has_repository() const { return snapshot_.has_value(); }

    // Takes ownership of snapshot.path. The previous checkout, if different,
    // is removed first.
    void commit(RepositorySnapshot snapshot);

    // Removes the checkout directory and forgets it.
    void clear();

    // Validates that the context points at an existing directory, and
    // optionally at a git working tree. Error codes: no_repository,
    // repository_missing, not_a_git_repository.
    core::errors::Result<RepositorySnapshot> require(bool require_git_work_tree) const;

    // Last URL path segment without a trailing ".git".
    static std::string derive_name(const std::string& url);

private:
    std::optional<RepositorySnapshot> snapshot_;
};

}  // namespace deploypilot::tools
