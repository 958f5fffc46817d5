#pragma once

#include <filesystem>
#include <string>
#include "core/errors/pilot_errors.hpp"

namespace deploypilot::policy {

// Keeps repository-relative paths inside the checkout. Command text is not
// filtered: execute_command runs arbitrary commands with the server's
// privileges and only rejects an empty command.
class PolicyGuard {
public:
    core::errors::Result<std::filesystem::path> validate_path_in_root(
        const std::filesystem::path& root,
        const std::filesystem::path& target_path) const;

    core::errors::Result<std::string> validate_command(
        const std::string& command) const;

    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
};

}  // namespace deploypilot::policy
