#include "policy/policy_guard.hpp"

#include <iterator>
#include <system_error>

namespace deploypilot::policy {

using core::errors::ErrorCategory;
using core::errors::PilotError;

bool PolicyGuard::is_within_root(const std::filesystem::path& root,
                                 const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (root_it->empty() && std::next(root_it) == root.end()) {
            // Trailing separator on the root.
            return true;
        }
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end() ||
           (root_it->empty() && std::next(root_it) == root.end());
}

core::errors::Result<std::filesystem::path> PolicyGuard::validate_path_in_root(
    const std::filesystem::path& root,
    const std::filesystem::path& target_path) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec) || ec) {
        return PilotError{ErrorCategory::Input,
                          "Root is not a directory: " + root.string(),
                          "invalid_root"};
    }

    const std::filesystem::path canonical_root = std::filesystem::weakly_canonical(root, ec);
    if (ec) {
        return PilotError{ErrorCategory::Input,
                          "Unable to resolve root: " + root.string(),
                          "invalid_root"};
    }

    std::filesystem::path candidate = target_path;
    if (candidate.is_relative()) {
        candidate = canonical_root / candidate;
    }

    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return PilotError{ErrorCategory::Input,
                          "Unable to resolve target path: " + target_path.string(),
                          "invalid_path"};
    }

    if (!is_within_root(canonical_root, canonical_candidate)) {
        return PilotError{ErrorCategory::Input,
                          "Path escapes repository root: " + target_path.string(),
                          "path_outside_root"};
    }

    return canonical_candidate;
}

core::errors::Result<std::string> PolicyGuard::validate_command(
    const std::string& command) const {
    if (command.find_first_not_of(" \t\r\n") == std::string::npos) {
        return PilotError{ErrorCategory::Input, "Command cannot be empty.", "empty_command"};
    }
    return command;
}

}  // namespace deploypilot::policy
