#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/session_id.hpp"
#include "core/errors/pilot_errors.hpp"
#include "policy/policy_guard.hpp"

namespace {

using deploypilot::core::errors::get_error;
using deploypilot::core::errors::get_value;
using deploypilot::core::errors::is_error;
using deploypilot::policy::PolicyGuard;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_policy_guard_" + deploypilot::core::config::generate_token());
        std::filesystem::create_directories(root_ / "sub");
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

TEST(PolicyGuardTest, AllowsPathInsideRoot) {
    TempWorkspace workspace;
    write_file(workspace.root() / "sub/sample.txt", "ok");

    PolicyGuard guard;
    auto result = guard.validate_path_in_root(workspace.root(), "sub/sample.txt");
    ASSERT_FALSE(is_error(result));

    const auto resolved = get_value(result);
    EXPECT_TRUE(resolved.is_absolute());
    EXPECT_EQ(resolved.filename().string(), "sample.txt");
}

TEST(PolicyGuardTest, AllowsMissingPathInsideRoot) {
    TempWorkspace workspace;
    PolicyGuard guard;
    auto result = guard.validate_path_in_root(workspace.root(), "sub/not_yet_created.py");
    ASSERT_FALSE(is_error(result));
}

TEST(PolicyGuardTest, RejectsPathOutsideRoot) {
    TempWorkspace workspace;
    const auto outside = workspace.root().parent_path() / "outside.txt";
    write_file(outside, "outside");

    PolicyGuard guard;
    auto result = guard.validate_path_in_root(workspace.root(), outside);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_outside_root");

    std::error_code ec;
    std::filesystem::remove(outside, ec);
}

TEST(PolicyGuardTest, RejectsParentTraversal) {
    TempWorkspace workspace;
    PolicyGuard guard;
    auto result = guard.validate_path_in_root(workspace.root(), "sub/../../escape.py");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_outside_root");
}

TEST(PolicyGuardTest, RejectsSiblingWithSharedPrefix) {
    TempWorkspace workspace;
    const auto sibling = std::filesystem::path(workspace.root().string() + "_sibling") / "a.txt";

    PolicyGuard guard;
    auto result = guard.validate_path_in_root(workspace.root(), sibling);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "path_outside_root");
}

TEST(PolicyGuardTest, RejectsInvalidRoot) {
    PolicyGuard guard;
    const auto missing_root =
        std::filesystem::current_path() /
        ("__missing_repository_root__" + deploypilot::core::config::generate_token());
    std::error_code ec;
    std::filesystem::remove_all(missing_root, ec);
    auto result = guard.validate_path_in_root(missing_root, "a.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_root");
}

TEST(PolicyGuardTest, AllowsAnyNonEmptyCommand) {
    PolicyGuard guard;
    auto result = guard.validate_command("rm -rf build && make");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "rm -rf build && make");
}

TEST(PolicyGuardTest, RejectsEmptyCommand) {
    PolicyGuard guard;
    auto result = guard.validate_command("");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "empty_command");
}

TEST(PolicyGuardTest, RejectsWhitespaceCommand) {
    PolicyGuard guard;
    auto result = guard.validate_command("  \t ");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "empty_command");
}

}  // namespace
