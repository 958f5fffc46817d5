#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/session_id.hpp"
#include "core/errors/pilot_errors.hpp"
#include "process/command_runner.hpp"
#include "tools/repository_context.hpp"
#include "tools/repository_tool.hpp"

namespace {

using deploypilot::core::errors::get_value;
using deploypilot::core::errors::is_error;
using deploypilot::tools::RepositoryContext;
using deploypilot::tools::RepositoryTool;
using nlohmann::json;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_repository_tool_" + deploypilot::core::config::generate_token());
        std::filesystem::create_directories(root_);
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

bool run_git(const std::vector<std::string>& args, const std::filesystem::path& cwd) {
    deploypilot::process::CommandSpec spec;
    spec.argv = {"git", "-c", "user.name=Test", "-c", "user.email=test@example.com"};
    spec.argv.insert(spec.argv.end(), args.begin(), args.end());
    spec.working_directory = cwd;
    auto result = deploypilot::process::run_process(spec);
    return !is_error(result) && get_value(result).succeeded();
}

// A committed repository named "sample-app" with a source file and a binary.
std::filesystem::path make_source_repo(const TempWorkspace& workspace) {
    const auto repo = workspace.root() / "sample-app";
    write_file(repo / "README.md", "# Sample\n");
    write_file(repo / "src/app.py", "print('hi')\n");
    {
        std::ofstream bin(repo / "logo.bin", std::ios::binary);
        const char bytes[] = {'\x89', 'P', 'N', 'G', '\0', '\x01', '\0', '\x02'};
        bin.write(bytes, sizeof(bytes));
    }
    EXPECT_TRUE(run_git({"init", "-q"}, repo));
    EXPECT_TRUE(run_git({"add", "."}, repo));
    EXPECT_TRUE(run_git({"commit", "-q", "-m", "initial"}, repo));
    return repo;
}

class RepositoryToolTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!deploypilot::process::executable_on_path("git")) {
            GTEST_SKIP() << "git not available";
        }
    }

    std::string call(const json& arguments) { return tool_.execute(arguments).content; }

    std::string clone(const std::filesystem::path& source) {
        return call(json{{"action", "clone"}, {"repo_url", source.string()}});
    }

    TempWorkspace workspace_;
    RepositoryContext context_;
    RepositoryTool tool_{context_, 60000};
};

TEST_F(RepositoryToolTest, ClonesIntoTemporaryCheckout) {
    const auto source = make_source_repo(workspace_);
    const std::string text = clone(source);
    EXPECT_EQ(text.rfind("Successfully cloned repository: " + source.string() + " to ", 0), 0u);

    ASSERT_TRUE(context_.has_repository());
    const auto snapshot = *context_.current();
    EXPECT_EQ(snapshot.name, "sample-app");
    EXPECT_TRUE(std::filesystem::exists(snapshot.path / "README.md"));
}

TEST_F(RepositoryToolTest, SecondCloneReplacesFirstCheckout) {
    const auto source = make_source_repo(workspace_);
    clone(source);
    const auto first = context_.current()->path;

    clone(source);
    const auto second = context_.current()->path;
    EXPECT_NE(first, second);
    EXPECT_FALSE(std::filesystem::exists(first));
    EXPECT_TRUE(std::filesystem::exists(second));
}

TEST_F(RepositoryToolTest, FailedCloneLeavesNoRepository) {
    const std::string text = clone(workspace_.root() / "does-not-exist");
    EXPECT_EQ(text.rfind("Error cloning repository: ", 0), 0u);
    EXPECT_FALSE(context_.has_repository());
}

TEST_F(RepositoryToolTest, LeadingDashUrlIsNotAnOption) {
    const std::string text = call(json{{"action", "clone"}, {"repo_url", "--bare"}});
    EXPECT_EQ(text.rfind("Error cloning repository: ", 0), 0u) << text;
    EXPECT_NE(text.find("--bare"), std::string::npos) << text;
    EXPECT_FALSE(context_.has_repository());
}

TEST_F(RepositoryToolTest, ListingTwiceGivesSameOutput) {
    clone(make_source_repo(workspace_));
    const std::string first = call(json{{"action", "list_files"}, {"path", ""}});
    const std::string second = call(json{{"action", "list_files"}, {"path", ""}});
    EXPECT_EQ(first.rfind("Files in repository sample-app:\n\n", 0), 0u) << first;
    EXPECT_EQ(first, second);
}

TEST_F(RepositoryToolTest, ListsFilesWithoutGitDirectory) {
    clone(make_source_repo(workspace_));
    const std::string text = call(json{{"action", "list_files"}});
    EXPECT_EQ(text.rfind("Files in repository sample-app:\n\n", 0), 0u);
    EXPECT_NE(text.find("[FILE] README.md"), std::string::npos);
    EXPECT_NE(text.find("[DIR]  src"), std::string::npos);
    EXPECT_NE(text.find("[FILE] src/app.py"), std::string::npos);
    EXPECT_EQ(text.find(".git/"), std::string::npos);
}

TEST_F(RepositoryToolTest, ListsSubdirectory) {
    clone(make_source_repo(workspace_));
    const std::string text = call(json{{"action", "list_files"}, {"path", "src"}});
    EXPECT_NE(text.find("[FILE] src/app.py"), std::string::npos);
    EXPECT_EQ(text.find("README.md"), std::string::npos);
}

TEST_F(RepositoryToolTest, RejectsListingOutsideCheckout) {
    clone(make_source_repo(workspace_));
    EXPECT_EQ(call(json{{"action", "list_files"}, {"path", "../"}}),
              "Error: Path ../ does not exist in the repository");
}

TEST_F(RepositoryToolTest, ReadsTextFile) {
    clone(make_source_repo(workspace_));
    EXPECT_EQ(call(json{{"action", "read_file"}, {"file_path", "src/app.py"}}),
              "Contents of src/app.py:\n\n```\nprint('hi')\n\n```");
}

TEST_F(RepositoryToolTest, RefusesBinaryFile) {
    clone(make_source_repo(workspace_));
    EXPECT_EQ(call(json{{"action", "read_file"}, {"file_path", "logo.bin"}}),
              "Error: File logo.bin is a binary file");
}

TEST_F(RepositoryToolTest, RefusesEscapingFilePath) {
    clone(make_source_repo(workspace_));
    EXPECT_EQ(call(json{{"action", "read_file"}, {"file_path", "../../etc/passwd"}}),
              "Error: File ../../etc/passwd does not exist in the repository");
}

TEST_F(RepositoryToolTest, ReportsRepositoryInfo) {
    const auto source = make_source_repo(workspace_);
    clone(source);
    const std::string text = call(json{{"action", "get_repo_info"}});
    EXPECT_EQ(text.rfind("Repository Information:\n\n", 0), 0u);
    EXPECT_NE(text.find("name: sample-app\n"), std::string::npos);
    EXPECT_NE(text.find("url: " + source.string() + "\n"), std::string::npos);
    EXPECT_NE(text.find("file_count: 3\n"), std::string::npos);
    EXPECT_NE(text.find("initial"), std::string::npos);
}

TEST_F(RepositoryToolTest, ActionsNeedRepository) {
    EXPECT_EQ(call(json{{"action", "list_files"}}), "Error: No repository is currently cloned");
    EXPECT_EQ(call(json{{"action", "get_repo_info"}}), "Error: No repository is currently cloned");
}

TEST_F(RepositoryToolTest, ValidatesArguments) {
    EXPECT_EQ(call(json{{"action", "clone"}}), "Error: Repository URL not provided");
    EXPECT_EQ(call(json{{"action", "push"}}),
              "Error: Unknown action 'push'. Available actions: clone, list_files, read_file, "
              "get_repo_info");
}

TEST(RepositoryContextTest, DerivesNameFromUrl) {
    EXPECT_EQ(RepositoryContext::derive_name("https://github.com/user/project.git"), "project");
    EXPECT_EQ(RepositoryContext::derive_name("https://github.com/user/project/"), "project");
    EXPECT_EQ(RepositoryContext::derive_name("git@github.com:user/tool.git"), "tool");
}

}  // namespace
