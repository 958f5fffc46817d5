#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/session_id.hpp"
#include "process/command_runner.hpp"
#include "tools/code_analysis_tool.hpp"
#include "tools/repository_context.hpp"

namespace {

using deploypilot::tools::CodeAnalysisTool;
using deploypilot::tools::RepositoryContext;
using nlohmann::json;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_code_analysis_" + deploypilot::core::config::generate_token());
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

const char* kPythonSource =
    "#!/usr/bin/env python3\n"
    "# helper module\n"
    "import os\n"
    "from typing import List\n"
    "\n"
    "class Greeter:\n"
    "    def greet(self):\n"
    "        return \"hi\"\n"
    "\n"
    "async def main():\n"
    "    pass\n";

class CodeAnalysisToolTest : public ::testing::Test {
protected:
    CodeAnalysisToolTest() : tool_(context_) {
        checkout_ = workspace_.root() / "checkout";
        std::filesystem::create_directories(checkout_);
        context_.commit({checkout_, "https://github.com/example/shop.git", "shop"});
    }

    std::string call(const json& arguments) { return tool_.execute(arguments).content; }

    TempWorkspace workspace_;
    std::filesystem::path checkout_;
    RepositoryContext context_;
    CodeAnalysisTool tool_;
};

TEST(CodeAnalysisMetricsTest, MeasuresPython) {
    const auto metrics = CodeAnalysisTool::measure("python", kPythonSource);
    EXPECT_EQ(metrics.language, "python");
    EXPECT_EQ(metrics.total_lines, 11u);
    EXPECT_EQ(metrics.blank_lines, 2u);
    EXPECT_EQ(metrics.comment_lines, 1u);
    EXPECT_EQ(metrics.class_count, 1u);
    EXPECT_EQ(metrics.function_count, 2u);
    ASSERT_EQ(metrics.imports.size(), 2u);
    EXPECT_EQ(metrics.imports[1], "from typing import List");
}

TEST(CodeAnalysisMetricsTest, MeasuresCppWithBlockComments) {
    const auto metrics = CodeAnalysisTool::measure("cpp",
                                                   "#include <vector>\n"
                                                   "// comment\n"
                                                   "/* block\n"
                                                   " * more\n"
                                                   " */\n"
                                                   "class Widget {\n"
                                                   "int add(int a, int b) {\n"
                                                   "    if (a) {\n"
                                                   "    return a + b;\n"
                                                   "}\n");
    EXPECT_EQ(metrics.total_lines, 10u);
    EXPECT_EQ(metrics.blank_lines, 0u);
    EXPECT_EQ(metrics.comment_lines, 4u);
    EXPECT_EQ(metrics.class_count, 1u);
    EXPECT_EQ(metrics.function_count, 1u);
    EXPECT_EQ(metrics.imports.size(), 1u);
}

TEST(CodeAnalysisMetricsTest, MeasuresJavaScript) {
    const auto metrics = CodeAnalysisTool::measure("javascript",
                                                   "const express = require('express');\n"
                                                   "export const handler = () => 1;\n"
                                                   "function start() {}\n"
                                                   "class Api {}\n");
    EXPECT_EQ(metrics.imports.size(), 1u);
    EXPECT_EQ(metrics.function_count, 2u);
    EXPECT_EQ(metrics.class_count, 1u);
}

TEST(CodeAnalysisMetricsTest, UnknownLanguageOnlyCountsLines) {
    const auto metrics = CodeAnalysisTool::measure("", "a\n\nclass X:\n");
    EXPECT_EQ(metrics.language, "text");
    EXPECT_EQ(metrics.total_lines, 3u);
    EXPECT_EQ(metrics.blank_lines, 1u);
    EXPECT_EQ(metrics.class_count, 0u);
}

TEST(CodeAnalysisMetricsTest, MapsExtensionsToLanguages) {
    EXPECT_EQ(CodeAnalysisTool::language_for("a/b.py"), "python");
    EXPECT_EQ(CodeAnalysisTool::language_for("x.TSX"), "typescript");
    EXPECT_EQ(CodeAnalysisTool::language_for("lib.hpp"), "cpp");
    EXPECT_EQ(CodeAnalysisTool::language_for("README.md"), "");
}

TEST_F(CodeAnalysisToolTest, SummarizesRepository) {
    write_file(checkout_ / "app.py", kPythonSource);
    write_file(checkout_ / "src/util.js", "module.exports = {};\n");
    write_file(checkout_ / "src/other.js", "console.log(1);\nconsole.log(2);\n");
    write_file(checkout_ / "node_modules/dep/index.js", "ignored\n");

    const std::string text = call(json{{"action", "summarize_repo"}});
    EXPECT_EQ(text.rfind("Repository summary for shop:\n\n", 0), 0u);
    EXPECT_NE(text.find("file_count: 3\n"), std::string::npos);
    EXPECT_NE(text.find("total_lines: 14\n"), std::string::npos);
    EXPECT_NE(text.find("File types:\n  .js: 2\n  .py: 1\n"), std::string::npos);
    EXPECT_NE(text.find("Largest files:\n  app.py ("), std::string::npos);
    EXPECT_NE(text.find("  [FILE] app.py\n"), std::string::npos);
    EXPECT_NE(text.find("  [DIR]  src\n"), std::string::npos);
    EXPECT_EQ(text.find("node_modules"), std::string::npos);
}

TEST_F(CodeAnalysisToolTest, AnalyzesSingleFile) {
    write_file(checkout_ / "app.py", kPythonSource);
    const std::string text = call(json{{"action", "analyze_code"}, {"file_path", "app.py"}});
    EXPECT_EQ(text.rfind("Code analysis for app.py:\n\nFile: app.py\n  language: python\n", 0), 0u);
    EXPECT_NE(text.find("  functions: 2\n"), std::string::npos);
    EXPECT_NE(text.find("  imports (2):\n    import os\n"), std::string::npos);
}

TEST_F(CodeAnalysisToolTest, AnalyzeRejectsMissingAndBinaryFiles) {
    {
        std::ofstream bin(checkout_ / "blob.py", std::ios::binary);
        const char bytes[] = {'a', '\0', 'b'};
        bin.write(bytes, sizeof(bytes));
    }
    EXPECT_EQ(call(json{{"action", "analyze_code"}, {"file_path", "nope.py"}}),
              "Error: File nope.py does not exist in the repository");
    EXPECT_EQ(call(json{{"action", "analyze_code"}, {"file_path", "../../x.py"}}),
              "Error: File ../../x.py does not exist in the repository");
    EXPECT_EQ(call(json{{"action", "analyze_code"}, {"file_path", "blob.py"}}),
              "Error: File blob.py is a binary file");
}

TEST_F(CodeAnalysisToolTest, AnalyzesWholeRepositoryWithLimit) {
    for (int i = 0; i < 52; ++i) {
        write_file(checkout_ / ("m" + std::to_string(100 + i) + ".py"), "def f():\n    pass\n");
    }
    write_file(checkout_ / "notes.md", "# not code\n");

    const std::string text = call(json{{"action", "analyze_code"}});
    EXPECT_EQ(text.rfind("Code analysis for repository shop (50 files analyzed, limited to 50 of 52):\n\n",
                         0),
              0u);
    EXPECT_NE(text.find("Totals:\n  total_lines: 100\n"), std::string::npos);
    EXPECT_NE(text.find("  functions: 50\n"), std::string::npos);
    EXPECT_EQ(text.find("notes.md"), std::string::npos);
}

TEST_F(CodeAnalysisToolTest, ReportsRepositoryWithoutSources) {
    write_file(checkout_ / "README.md", "hello\n");
    EXPECT_EQ(call(json{{"action", "analyze_code"}}), "No source files found in repository shop");
}

TEST_F(CodeAnalysisToolTest, FindsPatterns) {
    if (!deploypilot::process::executable_on_path("grep")) {
        GTEST_SKIP() << "grep not available";
    }
    write_file(checkout_ / "app.py", kPythonSource);
    write_file(checkout_ / "web/server.js", "function handler() {}\n");

    const std::string text = call(json{{"action", "find_patterns"}, {"pattern", "def [a-z]+"}});
    EXPECT_EQ(text.rfind("Matches for pattern 'def [a-z]+':\n\n", 0), 0u);
    EXPECT_NE(text.find("app.py:7:    def greet(self):"), std::string::npos);
    EXPECT_NE(text.find("app.py:10:async def main():"), std::string::npos);
    EXPECT_EQ(text.find("./"), std::string::npos);

    EXPECT_EQ(call(json{{"action", "find_patterns"}, {"pattern", "def [a-z]+"}, {"file_pattern", "*.js"}}),
              "No matches found for pattern 'def [a-z]+'");
}

TEST_F(CodeAnalysisToolTest, LeadingDashPatternIsNotAnOption) {
    if (!deploypilot::process::executable_on_path("grep")) {
        GTEST_SKIP() << "grep not available";
    }
    write_file(checkout_ / "cli.py", "parser.add_argument('--verbose')\n");

    const std::string long_flag = call(json{{"action", "find_patterns"}, {"pattern", "--verbose"}});
    EXPECT_EQ(long_flag.rfind("Matches for pattern '--verbose':\n\n", 0), 0u) << long_flag;
    EXPECT_NE(long_flag.find("cli.py:1:"), std::string::npos);

    const std::string short_flag = call(json{{"action", "find_patterns"}, {"pattern", "-v"}});
    EXPECT_NE(short_flag.find("cli.py:1:"), std::string::npos) << short_flag;
}

TEST_F(CodeAnalysisToolTest, TruncatesLongMatchLists) {
    if (!deploypilot::process::executable_on_path("grep")) {
        GTEST_SKIP() << "grep not available";
    }
    std::string content;
    for (int i = 0; i < 105; ++i) {
        content += "needle " + std::to_string(i) + "\n";
    }
    write_file(checkout_ / "hay.txt", content);

    const std::string text = call(json{{"action", "find_patterns"}, {"pattern", "needle"}});
    EXPECT_NE(text.find("hay.txt:100:needle 99\n"), std::string::npos);
    EXPECT_EQ(text.find("needle 100"), std::string::npos);
    EXPECT_NE(text.find("... (5 more lines truncated)\n"), std::string::npos);
}

TEST_F(CodeAnalysisToolTest, ReportsInvalidPattern) {
    if (!deploypilot::process::executable_on_path("grep")) {
        GTEST_SKIP() << "grep not available";
    }
    write_file(checkout_ / "app.py", kPythonSource);
    EXPECT_EQ(call(json{{"action", "find_patterns"}, {"pattern", "("}}).rfind(
                  "Error searching for pattern: ", 0),
              0u);
    EXPECT_EQ(call(json{{"action", "find_patterns"}}), "Error: Pattern not provided");
}

TEST_F(CodeAnalysisToolTest, ListsDependencies) {
    write_file(checkout_ / "package.json",
               R"({"dependencies":{"express":"^4.18.0"},"devDependencies":{"jest":"^29.0.0"}})");
    write_file(checkout_ / "requirements.txt", "flask==2.0\n# pinned\n-r extra.txt\nrequests\n");

    const std::string text = call(json{{"action", "dependency_analysis"}});
    EXPECT_NE(text.find("Node.js dependencies (package.json):\n"
                        "  dependencies (1):\n    express: ^4.18.0\n"
                        "  devDependencies (1):\n    jest: ^29.0.0\n"),
              std::string::npos);
    EXPECT_NE(text.find("Python dependencies (requirements.txt, 2):\n  flask==2.0\n  requests\n"),
              std::string::npos);
}

TEST_F(CodeAnalysisToolTest, ReportsMissingManifests) {
    EXPECT_EQ(call(json{{"action", "dependency_analysis"}}),
              "No dependency manifests found (package.json, requirements.txt)");
}

TEST(CodeAnalysisToolStandaloneTest, RequiresRepository) {
    RepositoryContext context;
    CodeAnalysisTool tool(context);
    EXPECT_EQ(tool.execute(json{{"action", "summarize_repo"}}).content,
              "Error: No repository is currently cloned");
    EXPECT_EQ(tool.execute(json{{"action", "lint"}}).content,
              "Error: Unknown action 'lint'. Available actions: summarize_repo, analyze_code, "
              "find_patterns, dependency_analysis");
}

}  // namespace
