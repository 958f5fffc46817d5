#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "protocol/tool_contract.hpp"
#include "tools/repository_context.hpp"

namespace deploypilot::tools {

enum class AnalysisAction {
    SummarizeRepo,
    AnalyzeCode,
    FindPatterns,
    DependencyAnalysis
};

struct SourceMetrics {
    std::string language;
    std::size_t total_lines = 0;
    std::size_t blank_lines = 0;
    std::size_t comment_lines = 0;
    std::size_t function_count = 0;
    std::size_t class_count = 0;
    std::vector<std::string> imports;
};

// Read-only inspection of the active checkout.
class CodeAnalysisTool : public protocol::ToolHandler {
public:
    static constexpr std::size_t kMaxAnalyzedFiles = 50;
    static constexpr std::size_t kMaxPatternLines = 100;

    explicit CodeAnalysisTool(const RepositoryContext& context);

    protocol::ToolCallResult execute(const nlohmann::json& arguments) override;
    static nlohmann::json input_schema();

    // Empty language when the extension is not a known source type.
    static std::string language_for(const std::filesystem::path& file);
    static SourceMetrics measure(const std::string& language, const std::string& content);

private:
    protocol::ToolCallResult summarize_repo(const RepositorySnapshot& snapshot);
    protocol::ToolCallResult analyze_code(const RepositorySnapshot& snapshot,
                                          const nlohmann::json& arguments);
    protocol::ToolCallResult find_patterns(const RepositorySnapshot& snapshot,
                                           const nlohmann::json& arguments);
    protocol::ToolCallResult dependency_analysis(const RepositorySnapshot& snapshot);

    const RepositoryContext& context_;
};

}  // namespace deploypilot::tools
