#include "tools/code_analysis_tool.hpp"

#include <algorithm>
#include <initializer_list>
#include <iterator>
#include <map>
#include <sstream>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"
#include "policy/policy_guard.hpp"
#include "process/command_runner.hpp"
#include "tools/file_utils.hpp"
#include "tools/tool_args.hpp"

namespace deploypilot::tools {

using nlohmann::json;
using protocol::ToolCallResult;

namespace {

constexpr ActionTable<AnalysisAction, 4> kActions = {{
    {"summarize_repo", AnalysisAction::SummarizeRepo},
    {"analyze_code", AnalysisAction::AnalyzeCode},
    {"find_patterns", AnalysisAction::FindPatterns},
    {"dependency_analysis", AnalysisAction::DependencyAnalysis},
}};

constexpr std::size_t kLargestFiles = 5;
constexpr std::size_t kListedImports = 10;
constexpr std::uint32_t kGrepTimeoutMs = 60000;

const std::string kNoRepository = "Error: No repository is currently cloned";

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.rfind(prefix, 0) == 0;
}

bool starts_with_any(const std::string& text, std::initializer_list<const char*> prefixes) {
    for (const char* prefix : prefixes) {
        if (starts_with(text, prefix)) {
            return true;
        }
    }
    return false;
}

bool hash_comments(const std::string& language) {
    return language == "python" || language == "ruby" || language == "shell";
}

bool is_import(const std::string& language, const std::string& t) {
    if (language == "python") {
        return starts_with(t, "import ") || (starts_with(t, "from ") && t.find(" import ") != std::string::npos);
    }
    if (language == "javascript" || language == "typescript") {
        return starts_with(t, "import ") || t.find("require(") != std::string::npos;
    }
    if (language == "java" || language == "go") {
        return starts_with(t, "import ");
    }
    if (language == "c" || language == "cpp") {
        return starts_with(t, "#include");
    }
    if (language == "rust") {
        return starts_with_any(t, {"use ", "pub use ", "extern crate "});
    }
    if (language == "ruby") {
        return starts_with_any(t, {"require ", "require_relative "});
    }
    if (language == "php") {
        return starts_with_any(t, {"use ", "require", "include"});
    }
    if (language == "shell") {
        return starts_with_any(t, {"source ", ". "});
    }
    return false;
}

// `name(...) {` style definitions, excluding control statements.
bool looks_like_c_function(const std::string& t) {
    if (starts_with_any(t, {"if", "for", "while", "switch", "catch", "else", "return", "do ", "}"})) {
        return false;
    }
    const auto paren = t.find('(');
    if (paren == std::string::npos || paren == 0) {
        return false;
    }
    if (t.find(';') != std::string::npos) {
        return false;
    }
    const auto assign = t.find('=');
    if (assign != std::string::npos && assign < paren) {
        return false;
    }
    return t.back() == '{' || t.back() == ')';
}

bool is_function(const std::string& language, const std::string& t) {
    if (language == "python") {
        return starts_with_any(t, {"def ", "async def "});
    }
    if (language == "javascript" || language == "typescript") {
        if (t.find("function ") != std::string::npos || t.find("function(") != std::string::npos) {
            return true;
        }
        return t.find("=>") != std::string::npos &&
               starts_with_any(t, {"const ", "let ", "export const ", "export default "});
    }
    if (language == "go") {
        return starts_with(t, "func ");
    }
    if (language == "rust") {
        return starts_with_any(t, {"fn ", "pub fn ", "async fn ", "pub async fn ", "pub(crate) fn "});
    }
    if (language == "ruby") {
        return starts_with(t, "def ");
    }
    if (language == "shell") {
        return t.find("()") != std::string::npos && t.find('{') != std::string::npos;
    }
    if (language == "php") {
        return t.find("function ") != std::string::npos;
    }
    if (language == "java" || language == "c" || language == "cpp") {
        return looks_like_c_function(t);
    }
    return false;
}

bool is_class(const std::string& language, const std::string& t) {
    if (language == "go") {
        return starts_with(t, "type ") && t.find(" struct") != std::string::npos;
    }
    if (language == "rust") {
        return starts_with_any(t, {"struct ", "pub struct ", "enum ", "pub enum ", "trait ", "pub trait "});
    }
    if (language == "c") {
        return starts_with_any(t, {"struct ", "typedef struct"}) && t.find(';') == std::string::npos;
    }
    if (language == "cpp") {
        return starts_with_any(t, {"class ", "struct "}) && t.find(';') == std::string::npos;
    }
    if (language == "java" || language == "php") {
        return t.find("class ") != std::string::npos || t.find("interface ") != std::string::npos;
    }
    return starts_with_any(t, {"class ", "export class ", "export default class "});
}

std::string render_metrics(const std::string& label, const SourceMetrics& metrics) {
    std::ostringstream out;
    out << "File: " << label << "\n"
        << "  language: " << metrics.language << "\n"
        << "  total_lines: " << metrics.total_lines << "\n"
        << "  blank_lines: " << metrics.blank_lines << "\n"
        << "  comment_lines: " << metrics.comment_lines << "\n"
        << "  functions: " << metrics.function_count << "\n"
        << "  classes: " << metrics.class_count << "\n"
        << "  imports (" << metrics.imports.size() << ")";
    const std::size_t shown = std::min(metrics.imports.size(), kListedImports);
    if (shown > 0) {
        out << ":";
    }
    out << "\n";
    for (std::size_t i = 0; i < shown; ++i) {
        out << "    " << trim_line(metrics.imports[i], 120) << "\n";
    }
    if (metrics.imports.size() > shown) {
        out << "    ... " << (metrics.imports.size() - shown) << " more\n";
    }
    return out.str();
}

std::size_t count_lines(const std::string& content) {
    if (content.empty()) {
        return 0;
    }
    const auto newlines = static_cast<std::size_t>(std::count(content.begin(), content.end(), '\n'));
    return content.back() == '\n' ? newlines : newlines + 1;
}

std::string extension_of(const std::filesystem::path& file) {
    const std::string ext = to_lower(file.extension().string());
    return ext.empty() ? "(no extension)" : ext;
}

}  // namespace

CodeAnalysisTool::CodeAnalysisTool(const RepositoryContext& context) : context_(context) {}

ToolCallResult CodeAnalysisTool::execute(const json& arguments) {
    const std::string action_text = string_arg(arguments, "action").value_or("");
    const auto action = parse_action(action_text, kActions);
    if (!action) {
        return {unknown_action_message(action_text, kActions)};
    }

    const auto snapshot = context_.current();
    if (!snapshot) {
        return {kNoRepository};
    }

    switch (*action) {
        case AnalysisAction::SummarizeRepo:
            return summarize_repo(*snapshot);
        case AnalysisAction::AnalyzeCode:
            return analyze_code(*snapshot, arguments);
        case AnalysisAction::FindPatterns:
            return find_patterns(*snapshot, arguments);
        case AnalysisAction::DependencyAnalysis:
            return dependency_analysis(*snapshot);
    }
    return {unknown_action_message(action_text, kActions)};
}

std::string CodeAnalysisTool::language_for(const std::filesystem::path& file) {
    static const std::map<std::string, std::string> kLanguages = {
        {".py", "python"},     {".js", "javascript"}, {".jsx", "javascript"}, {".mjs", "javascript"},
        {".cjs", "javascript"}, {".ts", "typescript"}, {".tsx", "typescript"}, {".java", "java"},
        {".go", "go"},         {".c", "c"},           {".h", "c"},            {".cpp", "cpp"},
        {".cc", "cpp"},        {".cxx", "cpp"},       {".hpp", "cpp"},        {".hh", "cpp"},
        {".rs", "rust"},       {".rb", "ruby"},       {".php", "php"},        {".sh", "shell"},
    };
    const auto it = kLanguages.find(to_lower(file.extension().string()));
    return it == kLanguages.end() ? "" : it->second;
}

SourceMetrics CodeAnalysisTool::measure(const std::string& language, const std::string& content) {
    SourceMetrics metrics;
    metrics.language = language.empty() ? "text" : language;

    std::istringstream in(content);
    std::string line;
    bool in_block_comment = false;
    while (std::getline(in, line)) {
        ++metrics.total_lines;
        const std::string t = trim(line);
        if (t.empty()) {
            ++metrics.blank_lines;
            continue;
        }
        if (language.empty()) {
            continue;
        }

        if (hash_comments(language)) {
            if (t[0] == '#' && !starts_with(t, "#!")) {
                ++metrics.comment_lines;
                continue;
            }
        } else {
            if (in_block_comment) {
                ++metrics.comment_lines;
                in_block_comment = t.find("*/") == std::string::npos;
                continue;
            }
            if (starts_with(t, "/*")) {
                ++metrics.comment_lines;
                in_block_comment = t.find("*/", 2) == std::string::npos;
                continue;
            }
            if (starts_with(t, "//") || starts_with(t, "* ") || t == "*") {
                ++metrics.comment_lines;
                continue;
            }
        }

        if (is_import(language, t)) {
            metrics.imports.push_back(t);
        } else if (is_class(language, t)) {
            ++metrics.class_count;
        } else if (is_function(language, t)) {
            ++metrics.function_count;
        }
    }
    return metrics;
}

ToolCallResult CodeAnalysisTool::summarize_repo(const RepositorySnapshot& snapshot) {
    const auto entries = walk_repository(snapshot.path, snapshot.path, default_skip_dirs());

    std::map<std::string, std::size_t> histogram;
    std::vector<const RepositoryEntry*> files;
    std::vector<const RepositoryEntry*> top_level;
    std::size_t total_lines = 0;
    for (const auto& entry : entries) {
        if (std::distance(entry.relative_path.begin(), entry.relative_path.end()) == 1) {
            top_level.push_back(&entry);
        }
        if (entry.is_directory) {
            continue;
        }
        files.push_back(&entry);
        ++histogram[extension_of(entry.relative_path)];
        const auto full_path = snapshot.path / entry.relative_path;
        if (!is_probably_binary(full_path)) {
            if (const auto content = read_text_file(full_path)) {
                total_lines += count_lines(*content);
            }
        }
    }

    std::vector<std::pair<std::string, std::size_t>> by_count(histogram.begin(), histogram.end());
    std::stable_sort(by_count.begin(), by_count.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    std::vector<const RepositoryEntry*> largest = files;
    std::stable_sort(largest.begin(), largest.end(),
                     [](const RepositoryEntry* a, const RepositoryEntry* b) { return a->size > b->size; });
    if (largest.size() > kLargestFiles) {
        largest.resize(kLargestFiles);
    }

    std::ostringstream out;
    out << "Repository summary for " << snapshot.name << ":\n\n"
        << "file_count: " << files.size() << "\n"
        << "total_lines: " << total_lines << "\n\n"
        << "File types:\n";
    for (const auto& [extension, count] : by_count) {
        out << "  " << extension << ": " << count << "\n";
    }
    out << "\nLargest files:\n";
    for (const auto* entry : largest) {
        out << "  " << entry->relative_path.generic_string() << " (" << entry->size << " bytes)\n";
    }
    out << "\nTop-level entries:\n";
    for (const auto* entry : top_level) {
        out << (entry->is_directory ? "  [DIR]  " : "  [FILE] ") << entry->relative_path.generic_string()
            << "\n";
    }
    return {out.str()};
}

ToolCallResult CodeAnalysisTool::analyze_code(const RepositorySnapshot& snapshot, const json& arguments) {
    if (const auto file_path = string_arg(arguments, "file_path")) {
        const std::string not_found = "Error: File " + *file_path + " does not exist in the repository";
        const policy::PolicyGuard guard;
        auto resolved = guard.validate_path_in_root(snapshot.path, *file_path);
        if (core::errors::is_error(resolved)) {
            return {not_found};
        }
        const auto full_path = core::errors::get_value(resolved);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(full_path, ec) || ec) {
            return {not_found};
        }
        if (is_probably_binary(full_path)) {
            return {"Error: File " + *file_path + " is a binary file"};
        }
        const auto content = read_text_file(full_path);
        if (!content) {
            return {"Error reading file: unable to open " + *file_path};
        }
        const auto metrics = measure(language_for(full_path), *content);
        return {"Code analysis for " + *file_path + ":\n\n" + render_metrics(*file_path, metrics)};
    }

    std::vector<std::filesystem::path> sources;
    std::size_t available = 0;
    for (const auto& entry : walk_repository(snapshot.path, snapshot.path, default_skip_dirs())) {
        if (entry.is_directory || language_for(entry.relative_path).empty()) {
            continue;
        }
        ++available;
        if (sources.size() < kMaxAnalyzedFiles) {
            sources.push_back(entry.relative_path);
        }
    }
    if (sources.empty()) {
        return {"No source files found in repository " + snapshot.name};
    }

    SourceMetrics totals;
    std::ostringstream body;
    for (const auto& relative : sources) {
        const auto content = read_text_file(snapshot.path / relative);
        if (!content) {
            LOG_WARN("CodeAnalysisTool: unable to read " + relative.generic_string());
            continue;
        }
        const auto metrics = measure(language_for(relative), *content);
        totals.total_lines += metrics.total_lines;
        totals.blank_lines += metrics.blank_lines;
        totals.comment_lines += metrics.comment_lines;
        totals.function_count += metrics.function_count;
        totals.class_count += metrics.class_count;
        body << render_metrics(relative.generic_string(), metrics) << "\n";
    }

    std::ostringstream out;
    out << "Code analysis for repository " << snapshot.name << " (" << sources.size() << " files analyzed";
    if (available > sources.size()) {
        out << ", limited to " << kMaxAnalyzedFiles << " of " << available;
    }
    out << "):\n\n"
        << body.str()
        << "Totals:\n"
        << "  total_lines: " << totals.total_lines << "\n"
        << "  blank_lines: " << totals.blank_lines << "\n"
        << "  comment_lines: " << totals.comment_lines << "\n"
        << "  functions: " << totals.function_count << "\n"
        << "  classes: " << totals.class_count;
    return {out.str()};
}

ToolCallResult CodeAnalysisTool::find_patterns(const RepositorySnapshot& snapshot, const json& arguments) {
    const auto pattern = string_arg(arguments, "pattern");
    if (!pattern) {
        return {"Error: Pattern not provided"};
    }

    process::CommandSpec spec;
    spec.argv = {"grep", "-rnIE", "--exclude-dir=.git", "-e", *pattern};
    if (const auto file_pattern = string_arg(arguments, "file_pattern")) {
        spec.argv.push_back("--include=" + *file_pattern);
    }
    spec.argv.push_back(".");
    spec.working_directory = snapshot.path;
    spec.timeout_ms = kGrepTimeoutMs;

    LOG_DEBUG("CodeAnalysisTool: grep for " + *pattern);
    auto capture_result = process::run_process(spec);
    if (core::errors::is_error(capture_result)) {
        return {"Error searching for pattern: " + core::errors::get_error(capture_result).message};
    }
    const auto& capture = core::errors::get_value(capture_result);
    if (capture.timed_out) {
        return {"Error searching for pattern: search timed out"};
    }
    // grep: 0 = matches, 1 = none, >= 2 = trouble.
    if (capture.exit_code == 1) {
        return {"No matches found for pattern '" + *pattern + "'"};
    }
    if (capture.exit_code != 0) {
        return {"Error searching for pattern: " + capture.combined_output()};
    }

    std::istringstream in(capture.stdout_text);
    std::string line;
    std::size_t total = 0;
    std::ostringstream matches;
    while (std::getline(in, line)) {
        ++total;
        if (total > kMaxPatternLines) {
            continue;
        }
        if (starts_with(line, "./")) {
            line.erase(0, 2);
        }
        matches << trim_line(line) << "\n";
    }

    std::ostringstream out;
    out << "Matches for pattern '" << *pattern << "':\n\n" << matches.str();
    if (total > kMaxPatternLines) {
        out << "... (" << (total - kMaxPatternLines) << " more lines truncated)\n";
    }
    return {out.str()};
}

ToolCallResult CodeAnalysisTool::dependency_analysis(const RepositorySnapshot& snapshot) {
    std::ostringstream out;
    bool found = false;

    const auto package_json = snapshot.path / "package.json";
    if (const auto content = read_text_file(package_json)) {
        found = true;
        const auto manifest = json::parse(*content, nullptr, false);
        out << "Node.js dependencies (package.json):\n";
        if (!manifest.is_object()) {
            out << "  (unable to parse package.json)\n";
        } else {
            for (const char* section : {"dependencies", "devDependencies"}) {
                const auto it = manifest.find(section);
                if (it == manifest.end() || !it->is_object()) {
                    continue;
                }
                out << "  " << section << " (" << it->size() << "):\n";
                for (const auto& [name, version] : it->items()) {
                    out << "    " << name << ": "
                        << (version.is_string() ? version.get<std::string>() : version.dump()) << "\n";
                }
            }
        }
        out << "\n";
    }

    const auto requirements = snapshot.path / "requirements.txt";
    if (const auto content = read_text_file(requirements)) {
        found = true;
        std::vector<std::string> packages;
        std::istringstream in(*content);
        std::string line;
        while (std::getline(in, line)) {
            const std::string t = trim(line);
            if (t.empty() || t[0] == '#' || t[0] == '-') {
                continue;
            }
            packages.push_back(t);
        }
        out << "Python dependencies (requirements.txt, " << packages.size() << "):\n";
        for (const auto& package : packages) {
            out << "  " << package << "\n";
        }
    }

    if (!found) {
        return {"No dependency manifests found (package.json, requirements.txt)"};
    }
    return {out.str()};
}

json CodeAnalysisTool::input_schema() {
    return json{
        {"type", "object"},
        {"properties",
         {{"action",
           {{"type", "string"},
            {"description",
             "The analysis to run (summarize_repo, analyze_code, find_patterns, dependency_analysis)"},
            {"enum", action_enum(kActions)}}},
          {"file_path",
           {{"type", "string"},
            {"description", "File to analyze (for 'analyze_code'; all source files when omitted)"}}},
          {"pattern",
           {{"type", "string"},
            {"description", "Extended regular expression to search for (for 'find_patterns')"}}},
          {"file_pattern",
           {{"type", "string"},
            {"description", "Glob restricting which files are searched, e.g. *.py (for 'find_patterns')"}}}}},
        {"required", json::array({"action"})}};
}

}  // namespace deploypilot::tools
