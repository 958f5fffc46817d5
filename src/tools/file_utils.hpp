#pragma once

#include <cstdint>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace deploypilot::tools {

struct RepositoryEntry {
    std::filesystem::path relative_path;
    bool is_directory = false;
    std::uintmax_t size = 0;
};

bool is_probably_binary(const std::filesystem::path& path);

// nullopt when the file cannot be opened.
std::optional<std::string> read_text_file(const std::filesystem::path& path,
                                          std::size_t max_bytes = 1024 * 1024);

// Recursive listing of `start` (inside `root`), paths relative to `root`,
// sorted. Directories named in `skip_dirs` are neither listed nor entered.
std::vector<RepositoryEntry> walk_repository(const std::filesystem::path& root,
                                             const std::filesystem::path& start,
                                             const std::vector<std::string>& skip_dirs);

const std::vector<std::string>& default_skip_dirs();

// "1.23 MB (1259.52 KB)"
std::string format_size(std::uintmax_t bytes);

std::string trim_line(const std::string& line, std::size_t max_length = 240);

std::string to_lower(std::string value);

bool write_text_file(const std::filesystem::path& path, const std::string& content);

}  // namespace deploypilot::tools
