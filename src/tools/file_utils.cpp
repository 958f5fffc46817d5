#include "tools/file_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <system_error>

namespace deploypilot::tools {

bool is_probably_binary(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }

    constexpr std::size_t kProbeSize = 1024;
    char buffer[kProbeSize];
    in.read(buffer, static_cast<std::streamsize>(kProbeSize));
    const std::streamsize read_bytes = in.gcount();
    for (std::streamsize i = 0; i < read_bytes; ++i) {
        if (buffer[i] == '\0') {
            return true;
        }
    }
    return false;
}

std::optional<std::string> read_text_file(const std::filesystem::path& path,
                                          const std::size_t max_bytes) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::string content(max_bytes, '\0');
    in.read(content.data(), static_cast<std::streamsize>(max_bytes));
    content.resize(static_cast<std::size_t>(in.gcount()));
    return content;
}

const std::vector<std::string>& default_skip_dirs() {
    static const std::vector<std::string> dirs = {".git", "node_modules", "venv", ".venv",
                                                  "__pycache__", "dist", "build"};
    return dirs;
}

std::vector<RepositoryEntry> walk_repository(const std::filesystem::path& root,
                                             const std::filesystem::path& start,
                                             const std::vector<std::string>& skip_dirs) {
    std::vector<RepositoryEntry> entries;
    std::error_code ec;
    const auto options = std::filesystem::directory_options::skip_permission_denied;
    std::filesystem::recursive_directory_iterator it(start, options, ec);
    if (ec) {
        return entries;
    }

    for (const std::filesystem::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        const auto& entry = *it;
        const bool is_dir = entry.is_directory(ec) && !entry.is_symlink(ec);
        const std::string leaf = entry.path().filename().string();
        if (is_dir &&
            std::find(skip_dirs.begin(), skip_dirs.end(), leaf) != skip_dirs.end()) {
            it.disable_recursion_pending();
            continue;
        }

        RepositoryEntry record;
        record.relative_path = entry.path().lexically_relative(root);
        record.is_directory = is_dir;
        if (!is_dir && entry.is_regular_file(ec)) {
            record.size = entry.file_size(ec);
            if (ec) {
                record.size = 0;
                ec.clear();
            }
        }
        entries.push_back(std::move(record));
    }

    std::sort(entries.begin(), entries.end(),
              [](const RepositoryEntry& a, const RepositoryEntry& b) {
                  return a.relative_path.generic_string() < b.relative_path.generic_string();
              });
    return entries;
}

std::string format_size(const std::uintmax_t bytes) {
    const double kb = static_cast<double>(bytes) / 1024.0;
    const double mb = kb / 1024.0;
    char buffer[96];
    std::snprintf(buffer, sizeof(buffer), "%.2f MB (%.2f KB)", mb, kb);
    return buffer;
}

std::string trim_line(const std::string& line, const std::size_t max_length) {
    if (line.size() <= max_length) {
        return line;
    }
    return line.substr(0, max_length) + "...";
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool write_text_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return false;
    }
    out << content;
    return out.good();
}

}  // namespace deploypilot::tools
