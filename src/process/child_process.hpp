#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>
#include "core/errors/pilot_errors.hpp"

namespace deploypilot::process {

struct LaunchSpec {
    std::vector<std::string> argv;
    std::filesystem::path working_directory = ".";
    std::vector<std::pair<std::string, std::string>> environment;
    // stdout and stderr of the child are appended here.
    std::filesystem::path log_file;
};

enum class StopOutcome {
    AlreadyExited,
    Terminated,   // exited after SIGTERM within the grace period
    Killed        // needed SIGKILL
};

std::string to_string(StopOutcome outcome);

// A long-running child that leads its own process group. Destroying a
// still-running ChildProcess terminates the whole group.
class ChildProcess {
public:
    static core::errors::Result<std::unique_ptr<ChildProcess>> spawn(const LaunchSpec& spec);

    ~ChildProcess();
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }
    const std::filesystem::path& log_file() const { return log_file_; }

    bool is_running();
    std::optional<int> exit_code() const { return exit_code_; }

    // SIGTERM to the group, wait up to `grace`, then SIGKILL and reap.
    StopOutcome terminate(std::chrono::milliseconds grace);

    // Last `max_bytes` of the log file.
    std::string read_output(std::size_t max_bytes = 16 * 1024) const;

private:
    ChildProcess(pid_t pid, std::filesystem::path log_file);
    bool reap(bool block);

    pid_t pid_ = -1;
    std::filesystem::path log_file_;
    std::optional<int> exit_code_;
};

}  // namespace deploypilot::process
