#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>
#include "core/errors/pilot_errors.hpp"
#include "process/child_process.hpp"

namespace deploypilot::client {

enum class ReadStatus {
    Line,
    Timeout,
    Closed
};

// Pipes to a spawned tool server: requests go to its stdin, responses come
// back one per line on its stdout. Its stderr is inherited.
class ServerChannel {
public:
    // Error code: spawn_failed (category Connection).
    static core::errors::Result<std::unique_ptr<ServerChannel>> spawn(const std::vector<std::string>& argv);

    ~ServerChannel();

    ServerChannel(const ServerChannel&) = delete;
    ServerChannel& operator=(const ServerChannel&) = delete;

    // Error code: channel_closed.
    core::errors::Result<bool> send_line(const std::string& line);

    // Waits at most `timeout` for a complete line (without the '\n').
    ReadStatus read_line(std::string& line, std::chrono::milliseconds timeout);

    // Closes stdin and waits for the server to exit; escalates to SIGTERM and
    // then SIGKILL. Idempotent.
    process::StopOutcome close(std::chrono::milliseconds grace);

    pid_t pid() const { return pid_; }
    bool is_running();
    std::optional<int> exit_code() const { return exit_code_; }

private:
    ServerChannel(pid_t pid, int stdin_fd, int stdout_fd);
    bool reap(bool block);
    bool wait_for_exit(std::chrono::milliseconds timeout);
    void close_stdin();

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    std::string buffer_;
    bool eof_ = false;
    bool closed_ = false;
    std::optional<int> exit_code_;
};

}  // namespace deploypilot::client
