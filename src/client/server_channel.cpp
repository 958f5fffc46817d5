#include "client/server_channel.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <initializer_list>
#include <mutex>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>
#include "core/logging/logger.hpp"

namespace deploypilot::client {

using core::errors::ErrorCategory;
using core::errors::PilotError;

namespace {

constexpr std::chrono::milliseconds kPollInterval{25};
constexpr std::chrono::milliseconds kDestructorGrace{5000};
constexpr std::size_t kReadChunk = 4096;

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(::close(fd));
        fd = -1;
    }
}

// A dead server must surface as EPIPE on write, not kill the client.
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { static_cast<void>(std::signal(SIGPIPE, SIG_IGN)); });
}

}  // namespace

ServerChannel::ServerChannel(const pid_t pid, const int stdin_fd, const int stdout_fd)
    : pid_(pid), stdin_fd_(stdin_fd), stdout_fd_(stdout_fd) {}

ServerChannel::~ServerChannel() {
    if (!closed_) {
        static_cast<void>(close(kDestructorGrace));
    }
}

core::errors::Result<std::unique_ptr<ServerChannel>> ServerChannel::spawn(
    const std::vector<std::string>& argv) {
    if (argv.empty() || argv.front().empty()) {
        return PilotError{ErrorCategory::Connection, "Server command cannot be empty.", "spawn_failed"};
    }
    ignore_sigpipe();

    int to_child[2] = {-1, -1};
    int from_child[2] = {-1, -1};
    int exec_status[2] = {-1, -1};
    if (pipe2(to_child, O_CLOEXEC) != 0 || pipe2(from_child, O_CLOEXEC) != 0 ||
        pipe2(exec_status, O_CLOEXEC) != 0) {
        const std::string reason = std::strerror(errno);
        for (int* pair : {to_child, from_child, exec_status}) {
            close_fd(pair[0]);
            close_fd(pair[1]);
        }
        return PilotError{ErrorCategory::Connection, "Failed to create server pipes: " + reason,
                          "spawn_failed"};
    }

    const pid_t pid = fork();
    if (pid < 0) {
        for (int* pair : {to_child, from_child, exec_status}) {
            close_fd(pair[0]);
            close_fd(pair[1]);
        }
        return PilotError{ErrorCategory::Connection, "Failed to fork server process.", "spawn_failed"};
    }

    if (pid == 0) {
        static_cast<void>(prctl(PR_SET_PDEATHSIG, SIGTERM));
        static_cast<void>(dup2(to_child[0], STDIN_FILENO));
        static_cast<void>(dup2(from_child[1], STDOUT_FILENO));

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& arg : argv) {
            args.push_back(const_cast<char*>(arg.c_str()));
        }
        args.push_back(nullptr);
        execvp(args[0], args.data());

        const int error = errno;
        static_cast<void>(write(exec_status[1], &error, sizeof(error)));
        _exit(127);
    }

    close_fd(to_child[0]);
    close_fd(from_child[1]);
    close_fd(exec_status[1]);

    // exec_status is close-on-exec: EOF means exec succeeded.
    int exec_error = 0;
    ssize_t got = 0;
    do {
        got = read(exec_status[0], &exec_error, sizeof(exec_error));
    } while (got < 0 && errno == EINTR);
    close_fd(exec_status[0]);

    if (got == static_cast<ssize_t>(sizeof(exec_error))) {
        int status = 0;
        static_cast<void>(waitpid(pid, &status, 0));
        close_fd(to_child[1]);
        close_fd(from_child[0]);
        return PilotError{ErrorCategory::Connection,
                          "Failed to start server '" + argv.front() + "': " + std::strerror(exec_error),
                          "spawn_failed"};
    }

    LOG_DEBUG("ServerChannel: spawned server pid " + std::to_string(pid) + " (" + argv.front() + ")");
    return std::unique_ptr<ServerChannel>(new ServerChannel(pid, to_child[1], from_child[0]));
}

core::errors::Result<bool> ServerChannel::send_line(const std::string& line) {
    if (stdin_fd_ < 0) {
        return PilotError{ErrorCategory::Connection, "Server channel is closed.", "channel_closed"};
    }
    std::string data = line;
    if (data.empty() || data.back() != '\n') {
        data.push_back('\n');
    }

    std::size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = write(stdin_fd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const std::string reason = std::strerror(errno);
            close_stdin();
            return PilotError{ErrorCategory::Connection, "Failed to write to server: " + reason,
                              "channel_closed"};
        }
        written += static_cast<std::size_t>(n);
    }
    return true;
}

ReadStatus ServerChannel::read_line(std::string& line, const std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        const auto newline = buffer_.find('\n');
        if (newline != std::string::npos) {
            line = buffer_.substr(0, newline);
            buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return ReadStatus::Line;
        }
        if (eof_ || stdout_fd_ < 0) {
            return ReadStatus::Closed;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return ReadStatus::Timeout;
        }

        pollfd pfd{stdout_fd_, POLLIN, 0};
        const int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            eof_ = true;
            continue;
        }
        if (ready == 0) {
            return ReadStatus::Timeout;
        }

        char chunk[kReadChunk];
        const ssize_t n = read(stdout_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            eof_ = true;
        } else if (n == 0) {
            eof_ = true;
        } else {
            buffer_.append(chunk, static_cast<std::size_t>(n));
        }
    }
}

process::StopOutcome ServerChannel::close(const std::chrono::milliseconds grace) {
    if (closed_) {
        return process::StopOutcome::AlreadyExited;
    }
    closed_ = true;

    close_stdin();
    process::StopOutcome outcome = process::StopOutcome::AlreadyExited;
    if (!wait_for_exit(grace)) {
        LOG_WARN("ServerChannel: server pid " + std::to_string(pid_) + " ignored end of input, sending SIGTERM");
        static_cast<void>(kill(pid_, SIGTERM));
        outcome = process::StopOutcome::Terminated;
        if (!wait_for_exit(grace)) {
            LOG_WARN("ServerChannel: server pid " + std::to_string(pid_) + " ignored SIGTERM, sending SIGKILL");
            static_cast<void>(kill(pid_, SIGKILL));
            static_cast<void>(reap(true));
            outcome = process::StopOutcome::Killed;
        }
    }
    close_fd(stdout_fd_);
    LOG_DEBUG("ServerChannel: server closed (" + process::to_string(outcome) + ")");
    return outcome;
}

bool ServerChannel::is_running() {
    return !reap(false);
}

bool ServerChannel::reap(const bool block) {
    if (exit_code_.has_value()) {
        return true;
    }
    int status = 0;
    pid_t waited = 0;
    do {
        waited = waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (waited < 0 && errno == EINTR);

    if (waited == pid_) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = 128 + WTERMSIG(status);
        } else {
            exit_code_ = -1;
        }
        return true;
    }
    if (waited < 0 && errno == ECHILD) {
        exit_code_ = -1;
        return true;
    }
    return false;
}

bool ServerChannel::wait_for_exit(const std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (reap(false)) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

void ServerChannel::close_stdin() {
    close_fd(stdin_fd_);
}

}  // namespace deploypilot::client
