#include "process/child_process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include "core/logging/logger.hpp"

namespace deploypilot::process {

using core::errors::ErrorCategory;
using core::errors::PilotError;

namespace {

constexpr std::chrono::milliseconds kDestructorGrace{2000};
constexpr std::chrono::milliseconds kPollInterval{50};

}  // namespace

std::string to_string(const StopOutcome outcome) {
    switch (outcome) {
        case StopOutcome::AlreadyExited:
            return "already exited";
        case StopOutcome::Terminated:
            return "terminated";
        case StopOutcome::Killed:
            return "killed";
        default:
            return "unknown";
    }
}

ChildProcess::ChildProcess(const pid_t pid, std::filesystem::path log_file)
    : pid_(pid), log_file_(std::move(log_file)) {}

ChildProcess::~ChildProcess() {
    if (pid_ > 0 && is_running()) {
        LOG_WARN("ChildProcess: terminating pid " + std::to_string(pid_) + " on release");
        static_cast<void>(terminate(kDestructorGrace));
    }
}

core::errors::Result<std::unique_ptr<ChildProcess>> ChildProcess::spawn(const LaunchSpec& spec) {
    if (spec.argv.empty() || spec.argv.front().empty()) {
        return PilotError{ErrorCategory::Input, "Launch command cannot be empty.",
                          "empty_command"};
    }
    if (spec.log_file.empty()) {
        return PilotError{ErrorCategory::Internal, "Launch spec is missing a log file.",
                          "missing_log_file"};
    }

    const int log_fd =
        open(spec.log_file.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (log_fd < 0) {
        return PilotError{ErrorCategory::Internal,
                          "Unable to open process log " + spec.log_file.string() + ": " +
                              std::strerror(errno),
                          "log_open_failed"};
    }

    const pid_t pid = fork();
    if (pid < 0) {
        static_cast<void>(close(log_fd));
        return PilotError{ErrorCategory::Internal, "Failed to fork process.", "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        static_cast<void>(prctl(PR_SET_PDEATHSIG, SIGTERM));

        const int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            static_cast<void>(dup2(null_fd, STDIN_FILENO));
            static_cast<void>(close(null_fd));
        }
        static_cast<void>(dup2(log_fd, STDOUT_FILENO));
        static_cast<void>(dup2(log_fd, STDERR_FILENO));

        if (chdir(spec.working_directory.c_str()) != 0) {
            const std::string msg = "chdir failed: " + spec.working_directory.string() + "\n";
            static_cast<void>(write(STDERR_FILENO, msg.data(), msg.size()));
            _exit(126);
        }
        for (const auto& [key, value] : spec.environment) {
            static_cast<void>(setenv(key.c_str(), value.c_str(), 1));
        }

        std::vector<char*> argv;
        argv.reserve(spec.argv.size() + 1);
        for (const auto& arg : spec.argv) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);
        execvp(argv[0], argv.data());

        const std::string msg =
            "exec failed: " + spec.argv[0] + ": " + std::strerror(errno) + "\n";
        static_cast<void>(write(STDERR_FILENO, msg.data(), msg.size()));
        _exit(127);
    }

    static_cast<void>(setpgid(pid, pid));
    static_cast<void>(close(log_fd));
    LOG_DEBUG("ChildProcess: spawned pid " + std::to_string(pid) + " (" + spec.argv[0] + ")");
    return std::unique_ptr<ChildProcess>(new ChildProcess(pid, spec.log_file));
}

bool ChildProcess::reap(const bool block) {
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
        // Reaped elsewhere; nothing left to wait for.
        exit_code_ = -1;
        return true;
    }
    return false;
}

bool ChildProcess::is_running() {
    return !reap(false);
}

StopOutcome ChildProcess::terminate(const std::chrono::milliseconds grace) {
    if (!is_running()) {
        // The leader is gone but helpers it started may still hold the group.
        static_cast<void>(kill(-pid_, SIGKILL));
        return StopOutcome::AlreadyExited;
    }

    static_cast<void>(kill(-pid_, SIGTERM));
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!is_running()) {
            static_cast<void>(kill(-pid_, SIGKILL));
            return StopOutcome::Terminated;
        }
        std::this_thread::sleep_for(kPollInterval);
    }

    static_cast<void>(kill(-pid_, SIGKILL));
    static_cast<void>(kill(pid_, SIGKILL));
    static_cast<void>(reap(true));
    return StopOutcome::Killed;
}

std::string ChildProcess::read_output(const std::size_t max_bytes) const {
    std::ifstream in(log_file_, std::ios::binary);
    if (!in.is_open()) {
        return "";
    }
    in.seekg(0, std::ios::end);
    const std::streamoff size = in.tellg();
    const std::streamoff start =
        size > static_cast<std::streamoff>(max_bytes) ? size - static_cast<std::streamoff>(max_bytes) : 0;
    in.seekg(start, std::ios::beg);
    std::string out(static_cast<std::size_t>(size - start), '\0');
    in.read(out.data(), static_cast<std::streamsize>(out.size()));
    out.resize(static_cast<std::size_t>(in.gcount()));
    return out;
}

}  // namespace deploypilot::process
