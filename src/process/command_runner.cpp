#include "process/command_runner.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace deploypilot::process {

using core::errors::ErrorCategory;
using core::errors::PilotError;

namespace {

// Output still arriving after the direct child exited comes from
// descendants that left the process group; stop waiting for it after this.
constexpr std::int64_t kPostExitDrainMs = 250;

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void drain_pipe(const int fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            is_open = false;
            static_cast<void>(close(fd));
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

void close_pipe(int fds[2]) {
    if (fds[0] >= 0) static_cast<void>(close(fds[0]));
    if (fds[1] >= 0) static_cast<void>(close(fds[1]));
}

[[noreturn]] void exec_child(const CommandSpec& spec, const int stdout_fd, const int stderr_fd) {
    static_cast<void>(setpgid(0, 0));
    static_cast<void>(prctl(PR_SET_PDEATHSIG, SIGKILL));

    const int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
        static_cast<void>(dup2(null_fd, STDIN_FILENO));
        static_cast<void>(close(null_fd));
    }
    static_cast<void>(dup2(stdout_fd, STDOUT_FILENO));
    static_cast<void>(dup2(stderr_fd, STDERR_FILENO));

    if (chdir(spec.working_directory.c_str()) != 0) {
        const std::string msg = "chdir failed: " + spec.working_directory.string() + ": " +
                                std::strerror(errno) + "\n";
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

    const std::string msg = "exec failed: " + spec.argv[0] + ": " + std::strerror(errno) + "\n";
    static_cast<void>(write(STDERR_FILENO, msg.data(), msg.size()));
    _exit(127);
}

}  // namespace

std::string ProcessCapture::combined_output() const {
    if (stderr_text.empty()) {
        return stdout_text;
    }
    if (stdout_text.empty()) {
        return stderr_text;
    }
    std::string out = stdout_text;
    if (out.back() != '\n') {
        out.push_back('\n');
    }
    return out + stderr_text;
}

std::vector<std::string> shell_argv(const std::string& command) {
    return {"/bin/sh", "-c", command};
}

bool executable_on_path(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0;
    }
    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return false;
    }
    std::stringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        const std::string candidate = dir + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

core::errors::Result<ProcessCapture> run_process(const CommandSpec& spec) {
    if (spec.argv.empty() || spec.argv.front().empty()) {
        return PilotError{ErrorCategory::Input, "Command cannot be empty.", "empty_command"};
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return PilotError{ErrorCategory::Internal, "Failed to create process pipes.",
                          "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return PilotError{ErrorCategory::Internal, "Failed to fork process.", "fork_failed"};
    }

    if (pid == 0) {
        exec_child(spec, stdout_pipe[1], stderr_pipe[1]);
    }

    // Set in both parent and child so the group exists before any kill(-pid).
    static_cast<void>(setpgid(pid, pid));

    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    int status = 0;
    std::chrono::steady_clock::time_point exited_at;

    while (stdout_open || stderr_open || !child_exited) {
        const auto now = std::chrono::steady_clock::now();
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(now - started).count();
        if (!capture.timed_out && spec.timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(spec.timeout_ms) && !child_exited) {
            capture.timed_out = true;
            static_cast<void>(kill(-pid, SIGKILL));
            static_cast<void>(kill(pid, SIGKILL));
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        // With nfds == 0 this is a plain 50ms sleep while waiting for exit.
        static_cast<void>(poll(fds, nfds, 50));

        drain_pipe(stdout_pipe[0], stdout_open, capture.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, capture.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
                exited_at = std::chrono::steady_clock::now();
                if (capture.timed_out) {
                    static_cast<void>(kill(-pid, SIGKILL));
                }
            }
        }

        if (child_exited && (stdout_open || stderr_open)) {
            const auto since_exit = std::chrono::duration_cast<std::chrono::milliseconds>(
                                        std::chrono::steady_clock::now() - exited_at)
                                        .count();
            if (since_exit > kPostExitDrainMs) {
                if (stdout_open) {
                    static_cast<void>(close(stdout_pipe[0]));
                    stdout_open = false;
                }
                if (stderr_open) {
                    static_cast<void>(close(stderr_pipe[0]));
                    stderr_open = false;
                }
            }
        }
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    } else {
        capture.exit_code = -1;
    }

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();
    return capture;
}

}  // namespace deploypilot::process
