#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "core/errors/pilot_errors.hpp"
#include "process/child_process.hpp"

namespace deploypilot::process {

struct ManagedProcess {
    std::string session_id;
    std::string app_path_or_kind;
    std::string url;
    std::uint16_t port = 0;
    std::filesystem::path working_directory;
    std::unique_ptr<ChildProcess> process;
};

// Copyable view of a tracked session.
struct SessionSummary {
    std::string session_id;
    std::string app_path_or_kind;
    std::string url;
    std::uint16_t port = 0;
    pid_t pid = -1;
    bool running = false;
};

struct LaunchRequest {
    std::string id_prefix = "ui";
    std::string app_path_or_kind;
    std::vector<std::string> argv;
    std::filesystem::path working_directory;
    std::vector<std::pair<std::string, std::string>> environment;
    std::uint16_t port = 0;
    std::string url;
    std::chrono::milliseconds grace_period{3000};
};

struct StopReport {
    std::string session_id;
    StopOutcome outcome = StopOutcome::Terminated;
};

// Owns every long-running child started on behalf of a tool call. Entries
// are keyed by a session id that is unique among live entries.
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(std::chrono::milliseconds stop_timeout = std::chrono::milliseconds(5000));
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    // Spawns, waits the grace period and keeps the child only if it is still
    // alive. A child that died early is reported with its captured output.
    core::errors::Result<SessionSummary> launch(const LaunchRequest& request);

    core::errors::Result<StopReport> stop(const std::string& session_id);

    // Drops entries whose process exited without an explicit stop.
    std::vector<std::string> reap_exited();

    std::vector<SessionSummary> list();
    bool contains(const std::string& session_id) const;
    std::size_t session_count() const;

    // Stops every tracked session; used on shutdown.
    std::size_t stop_all();

private:
    core::errors::Result<std::string> allocate_session_id(const std::string& prefix) const;
    static SessionSummary summarize(ManagedProcess& record);
    static void remove_log(const ManagedProcess& record);

    std::chrono::milliseconds stop_timeout_;
    mutable std::mutex mutex_;
    std::map<std::string, ManagedProcess> sessions_;
};

}  // namespace deploypilot::process
