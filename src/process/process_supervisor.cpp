#include "process/process_supervisor.hpp"

#include <system_error>
#include <thread>
#include "core/config/session_id.hpp"
#include "core/logging/logger.hpp"

namespace deploypilot::process {

using core::errors::ErrorCategory;
using core::errors::PilotError;

ProcessSupervisor::ProcessSupervisor(const std::chrono::milliseconds stop_timeout)
    : stop_timeout_(stop_timeout) {}

ProcessSupervisor::~ProcessSupervisor() {
    static_cast<void>(stop_all());
}

core::errors::Result<std::string> ProcessSupervisor::allocate_session_id(
    const std::string& prefix) const {
    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        std::string session_id = core::config::generate_session_id(prefix);
        if (sessions_.find(session_id) != sessions_.end()) {
            continue;
        }
        return session_id;
    }
    return PilotError{ErrorCategory::Internal, "Unable to allocate unique session ID.",
                      "session_id_generation_failed"};
}

SessionSummary ProcessSupervisor::summarize(ManagedProcess& record) {
    SessionSummary summary;
    summary.session_id = record.session_id;
    summary.app_path_or_kind = record.app_path_or_kind;
    summary.url = record.url;
    summary.port = record.port;
    if (record.process) {
        summary.pid = record.process->pid();
        summary.running = record.process->is_running();
    }
    return summary;
}

void ProcessSupervisor::remove_log(const ManagedProcess& record) {
    if (!record.process) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(record.process->log_file(), ec);
}

core::errors::Result<SessionSummary> ProcessSupervisor::launch(const LaunchRequest& request) {
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto allocated = allocate_session_id(request.id_prefix);
        if (core::errors::is_error(allocated)) {
            return core::errors::get_error(allocated);
        }
        session_id = core::errors::get_value(allocated);
        // Reserve the id while the child starts up.
        ManagedProcess placeholder;
        placeholder.session_id = session_id;
        sessions_.emplace(session_id, std::move(placeholder));
    }

    auto release_reservation = [this, &session_id]() {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.erase(session_id);
    };

    LaunchSpec spec;
    spec.argv = request.argv;
    spec.working_directory = request.working_directory;
    spec.environment = request.environment;
    spec.log_file = std::filesystem::temp_directory_path() / ("deploypilot-" + session_id + ".log");

    auto spawned = ChildProcess::spawn(spec);
    if (core::errors::is_error(spawned)) {
        release_reservation();
        return core::errors::get_error(spawned);
    }
    auto child = std::move(std::get<std::unique_ptr<ChildProcess>>(spawned));

    std::this_thread::sleep_for(request.grace_period);

    if (!child->is_running()) {
        const std::string output = child->read_output();
        const auto code = child->exit_code().value_or(-1);
        std::error_code ec;
        std::filesystem::remove(child->log_file(), ec);
        release_reservation();
        LOG_WARN("ProcessSupervisor: " + session_id + " exited during startup (code " +
                 std::to_string(code) + ")");
        return PilotError{ErrorCategory::Execution,
                          "Process exited during startup with code " + std::to_string(code) +
                              ".\nOutput:\n" + output,
                          "process_exited_early"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& record = sessions_[session_id];
    record.session_id = session_id;
    record.app_path_or_kind = request.app_path_or_kind;
    record.url = request.url;
    record.port = request.port;
    record.working_directory = request.working_directory;
    record.process = std::move(child);
    LOG_INFO("ProcessSupervisor: session " + session_id + " transition starting -> running (pid " +
             std::to_string(record.process->pid()) + ", " + record.url + ")");
    return summarize(record);
}

core::errors::Result<StopReport> ProcessSupervisor::stop(const std::string& session_id) {
    ManagedProcess record;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end() || !it->second.process) {
            return PilotError{ErrorCategory::Input, "Session ID not found: " + session_id,
                              "session_not_found"};
        }
        record = std::move(it->second);
        sessions_.erase(it);
    }

    StopReport report;
    report.session_id = session_id;
    report.outcome = record.process->terminate(stop_timeout_);
    remove_log(record);
    LOG_INFO("ProcessSupervisor: session " + session_id + " transition running -> stopped (" +
             to_string(report.outcome) + ")");
    return report;
}

std::vector<std::string> ProcessSupervisor::reap_exited() {
    std::vector<ManagedProcess> exited;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->second.process && !it->second.process->is_running()) {
                exited.push_back(std::move(it->second));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::vector<std::string> reaped;
    for (auto& record : exited) {
        // Helpers the leader spawned may still be holding the group.
        static_cast<void>(record.process->terminate(std::chrono::milliseconds(0)));
        remove_log(record);
        LOG_INFO("ProcessSupervisor: session " + record.session_id +
                 " transition running -> exited (reaped)");
        reaped.push_back(record.session_id);
    }
    return reaped;
}

std::vector<SessionSummary> ProcessSupervisor::list() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionSummary> out;
    out.reserve(sessions_.size());
    for (auto& [id, record] : sessions_) {
        if (!record.process) {
            continue;
        }
        out.push_back(summarize(record));
    }
    return out;
}

bool ProcessSupervisor::contains(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = sessions_.find(session_id);
    return it != sessions_.end() && it->second.process != nullptr;
}

std::size_t ProcessSupervisor::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& [id, record] : sessions_) {
        if (record.process) {
            ++count;
        }
    }
    return count;
}

std::size_t ProcessSupervisor::stop_all() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, record] : sessions_) {
            if (record.process) {
                ids.push_back(id);
            }
        }
    }

    std::size_t stopped = 0;
    for (const auto& id : ids) {
        auto result = stop(id);
        if (core::errors::is_error(result)) {
            LOG_WARN("ProcessSupervisor: stop_all skipped " + id + ": " +
                     core::errors::get_error(result).message);
            continue;
        }
        ++stopped;
    }
    return stopped;
}

}  // namespace deploypilot::process
