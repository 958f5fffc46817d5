#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include "core/errors/pilot_errors.hpp"

namespace deploypilot::process {

struct CommandSpec {
    std::vector<std::string> argv;
    std::filesystem::path working_directory = ".";
    std::uint32_t timeout_ms = 30000;
    std::vector<std::pair<std::string, std::string>> environment;
};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;

    bool succeeded() const { return !timed_out && exit_code == 0; }
    std::string combined_output() const;
};

// argv for `/bin/sh -c <command>`.
std::vector<std::string> shell_argv(const std::string& command);

// Runs argv[0] (PATH lookup) in its own process group with stdin on
// /dev/null, capturing both streams. On timeout the whole group is killed.
// Errors are returned only when the process could not be started at all.
core::errors::Result<ProcessCapture> run_process(const CommandSpec& spec);

// True when `name` resolves to an executable on PATH.
bool executable_on_path(const std::string& name);

}  // namespace deploypilot::process
