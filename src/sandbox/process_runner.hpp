#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/bench_errors.hpp"
#include "sandbox/environment.hpp"

namespace shellbench::sandbox {

class ResourceLimiter;

struct ProcessRequest {
    std::vector<std::string> argv;
    std::filesystem::path working_directory;
    Environment environment;
    std::chrono::milliseconds timeout{30000};
    // Bytes kept per stream; the rest is counted and dropped.
    std::size_t max_output_bytes = 100000;
    const ResourceLimiter* limiter = nullptr;
};

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    int term_signal = 0;
    std::string stdout_text;
    std::string stderr_text;
    std::size_t stdout_total_bytes = 0;
    std::size_t stderr_total_bytes = 0;
    double duration_seconds = 0.0;
};

// Runs argv[0] (resolved through the request PATH) in a new process group.
// On timeout the whole group is killed. Exit code 127 means exec failed.
core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request);

// `/bin/sh -c <command>` wrapper over run_process.
core::errors::Result<ProcessCapture> run_shell(const std::string& command,
                                               ProcessRequest request);

}  // namespace shellbench::sandbox
