#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "core/config/episode_config.hpp"
#include "core/errors/bench_errors.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/execution_contract.hpp"
#include "protocol/scenario.hpp"
#include "sandbox/environment.hpp"
#include "sandbox/process_runner.hpp"
#include "sandbox/resource_limiter.hpp"

namespace shellbench::sandbox {

struct SandboxOptions {
    // Parent of the sandbox root; the system temp directory when empty.
    std::filesystem::path temp_directory;
    std::chrono::milliseconds command_timeout{30000};
    std::size_t max_output_bytes = 100000;
    core::config::ResourceLimits resource_limits;
};

SandboxOptions sandbox_options_from(const core::config::EpisodeConfig& config);

// Owns a private directory tree for one episode. The tree is removed when the
// object is destroyed.
class Sandbox {
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    // Writes `files` into a fresh 0700 root. Fails with a Security error,
    // before any file is written, when a path would land outside the root.
    static core::errors::Result<std::unique_ptr<Sandbox>> create(
        const std::vector<protocol::ScenarioFile>& files, SandboxOptions options = {});

    // Only reachable through create().
    Sandbox(ConstructionKey, std::filesystem::path root, std::filesystem::path original_cwd,
            SandboxOptions options);
    ~Sandbox();
    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    // Runs every command in order. A failing command never stops the batch.
    protocol::ExecutionResult execute_commands(const std::vector<std::string>& commands);
    protocol::CommandOutcome execute_command(const std::string& command);

    const std::filesystem::path& root() const { return root_; }
    const std::filesystem::path& cwd() const { return cwd_; }
    const SandboxOptions& options() const { return options_; }

    // Environment commands see at the current cursor.
    Environment environment() const;

private:
    protocol::CommandOutcome change_directory(const std::string& command,
                                              const std::vector<std::string>& args);
    protocol::CommandOutcome run_in_shell(const std::string& command);
    void release();

    std::filesystem::path root_;
    std::filesystem::path cwd_;
    std::filesystem::path original_cwd_;
    SandboxOptions options_;
    std::unique_ptr<ResourceLimiter> limiter_;
    policy::PolicyGuard policy_guard_;
};

// Combined stdout/stderr view, capped at `max_bytes` with a truncation marker.
std::string combine_output(const ProcessCapture& capture, std::size_t max_bytes);

}  // namespace shellbench::sandbox
