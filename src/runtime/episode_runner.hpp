#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/episode_config.hpp"
#include "core/errors/bench_errors.hpp"
#include "protocol/command_batch.hpp"
#include "protocol/execution_contract.hpp"
#include "protocol/outcome_contract.hpp"
#include "protocol/scenario.hpp"
#include "protocol/verification_contract.hpp"
#include "runtime/observation.hpp"

namespace shellbench::runtime {

struct EpisodeReport {
    std::string episode_id;
    // What the agent was shown before it proposed `batch`.
    Observation observation;
    protocol::CommandBatch batch;
    protocol::ExecutionResult execution;
    // Shell history of the executed batch, as the next observation shows it.
    std::vector<std::string> history;
    protocol::VerificationResults verification;
    std::optional<protocol::TestResult> tests_before;
    protocol::Outcome outcome;
};

class EpisodeRunner {
public:
    explicit EpisodeRunner(core::config::EpisodeConfig config = {},
                           std::filesystem::path sandbox_parent = {});

    // Validates the raw action, then executes, verifies and scores it.
    // Malformed or unsafe actions fail before any sandbox exists.
    core::errors::Result<EpisodeReport> run(const protocol::Scenario& scenario,
                                            const nlohmann::json& action,
                                            const std::string& episode_id = "") const;

    core::errors::Result<EpisodeReport> run_batch(const protocol::Scenario& scenario,
                                                  const protocol::CommandBatch& batch,
                                                  const std::string& episode_id = "") const;

    const core::config::EpisodeConfig& config() const { return config_; }

private:
    core::config::EpisodeConfig config_;
    std::filesystem::path sandbox_parent_;
};

}  // namespace shellbench::runtime
