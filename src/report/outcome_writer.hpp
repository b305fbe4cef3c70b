#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/bench_errors.hpp"
#include "protocol/command_batch.hpp"
#include "protocol/execution_contract.hpp"
#include "protocol/outcome_contract.hpp"
#include "protocol/scenario.hpp"
#include "protocol/verification_contract.hpp"
#include "runtime/observation.hpp"

namespace shellbench::report {

nlohmann::json to_json(const protocol::CommandBatch& batch);
nlohmann::json to_json(const protocol::ExecutionResult& execution);
nlohmann::json to_json(const protocol::VerificationResults& results);
nlohmann::json to_json(const protocol::Outcome& outcome);
nlohmann::json to_json(const core::errors::BenchError& error);
nlohmann::json to_json(const runtime::Observation& observation);

// Appends one JSON object per line to a caller-chosen report file.
class OutcomeWriter {
public:
    explicit OutcomeWriter(std::filesystem::path report_path);

    core::errors::Result<std::filesystem::path> write_request(
        const std::string& episode_id, const protocol::Scenario& scenario,
        const nlohmann::json& action) const;

    core::errors::Result<std::filesystem::path> write_observation(
        const std::string& episode_id, const runtime::Observation& observation) const;

    core::errors::Result<std::filesystem::path> write_execution(
        const std::string& episode_id, const protocol::CommandBatch& batch,
        const protocol::ExecutionResult& execution,
        const std::vector<std::string>& history = {}) const;

    core::errors::Result<std::filesystem::path> write_verification(
        const std::string& episode_id, const protocol::VerificationResults& results) const;

    core::errors::Result<std::filesystem::path> write_outcome(
        const std::string& episode_id, const protocol::Outcome& outcome) const;

    core::errors::Result<std::filesystem::path> write_fault(
        const std::string& episode_id, const core::errors::BenchError& error) const;

    const std::filesystem::path& report_path() const { return report_path_; }

private:
    core::errors::Result<std::filesystem::path> append_event(
        const std::string& episode_id, const std::string& event_name,
        nlohmann::json payload) const;

    std::filesystem::path report_path_;
};

}  // namespace shellbench::report
