#include "report/outcome_writer.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <utility>
#include <variant>

namespace shellbench::report {

using core::errors::BenchError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

struct VerifierJsonVisitor {
    json operator()(const protocol::TestResult& result) const {
        return {{"success", result.success},     {"passed", result.passed},
                {"failed", result.failed},       {"total", result.total},
                {"exit_code", result.exit_code}, {"test_file", result.test_file},
                {"output", result.output},       {"error", result.error}};
    }

    json operator()(const protocol::StaticCheckResult& result) const {
        return {{"success", result.success},     {"skipped", result.skipped},
                {"error_count", result.error_count}, {"exit_code", result.exit_code},
                {"target", result.target},       {"output", result.output},
                {"error", result.error}};
    }

    json operator()(const protocol::PatternMatchResult& result) const {
        json rules = json::array();
        for (const auto& rule : result.rules) {
            rules.push_back({{"target", rule.target},
                             {"pattern", rule.pattern},
                             {"success", rule.success},
                             {"found", rule.found},
                             {"used_regex", rule.used_regex},
                             {"target_is_directory", rule.target_is_directory},
                             {"error", rule.error}});
        }
        return {{"success", result.success}, {"rules", rules}};
    }

    json operator()(const protocol::PermissionResult& result) const {
        json checks = json::array();
        for (const auto& check : result.checks) {
            checks.push_back({{"path", check.path},
                              {"expectation", check.expectation},
                              {"met", check.met},
                              {"detail", check.detail}});
        }
        return {{"success", result.success},
                {"has_expectations", result.has_expectations},
                {"checks", checks}};
    }

    json operator()(const protocol::VersionControlResult& result) const {
        return {{"success", result.success},
                {"has_expectations", result.has_expectations},
                {"is_work_tree", result.is_work_tree},
                {"branch", result.branch},
                {"commit_count", result.commit_count},
                {"required_commits", result.required_commits},
                {"error", result.error}};
    }

    json operator()(const protocol::BaselineDiffResult& result) const {
        return {{"success", result.success},
                {"created_files", result.created_files},
                {"modified_files", result.modified_files},
                {"deleted_files", result.deleted_files},
                {"created_directories", result.created_directories},
                {"deleted_directories", result.deleted_directories},
                {"error", result.error}};
    }
};

}  // namespace

json to_json(const protocol::CommandBatch& batch) {
    return {{"commands", batch.commands}, {"time_estimate", batch.time_estimate}};
}

json to_json(const protocol::ExecutionResult& execution) {
    json results = json::array();
    for (const auto& outcome : execution.results) {
        results.push_back({{"command", outcome.command},
                           {"success", outcome.success},
                           {"output", outcome.output},
                           {"error", outcome.error},
                           {"fault", protocol::to_string(outcome.fault)},
                           {"exit_code", outcome.exit_code},
                           {"elapsed_seconds", outcome.elapsed_seconds}});
    }

    json payload;
    payload["results"] = results;
    payload["total_time"] = execution.total_time;
    payload["all_successful"] = execution.all_successful;
    payload["transcript"] = execution.transcript;
    return payload;
}

json to_json(const runtime::Observation& observation) {
    return {{"task_description", observation.task_description},
            {"file_tree", observation.file_tree},
            {"cli_history", observation.cli_history}};
}

json to_json(const protocol::VerificationResults& results) {
    json payload = json::object();
    for (const auto& entry : results.entries()) {
        payload[protocol::to_string(protocol::kind_of(entry))] =
            std::visit(VerifierJsonVisitor{}, entry);
    }
    return payload;
}

json to_json(const protocol::Outcome& outcome) {
    json components = json::array();
    for (const auto& component : outcome.breakdown.components) {
        components.push_back({{"name", component.name},
                              {"score", component.score},
                              {"weight", component.weight}});
    }

    const auto& breakdown = outcome.breakdown;
    json payload;
    payload["success"] = outcome.success;
    payload["total_reward"] = outcome.total_reward;
    payload["breakdown"] = {{"base_reward", breakdown.base_reward},
                            {"time_score", breakdown.time_score},
                            {"regression_score", breakdown.regression_score},
                            {"time_penalty_weight", breakdown.time_penalty_weight},
                            {"regression_penalty_weight",
                             breakdown.regression_penalty_weight},
                            {"efficiency_score", breakdown.efficiency_score},
                            {"actual_time", breakdown.actual_time},
                            {"estimated_time", breakdown.estimated_time},
                            {"components", components}};
    return payload;
}

json to_json(const BenchError& error) {
    return {{"category", core::errors::to_string(error.category)},
            {"code", error.code},
            {"message", error.message},
            {"hint", error.hint}};
}

OutcomeWriter::OutcomeWriter(std::filesystem::path report_path)
    : report_path_(std::move(report_path)) {}

core::errors::Result<std::filesystem::path> OutcomeWriter::append_event(
    const std::string& episode_id, const std::string& event_name, json payload) const {
    if (report_path_.empty()) {
        return BenchError{ErrorCategory::Input, "Report path cannot be empty.",
                          "invalid_report_path"};
    }

    const auto parent = report_path_.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return BenchError{ErrorCategory::Internal,
                              "Unable to create report directory: " + parent.string(),
                              "report_dir_create_failed"};
        }
    }

    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = event_name;
    event["episode_id"] = episode_id;
    event["payload"] = std::move(payload);

    std::ofstream out(report_path_, std::ios::app);
    if (!out.is_open()) {
        return BenchError{ErrorCategory::Internal,
                          "Unable to open report file: " + report_path_.string(),
                          "report_open_failed"};
    }

    out << event.dump() << "\n";
    if (!out.good()) {
        return BenchError{ErrorCategory::Internal,
                          "Unable to write report event: " + report_path_.string(),
                          "report_write_failed"};
    }
    return report_path_;
}

core::errors::Result<std::filesystem::path> OutcomeWriter::write_request(
    const std::string& episode_id, const protocol::Scenario& scenario,
    const json& action) const {
    json payload;
    payload["difficulty"] = protocol::to_string(scenario.difficulty);
    payload["language"] = scenario.language;
    payload["task_description"] = scenario.task_description;
    payload["file_count"] = scenario.files.size();
    payload["action"] = action;
    return append_event(episode_id, "request", std::move(payload));
}

core::errors::Result<std::filesystem::path> OutcomeWriter::write_observation(
    const std::string& episode_id, const runtime::Observation& observation) const {
    return append_event(episode_id, "observation", to_json(observation));
}

core::errors::Result<std::filesystem::path> OutcomeWriter::write_execution(
    const std::string& episode_id, const protocol::CommandBatch& batch,
    const protocol::ExecutionResult& execution,
    const std::vector<std::string>& history) const {
    json payload = to_json(execution);
    payload["batch"] = to_json(batch);
    payload["history"] = history;
    return append_event(episode_id, "execution", std::move(payload));
}

core::errors::Result<std::filesystem::path> OutcomeWriter::write_verification(
    const std::string& episode_id, const protocol::VerificationResults& results) const {
    return append_event(episode_id, "verification", to_json(results));
}

core::errors::Result<std::filesystem::path> OutcomeWriter::write_outcome(
    const std::string& episode_id, const protocol::Outcome& outcome) const {
    return append_event(episode_id, "outcome", to_json(outcome));
}

core::errors::Result<std::filesystem::path> OutcomeWriter::write_fault(
    const std::string& episode_id, const BenchError& error) const {
    return append_event(episode_id, "fault", to_json(error));
}

}  // namespace shellbench::report
