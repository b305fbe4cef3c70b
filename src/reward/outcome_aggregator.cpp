#include "reward/outcome_aggregator.hpp"

#include <utility>
#include <variant>
#include "core/logging/logger.hpp"

namespace shellbench::reward {

using protocol::BaselineDiffResult;
using protocol::PatternMatchResult;
using protocol::PermissionResult;
using protocol::StaticCheckResult;
using protocol::TestResult;
using protocol::VersionControlResult;

namespace {

struct SuccessCascade {
    std::size_t veto_ceiling;
    bool decided_by_checks = false;
    bool failed = false;
    bool vetoed = false;
    bool diff_changed = false;

    void decide(const bool passed) {
        decided_by_checks = true;
        failed = failed || !passed;
    }

    void operator()(const TestResult& result) {
        decide(result.success && result.failed == 0);
    }

    void operator()(const StaticCheckResult& result) {
        if (!result.skipped && static_cast<std::size_t>(result.error_count) > veto_ceiling) {
            vetoed = true;
        }
    }

    void operator()(const PatternMatchResult& result) {
        for (const auto& rule : result.rules) {
            if (!rule.target_is_directory) {
                decide(rule.success);
            }
        }
    }

    void operator()(const PermissionResult& result) {
        if (result.has_expectations) {
            decide(result.success);
        }
    }

    void operator()(const VersionControlResult& result) {
        if (result.has_expectations) {
            decide(result.success);
        }
    }

    void operator()(const BaselineDiffResult& result) { diff_changed = result.success; }
};

}  // namespace

OutcomeAggregator::OutcomeAggregator(const std::size_t static_check_veto_ceiling,
                                     RewardCalculator calculator)
    : static_check_veto_ceiling_(static_check_veto_ceiling),
      calculator_(std::move(calculator)) {}

bool OutcomeAggregator::decide_success(const protocol::VerificationResults& results) const {
    SuccessCascade cascade{static_check_veto_ceiling_};
    for (const auto& entry : results.entries()) {
        std::visit(cascade, entry);
    }
    if (cascade.failed || cascade.vetoed) {
        return false;
    }
    return cascade.decided_by_checks || cascade.diff_changed;
}

protocol::Outcome OutcomeAggregator::aggregate(const protocol::Scenario& scenario,
                                               const protocol::CommandBatch& batch,
                                               const protocol::ExecutionResult& execution,
                                               const protocol::VerificationResults& results,
                                               const TestResult* tests_before) const {
    protocol::Outcome outcome;
    outcome.success = decide_success(results);
    outcome.breakdown = calculator_.calculate(results, execution.total_time,
                                              batch.time_estimate, tests_before);
    outcome.breakdown.efficiency_score = RewardCalculator::efficiency_score(
        results, scenario.expected_commands, execution.results.size());
    outcome.total_reward = calculator_.total(outcome.breakdown);

    LOG_INFO("OutcomeAggregator: success=" + std::string(outcome.success ? "true" : "false") +
             " reward=" + std::to_string(outcome.total_reward));
    return outcome;
}

}  // namespace shellbench::reward
