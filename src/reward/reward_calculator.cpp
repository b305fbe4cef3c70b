#include "reward/reward_calculator.hpp"

#include <algorithm>
#include <optional>
#include <variant>
#include <vector>

namespace shellbench::reward {

using protocol::BaselineDiffResult;
using protocol::PatternMatchResult;
using protocol::PermissionResult;
using protocol::RewardBreakdown;
using protocol::RewardComponent;
using protocol::StaticCheckResult;
using protocol::TestResult;
using protocol::VersionControlResult;

namespace {

double clip_unit(const double value) {
    return std::clamp(value, 0.0, 1.0);
}

double static_check_score(const StaticCheckResult& result) {
    if (result.skipped) {
        return 1.0;
    }
    if (!result.success && result.error_count == 0) {
        return 0.5;
    }
    return std::max(0.5, 1.0 - 0.05 * result.error_count);
}

// Scores every recorded verifier result. Each result type has its own
// overload so a new verifier kind fails to compile until it is scored.
struct ComponentCollector {
    const RewardWeights& weights;
    std::optional<RewardComponent> test;
    std::optional<RewardComponent> static_check;
    std::optional<RewardComponent> pattern;
    std::optional<RewardComponent> permission;
    const TestResult* tests = nullptr;
    const BaselineDiffResult* diff = nullptr;

    void operator()(const TestResult& result) {
        tests = &result;
        const double score =
            result.total > 0 ? static_cast<double>(result.passed) / result.total
                             : (result.success ? 1.0 : 0.0);
        test = RewardComponent{"test", score, weights.test};
    }

    void operator()(const StaticCheckResult& result) {
        static_check =
            RewardComponent{"static_check", static_check_score(result), weights.static_check};
    }

    void operator()(const PatternMatchResult& result) {
        int valid = 0;
        int passed = 0;
        for (const auto& rule : result.rules) {
            if (rule.target_is_directory) {
                continue;
            }
            ++valid;
            passed += rule.success ? 1 : 0;
        }
        if (valid > 0) {
            pattern = RewardComponent{"pattern_match", static_cast<double>(passed) / valid,
                                      weights.pattern};
        }
    }

    void operator()(const PermissionResult& result) {
        if (result.has_expectations) {
            permission =
                RewardComponent{"permission", result.success ? 1.0 : 0.0, weights.permission};
        }
    }

    // Commit requirements decide success only; they carry no reward weight.
    void operator()(const VersionControlResult&) {}

    void operator()(const BaselineDiffResult& result) { diff = &result; }

    std::vector<RewardComponent> components() const {
        std::vector<RewardComponent> collected;
        for (const auto* component : {&test, &static_check, &pattern, &permission}) {
            if (*component) {
                collected.push_back(**component);
            }
        }
        if (diff != nullptr) {
            if (collected.empty()) {
                collected.push_back({"baseline_diff", diff->success ? 1.0 : 0.0, 1.0});
            } else {
                collected.push_back(
                    {"baseline_diff", diff->success ? 1.0 : 0.5, weights.diff_secondary});
            }
        }
        return collected;
    }
};

}  // namespace

RewardCalculator::RewardCalculator(RewardWeights weights) : weights_(weights) {}

RewardBreakdown RewardCalculator::calculate(const protocol::VerificationResults& results,
                                            const double actual_time,
                                            const double estimated_time,
                                            const TestResult* tests_before) const {
    RewardBreakdown breakdown;
    breakdown.time_penalty_weight = weights_.time_penalty;
    breakdown.regression_penalty_weight = weights_.regression_penalty;
    breakdown.actual_time = actual_time;
    breakdown.estimated_time = estimated_time;

    ComponentCollector collector{weights_, {}, {}, {}, {}, nullptr, nullptr};
    for (const auto& entry : results.entries()) {
        std::visit(collector, entry);
    }
    breakdown.components = collector.components();
    const TestResult* tests = collector.tests;

    double weighted = 0.0;
    double weight_sum = 0.0;
    for (const auto& component : breakdown.components) {
        weighted += component.score * component.weight;
        weight_sum += component.weight;
    }
    // A partially passing suite is not inflated by checks that did not run.
    const double denominator = tests != nullptr ? std::max(weight_sum, 1.0) : weight_sum;
    breakdown.base_reward = denominator > 0.0 ? clip_unit(weighted / denominator) : 0.0;

    breakdown.time_score = time_score(actual_time, estimated_time);
    breakdown.regression_score = regression_score(tests_before, tests);
    return breakdown;
}

double RewardCalculator::total(const RewardBreakdown& breakdown) const {
    const double time_factor =
        1.0 - breakdown.time_penalty_weight * (1.0 - breakdown.time_score);
    const double regression_factor =
        1.0 - breakdown.regression_penalty_weight * (1.0 - breakdown.regression_score);
    return clip_unit(breakdown.base_reward * time_factor * regression_factor);
}

double RewardCalculator::time_score(const double actual_time, const double estimated_time) {
    if (estimated_time <= 0.0) {
        return 0.5;
    }
    if (actual_time <= estimated_time) {
        return 1.0;
    }
    return estimated_time / actual_time;
}

double RewardCalculator::regression_score(const TestResult* before, const TestResult* after) {
    if (before == nullptr || before->passed <= 0) {
        return 1.0;
    }
    const int passed_after = after != nullptr ? after->passed : 0;
    if (passed_after >= before->passed) {
        return 1.0;
    }
    return clip_unit(1.0 - static_cast<double>(before->passed - passed_after) /
                               before->passed);
}

double RewardCalculator::efficiency_score(const protocol::VerificationResults& results,
                                          const int expected_commands,
                                          const std::size_t commands_used) {
    const auto* tests = results.find<TestResult>();
    if (tests == nullptr || !tests->success || expected_commands <= 0) {
        return 1.0;
    }
    const double expected = expected_commands;
    const double used = static_cast<double>(commands_used);
    if (used <= expected) {
        return std::min(expected / std::max(used, 1.0), 1.0);
    }
    return std::max(expected / used, 0.7);
}

}  // namespace shellbench::reward
