#include <string>
#include <gtest/gtest.h>
#include "protocol/command_batch.hpp"
#include "protocol/execution_contract.hpp"
#include "protocol/scenario.hpp"
#include "protocol/verification_contract.hpp"
#include "reward/outcome_aggregator.hpp"

namespace {

using shellbench::protocol::BaselineDiffResult;
using shellbench::protocol::CommandBatch;
using shellbench::protocol::ExecutionResult;
using shellbench::protocol::PatternMatchResult;
using shellbench::protocol::PatternRuleResult;
using shellbench::protocol::PermissionResult;
using shellbench::protocol::Scenario;
using shellbench::protocol::StaticCheckResult;
using shellbench::protocol::TestResult;
using shellbench::protocol::VerificationResults;
using shellbench::protocol::VersionControlResult;
using shellbench::reward::OutcomeAggregator;

BaselineDiffResult changed_tree() {
    BaselineDiffResult diff;
    diff.success = true;
    diff.modified_files = {"app.py"};
    return diff;
}

TestResult passing_suite() {
    TestResult tests;
    tests.success = true;
    tests.passed = 3;
    tests.total = 3;
    tests.exit_code = 0;
    return tests;
}

TEST(OutcomeAggregatorTest, FailingTestsDecideFailure) {
    VerificationResults results;
    results.record(changed_tree());
    TestResult tests = passing_suite();
    tests.success = false;
    tests.failed = 1;
    results.record(tests);

    EXPECT_FALSE(OutcomeAggregator{}.decide_success(results));
}

TEST(OutcomeAggregatorTest, PassingTestsDecideSuccess) {
    VerificationResults results;
    results.record(BaselineDiffResult{});
    results.record(passing_suite());

    EXPECT_TRUE(OutcomeAggregator{}.decide_success(results));
}

TEST(OutcomeAggregatorTest, PatternRuleFailureVetoes) {
    VerificationResults results;
    results.record(passing_suite());
    PatternMatchResult patterns;
    PatternRuleResult miss;
    miss.target = "app.py";
    patterns.rules = {miss};
    results.record(patterns);

    EXPECT_FALSE(OutcomeAggregator{}.decide_success(results));
}

TEST(OutcomeAggregatorTest, DirectoryPatternRulesFallBackToDiff) {
    VerificationResults results;
    PatternMatchResult patterns;
    PatternRuleResult directory;
    directory.target_is_directory = true;
    patterns.rules = {directory};
    results.record(patterns);
    results.record(changed_tree());

    EXPECT_TRUE(OutcomeAggregator{}.decide_success(results));
}

TEST(OutcomeAggregatorTest, UnmetPermissionOrCommitExpectationsFail) {
    VerificationResults permissions;
    permissions.record(changed_tree());
    PermissionResult unmet;
    unmet.has_expectations = true;
    permissions.record(unmet);
    EXPECT_FALSE(OutcomeAggregator{}.decide_success(permissions));

    VerificationResults commits;
    commits.record(changed_tree());
    VersionControlResult missing;
    missing.has_expectations = true;
    missing.required_commits = 1;
    commits.record(missing);
    EXPECT_FALSE(OutcomeAggregator{}.decide_success(commits));
}

TEST(OutcomeAggregatorTest, InactiveExpectationsDoNotDecide) {
    VerificationResults results;
    PermissionResult none;
    none.success = true;
    results.record(none);
    VersionControlResult inactive;
    inactive.success = true;
    results.record(inactive);
    results.record(BaselineDiffResult{});

    EXPECT_FALSE(OutcomeAggregator{}.decide_success(results));
}

TEST(OutcomeAggregatorTest, StaticCheckVetoesOnlyAboveCeiling) {
    StaticCheckResult lint;
    lint.error_count = 10;

    VerificationResults at_ceiling;
    at_ceiling.record(passing_suite());
    at_ceiling.record(lint);
    EXPECT_TRUE(OutcomeAggregator{}.decide_success(at_ceiling));

    lint.error_count = 11;
    VerificationResults above;
    above.record(passing_suite());
    above.record(lint);
    EXPECT_FALSE(OutcomeAggregator{}.decide_success(above));

    lint.skipped = true;
    VerificationResults skipped;
    skipped.record(passing_suite());
    skipped.record(lint);
    EXPECT_TRUE(OutcomeAggregator{}.decide_success(skipped));
}

TEST(OutcomeAggregatorTest, AggregateFillsRewardAndEfficiency) {
    Scenario scenario;
    scenario.expected_commands = 1;
    CommandBatch batch{{"sed -i 's/-/+/' app.py", "cat app.py"}, 2.0};
    ExecutionResult execution;
    execution.total_time = 0.5;
    execution.results.resize(2);

    VerificationResults results;
    results.record(changed_tree());
    results.record(passing_suite());

    const auto outcome = OutcomeAggregator{}.aggregate(scenario, batch, execution, results);
    EXPECT_TRUE(outcome.success);
    EXPECT_NEAR(outcome.breakdown.base_reward, 0.75, 1e-9);
    EXPECT_NEAR(outcome.total_reward, 0.75, 1e-9);
    EXPECT_DOUBLE_EQ(outcome.breakdown.estimated_time, 2.0);
    EXPECT_DOUBLE_EQ(outcome.breakdown.actual_time, 0.5);
    EXPECT_DOUBLE_EQ(outcome.breakdown.efficiency_score, 0.7);
}

}  // namespace
