#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/bench_errors.hpp"
#include "protocol/command_batch.hpp"
#include "protocol/execution_contract.hpp"
#include "protocol/outcome_contract.hpp"
#include "protocol/scenario.hpp"
#include "protocol/verification_contract.hpp"
#include "report/outcome_writer.hpp"
#include "runtime/observation.hpp"
#include "temp_workspace.hpp"

namespace {

using shellbench::core::errors::BenchError;
using shellbench::core::errors::ErrorCategory;
using shellbench::core::errors::get_error;
using shellbench::core::errors::get_value;
using shellbench::core::errors::is_error;
using shellbench::protocol::BaselineDiffResult;
using shellbench::protocol::CommandBatch;
using shellbench::protocol::CommandFault;
using shellbench::protocol::CommandOutcome;
using shellbench::protocol::ExecutionResult;
using shellbench::protocol::Outcome;
using shellbench::protocol::Scenario;
using shellbench::protocol::TestResult;
using shellbench::protocol::VerificationResults;
using shellbench::report::OutcomeWriter;
using shellbench::testing::TempWorkspace;
using nlohmann::json;

std::vector<json> read_events(const std::filesystem::path& file_path) {
    std::vector<json> events;
    std::ifstream in(file_path);
    std::string line;
    while (std::getline(in, line)) {
        events.push_back(json::parse(line));
    }
    return events;
}

TEST(OutcomeWriterTest, AppendsEpisodeEventsInOrder) {
    TempWorkspace workspace("outcome_writer");
    const auto report_path = workspace.root() / "reports" / "episode.jsonl";
    const OutcomeWriter writer(report_path);
    const std::string episode_id = "ep-0000abcd";

    Scenario scenario;
    scenario.language = "python";
    scenario.task_description = "Fix add()";
    scenario.files = {{"calc.py", "x", false}};
    const json action = {{"commands", {"ls"}}, {"time_estimate", 1.0}};
    ASSERT_FALSE(is_error(writer.write_request(episode_id, scenario, action)));

    CommandBatch batch{{"ls"}, 1.0};
    ExecutionResult execution;
    CommandOutcome listed;
    listed.command = "ls";
    listed.success = true;
    listed.output = "calc.py\n";
    execution.results.push_back(listed);
    execution.total_time = 0.01;
    execution.transcript = {"$ ls", "calc.py\n"};
    ASSERT_FALSE(is_error(writer.write_execution(episode_id, batch, execution)));

    VerificationResults results;
    results.record(BaselineDiffResult{});
    TestResult tests;
    tests.total = 1;
    tests.failed = 1;
    results.record(tests);
    ASSERT_FALSE(is_error(writer.write_verification(episode_id, results)));

    Outcome outcome;
    outcome.total_reward = 0.25;
    const auto last = writer.write_outcome(episode_id, outcome);
    ASSERT_FALSE(is_error(last));
    EXPECT_EQ(get_value(last), report_path);

    const auto events = read_events(report_path);
    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0]["event"], "request");
    EXPECT_EQ(events[0]["episode_id"], episode_id);
    EXPECT_EQ(events[0]["payload"]["file_count"], 1);
    EXPECT_EQ(events[0]["payload"]["action"], action);
    EXPECT_TRUE(events[0]["ts_unix_ms"].is_number_integer());

    EXPECT_EQ(events[1]["event"], "execution");
    EXPECT_EQ(events[1]["payload"]["results"][0]["fault"], "none");
    EXPECT_EQ(events[1]["payload"]["batch"]["commands"][0], "ls");

    EXPECT_EQ(events[2]["event"], "verification");
    EXPECT_TRUE(events[2]["payload"].contains("baseline_diff"));
    EXPECT_EQ(events[2]["payload"]["test"]["failed"], 1);

    EXPECT_EQ(events[3]["event"], "outcome");
    EXPECT_DOUBLE_EQ(events[3]["payload"]["total_reward"].get<double>(), 0.25);
    EXPECT_FALSE(events[3]["payload"]["success"].get<bool>());
}

TEST(OutcomeWriterTest, WritesObservationAndHistory) {
    TempWorkspace workspace("outcome_writer");
    const OutcomeWriter writer(workspace.root() / "episode.jsonl");

    Scenario scenario;
    scenario.task_description = "List the files.";
    scenario.files = {{"notes.txt", "abc", false}};
    const auto observation = shellbench::runtime::build_observation(scenario);
    ASSERT_FALSE(is_error(writer.write_observation("ep-1", observation)));

    CommandBatch batch{{"ls"}, 1.0};
    ExecutionResult execution;
    CommandOutcome listed;
    listed.command = "ls";
    listed.success = true;
    listed.output = "notes.txt\n";
    execution.results.push_back(listed);
    const auto history = shellbench::runtime::render_transcript(execution);
    ASSERT_FALSE(is_error(writer.write_execution("ep-1", batch, execution, history)));

    const auto events = read_events(writer.report_path());
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0]["event"], "observation");
    EXPECT_EQ(events[0]["payload"]["task_description"], "List the files.");
    EXPECT_EQ(events[0]["payload"]["file_tree"], "Files:\n  - notes.txt (3 bytes)\n");
    EXPECT_EQ(events[1]["payload"]["history"][0], "$ ls");
    EXPECT_EQ(events[1]["payload"]["history"][1], "notes.txt");
}

TEST(OutcomeWriterTest, WritesFaultEvent) {
    TempWorkspace workspace("outcome_writer");
    const OutcomeWriter writer(workspace.root() / "faults.jsonl");

    const BenchError error{ErrorCategory::Policy, "Command rejected", "absolute_path",
                           "Use relative paths."};
    ASSERT_FALSE(is_error(writer.write_fault("ep-1", error)));

    const auto events = read_events(writer.report_path());
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0]["event"], "fault");
    EXPECT_EQ(events[0]["payload"]["category"], "policy");
    EXPECT_EQ(events[0]["payload"]["code"], "absolute_path");
    EXPECT_EQ(events[0]["payload"]["hint"], "Use relative paths.");
}

TEST(OutcomeWriterTest, FailsOnEmptyReportPath) {
    const OutcomeWriter writer{std::filesystem::path{}};
    const auto result = writer.write_outcome("ep-1", Outcome{});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_report_path");
}

TEST(OutcomeWriterTest, FailsWhenReportDirectoryIsAFile) {
    TempWorkspace workspace("outcome_writer");
    shellbench::testing::write_file(workspace.root() / "blocker", "not a directory");
    const OutcomeWriter writer(workspace.root() / "blocker" / "episode.jsonl");

    const auto result = writer.write_outcome("ep-1", Outcome{});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Internal);
    EXPECT_EQ(get_error(result).code, "report_dir_create_failed");
}

TEST(OutcomeWriterTest, ExecutionJsonCarriesFaultNames) {
    ExecutionResult execution;
    CommandOutcome timed_out;
    timed_out.command = "sleep 100";
    timed_out.fault = CommandFault::Timeout;
    timed_out.error = "Command timed out after 1s";
    execution.results.push_back(timed_out);
    execution.all_successful = false;

    const json payload = shellbench::report::to_json(execution);
    EXPECT_EQ(payload["results"][0]["fault"], "timeout");
    EXPECT_FALSE(payload["all_successful"].get<bool>());
}

}  // namespace
