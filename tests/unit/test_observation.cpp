#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "protocol/execution_contract.hpp"
#include "protocol/scenario.hpp"
#include "runtime/observation.hpp"

namespace {

using shellbench::protocol::CommandOutcome;
using shellbench::protocol::Difficulty;
using shellbench::protocol::ExecutionResult;
using shellbench::protocol::Scenario;
using shellbench::runtime::build_observation;
using shellbench::runtime::format_command_output;
using shellbench::runtime::generate_initial_history;
using shellbench::runtime::render_file_tree;
using shellbench::runtime::render_transcript;

Scenario two_file_scenario(const Difficulty difficulty) {
    Scenario scenario;
    scenario.difficulty = difficulty;
    scenario.language = "python";
    scenario.task_description = "Fix add";
    scenario.files = {{"calc.py", "12345", false}, {"test_calc.py", "abc", true}};
    return scenario;
}

TEST(ObservationTest, RendersFileTreeWithSizes) {
    const auto scenario = two_file_scenario(Difficulty::Easy);
    EXPECT_EQ(render_file_tree(scenario.files),
              "Files:\n  - calc.py (5 bytes)\n  - test_calc.py (3 bytes)\n");
}

TEST(ObservationTest, EasyHistoryIsPlainListing) {
    const auto history = generate_initial_history(two_file_scenario(Difficulty::Easy));
    EXPECT_EQ(history, (std::vector<std::string>{"$ ls", "calc.py test_calc.py"}));
}

TEST(ObservationTest, HardHistoryShowsFailingTests) {
    const auto history = generate_initial_history(two_file_scenario(Difficulty::Hard));
    ASSERT_EQ(history.size(), 6u);
    EXPECT_EQ(history[0], "$ ls -la");
    EXPECT_EQ(history[1], "-rw------- 1 user user 5 calc.py");
    EXPECT_EQ(history[3], "$ pytest -v");
    EXPECT_EQ(history[4], "test_calc.py::test_* FAILED");
}

TEST(ObservationTest, StoredHistoryWins) {
    auto scenario = two_file_scenario(Difficulty::Easy);
    scenario.cli_history = {"$ cat calc.py", "def add"};
    const auto observation = build_observation(scenario);
    EXPECT_EQ(observation.cli_history, "$ cat calc.py\ndef add");
    EXPECT_EQ(observation.task_description, "Fix add");
}

TEST(ObservationTest, FormatsOutputLines) {
    EXPECT_EQ(format_command_output("ls", "a\nb\n"),
              (std::vector<std::string>{"$ ls", "a", "b", "", ""}));
    EXPECT_EQ(format_command_output("true", ""),
              (std::vector<std::string>{"$ true", "", ""}));
}

TEST(ObservationTest, TruncatesLongOutput) {
    std::string output;
    for (int i = 0; i < 25; ++i) {
        output += "line" + std::to_string(i) + "\n";
    }
    const auto history = format_command_output("seq", output);
    ASSERT_EQ(history.size(), 23u);
    EXPECT_EQ(history[20], "line19");
    EXPECT_EQ(history[21], "... (6 more lines)");
    EXPECT_EQ(history[22], "");
}

TEST(ObservationTest, TranscriptShowsErrorsForFailedCommands) {
    ExecutionResult execution;
    CommandOutcome ok;
    ok.command = "echo hi";
    ok.success = true;
    ok.output = "hi";
    CommandOutcome failed;
    failed.command = "false";
    failed.error = "Command failed with code 1: ";
    execution.results = {ok, failed};

    const auto transcript = render_transcript(execution);
    EXPECT_EQ(transcript, (std::vector<std::string>{"$ echo hi", "hi", "", "$ false",
                                                    "Error: Command failed with code 1: ",
                                                    ""}));
}

}  // namespace
