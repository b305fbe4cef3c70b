#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/bench_errors.hpp"
#include "protocol/scenario.hpp"
#include "protocol/scenario_codec.hpp"
#include "temp_workspace.hpp"

namespace {

using shellbench::core::errors::ErrorCategory;
using shellbench::core::errors::get_error;
using shellbench::core::errors::get_value;
using shellbench::core::errors::is_error;
using shellbench::protocol::Difficulty;
using shellbench::protocol::RuleKind;
using shellbench::protocol::load_scenario_file;
using shellbench::protocol::parse_scenario;
using shellbench::protocol::scenario_to_json;
using nlohmann::json;

json sample_record() {
    return json::parse(R"({
        "difficulty": "MEDIUM",
        "language": "Python",
        "task_description": "Fix the add function and commit twice.",
        "files": [
            {"path": "calc.py", "content": "def add(a, b):\n    return a - b\n"},
            {"path": "test_calc.py", "content": "from calc import add\n", "is_test": true}
        ],
        "verification_rules": [
            {"type": "test", "target": "test_calc.py", "description": "tests pass"},
            {"type": "git", "expected": 2},
            {"type": "text_match", "target": "calc.py", "expected": "a \\+ b"}
        ],
        "expected_commands": 3,
        "cli_history": ["$ ls", "calc.py test_calc.py"],
        "metadata": {"category": "bugfix"}
    })");
}

TEST(ScenarioCodecTest, ParsesFullRecord) {
    const auto result = parse_scenario(sample_record());
    ASSERT_FALSE(is_error(result)) << get_error(result).message;

    const auto& scenario = get_value(result);
    EXPECT_EQ(scenario.difficulty, Difficulty::Medium);
    EXPECT_EQ(scenario.language, "python");
    ASSERT_EQ(scenario.files.size(), 2u);
    EXPECT_FALSE(scenario.files[0].is_test);
    EXPECT_TRUE(scenario.files[1].is_test);
    ASSERT_EQ(scenario.rules.size(), 3u);
    EXPECT_EQ(scenario.rules[0].kind, RuleKind::Test);
    EXPECT_EQ(scenario.rules[1].kind, RuleKind::Git);
    EXPECT_EQ(scenario.rules[1].expected, "2");
    EXPECT_EQ(scenario.rules[2].expected, "a \\+ b");
    EXPECT_EQ(scenario.expected_commands, 3);
    EXPECT_EQ(scenario.cli_history.size(), 2u);
    EXPECT_EQ(scenario.metadata["category"], "bugfix");
}

TEST(ScenarioCodecTest, AppliesDefaults) {
    const auto result = parse_scenario(json::parse(
        R"({"language": "javascript", "task_description": "t", "files": []})"));
    ASSERT_FALSE(is_error(result));
    const auto& scenario = get_value(result);
    EXPECT_EQ(scenario.difficulty, Difficulty::Easy);
    EXPECT_EQ(scenario.expected_commands, 10);
    EXPECT_TRUE(scenario.rules.empty());
    EXPECT_TRUE(scenario.metadata.is_object());
}

TEST(ScenarioCodecTest, RejectsMalformedRecords) {
    const auto not_object = parse_scenario(json::array());
    ASSERT_TRUE(is_error(not_object));
    EXPECT_EQ(get_error(not_object).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(not_object).code, "invalid_scenario");

    json bad_file = sample_record();
    bad_file["files"][0].erase("content");
    EXPECT_TRUE(is_error(parse_scenario(bad_file)));

    json bad_rule = sample_record();
    bad_rule["verification_rules"][0]["type"] = "telepathy";
    EXPECT_TRUE(is_error(parse_scenario(bad_rule)));

    json bad_difficulty = sample_record();
    bad_difficulty["difficulty"] = "impossible";
    EXPECT_TRUE(is_error(parse_scenario(bad_difficulty)));
}

TEST(ScenarioCodecTest, JsonRoundTripKeepsFields) {
    const auto first = parse_scenario(sample_record());
    ASSERT_FALSE(is_error(first));
    const auto second = parse_scenario(scenario_to_json(get_value(first)));
    ASSERT_FALSE(is_error(second));

    EXPECT_EQ(get_value(second).difficulty, Difficulty::Medium);
    EXPECT_EQ(get_value(second).files[1].content, "from calc import add\n");
    EXPECT_EQ(get_value(second).rules[1].expected, "2");
}

TEST(ScenarioCodecTest, LoadsScenarioFile) {
    shellbench::testing::TempWorkspace workspace("scenario_codec");
    const auto good = workspace.root() / "scenario.json";
    shellbench::testing::write_file(good, sample_record().dump());
    const auto loaded = load_scenario_file(good);
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).files.size(), 2u);

    const auto broken = workspace.root() / "broken.json";
    shellbench::testing::write_file(broken, "{ not json");
    const auto invalid = load_scenario_file(broken);
    ASSERT_TRUE(is_error(invalid));
    EXPECT_EQ(get_error(invalid).code, "invalid_scenario");

    const auto missing = load_scenario_file(workspace.root() / "missing.json");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "scenario_open_failed");
}

}  // namespace
