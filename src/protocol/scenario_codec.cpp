#include "protocol/scenario_codec.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <utility>

namespace shellbench::protocol {

using core::errors::BenchError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

BenchError invalid_record(const std::string& message) {
    return BenchError{ErrorCategory::Input, "Invalid scenario record: " + message,
                      "invalid_scenario"};
}

// Rule expectations may be stored as strings or numbers.
std::string expected_to_string(const json& value) {
    if (value.is_null()) {
        return "";
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

}  // namespace

core::errors::Result<Difficulty> parse_difficulty(const std::string& text) {
    const std::string lowered = lowercase(text);
    if (lowered == "easy") {
        return Difficulty::Easy;
    }
    if (lowered == "medium") {
        return Difficulty::Medium;
    }
    if (lowered == "hard") {
        return Difficulty::Hard;
    }
    if (lowered == "very_hard") {
        return Difficulty::VeryHard;
    }
    return invalid_record("unknown difficulty '" + text + "'");
}

core::errors::Result<RuleKind> parse_rule_kind(const std::string& text) {
    const std::string lowered = lowercase(text);
    if (lowered == "test") {
        return RuleKind::Test;
    }
    if (lowered == "text_match") {
        return RuleKind::TextMatch;
    }
    if (lowered == "lint") {
        return RuleKind::Lint;
    }
    if (lowered == "execution") {
        return RuleKind::Execution;
    }
    if (lowered == "permission") {
        return RuleKind::Permission;
    }
    if (lowered == "git") {
        return RuleKind::Git;
    }
    return invalid_record("unknown rule type '" + text + "'");
}

core::errors::Result<Scenario> parse_scenario(const json& record) {
    if (!record.is_object()) {
        return invalid_record("record must be a JSON object");
    }

    Scenario scenario;

    if (record.contains("difficulty")) {
        if (!record["difficulty"].is_string()) {
            return invalid_record("'difficulty' must be a string");
        }
        auto difficulty = parse_difficulty(record["difficulty"].get<std::string>());
        if (core::errors::is_error(difficulty)) {
            return core::errors::get_error(difficulty);
        }
        scenario.difficulty = core::errors::get_value(difficulty);
    }

    if (!record.contains("language") || !record["language"].is_string()) {
        return invalid_record("'language' must be a string");
    }
    scenario.language = lowercase(record["language"].get<std::string>());

    if (!record.contains("task_description") ||
        !record["task_description"].is_string()) {
        return invalid_record("'task_description' must be a string");
    }
    scenario.task_description = record["task_description"].get<std::string>();

    if (!record.contains("files") || !record["files"].is_array()) {
        return invalid_record("'files' must be an array");
    }
    for (const auto& file : record["files"]) {
        if (!file.is_object() || !file.contains("path") || !file["path"].is_string() ||
            !file.contains("content") || !file["content"].is_string()) {
            return invalid_record("each file needs string 'path' and 'content'");
        }
        ScenarioFile scenario_file;
        scenario_file.path = file["path"].get<std::string>();
        scenario_file.content = file["content"].get<std::string>();
        if (file.contains("is_test") && file["is_test"].is_boolean()) {
            scenario_file.is_test = file["is_test"].get<bool>();
        }
        scenario.files.push_back(std::move(scenario_file));
    }

    if (record.contains("verification_rules")) {
        if (!record["verification_rules"].is_array()) {
            return invalid_record("'verification_rules' must be an array");
        }
        for (const auto& rule : record["verification_rules"]) {
            if (!rule.is_object() || !rule.contains("type") || !rule["type"].is_string()) {
                return invalid_record("each rule needs a string 'type'");
            }
            auto kind = parse_rule_kind(rule["type"].get<std::string>());
            if (core::errors::is_error(kind)) {
                return core::errors::get_error(kind);
            }

            VerificationRule parsed;
            parsed.kind = core::errors::get_value(kind);
            if (rule.contains("target") && rule["target"].is_string()) {
                parsed.target = rule["target"].get<std::string>();
            }
            if (rule.contains("expected")) {
                parsed.expected = expected_to_string(rule["expected"]);
            }
            if (rule.contains("description") && rule["description"].is_string()) {
                parsed.description = rule["description"].get<std::string>();
            }
            scenario.rules.push_back(std::move(parsed));
        }
    }

    if (record.contains("expected_commands")) {
        if (!record["expected_commands"].is_number_integer()) {
            return invalid_record("'expected_commands' must be an integer");
        }
        scenario.expected_commands = record["expected_commands"].get<int>();
    }

    if (record.contains("cli_history")) {
        if (!record["cli_history"].is_array()) {
            return invalid_record("'cli_history' must be an array");
        }
        for (const auto& line : record["cli_history"]) {
            if (!line.is_string()) {
                return invalid_record("'cli_history' entries must be strings");
            }
            scenario.cli_history.push_back(line.get<std::string>());
        }
    }

    if (record.contains("metadata") && !record["metadata"].is_null()) {
        if (!record["metadata"].is_object()) {
            return invalid_record("'metadata' must be an object");
        }
        scenario.metadata = record["metadata"];
    }

    return scenario;
}

core::errors::Result<Scenario> load_scenario_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return BenchError{ErrorCategory::Input,
                          "Unable to open scenario file: " + path.string(),
                          "scenario_open_failed"};
    }

    const json record = json::parse(in, nullptr, false);
    if (record.is_discarded()) {
        return BenchError{ErrorCategory::Input,
                          "Scenario file is not valid JSON: " + path.string(),
                          "invalid_scenario"};
    }
    return parse_scenario(record);
}

json scenario_to_json(const Scenario& scenario) {
    json payload;
    payload["difficulty"] = to_string(scenario.difficulty);
    payload["language"] = scenario.language;
    payload["task_description"] = scenario.task_description;

    json files = json::array();
    for (const auto& file : scenario.files) {
        files.push_back({{"path", file.path},
                         {"content", file.content},
                         {"is_test", file.is_test}});
    }
    payload["files"] = files;

    json rules = json::array();
    for (const auto& rule : scenario.rules) {
        rules.push_back({{"type", to_string(rule.kind)},
                         {"target", rule.target},
                         {"expected", rule.expected},
                         {"description", rule.description}});
    }
    payload["verification_rules"] = rules;
    payload["expected_commands"] = scenario.expected_commands;
    payload["cli_history"] = scenario.cli_history;
    payload["metadata"] = scenario.metadata;
    return payload;
}

}  // namespace shellbench::protocol
