#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace shellbench::protocol {

    enum class Difficulty {
        Easy,       // 1-2 commands
        Medium,     // 3-5 commands
        Hard,       // 6-10 commands
        VeryHard    // 10+ commands
    };

    enum class RuleKind {
        Test,
        TextMatch,
        Lint,
        Execution,
        Permission,
        Git
    };

    // A file materialized into the sandbox before the agent's commands run.
    struct ScenarioFile {
        std::string path;       // relative to the sandbox root
        std::string content;
        bool is_test = false;
    };

    struct VerificationRule {
        RuleKind kind = RuleKind::Execution;
        std::string target;     // file path, may be empty
        std::string expected;   // pattern, permission word or commit count
        std::string description;
    };

    // Everything one episode needs. Built once, read-only afterwards.
    struct Scenario {
        Difficulty difficulty = Difficulty::Easy;
        std::string language;   // "python" or "javascript"
        std::string task_description;
        std::vector<ScenarioFile> files;
        std::vector<VerificationRule> rules;
        int expected_commands = 10;
        std::vector<std::string> cli_history;
        nlohmann::json metadata = nlohmann::json::object();
    };

    inline std::string to_string(const Difficulty difficulty) {
        switch (difficulty) {
            case Difficulty::Easy:
                return "easy";
            case Difficulty::Medium:
                return "medium";
            case Difficulty::Hard:
                return "hard";
            case Difficulty::VeryHard:
                return "very_hard";
            default:
                return "unknown";
        }
    }

    inline std::string to_string(const RuleKind kind) {
        switch (kind) {
            case RuleKind::Test:
                return "test";
            case RuleKind::TextMatch:
                return "text_match";
            case RuleKind::Lint:
                return "lint";
            case RuleKind::Execution:
                return "execution";
            case RuleKind::Permission:
                return "permission";
            case RuleKind::Git:
                return "git";
            default:
                return "unknown";
        }
    }

} // namespace shellbench::protocol
