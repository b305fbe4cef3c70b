#include "verifier/expectations.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <regex>

namespace shellbench::verifier {

using protocol::RuleKind;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

void add_unique(std::vector<std::string>& paths, const std::string& path) {
    if (std::find(paths.begin(), paths.end(), path) == paths.end()) {
        paths.push_back(path);
    }
}

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool mentions_read_only(const std::string& lowered_task) {
    return lowered_task.find("read-only") != std::string::npos ||
           lowered_task.find("read only") != std::string::npos ||
           lowered_task.find("readonly") != std::string::npos;
}

bool is_readme(const std::string& path) {
    const std::string name = lowercase(std::filesystem::path(path).filename().string());
    return name.rfind("readme", 0) == 0;
}

bool parse_positive_count(const std::string& text, int& value) {
    if (text.empty() || text.size() > 6 ||
        !std::all_of(text.begin(), text.end(),
                     [](const unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }
    value = std::stoi(text);
    return value > 0;
}

}  // namespace

ExpectationSet infer_expectations(const protocol::Scenario& scenario) {
    ExpectationSet expectations;
    const std::string task = lowercase(scenario.task_description);

    for (const auto& file : scenario.files) {
        if (ends_with(file.path, ".sh") || file.content.rfind("#!", 0) == 0) {
            add_unique(expectations.executable, file.path);
        }
        if (is_readme(file.path) && mentions_read_only(task)) {
            add_unique(expectations.read_only, file.path);
        }
    }

    const std::regex vcs_words("\\b(git|commit|commits|committed)\\b", std::regex::icase);
    const std::regex second_commit(
        "second commit|two commits|2 commits|another commit|additional commit",
        std::regex::icase);
    const std::string metadata_text = scenario.metadata.dump();
    if (std::regex_search(scenario.task_description, vcs_words) ||
        std::regex_search(metadata_text, vcs_words)) {
        expectations.version_control = true;
    }

    int explicit_commits = 0;
    for (const auto& rule : scenario.rules) {
        if (rule.kind == RuleKind::Permission && !rule.target.empty()) {
            const std::string expected = lowercase(rule.expected);
            if (expected == "executable") {
                add_unique(expectations.executable, rule.target);
            } else if (expected == "read_only" || expected == "readonly" ||
                       expected == "read-only") {
                add_unique(expectations.read_only, rule.target);
            }
        }
        if (rule.kind == RuleKind::Git) {
            expectations.version_control = true;
            int count = 0;
            if (parse_positive_count(rule.expected, count)) {
                explicit_commits = count;
            }
        }
    }

    if (expectations.version_control) {
        if (explicit_commits > 0) {
            expectations.min_commits = explicit_commits;
        } else if (std::regex_search(scenario.task_description, second_commit)) {
            expectations.min_commits = 2;
        } else {
            expectations.min_commits = 1;
        }
    }
    return expectations;
}

}  // namespace shellbench::verifier
