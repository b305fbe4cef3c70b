#include "verifier/verifier.hpp"

#include <fstream>
#include <regex>
#include <sstream>
#include <system_error>

namespace shellbench::verifier {

using protocol::PatternMatchResult;
using protocol::PatternRuleResult;
using protocol::RuleKind;

namespace {

// std::regex recurses once per matched character, so only bounded text is
// handed to it. Larger files are searched line by line and overlong lines
// fall back to a literal search.
constexpr std::size_t kRegexSearchLimit = 4096;

bool search_lines(const std::string& content, const std::regex& pattern,
                  const std::string& literal) {
    std::size_t begin = 0;
    while (begin <= content.size()) {
        std::size_t end = content.find('\n', begin);
        if (end == std::string::npos) {
            end = content.size();
        }
        const std::string line = content.substr(begin, end - begin);
        const bool found = line.size() <= kRegexSearchLimit
                               ? std::regex_search(line, pattern)
                               : line.find(literal) != std::string::npos;
        if (found) {
            return true;
        }
        begin = end + 1;
    }
    return false;
}

void check_rule(const VerifierContext& context, PatternRuleResult& rule) {
    const auto resolved = resolve_target(context, rule.target);
    std::error_code ec;
    if (!resolved || !std::filesystem::exists(*resolved, ec)) {
        rule.error = "Target file not found: " + rule.target;
        return;
    }
    if (std::filesystem::is_directory(*resolved, ec)) {
        rule.target_is_directory = true;
        rule.error = "Target is a directory: " + rule.target;
        return;
    }

    std::ifstream in(*resolved, std::ios::binary);
    if (!in.is_open()) {
        rule.error = "Unable to read target: " + rule.target;
        return;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    const std::string content = buffer.str();

    try {
        const std::regex pattern(rule.pattern, std::regex::ECMAScript);
        rule.used_regex = true;
        rule.found = content.size() <= kRegexSearchLimit
                         ? std::regex_search(content, pattern)
                         : search_lines(content, pattern, rule.pattern);
    } catch (const std::regex_error&) {
        rule.used_regex = false;
        rule.found = content.find(rule.pattern) != std::string::npos;
    }
    rule.success = rule.found;
    if (!rule.found) {
        rule.error = "Pattern not found in " + rule.target;
    }
}

}  // namespace

std::optional<protocol::VerifierResult> PatternMatchVerifier::verify(
    const VerifierContext& context) const {
    PatternMatchResult result;
    for (const auto& rule : context.scenario.rules) {
        if (rule.kind != RuleKind::TextMatch || rule.expected.empty()) {
            continue;
        }
        PatternRuleResult checked;
        checked.target = rule.target;
        checked.pattern = rule.expected;
        check_rule(context, checked);
        result.rules.push_back(std::move(checked));
    }
    if (result.rules.empty()) {
        return std::nullopt;
    }

    bool any_valid = false;
    bool all_pass = true;
    for (const auto& rule : result.rules) {
        if (rule.target_is_directory) {
            continue;
        }
        any_valid = true;
        all_pass = all_pass && rule.success;
    }
    result.success = any_valid && all_pass;
    return result;
}

}  // namespace shellbench::verifier
