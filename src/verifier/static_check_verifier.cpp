#include "verifier/verifier.hpp"

#include <sstream>
#include <system_error>

namespace shellbench::verifier {

using protocol::RuleKind;
using protocol::StaticCheckResult;

namespace {

int count_non_empty_lines(const std::string& text) {
    std::istringstream in(text);
    std::string line;
    int count = 0;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") != std::string::npos) {
            ++count;
        }
    }
    return count;
}

StaticCheckResult skipped(const std::string& target, const std::string& reason) {
    StaticCheckResult result;
    result.success = true;
    result.skipped = true;
    result.target = target;
    result.error = reason;
    return result;
}

}  // namespace

std::optional<std::string> StaticCheckVerifier::primary_file(
    const protocol::Scenario& scenario) {
    for (const auto& rule : scenario.rules) {
        if (rule.kind == RuleKind::Lint && !rule.target.empty()) {
            return rule.target;
        }
    }
    for (const auto& file : scenario.files) {
        if (!file.is_test) {
            return file.path;
        }
    }
    return std::nullopt;
}

std::optional<protocol::VerifierResult> StaticCheckVerifier::verify(
    const VerifierContext& context) const {
    const auto target = primary_file(context.scenario);
    if (!target) {
        return std::nullopt;
    }

    const std::string& language = context.scenario.language;
    std::vector<std::string> argv;
    if (language == "python") {
        argv = {"flake8", *target, "--max-line-length=100", "--ignore=E501,W503,E203"};
    } else if (language == "javascript") {
        argv = {"node", "--check", *target};
    } else {
        return skipped(*target, "No static checker for language: " + language);
    }

    if (!sandbox::find_executable(argv.front(), context.environment)) {
        return skipped(*target, argv.front() + " not installed");
    }

    StaticCheckResult result;
    result.target = *target;
    const auto resolved = resolve_target(context, *target);
    std::error_code ec;
    if (!resolved || !std::filesystem::is_regular_file(*resolved, ec)) {
        result.error = "File not found: " + *target;
        return result;
    }

    auto run = run_tool(context, argv, {{"PYTHONDONTWRITEBYTECODE", "1"}});
    if (core::errors::is_error(run)) {
        result.error = core::errors::get_error(run).message;
        return result;
    }

    const auto& capture = core::errors::get_value(run);
    result.exit_code = capture.exit_code;
    result.output = capture.stdout_text;
    if (capture.timed_out) {
        result.error = "Static check timed out";
        return result;
    }

    if (language == "python") {
        result.error_count = count_non_empty_lines(capture.stdout_text);
        if (capture.exit_code != 0 && result.error_count == 0) {
            result.error = capture.stderr_text.empty()
                               ? "flake8 exited with code " +
                                     std::to_string(capture.exit_code)
                               : capture.stderr_text;
        }
    } else {
        result.error_count = capture.exit_code == 0 ? 0 : 1;
        if (capture.exit_code != 0) {
            result.output += capture.stderr_text;
        }
    }
    result.success = capture.exit_code == 0 && result.error_count == 0;
    return result;
}

}  // namespace shellbench::verifier
