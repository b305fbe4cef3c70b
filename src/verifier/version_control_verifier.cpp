#include "verifier/verifier.hpp"

#include <system_error>
#include "verifier/expectations.hpp"

namespace shellbench::verifier {

using protocol::VersionControlResult;

namespace {

std::string trim_output(const std::string& text) {
    const auto end = text.find_last_not_of(" \t\r\n");
    return end == std::string::npos ? "" : text.substr(0, end + 1);
}

}  // namespace

std::optional<protocol::VerifierResult> VersionControlVerifier::verify(
    const VerifierContext& context) const {
    const ExpectationSet expectations = infer_expectations(context.scenario);

    VersionControlResult result;
    result.has_expectations = expectations.version_control;
    result.required_commits = expectations.min_commits;
    if (!result.has_expectations) {
        result.success = true;
        return result;
    }

    if (!sandbox::find_executable("git", context.environment)) {
        result.error = "git not found";
        return result;
    }

    // Keep discovery from climbing into a repository that encloses the sandbox.
    const sandbox::Environment git_environment = {
        {"HOME", context.root.string()},
        {"GIT_CEILING_DIRECTORIES", context.root.parent_path().string()}};

    auto toplevel = run_tool(context, {"git", "rev-parse", "--show-toplevel"},
                             git_environment);
    if (core::errors::is_error(toplevel)) {
        result.error = core::errors::get_error(toplevel).message;
        return result;
    }
    const auto& toplevel_capture = core::errors::get_value(toplevel);
    if (toplevel_capture.exit_code != 0) {
        result.error = "Not a git repository";
        return result;
    }

    std::error_code ec;
    const auto reported = std::filesystem::weakly_canonical(
        trim_output(toplevel_capture.stdout_text), ec);
    if (ec || reported != context.root) {
        result.error = "Sandbox root is not the repository top level";
        return result;
    }
    result.is_work_tree = true;

    auto branch = run_tool(context, {"git", "rev-parse", "--abbrev-ref", "HEAD"},
                           git_environment);
    if (!core::errors::is_error(branch) &&
        core::errors::get_value(branch).exit_code == 0) {
        result.branch = trim_output(core::errors::get_value(branch).stdout_text);
    }

    auto count = run_tool(context, {"git", "rev-list", "--count", "HEAD"},
                          git_environment);
    if (!core::errors::is_error(count) && core::errors::get_value(count).exit_code == 0) {
        const std::string text = trim_output(core::errors::get_value(count).stdout_text);
        result.commit_count = text.empty() ? 0 : std::stoi(text);
    }

    result.success = result.commit_count >= result.required_commits;
    if (!result.success) {
        result.error = "Expected at least " + std::to_string(result.required_commits) +
                       " commits, found " + std::to_string(result.commit_count);
    }
    return result;
}

}  // namespace shellbench::verifier
