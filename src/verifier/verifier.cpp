#include "verifier/verifier.hpp"

#include <utility>
#include "policy/policy_guard.hpp"

namespace shellbench::verifier {

using protocol::BaselineDiffResult;
using protocol::PatternMatchResult;
using protocol::PatternRuleResult;
using protocol::PermissionCheck;
using protocol::PermissionResult;
using protocol::StaticCheckResult;
using protocol::TestResult;
using protocol::VerifierKind;
using protocol::VerifierResult;
using protocol::VersionControlResult;

core::errors::Result<sandbox::ProcessCapture> run_tool(
    const VerifierContext& context, std::vector<std::string> argv,
    const sandbox::Environment& extra_environment) {
    sandbox::ProcessRequest request;
    request.argv = std::move(argv);
    request.working_directory = context.root;
    request.environment = context.environment;
    for (const auto& [key, value] : extra_environment) {
        request.environment[key] = value;
    }
    request.timeout = context.timeout;
    return sandbox::run_process(request);
}

VerifierResult failed_result(const VerifierKind kind, const std::string& message) {
    switch (kind) {
        case VerifierKind::Test: {
            TestResult result;
            result.error = message;
            return result;
        }
        case VerifierKind::StaticCheck: {
            StaticCheckResult result;
            result.error = message;
            return result;
        }
        case VerifierKind::PatternMatch: {
            PatternMatchResult result;
            PatternRuleResult rule;
            rule.error = message;
            result.rules.push_back(std::move(rule));
            return result;
        }
        case VerifierKind::Permission: {
            PermissionResult result;
            result.has_expectations = true;
            result.checks.push_back(PermissionCheck{"", "", false, message});
            return result;
        }
        case VerifierKind::VersionControl: {
            VersionControlResult result;
            result.has_expectations = true;
            result.error = message;
            return result;
        }
        case VerifierKind::BaselineDiff:
        default: {
            BaselineDiffResult result;
            result.error = message;
            return result;
        }
    }
}

std::optional<std::filesystem::path> resolve_target(const VerifierContext& context,
                                                    const std::string& relative) {
    if (relative.empty()) {
        return std::nullopt;
    }
    const policy::PolicyGuard guard;
    auto resolved = guard.resolve_in_root(context.root, relative);
    if (core::errors::is_error(resolved)) {
        return std::nullopt;
    }
    return core::errors::get_value(resolved);
}

}  // namespace shellbench::verifier
