#include "verifier/verifier.hpp"

#include <sys/stat.h>
#include "verifier/expectations.hpp"

namespace shellbench::verifier {

using protocol::PermissionCheck;
using protocol::PermissionResult;

namespace {

PermissionCheck check_mode(const VerifierContext& context, const std::string& path,
                           const std::string& expectation) {
    PermissionCheck check{path, expectation, false, ""};
    const auto resolved = resolve_target(context, path);
    struct stat info {};
    if (!resolved || ::stat(resolved->c_str(), &info) != 0) {
        check.detail = "missing";
        return check;
    }

    if (expectation == "executable") {
        check.met = (info.st_mode & S_IXUSR) != 0;
        check.detail = check.met ? "owner execute bit set" : "owner execute bit not set";
    } else {
        check.met = (info.st_mode & (S_IWUSR | S_IWGRP | S_IWOTH)) == 0;
        check.detail = check.met ? "no write bits" : "writable";
    }
    return check;
}

}  // namespace

std::optional<protocol::VerifierResult> PermissionVerifier::verify(
    const VerifierContext& context) const {
    const ExpectationSet expectations = infer_expectations(context.scenario);

    PermissionResult result;
    result.has_expectations = expectations.has_permission_expectations();
    result.success = true;
    for (const auto& path : expectations.executable) {
        result.checks.push_back(check_mode(context, path, "executable"));
    }
    for (const auto& path : expectations.read_only) {
        result.checks.push_back(check_mode(context, path, "read_only"));
    }
    for (const auto& check : result.checks) {
        result.success = result.success && check.met;
    }
    return result;
}

}  // namespace shellbench::verifier
