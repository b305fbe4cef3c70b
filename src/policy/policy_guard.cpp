#include "policy/policy_guard.hpp"

#include <system_error>

namespace shellbench::policy {

using core::errors::BenchError;
using core::errors::ErrorCategory;

bool PolicyGuard::is_within_root(const std::filesystem::path& root,
                                 const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

core::errors::Result<std::filesystem::path> PolicyGuard::resolve_in_root(
    const std::filesystem::path& sandbox_root,
    const std::filesystem::path& target_path,
    const std::filesystem::path& base) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(sandbox_root, ec) || ec) {
        return BenchError{ErrorCategory::Internal,
                          "Sandbox root is not a directory: " +
                              sandbox_root.string(),
                          "invalid_sandbox_root"};
    }

    const std::filesystem::path canonical_root =
        std::filesystem::canonical(sandbox_root, ec);
    if (ec) {
        return BenchError{ErrorCategory::Internal,
                          "Unable to resolve sandbox root: " +
                              sandbox_root.string(),
                          "invalid_sandbox_root"};
    }

    std::filesystem::path candidate = target_path;
    if (candidate.is_relative()) {
        candidate = (base.empty() ? canonical_root : base) / candidate;
    }

    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(candidate, ec);
    if (ec) {
        return BenchError{ErrorCategory::Security,
                          "Unable to resolve path: " + target_path.string(),
                          "unresolvable_path"};
    }

    if (!is_within_root(canonical_root, canonical_candidate)) {
        return BenchError{ErrorCategory::Security,
                          "Path escapes sandbox root: " + target_path.string(),
                          "path_outside_sandbox"};
    }

    return canonical_candidate;
}

}  // namespace shellbench::policy
