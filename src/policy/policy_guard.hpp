#pragma once

#include <filesystem>
#include "core/errors/bench_errors.hpp"

namespace shellbench::policy {

class PolicyGuard {
public:
    // Resolves `target_path` (relative paths are taken against `base`, which
    // defaults to the root) and fails unless the result stays under
    // `sandbox_root`. The target itself does not need to exist.
    core::errors::Result<std::filesystem::path> resolve_in_root(
        const std::filesystem::path& sandbox_root,
        const std::filesystem::path& target_path,
        const std::filesystem::path& base = {}) const;

    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
};

}  // namespace shellbench::policy
