#pragma once

#include <chrono>
#include <memory>
#include "core/config/episode_config.hpp"

namespace shellbench::sandbox {

// Applies per-process caps. `apply` runs in the forked child right before
// exec, so implementations must not allocate or log.
class ResourceLimiter {
public:
    virtual ~ResourceLimiter() = default;

    virtual void apply(std::chrono::milliseconds cpu_budget) const noexcept = 0;
    virtual bool supported() const noexcept = 0;
};

class PosixResourceLimiter final : public ResourceLimiter {
public:
    explicit PosixResourceLimiter(core::config::ResourceLimits limits);

    // Each setrlimit is best effort; a failing limit leaves the others in place.
    void apply(std::chrono::milliseconds cpu_budget) const noexcept override;
    bool supported() const noexcept override { return true; }

private:
    core::config::ResourceLimits limits_;
};

class NoopResourceLimiter final : public ResourceLimiter {
public:
    void apply(std::chrono::milliseconds) const noexcept override {}
    bool supported() const noexcept override { return false; }
};

std::unique_ptr<ResourceLimiter> make_platform_resource_limiter(
    const core::config::ResourceLimits& limits);

}  // namespace shellbench::sandbox
