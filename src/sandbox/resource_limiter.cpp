#include "sandbox/resource_limiter.hpp"

#if defined(__unix__) || defined(__APPLE__)
#include <sys/resource.h>
#define SHELLBENCH_HAS_RLIMIT 1
#endif

namespace shellbench::sandbox {

namespace {

#ifdef SHELLBENCH_HAS_RLIMIT
void set_limit(const int resource, const rlim_t soft, const rlim_t hard) noexcept {
    rlimit limit{};
    limit.rlim_cur = soft;
    limit.rlim_max = hard;
    static_cast<void>(setrlimit(resource, &limit));
}
#endif

}  // namespace

PosixResourceLimiter::PosixResourceLimiter(core::config::ResourceLimits limits)
    : limits_(limits) {}

void PosixResourceLimiter::apply(const std::chrono::milliseconds cpu_budget) const noexcept {
#ifdef SHELLBENCH_HAS_RLIMIT
    if (cpu_budget.count() > 0) {
        const auto seconds = static_cast<rlim_t>((cpu_budget.count() + 999) / 1000);
        set_limit(RLIMIT_CPU, seconds, seconds + 1);
    }
    if (limits_.address_space_bytes > 0) {
        const auto bytes = static_cast<rlim_t>(limits_.address_space_bytes);
        set_limit(RLIMIT_AS, bytes, bytes);
    }
#ifdef RLIMIT_NPROC
    if (limits_.max_processes > 0) {
        const auto count = static_cast<rlim_t>(limits_.max_processes);
        set_limit(RLIMIT_NPROC, count, count);
    }
#endif
    if (limits_.max_file_size_bytes > 0) {
        const auto bytes = static_cast<rlim_t>(limits_.max_file_size_bytes);
        set_limit(RLIMIT_FSIZE, bytes, bytes);
    }
    if (limits_.max_open_files > 0) {
        const auto count = static_cast<rlim_t>(limits_.max_open_files);
        set_limit(RLIMIT_NOFILE, count, count);
    }
#else
    static_cast<void>(cpu_budget);
#endif
}

std::unique_ptr<ResourceLimiter> make_platform_resource_limiter(
    const core::config::ResourceLimits& limits) {
#ifdef SHELLBENCH_HAS_RLIMIT
    return std::make_unique<PosixResourceLimiter>(limits);
#else
    static_cast<void>(limits);
    return std::make_unique<NoopResourceLimiter>();
#endif
}

}  // namespace shellbench::sandbox
