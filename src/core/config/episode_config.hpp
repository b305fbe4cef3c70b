#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace shellbench::core::config {

// Flavor of the host's stream editor; decides how `sed -i` is spelled.
enum class HostPlatform {
    Gnu,
    Bsd
};

inline HostPlatform detect_host_platform() {
#if defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || \
    defined(__NetBSD__)
    return HostPlatform::Bsd;
#else
    return HostPlatform::Gnu;
#endif
}

// Caps applied to every sandboxed command where the host supports them.
// A zero value leaves that limit untouched.
struct ResourceLimits {
    std::uint64_t address_space_bytes = 512ull * 1024 * 1024;
    std::uint64_t max_processes = 50;
    std::uint64_t max_file_size_bytes = 100ull * 1024 * 1024;
    std::uint64_t max_open_files = 256;
};

struct EpisodeConfig {
    std::chrono::milliseconds command_timeout{30000};
    std::size_t max_commands = 50;
    std::size_t max_output_bytes = 100000;
    ResourceLimits resource_limits;

    std::chrono::milliseconds verifier_timeout{30000};
    std::size_t static_check_veto_ceiling = 10;

    // Runs the test verifier on the untouched sandbox first so regressions
    // can be scored.
    bool measure_regressions = false;

    HostPlatform host_platform = detect_host_platform();
};

}  // namespace shellbench::core::config
