#pragma once

#include <string>
#include <vector>

namespace shellbench::protocol {

enum class CommandFault {
    None,
    Timeout,
    NonZeroExit,
    ResourceLimitExceeded,
    NavigationDenied,
    SpawnFailed
};

struct CommandOutcome {
    std::string command;
    bool success = false;
    std::string output;
    std::string error;
    CommandFault fault = CommandFault::None;
    int exit_code = 0;
    double elapsed_seconds = 0.0;
};

struct ExecutionResult {
    std::vector<CommandOutcome> results;
    double total_time = 0.0;
    bool all_successful = true;
    std::vector<std::string> transcript;
};

inline std::string to_string(const CommandFault fault) {
    switch (fault) {
        case CommandFault::None:
            return "none";
        case CommandFault::Timeout:
            return "timeout";
        case CommandFault::NonZeroExit:
            return "non_zero_exit";
        case CommandFault::ResourceLimitExceeded:
            return "resource_limit_exceeded";
        case CommandFault::NavigationDenied:
            return "navigation_denied";
        case CommandFault::SpawnFailed:
            return "spawn_failed";
        default:
            return "unknown";
    }
}

}  // namespace shellbench::protocol
