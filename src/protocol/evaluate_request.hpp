#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>

namespace shellbench::protocol {

    // Validated CLI input for evaluating one episode.
    struct EvaluateRequest {
        std::filesystem::path scenario_file;
        std::filesystem::path action_file;
        std::optional<std::filesystem::path> report_file;
        uint32_t timeout_sec = 30;
        uint32_t max_commands = 50;
        bool measure_regressions = false;
        bool verbose = false;
    };

} // namespace shellbench::protocol
