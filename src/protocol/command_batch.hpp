#pragma once
#include <string>
#include <vector>

namespace shellbench::protocol {

    // A validated action: the only form in which agent commands reach the sandbox.
    struct CommandBatch {
        std::vector<std::string> commands;
        double time_estimate = 0.0;   // seconds, always > 0 once validated
    };

} // namespace shellbench::protocol
