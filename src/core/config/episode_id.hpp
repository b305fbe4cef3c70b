#pragma once
#include <string>
#include <random>
#include <sstream>

namespace shellbench::core::config {

    // Draws an 8-character hex ID prefixed with "ep-" from the caller's generator.
    // The generator is passed in so seeded callers get reproducible IDs.
    inline std::string generate_episode_id(std::mt19937& gen) {
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << "ep-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace shellbench::core::config
