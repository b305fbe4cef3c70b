#pragma once

#include <string>
#include <vector>

namespace shellbench::protocol {

struct RewardComponent {
    std::string name;
    double score = 0.0;
    double weight = 0.0;
};

struct RewardBreakdown {
    double base_reward = 0.0;
    double time_score = 1.0;
    double regression_score = 1.0;
    double time_penalty_weight = 0.1;
    double regression_penalty_weight = 0.3;
    double efficiency_score = 1.0;
    double actual_time = 0.0;
    double estimated_time = 0.0;
    std::vector<RewardComponent> components;
};

struct Outcome {
    bool success = false;
    double total_reward = 0.0;
    RewardBreakdown breakdown;
};

}  // namespace shellbench::protocol
