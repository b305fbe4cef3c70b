#pragma once

#include <cstddef>
#include "protocol/outcome_contract.hpp"
#include "protocol/verification_contract.hpp"

namespace shellbench::reward {

struct RewardWeights {
    double test = 0.7;
    double static_check = 0.2;
    double pattern = 0.1;
    double permission = 0.1;
    double diff_secondary = 0.05;
    double time_penalty = 0.1;
    double regression_penalty = 0.3;
};

class RewardCalculator {
public:
    explicit RewardCalculator(RewardWeights weights = {});

    // Fills every field of the breakdown except efficiency_score.
    // `tests_before` is the suite result on the untouched scenario, if measured.
    protocol::RewardBreakdown calculate(const protocol::VerificationResults& results,
                                        double actual_time, double estimated_time,
                                        const protocol::TestResult* tests_before = nullptr) const;

    // Clipped product of the base reward and both penalty factors.
    double total(const protocol::RewardBreakdown& breakdown) const;

    static double time_score(double actual_time, double estimated_time);
    static double regression_score(const protocol::TestResult* before,
                                   const protocol::TestResult* after);

    // Informational: rewards finishing within the expected command count.
    static double efficiency_score(const protocol::VerificationResults& results,
                                   int expected_commands, std::size_t commands_used);

private:
    RewardWeights weights_;
};

}  // namespace shellbench::reward
