#pragma once

#include <cstddef>
#include "core/config/episode_config.hpp"
#include "protocol/command_batch.hpp"
#include "protocol/execution_contract.hpp"
#include "protocol/outcome_contract.hpp"
#include "protocol/scenario.hpp"
#include "protocol/verification_contract.hpp"
#include "reward/reward_calculator.hpp"

namespace shellbench::reward {

class OutcomeAggregator {
public:
    explicit OutcomeAggregator(std::size_t static_check_veto_ceiling = 10,
                               RewardCalculator calculator = RewardCalculator{});

    // Tests, then pattern rules, then permission and version-control
    // expectations decide. Static-check findings only veto above the ceiling.
    // When none of those applied, the baseline diff decides alone.
    bool decide_success(const protocol::VerificationResults& results) const;

    protocol::Outcome aggregate(const protocol::Scenario& scenario,
                                const protocol::CommandBatch& batch,
                                const protocol::ExecutionResult& execution,
                                const protocol::VerificationResults& results,
                                const protocol::TestResult* tests_before = nullptr) const;

private:
    std::size_t static_check_veto_ceiling_;
    RewardCalculator calculator_;
};

}  // namespace shellbench::reward
