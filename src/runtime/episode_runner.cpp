#include "runtime/episode_runner.hpp"

#include <memory>
#include <utility>
#include "core/logging/logger.hpp"
#include "policy/command_validator.hpp"
#include "reward/outcome_aggregator.hpp"
#include "sandbox/sandbox.hpp"
#include "verifier/verification_engine.hpp"

namespace shellbench::runtime {

using protocol::CommandBatch;
using protocol::Scenario;

EpisodeRunner::EpisodeRunner(core::config::EpisodeConfig config,
                             std::filesystem::path sandbox_parent)
    : config_(std::move(config)), sandbox_parent_(std::move(sandbox_parent)) {}

core::errors::Result<EpisodeReport> EpisodeRunner::run(const Scenario& scenario,
                                                       const nlohmann::json& action,
                                                       const std::string& episode_id) const {
    const policy::CommandValidator validator(config_.host_platform, config_.max_commands);
    auto batch = validator.parse_action(action);
    if (core::errors::is_error(batch)) {
        return core::errors::get_error(batch);
    }
    return run_batch(scenario, core::errors::get_value(batch), episode_id);
}

core::errors::Result<EpisodeReport> EpisodeRunner::run_batch(
    const Scenario& scenario, const CommandBatch& batch,
    const std::string& episode_id) const {
    EpisodeReport report;
    report.episode_id = episode_id;
    report.observation = build_observation(scenario);
    report.batch = batch;

    sandbox::SandboxOptions options = sandbox::sandbox_options_from(config_);
    options.temp_directory = sandbox_parent_;
    const verifier::VerificationEngine engine(config_);

    if (config_.measure_regressions) {
        auto baseline = sandbox::Sandbox::create(scenario.files, options);
        if (core::errors::is_error(baseline)) {
            return core::errors::get_error(baseline);
        }
        const auto& baseline_sandbox = core::errors::get_value(baseline);
        report.tests_before = engine.run_tests(baseline_sandbox->root(), scenario);
    }

    auto created = sandbox::Sandbox::create(scenario.files, options);
    if (core::errors::is_error(created)) {
        return core::errors::get_error(created);
    }
    const std::unique_ptr<sandbox::Sandbox>& sandbox = core::errors::get_value(created);

    LOG_INFO("EpisodeRunner: executing " + std::to_string(batch.commands.size()) +
             " commands");
    report.execution = sandbox->execute_commands(batch.commands);
    report.history = render_transcript(report.execution);
    report.verification = engine.verify(sandbox->root(), scenario);

    const reward::OutcomeAggregator aggregator(config_.static_check_veto_ceiling);
    report.outcome = aggregator.aggregate(
        scenario, batch, report.execution, report.verification,
        report.tests_before ? &*report.tests_before : nullptr);
    return report;
}

}  // namespace shellbench::runtime
