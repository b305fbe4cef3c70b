#include <chrono>
#include <fstream>
#include <iostream>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/config/episode_config.hpp"
#include "core/config/episode_id.hpp"
#include "core/errors/bench_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/scenario_codec.hpp"
#include "report/outcome_writer.hpp"
#include "runtime/episode_runner.hpp"

namespace {

void log_error(const std::string& context, const shellbench::core::errors::BenchError& err) {
    LOG_ERROR(context + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Draw an episode ID from a locally seeded generator
    std::random_device seed_source;
    std::mt19937 gen(seed_source());
    const std::string episode_id = shellbench::core::config::generate_episode_id(gen);

    // 2. Register the episode ID with the global logger
    shellbench::core::logging::Logger::get().set_episode_id(episode_id);

    // 3. Parse CLI input and return normalized input errors
    auto parsed = shellbench::app::cli::parse_and_validate(argc, argv);
    if (shellbench::core::errors::is_error(parsed)) {
        log_error("Input error", shellbench::core::errors::get_error(parsed));
        return 2;
    }
    const auto& req = shellbench::core::errors::get_value(parsed);
    if (req.verbose) {
        shellbench::core::logging::Logger::get().set_min_level(
            shellbench::core::logging::LogLevel::DEBUG);
    }

    // 4. Load the scenario record and the raw action
    auto loaded = shellbench::protocol::load_scenario_file(req.scenario_file);
    if (shellbench::core::errors::is_error(loaded)) {
        log_error("Scenario error", shellbench::core::errors::get_error(loaded));
        return 2;
    }
    const auto& scenario = shellbench::core::errors::get_value(loaded);

    std::ifstream action_in(req.action_file);
    if (!action_in.is_open()) {
        LOG_ERROR("Input error [action_open_failed]: unable to open " +
                  req.action_file.string());
        return 2;
    }
    std::ostringstream action_text;
    action_text << action_in.rdbuf();
    // Unparseable text is handed over as a string so the validator reports it.
    nlohmann::json action = nlohmann::json::parse(action_text.str(), nullptr, false);
    if (action.is_discarded()) {
        action = action_text.str();
    }

    std::optional<shellbench::report::OutcomeWriter> writer;
    if (req.report_file) {
        writer.emplace(req.report_file.value());
        auto written = writer->write_request(episode_id, scenario, action);
        if (shellbench::core::errors::is_error(written)) {
            log_error("Failed to write report", shellbench::core::errors::get_error(written));
            return 6;
        }
    }

    // 5. Run the episode
    shellbench::core::config::EpisodeConfig config;
    config.command_timeout = std::chrono::seconds(req.timeout_sec);
    config.max_commands = req.max_commands;
    config.measure_regressions = req.measure_regressions;

    LOG_INFO("Evaluating scenario: " + req.scenario_file.string());
    const shellbench::runtime::EpisodeRunner runner(config);
    auto episode = runner.run(scenario, action, episode_id);
    if (shellbench::core::errors::is_error(episode)) {
        const auto& err = shellbench::core::errors::get_error(episode);
        log_error("Episode aborted", err);
        if (writer) {
            auto written = writer->write_fault(episode_id, err);
            if (shellbench::core::errors::is_error(written)) {
                log_error("Failed to write report",
                          shellbench::core::errors::get_error(written));
                return 6;
            }
        }
        nlohmann::json fault;
        fault["episode_id"] = episode_id;
        fault["fault"] = shellbench::report::to_json(err);
        std::cout << fault.dump(2) << std::endl;
        return 3;
    }

    const auto& report = shellbench::core::errors::get_value(episode);
    if (writer) {
        auto written = writer->write_observation(episode_id, report.observation);
        if (!shellbench::core::errors::is_error(written)) {
            written = writer->write_execution(episode_id, report.batch, report.execution,
                                              report.history);
        }
        if (!shellbench::core::errors::is_error(written)) {
            written = writer->write_verification(episode_id, report.verification);
        }
        if (!shellbench::core::errors::is_error(written)) {
            written = writer->write_outcome(episode_id, report.outcome);
        }
        if (shellbench::core::errors::is_error(written)) {
            log_error("Failed to write report", shellbench::core::errors::get_error(written));
            return 6;
        }
        LOG_INFO("Report: " + writer->report_path().string());
    }

    nlohmann::json summary = shellbench::report::to_json(report.outcome);
    summary["episode_id"] = episode_id;
    std::cout << summary.dump(2) << std::endl;
    return report.outcome.success ? 0 : 1;
}
