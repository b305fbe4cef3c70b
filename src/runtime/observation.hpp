#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "protocol/execution_contract.hpp"
#include "protocol/scenario.hpp"

namespace shellbench::runtime {

// What the agent sees before proposing its command batch.
struct Observation {
    std::string task_description;
    std::string file_tree;
    std::string cli_history;
};

Observation build_observation(const protocol::Scenario& scenario);

// "Files:\n  - path (N bytes)\n" for every scenario file.
std::string render_file_tree(const std::vector<protocol::ScenarioFile>& files);

// Simulated shell session shown to the agent when the scenario has none.
std::vector<std::string> generate_initial_history(const protocol::Scenario& scenario);

std::vector<std::string> format_command_output(const std::string& command,
                                               const std::string& output,
                                               std::size_t max_lines = 20);

// Transcript of a finished batch, one history block per command.
std::vector<std::string> render_transcript(const protocol::ExecutionResult& execution);

}  // namespace shellbench::runtime
