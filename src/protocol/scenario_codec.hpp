#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/bench_errors.hpp"
#include "protocol/scenario.hpp"

namespace shellbench::protocol {

// Decodes a stored scenario record (the dataset format used by the scenario
// generators) into a Scenario.
core::errors::Result<Scenario> parse_scenario(const nlohmann::json& record);

core::errors::Result<Scenario> load_scenario_file(const std::filesystem::path& path);

nlohmann::json scenario_to_json(const Scenario& scenario);

core::errors::Result<Difficulty> parse_difficulty(const std::string& text);
core::errors::Result<RuleKind> parse_rule_kind(const std::string& text);

}  // namespace shellbench::protocol
