#include "runtime/observation.hpp"

#include <sstream>

namespace shellbench::runtime {

using protocol::Difficulty;

namespace {

std::string join_lines(const std::vector<std::string>& lines) {
    std::string joined;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            joined += "\n";
        }
        joined += lines[i];
    }
    return joined;
}

}  // namespace

Observation build_observation(const protocol::Scenario& scenario) {
    Observation observation;
    observation.task_description = scenario.task_description;
    observation.file_tree = render_file_tree(scenario.files);
    observation.cli_history = join_lines(
        scenario.cli_history.empty() ? generate_initial_history(scenario)
                                     : scenario.cli_history);
    return observation;
}

std::string render_file_tree(const std::vector<protocol::ScenarioFile>& files) {
    std::string tree = "Files:\n";
    for (const auto& file : files) {
        tree += "  - " + file.path + " (" + std::to_string(file.content.size()) + " bytes)\n";
    }
    return tree;
}

std::vector<std::string> generate_initial_history(const protocol::Scenario& scenario) {
    std::vector<std::string> history;
    if (scenario.difficulty == Difficulty::Easy) {
        history.push_back("$ ls");
        std::string listing;
        for (const auto& file : scenario.files) {
            listing += (listing.empty() ? "" : " ") + file.path;
        }
        history.push_back(listing);
        return history;
    }

    history.push_back("$ ls -la");
    for (const auto& file : scenario.files) {
        history.push_back("-rw------- 1 user user " + std::to_string(file.content.size()) +
                          " " + file.path);
    }

    if (scenario.difficulty == Difficulty::Hard ||
        scenario.difficulty == Difficulty::VeryHard) {
        const protocol::ScenarioFile* test_file = nullptr;
        for (const auto& file : scenario.files) {
            if (file.is_test) {
                test_file = &file;
                break;
            }
        }
        if (test_file != nullptr && scenario.language == "javascript") {
            history.push_back("$ node " + test_file->path);
            history.push_back("Test failed: ...");
        } else if (test_file != nullptr) {
            history.push_back("$ pytest -v");
            history.push_back(test_file->path + "::test_* FAILED");
            history.push_back("Some tests are failing...");
        }
    }
    return history;
}

std::vector<std::string> format_command_output(const std::string& command,
                                               const std::string& output,
                                               const std::size_t max_lines) {
    std::vector<std::string> history = {"$ " + command};

    std::vector<std::string> lines;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    if (!output.empty() && output.back() == '\n') {
        lines.emplace_back();
    }
    if (output.empty()) {
        lines.emplace_back();
    }

    if (lines.size() > max_lines) {
        history.insert(history.end(), lines.begin(),
                       lines.begin() + static_cast<std::ptrdiff_t>(max_lines));
        history.push_back("... (" + std::to_string(lines.size() - max_lines) +
                          " more lines)");
    } else {
        history.insert(history.end(), lines.begin(), lines.end());
    }
    history.emplace_back();
    return history;
}

std::vector<std::string> render_transcript(const protocol::ExecutionResult& execution) {
    std::vector<std::string> transcript;
    for (const auto& outcome : execution.results) {
        const std::string shown =
            outcome.success ? outcome.output : "Error: " + outcome.error;
        const auto block = format_command_output(outcome.command, shown);
        transcript.insert(transcript.end(), block.begin(), block.end());
    }
    return transcript;
}

}  // namespace shellbench::runtime
