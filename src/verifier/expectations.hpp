#pragma once

#include <string>
#include <vector>
#include "protocol/scenario.hpp"

namespace shellbench::verifier {

// What the finished sandbox is expected to look like beyond test results.
// Paths are relative to the sandbox root.
struct ExpectationSet {
    std::vector<std::string> executable;
    std::vector<std::string> read_only;
    bool version_control = false;
    int min_commits = 0;

    bool has_permission_expectations() const {
        return !executable.empty() || !read_only.empty();
    }
};

// Pure function of the scenario; touches no files.
ExpectationSet infer_expectations(const protocol::Scenario& scenario);

}  // namespace shellbench::verifier
