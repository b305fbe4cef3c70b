#pragma once

#include <filesystem>
#include <memory>
#include <vector>
#include "core/config/episode_config.hpp"
#include "protocol/scenario.hpp"
#include "protocol/verification_contract.hpp"
#include "verifier/verifier.hpp"

namespace shellbench::verifier {

class VerificationEngine {
public:
    explicit VerificationEngine(core::config::EpisodeConfig config = {});

    // Runs the baseline diff first, then test, static check, pattern,
    // permission and version control. A verifier that throws yields a failed
    // result of its own kind; the others still run.
    protocol::VerificationResults verify(const std::filesystem::path& root,
                                         const protocol::Scenario& scenario) const;

    // Test verifier alone, used to measure the suite before commands run.
    std::optional<protocol::TestResult> run_tests(const std::filesystem::path& root,
                                                  const protocol::Scenario& scenario) const;

private:
    VerifierContext make_context(const std::filesystem::path& root,
                                 const protocol::Scenario& scenario) const;

    core::config::EpisodeConfig config_;
    std::vector<std::unique_ptr<Verifier>> verifiers_;
};

}  // namespace shellbench::verifier
