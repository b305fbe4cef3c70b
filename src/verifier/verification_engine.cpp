#include "verifier/verification_engine.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"
#include "sandbox/environment.hpp"

namespace shellbench::verifier {

VerificationEngine::VerificationEngine(core::config::EpisodeConfig config)
    : config_(std::move(config)) {
    verifiers_.push_back(std::make_unique<BaselineDiffVerifier>());
    verifiers_.push_back(std::make_unique<TestVerifier>());
    verifiers_.push_back(std::make_unique<StaticCheckVerifier>());
    verifiers_.push_back(std::make_unique<PatternMatchVerifier>());
    verifiers_.push_back(std::make_unique<PermissionVerifier>());
    verifiers_.push_back(std::make_unique<VersionControlVerifier>());
}

VerifierContext VerificationEngine::make_context(const std::filesystem::path& root,
                                                 const protocol::Scenario& scenario) const {
    return VerifierContext{root, scenario, sandbox::make_sandbox_environment(root, root),
                           config_.verifier_timeout};
}

protocol::VerificationResults VerificationEngine::verify(
    const std::filesystem::path& root, const protocol::Scenario& scenario) const {
    const VerifierContext context = make_context(root, scenario);
    protocol::VerificationResults results;

    for (const auto& verifier : verifiers_) {
        const std::string name = protocol::to_string(verifier->kind());
        try {
            auto result = verifier->verify(context);
            if (!result) {
                LOG_DEBUG("VerificationEngine: " + name + " not applicable");
                continue;
            }
            results.record(std::move(*result));
        } catch (const std::exception& e) {
            LOG_WARN("VerificationEngine: " + name + " verifier failed: " + e.what());
            results.record(failed_result(verifier->kind(), e.what()));
        }
    }
    return results;
}

std::optional<protocol::TestResult> VerificationEngine::run_tests(
    const std::filesystem::path& root, const protocol::Scenario& scenario) const {
    const VerifierContext context = make_context(root, scenario);
    try {
        auto result = TestVerifier{}.verify(context);
        if (!result) {
            return std::nullopt;
        }
        return std::get<protocol::TestResult>(*result);
    } catch (const std::exception& e) {
        LOG_WARN(std::string("VerificationEngine: baseline test run failed: ") + e.what());
        return protocol::TestResult{};
    }
}

}  // namespace shellbench::verifier
