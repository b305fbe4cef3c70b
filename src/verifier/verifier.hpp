#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/bench_errors.hpp"
#include "protocol/scenario.hpp"
#include "protocol/verification_contract.hpp"
#include "sandbox/environment.hpp"
#include "sandbox/process_runner.hpp"

namespace shellbench::verifier {

struct VerifierContext {
    std::filesystem::path root;
    const protocol::Scenario& scenario;
    sandbox::Environment environment;
    std::chrono::milliseconds timeout{30000};
};

class Verifier {
public:
    virtual ~Verifier() = default;

    virtual protocol::VerifierKind kind() const = 0;

    // Empty when the scenario gives this verifier nothing to check.
    virtual std::optional<protocol::VerifierResult> verify(
        const VerifierContext& context) const = 0;
};

class TestVerifier final : public Verifier {
public:
    protocol::VerifierKind kind() const override { return protocol::VerifierKind::Test; }
    std::optional<protocol::VerifierResult> verify(
        const VerifierContext& context) const override;

    // Target of the first test rule, else the first file flagged as a test.
    static std::optional<std::string> designated_test_file(
        const protocol::Scenario& scenario);
};

class StaticCheckVerifier final : public Verifier {
public:
    protocol::VerifierKind kind() const override {
        return protocol::VerifierKind::StaticCheck;
    }
    std::optional<protocol::VerifierResult> verify(
        const VerifierContext& context) const override;

    // Target of the first lint rule, else the first non-test file.
    static std::optional<std::string> primary_file(const protocol::Scenario& scenario);
};

class PatternMatchVerifier final : public Verifier {
public:
    protocol::VerifierKind kind() const override {
        return protocol::VerifierKind::PatternMatch;
    }
    std::optional<protocol::VerifierResult> verify(
        const VerifierContext& context) const override;
};

class PermissionVerifier final : public Verifier {
public:
    protocol::VerifierKind kind() const override {
        return protocol::VerifierKind::Permission;
    }
    std::optional<protocol::VerifierResult> verify(
        const VerifierContext& context) const override;
};

class VersionControlVerifier final : public Verifier {
public:
    protocol::VerifierKind kind() const override {
        return protocol::VerifierKind::VersionControl;
    }
    std::optional<protocol::VerifierResult> verify(
        const VerifierContext& context) const override;
};

class BaselineDiffVerifier final : public Verifier {
public:
    protocol::VerifierKind kind() const override {
        return protocol::VerifierKind::BaselineDiff;
    }
    std::optional<protocol::VerifierResult> verify(
        const VerifierContext& context) const override;
};

// Runs an external checker inside the sandbox root without resource caps.
core::errors::Result<sandbox::ProcessCapture> run_tool(
    const VerifierContext& context, std::vector<std::string> argv,
    const sandbox::Environment& extra_environment = {});

// Result of `kind` marked as failed with `message`.
protocol::VerifierResult failed_result(protocol::VerifierKind kind,
                                       const std::string& message);

// Resolves a scenario-relative path; empty when it leaves the root.
std::optional<std::filesystem::path> resolve_target(const VerifierContext& context,
                                                    const std::string& relative);

}  // namespace shellbench::verifier
