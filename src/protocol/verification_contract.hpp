#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace shellbench::protocol {

enum class VerifierKind {
    Test,
    StaticCheck,
    PatternMatch,
    Permission,
    VersionControl,
    BaselineDiff
};

struct TestResult {
    bool success = false;
    int passed = 0;
    int failed = 0;
    int total = 0;
    int exit_code = -1;
    std::string test_file;
    std::string output;
    std::string error;
};

struct StaticCheckResult {
    bool success = false;
    bool skipped = false;
    int error_count = 0;
    int exit_code = -1;
    std::string target;
    std::string output;
    std::string error;
};

struct PatternRuleResult {
    std::string target;
    std::string pattern;
    bool success = false;
    bool found = false;
    bool used_regex = false;
    bool target_is_directory = false;  // malformed rule, ignored when scoring
    std::string error;
};

struct PatternMatchResult {
    bool success = false;
    std::vector<PatternRuleResult> rules;
};

struct PermissionCheck {
    std::string path;
    std::string expectation;  // "executable" or "read_only"
    bool met = false;
    std::string detail;
};

struct PermissionResult {
    bool success = false;
    bool has_expectations = false;
    std::vector<PermissionCheck> checks;
};

struct VersionControlResult {
    bool success = false;
    bool has_expectations = false;
    bool is_work_tree = false;
    std::string branch;
    int commit_count = 0;
    int required_commits = 0;
    std::string error;
};

struct BaselineDiffResult {
    bool success = false;
    std::vector<std::string> created_files;
    std::vector<std::string> modified_files;
    std::vector<std::string> deleted_files;
    std::vector<std::string> created_directories;
    std::vector<std::string> deleted_directories;
    std::string error;
};

using VerifierResult = std::variant<TestResult, StaticCheckResult,
                                    PatternMatchResult, PermissionResult,
                                    VersionControlResult, BaselineDiffResult>;

inline VerifierKind kind_of(const VerifierResult& result) {
    return static_cast<VerifierKind>(result.index());
}

inline std::string to_string(const VerifierKind kind) {
    switch (kind) {
        case VerifierKind::Test:
            return "test";
        case VerifierKind::StaticCheck:
            return "static_check";
        case VerifierKind::PatternMatch:
            return "pattern_match";
        case VerifierKind::Permission:
            return "permission";
        case VerifierKind::VersionControl:
            return "version_control";
        case VerifierKind::BaselineDiff:
            return "baseline_diff";
        default:
            return "unknown";
    }
}

// Append-only within one episode: a kind can be recorded once.
class VerificationResults {
public:
    bool record(VerifierResult result) {
        const VerifierKind kind = kind_of(result);
        if (contains(kind)) {
            return false;
        }
        entries_.push_back(std::move(result));
        return true;
    }

    bool contains(const VerifierKind kind) const {
        for (const auto& entry : entries_) {
            if (kind_of(entry) == kind) {
                return true;
            }
        }
        return false;
    }

    template <typename T>
    const T* find() const {
        for (const auto& entry : entries_) {
            if (const auto* value = std::get_if<T>(&entry)) {
                return value;
            }
        }
        return nullptr;
    }

    const std::vector<VerifierResult>& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<VerifierResult> entries_;
};

}  // namespace shellbench::protocol
