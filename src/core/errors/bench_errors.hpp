#pragma once
#include <string>
#include <variant>

namespace shellbench::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // Malformed action or scenario record
        Policy,     // Command rejected by the safety policy
        Security,   // Sandbox setup refused a path outside its root
        Execution,  // A subprocess could not be started or observed
        Internal    // Filesystem or logic failure inside shellbench
    };

    // The standardized error payload
    struct BenchError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // 2. Propagation strategy: a Result holds either a value of type T or a BenchError.
    template <typename T>
    using Result = std::variant<T, BenchError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<BenchError>(result);
    }

    template <typename T>
    const BenchError& get_error(const Result<T>& result) {
        return std::get<BenchError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Policy:    return "policy";
            case ErrorCategory::Security:  return "security";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace shellbench::core::errors
