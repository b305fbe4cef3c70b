#include <gtest/gtest.h>
#include "core/errors/bench_errors.hpp"

using namespace shellbench::core::errors;

// A dummy function to simulate a scenario lookup failing
Result<std::string> simulate_load_scenario(bool should_fail) {
    if (should_fail) {
        return BenchError{ErrorCategory::Input, "Scenario not found", "scenario_open_failed"};
    }
    return std::string("scenario record");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_load_scenario(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "scenario record");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_load_scenario(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Input);
    EXPECT_EQ(error.message, "Scenario not found");
    EXPECT_EQ(error.code, "scenario_open_failed");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, DefaultsCodeWhenOmitted) {
    const BenchError error{ErrorCategory::Internal, "boom"};
    EXPECT_EQ(error.code, "unknown_error");
}

TEST(ErrorModelTest, CategoryNames) {
    EXPECT_EQ(to_string(ErrorCategory::Input), "input");
    EXPECT_EQ(to_string(ErrorCategory::Policy), "policy");
    EXPECT_EQ(to_string(ErrorCategory::Security), "security");
    EXPECT_EQ(to_string(ErrorCategory::Execution), "execution");
    EXPECT_EQ(to_string(ErrorCategory::Internal), "internal");
}
