#include <chrono>
#include <string>
#include <gtest/gtest.h>
#include "core/errors/bench_errors.hpp"
#include "sandbox/environment.hpp"
#include "sandbox/process_runner.hpp"
#include "temp_workspace.hpp"

namespace {

using shellbench::core::errors::get_value;
using shellbench::core::errors::is_error;
using shellbench::sandbox::find_executable;
using shellbench::sandbox::make_sandbox_environment;
using shellbench::sandbox::ProcessRequest;
using shellbench::sandbox::run_shell;
using shellbench::testing::TempWorkspace;

ProcessRequest request_in(const TempWorkspace& workspace) {
    ProcessRequest request;
    request.working_directory = workspace.root();
    request.environment = make_sandbox_environment(workspace.root(), workspace.root());
    request.timeout = std::chrono::seconds(10);
    return request;
}

TEST(ProcessRunnerTest, CapturesStdoutStderrAndExitCode) {
    TempWorkspace workspace("process_runner");
    auto result = run_shell("echo out; echo err 1>&2; exit 3", request_in(workspace));
    ASSERT_FALSE(is_error(result));

    const auto& capture = get_value(result);
    EXPECT_EQ(capture.exit_code, 3);
    EXPECT_FALSE(capture.timed_out);
    EXPECT_EQ(capture.stdout_text, "out\n");
    EXPECT_EQ(capture.stderr_text, "err\n");
}

TEST(ProcessRunnerTest, RunsInRequestedDirectory) {
    TempWorkspace workspace("process_runner");
    auto result = run_shell("pwd", request_in(workspace));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).stdout_text, workspace.root().string() + "\n");
}

TEST(ProcessRunnerTest, KillsProcessGroupOnTimeout) {
    TempWorkspace workspace("process_runner");
    ProcessRequest request = request_in(workspace);
    request.timeout = std::chrono::milliseconds(300);

    const auto started = std::chrono::steady_clock::now();
    auto result = run_shell("sleep 5 | cat", request);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    ASSERT_FALSE(is_error(result));

    EXPECT_TRUE(get_value(result).timed_out);
    EXPECT_LT(elapsed, std::chrono::seconds(4));
}

TEST(ProcessRunnerTest, CapsCapturedOutputButCountsEverything) {
    TempWorkspace workspace("process_runner");
    ProcessRequest request = request_in(workspace);
    request.max_output_bytes = 100;

    auto result = run_shell("yes x | head -c 5000", request);
    ASSERT_FALSE(is_error(result));
    const auto& capture = get_value(result);
    EXPECT_EQ(capture.stdout_text.size(), 100u);
    EXPECT_EQ(capture.stdout_total_bytes, 5000u);
}

TEST(ProcessRunnerTest, SandboxEnvironmentPointsHomeAtRoot) {
    TempWorkspace workspace("process_runner");
    auto result = run_shell("echo \"$HOME|$TMPDIR|${LD_PRELOAD:-unset}\"", request_in(workspace));
    ASSERT_FALSE(is_error(result));
    const std::string root = workspace.root().string();
    EXPECT_EQ(get_value(result).stdout_text, root + "|" + root + "|unset\n");
}

TEST(ProcessRunnerTest, FindsExecutablesOnPath) {
    const auto environment = shellbench::sandbox::capture_process_environment();
    EXPECT_TRUE(find_executable("sh", environment).has_value());
    EXPECT_FALSE(find_executable("definitely-not-a-real-tool-xyz", environment).has_value());
}

}  // namespace
