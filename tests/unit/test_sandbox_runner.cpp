#include <csignal>
#include <filesystem>
#include <fstream>
#include <future>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <unistd.h>
#include "core/config/contest_id.hpp"
#include "core/errors/contest_errors.hpp"
#include "sandbox/process_probe.hpp"
#include "sandbox/sandbox_runner.hpp"

namespace {

using arena::core::errors::get_error;
using arena::core::errors::get_value;
using arena::core::errors::is_error;
using arena::protocol::ExecutionOutcome;
using arena::sandbox::SandboxOptions;
using arena::sandbox::SandboxRunner;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_sandbox_runner_" + arena::core::config::generate_contest_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

// The unit file is run by /bin/sh, so submissions and harnesses are shell.
SandboxOptions shell_options(const std::filesystem::path& scratch_root) {
    SandboxOptions options;
    options.interpreter = "/bin/sh";
    options.unit_filename = "unit.sh";
    options.scratch_root = scratch_root;
    return options;
}

ExecutionOutcome run(const SandboxOptions& options, const std::string& code,
                     const std::string& harness, double timeout_s = 5.0,
                     std::uint32_t memory_limit_mb = 256) {
    SandboxRunner runner(options);
    auto result = runner.execute(code, harness, timeout_s, memory_limit_mb);
    EXPECT_FALSE(is_error(result));
    return get_value(result);
}

bool process_gone(const pid_t pid) {
    if (kill(pid, 0) != 0) {
        return true;
    }
    // An orphan reparented to a non-reaping init lingers as a zombie.
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string line;
    std::getline(stat, line);
    const auto close_paren = line.rfind(')');
    return close_paren != std::string::npos && close_paren + 2 < line.size() &&
           line[close_paren + 2] == 'Z';
}

TEST(SandboxRunnerTest, PassingHarnessSucceeds) {
    TempWorkspace workspace;
    const auto outcome = run(shell_options(workspace.root()), "VALUE=3", "echo \"$VALUE passed\"");
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.tests_passed, 3u);
    EXPECT_EQ(outcome.total_tests, 3u);
    EXPECT_FALSE(outcome.error.has_value());
    EXPECT_EQ(outcome.stdout_text, "3 passed\n");
    EXPECT_TRUE(outcome.all_tests_passed());
}

TEST(SandboxRunnerTest, FailingHarnessReportsCountsAndExitCode) {
    TempWorkspace workspace;
    const auto outcome =
        run(shell_options(workspace.root()), "true", "echo \"1 failed, 2 passed\"\nexit 1");
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.tests_passed, 2u);
    EXPECT_EQ(outcome.total_tests, 3u);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error.value(), "Process exited with code 1");
}

TEST(SandboxRunnerTest, MissingSummaryIsAFailure) {
    TempWorkspace workspace;
    const auto outcome = run(shell_options(workspace.root()), "true", "echo hello");
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.tests_passed, 0u);
    EXPECT_EQ(outcome.total_tests, 1u);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error.value(), "No test summary found in harness output.");
}

TEST(SandboxRunnerTest, StderrBecomesError) {
    TempWorkspace workspace;
    const auto outcome =
        run(shell_options(workspace.root()), "true", "echo broken >&2\nexit 2");
    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error.value(), "broken\n");
}

TEST(SandboxRunnerTest, EnforcesWallClockTimeout) {
    TempWorkspace workspace;
    SandboxRunner runner(shell_options(workspace.root()));
    auto result = runner.execute("true", "sleep 30", 1.0, 256);
    ASSERT_FALSE(is_error(result));
    const auto outcome = get_value(result);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.tests_passed, 0u);
    EXPECT_EQ(outcome.total_tests, 1u);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error.value(), "Timeout after 1s");
    EXPECT_GE(outcome.duration_ms, 1000.0);
    EXPECT_LT(outcome.duration_ms, 10000.0);
    EXPECT_FALSE(runner.working_directory().empty());
    EXPECT_FALSE(std::filesystem::exists(runner.working_directory()));
}

TEST(SandboxRunnerTest, FractionalTimeoutInMessage) {
    TempWorkspace workspace;
    const auto outcome = run(shell_options(workspace.root()), "true", "sleep 30", 0.5);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error.value(), "Timeout after 0.5s");
}

TEST(SandboxRunnerTest, TimeoutKillsWholeProcessGroup) {
    TempWorkspace workspace;
    const auto pid_file = workspace.root() / "child.pid";
    const auto outcome = run(shell_options(workspace.root()), "true",
                             "sleep 30 &\necho $! > '" + pid_file.string() + "'\nwait", 1.0);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error.value(), "Timeout after 1s");

    std::ifstream in(pid_file);
    pid_t child = 0;
    in >> child;
    ASSERT_GT(child, 0);
    EXPECT_TRUE(process_gone(child));
}

TEST(SandboxRunnerTest, EnforcesMemoryLimit) {
    TempWorkspace workspace;
    // Doubles a shell string until the group's resident memory passes the limit.
    SandboxRunner runner(shell_options(workspace.root()));
    auto result = runner.execute("x=aaaaaaaaaaaaaaaa", "while :; do x=\"$x$x\"; done", 20.0, 64);
    ASSERT_FALSE(is_error(result));
    const auto outcome = get_value(result);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.tests_passed, 0u);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error.value().rfind("Memory limit exceeded: ", 0), 0u);
    EXPECT_NE(outcome.error.value().find("MB > 64MB"), std::string::npos);
    EXPECT_GT(outcome.peak_memory_mb, 64.0);
    EXPECT_FALSE(runner.working_directory().empty());
    EXPECT_FALSE(std::filesystem::exists(runner.working_directory()));
}

TEST(SandboxRunnerTest, MissingInterpreterFailsTheSubmission) {
    TempWorkspace workspace;
    auto options = shell_options(workspace.root());
    options.interpreter = (workspace.root() / "no-such-interpreter").string();
    const auto outcome = run(options, "true", "echo \"1 passed\"");
    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_NE(outcome.error.value().find("exec"), std::string::npos);
}

TEST(SandboxRunnerTest, RemovesWorkingDirectoryAfterRun) {
    TempWorkspace workspace;
    SandboxRunner runner(shell_options(workspace.root()));
    auto result = runner.execute("true", "echo \"1 passed\"", 5.0, 256);
    ASSERT_FALSE(is_error(result));
    EXPECT_FALSE(runner.working_directory().empty());
    EXPECT_FALSE(std::filesystem::exists(runner.working_directory()));
}

TEST(SandboxRunnerTest, ConcurrentRunsDoNotInheritEachOthersPipes) {
    TempWorkspace workspace;
    const auto options = shell_options(workspace.root());
    // Only the child's own stdout and stderr may be pipes.
    const std::string harness =
        "sleep 0.3\n"
        "ls -l /proc/$$/fd > fds.txt\n"
        "if [ \"$(grep -c 'pipe:' fds.txt)\" = 2 ]; then echo \"1 passed\"; "
        "else echo \"1 failed\"; cat fds.txt; exit 1; fi";

    std::vector<std::future<ExecutionOutcome>> runs;
    for (int i = 0; i < 8; ++i) {
        runs.push_back(std::async(std::launch::async, [&options, &harness]() {
            return run(options, "true", harness, 10.0);
        }));
    }
    for (auto& pending : runs) {
        const auto outcome = pending.get();
        EXPECT_TRUE(outcome.success) << outcome.stdout_text;
        EXPECT_EQ(outcome.tests_passed, 1u);
    }
}

TEST(SandboxRunnerTest, RejectsSecondExecution) {
    TempWorkspace workspace;
    SandboxRunner runner(shell_options(workspace.root()));
    ASSERT_FALSE(is_error(runner.execute("true", "echo \"1 passed\"", 5.0, 256)));

    auto again = runner.execute("true", "echo \"1 passed\"", 5.0, 256);
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).code, "sandbox_reused");
}

TEST(SandboxRunnerTest, FormatsSeconds) {
    EXPECT_EQ(arena::sandbox::format_seconds(1.0), "1");
    EXPECT_EQ(arena::sandbox::format_seconds(0.5), "0.5");
}

TEST(ProcessProbeTest, ReadsOwnResidentMemory) {
    const auto own = arena::sandbox::resident_kb(getpid());
    ASSERT_TRUE(own.has_value());
    EXPECT_GT(own.value(), 0u);
    EXPECT_FALSE(arena::sandbox::resident_kb(-1).has_value());
}

}  // namespace
