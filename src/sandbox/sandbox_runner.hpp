#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/contest_errors.hpp"
#include "protocol/problem_contract.hpp"

namespace arena::sandbox {

struct SandboxOptions {
    std::string interpreter = "python3";
    std::string unit_filename = "solution.py";
    std::filesystem::path scratch_root = std::filesystem::temp_directory_path();
    std::uint32_t poll_interval_ms = 10;
    std::uint32_t kill_grace_ms = 200;
};

// Runs one submission and its harness as an isolated child process group.
// An instance executes exactly one submission; create one per submission.
class SandboxRunner {
public:
    explicit SandboxRunner(SandboxOptions options = {});

    SandboxRunner(const SandboxRunner&) = delete;
    SandboxRunner& operator=(const SandboxRunner&) = delete;

    // Launch, limit and sandbox failures are reported inside the outcome.
    // The error branch is reserved for calling execute() a second time.
    core::errors::Result<protocol::ExecutionOutcome> execute(
        const std::string& code, const std::string& harness,
        double timeout_seconds, std::uint32_t memory_limit_mb);

    // Working directory of the last run; removed by the time execute returns.
    const std::filesystem::path& working_directory() const { return working_directory_; }

private:
    SandboxOptions options_;
    bool used_ = false;
    std::filesystem::path working_directory_;
};

// "1" for whole seconds, "0.5" otherwise. Used in timeout diagnostics.
std::string format_seconds(double seconds);

}  // namespace arena::sandbox
