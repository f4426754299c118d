#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace arena::protocol {

// One contest problem. Everything except released_at_ms is fixed once the
// problem source has produced it; released_at_ms is stamped exactly once,
// when the orchestrator begins soliciting submissions.
struct Problem {
    std::string id;
    std::string stub;         // declares the required entry point
    std::string harness;      // executable assertions, appended after the submission
    std::string description;
    std::uint32_t timeout_s = 1;
    std::uint32_t memory_limit_mb = 256;
    std::optional<std::int64_t> released_at_ms;
};

// Result of running one submission plus its harness in the sandbox.
struct ExecutionOutcome {
    bool success = false;
    std::string stdout_text;
    std::optional<std::string> error;
    double duration_ms = 0.0;        // sandbox wall clock, not agent latency
    double peak_memory_mb = 0.0;
    std::uint32_t tests_passed = 0;
    std::uint32_t total_tests = 1;   // never below 1

    bool all_tests_passed() const {
        return success && tests_passed == total_tests;
    }
};

inline ExecutionOutcome failed_outcome(const std::string& error) {
    ExecutionOutcome outcome;
    outcome.success = false;
    outcome.error = error;
    outcome.tests_passed = 0;
    outcome.total_tests = 1;
    return outcome;
}

}  // namespace arena::protocol
