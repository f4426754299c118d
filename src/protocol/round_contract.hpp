#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "protocol/problem_contract.hpp"

namespace arena::protocol {

// Tag for each per-agent step of a round. The orchestrator branches on this
// instead of letting exceptions cross task boundaries.
enum class StepStatus {
    Ok,
    TimedOut,
    Failed
};

// Everything one agent contributed to one round.
struct AgentRoundRecord {
    std::string agent;
    StepStatus solicitation = StepStatus::Failed;
    std::string raw_submission;
    std::string extracted_code;
    double response_latency_ms = 0.0;
    std::optional<ExecutionOutcome> outcome;  // set only for responding agents
    std::optional<std::string> error;

    bool responded() const { return solicitation == StepStatus::Ok; }
};

struct Reward {
    std::int64_t amount = 0;
    std::string explanation;
};

// Read-only view of a round handed to the reward policy. Rewards are filled
// in after scoring and are only visible to the ruleset check.
struct RoundContext {
    std::size_t round_number = 0;  // 1-based
    Problem problem;
    std::string ruleset_text;
    std::vector<AgentRoundRecord> records;
    std::vector<std::pair<std::string, Reward>> rewards;

    const AgentRoundRecord* find(const std::string& agent) const {
        for (const auto& record : records) {
            if (record.agent == agent) {
                return &record;
            }
        }
        return nullptr;
    }
};

// Delivered to each responding agent once its reward has been posted.
struct Feedback {
    std::string problem_id;
    std::int64_t timestamp_ms = 0;
    ExecutionOutcome outcome;
    std::int64_t reward = 0;
    std::string explanation;
    std::int64_t balance = 0;
    std::string ruleset_text;
    std::string extracted_code;
    double response_latency_ms = 0.0;
};

inline std::string to_string(const StepStatus status) {
    switch (status) {
        case StepStatus::Ok:
            return "ok";
        case StepStatus::TimedOut:
            return "timed_out";
        case StepStatus::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

}  // namespace arena::protocol
