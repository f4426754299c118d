#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "contest/agent.hpp"
#include "contest/problem_source.hpp"
#include "contest/reward_policy.hpp"
#include "core/errors/contest_errors.hpp"
#include "ledger/ledger.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/problem_contract.hpp"
#include "protocol/round_contract.hpp"
#include "ruleset/ruleset_store.hpp"
#include "sandbox/sandbox_runner.hpp"

namespace arena::contest {

enum class ContestPhase {
    Idle,
    Active,
    RoundInProgress,
    Ended
};

std::string to_string(ContestPhase phase);

using Extractor = std::function<std::string(const std::string& raw, const std::string& entry_point)>;
using EventSink = std::function<void(const protocol::ContestEvent&)>;

struct ContestOptions {
    std::chrono::milliseconds response_budget{30000};
    std::chrono::milliseconds round_pause{0};
    sandbox::SandboxOptions sandbox;
    Extractor extractor;            // submission::extract_executable when empty
    std::int64_t evaluator_fee = 0; // posted to the governing role each round when non-zero
};

// Audit record of one completed round.
struct RoundLog {
    std::size_t round_number = 0;
    std::string problem_id;
    std::int64_t released_at_ms = 0;
    std::int64_t completed_at_ms = 0;
    std::string ruleset_text;
    std::vector<protocol::AgentRoundRecord> records;
    std::vector<std::pair<std::string, protocol::Reward>> rewards;
    bool ruleset_updated = false;
    std::optional<std::size_t> ruleset_version;
    // Ledger, policy and ruleset failures of this round. The round itself
    // still completed and advanced.
    std::vector<core::errors::ContestError> errors;
};

struct ContestStatus {
    ContestPhase phase = ContestPhase::Idle;
    std::optional<std::int64_t> started_at_ms;
    std::size_t current_problem_index = 0;
    std::size_t total_problems = 0;
    std::optional<std::string> current_problem_id;
    std::vector<std::string> participants;
    std::vector<ledger::Standing> leaderboard;
};

// Round orchestrator. Owns the contest state machine
// Idle -> Active -> (RoundInProgress -> Active)* -> Ended and drives each
// round through solicitation, extraction, sandboxed execution, rewards,
// feedback and the optional ruleset revision. Collaborators are borrowed and
// must outlive the engine.
class ContestEngine {
public:
    ContestEngine(ledger::Ledger& ledger, ruleset::RulesetStore& rulesets,
                  ProblemSource& problem_source, RewardPolicy& reward_policy,
                  ContestOptions options = {});

    ContestEngine(const ContestEngine&) = delete;
    ContestEngine& operator=(const ContestEngine&) = delete;

    core::errors::Result<std::size_t> load_problems();
    core::errors::Result<std::size_t> register_agent(std::shared_ptr<Agent> agent);
    void add_event_sink(EventSink sink);

    core::errors::Result<ContestPhase> start();
    core::errors::Result<RoundLog> run_round();
    core::errors::Result<std::vector<ledger::Standing>> run_full_contest();

    // Ended -> Idle with problems reloaded. Ledger and ruleset history stay.
    core::errors::Result<ContestPhase> reset();

    ContestPhase phase() const;
    ContestStatus status() const;
    std::optional<protocol::Problem> current_problem() const;
    std::vector<protocol::Problem> problems() const;
    std::vector<RoundLog> round_logs() const;
    std::vector<std::string> participants() const;

private:
    struct Participant {
        std::string name;
        std::shared_ptr<Agent> agent;
    };

    std::vector<protocol::AgentRoundRecord> solicit(const protocol::Problem& problem,
                                                    std::size_t round_number);
    void extract_and_execute(const protocol::Problem& problem,
                             std::vector<protocol::AgentRoundRecord>& records) const;
    void reward_and_feedback(protocol::RoundContext& context, RoundLog& log);
    void check_ruleset(const protocol::RoundContext& context, RoundLog& log);
    void emit(protocol::EventPayload payload);

    ledger::Ledger& ledger_;
    ruleset::RulesetStore& rulesets_;
    ProblemSource& problem_source_;
    RewardPolicy& reward_policy_;
    ContestOptions options_;

    mutable std::mutex mutex_;
    ContestPhase phase_ = ContestPhase::Idle;
    bool problems_loaded_ = false;
    std::vector<protocol::Problem> problems_;
    std::size_t current_index_ = 0;
    std::optional<std::int64_t> started_at_ms_;
    std::vector<Participant> participants_;
    std::vector<RoundLog> round_logs_;
    std::vector<EventSink> sinks_;
};

std::vector<protocol::Standing> to_event_standings(const std::vector<ledger::Standing>& standings);

}  // namespace arena::contest
