#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace arena::protocol {

    using Standing = std::pair<std::string, std::int64_t>;

    // Define the specific lifecycle events
    struct AgentRegisteredEvent { std::string name; };
    struct ContestStartedEvent { std::size_t total_problems = 0; std::vector<std::string> participants; };
    struct RoundStartedEvent { std::size_t round_number = 0; std::string problem_id; };
    struct SubmissionReceivedEvent { std::string agent; std::string problem_id; double response_latency_ms = 0.0; };
    struct RulesetUpdatedEvent { std::size_t version = 0; std::string author; };
    struct RoundCompletedEvent {
        std::size_t round_number = 0;
        std::string problem_id;
        std::size_t responders = 0;
        bool ruleset_updated = false;
        std::vector<Standing> leaderboard;
    };
    struct ContestEndedEvent { std::string winner; std::vector<Standing> final_leaderboard; };

    // A contest event is exactly ONE of the payloads below.
    using EventPayload = std::variant<
        AgentRegisteredEvent,
        ContestStartedEvent,
        RoundStartedEvent,
        SubmissionReceivedEvent,
        RulesetUpdatedEvent,
        RoundCompletedEvent,
        ContestEndedEvent
    >;

    struct ContestEvent {
        std::int64_t timestamp_ms = 0;
        EventPayload payload;
    };

    inline std::string event_kind(const ContestEvent& event) {
        struct KindVisitor {
            std::string operator()(const AgentRegisteredEvent&) const { return "agent_registered"; }
            std::string operator()(const ContestStartedEvent&) const { return "contest_started"; }
            std::string operator()(const RoundStartedEvent&) const { return "round_started"; }
            std::string operator()(const SubmissionReceivedEvent&) const { return "submission_received"; }
            std::string operator()(const RulesetUpdatedEvent&) const { return "ruleset_updated"; }
            std::string operator()(const RoundCompletedEvent&) const { return "round_completed"; }
            std::string operator()(const ContestEndedEvent&) const { return "contest_ended"; }
        };
        return std::visit(KindVisitor{}, event.payload);
    }

} // namespace arena::protocol
