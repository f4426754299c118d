#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "contest/reward_policy.hpp"
#include "core/errors/contest_errors.hpp"
#include "protocol/round_contract.hpp"
#include "ruleset/ruleset_store.hpp"

namespace arena::policy {

inline constexpr std::int64_t kRewardLimit = 10000;

// Dollar rates read from the ruleset text. Each clause missing from the text
// keeps its default.
struct RewardRates {
    std::int64_t pass_bonus = 1000;
    std::int64_t failure_penalty = 500;
    std::int64_t latency_penalty_per_second = 5;
};

RewardRates parse_reward_rates(const std::string& ruleset_text);

// Replacement ruleset text proposed once `after_round` rounds have completed.
struct Amendment {
    std::size_t after_round = 0;
    std::string text;
};

// Fixed-formula reward policy driven by the ruleset text in effect for the
// round: pass bonus or failure penalty, minus the per-second latency penalty
// on the agent's response latency, clamped to +/- kRewardLimit.
class RulesetRewardPolicy : public contest::RewardPolicy {
public:
    explicit RulesetRewardPolicy(std::vector<Amendment> amendments = {},
                                 std::string governing_role = ruleset::kDefaultGoverningRole);

    core::errors::Result<protocol::Reward> score(
        const std::string& target_agent, const protocol::RoundContext& context) override;

    std::optional<std::string> maybe_revise_ruleset(
        const protocol::RoundContext& context) override;

    std::string governing_role() const override { return governing_role_; }

private:
    std::vector<Amendment> amendments_;
    std::string governing_role_;
};

}  // namespace arena::policy
