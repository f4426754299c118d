#pragma once

#include <optional>
#include <string>
#include "core/errors/contest_errors.hpp"
#include "protocol/round_contract.hpp"

namespace arena::contest {

// Decides rewards from execution results and the ruleset text. The
// orchestrator never reads the ruleset itself.
class RewardPolicy {
public:
    virtual ~RewardPolicy() = default;

    // Exactly one reward, for `target_agent` only. The context carries every
    // agent's record for comparison.
    virtual core::errors::Result<protocol::Reward> score(
        const std::string& target_agent, const protocol::RoundContext& context) = 0;

    // Called once per round after rewards are posted; context.rewards is set.
    virtual std::optional<std::string> maybe_revise_ruleset(
        const protocol::RoundContext& context) = 0;

    // Author name used for ruleset updates.
    virtual std::string governing_role() const = 0;
};

}  // namespace arena::contest
