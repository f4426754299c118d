#include "policy/ruleset_reward_policy.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <regex>
#include <sstream>
#include <utility>

namespace arena::policy {

using core::errors::ContestError;
using core::errors::ErrorCategory;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

// First "$1,000"-style amount on the line, sign ignored.
std::optional<std::int64_t> dollar_amount(const std::string& line) {
    static const std::regex kAmount(R"(\$\s*([0-9][0-9,]*))");
    std::smatch match;
    if (!std::regex_search(line, match, kAmount)) {
        return std::nullopt;
    }
    std::string digits;
    for (const char c : match[1].str()) {
        if (c != ',') {
            digits.push_back(c);
        }
    }
    if (digits.empty() || digits.size() > 15) {
        return std::nullopt;
    }
    return std::stoll(digits);
}

std::string format_one_decimal(const double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << value;
    return out.str();
}

}  // namespace

RewardRates parse_reward_rates(const std::string& ruleset_text) {
    RewardRates rates;
    bool have_pass = false;
    bool have_failure = false;
    bool have_latency = false;

    std::istringstream lines(ruleset_text);
    std::string line;
    while (std::getline(lines, line)) {
        const auto amount = dollar_amount(line);
        if (!amount.has_value()) {
            continue;
        }
        const std::string lowered = lowercase(line);
        if (lowered.find("latency") != std::string::npos) {
            if (!have_latency) {
                rates.latency_penalty_per_second = amount.value();
                have_latency = true;
            }
        } else if (lowered.find("fail") != std::string::npos ||
                   lowered.find("error") != std::string::npos) {
            if (!have_failure) {
                rates.failure_penalty = amount.value();
                have_failure = true;
            }
        } else if (lowered.find("pass") != std::string::npos) {
            if (!have_pass) {
                rates.pass_bonus = amount.value();
                have_pass = true;
            }
        }
    }
    return rates;
}

RulesetRewardPolicy::RulesetRewardPolicy(std::vector<Amendment> amendments,
                                         std::string governing_role)
    : amendments_(std::move(amendments)), governing_role_(std::move(governing_role)) {}

core::errors::Result<protocol::Reward> RulesetRewardPolicy::score(
    const std::string& target_agent, const protocol::RoundContext& context) {
    const protocol::AgentRoundRecord* record = context.find(target_agent);
    if (record == nullptr) {
        return ContestError{ErrorCategory::Agent,
                            "Agent did not take part in round " +
                                std::to_string(context.round_number) + ": " + target_agent,
                            "unknown_agent"};
    }
    if (!record->responded() || !record->outcome.has_value()) {
        return ContestError{ErrorCategory::Agent,
                            "Agent has no executed submission to score: " + target_agent,
                            "no_submission"};
    }

    const RewardRates rates = parse_reward_rates(context.ruleset_text);
    const protocol::ExecutionOutcome& outcome = record->outcome.value();
    const bool passed = outcome.all_tests_passed();

    const double latency_s = std::max(0.0, record->response_latency_ms / 1000.0);
    const auto latency_penalty =
        static_cast<std::int64_t>(static_cast<double>(rates.latency_penalty_per_second) * latency_s);

    std::int64_t amount = passed ? rates.pass_bonus : -rates.failure_penalty;
    amount -= latency_penalty;
    amount = std::clamp(amount, -kRewardLimit, kRewardLimit);

    std::ostringstream explanation;
    explanation << (passed ? "passed" : "failed") << " (" << outcome.tests_passed << "/"
                << outcome.total_tests << " tests): "
                << (passed ? "+$" + std::to_string(rates.pass_bonus)
                           : "-$" + std::to_string(rates.failure_penalty))
                << "; latency " << format_one_decimal(latency_s) << "s x $"
                << rates.latency_penalty_per_second << "/s: -$" << latency_penalty
                << "; execution " << static_cast<long long>(outcome.duration_ms)
                << "ms (not priced)";
    if (outcome.error.has_value() && !passed) {
        explanation << "; error: " << outcome.error.value();
    }
    explanation << " => $" << amount;

    return protocol::Reward{amount, explanation.str()};
}

std::optional<std::string> RulesetRewardPolicy::maybe_revise_ruleset(
    const protocol::RoundContext& context) {
    for (const auto& amendment : amendments_) {
        if (amendment.after_round == context.round_number &&
            amendment.text != context.ruleset_text) {
            return amendment.text;
        }
    }
    return std::nullopt;
}

}  // namespace arena::policy
