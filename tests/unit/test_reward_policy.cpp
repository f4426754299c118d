#include <string>
#include <gtest/gtest.h>
#include "policy/ruleset_reward_policy.hpp"
#include "ruleset/ruleset_store.hpp"

namespace {

using arena::core::errors::get_error;
using arena::core::errors::get_value;
using arena::core::errors::is_error;
using arena::policy::Amendment;
using arena::policy::parse_reward_rates;
using arena::policy::RulesetRewardPolicy;
using arena::protocol::AgentRoundRecord;
using arena::protocol::ExecutionOutcome;
using arena::protocol::RoundContext;
using arena::protocol::StepStatus;

AgentRoundRecord responded(const std::string& agent, bool passed, double latency_ms) {
    AgentRoundRecord record;
    record.agent = agent;
    record.solicitation = StepStatus::Ok;
    record.response_latency_ms = latency_ms;
    ExecutionOutcome outcome;
    outcome.success = passed;
    outcome.tests_passed = passed ? 3 : 1;
    outcome.total_tests = 3;
    outcome.duration_ms = 40.0;
    if (!passed) {
        outcome.error = "Process exited with code 1";
    }
    record.outcome = outcome;
    return record;
}

RoundContext context_with(const std::string& ruleset_text) {
    RoundContext context;
    context.round_number = 1;
    context.problem.id = "001";
    context.ruleset_text = ruleset_text;
    return context;
}

TEST(RewardRatesTest, ReadsDefaultConstitution) {
    const auto rates = parse_reward_rates(arena::ruleset::default_constitution());
    EXPECT_EQ(rates.pass_bonus, 1000);
    EXPECT_EQ(rates.failure_penalty, 500);
    EXPECT_EQ(rates.latency_penalty_per_second, 5);
}

TEST(RewardRatesTest, ReadsAmendedRatesAndKeepsMissingDefaults) {
    const auto rates = parse_reward_rates(
        "All unit tests pass: + $2,500\n"
        "Latency: - $20 x (seconds from problem release to query return)");
    EXPECT_EQ(rates.pass_bonus, 2500);
    EXPECT_EQ(rates.failure_penalty, 500);
    EXPECT_EQ(rates.latency_penalty_per_second, 20);
}

TEST(RulesetRewardPolicyTest, PassingSubmissionEarnsBonusMinusLatency) {
    RulesetRewardPolicy policy;
    auto context = context_with(arena::ruleset::default_constitution());
    context.records.push_back(responded("alpha", true, 2400.0));

    auto reward = policy.score("alpha", context);
    ASSERT_FALSE(is_error(reward));
    EXPECT_EQ(get_value(reward).amount, 1000 - 12);
    EXPECT_NE(get_value(reward).explanation.find("passed (3/3 tests)"), std::string::npos);
    EXPECT_NE(get_value(reward).explanation.find("latency 2.4s"), std::string::npos);
}

TEST(RulesetRewardPolicyTest, FailingSubmissionIsPenalized) {
    RulesetRewardPolicy policy;
    auto context = context_with(arena::ruleset::default_constitution());
    context.records.push_back(responded("beta", false, 1000.0));

    auto reward = policy.score("beta", context);
    ASSERT_FALSE(is_error(reward));
    EXPECT_EQ(get_value(reward).amount, -505);
    EXPECT_NE(get_value(reward).explanation.find("failed (1/3 tests)"), std::string::npos);
}

TEST(RulesetRewardPolicyTest, RewardIsClamped) {
    RulesetRewardPolicy policy;
    auto context = context_with("All unit tests pass: + $50,000\nLatency: - $0 x seconds");
    context.records.push_back(responded("alpha", true, 0.0));
    auto high = policy.score("alpha", context);
    ASSERT_FALSE(is_error(high));
    EXPECT_EQ(get_value(high).amount, 10000);

    auto slow = context_with(arena::ruleset::default_constitution());
    slow.records.push_back(responded("beta", false, 3600000.0));
    auto low = policy.score("beta", slow);
    ASSERT_FALSE(is_error(low));
    EXPECT_EQ(get_value(low).amount, -10000);
}

TEST(RulesetRewardPolicyTest, RejectsAgentsWithoutSubmission) {
    RulesetRewardPolicy policy;
    auto context = context_with(arena::ruleset::default_constitution());
    AgentRoundRecord silent;
    silent.agent = "gamma";
    silent.solicitation = StepStatus::TimedOut;
    context.records.push_back(silent);

    auto missing = policy.score("gamma", context);
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "no_submission");

    auto unknown = policy.score("delta", context);
    ASSERT_TRUE(is_error(unknown));
    EXPECT_EQ(get_error(unknown).code, "unknown_agent");
}

TEST(RulesetRewardPolicyTest, ProposesScheduledAmendment) {
    RulesetRewardPolicy policy({Amendment{2, "new rules"}});
    EXPECT_EQ(policy.governing_role(), "PrincipleEvaluator");

    auto first = context_with("old rules");
    EXPECT_FALSE(policy.maybe_revise_ruleset(first).has_value());

    auto second = context_with("old rules");
    second.round_number = 2;
    const auto proposal = policy.maybe_revise_ruleset(second);
    ASSERT_TRUE(proposal.has_value());
    EXPECT_EQ(proposal.value(), "new rules");

    second.ruleset_text = "new rules";
    EXPECT_FALSE(policy.maybe_revise_ruleset(second).has_value());
}

}  // namespace
