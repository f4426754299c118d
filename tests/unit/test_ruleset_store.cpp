#include <string>
#include <gtest/gtest.h>
#include "ruleset/ruleset_store.hpp"

namespace {

using arena::core::errors::ErrorCategory;
using arena::core::errors::get_error;
using arena::core::errors::get_value;
using arena::core::errors::is_error;
using arena::ruleset::RulesetStore;

TEST(RulesetStoreTest, StartsAtDefaultConstitution) {
    RulesetStore store;
    EXPECT_EQ(store.current(), arena::ruleset::default_constitution());
    EXPECT_EQ(store.origin(), store.current());
    EXPECT_EQ(store.version(), 0u);
    EXPECT_EQ(store.governing_role(), "PrincipleEvaluator");
    EXPECT_NE(store.current().find("+ $1,000"), std::string::npos);
}

TEST(RulesetStoreTest, GoverningRoleUpdatesAndRecordsHistory) {
    RulesetStore store("v0");
    auto first = store.update("v1", "PrincipleEvaluator");
    ASSERT_FALSE(is_error(first));
    EXPECT_EQ(get_value(first), 1u);
    auto second = store.update("v2", "PrincipleEvaluator");
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(get_value(second), 2u);

    EXPECT_EQ(store.current(), "v2");
    const auto history = store.history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].old_text, "v0");
    EXPECT_EQ(history[0].new_text, "v1");
    EXPECT_EQ(history[1].old_text, "v1");
    EXPECT_EQ(history[1].author, "PrincipleEvaluator");
}

TEST(RulesetStoreTest, RejectsOtherAuthorsWithoutChange) {
    RulesetStore store("v0");
    auto denied = store.update("hijacked", "alpha");
    ASSERT_TRUE(is_error(denied));
    EXPECT_EQ(get_error(denied).category, ErrorCategory::Ruleset);
    EXPECT_EQ(get_error(denied).code, "ruleset_permission_denied");
    EXPECT_EQ(store.current(), "v0");
    EXPECT_TRUE(store.history().empty());
}

TEST(RulesetStoreTest, CustomGoverningRole) {
    RulesetStore store("v0", "Judge");
    EXPECT_TRUE(is_error(store.update("v1", "PrincipleEvaluator")));
    EXPECT_FALSE(is_error(store.update("v1", "Judge")));
}

TEST(RulesetStoreTest, TextAtReplaysHistory) {
    RulesetStore store("v0");
    store.update("v1", "PrincipleEvaluator");
    store.update("v2", "PrincipleEvaluator");

    auto origin = store.text_at(0);
    ASSERT_FALSE(is_error(origin));
    EXPECT_EQ(get_value(origin), "v0");
    auto middle = store.text_at(1);
    ASSERT_FALSE(is_error(middle));
    EXPECT_EQ(get_value(middle), "v1");

    auto missing = store.text_at(3);
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "unknown_ruleset_version");
}

TEST(RulesetStoreTest, VerifyChainMatchesCurrent) {
    RulesetStore store("v0");
    store.update("v1", "PrincipleEvaluator");
    store.update("v1", "PrincipleEvaluator");
    auto verified = store.verify_chain();
    ASSERT_FALSE(is_error(verified));
    EXPECT_EQ(get_value(verified), 2u);
}

}  // namespace
