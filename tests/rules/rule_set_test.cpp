// Tests for rules/rule_set.h -- enable flags as an immutable value.

#include "rules/rule_set.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace satb {
namespace {

TEST(RuleSetTest, AllEnabledByDefault) {
  RuleSet rules;
  EXPECT_EQ(rules.enabledCount(), kRuleCount);
  EXPECT_EQ(rules, RuleSet::all());
  EXPECT_EQ(rules.enabledRules().front(), RuleId::ParallelFifths);
  EXPECT_EQ(rules.enabledRules().back(), RuleId::ImproperOmission);
}

TEST(RuleSetTest, WithReturnsACopy) {
  RuleSet original;
  RuleSet changed = original.with(RuleId::VoiceCrossing, false);
  EXPECT_TRUE(original.isEnabled(RuleId::VoiceCrossing));
  EXPECT_FALSE(changed.isEnabled(RuleId::VoiceCrossing));
  EXPECT_EQ(changed.enabledCount(), kRuleCount - 1);
  EXPECT_NE(original, changed);
}

TEST(RuleSetTest, WithRuleByName) {
  auto changed = RuleSet().withRule("voice_overlap", false);
  ASSERT_TRUE(changed.has_value());
  EXPECT_FALSE(changed->isEnabled(RuleId::VoiceOverlap));
  EXPECT_FALSE(RuleSet().withRule("voice_overlaps", false).has_value());
}

TEST(RuleSetTest, WithoutRulesCollectsUnknownNames) {
  std::vector<std::string> unknown;
  RuleSet rules = RuleSet().withoutRules({"parallel_fifths", "bogus", "voice_crossing"}, &unknown);
  EXPECT_FALSE(rules.isEnabled(RuleId::ParallelFifths));
  EXPECT_FALSE(rules.isEnabled(RuleId::VoiceCrossing));
  EXPECT_EQ(rules.enabledCount(), kRuleCount - 2);
  EXPECT_EQ(unknown, (std::vector<std::string>{"bogus"}));
}

TEST(RuleSetTest, AtLeastTier) {
  RuleSet critical = RuleSet::atLeast(RuleTier::Critical);
  EXPECT_EQ(critical.enabledCount(), kRuleCount - 4);
  EXPECT_FALSE(critical.isEnabled(RuleId::MaximumDistance));
  EXPECT_TRUE(critical.isEnabled(RuleId::DuplicatedSeventh));

  EXPECT_EQ(RuleSet::atLeast(RuleTier::Important), RuleSet::all());
  EXPECT_EQ(RuleSet::atLeast(RuleTier::Advanced), RuleSet::all());
}

}  // namespace
}  // namespace satb
