// Tests for rules/rules_engine.h -- detection plus exceptions, per pair.

#include "rules/rules_engine.h"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "test_helpers.h"

namespace satb {
namespace {

using test_helpers::PairFixture;

/// Copy of the violation for a rule, so callers may pass a temporary list.
std::optional<RuleViolation> findViolation(const std::vector<RuleViolation>& violations,
                                           RuleId rule) {
  for (const auto& violation : violations) {
    if (violation.rule == rule) return violation;
  }
  return std::nullopt;
}

bool hasViolation(const std::vector<RuleViolation>& violations, RuleId rule) {
  return findViolation(violations, rule).has_value();
}

std::vector<RuleViolation> validate(const std::string& chord1, const std::string& chord2,
                                    const RulesEngine& engine = RulesEngine()) {
  PairFixture fixture(chord1, chord2);
  return engine.validatePair(fixture.first, fixture.second, fixture.key);
}

// ---------------------------------------------------------------------------
// Whole-pair validation
// ---------------------------------------------------------------------------

TEST(RulesEngineTest, CleanDominantSeventhResolution) {
  // The tenor-bass direct octave is cancelled because the tenor steps.
  auto violations = validate("F4 D4 B3 G2", "E4 C4 C4 C3");
  EXPECT_TRUE(violations.empty());
}

TEST(RulesEngineTest, UnresolvedSeventh) {
  auto violations = validate("F4 D4 B3 G2", "G4 E4 C4 C3");
  std::optional<RuleViolation> seventh = findViolation(violations, RuleId::SeventhResolution);
  ASSERT_TRUE(seventh.has_value());
  EXPECT_EQ(seventh->voices, (std::vector<Voice>{Voice::Soprano}));
  EXPECT_EQ(seventh->detail, "F4->G4");
  EXPECT_EQ(seventh->tier, RuleTier::Critical);
  EXPECT_EQ(seventh->confidence, 100);
  EXPECT_EQ(seventh->short_message, "Unresolved seventh");
  // Soprano steps while the bass leaps a fourth: the direct fifth is allowed.
  EXPECT_FALSE(hasViolation(violations, RuleId::DirectFifths));
}

TEST(RulesEngineTest, ViolationsFollowCatalogueOrder) {
  auto violations = validate("G4 E4 C4 C3", "A4 F4 D4 D3");
  ASSERT_GE(violations.size(), 2u);
  for (size_t idx = 1; idx < violations.size(); ++idx) {
    EXPECT_LT(static_cast<int>(violations[idx - 1].rule), static_cast<int>(violations[idx].rule));
  }
  std::optional<RuleViolation> fifths = findViolation(violations, RuleId::ParallelFifths);
  ASSERT_TRUE(fifths.has_value());
  EXPECT_EQ(fifths->voices, (std::vector<Voice>{Voice::Soprano, Voice::Tenor}));
  EXPECT_EQ(fifths->short_message, "Parallel fifths");
  EXPECT_TRUE(hasViolation(violations, RuleId::ParallelOctaves));
}

TEST(RulesEngineTest, ContraryFifthsReadConsecutive) {
  auto violations = validate("G4 E4 C4 C3", "D5 B4 D4 G2");
  std::optional<RuleViolation> fifths = findViolation(violations, RuleId::ParallelFifths);
  ASSERT_TRUE(fifths.has_value());
  EXPECT_EQ(fifths->motion, MotionType::Contrary);
  EXPECT_EQ(fifths->short_message, "Consecutive fifths");
}

TEST(RulesEngineTest, VoiceCrossing) {
  auto violations = validate("E4 G3 C4 C3", "E4 G3 C4 C3");
  std::optional<RuleViolation> crossing = findViolation(violations, RuleId::VoiceCrossing);
  ASSERT_TRUE(crossing.has_value());
  EXPECT_EQ(crossing->voices, (std::vector<Voice>{Voice::Tenor, Voice::Alto}));
}

TEST(RulesEngineTest, DirectFifthConfidenceDependsOnVoices) {
  auto outer = validate("E4 C4 G3 C3", "D5 B4 B3 G3");
  std::optional<RuleViolation> outer_fifth = findViolation(outer, RuleId::DirectFifths);
  ASSERT_TRUE(outer_fifth.has_value());
  EXPECT_EQ(outer_fifth->voices, (std::vector<Voice>{Voice::Soprano, Voice::Bass}));
  EXPECT_EQ(outer_fifth->confidence, 100);

  auto inner = validate("C5 E4 G3 C3", "D5 A4 D4 F3");
  std::optional<RuleViolation> inner_fifth = findViolation(inner, RuleId::DirectFifths);
  ASSERT_TRUE(inner_fifth.has_value());
  EXPECT_EQ(inner_fifth->voices, (std::vector<Voice>{Voice::Alto, Voice::Tenor}));
  EXPECT_EQ(inner_fifth->confidence, 70);
}

TEST(RulesEngineTest, DirectOctaveWithRisingLeadingToneIsAllowed) {
  auto violations = validate("B4 D4 G3 G2", "C5 E4 G3 C3");
  EXPECT_FALSE(hasViolation(violations, RuleId::DirectOctaves));
}

TEST(RulesEngineTest, UnequalFifthsCancelledByParallelTenths) {
  EXPECT_TRUE(hasViolation(validate("F4 D4 G3 B2", "G4 E4 C4 C3"), RuleId::UnequalFifths));
  EXPECT_FALSE(hasViolation(validate("D5 F4 D4 B2", "E5 G4 C4 C3"), RuleId::UnequalFifths));
}

TEST(RulesEngineTest, FailedExceptionDoesNotSuppress) {
  // Tenor B2/F3 -> C3/G3 against the bass; the parallel-tenths check needs the
  // silent soprano, fails, and the violation stands.
  auto violations = validate("- D4 F3 B2", "- E4 G3 C3");
  std::optional<RuleViolation> unequal = findViolation(violations, RuleId::UnequalFifths);
  ASSERT_TRUE(unequal.has_value());
  EXPECT_EQ(unequal->voices, (std::vector<Voice>{Voice::Bass, Voice::Tenor}));
  EXPECT_EQ(unequal->confidence, 90);
}

// ---------------------------------------------------------------------------
// Leading tone exceptions
// ---------------------------------------------------------------------------

TEST(RulesEngineTest, LeadingToneExceptions) {
  std::optional<RuleViolation> unresolved =
      findViolation(validate("B4 D4 G3 G2", "G4 E4 C4 C3"), RuleId::LeadingToneResolution);
  ASSERT_TRUE(unresolved.has_value());
  EXPECT_EQ(unresolved->voices, (std::vector<Voice>{Voice::Soprano}));
  EXPECT_EQ(unresolved->detail, "B4->G4");

  // V -> IV: no resolution expected.
  EXPECT_FALSE(hasViolation(validate("D5 B4 G4 G3", "C5 A4 F4 F3"),
                          RuleId::LeadingToneResolution));
  // Inner leading tone dropping to the fifth under the tonic.
  EXPECT_FALSE(hasViolation(validate("D5 B4 G4 G3", "C5 G4 E4 C4"),
                          RuleId::LeadingToneResolution));
  // V6 -> vi with the bass stepping down.
  EXPECT_FALSE(hasViolation(validate("D5 G4 D4 B2", "C5 A4 E4 A2"),
                          RuleId::LeadingToneResolution));
}

TEST(RulesEngineTest, LocalLeadingToneIsReported) {
  std::optional<RuleViolation> unresolved =
      findViolation(validate("A4 F#4 D4 D3", "B4 D4 G3 G2"), RuleId::LeadingToneResolution);
  ASSERT_TRUE(unresolved.has_value());
  EXPECT_EQ(unresolved->voices, (std::vector<Voice>{Voice::Alto}));
}

// ---------------------------------------------------------------------------
// Tiers and omission
// ---------------------------------------------------------------------------

TEST(RulesEngineTest, MissingThirdReportedAsCritical) {
  std::optional<RuleViolation> omission =
      findViolation(validate("C5 G4 C4 C3", "C5 G4 C4 C3"), RuleId::ImproperOmission);
  ASSERT_TRUE(omission.has_value());
  EXPECT_EQ(omission->tier, RuleTier::Critical);
  EXPECT_EQ(omission->confidence, 85);
  EXPECT_EQ(omission->detail, "missing 3");
}

TEST(RulesEngineTest, ChromaticChordMayOmitThird) {
  EXPECT_FALSE(
      hasViolation(validate("Db5 Ab4 Db4 Db3", "E5 C5 G4 C4"), RuleId::ImproperOmission));
}

TEST(RulesEngineTest, ExplicitRuleSet) {
  PairFixture fixture("E5 C4 G3 C3", "E5 C4 G3 C3");
  RulesEngine engine;
  EXPECT_TRUE(
      hasViolation(engine.validate(fixture.pair(), RuleSet::all()), RuleId::MaximumDistance));
  EXPECT_FALSE(hasViolation(engine.validate(fixture.pair(), RuleSet::atLeast(RuleTier::Critical)),
                            RuleId::MaximumDistance));
}

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

TEST(RulesEngineTest, DisableRuleByName) {
  RulesEngine engine;
  EXPECT_TRUE(engine.setRuleEnabled("seventh_resolution", false));
  EXPECT_FALSE(engine.ruleSet().isEnabled(RuleId::SeventhResolution));
  EXPECT_FALSE(hasViolation(validate("F4 D4 B3 G2", "G4 E4 C4 C3", engine),
                          RuleId::SeventhResolution));

  EXPECT_FALSE(engine.setRuleEnabled("seventh_resolutions", false));
  EXPECT_TRUE(engine.setRuleEnabled("seventh_resolution", true));
  EXPECT_TRUE(engine.ruleSet().isEnabled(RuleId::SeventhResolution));
}

TEST(RulesEngineTest, ActiveRules) {
  RulesEngine engine;
  EXPECT_EQ(engine.activeRules().size(), static_cast<size_t>(kRuleCount));

  auto important = engine.activeRules(RuleTier::Important);
  ASSERT_EQ(important.size(), 4u);
  EXPECT_EQ(important[0]->id, RuleId::MaximumDistance);
  EXPECT_TRUE(engine.activeRules(RuleTier::Advanced).empty());

  engine.setRuleSet(RuleSet().with(RuleId::VoiceOverlap, false));
  EXPECT_EQ(engine.activeRules(RuleTier::Important).size(), 3u);
}

TEST(RulesEngineTest, FindRule) {
  const RuleDefinition* rule = RulesEngine::findRule("voice_overlap");
  ASSERT_TRUE(rule != nullptr);
  EXPECT_EQ(rule->id, RuleId::VoiceOverlap);
  EXPECT_EQ(rule->tier, RuleTier::Important);
  EXPECT_EQ(RulesEngine::findRule("voice_overlaps"), nullptr);
}

TEST(RulesEngineTest, ShortMessage) {
  const RuleDefinition& octaves = ruleDefinition(RuleId::ParallelOctaves);
  EXPECT_EQ(violationShortMessage(octaves, MotionType::Contrary), "Consecutive octaves");
  EXPECT_EQ(violationShortMessage(octaves, MotionType::Parallel), "Parallel octaves");
  EXPECT_EQ(violationShortMessage(ruleDefinition(RuleId::DirectFifths), MotionType::Contrary),
            "Direct fifth");
}

}  // namespace
}  // namespace satb
