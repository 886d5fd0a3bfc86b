// Tests for analysis/progression_analyzer.h -- beats, pairing and global
// violation indices.

#include "analysis/progression_analyzer.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace satb {
namespace {

ProgressionResult analyzeStrings(const std::vector<std::string>& chords) {
  return analyzeChordStrings(chords, KeyContext(), RuleSet::all());
}

const LocatedViolation* findViolation(const ProgressionResult& result, RuleId rule) {
  for (const auto& located : result.violations) {
    if (located.violation.rule == rule) return &located;
  }
  return nullptr;
}

TEST(ProgressionAnalyzerTest, CleanCadence) {
  ProgressionResult result = analyzeStrings({"F4 D4 B3 G2", "E4 C4 C4 C3"});
  ASSERT_EQ(result.beats.size(), 2u);
  EXPECT_TRUE(result.beats[0].ok());
  EXPECT_TRUE(result.beats[1].ok());
  EXPECT_EQ(result.beats[0].analysis->numeral, "V");
  EXPECT_EQ(result.beats[1].analysis->numeral, "I");
  EXPECT_EQ(result.beats[0].input, "F4 D4 B3 G2");
  EXPECT_FALSE(result.hasViolations());
  EXPECT_EQ(result.invalidBeatCount(), 0);
}

TEST(ProgressionAnalyzerTest, InvalidBeatBreaksTheChain) {
  ProgressionResult result =
      analyzeStrings({"F4 D4 B3 G2", "E4 H4 C4 C3", "G4 E4 C4 C3"});
  ASSERT_EQ(result.beats.size(), 3u);
  EXPECT_FALSE(result.beats[1].ok());
  ASSERT_EQ(result.beats[1].errors.size(), 1u);
  EXPECT_EQ(result.beats[1].errors[0].voice, Voice::Alto);
  EXPECT_EQ(result.invalidBeatCount(), 1);
  // V7 -> I with a rising seventh would be a violation, but no pair spans
  // the invalid beat.
  EXPECT_FALSE(result.hasViolations());
}

TEST(ProgressionAnalyzerTest, FirstChordViolationsUseThePairStart) {
  ProgressionResult result =
      analyzeStrings({"E4 C4 G3 C3", "E4 C4 G3 C3", "E5 C4 G3 C3", "E5 C4 G3 C3"});
  ASSERT_EQ(result.violations.size(), 1u);
  EXPECT_EQ(result.violations[0].violation.rule, RuleId::MaximumDistance);
  EXPECT_EQ(result.violations[0].chord_index, 2);
}

TEST(ProgressionAnalyzerTest, SecondChordViolationsUseThePairEnd) {
  ProgressionResult result = analyzeStrings({"E4 C4 G3 C3", "G5 C4 G3 C3"});
  const LocatedViolation* leap = findViolation(result, RuleId::ExcessiveMelodicMotion);
  ASSERT_NE(leap, nullptr);
  EXPECT_EQ(leap->chord_index, 1);
  EXPECT_EQ(leap->violation.voices, (std::vector<Voice>{Voice::Soprano}));
}

TEST(ProgressionAnalyzerTest, RuleSetIsRespected) {
  ProgressionResult result = analyzeChordStrings(
      {"F4 D4 B3 G2", "G4 E4 C4 C3"}, KeyContext(),
      RuleSet().with(RuleId::SeventhResolution, false));
  EXPECT_EQ(findViolation(result, RuleId::SeventhResolution), nullptr);
}

TEST(ProgressionAnalyzerTest, VoiceInputs) {
  std::vector<VoiceInputs> beats = {{"F4", "D4", "B3", "G2"}, {"E4", "", "C4", "C3"}};
  ProgressionResult result = analyzeProgression(beats, KeyContext(), RuleSet::all());
  ASSERT_EQ(result.beats.size(), 2u);
  EXPECT_TRUE(result.beats[1].ok());
  EXPECT_EQ(result.beats[1].input, "E4 - C4 C3");
  EXPECT_FALSE(result.beats[1].analysis->snapshot().has(Voice::Alto));
}

TEST(ProgressionAnalyzerTest, ParsedSnapshots) {
  std::vector<SnapshotParseResult> beats = {snapshotFromString("E5 C5 A4 A3"),
                                            snapshotFromString("E5 B4 G#4 E3")};
  KeyContext key(Letter::A, 0, Mode::Minor);
  ProgressionResult result = analyzeProgression(beats, key, RuleSet::all());
  EXPECT_EQ(result.key, key);
  ASSERT_EQ(result.beats.size(), 2u);
  EXPECT_EQ(result.beats[0].input, "E5 C5 A4 A3");
  EXPECT_EQ(result.beats[0].analysis->numeral, "i");
  EXPECT_EQ(result.beats[1].analysis->numeral, "V");
}

}  // namespace
}  // namespace satb
