// Tests for analysis/analysis_report.h -- placement, text lines and JSON.

#include "analysis/analysis_report.h"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

namespace satb {
namespace {

ProgressionResult analyzeStrings(const std::vector<std::string>& chords) {
  return analyzeChordStrings(chords, KeyContext(), RuleSet::all());
}

LocatedViolation makeViolation(RuleId rule, int chord_index, std::vector<Voice> voices) {
  LocatedViolation located;
  located.chord_index = chord_index;
  located.violation.rule = rule;
  located.violation.tier = RuleTier::Critical;
  located.violation.confidence = 100;
  located.violation.voices = std::move(voices);
  return located;
}

// ---------------------------------------------------------------------------
// Placement
// ---------------------------------------------------------------------------

TEST(AnalysisReportTest, BeatPosition) {
  EXPECT_EQ(beatPosition(0).measure, 1);
  EXPECT_EQ(beatPosition(0).beat, 1);
  EXPECT_EQ(beatPosition(3).beat, 4);
  EXPECT_EQ(beatPosition(4).measure, 2);
  EXPECT_EQ(beatPosition(4).beat, 1);
  EXPECT_EQ(beatPositionLabel(9), "m3 b2");
}

TEST(AnalysisReportTest, VoicesDisplayBassFirst) {
  EXPECT_EQ(displayVoiceOrder({Voice::Soprano, Voice::Bass}),
            (std::vector<Voice>{Voice::Bass, Voice::Soprano}));
  EXPECT_EQ(displayVoiceOrder({Voice::Alto, Voice::Tenor, Voice::Soprano}),
            (std::vector<Voice>{Voice::Tenor, Voice::Alto, Voice::Soprano}));
}

// ---------------------------------------------------------------------------
// Text
// ---------------------------------------------------------------------------

TEST(AnalysisReportTest, ViolationLine) {
  LocatedViolation located = makeViolation(RuleId::ParallelFifths, 1,
                                           {Voice::Soprano, Voice::Bass});
  located.violation.short_message = "Parallel fifths";
  EXPECT_EQ(formatViolationLine(located),
            "m1 b2: Parallel fifths (Bass-Soprano) [parallel_fifths, 100%]");
}

TEST(AnalysisReportTest, ViolationLineWithDetailAndNoVoices) {
  LocatedViolation located = makeViolation(RuleId::ImproperOmission, 4, {});
  located.violation.confidence = 85;
  located.violation.short_message = "Omitted chord factor";
  located.violation.detail = "missing 3";
  EXPECT_EQ(formatViolationLine(located),
            "m2 b1: Omitted chord factor, missing 3 [improper_omission, 85%]");
}

TEST(AnalysisReportTest, BeatLines) {
  ProgressionResult result = analyzeStrings({"F4 D4 B3 G2", "E4 H4 C4 C3"});
  EXPECT_EQ(formatBeatLine(result.beats[0], 0), "m1 b1: V7,+ (dominant) F4 D4 B3 G2");
  EXPECT_EQ(formatBeatLine(result.beats[1], 1), "m1 b2: invalid chord [Alto: invalid pitch 'H4']");
}

TEST(AnalysisReportTest, TierSummary) {
  std::vector<LocatedViolation> violations = {
      makeViolation(RuleId::ParallelFifths, 0, {}), makeViolation(RuleId::VoiceOverlap, 0, {}),
      makeViolation(RuleId::VoiceCrossing, 1, {})};
  violations[1].violation.tier = RuleTier::Important;
  TierSummary summary = summarizeTiers(violations);
  EXPECT_EQ(summary.critical, 2u);
  EXPECT_EQ(summary.important, 1u);
  EXPECT_EQ(summary.advanced, 0u);
  EXPECT_EQ(summary.total(), 3u);
}

TEST(AnalysisReportTest, TextReport) {
  std::string text = progressionToText(analyzeStrings({"F4 D4 B3 G2", "G4 E4 C4 C3"}));
  EXPECT_EQ(text.rfind("Key: C_major\n", 0), 0u);
  EXPECT_NE(text.find("m1 b2: I (tonic) G4 E4 C4 C3\n"), std::string::npos);
  EXPECT_NE(text.find("Violations: 1 (critical 1, important 0, advanced 0)"), std::string::npos);
  EXPECT_NE(text.find("m1 b1: Unresolved seventh (Soprano), F4->G4 [seventh_resolution, 100%]"),
            std::string::npos);
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

TEST(AnalysisReportTest, JsonChordsAndSummary) {
  std::string json = progressionToJson(analyzeStrings({"F4 D4 B3 G2", "E4 H4 C4 C3"}), false);
  EXPECT_EQ(json.rfind("{\"key\":\"C_major\",\"chords\":[", 0), 0u);
  EXPECT_NE(json.find("\"label\":\"V7,+\""), std::string::npos);
  EXPECT_NE(json.find("\"function\":\"dominant\""), std::string::npos);
  EXPECT_NE(json.find("\"chromatic\":null"), std::string::npos);
  EXPECT_NE(json.find("\"factors\":[\"7\",\"5\",\"3\",\"1\"]"), std::string::npos);
  EXPECT_NE(json.find("\"errors\":[{\"voice\":\"Alto\",\"input\":\"H4\",\"reason\":\"invalid pitch\"}]"),
            std::string::npos);
  EXPECT_NE(json.find("\"violations\":[]"), std::string::npos);
  EXPECT_NE(json.find("\"summary\":{\"critical\":0,\"important\":0,\"advanced\":0,\"total\":0,"
                      "\"invalid_chords\":1}"),
            std::string::npos);
}

TEST(AnalysisReportTest, JsonViolation) {
  std::string json = progressionToJson(analyzeStrings({"F4 D4 B3 G2", "G4 E4 C4 C3"}), false);
  EXPECT_NE(json.find("{\"rule\":\"seventh_resolution\",\"tier\":\"critical\",\"confidence\":100,"
                      "\"voices\":[\"Soprano\"],\"motion\":null,\"chord_index\":0,"
                      "\"measure\":1,\"beat\":1,\"short_message\":\"Unresolved seventh\""),
            std::string::npos);
  EXPECT_NE(json.find("\"detail\":\"F4->G4\""), std::string::npos);
}

TEST(AnalysisReportTest, PrettyJsonIsIndented) {
  std::string json = progressionToJson(analyzeStrings({"E4 C4 G3 C3"}), true);
  EXPECT_EQ(json.rfind("{\n  \"key\": \"C_major\",", 0), 0u);
}

}  // namespace
}  // namespace satb
