// Text and JSON reports for an analyzed progression.

#ifndef SATB_ANALYSIS_ANALYSIS_REPORT_H
#define SATB_ANALYSIS_ANALYSIS_REPORT_H

#include <cstdint>
#include <string>
#include <vector>

#include "analysis/progression_analyzer.h"

namespace satb {

/// Beats per measure used for report placement.
constexpr int kBeatsPerMeasure = 4;

/// 1-based measure and beat of a chord.
struct BeatPosition {
  int measure = 1;
  int beat = 1;
};

/// @brief Measure/beat placement of a global chord index.
BeatPosition beatPosition(int chord_index);

/// @brief "m2 b3" label for a chord index.
std::string beatPositionLabel(int chord_index);

/// @brief Voices reordered bass to soprano for display.
std::vector<Voice> displayVoiceOrder(const std::vector<Voice>& voices);

/// Violation counts per reported tier.
struct TierSummary {
  uint32_t critical = 0;
  uint32_t important = 0;
  uint32_t advanced = 0;

  uint32_t total() const { return critical + important + advanced; }
};

/// @brief Count violations by reported tier.
TierSummary summarizeTiers(const std::vector<LocatedViolation>& violations);

/// @brief One report line for a violation.
///
/// Example: "m1 b2: Parallel fifths (Bass-Soprano) [parallel_fifths, 100%]".
std::string formatViolationLine(const LocatedViolation& located);

/// @brief One report line for a beat: label and function, or its errors.
std::string formatBeatLine(const BeatResult& beat, int chord_index);

/// @brief Multi-line summary: key, one line per chord, one per violation.
std::string progressionToText(const ProgressionResult& result);

/// @brief Serialize a progression result.
/// @param result The analyzed progression.
/// @param pretty Indent with two spaces when true; minified otherwise.
std::string progressionToJson(const ProgressionResult& result, bool pretty = false);

}  // namespace satb

#endif  // SATB_ANALYSIS_ANALYSIS_REPORT_H
