// Progression analyzer -- classifies every beat of a chord sequence and
// validates each adjacent pair of valid beats.

#ifndef SATB_ANALYSIS_PROGRESSION_ANALYZER_H
#define SATB_ANALYSIS_PROGRESSION_ANALYZER_H

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "core/voice.h"
#include "harmony/chord_snapshot.h"
#include "harmony/functional_classifier.h"
#include "harmony/key_context.h"
#include "rules/rule_set.h"
#include "rules/rule_types.h"

namespace satb {

/// Raw pitch names for one beat, soprano first. "" or "-" marks a rest.
using VoiceInputs = std::array<std::string, kVoiceCount>;

/// Analysis of one beat, or the reasons it could not be analyzed.
struct BeatResult {
  std::string input;                      ///< Beat as given, for reports.
  std::optional<ChordAnalysis> analysis;  ///< Empty when errors is not.
  std::vector<PitchError> errors;

  bool ok() const { return analysis.has_value(); }
};

/// A violation placed on the beat it belongs to.
struct LocatedViolation {
  int chord_index = 0;  ///< Global beat index.
  RuleViolation violation;
};

/// Result of analyzing a whole progression.
struct ProgressionResult {
  KeyContext key;
  std::vector<BeatResult> beats;
  std::vector<LocatedViolation> violations;  ///< Pair order, then rule order.

  bool hasViolations() const { return !violations.empty(); }
  int invalidBeatCount() const;
};

/// @brief Analyze pre-parsed beats.
///
/// Invalid beats are kept in the result with their errors and break the
/// chain: no pair is formed across them.
/// @param beats Parse result per beat.
/// @param key Key of the progression.
/// @param rules Rules to evaluate.
/// @param verbose Log rule decisions to stderr.
ProgressionResult analyzeProgression(const std::vector<SnapshotParseResult>& beats,
                                     const KeyContext& key, const RuleSet& rules,
                                     bool verbose = false);

/// @brief Analyze beats given as per-voice pitch names.
ProgressionResult analyzeProgression(const std::vector<VoiceInputs>& beats,
                                     const KeyContext& key, const RuleSet& rules,
                                     bool verbose = false);

/// @brief Analyze beats given as "S A T B" strings.
ProgressionResult analyzeChordStrings(const std::vector<std::string>& chords,
                                      const KeyContext& key, const RuleSet& rules,
                                      bool verbose = false);

}  // namespace satb

#endif  // SATB_ANALYSIS_PROGRESSION_ANALYZER_H
