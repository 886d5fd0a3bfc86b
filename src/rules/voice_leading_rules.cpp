/// @file
/// @brief Geometric detectors for the fourteen voice-leading rules.

#include "rules/voice_leading_rules.h"

#include <cstdlib>
#include <string>

#include "core/pitch_utils.h"
#include "rules/context_analyzer.h"

namespace satb {

namespace {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

/// Both pitches of two voices in both chords.
struct PairPitches {
  Pitch upper1;
  Pitch lower1;
  Pitch upper2;
  Pitch lower2;
};

std::optional<PairPitches> pairPitches(const ProgressionPair& pair, Voice upper, Voice lower) {
  const auto& first = pair.first.snapshot();
  const auto& second = pair.second.snapshot();
  if (!first.has(upper) || !first.has(lower) || !second.has(upper) || !second.has(lower)) {
    return std::nullopt;
  }
  return PairPitches{*first.pitch(upper), *first.pitch(lower), *second.pitch(upper),
                     *second.pitch(lower)};
}

MotionType pairMotion(const PairPitches& pitches) {
  return classifyMotion(pitches.upper1, pitches.upper2, pitches.lower1, pitches.lower2);
}

/// Signed movement of one voice, or nullopt if it is silent in either chord.
std::optional<int> voiceMovement(const ProgressionPair& pair, Voice voice) {
  const auto& from = pair.first.snapshot().pitch(voice);
  const auto& to = pair.second.snapshot().pitch(voice);
  if (!from || !to) return std::nullopt;
  return semitones(*from, *to);
}

Finding pairFinding(Voice upper, Voice lower, MotionType motion) {
  Finding finding;
  finding.voices = {upper, lower};
  finding.motion = motion;
  return finding;
}

// ---------------------------------------------------------------------------
// Perfect consonances
// ---------------------------------------------------------------------------

Detection detectParallelPerfect(const ProgressionPair& pair, bool fifths) {
  auto same_class = fifths ? isFifthClass : isOctaveClass;
  std::vector<Finding> findings;
  for (const auto& [upper, lower] : kVoicePairs) {
    auto pitches = pairPitches(pair, upper, lower);
    if (!pitches) continue;
    if (!same_class(pitches->upper1, pitches->lower1) ||
        !same_class(pitches->upper2, pitches->lower2)) {
      continue;
    }
    MotionType motion = pairMotion(*pitches);
    if (motion == MotionType::Parallel || motion == MotionType::Contrary) {
      findings.push_back(pairFinding(upper, lower, motion));
    }
  }
  return Detection::found(std::move(findings));
}

Detection detectDirectPerfect(const ProgressionPair& pair, bool fifths) {
  std::vector<Finding> findings;
  for (const auto& [upper, lower] : kVoicePairs) {
    auto pitches = pairPitches(pair, upper, lower);
    if (!pitches) continue;

    bool arrives = fifths ? isPerfectFifth(pitches->upper2, pitches->lower2)
                          : isOctaveClass(pitches->upper2, pitches->lower2);
    if (!arrives) continue;

    bool already_there =
        fifths ? (isPerfectFifth(pitches->upper1, pitches->lower1) ||
                  isDiminishedFifth(pitches->upper1, pitches->lower1))
               : isOctaveClass(pitches->upper1, pitches->lower1);
    if (already_there) continue;

    if (pairMotion(*pitches) == MotionType::Parallel) {
      findings.push_back(pairFinding(upper, lower, MotionType::Parallel));
    }
  }
  return Detection::found(std::move(findings));
}

Detection detectUnequalFifths(const ProgressionPair& pair) {
  static constexpr Voice kAgainstBass[] = {Voice::Soprano, Voice::Alto, Voice::Tenor};
  std::vector<Finding> findings;
  for (Voice other : kAgainstBass) {
    auto pitches = pairPitches(pair, other, Voice::Bass);
    if (!pitches) continue;
    if (isDiminishedFifth(pitches->lower1, pitches->upper1) &&
        isPerfectFifth(pitches->lower2, pitches->upper2)) {
      Finding finding;
      finding.voices = {Voice::Bass, other};
      finding.motion = pairMotion(*pitches);
      findings.push_back(std::move(finding));
    }
  }
  return Detection::found(std::move(findings));
}

// ---------------------------------------------------------------------------
// Tendency tones
// ---------------------------------------------------------------------------

/// Roots a perfect fourth or fifth apart, by spelled letter names.
bool rootsMoveByFourthOrFifth(const ChordAnalysis& first, const ChordAnalysis& second) {
  const auto& root1 = first.model.rootPitch();
  const auto& root2 = second.model.rootPitch();
  if (!root1 || !root2) return false;
  auto name = intervalBetween(Pitch{root1->letter, root1->accidental, 4},
                              Pitch{root2->letter, root2->accidental, 4})
                  .simpleName();
  return name == "P4" || name == "P5";
}

Detection detectLeadingTone(const ProgressionPair& pair) {
  const ChordAnalysis& first = pair.first;
  const ChordAnalysis& second = pair.second;
  bool secondary = first.chromatic == ChromaticKind::SecondaryDominant;
  if (first.degree == 3 && !secondary) return Detection::none();

  const int leading_tone_pc = normalizePitchClass(pair.key.tonicPitchClass() + 11);
  const bool tonal_context = first.degree == 5 || first.degree == 7;
  const bool local_context = !first.model.isIndeterminate() &&
                             (secondary || !first.is_diatonic) &&
                             rootsMoveByFourthOrFifth(first, second);
  if (!tonal_context && !local_context) return Detection::none();

  const int local_pc = normalizePitchClass(first.rootPitchClass() + interval::kMajor3rd);
  std::vector<Finding> findings;
  for (Voice voice : kAllVoices) {
    const auto& from = first.snapshot().pitch(voice);
    if (!from) continue;

    bool tonal = tonal_context && from->pitchClass() == leading_tone_pc;
    bool local = !tonal && local_context && from->pitchClass() == local_pc;
    if (!tonal && !local) continue;

    const auto& to = second.snapshot().pitch(voice);
    if (!to) continue;
    if (to->pitchClass() == pair.key.tonicPitchClass() || semitones(*from, *to) == 1) continue;

    Finding finding;
    finding.voices = {voice};
    finding.local_leading_tone = local;
    finding.detail = pitchToString(*from) + "->" + pitchToString(*to);
    findings.push_back(std::move(finding));
  }
  return Detection::found(std::move(findings));
}

Detection detectSeventhResolution(const ProgressionPair& pair) {
  if (!pair.first.has_seventh) return Detection::none();

  std::vector<Finding> findings;
  for (Voice voice : pair.first.model.voicesWithFactor(ChordFactor::Seventh)) {
    const auto& from = pair.first.snapshot().pitch(voice);
    const auto& to = pair.second.snapshot().pitch(voice);
    if (!from || !to) continue;
    int move = semitones(*from, *to);
    if (move == -1 || move == -2) continue;

    Finding finding;
    finding.voices = {voice};
    finding.detail = pitchToString(*from) + "->" + pitchToString(*to);
    findings.push_back(std::move(finding));
  }
  return Detection::found(std::move(findings));
}

// ---------------------------------------------------------------------------
// Spacing
// ---------------------------------------------------------------------------

Detection detectVoiceCrossing(const ProgressionPair& pair) {
  const auto& chord = pair.first.snapshot();
  std::vector<Finding> findings;
  for (const auto& [lower, upper] : kAdjacentPairs) {
    if (!chord.has(lower) || !chord.has(upper)) continue;
    if (chord.pitch(lower)->value() > chord.pitch(upper)->value()) {
      Finding finding;
      finding.voices = {lower, upper};
      findings.push_back(std::move(finding));
    }
  }
  return Detection::found(std::move(findings));
}

Detection detectMaximumDistance(const ProgressionPair& pair) {
  static constexpr std::pair<Voice, Voice> kUpperPairs[] = {
      {Voice::Alto, Voice::Soprano}, {Voice::Tenor, Voice::Alto}};
  const auto& chord = pair.first.snapshot();
  std::vector<Finding> findings;
  for (const auto& [lower, upper] : kUpperPairs) {
    if (!chord.has(lower) || !chord.has(upper)) continue;
    int gap = std::abs(chord.pitch(upper)->value() - chord.pitch(lower)->value());
    if (gap > interval::kOctave) {
      Finding finding;
      finding.voices = {lower, upper};
      finding.detail = std::to_string(gap) + " semitones";
      findings.push_back(std::move(finding));
    }
  }
  return Detection::found(std::move(findings));
}

Detection detectVoiceOverlap(const ProgressionPair& pair) {
  std::vector<Finding> findings;
  for (const auto& [lower, upper] : kAdjacentPairs) {
    auto pitches = pairPitches(pair, upper, lower);
    if (!pitches) continue;

    const char* direction = nullptr;
    if (pitches->upper2.value() < pitches->lower1.value()) {
      direction = "descending";
    } else if (pitches->lower2.value() > pitches->upper1.value()) {
      direction = "ascending";
    }
    if (direction == nullptr) continue;

    Finding finding;
    finding.voices = {lower, upper};
    finding.detail = direction;
    findings.push_back(std::move(finding));
  }
  return Detection::found(std::move(findings));
}

// ---------------------------------------------------------------------------
// Doubling and omission
// ---------------------------------------------------------------------------

/// Doubled factor in chord 1, else in chord 2.
Detection detectDoubledFactor(const ProgressionPair& pair, ChordFactor factor,
                              bool dominant_only) {
  const ChordAnalysis* chords[] = {&pair.first, &pair.second};
  std::vector<Finding> findings;
  for (int idx = 0; idx < 2; ++idx) {
    const ChordAnalysis& chord = *chords[idx];
    if (dominant_only && !isDominantChord(chord)) continue;
    auto voices = chord.model.voicesWithFactor(factor);
    if (voices.size() > 1) {
      Finding finding;
      finding.voices = std::move(voices);
      finding.chord_index = idx;
      findings.push_back(std::move(finding));
    }
  }
  return Detection::found(std::move(findings));
}

Detection detectExcessiveMotion(const ProgressionPair& pair) {
  Finding finding;
  finding.chord_index = 1;
  for (Voice voice : kAllVoices) {
    auto move = voiceMovement(pair, voice);
    if (move && std::abs(*move) > interval::kOctave) finding.voices.push_back(voice);
  }
  if (finding.voices.empty()) return Detection::none();
  return Detection::found({finding});
}

Detection detectImproperOmission(const ProgressionPair& pair) {
  const ChordModel& chord = pair.first.model;
  // Indeterminate chords (including empty ones) have no factors to omit.
  if (chord.isIndeterminate()) return Detection::none();

  // Seventh templates require the seventh, so only the third can be missing.
  if (chord.hasFactor(ChordFactor::Third)) return Detection::none();

  Finding finding;
  finding.detail = "missing 3";
  finding.tier_override = RuleTier::Critical;
  return Detection::found({finding});
}

}  // namespace

Detection detectViolation(RuleId rule, const ProgressionPair& pair) {
  switch (rule) {
    case RuleId::ParallelFifths:         return detectParallelPerfect(pair, true);
    case RuleId::ParallelOctaves:        return detectParallelPerfect(pair, false);
    case RuleId::DirectFifths:           return detectDirectPerfect(pair, true);
    case RuleId::DirectOctaves:          return detectDirectPerfect(pair, false);
    case RuleId::UnequalFifths:          return detectUnequalFifths(pair);
    case RuleId::LeadingToneResolution:  return detectLeadingTone(pair);
    case RuleId::SeventhResolution:      return detectSeventhResolution(pair);
    case RuleId::VoiceCrossing:          return detectVoiceCrossing(pair);
    case RuleId::MaximumDistance:        return detectMaximumDistance(pair);
    case RuleId::VoiceOverlap:           return detectVoiceOverlap(pair);
    case RuleId::DuplicatedLeadingTone:
      return detectDoubledFactor(pair, ChordFactor::Third, true);
    case RuleId::DuplicatedSeventh:
      return detectDoubledFactor(pair, ChordFactor::Seventh, false);
    case RuleId::ExcessiveMelodicMotion: return detectExcessiveMotion(pair);
    case RuleId::ImproperOmission:       return detectImproperOmission(pair);
  }
  return Detection::failed("unknown rule");
}

}  // namespace satb
