// Implementation of the rule exception predicates.

#include "rules/rule_exceptions.h"

#include <cstdlib>

#include "core/pitch_utils.h"
#include "rules/context_analyzer.h"

namespace satb {

namespace {

ExceptionOutcome fromBool(bool value) {
  return value ? ExceptionOutcome::applies() : ExceptionOutcome::doesNotApply();
}

/// Movement of a voice in the pair, or nullopt when silent in either chord.
std::optional<int> movement(const ProgressionPair& pair, Voice voice) {
  const auto& from = pair.first.snapshot().pitch(voice);
  const auto& to = pair.second.snapshot().pitch(voice);
  if (!from || !to) return std::nullopt;
  return semitones(*from, *to);
}

bool isOuterPair(const Finding& finding) {
  return finding.voices.size() == 2 &&
         ((finding.voices[0] == Voice::Soprano && finding.voices[1] == Voice::Bass) ||
          (finding.voices[0] == Voice::Bass && finding.voices[1] == Voice::Soprano));
}

/// Step includes a repeated note.
bool isStepOrHold(int move) {
  return std::abs(move) <= interval::kMajor2nd;
}

// ---------------------------------------------------------------------------
// Direct motion
// ---------------------------------------------------------------------------

ExceptionOutcome outerVoicesStepAndLeap(const ProgressionPair& pair, const Finding& finding) {
  if (!isOuterPair(finding)) return ExceptionOutcome::doesNotApply();
  auto soprano = movement(pair, Voice::Soprano);
  auto bass = movement(pair, Voice::Bass);
  if (!soprano || !bass) return ExceptionOutcome::failed("outer voice silent");
  int bass_leap = std::abs(*bass);
  return fromBool(isStepOrHold(*soprano) && bass_leap >= interval::kMinor3rd &&
                  bass_leap <= interval::kPerfect5th);
}

ExceptionOutcome outerVoicesLeadingTone(const ProgressionPair& pair, const Finding& finding) {
  if (!isOuterPair(finding)) return ExceptionOutcome::doesNotApply();
  auto soprano = movement(pair, Voice::Soprano);
  auto bass = movement(pair, Voice::Bass);
  if (!soprano || !bass) return ExceptionOutcome::failed("outer voice silent");
  return fromBool(*soprano == interval::kMinor2nd && *bass == interval::kPerfect4th);
}

ExceptionOutcome innerVoicesOneStep(const ProgressionPair& pair, const Finding& finding) {
  if (finding.voices.size() != 2) return ExceptionOutcome::failed("expected a voice pair");
  if (isOuterPair(finding)) return ExceptionOutcome::doesNotApply();
  auto first = movement(pair, finding.voices[0]);
  auto second = movement(pair, finding.voices[1]);
  if (!first || !second) return ExceptionOutcome::failed("voice silent");
  return fromBool(isStepOrHold(*first) != isStepOrHold(*second));
}

// ---------------------------------------------------------------------------
// Fifths against the bass
// ---------------------------------------------------------------------------

bool isTenth(const Pitch& lower, const Pitch& upper) {
  auto name = intervalBetween(lower, upper).simpleName();
  return name == "m3" || name == "M3" || name == "A3";
}

ExceptionOutcome parallelTenths(const ProgressionPair& pair) {
  const auto& first = pair.first.snapshot();
  const auto& second = pair.second.snapshot();
  if (!first.has(Voice::Soprano) || !first.has(Voice::Bass) || !second.has(Voice::Soprano) ||
      !second.has(Voice::Bass)) {
    return ExceptionOutcome::failed("outer voice silent");
  }
  const Pitch& soprano1 = *first.pitch(Voice::Soprano);
  const Pitch& bass1 = *first.pitch(Voice::Bass);
  const Pitch& soprano2 = *second.pitch(Voice::Soprano);
  const Pitch& bass2 = *second.pitch(Voice::Bass);
  return fromBool(isTenth(bass1, soprano1) && isTenth(bass2, soprano2) &&
                  classifyMotion(soprano1, soprano2, bass1, bass2) == MotionType::Parallel);
}

// ---------------------------------------------------------------------------
// Leading tone
// ---------------------------------------------------------------------------

ExceptionOutcome nonTonicDestination(const ProgressionPair& pair, const Finding& finding) {
  if (finding.local_leading_tone) return ExceptionOutcome::doesNotApply();
  const ChordAnalysis& second = pair.second;
  if (second.model.isIndeterminate()) return ExceptionOutcome::doesNotApply();
  const std::string& numeral = second.numeral;
  bool tonic = second.target.empty() && (numeral == "I" || numeral == "i");
  bool submediant =
      second.target.empty() && (numeral == "vi" || numeral == "VI" || numeral == "bVI");
  return fromBool(!tonic && !submediant);
}

ExceptionOutcome deceptiveBassResolution(const ProgressionPair& pair, const Finding& finding) {
  if (finding.voices.size() != 1) return ExceptionOutcome::failed("expected one voice");
  if (finding.voices[0] != Voice::Bass || finding.local_leading_tone) {
    return ExceptionOutcome::doesNotApply();
  }
  const ChordAnalysis& second = pair.second;
  return fromBool(!pair.key.isMinor() && second.numeral == "vi" && second.target.empty() &&
                  second.factor(Voice::Bass) == ChordFactor::Root);
}

ExceptionOutcome indirectResolution(const ProgressionPair& pair, const Finding& finding) {
  if (finding.voices.size() != 1) return ExceptionOutcome::failed("expected one voice");
  Voice voice = finding.voices[0];
  Voice above;
  if (voice == Voice::Alto) {
    above = Voice::Soprano;
  } else if (voice == Voice::Tenor) {
    above = Voice::Alto;
  } else {
    return ExceptionOutcome::doesNotApply();
  }
  const ChordAnalysis& second = pair.second;
  return fromBool(second.factor(voice) == ChordFactor::Fifth &&
                  second.factor(above) == ChordFactor::Root);
}

}  // namespace

ExceptionOutcome evaluateException(ExceptionKind kind, const ProgressionPair& pair,
                                   const Finding& finding) {
  switch (kind) {
    case ExceptionKind::DominantPair:
      return fromBool(isDominantPair(pair.first, pair.second));
    case ExceptionKind::VoicingChange:
      return fromBool(isVoicingChange(pair.first, pair.second));
    case ExceptionKind::OuterVoicesStepAndLeap:
      return outerVoicesStepAndLeap(pair, finding);
    case ExceptionKind::OuterVoicesLeadingTone:
      return outerVoicesLeadingTone(pair, finding);
    case ExceptionKind::InnerVoicesOneStep:
      return innerVoicesOneStep(pair, finding);
    case ExceptionKind::ParallelTenths:
      return parallelTenths(pair);
    case ExceptionKind::NonTonicDestination:
      return nonTonicDestination(pair, finding);
    case ExceptionKind::DeceptiveBassResolution:
      return deceptiveBassResolution(pair, finding);
    case ExceptionKind::IndirectResolution:
      return indirectResolution(pair, finding);
    case ExceptionKind::ChromaticChord:
      return fromBool(pair.first.chromatic.has_value());
  }
  return ExceptionOutcome::failed("unknown exception");
}

}  // namespace satb
