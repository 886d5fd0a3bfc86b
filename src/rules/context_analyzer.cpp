// Implementation of the shared rule-context predicates.

#include "rules/context_analyzer.h"

#include <set>
#include <string>

namespace satb {

namespace {

std::set<int> pitchClassSet(const ChordAnalysis& chord) {
  auto classes = chord.model.pitchClasses();
  return std::set<int>(classes.begin(), classes.end());
}

std::set<std::string> pitchSet(const ChordAnalysis& chord) {
  std::set<std::string> result;
  for (Voice voice : kAllVoices) {
    const auto& pitch = chord.snapshot().pitch(voice);
    if (pitch) result.insert(pitchToString(*pitch));
  }
  return result;
}

}  // namespace

bool isVoicingChange(const ChordAnalysis& first, const ChordAnalysis& second) {
  if (first.rootPitchClass() != second.rootPitchClass()) return false;
  if (first.quality() != second.quality()) return false;
  if (first.inversion() != second.inversion()) return false;
  if (pitchClassSet(first) != pitchClassSet(second)) return false;
  return pitchSet(first) != pitchSet(second);
}

bool isDominantPair(const ChordAnalysis& first, const ChordAnalysis& second) {
  bool degrees_match = (first.degree == 5 && second.degree == 7) ||
                       (first.degree == 7 && second.degree == 5);
  if (!degrees_match) return false;

  return first.function == HarmonicFunction::Dominant ||
         second.function == HarmonicFunction::Dominant;
}

bool isDominantChord(const ChordAnalysis& chord) {
  if (chord.chromatic == ChromaticKind::SecondaryDominant) return true;
  if (chord.chromatic) return false;
  return chord.numeral == "V" || chord.numeral == "vii°";
}

}  // namespace satb
