// Implementation of chord vocabulary string conversion and lookups.

#include "harmony/chord_types.h"

namespace satb {

const char* chordQualityToString(ChordQuality quality) {
  switch (quality) {
    case ChordQuality::Major:           return "major";
    case ChordQuality::Minor:           return "minor";
    case ChordQuality::Diminished:      return "diminished";
    case ChordQuality::Augmented:       return "augmented";
    case ChordQuality::Dominant7:       return "dominant7";
    case ChordQuality::Diminished7:     return "diminished7";
    case ChordQuality::HalfDiminished7: return "half_diminished7";
    case ChordQuality::MajorMajor7:     return "major7";
    case ChordQuality::Minor7:          return "minor7";
    case ChordQuality::AugmentedSixth:  return "augmented_sixth";
    case ChordQuality::Unknown:         return "unknown";
  }
  return "unknown";
}

bool isSeventhQuality(ChordQuality quality) {
  switch (quality) {
    case ChordQuality::Dominant7:
    case ChordQuality::Diminished7:
    case ChordQuality::HalfDiminished7:
    case ChordQuality::MajorMajor7:
    case ChordQuality::Minor7:
      return true;
    default:
      return false;
  }
}

char chordFactorToChar(ChordFactor factor) {
  switch (factor) {
    case ChordFactor::Root:    return '1';
    case ChordFactor::Third:   return '3';
    case ChordFactor::Fifth:   return '5';
    case ChordFactor::Seventh: return '7';
    case ChordFactor::Ninth:   return '9';
    case ChordFactor::Unknown: return '?';
  }
  return '?';
}

std::optional<ChordFactor> chordFactorFromChar(char chr) {
  switch (chr) {
    case '1': return ChordFactor::Root;
    case '3': return ChordFactor::Third;
    case '5': return ChordFactor::Fifth;
    case '7': return ChordFactor::Seventh;
    case '9': return ChordFactor::Ninth;
    case '?': return ChordFactor::Unknown;
    default:  return std::nullopt;
  }
}

const char* harmonicFunctionToString(HarmonicFunction func) {
  switch (func) {
    case HarmonicFunction::Tonic:       return "tonic";
    case HarmonicFunction::Subdominant: return "subdominant";
    case HarmonicFunction::Dominant:    return "dominant";
  }
  return "tonic";
}

HarmonicFunction functionForDegree(int degree) {
  switch (degree) {
    case 1:
    case 6:
    case 3:  // Mediant: tonic substitute here, dominant in some readings.
      return HarmonicFunction::Tonic;
    case 2:
    case 4:
      return HarmonicFunction::Subdominant;
    case 5:
    case 7:
      return HarmonicFunction::Dominant;
    default:
      return HarmonicFunction::Tonic;
  }
}

const char* chromaticKindToString(ChromaticKind kind) {
  switch (kind) {
    case ChromaticKind::SecondaryDominant: return "secondary_dominant";
    case ChromaticKind::Neapolitan:        return "neapolitan";
    case ChromaticKind::AugmentedSixth:    return "augmented_sixth";
    case ChromaticKind::Borrowed:          return "borrowed";
  }
  return "none";
}

const char* augmentedSixthLabel(AugmentedSixthType type) {
  switch (type) {
    case AugmentedSixthType::Italian: return "+6it";
    case AugmentedSixthType::French:  return "+6fr";
    case AugmentedSixthType::German:  return "+6al";
  }
  return "+6";
}

}  // namespace satb
