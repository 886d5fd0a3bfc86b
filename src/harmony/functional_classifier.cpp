/// @file
/// @brief Roman-numeral labelling and chromatic chord detection.

#include "harmony/functional_classifier.h"

#include <algorithm>
#include <iterator>
#include <vector>

#include "core/pitch_utils.h"
#include "harmony/figured_bass.h"

namespace satb {

namespace {

constexpr const char* kUpperNumerals[7] = {"I", "II", "III", "IV", "V", "VI", "VII"};
constexpr const char* kLowerNumerals[7] = {"i", "ii", "iii", "iv", "v", "vi", "vii"};

// Diatonic triad numerals used to name secondary targets.
constexpr const char* kMajorTargets[7] = {"I", "ii", "iii", "IV", "V", "vi", "vii°"};
constexpr const char* kMinorTargets[7] = {"i", "ii°", "III", "iv", "V", "VI", "vii°"};

// Numerals a major key may borrow from its parallel minor.
constexpr const char* kBorrowableNumerals[] = {"i", "iv", "ii°", "v", "bIII", "bVI", "bVII"};

bool isUpperCaseQuality(ChordQuality quality) {
  switch (quality) {
    case ChordQuality::Major:
    case ChordQuality::Augmented:
    case ChordQuality::Dominant7:
    case ChordQuality::MajorMajor7:
    case ChordQuality::AugmentedSixth:
      return true;
    default:
      return false;
  }
}

const char* qualityGlyph(ChordQuality quality) {
  switch (quality) {
    case ChordQuality::Diminished:
    case ChordQuality::Diminished7:
      return "°";
    case ChordQuality::HalfDiminished7:
      return "ø";
    case ChordQuality::Augmented:
      return "+";
    default:
      return "";
  }
}

/// Signed distance of the root from the key's pitch on the same degree,
/// folded into [-6, 5].
int rootAlteration(int root_pc, int degree, const KeyContext& key) {
  int diff = pitchClassDistance(key.degreePitchClass(degree), root_pc);
  return diff > 5 ? diff - 12 : diff;
}

std::string alterationPrefix(int alteration) {
  if (alteration < 0) return std::string(static_cast<size_t>(-alteration), 'b');
  if (alteration > 0) return std::string(static_cast<size_t>(alteration), '#');
  return "";
}

bool isDominantShape(ChordQuality quality) {
  return quality == ChordQuality::Major || quality == ChordQuality::Dominant7;
}

bool isLeadingToneShape(ChordQuality quality) {
  return quality == ChordQuality::Diminished || quality == ChordQuality::Diminished7 ||
         quality == ChordQuality::HalfDiminished7;
}

bool contains(const std::vector<int>& values, int value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

// ---------------------------------------------------------------------------
// Chromatic detectors. Each fills the analysis and returns true on a match.
// ---------------------------------------------------------------------------

bool detectSecondaryDominant(ChordAnalysis& analysis, const KeyContext& key) {
  ChordQuality quality = analysis.quality();
  bool dominant = isDominantShape(quality);
  if (!dominant && !isLeadingToneShape(quality)) return false;
  if (analysis.is_diatonic) return false;

  int resolution = dominant ? interval::kPerfect4th : interval::kMinor2nd;
  int target_pc = normalizePitchClass(analysis.rootPitchClass() + resolution);
  auto target_degree = key.scaleDegree(target_pc);
  if (!target_degree || *target_degree < 2 || *target_degree > 6) return false;

  if (dominant) {
    analysis.numeral = "V";
  } else {
    analysis.numeral = quality == ChordQuality::HalfDiminished7 ? "viiø" : "vii°";
  }
  const auto& targets = key.isMinor() ? kMinorTargets : kMajorTargets;
  analysis.target = targets[*target_degree - 1];
  analysis.function = HarmonicFunction::Dominant;
  analysis.chromatic = ChromaticKind::SecondaryDominant;
  return true;
}

bool detectNeapolitan(ChordAnalysis& analysis, const KeyContext& key) {
  if (analysis.quality() != ChordQuality::Major) return false;
  int flat_two = normalizePitchClass(key.tonicPitchClass() + interval::kMinor2nd);
  if (analysis.rootPitchClass() != flat_two) return false;

  analysis.numeral = "N";
  analysis.cipher = figuredBassCipher(CipherCategory::Triad, analysis.inversion());
  analysis.function = HarmonicFunction::Subdominant;
  analysis.chromatic = ChromaticKind::Neapolitan;
  return true;
}

bool detectAugmentedSixth(ChordAnalysis& analysis, const KeyContext& key) {
  std::vector<int> rel;
  for (int pc : analysis.model.pitchClasses()) {
    rel.push_back(pitchClassDistance(key.tonicPitchClass(), pc));
  }
  // Tonic, flat sixth and sharp fourth form the Italian core.
  if (!contains(rel, 0) || !contains(rel, interval::kMinor6th) ||
      !contains(rel, interval::kTritone)) {
    return false;
  }

  std::optional<AugmentedSixthType> type;
  if (rel.size() == 3) {
    type = AugmentedSixthType::Italian;
  } else if (rel.size() == 4 && contains(rel, interval::kMinor3rd)) {
    type = AugmentedSixthType::German;
  } else if (rel.size() == 4 && contains(rel, interval::kMajor2nd)) {
    type = AugmentedSixthType::French;
  }
  if (!type) return false;

  analysis.numeral = augmentedSixthLabel(*type);
  analysis.cipher.clear();
  analysis.function = HarmonicFunction::Subdominant;
  analysis.chromatic = ChromaticKind::AugmentedSixth;
  analysis.augmented_sixth = type;
  // The upper note of the augmented sixth is not a seventh to resolve down.
  analysis.has_seventh = false;
  return true;
}

bool detectBorrowed(ChordAnalysis& analysis, const KeyContext& key, const std::string& prefix) {
  if (key.isMinor() || analysis.is_diatonic) return false;

  KeyContext parallel = key.parallelKey();
  for (int pc : analysis.model.pitchClasses()) {
    if (!parallel.isDiatonic(pc)) return false;
  }

  std::string numeral = prefix + romanNumeral(analysis.degree, analysis.quality());
  auto iter = std::find_if(std::begin(kBorrowableNumerals), std::end(kBorrowableNumerals),
                           [&numeral](const char* accepted) { return numeral == accepted; });
  if (iter == std::end(kBorrowableNumerals)) return false;

  analysis.numeral = numeral;
  if (numeral == "iv" || numeral == "ii°" || numeral == "bVI" || numeral == "bVII") {
    analysis.function = HarmonicFunction::Subdominant;
  } else {
    analysis.function = functionForDegree(analysis.degree);
  }
  analysis.chromatic = ChromaticKind::Borrowed;
  return true;
}

/// True when a non-diatonic chord is standard enough not to need the "?"
/// marker: raised 6th/7th in minor, or the major-key vii°7.
bool isConventionalAlteration(const ChordAnalysis& analysis, const KeyContext& key) {
  if (key.isMinor()) {
    for (int pc : analysis.model.pitchClasses()) {
      if (!key.isDiatonic(pc) && !key.isRaisedMinorDegree(pc)) return false;
    }
    return true;
  }
  int leading_tone = normalizePitchClass(key.tonicPitchClass() + interval::kMajor7th);
  return analysis.quality() == ChordQuality::Diminished7 &&
         analysis.rootPitchClass() == leading_tone;
}

}  // namespace

// ---------------------------------------------------------------------------
// ChordAnalysis
// ---------------------------------------------------------------------------

std::string ChordAnalysis::label() const {
  std::string result = numeral;
  if (!target.empty()) result += "/" + target;
  if (uncertain) result += "?";
  return result;
}

std::string ChordAnalysis::displayLabel() const {
  std::string result = numeral + cipher;
  if (!target.empty()) result += "/" + target;
  if (uncertain) result += "?";
  return result;
}

// ---------------------------------------------------------------------------
// Classification
// ---------------------------------------------------------------------------

std::string romanNumeral(int degree, ChordQuality quality) {
  if (degree < 1 || degree > 7) return "?";
  std::string result = isUpperCaseQuality(quality) ? kUpperNumerals[degree - 1]
                                                   : kLowerNumerals[degree - 1];
  result += qualityGlyph(quality);
  return result;
}

ChordAnalysis classifyChord(const ChordSnapshot& snapshot, const KeyContext& key) {
  return classifyChord(ChordModel(snapshot), key);
}

ChordAnalysis classifyChord(const ChordModel& model, const KeyContext& key) {
  ChordAnalysis analysis;
  analysis.model = model;

  auto pitch_classes = model.pitchClasses();
  analysis.is_diatonic = std::all_of(pitch_classes.begin(), pitch_classes.end(),
                                     [&key](int pc) { return key.isDiatonic(pc); });

  const auto& root = model.rootPitch();
  if (model.isIndeterminate() || !root) {
    analysis.numeral = "?";
    analysis.degree = 0;
    analysis.function = HarmonicFunction::Tonic;
    return analysis;
  }

  analysis.degree = key.letterDegree(root->letter);
  analysis.has_seventh = model.hasSeventh();
  analysis.has_ninth = model.hasNinth();
  analysis.cipher = figuredBassCipher(model.quality(), model.inversion(), model.hasNinth());

  int alteration = rootAlteration(model.rootPitchClass(), analysis.degree, key);
  bool raised_minor_degree = key.isMinor() && alteration > 0 &&
                             key.isRaisedMinorDegree(model.rootPitchClass());
  std::string prefix = raised_minor_degree ? "" : alterationPrefix(alteration);

  if (detectSecondaryDominant(analysis, key)) return analysis;
  if (detectNeapolitan(analysis, key)) return analysis;
  if (detectAugmentedSixth(analysis, key)) return analysis;
  if (detectBorrowed(analysis, key, prefix)) return analysis;

  analysis.numeral = prefix + romanNumeral(analysis.degree, model.quality());
  analysis.function = functionForDegree(analysis.degree);
  analysis.uncertain = !analysis.is_diatonic && !isConventionalAlteration(analysis, key);
  return analysis;
}

}  // namespace satb
