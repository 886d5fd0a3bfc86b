// Functional chord classification: roman numerals, harmonic function,
// chromatic chord detection and figured-bass ciphers relative to a key.

#ifndef SATB_HARMONY_FUNCTIONAL_CLASSIFIER_H
#define SATB_HARMONY_FUNCTIONAL_CLASSIFIER_H

#include <optional>
#include <string>

#include "harmony/chord_model.h"
#include "harmony/chord_snapshot.h"
#include "harmony/chord_types.h"
#include "harmony/key_context.h"

namespace satb {

/// @brief Functional analysis of one chord in a key.
///
/// Produced by classifyChord() and read-only afterwards. The cipher always
/// agrees with the factor in the bass voice (through model.inversion()).
struct ChordAnalysis {
  ChordModel model;

  /// Roman numeral with accidental prefix and quality glyph ("V", "vii°",
  /// "bVI", "ii°"), or "N", "+6it"/"+6fr"/"+6al", or "?" when indeterminate.
  std::string numeral = "?";

  /// Target numeral of a secondary chord ("V" in V/V). Empty otherwise.
  std::string target;

  /// Non-diatonic chord that matched no chromatic pattern.
  bool uncertain = false;

  /// Root scale degree by letter distance from the tonic (1-7), 0 if unknown.
  int degree = 0;

  HarmonicFunction function = HarmonicFunction::Tonic;
  bool is_diatonic = true;
  std::optional<ChromaticKind> chromatic;
  std::optional<AugmentedSixthType> augmented_sixth;
  std::string cipher;
  bool has_seventh = false;
  bool has_ninth = false;

  const ChordSnapshot& snapshot() const { return model.snapshot(); }
  int rootPitchClass() const { return model.rootPitchClass(); }
  ChordQuality quality() const { return model.quality(); }
  int inversion() const { return model.inversion(); }
  const std::optional<ChordFactor>& factor(Voice voice) const { return model.factor(voice); }

  /// @brief Numeral with secondary target and uncertainty marker ("V/V", "IV?").
  std::string label() const;

  /// @brief Numeral with cipher; for secondary chords the cipher precedes
  ///        the slash ("V7,+/V", "vii°7t/V", "N6", "IV6?").
  std::string displayLabel() const;
};

/// @brief Roman numeral for a degree and quality, without accidental prefix.
///
/// Upper case for major, augmented, dominant and major-seventh qualities;
/// lower case otherwise. Diminished qualities take "°", half-diminished "ø",
/// augmented "+".
std::string romanNumeral(int degree, ChordQuality quality);

/// @brief Classify a chord in a key.
///
/// Chromatic patterns are tried in priority order (secondary dominant,
/// Neapolitan, augmented sixth, modal borrowing) before the diatonic
/// fallback. Indeterminate chords get numeral "?", degree 0, tonic function
/// and no chromatic tag.
ChordAnalysis classifyChord(const ChordSnapshot& snapshot, const KeyContext& key);

/// @brief Classify an already-built chord model.
ChordAnalysis classifyChord(const ChordModel& model, const KeyContext& key);

}  // namespace satb

#endif  // SATB_HARMONY_FUNCTIONAL_CLASSIFIER_H
