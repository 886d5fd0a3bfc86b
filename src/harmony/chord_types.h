// Chord vocabulary for harmonic analysis: qualities, factors, functions,
// and chromatic categories.

#ifndef SATB_HARMONY_CHORD_TYPES_H
#define SATB_HARMONY_CHORD_TYPES_H

#include <cstdint>
#include <optional>

namespace satb {

/// Quality of a chord (triad or seventh), as inferred from its pitch classes.
enum class ChordQuality : uint8_t {
  Major,
  Minor,
  Diminished,
  Augmented,
  Dominant7,
  Diminished7,       // Fully diminished seventh (dim3 + dim3 + dim3)
  HalfDiminished7,   // Half-diminished seventh (min3 + dim3 + maj3)
  MajorMajor7,
  Minor7,
  AugmentedSixth,    // French augmented sixth spelled from its own root
  Unknown            // No template matched (indeterminate chord)
};

/// Role a voice plays relative to the chord root.
enum class ChordFactor : uint8_t {
  Root,
  Third,
  Fifth,
  Seventh,
  Ninth,
  Unknown
};

/// Functional category of a chord within the key.
enum class HarmonicFunction : uint8_t {
  Tonic,        // I, vi, iii
  Subdominant,  // ii, IV, N, augmented sixths, most borrowed chords
  Dominant      // V, vii, secondary dominants
};

/// Chromatic chord categories recognized before the diatonic fallback.
enum class ChromaticKind : uint8_t {
  SecondaryDominant,
  Neapolitan,
  AugmentedSixth,
  Borrowed
};

/// Augmented-sixth chord nationality.
enum class AugmentedSixthType : uint8_t { Italian, French, German };

/// @brief Convert ChordQuality to a lowercase identifier ("dominant7", ...).
const char* chordQualityToString(ChordQuality quality);

/// @brief True for four-note qualities whose top factor is a seventh.
///
/// The French augmented sixth is excluded: its "seventh" is part of the
/// augmented sixth, not a dissonance requiring resolution.
bool isSeventhQuality(ChordQuality quality);

/// @brief Single-character factor label ('1', '3', '5', '7', '9', '?').
char chordFactorToChar(ChordFactor factor);

/// @brief Parse a factor label character.
std::optional<ChordFactor> chordFactorFromChar(char chr);

/// @brief Convert HarmonicFunction to a lowercase string ("tonic", ...).
const char* harmonicFunctionToString(HarmonicFunction func);

/// @brief Harmonic function of a root scale degree (1-7).
///
/// {1, 6} -> tonic, {2, 4} -> subdominant, {5, 7} -> dominant. Degree 3 is
/// ambiguous between tonic and dominant and is classified as tonic. Any
/// other value (including 0 for unknown roots) also yields tonic.
HarmonicFunction functionForDegree(int degree);

/// @brief Convert ChromaticKind to its report tag ("secondary_dominant", ...).
const char* chromaticKindToString(ChromaticKind kind);

/// @brief Figured label of an augmented-sixth type ("+6it", "+6fr", "+6al").
const char* augmentedSixthLabel(AugmentedSixthType type);

}  // namespace satb

#endif  // SATB_HARMONY_CHORD_TYPES_H
