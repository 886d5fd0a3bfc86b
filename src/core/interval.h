// Spelled interval naming and voice-pair motion classification.
//
// Interval names are derived from letter distance (generic size) and the
// semitone deviation from the diatonic size (quality), so a descending minor
// sixth and an ascending augmented fifth never compare equal even though
// both span eight semitones.

#ifndef SATB_CORE_INTERVAL_H
#define SATB_CORE_INTERVAL_H

#include <cstdint>
#include <string>

#include "core/pitch.h"

namespace satb {

// ---------------------------------------------------------------------------
// Interval
// ---------------------------------------------------------------------------

/// Interval quality, from doubly diminished to doubly augmented.
enum class IntervalQuality : uint8_t {
  DoublyDiminished,
  Diminished,
  Minor,
  Perfect,
  Major,
  Augmented,
  DoublyAugmented,
  Unknown  ///< Deviation too large to name.
};

/// @brief Short quality prefix used in interval names ("P", "m", "A", ...).
/// @param quality The interval quality.
/// @return Null-terminated prefix. "?" for Unknown.
const char* intervalQualityPrefix(IntervalQuality quality);

/// @brief A spelled interval between two pitches, measured low to high.
struct Interval {
  int generic = 1;    ///< Compound generic size (1 = unison, 8 = octave, 12 = twelfth).
  int semitones = 0;  ///< Span from the lower to the upper spelled pitch.
  IntervalQuality quality = IntervalQuality::Perfect;

  /// @brief Generic size reduced into one octave. Unison stays 1; octaves
  ///        and compound octaves reduce to 8.
  int simpleGeneric() const;

  /// @brief Reduced name such as "P5", "d5", "A5", "P8", "m3".
  std::string simpleName() const;

  /// @brief Unreduced name such as "P12" or "M10".
  std::string name() const;
};

/// @brief Build the interval between two pitches, ignoring their order.
///
/// The pitches are ordered by staff position (then by semitone value) so
/// that intervalBetween(a, b) and intervalBetween(b, a) are identical.
Interval intervalBetween(const Pitch& first, const Pitch& second);

/// @brief Simple interval name between two pitches ("P5", "M3", ...).
std::string intervalName(const Pitch& first, const Pitch& second);

/// @brief True if the pitches form a perfect fifth (simple or compound).
bool isPerfectFifth(const Pitch& first, const Pitch& second);

/// @brief True if the pitches form a diminished fifth (simple or compound).
bool isDiminishedFifth(const Pitch& first, const Pitch& second);

/// @brief True if the pitches form a perfect or augmented fifth.
bool isFifthClass(const Pitch& first, const Pitch& second);

/// @brief True if the pitches form a perfect octave or perfect unison.
bool isOctaveClass(const Pitch& first, const Pitch& second);

// ---------------------------------------------------------------------------
// Motion classification
// ---------------------------------------------------------------------------

/// @brief Relative motion of two voices between successive chords.
enum class MotionType : uint8_t {
  Parallel,  ///< Both voices move in the same direction.
  Contrary,  ///< Both voices move, in opposite directions.
  Oblique,   ///< Exactly one voice moves.
  Static     ///< Neither voice moves.
};

/// @brief Convert MotionType to a lowercase string ("parallel", ...).
const char* motionTypeToString(MotionType type);

/// @brief Classify the motion of two voices.
/// @param prev1 Voice 1 in the first chord.
/// @param curr1 Voice 1 in the second chord.
/// @param prev2 Voice 2 in the first chord.
/// @param curr2 Voice 2 in the second chord.
/// @return Classified motion type (direction only, not interval size).
MotionType classifyMotion(const Pitch& prev1, const Pitch& curr1,
                          const Pitch& prev2, const Pitch& curr2);

}  // namespace satb

#endif  // SATB_CORE_INTERVAL_H
