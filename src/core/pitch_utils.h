// Pitch utilities for SATB harmony analysis -- interval constants,
// scale tables, and pitch-class arithmetic.

#ifndef SATB_CORE_PITCH_UTILS_H
#define SATB_CORE_PITCH_UTILS_H

namespace satb {

// ---------------------------------------------------------------------------
// Interval constants (semitones)
// ---------------------------------------------------------------------------

namespace interval {

constexpr int kUnison = 0;
constexpr int kMinor2nd = 1;
constexpr int kMajor2nd = 2;
constexpr int kMinor3rd = 3;
constexpr int kMajor3rd = 4;
constexpr int kPerfect4th = 5;
constexpr int kTritone = 6;
constexpr int kPerfect5th = 7;
constexpr int kMinor6th = 8;
constexpr int kMajor6th = 9;
constexpr int kMinor7th = 10;
constexpr int kMajor7th = 11;
constexpr int kOctave = 12;

}  // namespace interval

// ---------------------------------------------------------------------------
// Scale interval arrays (semitones from tonic, 7 degrees)
// ---------------------------------------------------------------------------

constexpr int kScaleMajor[7] = {0, 2, 4, 5, 7, 9, 11};
constexpr int kScaleNaturalMinor[7] = {0, 2, 3, 5, 7, 8, 10};

/// Pitch class of each natural letter C D E F G A B.
constexpr int kLetterPitchClass[7] = {0, 2, 4, 5, 7, 9, 11};

/// Letter names in diatonic order.
constexpr char kLetterNames[7] = {'C', 'D', 'E', 'F', 'G', 'A', 'B'};

/// Lowest and highest continuous semitone value accepted for a pitch.
constexpr int kMinSemitoneValue = 0;
constexpr int kMaxSemitoneValue = 127;

// ---------------------------------------------------------------------------
// Pitch-class arithmetic
// ---------------------------------------------------------------------------

/// @brief Reduce any integer to a pitch class in [0, 11].
/// @param value Semitone value (may be negative).
/// @return Pitch class where C=0, C#=1, ..., B=11.
inline int normalizePitchClass(int value) {
  return ((value % 12) + 12) % 12;
}

/// @brief Ascending distance between two pitch classes.
/// @param from Starting pitch class.
/// @param to Destination pitch class.
/// @return Semitones (0-11) going upward from `from` to `to`.
inline int pitchClassDistance(int from, int to) {
  return normalizePitchClass(to - from);
}

}  // namespace satb

#endif  // SATB_CORE_PITCH_UTILS_H
