// Spelled pitch value type: diatonic letter, accidental count, octave.

#ifndef SATB_CORE_PITCH_H
#define SATB_CORE_PITCH_H

#include <cstdint>
#include <optional>
#include <string>

namespace satb {

/// Diatonic letter name, in scale order starting from C.
enum class Letter : uint8_t { C = 0, D, E, F, G, A, B };

/// Accepted accidental range (double flat to double sharp).
constexpr int kMinAccidental = -2;
constexpr int kMaxAccidental = 2;

/// Accepted octave range (scientific pitch notation, C4 = middle C).
constexpr int kMinOctave = -1;
constexpr int kMaxOctave = 9;

/// @brief A spelled pitch. Immutable once created through makePitch().
///
/// The continuous semitone value follows MIDI numbering: C4 = 60.
/// B#3 and C4 share a semitone value but are distinct pitches.
struct Pitch {
  Letter letter = Letter::C;
  int8_t accidental = 0;  ///< +1 per sharp, -1 per flat.
  int8_t octave = 4;

  /// @brief Continuous semitone value ((octave + 1) * 12 + letter + accidental).
  int value() const;

  /// @brief Pitch class in [0, 11].
  int pitchClass() const;

  /// @brief Position on the diatonic staff (octave * 7 + letter index).
  int diatonicIndex() const;

  bool operator==(const Pitch& other) const {
    return letter == other.letter && accidental == other.accidental &&
           octave == other.octave;
  }
  bool operator!=(const Pitch& other) const { return !(*this == other); }
};

/// @brief Build a pitch, validating the accidental, octave, and semitone range.
/// @param letter Diatonic letter.
/// @param accidental Accidental count in [-2, 2].
/// @param octave Octave number in [-1, 9].
/// @return The pitch, or std::nullopt when any component is out of range.
std::optional<Pitch> makePitch(Letter letter, int accidental, int octave);

/// @brief Parse a note name such as "C4", "F#3", "Bb2", "Ebb5", "C##-1".
/// @param text Letter (either case), up to two '#' or 'b', then an octave.
/// @return The pitch, or std::nullopt for malformed or out-of-range input.
std::optional<Pitch> pitchFromString(const std::string& text);

/// @brief Format a pitch as a note name ("F#4").
std::string pitchToString(const Pitch& pitch);

/// @brief Format only the pitch name without octave ("F#").
std::string pitchNameToString(Letter letter, int accidental);

/// @brief Pitch class of a pitch (0-11).
int pitchClass(const Pitch& pitch);

/// @brief Signed semitone distance from one pitch to another.
/// @return Positive when `to` is higher than `from`.
int semitones(const Pitch& from, const Pitch& to);

/// @brief Pitch class of a natural letter.
int letterPitchClass(Letter letter);

/// @brief Upper-case letter character for a Letter.
char letterToChar(Letter letter);

/// @brief Parse a letter character (either case).
/// @return The letter, or std::nullopt for anything outside A-G.
std::optional<Letter> letterFromChar(char chr);

/// @brief Move a letter by a number of diatonic steps, wrapping around.
/// @param letter Starting letter.
/// @param steps Diatonic steps (negative moves down).
/// @return The resulting letter.
Letter shiftLetter(Letter letter, int steps);

/// @brief Number of diatonic steps going upward from one letter to another.
/// @return Steps in [0, 6].
int letterDistance(Letter from, Letter to);

/// @brief Accidental that spells a pitch class on a given letter.
/// @param letter The letter to spell on.
/// @param pitch_class Target pitch class (0-11).
/// @return Accidental in [-2, 2], or std::nullopt when the letter is too far.
std::optional<int> accidentalForPitchClass(Letter letter, int pitch_class);

}  // namespace satb

#endif  // SATB_CORE_PITCH_H
