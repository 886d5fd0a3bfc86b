/// @file
/// @brief Implementation of the spelled pitch model and note-name parsing.

#include "core/pitch.h"

#include <cctype>

#include "core/pitch_utils.h"

namespace satb {

// ---------------------------------------------------------------------------
// Pitch members
// ---------------------------------------------------------------------------

int Pitch::value() const {
  return (static_cast<int>(octave) + 1) * 12 + letterPitchClass(letter) +
         static_cast<int>(accidental);
}

int Pitch::pitchClass() const {
  return normalizePitchClass(value());
}

int Pitch::diatonicIndex() const {
  return static_cast<int>(octave) * 7 + static_cast<int>(letter);
}

// ---------------------------------------------------------------------------
// Construction and parsing
// ---------------------------------------------------------------------------

std::optional<Pitch> makePitch(Letter letter, int accidental, int octave) {
  if (accidental < kMinAccidental || accidental > kMaxAccidental) return std::nullopt;
  if (octave < kMinOctave || octave > kMaxOctave) return std::nullopt;

  Pitch pitch;
  pitch.letter = letter;
  pitch.accidental = static_cast<int8_t>(accidental);
  pitch.octave = static_cast<int8_t>(octave);

  int val = pitch.value();
  if (val < kMinSemitoneValue || val > kMaxSemitoneValue) return std::nullopt;
  return pitch;
}

std::optional<Pitch> pitchFromString(const std::string& text) {
  if (text.empty()) return std::nullopt;

  auto letter = letterFromChar(text[0]);
  if (!letter) return std::nullopt;

  size_t pos = 1;
  int accidental = 0;
  while (pos < text.size() && (text[pos] == '#' || text[pos] == 'b')) {
    accidental += (text[pos] == '#') ? 1 : -1;
    // Mixed spellings such as "C#b4" are rejected.
    if (pos > 1 && text[pos] != text[pos - 1]) return std::nullopt;
    ++pos;
  }

  bool negative = false;
  if (pos < text.size() && text[pos] == '-') {
    negative = true;
    ++pos;
  }
  if (pos >= text.size()) return std::nullopt;

  int octave = 0;
  size_t digits = 0;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
    octave = octave * 10 + (text[pos] - '0');
    ++pos;
    ++digits;
    if (digits > 2) return std::nullopt;
  }
  if (digits == 0 || pos != text.size()) return std::nullopt;

  return makePitch(*letter, accidental, negative ? -octave : octave);
}

std::string pitchNameToString(Letter letter, int accidental) {
  std::string result(1, letterToChar(letter));
  char sign = accidental > 0 ? '#' : 'b';
  int count = accidental > 0 ? accidental : -accidental;
  result.append(static_cast<size_t>(count), sign);
  return result;
}

std::string pitchToString(const Pitch& pitch) {
  return pitchNameToString(pitch.letter, pitch.accidental) +
         std::to_string(static_cast<int>(pitch.octave));
}

// ---------------------------------------------------------------------------
// Free functions
// ---------------------------------------------------------------------------

int pitchClass(const Pitch& pitch) {
  return pitch.pitchClass();
}

int semitones(const Pitch& from, const Pitch& to) {
  return to.value() - from.value();
}

int letterPitchClass(Letter letter) {
  return kLetterPitchClass[static_cast<int>(letter)];
}

char letterToChar(Letter letter) {
  return kLetterNames[static_cast<int>(letter)];
}

std::optional<Letter> letterFromChar(char chr) {
  switch (std::toupper(static_cast<unsigned char>(chr))) {
    case 'C': return Letter::C;
    case 'D': return Letter::D;
    case 'E': return Letter::E;
    case 'F': return Letter::F;
    case 'G': return Letter::G;
    case 'A': return Letter::A;
    case 'B': return Letter::B;
    default:  return std::nullopt;
  }
}

Letter shiftLetter(Letter letter, int steps) {
  int idx = ((static_cast<int>(letter) + steps) % 7 + 7) % 7;
  return static_cast<Letter>(idx);
}

int letterDistance(Letter from, Letter to) {
  return ((static_cast<int>(to) - static_cast<int>(from)) % 7 + 7) % 7;
}

std::optional<int> accidentalForPitchClass(Letter letter, int pitch_class) {
  int diff = normalizePitchClass(pitch_class - letterPitchClass(letter));
  // Map 0..11 onto -6..5 so that e.g. 11 reads as one flat below.
  if (diff > 6) diff -= 12;
  if (diff < kMinAccidental || diff > kMaxAccidental) return std::nullopt;
  return diff;
}

}  // namespace satb
