// Implementation of the key context and key-name parsing.

#include "harmony/key_context.h"

#include <cctype>

#include "core/pitch_utils.h"

namespace satb {

const char* modeToString(Mode mode) {
  switch (mode) {
    case Mode::Major: return "major";
    case Mode::Minor: return "minor";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// KeyContext
// ---------------------------------------------------------------------------

KeyContext::KeyContext() {
  recompute();
}

KeyContext::KeyContext(Letter tonic_letter, int tonic_accidental, Mode mode)
    : tonic_letter_(tonic_letter), tonic_accidental_(tonic_accidental), mode_(mode) {
  recompute();
}

void KeyContext::setTonality(Letter tonic_letter, int tonic_accidental, Mode mode) {
  tonic_letter_ = tonic_letter;
  tonic_accidental_ = tonic_accidental;
  mode_ = mode;
  recompute();
}

void KeyContext::recompute() {
  tonic_pc_ = normalizePitchClass(letterPitchClass(tonic_letter_) + tonic_accidental_);
  const int* steps = (mode_ == Mode::Minor) ? kScaleNaturalMinor : kScaleMajor;
  for (int idx = 0; idx < 7; ++idx) {
    scale_[static_cast<size_t>(idx)] = normalizePitchClass(tonic_pc_ + steps[idx]);
  }
}

bool KeyContext::isDiatonic(int pitch_class) const {
  return scaleDegree(pitch_class).has_value();
}

std::optional<int> KeyContext::scaleDegree(int pitch_class) const {
  int pc = normalizePitchClass(pitch_class);
  for (int idx = 0; idx < 7; ++idx) {
    if (scale_[static_cast<size_t>(idx)] == pc) return idx + 1;
  }
  return std::nullopt;
}

std::optional<int> KeyContext::scaleDegree(const Pitch& pitch) const {
  return scaleDegree(pitch.pitchClass());
}

int KeyContext::letterDegree(Letter letter) const {
  return letterDistance(tonic_letter_, letter) + 1;
}

int KeyContext::degreePitchClass(int degree) const {
  int idx = ((degree - 1) % 7 + 7) % 7;
  return scale_[static_cast<size_t>(idx)];
}

bool KeyContext::isRaisedMinorDegree(int pitch_class) const {
  if (mode_ != Mode::Minor) return false;
  int rel = pitchClassDistance(tonic_pc_, pitch_class);
  return rel == interval::kMajor6th || rel == interval::kMajor7th;
}

int KeyContext::keySignatureAccidentals() const {
  // TODO: derive minor signatures from the relative major once the expected
  // minor-key output is confirmed; minor keys currently report 0.
  if (mode_ == Mode::Minor) return 0;

  // Position of each natural letter on the circle of fifths, C = 0.
  static constexpr int kLetterFifths[7] = {0, 2, 4, -1, 1, 3, 5};
  return kLetterFifths[static_cast<int>(tonic_letter_)] + 7 * tonic_accidental_;
}

KeyContext KeyContext::parallelKey() const {
  return KeyContext(tonic_letter_, tonic_accidental_,
                    mode_ == Mode::Major ? Mode::Minor : Mode::Major);
}

// ---------------------------------------------------------------------------
// String conversion
// ---------------------------------------------------------------------------

std::optional<KeyContext> keyContextFromString(const std::string& str) {
  if (str.empty()) return std::nullopt;

  auto letter = letterFromChar(str[0]);
  if (!letter) return std::nullopt;

  size_t pos = 1;
  int accidental = 0;
  while (pos < str.size() && (str[pos] == '#' || str[pos] == 'b')) {
    accidental += (str[pos] == '#') ? 1 : -1;
    ++pos;
  }
  if (accidental < kMinAccidental || accidental > kMaxAccidental) return std::nullopt;

  if (pos == str.size()) return KeyContext(*letter, accidental, Mode::Major);

  char sep = str[pos];
  if (sep != '_' && sep != '-' && sep != ' ') return std::nullopt;

  std::string mode_part;
  for (size_t idx = pos + 1; idx < str.size(); ++idx) {
    mode_part.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(str[idx]))));
  }

  if (mode_part == "major") return KeyContext(*letter, accidental, Mode::Major);
  if (mode_part == "minor") return KeyContext(*letter, accidental, Mode::Minor);
  return std::nullopt;
}

std::string keyContextToString(const KeyContext& key) {
  return pitchNameToString(key.tonicLetter(), key.tonicAccidental()) + "_" +
         modeToString(key.mode());
}

}  // namespace satb
