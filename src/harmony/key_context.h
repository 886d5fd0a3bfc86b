// Key context for harmonic analysis: tonic, mode, diatonic set, degree lookup.

#ifndef SATB_HARMONY_KEY_CONTEXT_H
#define SATB_HARMONY_KEY_CONTEXT_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "core/pitch.h"

namespace satb {

/// Mode of a key.
enum class Mode : uint8_t { Major, Minor };

/// @brief Convert Mode to a lowercase string ("major" / "minor").
const char* modeToString(Mode mode);

/// @brief Active tonality for one analysis session.
///
/// Holds a spelled tonic (letter + accidental) so that chord roots can be
/// named by letter distance, plus the derived diatonic pitch-class set
/// (major scale, or natural minor scale for minor keys). The set is only
/// recomputed through setTonality().
class KeyContext {
 public:
  /// @brief C major.
  KeyContext();

  /// @brief Build a key from a spelled tonic and mode.
  /// @param tonic_letter Tonic letter.
  /// @param tonic_accidental Tonic accidental in [-2, 2].
  /// @param mode Major or minor.
  KeyContext(Letter tonic_letter, int tonic_accidental, Mode mode);

  /// @brief Replace tonic and mode and recompute the diatonic set.
  void setTonality(Letter tonic_letter, int tonic_accidental, Mode mode);

  Letter tonicLetter() const { return tonic_letter_; }
  int tonicAccidental() const { return tonic_accidental_; }
  int tonicPitchClass() const { return tonic_pc_; }
  Mode mode() const { return mode_; }
  bool isMinor() const { return mode_ == Mode::Minor; }

  /// @brief True if the pitch class belongs to the diatonic set.
  bool isDiatonic(int pitch_class) const;

  /// @brief Scale degree (1-7) of a diatonic pitch class.
  /// @return The degree, or std::nullopt when the pitch class is not diatonic.
  std::optional<int> scaleDegree(int pitch_class) const;

  /// @brief Scale degree (1-7) of a pitch, gated on diatonic membership.
  std::optional<int> scaleDegree(const Pitch& pitch) const;

  /// @brief Degree (1-7) by letter distance from the tonic letter.
  ///
  /// Unlike scaleDegree(), this ignores accidentals: F# and F are both
  /// degree 4 in C major.
  int letterDegree(Letter letter) const;

  /// @brief Pitch class of a scale degree (1-7).
  int degreePitchClass(int degree) const;

  /// @brief True for the raised sixth or seventh degree of a minor key
  ///        (A and B natural in C minor). Always false in major.
  bool isRaisedMinorDegree(int pitch_class) const;

  /// @brief Key-signature accidental count: positive = sharps, negative = flats.
  ///
  /// Minor keys report 0.
  int keySignatureAccidentals() const;

  /// @brief The parallel key (same tonic, other mode).
  KeyContext parallelKey() const;

  /// @brief The seven diatonic pitch classes in degree order.
  const std::array<int, 7>& diatonicSet() const { return scale_; }

  bool operator==(const KeyContext& other) const {
    return tonic_letter_ == other.tonic_letter_ &&
           tonic_accidental_ == other.tonic_accidental_ && mode_ == other.mode_;
  }
  bool operator!=(const KeyContext& other) const { return !(*this == other); }

 private:
  void recompute();

  Letter tonic_letter_ = Letter::C;
  int tonic_accidental_ = 0;
  Mode mode_ = Mode::Major;
  int tonic_pc_ = 0;
  std::array<int, 7> scale_{};
};

/// @brief Parse a key such as "C_major", "g_minor", "Bb major", "f#-minor".
///
/// The tonic is a letter with up to two '#' or 'b'; the mode word follows a
/// '_', '-' or space separator. A bare tonic is read as major.
///
/// @return The key, or std::nullopt on unrecognized input.
std::optional<KeyContext> keyContextFromString(const std::string& str);

/// @brief Format a key as "C_major" / "G_minor".
std::string keyContextToString(const KeyContext& key);

}  // namespace satb

#endif  // SATB_HARMONY_KEY_CONTEXT_H
