// Chord model: root and quality inference, per-voice chord factors,
// inversion, and factor queries over a ChordSnapshot.

#ifndef SATB_HARMONY_CHORD_MODEL_H
#define SATB_HARMONY_CHORD_MODEL_H

#include <array>
#include <optional>
#include <vector>

#include "core/pitch.h"
#include "core/voice.h"
#include "harmony/chord_snapshot.h"
#include "harmony/chord_types.h"

namespace satb {

/// @brief Outcome of matching a pitch-class set against the chord templates.
struct RootInference {
  int root_pc = 0;
  ChordQuality quality = ChordQuality::Unknown;
  bool has_ninth = false;
};

/// @brief Infer root and quality from distinct pitch classes.
///
/// Candidates are tried in the given order (callers pass bass first).
/// Seventh templates win over triads; within a template size the table order
/// decides, then candidate order. A second pass lets intervals 1 and 2 act
/// as an added ninth.
///
/// @param pitch_classes Distinct pitch classes, preferred root first.
/// @return The inference, or std::nullopt for fewer than two pitch classes
///         or when no template matches.
std::optional<RootInference> inferRoot(const std::vector<int>& pitch_classes);

/// @brief Chord factor of an interval above the root.
/// @param semitones_above_root Semitones from root to note (any integer).
/// @param quality Chord quality; in a diminished seventh 9 semitones is '7'.
/// @return 0 -> root, {3,4} -> 3rd, {6,7,8} -> 5th, {10,11} -> 7th,
///         {1,2} -> 9th, otherwise Unknown.
ChordFactor factorForInterval(int semitones_above_root, ChordQuality quality);

/// @brief Chord factor of a pitch relative to a root pitch class.
///
/// Octave-invariant: only the pitch class of `pitch` matters.
ChordFactor chordFactor(const Pitch& pitch, int root_pc,
                        ChordQuality quality = ChordQuality::Unknown);

/// @brief Inversion number for the factor in the bass: 1->0, 3->1, 5->2, 7->3.
/// Anything else maps to 0.
int inversionForBassFactor(ChordFactor bass_factor);

/// @brief Derived harmonic structure of one snapshot (key independent).
class ChordModel {
 public:
  ChordModel() = default;

  /// @brief Infer root, quality, factors and inversion for a snapshot.
  explicit ChordModel(const ChordSnapshot& snapshot);

  const ChordSnapshot& snapshot() const { return snapshot_; }

  int rootPitchClass() const { return root_pc_; }

  /// @brief Spelled root: the lowest voice carrying the root pitch class.
  ///        For indeterminate chords this is the lowest sounding pitch.
  const std::optional<Pitch>& rootPitch() const { return root_pitch_; }

  ChordQuality quality() const { return quality_; }

  /// @brief True when no template matched (quality Unknown).
  bool isIndeterminate() const { return quality_ == ChordQuality::Unknown; }

  bool hasNinth() const { return has_ninth_; }
  bool hasSeventh() const { return isSeventhQuality(quality_); }

  /// @brief Inversion (0-3) from the factor in the bass voice.
  int inversion() const { return inversion_; }

  /// @brief Factor of a voice, or std::nullopt if the voice is silent.
  const std::optional<ChordFactor>& factor(Voice voice) const {
    return factors_[static_cast<size_t>(voiceIndex(voice))];
  }

  /// @brief Voices carrying a factor, top down.
  std::vector<Voice> voicesWithFactor(ChordFactor factor) const;

  bool hasFactor(ChordFactor factor) const;

  /// @brief True when root, third and fifth are all present.
  bool isComplete() const;

  /// @brief Factors carried by more than one voice, in factor order.
  std::vector<ChordFactor> doubledFactors() const;

  /// @brief Missing triad members (root, third, fifth). A seventh chord
  ///        never lacks its seventh, since inference requires it.
  std::vector<ChordFactor> missingFactors() const;

  /// @brief Distinct pitch classes, bass first.
  std::vector<int> pitchClasses() const { return snapshot_.pitchClasses(); }

 private:
  ChordSnapshot snapshot_;
  int root_pc_ = 0;
  std::optional<Pitch> root_pitch_;
  ChordQuality quality_ = ChordQuality::Unknown;
  bool has_ninth_ = false;
  int inversion_ = 0;
  std::array<std::optional<ChordFactor>, kVoiceCount> factors_{};
};

// ---------------------------------------------------------------------------
// Factor movement across a pair of chords
// ---------------------------------------------------------------------------

/// @brief How one voice changes chord factor from one chord to the next.
struct FactorMovement {
  ChordFactor from = ChordFactor::Unknown;
  ChordFactor to = ChordFactor::Unknown;
};

/// @brief Factor movement of a voice, or std::nullopt if it is silent in
///        either chord.
std::optional<FactorMovement> factorMovement(const ChordModel& first,
                                             const ChordModel& second, Voice voice);

/// @brief Voices moving from one factor to another (e.g. 7 -> 3), top down.
std::vector<Voice> voicesWithMovement(const ChordModel& first, const ChordModel& second,
                                      ChordFactor from, ChordFactor to);

}  // namespace satb

#endif  // SATB_HARMONY_CHORD_MODEL_H
