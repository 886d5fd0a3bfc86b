// Four-voice chord snapshot: one optional pitch per SATB voice.

#ifndef SATB_HARMONY_CHORD_SNAPSHOT_H
#define SATB_HARMONY_CHORD_SNAPSHOT_H

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "core/pitch.h"
#include "core/voice.h"

namespace satb {

/// @brief Invalid-pitch error, local to one voice of one chord.
struct PitchError {
  Voice voice = Voice::Soprano;
  std::string input;   ///< The text that failed to parse.
  std::string reason;  ///< Short description ("invalid pitch", ...).
};

/// @brief The sounding pitches of one beat, indexed by voice.
///
/// Voices may be absent. A snapshot is a plain value: once built it is never
/// modified in place.
class ChordSnapshot {
 public:
  ChordSnapshot() = default;

  /// @brief Build from pitches listed top down (S, A, T, B).
  ChordSnapshot(std::optional<Pitch> soprano, std::optional<Pitch> alto,
                std::optional<Pitch> tenor, std::optional<Pitch> bass);

  /// @brief Pitch of a voice, or std::nullopt if the voice is silent.
  const std::optional<Pitch>& pitch(Voice voice) const {
    return voices_[static_cast<size_t>(voiceIndex(voice))];
  }

  /// @brief True if the voice sounds in this chord.
  bool has(Voice voice) const { return pitch(voice).has_value(); }

  /// @brief Number of sounding voices (0-4).
  int voiceCount() const;

  /// @brief Distinct pitch classes, ordered from the lowest part upward
  ///        (bass first), first occurrence wins.
  std::vector<int> pitchClasses() const;

  /// @brief Lowest-part voice that sounds (bass, else tenor, ...).
  std::optional<Voice> lowestVoice() const;

  /// @brief Space-separated note names top down, '-' for silent voices.
  std::string toString() const;

  bool operator==(const ChordSnapshot& other) const { return voices_ == other.voices_; }
  bool operator!=(const ChordSnapshot& other) const { return !(*this == other); }

 private:
  std::array<std::optional<Pitch>, kVoiceCount> voices_{};
};

/// @brief Result of building a snapshot from voice text.
///
/// Exactly one of snapshot / errors is populated: any invalid voice excludes
/// the whole chord.
struct SnapshotParseResult {
  std::optional<ChordSnapshot> snapshot;
  std::vector<PitchError> errors;

  bool ok() const { return snapshot.has_value(); }
};

/// @brief Build a snapshot from four note names listed top down.
///
/// An empty string or "-" marks a silent voice. Every malformed voice is
/// reported, not just the first one.
SnapshotParseResult snapshotFromNames(const std::array<std::string, kVoiceCount>& names);

/// @brief Build a snapshot from a whitespace-separated "S A T B" string,
///        e.g. "F4 D4 B3 G2" or "E4 - C4 C3".
SnapshotParseResult snapshotFromString(const std::string& text);

}  // namespace satb

#endif  // SATB_HARMONY_CHORD_SNAPSHOT_H
