/// @file
/// @brief Implementation of ChordSnapshot and its text builders.

#include "harmony/chord_snapshot.h"

#include <algorithm>
#include <sstream>

namespace satb {

ChordSnapshot::ChordSnapshot(std::optional<Pitch> soprano, std::optional<Pitch> alto,
                             std::optional<Pitch> tenor, std::optional<Pitch> bass)
    : voices_{soprano, alto, tenor, bass} {}

int ChordSnapshot::voiceCount() const {
  return static_cast<int>(std::count_if(voices_.begin(), voices_.end(),
                                        [](const std::optional<Pitch>& p) {
                                          return p.has_value();
                                        }));
}

std::vector<int> ChordSnapshot::pitchClasses() const {
  std::vector<int> result;
  for (auto iter = voices_.rbegin(); iter != voices_.rend(); ++iter) {
    if (!iter->has_value()) continue;
    int pc = (*iter)->pitchClass();
    if (std::find(result.begin(), result.end(), pc) == result.end()) {
      result.push_back(pc);
    }
  }
  return result;
}

std::optional<Voice> ChordSnapshot::lowestVoice() const {
  for (int idx = kVoiceCount - 1; idx >= 0; --idx) {
    if (voices_[static_cast<size_t>(idx)].has_value()) {
      return kAllVoices[static_cast<size_t>(idx)];
    }
  }
  return std::nullopt;
}

std::string ChordSnapshot::toString() const {
  std::string result;
  for (size_t idx = 0; idx < voices_.size(); ++idx) {
    if (idx > 0) result += ' ';
    result += voices_[idx] ? pitchToString(*voices_[idx]) : "-";
  }
  return result;
}

// ---------------------------------------------------------------------------
// Builders
// ---------------------------------------------------------------------------

SnapshotParseResult snapshotFromNames(const std::array<std::string, kVoiceCount>& names) {
  SnapshotParseResult result;
  std::array<std::optional<Pitch>, kVoiceCount> pitches{};

  for (size_t idx = 0; idx < names.size(); ++idx) {
    const std::string& name = names[idx];
    if (name.empty() || name == "-") continue;

    auto pitch = pitchFromString(name);
    if (!pitch) {
      result.errors.push_back({kAllVoices[idx], name, "invalid pitch"});
      continue;
    }
    pitches[idx] = *pitch;
  }

  if (result.errors.empty()) {
    result.snapshot = ChordSnapshot(pitches[0], pitches[1], pitches[2], pitches[3]);
  }
  return result;
}

SnapshotParseResult snapshotFromString(const std::string& text) {
  std::istringstream stream(text);
  std::vector<std::string> tokens;
  std::string token;
  while (stream >> token) tokens.push_back(token);

  if (tokens.size() != static_cast<size_t>(kVoiceCount)) {
    SnapshotParseResult result;
    // Attribute a count mismatch to the first voice that has no token, or to
    // the bass when there are too many.
    Voice voice = tokens.size() < static_cast<size_t>(kVoiceCount)
                      ? kAllVoices[tokens.size()]
                      : Voice::Bass;
    result.errors.push_back({voice, text, "expected 4 voices, got " + std::to_string(tokens.size())});
    return result;
  }

  std::array<std::string, kVoiceCount> names;
  std::copy(tokens.begin(), tokens.end(), names.begin());
  return snapshotFromNames(names);
}

}  // namespace satb
