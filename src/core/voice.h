// SATB voice identifiers and fixed voice-pair orderings.

#ifndef SATB_CORE_VOICE_H
#define SATB_CORE_VOICE_H

#include <array>
#include <cstdint>
#include <optional>
#include <utility>

namespace satb {

/// Four-part voice identifier, listed from the top part down.
enum class Voice : uint8_t { Soprano = 0, Alto, Tenor, Bass };

constexpr int kVoiceCount = 4;

/// All voices, top down (S, A, T, B).
constexpr std::array<Voice, kVoiceCount> kAllVoices = {
    Voice::Soprano, Voice::Alto, Voice::Tenor, Voice::Bass};

/// Voice pairs (upper, lower) in the order rules visit them.
constexpr std::array<std::pair<Voice, Voice>, 6> kVoicePairs = {{
    {Voice::Soprano, Voice::Alto},
    {Voice::Soprano, Voice::Tenor},
    {Voice::Soprano, Voice::Bass},
    {Voice::Alto, Voice::Tenor},
    {Voice::Alto, Voice::Bass},
    {Voice::Tenor, Voice::Bass},
}};

/// Adjacent voice pairs (lower, upper), bass first.
constexpr std::array<std::pair<Voice, Voice>, 3> kAdjacentPairs = {{
    {Voice::Bass, Voice::Tenor},
    {Voice::Tenor, Voice::Alto},
    {Voice::Alto, Voice::Soprano},
}};

/// @brief Array index of a voice (0 = soprano).
inline int voiceIndex(Voice voice) {
  return static_cast<int>(voice);
}

/// @brief Single-letter abbreviation ('S', 'A', 'T', 'B').
char voiceToChar(Voice voice);

/// @brief Full voice name ("Soprano", ...).
const char* voiceToString(Voice voice);

/// @brief Parse a single-letter abbreviation (either case).
std::optional<Voice> voiceFromChar(char chr);

/// @brief Display rank from low to high (bass = 0, soprano = 3).
int voiceRankLowToHigh(Voice voice);

}  // namespace satb

#endif  // SATB_CORE_VOICE_H
