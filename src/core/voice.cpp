/// @file
/// @brief Voice identifier conversions.

#include "core/voice.h"

#include <cctype>

namespace satb {

char voiceToChar(Voice voice) {
  switch (voice) {
    case Voice::Soprano: return 'S';
    case Voice::Alto:    return 'A';
    case Voice::Tenor:   return 'T';
    case Voice::Bass:    return 'B';
  }
  return '?';
}

const char* voiceToString(Voice voice) {
  switch (voice) {
    case Voice::Soprano: return "Soprano";
    case Voice::Alto:    return "Alto";
    case Voice::Tenor:   return "Tenor";
    case Voice::Bass:    return "Bass";
  }
  return "Unknown";
}

std::optional<Voice> voiceFromChar(char chr) {
  switch (std::toupper(static_cast<unsigned char>(chr))) {
    case 'S': return Voice::Soprano;
    case 'A': return Voice::Alto;
    case 'T': return Voice::Tenor;
    case 'B': return Voice::Bass;
    default:  return std::nullopt;
  }
}

int voiceRankLowToHigh(Voice voice) {
  return kVoiceCount - 1 - voiceIndex(voice);
}

}  // namespace satb
