// Implementation of the figured-bass cipher tables.

#include "harmony/figured_bass.h"

namespace satb {

namespace {

constexpr const char* kTriadCiphers[] = {"", "6", "6/4"};
constexpr const char* kDominantSeventhCiphers[] = {"7,+", "6,5t", "+6", "+4"};
constexpr const char* kDiminishedSeventhCiphers[] = {"7t", "+6,5t", "+4,3", "+2"};
constexpr const char* kHalfDiminishedSeventhCiphers[] = {"7,5t", "+6,5", "+4,3", "4,+2"};
constexpr const char* kSeventhCiphers[] = {"7", "6,5", "4,3", "2"};

}  // namespace

CipherCategory cipherCategory(ChordQuality quality) {
  switch (quality) {
    case ChordQuality::Dominant7:       return CipherCategory::DominantSeventh;
    case ChordQuality::Diminished7:     return CipherCategory::DiminishedSeventh;
    case ChordQuality::HalfDiminished7: return CipherCategory::HalfDiminishedSeventh;
    case ChordQuality::MajorMajor7:
    case ChordQuality::Minor7:
      return CipherCategory::Seventh;
    default:
      return CipherCategory::Triad;
  }
}

std::string figuredBassCipher(CipherCategory category, int inversion, bool has_ninth) {
  if (has_ninth) return "9";
  if (inversion < 0) return "";

  if (category == CipherCategory::Triad) {
    return inversion < 3 ? kTriadCiphers[inversion] : "";
  }
  if (inversion > 3) return "";

  switch (category) {
    case CipherCategory::DominantSeventh:       return kDominantSeventhCiphers[inversion];
    case CipherCategory::DiminishedSeventh:     return kDiminishedSeventhCiphers[inversion];
    case CipherCategory::HalfDiminishedSeventh: return kHalfDiminishedSeventhCiphers[inversion];
    case CipherCategory::Seventh:               return kSeventhCiphers[inversion];
    case CipherCategory::Triad:                 break;
  }
  return "";
}

std::string figuredBassCipher(ChordQuality quality, int inversion, bool has_ninth) {
  return figuredBassCipher(cipherCategory(quality), inversion, has_ninth);
}

}  // namespace satb
