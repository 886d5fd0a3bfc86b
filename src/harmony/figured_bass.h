// Figured-bass cipher tables keyed by chord category and inversion.

#ifndef SATB_HARMONY_FIGURED_BASS_H
#define SATB_HARMONY_FIGURED_BASS_H

#include <cstdint>
#include <string>

#include "harmony/chord_types.h"

namespace satb {

/// Row of the cipher table a chord quality reads from.
enum class CipherCategory : uint8_t {
  Triad,
  DominantSeventh,
  DiminishedSeventh,
  HalfDiminishedSeventh,
  Seventh  ///< Major and minor sevenths.
};

/// @brief Cipher table row for a chord quality.
CipherCategory cipherCategory(ChordQuality quality);

/// @brief Figured-bass cipher for a category and inversion.
///
/// Triads: "", "6", "6/4". Dominant seventh: "7,+", "6,5t", "+6", "+4".
/// Diminished seventh: "7t", "+6,5t", "+4,3", "+2". Half-diminished seventh:
/// "7,5t", "+6,5", "+4,3", "4,+2". Other sevenths: "7", "6,5", "4,3", "2".
///
/// @param category Table row.
/// @param inversion 0-3. Out-of-table combinations give "".
/// @param has_ninth An added ninth overrides the cipher to "9".
std::string figuredBassCipher(CipherCategory category, int inversion, bool has_ninth = false);

/// @brief Convenience overload that picks the row from the quality.
std::string figuredBassCipher(ChordQuality quality, int inversion, bool has_ninth = false);

}  // namespace satb

#endif  // SATB_HARMONY_FIGURED_BASS_H
