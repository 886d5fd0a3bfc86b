// Shared context predicates used by several rules' exceptions.

#ifndef SATB_RULES_CONTEXT_ANALYZER_H
#define SATB_RULES_CONTEXT_ANALYZER_H

#include "harmony/functional_classifier.h"

namespace satb {

/// @brief True when two chords are the same harmony redistributed.
///
/// Requires equal root, quality and inversion, and identical pitch-class
/// sets, while the sets of concrete pitches differ (octave or doubling
/// changes only). An exact repetition is not a voicing change.
bool isVoicingChange(const ChordAnalysis& first, const ChordAnalysis& second);

/// @brief True for a V-vii or vii-V pair sharing dominant function.
///
/// The root degrees must form {5, 7} in either order and at least one chord
/// must carry dominant function. Indeterminate chords have no degree and
/// never pair.
bool isDominantPair(const ChordAnalysis& first, const ChordAnalysis& second);

/// @brief True for chords whose third is the leading tone: V, vii° and
///        their secondary forms.
bool isDominantChord(const ChordAnalysis& chord);

}  // namespace satb

#endif  // SATB_RULES_CONTEXT_ANALYZER_H
