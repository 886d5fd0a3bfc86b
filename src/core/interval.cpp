/// @file
/// @brief Implementation of spelled interval naming and motion classification.

#include "core/interval.h"

namespace satb {

// ---------------------------------------------------------------------------
// Quality helpers
// ---------------------------------------------------------------------------

const char* intervalQualityPrefix(IntervalQuality quality) {
  switch (quality) {
    case IntervalQuality::DoublyDiminished: return "dd";
    case IntervalQuality::Diminished:       return "d";
    case IntervalQuality::Minor:            return "m";
    case IntervalQuality::Perfect:          return "P";
    case IntervalQuality::Major:            return "M";
    case IntervalQuality::Augmented:        return "A";
    case IntervalQuality::DoublyAugmented:  return "AA";
    case IntervalQuality::Unknown:          return "?";
  }
  return "?";
}

/// @brief True for generic sizes of the perfect family (1, 4, 5, 8).
static bool isPerfectFamily(int simple_generic) {
  return simple_generic == 1 || simple_generic == 4 || simple_generic == 5 ||
         simple_generic == 8;
}

/// @brief Semitone size of the reference (perfect or major) interval.
static int referenceSemitones(int simple_generic) {
  switch (simple_generic) {
    case 1: return 0;
    case 2: return 2;
    case 3: return 4;
    case 4: return 5;
    case 5: return 7;
    case 6: return 9;
    case 7: return 11;
    case 8: return 12;
    default: return 0;
  }
}

/// @brief Derive the quality from the deviation against the reference size.
static IntervalQuality qualityFromDeviation(int simple_generic, int deviation) {
  if (isPerfectFamily(simple_generic)) {
    switch (deviation) {
      case -2: return IntervalQuality::DoublyDiminished;
      case -1: return IntervalQuality::Diminished;
      case 0:  return IntervalQuality::Perfect;
      case 1:  return IntervalQuality::Augmented;
      case 2:  return IntervalQuality::DoublyAugmented;
      default: return IntervalQuality::Unknown;
    }
  }
  switch (deviation) {
    case -3: return IntervalQuality::DoublyDiminished;
    case -2: return IntervalQuality::Diminished;
    case -1: return IntervalQuality::Minor;
    case 0:  return IntervalQuality::Major;
    case 1:  return IntervalQuality::Augmented;
    case 2:  return IntervalQuality::DoublyAugmented;
    default: return IntervalQuality::Unknown;
  }
}

/// @brief Reduce a compound generic size, keeping octaves as 8.
static int reduceGeneric(int generic) {
  if (generic <= 1) return 1;
  return ((generic - 2) % 7) + 2;
}

// ---------------------------------------------------------------------------
// Interval
// ---------------------------------------------------------------------------

int Interval::simpleGeneric() const {
  return reduceGeneric(generic);
}

std::string Interval::simpleName() const {
  return std::string(intervalQualityPrefix(quality)) + std::to_string(simpleGeneric());
}

std::string Interval::name() const {
  return std::string(intervalQualityPrefix(quality)) + std::to_string(generic);
}

Interval intervalBetween(const Pitch& first, const Pitch& second) {
  const Pitch* lower = &first;
  const Pitch* upper = &second;
  if (second.diatonicIndex() < first.diatonicIndex() ||
      (second.diatonicIndex() == first.diatonicIndex() &&
       second.value() < first.value())) {
    lower = &second;
    upper = &first;
  }

  Interval result;
  result.generic = upper->diatonicIndex() - lower->diatonicIndex() + 1;
  result.semitones = upper->value() - lower->value();

  int simple = reduceGeneric(result.generic);
  int octaves_removed = (result.generic - simple) / 7;
  int simple_semitones = result.semitones - 12 * octaves_removed;
  result.quality = qualityFromDeviation(simple, simple_semitones - referenceSemitones(simple));
  return result;
}

std::string intervalName(const Pitch& first, const Pitch& second) {
  return intervalBetween(first, second).simpleName();
}

bool isPerfectFifth(const Pitch& first, const Pitch& second) {
  Interval ivl = intervalBetween(first, second);
  return ivl.simpleGeneric() == 5 && ivl.quality == IntervalQuality::Perfect;
}

bool isDiminishedFifth(const Pitch& first, const Pitch& second) {
  Interval ivl = intervalBetween(first, second);
  return ivl.simpleGeneric() == 5 && ivl.quality == IntervalQuality::Diminished;
}

bool isFifthClass(const Pitch& first, const Pitch& second) {
  Interval ivl = intervalBetween(first, second);
  return ivl.simpleGeneric() == 5 && (ivl.quality == IntervalQuality::Perfect ||
                                      ivl.quality == IntervalQuality::Augmented);
}

bool isOctaveClass(const Pitch& first, const Pitch& second) {
  Interval ivl = intervalBetween(first, second);
  int simple = ivl.simpleGeneric();
  return (simple == 8 || simple == 1) && ivl.quality == IntervalQuality::Perfect;
}

// ---------------------------------------------------------------------------
// Motion classification
// ---------------------------------------------------------------------------

const char* motionTypeToString(MotionType type) {
  switch (type) {
    case MotionType::Parallel: return "parallel";
    case MotionType::Contrary: return "contrary";
    case MotionType::Oblique:  return "oblique";
    case MotionType::Static:   return "static";
  }
  return "unknown";
}

MotionType classifyMotion(const Pitch& prev1, const Pitch& curr1,
                          const Pitch& prev2, const Pitch& curr2) {
  int dir1 = semitones(prev1, curr1);
  int dir2 = semitones(prev2, curr2);

  if (dir1 == 0 && dir2 == 0) return MotionType::Static;
  if (dir1 == 0 || dir2 == 0) return MotionType::Oblique;
  if ((dir1 > 0) == (dir2 > 0)) return MotionType::Parallel;
  return MotionType::Contrary;
}

}  // namespace satb
