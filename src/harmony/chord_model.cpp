/// @file
/// @brief Template-based root inference and chord-factor derivation.

#include "harmony/chord_model.h"

#include <algorithm>
#include <cstdint>

#include "core/pitch_utils.h"

namespace satb {

namespace {

constexpr uint16_t bit(int semitones) {
  return static_cast<uint16_t>(1u << semitones);
}

/// Interval set of a chord type above its root, with the intervals that must
/// be present for a partial voicing to count as that type.
struct ChordTemplate {
  ChordQuality quality;
  uint16_t intervals;
  uint16_t required;
};

// Seventh chords first; within each size the order breaks ties.
constexpr ChordTemplate kTemplates[] = {
    {ChordQuality::Dominant7, bit(0) | bit(4) | bit(7) | bit(10), bit(0) | bit(4) | bit(10)},
    {ChordQuality::Diminished7, bit(0) | bit(3) | bit(6) | bit(9),
     bit(0) | bit(3) | bit(6) | bit(9)},
    {ChordQuality::HalfDiminished7, bit(0) | bit(3) | bit(6) | bit(10),
     bit(0) | bit(3) | bit(6) | bit(10)},
    {ChordQuality::MajorMajor7, bit(0) | bit(4) | bit(7) | bit(11), bit(0) | bit(4) | bit(11)},
    {ChordQuality::Minor7, bit(0) | bit(3) | bit(7) | bit(10), bit(0) | bit(3) | bit(10)},
    {ChordQuality::AugmentedSixth, bit(0) | bit(4) | bit(6) | bit(10),
     bit(0) | bit(4) | bit(6) | bit(10)},
    {ChordQuality::Major, bit(0) | bit(4) | bit(7), bit(0)},
    {ChordQuality::Minor, bit(0) | bit(3) | bit(7), bit(0)},
    {ChordQuality::Diminished, bit(0) | bit(3) | bit(6), bit(0) | bit(6)},
    {ChordQuality::Augmented, bit(0) | bit(4) | bit(8), bit(0) | bit(8)},
};

constexpr uint16_t kNinthBits = bit(1) | bit(2);

/// Relative interval set of all pitch classes above a candidate root.
uint16_t relativeMask(const std::vector<int>& pitch_classes, int root_pc) {
  uint16_t mask = 0;
  for (int pc : pitch_classes) {
    mask |= bit(pitchClassDistance(root_pc, pc));
  }
  return mask;
}

bool matches(const ChordTemplate& tmpl, uint16_t mask) {
  bool within = (mask & ~tmpl.intervals) == 0;
  bool has_required = (mask & tmpl.required) == tmpl.required;
  return within && has_required;
}

/// Template-major search: the first template any candidate satisfies wins.
std::optional<RootInference> search(const std::vector<int>& pitch_classes, bool allow_ninth) {
  for (const auto& tmpl : kTemplates) {
    for (int candidate : pitch_classes) {
      uint16_t mask = relativeMask(pitch_classes, candidate);
      if (allow_ninth) {
        if ((mask & kNinthBits) == 0) continue;
        mask = static_cast<uint16_t>(mask & ~kNinthBits);
      }
      if (matches(tmpl, mask)) {
        return RootInference{candidate, tmpl.quality, allow_ninth};
      }
    }
  }
  return std::nullopt;
}

}  // namespace

std::optional<RootInference> inferRoot(const std::vector<int>& pitch_classes) {
  if (pitch_classes.size() < 2) return std::nullopt;

  auto exact = search(pitch_classes, false);
  if (exact) return exact;
  return search(pitch_classes, true);
}

ChordFactor factorForInterval(int semitones_above_root, ChordQuality quality) {
  int rel = normalizePitchClass(semitones_above_root);
  switch (rel) {
    case interval::kUnison:
      return ChordFactor::Root;
    case interval::kMinor3rd:
    case interval::kMajor3rd:
      return ChordFactor::Third;
    case interval::kTritone:
    case interval::kPerfect5th:
    case interval::kMinor6th:
      return ChordFactor::Fifth;
    case interval::kMinor7th:
    case interval::kMajor7th:
      return ChordFactor::Seventh;
    case interval::kMinor2nd:
    case interval::kMajor2nd:
      return ChordFactor::Ninth;
    case interval::kMajor6th:
      // Diminished seventh above the root.
      return quality == ChordQuality::Diminished7 ? ChordFactor::Seventh : ChordFactor::Unknown;
    default:
      return ChordFactor::Unknown;
  }
}

ChordFactor chordFactor(const Pitch& pitch, int root_pc, ChordQuality quality) {
  return factorForInterval(pitch.pitchClass() - root_pc, quality);
}

int inversionForBassFactor(ChordFactor bass_factor) {
  switch (bass_factor) {
    case ChordFactor::Root:    return 0;
    case ChordFactor::Third:   return 1;
    case ChordFactor::Fifth:   return 2;
    case ChordFactor::Seventh: return 3;
    default:                   return 0;
  }
}

// ---------------------------------------------------------------------------
// ChordModel
// ---------------------------------------------------------------------------

ChordModel::ChordModel(const ChordSnapshot& snapshot) : snapshot_(snapshot) {
  auto inference = inferRoot(snapshot_.pitchClasses());
  if (inference) {
    root_pc_ = inference->root_pc;
    quality_ = inference->quality;
    has_ninth_ = inference->has_ninth;
    for (int idx = kVoiceCount - 1; idx >= 0; --idx) {
      const auto& pitch = snapshot_.pitch(kAllVoices[static_cast<size_t>(idx)]);
      if (pitch && pitch->pitchClass() == root_pc_) {
        root_pitch_ = pitch;
        break;
      }
    }
  } else {
    // Indeterminate: the lowest sounding pitch stands in as the reference.
    auto lowest = snapshot_.lowestVoice();
    if (lowest) {
      root_pitch_ = snapshot_.pitch(*lowest);
      root_pc_ = root_pitch_->pitchClass();
    }
  }

  for (Voice voice : kAllVoices) {
    const auto& pitch = snapshot_.pitch(voice);
    if (!pitch) continue;
    factors_[static_cast<size_t>(voiceIndex(voice))] = chordFactor(*pitch, root_pc_, quality_);
  }

  const auto& bass_factor = factor(Voice::Bass);
  inversion_ = bass_factor ? inversionForBassFactor(*bass_factor) : 0;
}

std::vector<Voice> ChordModel::voicesWithFactor(ChordFactor target) const {
  std::vector<Voice> result;
  for (Voice voice : kAllVoices) {
    const auto& voice_factor = factor(voice);
    if (voice_factor && *voice_factor == target) result.push_back(voice);
  }
  return result;
}

bool ChordModel::hasFactor(ChordFactor target) const {
  return !voicesWithFactor(target).empty();
}

bool ChordModel::isComplete() const {
  return hasFactor(ChordFactor::Root) && hasFactor(ChordFactor::Third) &&
         hasFactor(ChordFactor::Fifth);
}

std::vector<ChordFactor> ChordModel::doubledFactors() const {
  static constexpr ChordFactor kOrder[] = {ChordFactor::Root, ChordFactor::Third,
                                           ChordFactor::Fifth, ChordFactor::Seventh,
                                           ChordFactor::Ninth};
  std::vector<ChordFactor> result;
  for (ChordFactor candidate : kOrder) {
    if (voicesWithFactor(candidate).size() > 1) result.push_back(candidate);
  }
  return result;
}

std::vector<ChordFactor> ChordModel::missingFactors() const {
  std::vector<ChordFactor> result;
  for (ChordFactor member : {ChordFactor::Root, ChordFactor::Third, ChordFactor::Fifth}) {
    if (!hasFactor(member)) result.push_back(member);
  }
  return result;
}

// ---------------------------------------------------------------------------
// Factor movement
// ---------------------------------------------------------------------------

std::optional<FactorMovement> factorMovement(const ChordModel& first,
                                             const ChordModel& second, Voice voice) {
  const auto& from = first.factor(voice);
  const auto& to = second.factor(voice);
  if (!from || !to) return std::nullopt;
  return FactorMovement{*from, *to};
}

std::vector<Voice> voicesWithMovement(const ChordModel& first, const ChordModel& second,
                                      ChordFactor from, ChordFactor to) {
  std::vector<Voice> result;
  for (Voice voice : kAllVoices) {
    auto movement = factorMovement(first, second, voice);
    if (movement && movement->from == from && movement->to == to) {
      result.push_back(voice);
    }
  }
  return result;
}

}  // namespace satb
