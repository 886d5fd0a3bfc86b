// Implementation of rule identifier and tier string conversion.

#include "rules/rule_types.h"

namespace satb {

const char* ruleIdToString(RuleId id) {
  switch (id) {
    case RuleId::ParallelFifths:         return "parallel_fifths";
    case RuleId::ParallelOctaves:        return "parallel_octaves";
    case RuleId::DirectFifths:           return "direct_fifths";
    case RuleId::DirectOctaves:          return "direct_octaves";
    case RuleId::UnequalFifths:          return "unequal_fifths";
    case RuleId::LeadingToneResolution:  return "leading_tone_resolution";
    case RuleId::SeventhResolution:      return "seventh_resolution";
    case RuleId::VoiceCrossing:          return "voice_crossing";
    case RuleId::MaximumDistance:        return "maximum_distance";
    case RuleId::VoiceOverlap:           return "voice_overlap";
    case RuleId::DuplicatedLeadingTone:  return "duplicated_leading_tone";
    case RuleId::DuplicatedSeventh:      return "duplicated_seventh";
    case RuleId::ExcessiveMelodicMotion: return "excessive_melodic_motion";
    case RuleId::ImproperOmission:       return "improper_omission";
  }
  return "unknown";
}

std::optional<RuleId> ruleIdFromString(const std::string& name) {
  for (int idx = 0; idx < kRuleCount; ++idx) {
    auto id = static_cast<RuleId>(idx);
    if (name == ruleIdToString(id)) return id;
  }
  return std::nullopt;
}

const char* ruleTierToString(RuleTier tier) {
  switch (tier) {
    case RuleTier::Critical:  return "critical";
    case RuleTier::Important: return "important";
    case RuleTier::Advanced:  return "advanced";
  }
  return "unknown";
}

std::optional<RuleTier> ruleTierFromString(const std::string& name) {
  if (name == "critical") return RuleTier::Critical;
  if (name == "important") return RuleTier::Important;
  if (name == "advanced") return RuleTier::Advanced;
  return std::nullopt;
}

}  // namespace satb
