// Core rule-engine types: rule identifiers, tiers, violations and the
// chord pair a rule evaluates.

#ifndef SATB_RULES_RULE_TYPES_H
#define SATB_RULES_RULE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/interval.h"
#include "core/voice.h"
#include "harmony/functional_classifier.h"
#include "harmony/key_context.h"

namespace satb {

/// Voice-leading rules, in catalogue (and reporting) order.
enum class RuleId : uint8_t {
  ParallelFifths,
  ParallelOctaves,
  DirectFifths,
  DirectOctaves,
  UnequalFifths,
  LeadingToneResolution,
  SeventhResolution,
  VoiceCrossing,
  MaximumDistance,
  VoiceOverlap,
  DuplicatedLeadingTone,
  DuplicatedSeventh,
  ExcessiveMelodicMotion,
  ImproperOmission
};

constexpr int kRuleCount = 14;

/// Severity tier. Lower values are more severe.
enum class RuleTier : uint8_t { Critical, Important, Advanced };

/// @brief Snake-case rule name ("parallel_fifths").
const char* ruleIdToString(RuleId id);

/// @brief Parse a snake-case rule name.
std::optional<RuleId> ruleIdFromString(const std::string& name);

/// @brief Lowercase tier name ("critical").
const char* ruleTierToString(RuleTier tier);

/// @brief Parse a tier name.
std::optional<RuleTier> ruleTierFromString(const std::string& name);

/// @brief A reported voice-leading violation.
struct RuleViolation {
  RuleId rule = RuleId::ParallelFifths;
  RuleTier tier = RuleTier::Critical;
  int confidence = 100;            ///< 0-100.
  std::vector<Voice> voices;       ///< Affected voices, in detection order.
  std::optional<MotionType> motion;
  int chord_index = 0;             ///< 0 = first chord of the pair, 1 = second.
  std::string short_message;
  std::string full_message;
  std::string detail;              ///< Extra token such as "missing 3".
};

/// @brief Two adjacent analyzed chords plus the key they were analyzed in.
///
/// Holds references: the analyses must outlive the pair.
struct ProgressionPair {
  const ChordAnalysis& first;
  const ChordAnalysis& second;
  const KeyContext& key;
};

}  // namespace satb

#endif  // SATB_RULES_RULE_TYPES_H
