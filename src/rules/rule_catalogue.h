// Static rule catalogue: identity, tier, messages, registered exceptions
// and confidence model for each voice-leading rule.

#ifndef SATB_RULES_RULE_CATALOGUE_H
#define SATB_RULES_RULE_CATALOGUE_H

#include <cstdint>
#include <vector>

#include "rules/rule_types.h"

namespace satb {

/// Tagged exception predicates. Evaluated by evaluateException().
enum class ExceptionKind : uint8_t {
  DominantPair,              ///< V-vii / vii-V share dominant function.
  VoicingChange,             ///< Same harmony, redistributed.
  OuterVoicesStepAndLeap,    ///< S-B: soprano steps, bass moves a 3rd to a 5th.
  OuterVoicesLeadingTone,    ///< S-B: soprano rises a semitone, bass rises a 4th.
  InnerVoicesOneStep,        ///< Other pairs: exactly one voice steps.
  ParallelTenths,            ///< Bass and soprano move in parallel tenths.
  NonTonicDestination,       ///< Tonal leading tone going to neither I nor vi.
  DeceptiveBassResolution,   ///< V6 -> vi in major, bass leading tone to the root.
  IndirectResolution,        ///< Inner leading tone drops to the 5th under the tonic.
  ChromaticChord             ///< Secondary, Neapolitan, augmented sixth, borrowed.
};

/// @brief Snake-case exception name for logs ("voicing_change").
const char* exceptionKindToString(ExceptionKind kind);

/// How a rule's confidence is computed once a violation survives.
enum class ConfidenceModel : uint8_t {
  Fixed,       ///< Always base_confidence.
  ByVoicePair  ///< S-B 100, with bass 90, soprano with an inner voice 80, else 70.
};

/// @brief Static description of one rule.
struct RuleDefinition {
  RuleId id;
  RuleTier tier;
  const char* short_message;
  const char* full_message;
  std::vector<ExceptionKind> exceptions;  ///< Evaluated in this order.
  ConfidenceModel confidence_model;
  int base_confidence;

  const char* name() const { return ruleIdToString(id); }
};

/// @brief All rule definitions, in RuleId order.
const std::vector<RuleDefinition>& ruleCatalogue();

/// @brief Definition of one rule.
const RuleDefinition& ruleDefinition(RuleId id);

/// @brief Confidence for a violation between the given voices.
int computeConfidence(const RuleDefinition& rule, const std::vector<Voice>& voices);

}  // namespace satb

#endif  // SATB_RULES_RULE_CATALOGUE_H
