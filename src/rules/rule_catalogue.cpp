/// @file
/// @brief The voice-leading rule table.

#include "rules/rule_catalogue.h"

#include <algorithm>

namespace satb {

const char* exceptionKindToString(ExceptionKind kind) {
  switch (kind) {
    case ExceptionKind::DominantPair:            return "dominant_pair";
    case ExceptionKind::VoicingChange:           return "voicing_change";
    case ExceptionKind::OuterVoicesStepAndLeap:  return "outer_voices_step_and_leap";
    case ExceptionKind::OuterVoicesLeadingTone:  return "outer_voices_leading_tone";
    case ExceptionKind::InnerVoicesOneStep:      return "inner_voices_one_step";
    case ExceptionKind::ParallelTenths:          return "parallel_tenths";
    case ExceptionKind::NonTonicDestination:     return "non_tonic_destination";
    case ExceptionKind::DeceptiveBassResolution: return "deceptive_bass_resolution";
    case ExceptionKind::IndirectResolution:      return "indirect_resolution";
    case ExceptionKind::ChromaticChord:          return "chromatic_chord";
  }
  return "unknown";
}

namespace {

std::vector<RuleDefinition> buildCatalogue() {
  using EK = ExceptionKind;
  std::vector<RuleDefinition> rules;
  rules.reserve(kRuleCount);

  rules.push_back({RuleId::ParallelFifths, RuleTier::Critical, "Parallel fifths",
                   "Two perfect fifths in a row between the same voices. Forbidden in "
                   "parallel and in contrary motion: they weaken the independence of the "
                   "voices.",
                   {EK::DominantPair, EK::VoicingChange}, ConfidenceModel::Fixed, 100});

  rules.push_back({RuleId::ParallelOctaves, RuleTier::Critical, "Parallel octaves",
                   "Two perfect octaves in a row between the same voices. Forbidden in "
                   "parallel and in contrary motion: the two parts merge into one.",
                   {EK::DominantPair, EK::VoicingChange}, ConfidenceModel::Fixed, 100});

  rules.push_back({RuleId::DirectFifths, RuleTier::Critical, "Direct fifth",
                   "Two voices reach a perfect fifth by similar motion with a leap.",
                   {EK::VoicingChange, EK::OuterVoicesStepAndLeap, EK::InnerVoicesOneStep},
                   ConfidenceModel::ByVoicePair, 100});

  rules.push_back({RuleId::DirectOctaves, RuleTier::Critical, "Direct octave",
                   "Two voices reach a perfect octave by similar motion with a leap.",
                   {EK::VoicingChange, EK::OuterVoicesLeadingTone, EK::InnerVoicesOneStep},
                   ConfidenceModel::ByVoicePair, 100});

  rules.push_back({RuleId::UnequalFifths, RuleTier::Critical, "Unequal fifths",
                   "A diminished fifth moves to a perfect fifth against the bass.",
                   {EK::ParallelTenths}, ConfidenceModel::Fixed, 90});

  rules.push_back({RuleId::LeadingToneResolution, RuleTier::Critical,
                   "Unresolved leading tone",
                   "The leading tone of a dominant chord must rise to the tonic.",
                   {EK::NonTonicDestination, EK::DominantPair, EK::DeceptiveBassResolution,
                    EK::IndirectResolution},
                   ConfidenceModel::Fixed, 100});

  rules.push_back({RuleId::SeventhResolution, RuleTier::Critical, "Unresolved seventh",
                   "The chord seventh is a dissonance and must resolve down by step.",
                   {EK::VoicingChange}, ConfidenceModel::Fixed, 100});

  rules.push_back({RuleId::VoiceCrossing, RuleTier::Critical, "Voice crossing",
                   "A lower voice sounds above a higher one, breaking the order "
                   "Bass < Tenor < Alto < Soprano.",
                   {}, ConfidenceModel::Fixed, 100});

  rules.push_back({RuleId::MaximumDistance, RuleTier::Important, "Voices too far apart",
                   "Adjacent upper voices are more than an octave apart.",
                   {}, ConfidenceModel::Fixed, 80});

  rules.push_back({RuleId::VoiceOverlap, RuleTier::Important, "Voice overlap",
                   "A voice moves past the pitch its neighbour held in the previous chord.",
                   {}, ConfidenceModel::Fixed, 80});

  rules.push_back({RuleId::DuplicatedLeadingTone, RuleTier::Critical,
                   "Doubled leading tone",
                   "The leading tone is doubled: both voices would need to resolve to the "
                   "tonic.",
                   {}, ConfidenceModel::Fixed, 100});

  rules.push_back({RuleId::DuplicatedSeventh, RuleTier::Critical, "Doubled seventh",
                   "The chord seventh is doubled: a dissonance must not be doubled.",
                   {}, ConfidenceModel::Fixed, 100});

  rules.push_back({RuleId::ExcessiveMelodicMotion, RuleTier::Important,
                   "Excessive melodic leap",
                   "A voice leaps more than an octave.",
                   {}, ConfidenceModel::Fixed, 90});

  rules.push_back({RuleId::ImproperOmission, RuleTier::Important, "Omitted chord factor",
                   "The chord omits an essential factor. The third defines the quality and "
                   "must not be omitted; a seventh chord must keep its seventh.",
                   {EK::ChromaticChord}, ConfidenceModel::Fixed, 85});

  return rules;
}

}  // namespace

const std::vector<RuleDefinition>& ruleCatalogue() {
  static const std::vector<RuleDefinition> kCatalogue = buildCatalogue();
  return kCatalogue;
}

const RuleDefinition& ruleDefinition(RuleId id) {
  return ruleCatalogue()[static_cast<size_t>(id)];
}

int computeConfidence(const RuleDefinition& rule, const std::vector<Voice>& voices) {
  if (rule.confidence_model == ConfidenceModel::Fixed) return rule.base_confidence;

  auto has = [&voices](Voice voice) {
    return std::find(voices.begin(), voices.end(), voice) != voices.end();
  };
  if (has(Voice::Bass) && has(Voice::Soprano)) return 100;
  if (has(Voice::Bass)) return 90;
  if (has(Voice::Soprano)) return 80;
  return 70;
}

}  // namespace satb
