/// @file
/// @brief Rule evaluation loop: detection, per-finding exceptions, confidence.

#include "rules/rules_engine.h"

#include <cstdio>
#include <string>

#include "rules/rule_exceptions.h"
#include "rules/voice_leading_rules.h"

namespace satb {

namespace {

std::string voicesToString(const std::vector<Voice>& voices) {
  std::string result;
  for (Voice voice : voices) result += voiceToChar(voice);
  return result.empty() ? "-" : result;
}

bool isParallelRule(RuleId id) {
  return id == RuleId::ParallelFifths || id == RuleId::ParallelOctaves;
}

}  // namespace

std::string violationShortMessage(const RuleDefinition& rule,
                                  const std::optional<MotionType>& motion) {
  std::string message = rule.short_message;
  if (isParallelRule(rule.id) && motion == MotionType::Contrary) {
    const std::string kParallel = "Parallel";
    if (message.compare(0, kParallel.size(), kParallel) == 0) {
      message.replace(0, kParallel.size(), "Consecutive");
    }
  }
  return message;
}

RulesEngine::RulesEngine(RuleSet rules) : rules_(rules) {}

bool RulesEngine::setRuleEnabled(const std::string& name, bool enabled) {
  auto next = rules_.withRule(name, enabled);
  if (!next) return false;
  rules_ = *next;
  return true;
}

std::vector<RuleViolation> RulesEngine::validatePair(const ChordAnalysis& first,
                                                     const ChordAnalysis& second,
                                                     const KeyContext& key) const {
  return validate(ProgressionPair{first, second, key}, rules_);
}

std::vector<RuleViolation> RulesEngine::validate(const ProgressionPair& pair,
                                                 const RuleSet& rules) const {
  std::vector<RuleViolation> violations;
  for (const auto& rule : ruleCatalogue()) {
    if (!rules.isEnabled(rule.id)) continue;
    auto violation = evaluateRule(rule, pair);
    if (violation) violations.push_back(std::move(*violation));
  }
  return violations;
}

std::optional<RuleViolation> RulesEngine::evaluateRule(const RuleDefinition& rule,
                                                       const ProgressionPair& pair) const {
  Detection detection = detectViolation(rule.id, pair);
  if (detection.status == DetectionStatus::Failed) {
    std::fprintf(stderr, "[RulesEngine] WARNING: %s detector failed: %s\n", rule.name(),
                 detection.error.c_str());
    return std::nullopt;
  }
  if (!detection.fired()) return std::nullopt;

  for (const auto& finding : detection.findings) {
    bool suppressed = false;
    for (ExceptionKind kind : rule.exceptions) {
      ExceptionOutcome outcome = evaluateException(kind, pair, finding);
      if (outcome.status == ExceptionStatus::Failed) {
        std::fprintf(stderr, "[RulesEngine] WARNING: %s exception %s failed: %s\n",
                     rule.name(), exceptionKindToString(kind), outcome.error.c_str());
        continue;
      }
      if (outcome.applied()) {
        if (verbose_) {
          std::fprintf(stderr, "[RulesEngine] %s [%s] suppressed by %s\n", rule.name(),
                       voicesToString(finding.voices).c_str(), exceptionKindToString(kind));
        }
        suppressed = true;
        break;
      }
    }
    if (suppressed) continue;

    RuleViolation violation;
    violation.rule = rule.id;
    violation.tier = finding.tier_override.value_or(rule.tier);
    violation.confidence = computeConfidence(rule, finding.voices);
    violation.voices = finding.voices;
    violation.motion = finding.motion;
    violation.chord_index = finding.chord_index;
    violation.short_message = violationShortMessage(rule, finding.motion);
    violation.full_message = rule.full_message;
    violation.detail = finding.detail;
    if (verbose_) {
      std::fprintf(stderr, "[RulesEngine] %s [%s] reported\n", rule.name(),
                   voicesToString(finding.voices).c_str());
    }
    return violation;
  }
  return std::nullopt;
}

std::vector<const RuleDefinition*> RulesEngine::activeRules(
    std::optional<RuleTier> tier) const {
  std::vector<const RuleDefinition*> result;
  for (const auto& rule : ruleCatalogue()) {
    if (!rules_.isEnabled(rule.id)) continue;
    if (tier && rule.tier != *tier) continue;
    result.push_back(&rule);
  }
  return result;
}

const RuleDefinition* RulesEngine::findRule(const std::string& name) {
  auto id = ruleIdFromString(name);
  if (!id) return nullptr;
  return &ruleDefinition(*id);
}

}  // namespace satb
