// Base detectors for the voice-leading rules.
//
// A detector only answers "does the geometry break the rule". Exceptions are
// applied afterwards, per finding, by the rules engine.

#ifndef SATB_RULES_VOICE_LEADING_RULES_H
#define SATB_RULES_VOICE_LEADING_RULES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/interval.h"
#include "core/voice.h"
#include "rules/rule_types.h"

namespace satb {

/// @brief One candidate violation produced by a detector.
struct Finding {
  std::vector<Voice> voices;
  std::optional<MotionType> motion;
  int chord_index = 0;
  std::string detail;

  /// Leading-tone rule: the note is the local leading tone of a secondary
  /// or chromatic chord rather than the key's seventh degree.
  bool local_leading_tone = false;

  /// Tier to report instead of the rule's own tier.
  std::optional<RuleTier> tier_override;
};

enum class DetectionStatus : uint8_t { NoViolation, Violation, Failed };

/// @brief Result of running one detector on a pair.
struct Detection {
  DetectionStatus status = DetectionStatus::NoViolation;
  std::vector<Finding> findings;  ///< Candidates in visiting order.
  std::string error;              ///< Set when status is Failed.

  static Detection none() { return Detection{}; }

  static Detection found(std::vector<Finding> findings) {
    if (findings.empty()) return none();
    Detection result;
    result.status = DetectionStatus::Violation;
    result.findings = std::move(findings);
    return result;
  }

  static Detection failed(std::string error) {
    Detection result;
    result.status = DetectionStatus::Failed;
    result.error = std::move(error);
    return result;
  }

  bool fired() const { return status == DetectionStatus::Violation; }
};

/// @brief Run the base detector of a rule on a chord pair.
Detection detectViolation(RuleId rule, const ProgressionPair& pair);

}  // namespace satb

#endif  // SATB_RULES_VOICE_LEADING_RULES_H
