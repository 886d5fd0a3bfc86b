// Exception predicates that cancel a detected finding.

#ifndef SATB_RULES_RULE_EXCEPTIONS_H
#define SATB_RULES_RULE_EXCEPTIONS_H

#include <cstdint>
#include <string>
#include <utility>

#include "rules/rule_catalogue.h"
#include "rules/voice_leading_rules.h"

namespace satb {

enum class ExceptionStatus : uint8_t { Applies, DoesNotApply, Failed };

/// @brief Outcome of one exception predicate.
///
/// Failed never cancels a finding: the engine logs the error and keeps
/// evaluating the remaining exceptions.
struct ExceptionOutcome {
  ExceptionStatus status = ExceptionStatus::DoesNotApply;
  std::string error;

  static ExceptionOutcome applies() { return {ExceptionStatus::Applies, {}}; }
  static ExceptionOutcome doesNotApply() { return {ExceptionStatus::DoesNotApply, {}}; }
  static ExceptionOutcome failed(std::string error) {
    return {ExceptionStatus::Failed, std::move(error)};
  }

  bool applied() const { return status == ExceptionStatus::Applies; }
};

/// @brief Evaluate one exception against a finding.
/// @param kind Exception to evaluate.
/// @param pair The chord pair the finding came from.
/// @param finding The candidate violation.
ExceptionOutcome evaluateException(ExceptionKind kind, const ProgressionPair& pair,
                                   const Finding& finding);

}  // namespace satb

#endif  // SATB_RULES_RULE_EXCEPTIONS_H
