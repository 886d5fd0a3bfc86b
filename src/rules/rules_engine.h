// Voice-leading rules engine: runs every enabled rule on a chord pair.

#ifndef SATB_RULES_RULES_ENGINE_H
#define SATB_RULES_RULES_ENGINE_H

#include <optional>
#include <string>
#include <vector>

#include "rules/rule_catalogue.h"
#include "rules/rule_set.h"
#include "rules/rule_types.h"

namespace satb {

/// @brief Evaluates the rule catalogue on adjacent chord pairs.
///
/// Each rule runs its detector, then evaluates its registered exceptions
/// per finding in registration order. The first finding no exception
/// cancels is reported, so a rule yields at most one violation per pair.
/// Rules never short-circuit each other.
///
/// The engine holds a default RuleSet for validatePair(); validate() takes
/// the set explicitly. Neither call mutates the engine.
class RulesEngine {
 public:
  explicit RulesEngine(RuleSet rules = RuleSet::all());

  const RuleSet& ruleSet() const { return rules_; }
  void setRuleSet(const RuleSet& rules) { rules_ = rules; }

  /// @brief Enable or disable a rule by name.
  /// @return false for an unknown rule name (logged).
  bool setRuleEnabled(const std::string& name, bool enabled);

  /// @brief Log suppressed findings and rule decisions to stderr.
  void setVerbose(bool verbose) { verbose_ = verbose; }
  bool verbose() const { return verbose_; }

  /// @brief Validate one pair with the engine's own rule set.
  std::vector<RuleViolation> validatePair(const ChordAnalysis& first,
                                          const ChordAnalysis& second,
                                          const KeyContext& key) const;

  /// @brief Validate one pair with an explicit rule set.
  /// @return Violations in catalogue order.
  std::vector<RuleViolation> validate(const ProgressionPair& pair, const RuleSet& rules) const;

  /// @brief Enabled rule definitions, optionally restricted to one tier.
  std::vector<const RuleDefinition*> activeRules(
      std::optional<RuleTier> tier = std::nullopt) const;

  /// @brief Look up a rule definition by snake-case name.
  /// @return nullptr if no rule has that name.
  static const RuleDefinition* findRule(const std::string& name);

 private:
  std::optional<RuleViolation> evaluateRule(const RuleDefinition& rule,
                                            const ProgressionPair& pair) const;

  RuleSet rules_;
  bool verbose_ = false;
};

/// @brief Short message for a violation; parallel rules read "Consecutive"
///        for contrary motion.
std::string violationShortMessage(const RuleDefinition& rule,
                                  const std::optional<MotionType>& motion);

}  // namespace satb

#endif  // SATB_RULES_RULES_ENGINE_H
