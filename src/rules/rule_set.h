// Immutable snapshot of which rules are enabled.

#ifndef SATB_RULES_RULE_SET_H
#define SATB_RULES_RULE_SET_H

#include <bitset>
#include <optional>
#include <string>
#include <vector>

#include "rules/rule_types.h"

namespace satb {

/// @brief Enabled/disabled flags for every rule, as a value.
///
/// Toggling returns a new RuleSet; an existing set never changes, so one
/// set can be shared by concurrent analyses.
class RuleSet {
 public:
  /// @brief All rules enabled.
  RuleSet();

  /// @brief All rules enabled.
  static RuleSet all() { return RuleSet(); }

  /// @brief Only rules at or above a severity (critical is the highest).
  static RuleSet atLeast(RuleTier min_tier);

  bool isEnabled(RuleId id) const { return enabled_.test(static_cast<size_t>(id)); }

  /// @brief Copy with one rule switched.
  RuleSet with(RuleId id, bool enabled) const;

  /// @brief Copy with a rule switched by name.
  /// @return The new set, or std::nullopt for an unknown name (logged).
  std::optional<RuleSet> withRule(const std::string& name, bool enabled) const;

  /// @brief Copy with each named rule disabled.
  /// @param names Rule names; unknown names are logged and collected.
  /// @param unknown If non-null, receives the names that were not recognized.
  RuleSet withoutRules(const std::vector<std::string>& names,
                       std::vector<std::string>* unknown = nullptr) const;

  /// @brief Enabled rules in catalogue order.
  std::vector<RuleId> enabledRules() const;

  int enabledCount() const { return static_cast<int>(enabled_.count()); }

  bool operator==(const RuleSet& other) const { return enabled_ == other.enabled_; }
  bool operator!=(const RuleSet& other) const { return !(*this == other); }

 private:
  std::bitset<kRuleCount> enabled_;
};

}  // namespace satb

#endif  // SATB_RULES_RULE_SET_H
