// Implementation of the rule enable/disable snapshot.

#include "rules/rule_set.h"

#include <cstdio>

#include "rules/rule_catalogue.h"

namespace satb {

RuleSet::RuleSet() {
  enabled_.set();
}

RuleSet RuleSet::atLeast(RuleTier min_tier) {
  RuleSet result;
  for (const auto& rule : ruleCatalogue()) {
    if (static_cast<int>(rule.tier) > static_cast<int>(min_tier)) {
      result.enabled_.reset(static_cast<size_t>(rule.id));
    }
  }
  return result;
}

RuleSet RuleSet::with(RuleId id, bool enabled) const {
  RuleSet result = *this;
  result.enabled_.set(static_cast<size_t>(id), enabled);
  return result;
}

std::optional<RuleSet> RuleSet::withRule(const std::string& name, bool enabled) const {
  auto id = ruleIdFromString(name);
  if (!id) {
    std::fprintf(stderr, "[RuleSet] WARNING: unknown rule '%s'\n", name.c_str());
    return std::nullopt;
  }
  return with(*id, enabled);
}

RuleSet RuleSet::withoutRules(const std::vector<std::string>& names,
                              std::vector<std::string>* unknown) const {
  RuleSet result = *this;
  for (const auto& name : names) {
    auto next = result.withRule(name, false);
    if (next) {
      result = *next;
    } else if (unknown != nullptr) {
      unknown->push_back(name);
    }
  }
  return result;
}

std::vector<RuleId> RuleSet::enabledRules() const {
  std::vector<RuleId> result;
  for (int idx = 0; idx < kRuleCount; ++idx) {
    if (enabled_.test(static_cast<size_t>(idx))) result.push_back(static_cast<RuleId>(idx));
  }
  return result;
}

}  // namespace satb
