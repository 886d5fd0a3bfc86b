// Progression analyzer implementation.

#include "analysis/progression_analyzer.h"

#include <cstdio>

#include "rules/rules_engine.h"

namespace satb {

namespace {

std::string joinInputs(const VoiceInputs& inputs) {
  std::string result;
  for (size_t idx = 0; idx < inputs.size(); ++idx) {
    if (idx > 0) result += ' ';
    result += inputs[idx].empty() ? "-" : inputs[idx];
  }
  return result;
}

ProgressionResult analyzeWithInputs(const std::vector<SnapshotParseResult>& parsed,
                                    const std::vector<std::string>& inputs,
                                    const KeyContext& key, const RuleSet& rules,
                                    bool verbose) {
  ProgressionResult result;
  result.key = key;
  result.beats.reserve(parsed.size());

  for (size_t idx = 0; idx < parsed.size(); ++idx) {
    BeatResult beat;
    if (idx < inputs.size()) {
      beat.input = inputs[idx];
    } else if (parsed[idx].snapshot) {
      beat.input = parsed[idx].snapshot->toString();
    }
    if (parsed[idx].ok()) {
      beat.analysis = classifyChord(*parsed[idx].snapshot, key);
    } else {
      beat.errors = parsed[idx].errors;
      for (const auto& error : beat.errors) {
        std::fprintf(stderr, "[ProgressionAnalyzer] WARNING: beat %zu %s: %s ('%s')\n",
                     idx + 1, voiceToString(error.voice), error.reason.c_str(),
                     error.input.c_str());
      }
    }
    result.beats.push_back(std::move(beat));
  }

  RulesEngine engine(rules);
  engine.setVerbose(verbose);
  for (size_t idx = 1; idx < result.beats.size(); ++idx) {
    const BeatResult& prev = result.beats[idx - 1];
    const BeatResult& curr = result.beats[idx];
    if (!prev.ok() || !curr.ok()) continue;

    for (auto& violation : engine.validatePair(*prev.analysis, *curr.analysis, key)) {
      LocatedViolation located;
      located.chord_index = static_cast<int>(idx - 1) + violation.chord_index;
      located.violation = std::move(violation);
      result.violations.push_back(std::move(located));
    }
  }
  return result;
}

}  // namespace

int ProgressionResult::invalidBeatCount() const {
  int count = 0;
  for (const auto& beat : beats) {
    if (!beat.ok()) ++count;
  }
  return count;
}

ProgressionResult analyzeProgression(const std::vector<SnapshotParseResult>& beats,
                                     const KeyContext& key, const RuleSet& rules,
                                     bool verbose) {
  return analyzeWithInputs(beats, {}, key, rules, verbose);
}

ProgressionResult analyzeProgression(const std::vector<VoiceInputs>& beats,
                                     const KeyContext& key, const RuleSet& rules,
                                     bool verbose) {
  std::vector<SnapshotParseResult> parsed;
  std::vector<std::string> inputs;
  parsed.reserve(beats.size());
  inputs.reserve(beats.size());
  for (const auto& beat : beats) {
    parsed.push_back(snapshotFromNames(beat));
    inputs.push_back(joinInputs(beat));
  }
  return analyzeWithInputs(parsed, inputs, key, rules, verbose);
}

ProgressionResult analyzeChordStrings(const std::vector<std::string>& chords,
                                      const KeyContext& key, const RuleSet& rules,
                                      bool verbose) {
  std::vector<SnapshotParseResult> parsed;
  parsed.reserve(chords.size());
  for (const auto& chord : chords) parsed.push_back(snapshotFromString(chord));
  return analyzeWithInputs(parsed, chords, key, rules, verbose);
}

}  // namespace satb
