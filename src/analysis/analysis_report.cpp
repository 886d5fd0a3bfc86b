/// @file
/// @brief Text and JSON rendering of progression results.

#include "analysis/analysis_report.h"

#include <algorithm>

#include "core/json_helpers.h"
#include "rules/rule_catalogue.h"

namespace satb {

// ---------------------------------------------------------------------------
// Placement
// ---------------------------------------------------------------------------

BeatPosition beatPosition(int chord_index) {
  BeatPosition pos;
  pos.measure = chord_index / kBeatsPerMeasure + 1;
  pos.beat = chord_index % kBeatsPerMeasure + 1;
  return pos;
}

std::string beatPositionLabel(int chord_index) {
  BeatPosition pos = beatPosition(chord_index);
  return "m" + std::to_string(pos.measure) + " b" + std::to_string(pos.beat);
}

std::vector<Voice> displayVoiceOrder(const std::vector<Voice>& voices) {
  std::vector<Voice> result = voices;
  std::stable_sort(result.begin(), result.end(), [](Voice lhs, Voice rhs) {
    return voiceRankLowToHigh(lhs) < voiceRankLowToHigh(rhs);
  });
  return result;
}

TierSummary summarizeTiers(const std::vector<LocatedViolation>& violations) {
  TierSummary summary;
  for (const auto& located : violations) {
    switch (located.violation.tier) {
      case RuleTier::Critical:
        ++summary.critical;
        break;
      case RuleTier::Important:
        ++summary.important;
        break;
      case RuleTier::Advanced:
        ++summary.advanced;
        break;
    }
  }
  return summary;
}

// ---------------------------------------------------------------------------
// Text
// ---------------------------------------------------------------------------

namespace {

std::string joinVoiceNames(const std::vector<Voice>& voices) {
  std::string result;
  for (Voice voice : displayVoiceOrder(voices)) {
    if (!result.empty()) result += '-';
    result += voiceToString(voice);
  }
  return result;
}

std::vector<std::string> factorTokens(const ChordAnalysis& analysis) {
  std::vector<std::string> tokens;
  for (Voice voice : kAllVoices) {
    const auto& factor = analysis.factor(voice);
    tokens.push_back(factor ? std::string(1, chordFactorToChar(*factor)) : "-");
  }
  return tokens;
}

}  // namespace

std::string formatViolationLine(const LocatedViolation& located) {
  const RuleViolation& violation = located.violation;
  std::string line = beatPositionLabel(located.chord_index) + ": " + violation.short_message;
  if (!violation.voices.empty()) line += " (" + joinVoiceNames(violation.voices) + ")";
  if (!violation.detail.empty()) line += ", " + violation.detail;
  line += " [";
  line += ruleIdToString(violation.rule);
  line += ", " + std::to_string(violation.confidence) + "%]";
  return line;
}

std::string formatBeatLine(const BeatResult& beat, int chord_index) {
  std::string line = beatPositionLabel(chord_index) + ": ";
  if (!beat.ok()) {
    line += "invalid chord";
    for (const auto& error : beat.errors) {
      line += " [";
      line += voiceToString(error.voice);
      line += ": " + error.reason;
      if (!error.input.empty()) line += " '" + error.input + "'";
      line += "]";
    }
    return line;
  }
  const ChordAnalysis& analysis = *beat.analysis;
  line += analysis.displayLabel();
  line += " (";
  line += harmonicFunctionToString(analysis.function);
  line += ") ";
  line += analysis.snapshot().toString();
  return line;
}

std::string progressionToText(const ProgressionResult& result) {
  std::string out;
  out += "Key: " + keyContextToString(result.key) + "\n";
  for (size_t idx = 0; idx < result.beats.size(); ++idx) {
    out += formatBeatLine(result.beats[idx], static_cast<int>(idx)) + "\n";
  }

  TierSummary summary = summarizeTiers(result.violations);
  out += "\nViolations: " + std::to_string(summary.total());
  out += " (critical " + std::to_string(summary.critical);
  out += ", important " + std::to_string(summary.important);
  out += ", advanced " + std::to_string(summary.advanced) + ")\n";
  for (const auto& located : result.violations) {
    out += formatViolationLine(located) + "\n";
  }
  return out;
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

namespace {

void writeBeat(JsonWriter& writer, const BeatResult& beat, int chord_index) {
  BeatPosition pos = beatPosition(chord_index);
  writer.beginObject();
  writer.key("index");
  writer.value(chord_index);
  writer.key("measure");
  writer.value(pos.measure);
  writer.key("beat");
  writer.value(pos.beat);
  writer.key("input");
  writer.value(beat.input);

  if (beat.ok()) {
    const ChordAnalysis& analysis = *beat.analysis;
    writer.key("label");
    writer.value(analysis.displayLabel());
    writer.key("numeral");
    writer.value(analysis.numeral);
    writer.key("cipher");
    writer.value(analysis.cipher);
    writer.key("function");
    writer.value(harmonicFunctionToString(analysis.function));
    writer.key("quality");
    writer.value(chordQualityToString(analysis.quality()));
    writer.key("inversion");
    writer.value(analysis.inversion());
    writer.key("diatonic");
    writer.value(analysis.is_diatonic);
    writer.key("uncertain");
    writer.value(analysis.uncertain);
    writer.key("chromatic");
    if (analysis.chromatic) {
      writer.value(chromaticKindToString(*analysis.chromatic));
    } else {
      writer.valueNull();
    }
    writer.key("factors");
    writer.valueStringArray(factorTokens(analysis));
  }

  writer.key("errors");
  writer.beginArray();
  for (const auto& error : beat.errors) {
    writer.beginObject();
    writer.key("voice");
    writer.value(voiceToString(error.voice));
    writer.key("input");
    writer.value(error.input);
    writer.key("reason");
    writer.value(error.reason);
    writer.endObject();
  }
  writer.endArray();
  writer.endObject();
}

void writeViolation(JsonWriter& writer, const LocatedViolation& located) {
  const RuleViolation& violation = located.violation;
  BeatPosition pos = beatPosition(located.chord_index);
  writer.beginObject();
  writer.key("rule");
  writer.value(ruleIdToString(violation.rule));
  writer.key("tier");
  writer.value(ruleTierToString(violation.tier));
  writer.key("confidence");
  writer.value(violation.confidence);

  std::vector<std::string> voices;
  for (Voice voice : displayVoiceOrder(violation.voices)) voices.emplace_back(voiceToString(voice));
  writer.key("voices");
  writer.valueStringArray(voices);

  writer.key("motion");
  if (violation.motion) {
    writer.value(motionTypeToString(*violation.motion));
  } else {
    writer.valueNull();
  }
  writer.key("chord_index");
  writer.value(located.chord_index);
  writer.key("measure");
  writer.value(pos.measure);
  writer.key("beat");
  writer.value(pos.beat);
  writer.key("short_message");
  writer.value(violation.short_message);
  writer.key("full_message");
  writer.value(violation.full_message);
  if (!violation.detail.empty()) {
    writer.key("detail");
    writer.value(violation.detail);
  }
  writer.endObject();
}

}  // namespace

std::string progressionToJson(const ProgressionResult& result, bool pretty) {
  JsonWriter writer(pretty ? 2 : 0);
  writer.beginObject();

  writer.key("key");
  writer.value(keyContextToString(result.key));

  writer.key("chords");
  writer.beginArray();
  for (size_t idx = 0; idx < result.beats.size(); ++idx) {
    writeBeat(writer, result.beats[idx], static_cast<int>(idx));
  }
  writer.endArray();

  writer.key("violations");
  writer.beginArray();
  for (const auto& located : result.violations) writeViolation(writer, located);
  writer.endArray();

  TierSummary summary = summarizeTiers(result.violations);
  writer.key("summary");
  writer.beginObject();
  writer.key("critical");
  writer.value(summary.critical);
  writer.key("important");
  writer.value(summary.important);
  writer.key("advanced");
  writer.value(summary.advanced);
  writer.key("total");
  writer.value(summary.total());
  writer.key("invalid_chords");
  writer.value(result.invalidBeatCount());
  writer.endObject();

  writer.endObject();
  return writer.toString();
}

}  // namespace satb
