// Implementation of analyzer configuration loading.

#include "analysis/analyzer_config.h"

#include <cstdio>

#include "core/json_parser.h"

namespace satb {

RuleSet AnalyzerConfig::ruleSet() const {
  return RuleSet::atLeast(min_tier).withoutRules(disabled_rules);
}

// ---------------------------------------------------------------------------
// Files
// ---------------------------------------------------------------------------

std::optional<std::string> readTextFile(const std::string& path) {
  FILE* file = std::fopen(path.c_str(), "rb");
  if (!file) return std::nullopt;

  std::string content;
  char buffer[4096];
  size_t bytes_read = 0;
  while ((bytes_read = std::fread(buffer, 1, sizeof(buffer), file)) > 0) {
    content.append(buffer, bytes_read);
  }
  bool failed = std::ferror(file) != 0;
  std::fclose(file);
  if (failed) return std::nullopt;
  return content;
}

// ---------------------------------------------------------------------------
// Config
// ---------------------------------------------------------------------------

namespace {

ConfigResult configError(std::string error) {
  ConfigResult result;
  result.error = std::move(error);
  return result;
}

bool isConfigKey(const std::string& name) {
  return name == "key" || name == "disabled_rules" || name == "min_tier" ||
         name == "verbose" || name == "pretty";
}

}  // namespace

ConfigResult parseAnalyzerConfig(const std::string& json, const AnalyzerConfig& base) {
  JsonParseResult parsed = parseJsonObject(json);
  if (!parsed.ok) return configError("invalid config JSON: " + parsed.error);

  AnalyzerConfig config = base;
  for (const auto& entry : parsed.values) {
    if (!isConfigKey(entry.first)) {
      std::fprintf(stderr, "[AnalyzerConfig] WARNING: ignoring unknown key '%s'\n",
                   entry.first.c_str());
    }
  }

  auto iter = parsed.values.find("key");
  if (iter != parsed.values.end()) {
    std::string text = iter->second.asString();
    auto key = keyContextFromString(text);
    if (!key) return configError("unknown key '" + text + "'");
    config.key = *key;
  }

  iter = parsed.values.find("disabled_rules");
  if (iter != parsed.values.end()) {
    for (const auto& name : iter->second.asStringList()) {
      if (!ruleIdFromString(name)) return configError("unknown rule '" + name + "'");
      config.disabled_rules.push_back(name);
    }
  }

  iter = parsed.values.find("min_tier");
  if (iter != parsed.values.end()) {
    std::string text = iter->second.asString();
    auto tier = ruleTierFromString(text);
    if (!tier) return configError("unknown tier '" + text + "'");
    config.min_tier = *tier;
  }

  iter = parsed.values.find("verbose");
  if (iter != parsed.values.end()) config.verbose = iter->second.asBool(config.verbose);

  iter = parsed.values.find("pretty");
  if (iter != parsed.values.end()) config.pretty = iter->second.asBool(config.pretty);

  ConfigResult result;
  result.config = std::move(config);
  return result;
}

ConfigResult loadAnalyzerConfig(const std::string& path, const AnalyzerConfig& base) {
  auto text = readTextFile(path);
  if (!text) return configError("cannot read config file: " + path);
  return parseAnalyzerConfig(*text, base);
}

// ---------------------------------------------------------------------------
// Progression files
// ---------------------------------------------------------------------------

namespace {

ProgressionFileResult progressionError(std::string error) {
  ProgressionFileResult result;
  result.error = std::move(error);
  return result;
}

}  // namespace

ProgressionFileResult parseProgressionFile(const std::string& json) {
  JsonParseResult parsed = parseJsonObject(json);
  if (!parsed.ok) return progressionError("invalid progression JSON: " + parsed.error);

  ProgressionFile file;
  auto iter = parsed.values.find("key");
  if (iter != parsed.values.end()) {
    std::string text = iter->second.asString();
    auto key = keyContextFromString(text);
    if (!key) return progressionError("unknown key '" + text + "'");
    file.key = *key;
  }

  iter = parsed.values.find("chords");
  if (iter == parsed.values.end() || iter->second.type != JsonValue::Array) {
    return progressionError("missing \"chords\" array");
  }
  file.chords = iter->second.asStringList();
  if (file.chords.size() != iter->second.array_val.size()) {
    return progressionError("\"chords\" must contain only strings");
  }

  ProgressionFileResult result;
  result.file = std::move(file);
  return result;
}

ProgressionFileResult loadProgressionFile(const std::string& path) {
  auto text = readTextFile(path);
  if (!text) return progressionError("cannot read progression file: " + path);
  return parseProgressionFile(*text);
}

}  // namespace satb
