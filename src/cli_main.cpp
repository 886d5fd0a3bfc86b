/// @file
/// @brief CLI entry point for the SATB harmony analyzer.

#include <cstdio>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

#include "analysis/analysis_report.h"
#include "analysis/analyzer_config.h"
#include "analysis/progression_analyzer.h"
#include "harmony/key_context.h"
#include "rules/rule_catalogue.h"
#include "rules/rules_engine.h"

namespace {

constexpr int kExitClean = 0;
constexpr int kExitViolations = 1;
constexpr int kExitUsage = 2;

/// @brief Command-line options parsed from argv.
struct CliOptions {
  std::optional<std::string> key;
  std::vector<std::string> chords;
  std::string input_path;
  std::string config_path;
  std::vector<std::string> disabled;
  std::optional<std::string> min_tier;
  bool json_output = false;
  bool verbose = false;
  bool list_rules = false;
  std::optional<std::string> list_tier;
  bool help = false;
};

/// @brief Print usage information to stdout.
void printUsage() {
  std::printf("satb_cli - SATB chord classification and voice-leading checker\n\n");
  std::printf("Usage: satb_cli [options]\n\n");
  std::printf("Options:\n");
  std::printf("  --key KEY         Key (e.g. C_major, a_minor, Eb_major)\n");
  std::printf("  --chord \"S A T B\" Add a chord, soprano first; '-' for a rest\n");
  std::printf("  --input FILE      Progression JSON {\"key\": ..., \"chords\": [...]}\n");
  std::printf("  --config FILE     Analyzer config JSON\n");
  std::printf("  --disable RULE    Disable a rule (repeatable)\n");
  std::printf("  --min-tier TIER   Evaluate rules at or above: critical, important, advanced\n");
  std::printf("  --json            JSON output\n");
  std::printf("  --verbose         Log rule decisions to stderr\n");
  std::printf("  --list-rules [T]  List rules, optionally one tier\n");
  std::printf("  --help            Show this help\n");
  std::printf("\nExit codes: 0 no violations, 1 violations found, 2 usage or config error\n");
}

/// @brief Parse command-line arguments into CliOptions.
/// @return An error message, or empty on success.
std::string parseArgs(int argc, char* argv[], CliOptions& opts) {
  for (int idx = 1; idx < argc; ++idx) {
    const char* arg = argv[idx];
    bool has_value = idx + 1 < argc;
    if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      opts.help = true;
    } else if (std::strcmp(arg, "--key") == 0 && has_value) {
      opts.key = argv[++idx];
    } else if (std::strcmp(arg, "--chord") == 0 && has_value) {
      opts.chords.emplace_back(argv[++idx]);
    } else if (std::strcmp(arg, "--input") == 0 && has_value) {
      opts.input_path = argv[++idx];
    } else if (std::strcmp(arg, "--config") == 0 && has_value) {
      opts.config_path = argv[++idx];
    } else if (std::strcmp(arg, "--disable") == 0 && has_value) {
      opts.disabled.emplace_back(argv[++idx]);
    } else if (std::strcmp(arg, "--min-tier") == 0 && has_value) {
      opts.min_tier = argv[++idx];
    } else if (std::strcmp(arg, "--json") == 0) {
      opts.json_output = true;
    } else if (std::strcmp(arg, "--verbose") == 0) {
      opts.verbose = true;
    } else if (std::strcmp(arg, "--list-rules") == 0) {
      opts.list_rules = true;
      if (has_value && argv[idx + 1][0] != '-') opts.list_tier = argv[++idx];
    } else {
      return std::string("unknown or incomplete option: ") + arg;
    }
  }
  return {};
}

/// @brief Merge config file and flags into one AnalyzerConfig.
/// @return The config, or std::nullopt after reporting the error.
std::optional<satb::AnalyzerConfig> buildConfig(const CliOptions& opts) {
  satb::AnalyzerConfig config;
  if (!opts.config_path.empty()) {
    satb::ConfigResult loaded = satb::loadAnalyzerConfig(opts.config_path);
    if (!loaded.ok()) {
      std::fprintf(stderr, "Error: %s\n", loaded.error.c_str());
      return std::nullopt;
    }
    config = *loaded.config;
  }
  if (opts.key) {
    auto key = satb::keyContextFromString(*opts.key);
    if (!key) {
      std::fprintf(stderr, "Error: unknown key '%s'\n", opts.key->c_str());
      return std::nullopt;
    }
    config.key = *key;
  }
  if (opts.min_tier) {
    auto tier = satb::ruleTierFromString(*opts.min_tier);
    if (!tier) {
      std::fprintf(stderr, "Error: unknown tier '%s'\n", opts.min_tier->c_str());
      return std::nullopt;
    }
    config.min_tier = *tier;
  }
  for (const auto& name : opts.disabled) {
    if (!satb::ruleIdFromString(name)) {
      std::fprintf(stderr, "Error: unknown rule '%s'\n", name.c_str());
      return std::nullopt;
    }
    config.disabled_rules.push_back(name);
  }
  if (opts.verbose) config.verbose = true;
  return config;
}

/// @brief Print the rule catalogue, or one tier of it.
int listRules(const CliOptions& opts) {
  std::optional<satb::RuleTier> tier;
  if (opts.list_tier) {
    tier = satb::ruleTierFromString(*opts.list_tier);
    if (!tier) {
      std::fprintf(stderr, "Error: unknown tier '%s'\n", opts.list_tier->c_str());
      return kExitUsage;
    }
  }
  satb::RulesEngine engine;
  for (const satb::RuleDefinition* rule : engine.activeRules(tier)) {
    std::printf("%-26s %-10s %s\n", rule->name(), satb::ruleTierToString(rule->tier),
                rule->short_message);
  }
  return kExitClean;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  std::string arg_error = parseArgs(argc, argv, opts);
  if (!arg_error.empty()) {
    std::fprintf(stderr, "Error: %s\n", arg_error.c_str());
    printUsage();
    return kExitUsage;
  }
  if (opts.help) {
    printUsage();
    return kExitClean;
  }
  if (opts.list_rules) return listRules(opts);

  auto config = buildConfig(opts);
  if (!config) return kExitUsage;

  std::vector<std::string> chords;
  if (!opts.input_path.empty()) {
    satb::ProgressionFileResult loaded = satb::loadProgressionFile(opts.input_path);
    if (!loaded.ok()) {
      std::fprintf(stderr, "Error: %s\n", loaded.error.c_str());
      return kExitUsage;
    }
    // A --key flag wins over the key named in the file.
    if (loaded.file->key && !opts.key) config->key = *loaded.file->key;
    chords = loaded.file->chords;
  }
  chords.insert(chords.end(), opts.chords.begin(), opts.chords.end());
  if (chords.empty()) {
    std::fprintf(stderr, "Error: no chords given (use --chord or --input)\n");
    printUsage();
    return kExitUsage;
  }

  satb::ProgressionResult result =
      satb::analyzeChordStrings(chords, config->key, config->ruleSet(), config->verbose);

  if (opts.json_output) {
    std::printf("%s\n", satb::progressionToJson(result, config->pretty).c_str());
  } else {
    std::printf("%s", satb::progressionToText(result).c_str());
  }

  return result.hasViolations() ? kExitViolations : kExitClean;
}
