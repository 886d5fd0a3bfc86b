// Analyzer configuration and progression files (flat JSON).

#ifndef SATB_ANALYSIS_ANALYZER_CONFIG_H
#define SATB_ANALYSIS_ANALYZER_CONFIG_H

#include <optional>
#include <string>
#include <vector>

#include "harmony/key_context.h"
#include "rules/rule_set.h"
#include "rules/rule_types.h"

namespace satb {

/// Settings shared by the CLI and embedding code.
struct AnalyzerConfig {
  KeyContext key;                           ///< C major by default.
  std::vector<std::string> disabled_rules;  ///< Snake-case rule names.
  RuleTier min_tier = RuleTier::Advanced;   ///< Least severe tier to evaluate.
  bool verbose = false;
  bool pretty = true;

  /// @brief Rules at or above min_tier, minus the disabled ones.
  RuleSet ruleSet() const;
};

/// Parsed configuration or the reason parsing failed.
struct ConfigResult {
  std::optional<AnalyzerConfig> config;
  std::string error;

  bool ok() const { return config.has_value(); }
};

/// @brief Parse a config object, starting from a base config.
///
/// Recognized keys: "key", "disabled_rules", "min_tier", "verbose",
/// "pretty". Unknown keys are ignored with a warning; an unknown key name,
/// tier or rule is an error.
ConfigResult parseAnalyzerConfig(const std::string& json,
                                 const AnalyzerConfig& base = AnalyzerConfig());

/// @brief Read and parse a config file.
ConfigResult loadAnalyzerConfig(const std::string& path,
                                const AnalyzerConfig& base = AnalyzerConfig());

/// A progression read from a file.
struct ProgressionFile {
  std::optional<KeyContext> key;  ///< Empty when the file names no key.
  std::vector<std::string> chords;
};

/// Parsed progression file or the reason parsing failed.
struct ProgressionFileResult {
  std::optional<ProgressionFile> file;
  std::string error;

  bool ok() const { return file.has_value(); }
};

/// @brief Parse {"key": "C_major", "chords": ["F4 D4 B3 G2", ...]}.
ProgressionFileResult parseProgressionFile(const std::string& json);

/// @brief Read and parse a progression file.
ProgressionFileResult loadProgressionFile(const std::string& path);

/// @brief Read a whole text file.
/// @return File contents, or std::nullopt when unreadable.
std::optional<std::string> readTextFile(const std::string& path);

}  // namespace satb

#endif  // SATB_ANALYSIS_ANALYZER_CONFIG_H
