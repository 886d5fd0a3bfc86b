// Minimal flat-object JSON parser for configuration and progression input
// (no external dependencies).
//
// Handles a top-level object whose values are strings, numbers, booleans,
// null, or arrays of those scalars. Nested objects are skipped.

#ifndef SATB_CORE_JSON_PARSER_H
#define SATB_CORE_JSON_PARSER_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace satb {

/// @brief A single JSON value (scalar, or an array of scalars).
struct JsonValue {
  enum Type { String, Number, Bool, Null, Array };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;
  std::vector<JsonValue> array_val;

  /// @brief Get value as integer, with default.
  int asInt(int default_val = 0) const;

  /// @brief Get value as boolean, with default.
  bool asBool(bool default_val = false) const;

  /// @brief Get value as string, with default.
  std::string asString(const std::string& default_val = "") const;

  /// @brief Get the string elements of an array value.
  ///
  /// A plain string value yields a one-element list. Non-string array
  /// elements are skipped.
  std::vector<std::string> asStringList() const;
};

/// @brief Result of parsing a flat JSON object.
struct JsonParseResult {
  bool ok = false;
  std::string error;  ///< Short reason when ok is false.
  std::map<std::string, JsonValue> values;
};

/// @brief Parse a flat JSON object into a key-value map.
/// @param json Pointer to JSON text.
/// @param length Length of the JSON text.
/// @return Parsed values, or ok=false with an error description.
JsonParseResult parseJsonObject(const char* json, size_t length);

/// @brief Convenience overload for std::string input.
JsonParseResult parseJsonObject(const std::string& json);

}  // namespace satb

#endif  // SATB_CORE_JSON_PARSER_H
