// Minimal JSON serialization writer (no external dependencies).
//
// Builds analysis reports and rule listings incrementally. Compact output by
// default; pass an indent width for line-broken output. Does not parse JSON.

#ifndef SATB_CORE_JSON_HELPERS_H
#define SATB_CORE_JSON_HELPERS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace satb {

/// @brief JSON writer that appends to an internal buffer.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("rule");
///   writer.value("parallel_fifths");
///   writer.key("confidence");
///   writer.value(100);
///   writer.endObject();
///   // writer.toString() -> {"rule":"parallel_fifths","confidence":100}
/// @endcode
///
/// Commas are inserted automatically. The caller is responsible for matching
/// begin/end calls.
class JsonWriter {
 public:
  /// @brief Create a writer.
  /// @param indent_size Spaces per nesting level; 0 writes compact JSON.
  explicit JsonWriter(int indent_size = 0) : indent_size_(indent_size) {}

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key (must be followed by a value or container).
  void key(std::string_view name);

  /// @brief Write a string value (JSON-escaped).
  void value(std::string_view val);

  /// @brief Write a string literal. Prevents literals binding to value(bool).
  void value(const char* val);

  void value(int val);
  void value(uint32_t val);
  void value(bool val);
  void valueNull();

  /// @brief Write an array of strings as a single value.
  void valueStringArray(const std::vector<std::string>& values);

  /// @brief Get the JSON text written so far.
  const std::string& toString() const { return buffer_; }

 private:
  /// Emit the separator and indentation that precede a new element.
  void beforeElement();

  /// Open a container with the given bracket.
  void open(char bracket);

  /// Close a container with the given bracket.
  void close(char bracket);

  /// Append a newline plus indentation for the current depth.
  void newline();

  static std::string escapeString(std::string_view input);

  std::string buffer_;
  int indent_size_ = 0;

  /// One entry per open container: count of elements written so far.
  std::vector<uint32_t> element_counts_;

  /// True right after key(): the next value belongs to that key.
  bool after_key_ = false;
};

}  // namespace satb

#endif  // SATB_CORE_JSON_HELPERS_H
