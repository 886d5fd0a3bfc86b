/// @file
/// @brief Implementation of the minimal JSON writer used for reports.

#include "core/json_helpers.h"

#include <cstdio>

namespace satb {

// ---------------------------------------------------------------------------
// Layout helpers
// ---------------------------------------------------------------------------

void JsonWriter::newline() {
  if (indent_size_ <= 0) return;
  buffer_ += '\n';
  buffer_.append(element_counts_.size() * static_cast<size_t>(indent_size_), ' ');
}

void JsonWriter::beforeElement() {
  if (after_key_) {
    after_key_ = false;
    return;
  }
  if (element_counts_.empty()) return;
  if (element_counts_.back() > 0) buffer_ += ',';
  ++element_counts_.back();
  newline();
}

void JsonWriter::open(char bracket) {
  beforeElement();
  buffer_ += bracket;
  element_counts_.push_back(0);
}

void JsonWriter::close(char bracket) {
  bool had_elements = !element_counts_.empty() && element_counts_.back() > 0;
  if (!element_counts_.empty()) element_counts_.pop_back();
  // Empty containers stay compact: {} or [].
  if (had_elements) newline();
  buffer_ += bracket;
}

// ---------------------------------------------------------------------------
// Containers and keys
// ---------------------------------------------------------------------------

void JsonWriter::beginObject() { open('{'); }
void JsonWriter::endObject() { close('}'); }
void JsonWriter::beginArray() { open('['); }
void JsonWriter::endArray() { close(']'); }

void JsonWriter::key(std::string_view name) {
  beforeElement();
  buffer_ += '"';
  buffer_ += escapeString(name);
  buffer_ += indent_size_ > 0 ? "\": " : "\":";
  after_key_ = true;
}

// ---------------------------------------------------------------------------
// Values
// ---------------------------------------------------------------------------

void JsonWriter::value(std::string_view val) {
  beforeElement();
  buffer_ += '"';
  buffer_ += escapeString(val);
  buffer_ += '"';
}

void JsonWriter::value(const char* val) {
  if (val == nullptr) {
    valueNull();
    return;
  }
  value(std::string_view(val));
}

void JsonWriter::value(int val) {
  beforeElement();
  buffer_ += std::to_string(val);
}

void JsonWriter::value(uint32_t val) {
  beforeElement();
  buffer_ += std::to_string(val);
}

void JsonWriter::value(bool val) {
  beforeElement();
  buffer_ += val ? "true" : "false";
}

void JsonWriter::valueNull() {
  beforeElement();
  buffer_ += "null";
}

void JsonWriter::valueStringArray(const std::vector<std::string>& values) {
  beginArray();
  for (const auto& item : values) {
    value(std::string_view(item));
  }
  endArray();
}

std::string JsonWriter::escapeString(std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (char chr : input) {
    switch (chr) {
      case '"':  result += "\\\""; break;
      case '\\': result += "\\\\"; break;
      case '\b': result += "\\b";  break;
      case '\f': result += "\\f";  break;
      case '\n': result += "\\n";  break;
      case '\r': result += "\\r";  break;
      case '\t': result += "\\t";  break;
      default:
        if (static_cast<unsigned char>(chr) < 0x20) {
          char hex_buf[8];
          std::snprintf(hex_buf, sizeof(hex_buf), "\\u%04x",
                        static_cast<unsigned>(static_cast<unsigned char>(chr)));
          result += hex_buf;
        } else {
          result += chr;
        }
        break;
    }
  }
  return result;
}

}  // namespace satb
