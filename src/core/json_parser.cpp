// Implementation of the minimal flat-object JSON parser.

#include "core/json_parser.h"

#include <cctype>
#include <cstdlib>

namespace satb {

int JsonValue::asInt(int default_val) const {
  if (type == Number) return static_cast<int>(number_val);
  return default_val;
}

bool JsonValue::asBool(bool default_val) const {
  if (type == Bool) return bool_val;
  return default_val;
}

std::string JsonValue::asString(const std::string& default_val) const {
  if (type == String) return string_val;
  return default_val;
}

std::vector<std::string> JsonValue::asStringList() const {
  std::vector<std::string> result;
  if (type == String) {
    result.push_back(string_val);
  } else if (type == Array) {
    for (const auto& item : array_val) {
      if (item.type == String) result.push_back(item.string_val);
    }
  }
  return result;
}

namespace {

/// @brief Cursor over the input text.
struct Reader {
  const char* json;
  size_t length;
  size_t pos = 0;

  bool atEnd() const { return pos >= length; }
  char peek() const { return json[pos]; }

  void skipWhitespace() {
    while (pos < length && std::isspace(static_cast<unsigned char>(json[pos]))) {
      ++pos;
    }
  }

  bool consumeWord(const char* word) {
    size_t idx = 0;
    while (word[idx] != '\0') {
      if (pos + idx >= length || json[pos + idx] != word[idx]) return false;
      ++idx;
    }
    pos += idx;
    return true;
  }
};

/// @brief Parse a string literal (expects the cursor at the opening quote).
bool parseString(Reader& reader, std::string& out) {
  if (reader.atEnd() || reader.peek() != '"') return false;
  ++reader.pos;

  out.clear();
  while (!reader.atEnd() && reader.peek() != '"') {
    char chr = reader.peek();
    if (chr == '\\' && reader.pos + 1 < reader.length) {
      ++reader.pos;
      switch (reader.peek()) {
        case '"':  out += '"'; break;
        case '\\': out += '\\'; break;
        case '/':  out += '/'; break;
        case 'n':  out += '\n'; break;
        case 't':  out += '\t'; break;
        case 'r':  out += '\r'; break;
        default:   out += reader.peek(); break;
      }
    } else {
      out += chr;
    }
    ++reader.pos;
  }

  if (reader.atEnd()) return false;  // unterminated
  ++reader.pos;
  return true;
}

/// @brief Parse a number (integer or floating point).
bool parseNumber(Reader& reader, JsonValue& out) {
  size_t start = reader.pos;
  if (!reader.atEnd() && reader.peek() == '-') ++reader.pos;
  size_t digits_start = reader.pos;
  while (!reader.atEnd() && std::isdigit(static_cast<unsigned char>(reader.peek()))) {
    ++reader.pos;
  }
  if (reader.pos == digits_start) return false;
  if (!reader.atEnd() && reader.peek() == '.') {
    ++reader.pos;
    while (!reader.atEnd() && std::isdigit(static_cast<unsigned char>(reader.peek()))) {
      ++reader.pos;
    }
  }

  std::string num_str(reader.json + start, reader.pos - start);
  out.type = JsonValue::Number;
  out.number_val = std::strtod(num_str.c_str(), nullptr);
  return true;
}

/// @brief Skip a nested object, honoring strings that contain braces.
bool skipObject(Reader& reader) {
  int depth = 0;
  std::string scratch;
  while (!reader.atEnd()) {
    char chr = reader.peek();
    if (chr == '"') {
      if (!parseString(reader, scratch)) return false;
      continue;
    }
    if (chr == '{') ++depth;
    if (chr == '}') {
      --depth;
      if (depth == 0) {
        ++reader.pos;
        return true;
      }
    }
    ++reader.pos;
  }
  return false;
}

bool parseValue(Reader& reader, JsonValue& out, bool allow_array);

/// @brief Parse an array of scalars (expects the cursor at '[').
bool parseArray(Reader& reader, JsonValue& out) {
  ++reader.pos;  // '['
  out.type = JsonValue::Array;
  out.array_val.clear();

  reader.skipWhitespace();
  if (!reader.atEnd() && reader.peek() == ']') {
    ++reader.pos;
    return true;
  }

  while (!reader.atEnd()) {
    reader.skipWhitespace();
    if (!reader.atEnd() && reader.peek() == '{') {
      // Objects inside arrays are not supported; skip them.
      if (!skipObject(reader)) return false;
    } else {
      JsonValue item;
      if (!parseValue(reader, item, false)) return false;
      out.array_val.push_back(item);
    }
    reader.skipWhitespace();
    if (reader.atEnd()) return false;
    if (reader.peek() == ',') {
      ++reader.pos;
      continue;
    }
    if (reader.peek() == ']') {
      ++reader.pos;
      return true;
    }
    return false;
  }
  return false;
}

bool parseValue(Reader& reader, JsonValue& out, bool allow_array) {
  reader.skipWhitespace();
  if (reader.atEnd()) return false;

  char chr = reader.peek();
  if (chr == '"') {
    out.type = JsonValue::String;
    return parseString(reader, out.string_val);
  }
  if (chr == '[') {
    if (!allow_array) return false;
    return parseArray(reader, out);
  }
  if (reader.consumeWord("true")) {
    out.type = JsonValue::Bool;
    out.bool_val = true;
    return true;
  }
  if (reader.consumeWord("false")) {
    out.type = JsonValue::Bool;
    out.bool_val = false;
    return true;
  }
  if (reader.consumeWord("null")) {
    out.type = JsonValue::Null;
    return true;
  }
  return parseNumber(reader, out);
}

/// @brief Build a failed result with a position-tagged message.
JsonParseResult failAt(const Reader& reader, const char* what) {
  JsonParseResult result;
  result.ok = false;
  result.error = std::string(what) + " at offset " + std::to_string(reader.pos);
  return result;
}

}  // namespace

JsonParseResult parseJsonObject(const char* json, size_t length) {
  if (json == nullptr || length == 0) {
    JsonParseResult result;
    result.error = "empty input";
    return result;
  }

  Reader reader{json, length};
  reader.skipWhitespace();
  if (reader.atEnd() || reader.peek() != '{') return failAt(reader, "expected '{'");
  ++reader.pos;

  JsonParseResult result;
  reader.skipWhitespace();
  if (!reader.atEnd() && reader.peek() == '}') {
    result.ok = true;
    return result;
  }

  while (!reader.atEnd()) {
    reader.skipWhitespace();
    std::string key;
    if (!parseString(reader, key)) return failAt(reader, "expected key string");

    reader.skipWhitespace();
    if (reader.atEnd() || reader.peek() != ':') return failAt(reader, "expected ':'");
    ++reader.pos;
    reader.skipWhitespace();

    if (!reader.atEnd() && reader.peek() == '{') {
      if (!skipObject(reader)) return failAt(reader, "unterminated object");
    } else {
      JsonValue val;
      if (!parseValue(reader, val, true)) return failAt(reader, "invalid value");
      result.values[key] = val;
    }

    reader.skipWhitespace();
    if (reader.atEnd()) return failAt(reader, "unexpected end of input");
    if (reader.peek() == ',') {
      ++reader.pos;
      continue;
    }
    if (reader.peek() == '}') {
      result.ok = true;
      return result;
    }
    return failAt(reader, "expected ',' or '}'");
  }
  return failAt(reader, "unexpected end of input");
}

JsonParseResult parseJsonObject(const std::string& json) {
  return parseJsonObject(json.data(), json.size());
}

}  // namespace satb
