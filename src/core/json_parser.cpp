// Implementation of the recursive JSON parser.

#include "core/json_parser.h"

#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace affect {

int JsonValue::asInt(int default_val) const {
  if (type == Number) return static_cast<int>(number_val);
  return default_val;
}

uint32_t JsonValue::asUint(uint32_t default_val) const {
  if (type == Number && number_val >= 0.0) return static_cast<uint32_t>(number_val);
  return default_val;
}

double JsonValue::asDouble(double default_val) const {
  if (type == Number) return number_val;
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

const JsonValue* JsonValue::find(const std::string& key) const {
  if (type != Object) return nullptr;
  for (const auto& member : object_val) {
    if (member.first == key) return &member.second;
  }
  return nullptr;
}

namespace {

constexpr int kMaxDepth = 256;

/// @brief Cursor over the input text with the first recorded error.
struct Cursor {
  const char* json;
  size_t length;
  size_t pos = 0;
  std::string error;
  size_t error_pos = 0;

  bool atEnd() const { return pos >= length; }
  char peek() const { return pos < length ? json[pos] : '\0'; }

  bool fail(const std::string& message) {
    if (error.empty()) {
      error = message;
      error_pos = pos;
    }
    return false;
  }
};

/// @brief Skip whitespace in JSON string.
void skipWhitespace(Cursor& cur) {
  while (!cur.atEnd() && std::isspace(static_cast<unsigned char>(cur.peek()))) {
    ++cur.pos;
  }
}

/// @brief Append a code point as UTF-8.
void appendUtf8(std::string& out, uint32_t code) {
  if (code < 0x80) {
    out += static_cast<char>(code);
  } else if (code < 0x800) {
    out += static_cast<char>(0xC0 | (code >> 6));
    out += static_cast<char>(0x80 | (code & 0x3F));
  } else {
    out += static_cast<char>(0xE0 | (code >> 12));
    out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (code & 0x3F));
  }
}

/// @brief Parse a JSON string literal (expects pos at opening quote).
bool parseString(Cursor& cur, std::string& out) {
  if (cur.peek() != '"') return cur.fail("expected '\"'");
  ++cur.pos;  // skip opening quote

  out.clear();
  while (!cur.atEnd() && cur.peek() != '"') {
    char chr = cur.json[cur.pos];
    if (chr == '\\') {
      ++cur.pos;
      if (cur.atEnd()) return cur.fail("unterminated escape");
      switch (cur.json[cur.pos]) {
        case '"':  out += '"'; break;
        case '\\': out += '\\'; break;
        case '/':  out += '/'; break;
        case 'b':  out += '\b'; break;
        case 'f':  out += '\f'; break;
        case 'n':  out += '\n'; break;
        case 't':  out += '\t'; break;
        case 'r':  out += '\r'; break;
        case 'u': {
          if (cur.pos + 4 >= cur.length) return cur.fail("truncated \\u escape");
          std::string hex(cur.json + cur.pos + 1, 4);
          char* end = nullptr;
          unsigned long code = std::strtoul(hex.c_str(), &end, 16);
          if (end != hex.c_str() + 4) return cur.fail("invalid \\u escape");
          appendUtf8(out, static_cast<uint32_t>(code));
          cur.pos += 4;
          break;
        }
        default:
          return cur.fail("invalid escape character");
      }
    } else {
      out += chr;
    }
    ++cur.pos;
  }

  if (cur.atEnd()) return cur.fail("unterminated string");
  ++cur.pos;  // skip closing quote
  return true;
}

/// @brief Parse a JSON number (integer, fraction, exponent).
bool parseNumber(Cursor& cur, JsonValue& val) {
  size_t start = cur.pos;
  auto digits = [&cur]() {
    size_t begin = cur.pos;
    while (!cur.atEnd() && std::isdigit(static_cast<unsigned char>(cur.peek()))) ++cur.pos;
    return cur.pos > begin;
  };

  if (cur.peek() == '-') ++cur.pos;
  if (!digits()) return cur.fail("invalid number");
  if (cur.peek() == '.') {
    ++cur.pos;
    if (!digits()) return cur.fail("invalid number fraction");
  }
  if (cur.peek() == 'e' || cur.peek() == 'E') {
    ++cur.pos;
    if (cur.peek() == '+' || cur.peek() == '-') ++cur.pos;
    if (!digits()) return cur.fail("invalid number exponent");
  }

  std::string num_str(cur.json + start, cur.pos - start);
  val.type = JsonValue::Number;
  val.number_val = std::strtod(num_str.c_str(), nullptr);
  return true;
}

/// @brief Match a bare literal such as "true".
bool matchLiteral(Cursor& cur, const char* literal) {
  size_t idx = 0;
  while (literal[idx] != '\0') {
    if (cur.pos + idx >= cur.length || cur.json[cur.pos + idx] != literal[idx]) {
      return cur.fail(std::string("invalid literal, expected ") + literal);
    }
    ++idx;
  }
  cur.pos += idx;
  return true;
}

bool parseValue(Cursor& cur, JsonValue& val, int depth);

bool parseArray(Cursor& cur, JsonValue& val, int depth) {
  ++cur.pos;  // skip '['
  val.type = JsonValue::Array;
  skipWhitespace(cur);
  if (cur.peek() == ']') {
    ++cur.pos;
    return true;
  }
  while (true) {
    JsonValue element;
    if (!parseValue(cur, element, depth + 1)) return false;
    val.array_val.push_back(std::move(element));
    skipWhitespace(cur);
    if (cur.peek() == ',') {
      ++cur.pos;
      continue;
    }
    if (cur.peek() == ']') {
      ++cur.pos;
      return true;
    }
    return cur.fail("expected ',' or ']' in array");
  }
}

bool parseObject(Cursor& cur, JsonValue& val, int depth) {
  ++cur.pos;  // skip '{'
  val.type = JsonValue::Object;
  skipWhitespace(cur);
  if (cur.peek() == '}') {
    ++cur.pos;
    return true;
  }
  while (true) {
    skipWhitespace(cur);
    std::string key;
    if (!parseString(cur, key)) return false;
    skipWhitespace(cur);
    if (cur.peek() != ':') return cur.fail("expected ':' after object key");
    ++cur.pos;

    JsonValue member;
    if (!parseValue(cur, member, depth + 1)) return false;
    val.object_val.emplace_back(std::move(key), std::move(member));

    skipWhitespace(cur);
    if (cur.peek() == ',') {
      ++cur.pos;
      continue;
    }
    if (cur.peek() == '}') {
      ++cur.pos;
      return true;
    }
    return cur.fail("expected ',' or '}' in object");
  }
}

bool parseValue(Cursor& cur, JsonValue& val, int depth) {
  if (depth > kMaxDepth) return cur.fail("nesting too deep");
  skipWhitespace(cur);
  if (cur.atEnd()) return cur.fail("unexpected end of input");

  switch (cur.peek()) {
    case '{':
      return parseObject(cur, val, depth);
    case '[':
      return parseArray(cur, val, depth);
    case '"':
      val.type = JsonValue::String;
      return parseString(cur, val.string_val);
    case 't':
      val.type = JsonValue::Bool;
      val.bool_val = true;
      return matchLiteral(cur, "true");
    case 'f':
      val.type = JsonValue::Bool;
      val.bool_val = false;
      return matchLiteral(cur, "false");
    case 'n':
      val.type = JsonValue::Null;
      return matchLiteral(cur, "null");
    default:
      return parseNumber(cur, val);
  }
}

}  // namespace

JsonParseResult parseJson(const char* json, size_t length) {
  JsonParseResult result;
  if (!json || length == 0) {
    result.error_message = "empty input";
    return result;
  }

  Cursor cur{json, length};
  if (!parseValue(cur, result.value, 0)) {
    result.error_message = cur.error;
    result.error_offset = cur.error_pos;
    result.value = JsonValue();
    return result;
  }
  skipWhitespace(cur);
  if (!cur.atEnd()) {
    result.error_message = "trailing characters after JSON value";
    result.error_offset = cur.pos;
    result.value = JsonValue();
    return result;
  }
  result.success = true;
  return result;
}

bool readTextFile(const std::string& path, std::string& out) {
  FILE* file = std::fopen(path.c_str(), "rb");
  if (!file) return false;

  out.clear();
  char buffer[4096];
  size_t bytes_read = 0;
  while ((bytes_read = std::fread(buffer, 1, sizeof(buffer), file)) > 0) {
    out.append(buffer, bytes_read);
  }
  bool read_ok = std::ferror(file) == 0;
  std::fclose(file);
  return read_ok;
}

}  // namespace affect
