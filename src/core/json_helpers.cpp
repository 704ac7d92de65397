/// @file
/// @brief JsonWriter token recording and rendering.

#include "core/json_helpers.h"

#include <cmath>
#include <cstdio>
#include <utility>

namespace affect {

void JsonWriter::beginObject() { tokens_.push_back({TokenKind::Open, "{"}); }

void JsonWriter::endObject() { tokens_.push_back({TokenKind::Close, "}"}); }

void JsonWriter::beginArray() { tokens_.push_back({TokenKind::Open, "["}); }

void JsonWriter::endArray() { tokens_.push_back({TokenKind::Close, "]"}); }

void JsonWriter::key(std::string_view name) {
  tokens_.push_back({TokenKind::Key, quote(name)});
}

void JsonWriter::value(std::string_view val) { pushScalar(quote(val)); }

void JsonWriter::value(const char* val) {
  value(std::string_view(val ? val : ""));
}

void JsonWriter::value(int val) { pushScalar(std::to_string(val)); }

void JsonWriter::value(uint32_t val) { pushScalar(std::to_string(val)); }

void JsonWriter::value(uint64_t val) { pushScalar(std::to_string(val)); }

void JsonWriter::value(double val) {
  if (!std::isfinite(val)) {
    pushScalar("null");
    return;
  }
  char num_buf[32];
  std::snprintf(num_buf, sizeof(num_buf), "%.10g", val);
  pushScalar(num_buf);
}

void JsonWriter::value(bool val) { pushScalar(val ? "true" : "false"); }

void JsonWriter::valueNull() { pushScalar("null"); }

std::string JsonWriter::toString() const { return render(-1); }

std::string JsonWriter::toPrettyString(int indent_size) const {
  return render(indent_size < 0 ? 0 : indent_size);
}

void JsonWriter::pushScalar(std::string text) {
  tokens_.push_back({TokenKind::Scalar, std::move(text)});
}

std::string JsonWriter::render(int indent_size) const {
  const bool pretty = indent_size >= 0;
  std::string out;
  int depth = 0;
  bool first_in_container = true;
  bool after_key = false;

  auto newline = [&]() {
    if (!pretty) return;
    out += '\n';
    out.append(static_cast<size_t>(depth * indent_size), ' ');
  };

  for (const Token& token : tokens_) {
    switch (token.kind) {
      case TokenKind::Key:
        if (!first_in_container) out += ',';
        newline();
        out += token.text;
        out += pretty ? ": " : ":";
        after_key = true;
        first_in_container = false;
        break;

      case TokenKind::Open:
      case TokenKind::Scalar:
        if (!after_key) {
          if (!first_in_container) out += ',';
          if (depth > 0) newline();
        }
        out += token.text;
        after_key = false;
        first_in_container = false;
        if (token.kind == TokenKind::Open) {
          ++depth;
          first_in_container = true;
        }
        break;

      case TokenKind::Close:
        --depth;
        // Empty containers stay on one line.
        if (!first_in_container) newline();
        out += token.text;
        first_in_container = false;
        after_key = false;
        break;
    }
  }
  return out;
}

std::string JsonWriter::quote(std::string_view input) {
  std::string result;
  result.reserve(input.size() + 2);
  result += '"';
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
  result += '"';
  return result;
}

}  // namespace affect
