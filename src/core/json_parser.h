// Small recursive JSON parser for prototype, expression and config input.

#ifndef AFFECT_CORE_JSON_PARSER_H
#define AFFECT_CORE_JSON_PARSER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace affect {

/// @brief A JSON value. Objects keep their members in document order.
struct JsonValue {
  enum Type { String, Number, Bool, Null, Array, Object };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;
  std::vector<JsonValue> array_val;
  std::vector<std::pair<std::string, JsonValue>> object_val;

  bool isString() const { return type == String; }
  bool isNumber() const { return type == Number; }
  bool isBool() const { return type == Bool; }
  bool isNull() const { return type == Null; }
  bool isArray() const { return type == Array; }
  bool isObject() const { return type == Object; }

  /// @brief Get value as integer, with default.
  int asInt(int default_val = 0) const;

  /// @brief Get value as unsigned integer, with default.
  uint32_t asUint(uint32_t default_val = 0) const;

  /// @brief Get value as double, with default.
  double asDouble(double default_val = 0.0) const;

  /// @brief Get value as boolean, with default.
  bool asBool(bool default_val = false) const;

  /// @brief Get value as string, with default.
  std::string asString(const std::string& default_val = "") const;

  /// @brief Look up an object member by key.
  /// @return Pointer to the member, or nullptr if absent or not an object.
  const JsonValue* find(const std::string& key) const;
};

/// @brief Outcome of parsing a JSON document.
struct JsonParseResult {
  bool success = false;
  std::string error_message;
  size_t error_offset = 0;  ///< Byte offset of the first error.
  JsonValue value;
};

/// @brief Parse a complete JSON document.
/// @param json Pointer to JSON text.
/// @param length Length of JSON text.
/// @return Parsed value, or success=false with a message and offset.
JsonParseResult parseJson(const char* json, size_t length);

/// @brief Read an entire file into a string.
/// @param path File path.
/// @param out Receives the file contents.
/// @return False if the file cannot be opened.
bool readTextFile(const std::string& path, std::string& out);

}  // namespace affect

#endif  // AFFECT_CORE_JSON_PARSER_H
