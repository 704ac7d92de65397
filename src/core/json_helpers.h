// Minimal JSON serialization writer for diagnostic reports.
//
// Builds JSON output via a string-builder approach. Non-finite doubles are
// written as null so NaN metrics never produce invalid documents.

#ifndef AFFECT_CORE_JSON_HELPERS_H
#define AFFECT_CORE_JSON_HELPERS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace affect {

/// @brief Simple JSON writer that builds a JSON string incrementally.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("prototypeId");
///   writer.value("joy");
///   writer.key("activationRate");
///   writer.value(0.25);
///   writer.endObject();
///   std::string json = writer.toString();
///   // -> {"prototypeId":"joy","activationRate":0.25}
/// @endcode
///
/// Calls are recorded as tokens; commas and indentation are decided when the
/// output is rendered. Structure is not validated (begin/end must pair up).
class JsonWriter {
 public:
  JsonWriter() = default;

  /// @brief Begin a JSON object '{'.
  void beginObject();

  /// @brief End a JSON object '}'.
  void endObject();

  /// @brief Begin a JSON array '['.
  void beginArray();

  /// @brief End a JSON array ']'.
  void endArray();

  /// @brief Write an object key (must be followed by a value call).
  /// @param name Key string.
  void key(std::string_view name);

  /// @brief Write a string value.
  /// @param val String to write (will be JSON-escaped).
  void value(std::string_view val);

  /// @brief Write a string value from a C string.
  /// @param val Null-terminated string (kept from converting to bool).
  void value(const char* val);

  /// @brief Write an integer value.
  /// @param val Integer value.
  void value(int val);

  /// @brief Write an unsigned integer value.
  /// @param val Unsigned integer value.
  void value(uint32_t val);

  /// @brief Write a 64-bit unsigned integer value (sample counts).
  /// @param val Unsigned integer value.
  void value(uint64_t val);

  /// @brief Write a floating-point value. NaN and infinity become null.
  /// @param val Double value.
  void value(double val);

  /// @brief Write a boolean value.
  /// @param val Boolean value.
  void value(bool val);

  /// @brief Write a null value.
  void valueNull();

  /// @brief Write a key followed by a value.
  template <typename T>
  void field(std::string_view name, const T& val) {
    key(name);
    value(val);
  }

  /// @brief Get the accumulated JSON string.
  /// @return Complete JSON string built so far.
  std::string toString() const;

  /// @brief Get the accumulated JSON string with pretty-print indentation.
  /// @param indent_size Number of spaces per indent level (default: 2).
  /// @return Formatted JSON string.
  std::string toPrettyString(int indent_size = 2) const;

 private:
  enum class TokenKind : uint8_t { Open, Close, Key, Scalar };

  struct Token {
    TokenKind kind;
    std::string text;  ///< Bracket, escaped key, or rendered scalar.
  };

  void pushScalar(std::string text);

  /// Render the token stream; a negative indent gives the compact form.
  std::string render(int indent_size) const;

  static std::string quote(std::string_view input);

  std::vector<Token> tokens_;
};

}  // namespace affect

#endif  // AFFECT_CORE_JSON_HELPERS_H
