// Minimal flat-object JSON parser for configuration input (no external
// dependencies).
//
// Handles only the subset needed for ForgeConfig: one object whose values
// are strings, numbers, booleans or null. Nested objects and arrays are
// skipped.

#ifndef SYMFORGE_CORE_JSON_PARSER_H
#define SYMFORGE_CORE_JSON_PARSER_H

#include <map>
#include <string>
#include <string_view>

namespace symforge {

/// @brief A single scalar JSON value.
struct JsonValue {
  enum Type { String, Number, Bool, Null };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;

  bool isNumber() const { return type == Number; }
  bool isString() const { return type == String; }
  bool isBool() const { return type == Bool; }
};

/// @brief Parse a flat JSON object into a key-value map.
/// @param json JSON text.
/// @param out Receives the top-level scalar entries.
/// @param error Receives a description when parsing fails.
/// @return True on success. On failure `out` holds the entries parsed so far.
bool parseFlatJsonObject(std::string_view json, std::map<std::string, JsonValue>& out,
                         std::string& error);

}  // namespace symforge

#endif  // SYMFORGE_CORE_JSON_PARSER_H
