// Implementation of the minimal flat-object JSON parser.

#include "core/json_parser.h"

#include <cctype>
#include <cstdlib>

namespace symforge {

namespace {

void skipWhitespace(std::string_view json, size_t& pos) {
  while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) {
    ++pos;
  }
}

/// @brief Parse a string literal (pos at the opening quote).
/// @return False if the closing quote is missing.
bool parseString(std::string_view json, size_t& pos, std::string& out) {
  if (pos >= json.size() || json[pos] != '"') return false;
  ++pos;

  out.clear();
  while (pos < json.size() && json[pos] != '"') {
    if (json[pos] == '\\' && pos + 1 < json.size()) {
      ++pos;
      switch (json[pos]) {
        case 'n': out += '\n'; break;
        case 't': out += '\t'; break;
        case 'r': out += '\r'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        default:  out += json[pos]; break;  // \" \\ \/
      }
    } else {
      out += json[pos];
    }
    ++pos;
  }

  if (pos >= json.size()) return false;
  ++pos;  // closing quote
  return true;
}

bool parseNumber(std::string_view json, size_t& pos, double& out) {
  size_t start = pos;
  if (pos < json.size() && (json[pos] == '-' || json[pos] == '+')) ++pos;
  while (pos < json.size() &&
         (std::isdigit(static_cast<unsigned char>(json[pos])) || json[pos] == '.' ||
          json[pos] == 'e' || json[pos] == 'E' || json[pos] == '-' || json[pos] == '+')) {
    ++pos;
  }
  if (pos == start) return false;

  std::string num_str(json.substr(start, pos - start));
  char* end = nullptr;
  out = std::strtod(num_str.c_str(), &end);
  return end != nullptr && *end == '\0';
}

bool matchLiteral(std::string_view json, size_t& pos, std::string_view literal) {
  if (json.substr(pos, literal.size()) != literal) return false;
  pos += literal.size();
  return true;
}

/// @brief Skip a nested object or array, honoring strings inside it.
bool skipContainer(std::string_view json, size_t& pos) {
  int depth = 0;
  std::string scratch;
  while (pos < json.size()) {
    char chr = json[pos];
    if (chr == '"') {
      if (!parseString(json, pos, scratch)) return false;
      continue;
    }
    if (chr == '{' || chr == '[') ++depth;
    if (chr == '}' || chr == ']') --depth;
    ++pos;
    if (depth == 0) return true;
  }
  return false;
}

}  // namespace

bool parseFlatJsonObject(std::string_view json, std::map<std::string, JsonValue>& out,
                         std::string& error) {
  size_t pos = 0;
  skipWhitespace(json, pos);
  if (pos >= json.size() || json[pos] != '{') {
    error = "expected '{' at start of object";
    return false;
  }
  ++pos;

  bool expect_entry = true;
  while (true) {
    skipWhitespace(json, pos);
    if (pos >= json.size()) {
      error = "unterminated object";
      return false;
    }
    if (json[pos] == '}') {
      ++pos;
      break;
    }
    if (!expect_entry) {
      if (json[pos] != ',') {
        error = "expected ',' between entries at offset " + std::to_string(pos);
        return false;
      }
      ++pos;
      skipWhitespace(json, pos);
    }

    std::string key;
    if (!parseString(json, pos, key)) {
      error = "expected quoted key at offset " + std::to_string(pos);
      return false;
    }
    skipWhitespace(json, pos);
    if (pos >= json.size() || json[pos] != ':') {
      error = "expected ':' after key '" + key + "'";
      return false;
    }
    ++pos;
    skipWhitespace(json, pos);
    if (pos >= json.size()) {
      error = "missing value for key '" + key + "'";
      return false;
    }

    JsonValue val;
    bool parsed = true;
    char chr = json[pos];
    if (chr == '"') {
      val.type = JsonValue::String;
      parsed = parseString(json, pos, val.string_val);
    } else if (chr == 't' || chr == 'f') {
      val.type = JsonValue::Bool;
      val.bool_val = (chr == 't');
      parsed = matchLiteral(json, pos, val.bool_val ? "true" : "false");
    } else if (chr == 'n') {
      parsed = matchLiteral(json, pos, "null");
    } else if (chr == '{' || chr == '[') {
      if (!skipContainer(json, pos)) {
        error = "unterminated nested value for key '" + key + "'";
        return false;
      }
      expect_entry = false;
      continue;
    } else {
      val.type = JsonValue::Number;
      parsed = parseNumber(json, pos, val.number_val);
    }

    if (!parsed) {
      error = "malformed value for key '" + key + "'";
      return false;
    }
    out[key] = val;
    expect_entry = false;
  }

  return true;
}

}  // namespace symforge
