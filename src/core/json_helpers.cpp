/// @file
/// @brief Implementation of the minimal JSON writer for metadata documents.

#include "core/json_helpers.h"

#include <cmath>
#include <cstdio>

namespace symforge {

// ---------------------------------------------------------------------------
// Containers and keys
// ---------------------------------------------------------------------------

void JsonWriter::open(char bracket) {
  beforeElement();
  buffer_ += bracket;
  scopes_.emplace_back();
}

void JsonWriter::close(char bracket) {
  buffer_ += bracket;
  if (!scopes_.empty()) scopes_.pop_back();
  afterValue();
}

void JsonWriter::beginObject() { open('{'); }
void JsonWriter::endObject() { close('}'); }
void JsonWriter::beginArray() { open('['); }
void JsonWriter::endArray() { close(']'); }

void JsonWriter::key(std::string_view name) {
  beforeElement();
  buffer_ += '"';
  appendEscaped(buffer_, name);
  buffer_ += "\":";
  if (!scopes_.empty()) scopes_.back().pending_key = true;
}

void JsonWriter::beforeElement() {
  if (scopes_.empty()) return;
  Scope& scope = scopes_.back();
  if (scope.pending_key) {
    // Value completing a key/value pair: no separator.
    scope.pending_key = false;
    return;
  }
  if (scope.elements > 0) buffer_ += ',';
}

void JsonWriter::afterValue() {
  if (!scopes_.empty()) ++scopes_.back().elements;
}

// ---------------------------------------------------------------------------
// Scalars
// ---------------------------------------------------------------------------

void JsonWriter::value(std::string_view val) {
  beforeElement();
  buffer_ += '"';
  appendEscaped(buffer_, val);
  buffer_ += '"';
  afterValue();
}

void JsonWriter::value(int64_t val) {
  beforeElement();
  buffer_ += std::to_string(val);
  afterValue();
}

void JsonWriter::value(double val) {
  beforeElement();
  if (!std::isfinite(val)) {
    buffer_ += "null";
  } else {
    // Ratios, percentages and blend factors: six significant digits.
    char digits[32];
    std::snprintf(digits, sizeof(digits), "%.6g", val);
    buffer_ += digits;
  }
  afterValue();
}

void JsonWriter::value(bool val) {
  beforeElement();
  buffer_ += val ? "true" : "false";
  afterValue();
}

void JsonWriter::valueNull() {
  beforeElement();
  buffer_ += "null";
  afterValue();
}

void JsonWriter::appendEscaped(std::string& out, std::string_view input) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (char chr : input) {
    auto byte = static_cast<unsigned char>(chr);
    if (chr == '"' || chr == '\\') {
      out += '\\';
      out += chr;
    } else if (chr == '\n') {
      out += "\\n";
    } else if (chr == '\t') {
      out += "\\t";
    } else if (chr == '\r') {
      out += "\\r";
    } else if (chr == '\b') {
      out += "\\b";
    } else if (chr == '\f') {
      out += "\\f";
    } else if (byte < 0x20) {
      out += "\\u00";
      out += kHex[byte >> 4];
      out += kHex[byte & 0x0F];
    } else {
      out += chr;
    }
  }
}

// ---------------------------------------------------------------------------
// Pretty printing
// ---------------------------------------------------------------------------

std::string JsonWriter::toPrettyString(int indent_size) const {
  std::string out;
  out.reserve(buffer_.size() * 2);
  size_t depth = 0;
  size_t step = indent_size > 0 ? static_cast<size_t>(indent_size) : 0;

  auto breakLine = [&]() {
    out += '\n';
    out.append(depth * step, ' ');
  };

  size_t pos = 0;
  while (pos < buffer_.size()) {
    char chr = buffer_[pos];

    // Copy string literals untouched, escapes included.
    if (chr == '"') {
      size_t end = pos + 1;
      while (end < buffer_.size() && buffer_[end] != '"') {
        end += buffer_[end] == '\\' ? 2 : 1;
      }
      out.append(buffer_, pos, end + 1 - pos);
      pos = end + 1;
      continue;
    }

    bool opens = chr == '{' || chr == '[';
    bool closes = chr == '}' || chr == ']';
    if (opens) {
      out += chr;
      ++depth;
      char next = pos + 1 < buffer_.size() ? buffer_[pos + 1] : '\0';
      if (next != '}' && next != ']') breakLine();
    } else if (closes) {
      --depth;
      char prev = pos > 0 ? buffer_[pos - 1] : '\0';
      if (prev != '{' && prev != '[') breakLine();
      out += chr;
    } else if (chr == ',') {
      out += chr;
      breakLine();
    } else if (chr == ':') {
      out += ": ";
    } else {
      out += chr;
    }
    ++pos;
  }
  return out;
}

}  // namespace symforge
