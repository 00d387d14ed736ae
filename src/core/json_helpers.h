// Minimal JSON serialization writer (no external dependencies).
//
// Builds the metadata documents handed to persistence collaborators
// (capsule metadata, validator results). Does not parse JSON.

#ifndef SYMFORGE_CORE_JSON_HELPERS_H
#define SYMFORGE_CORE_JSON_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace symforge {

/// @brief Incremental JSON writer with automatic comma tracking.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.field("template_name", "Flat_32x32");
///   writer.field("width", 32);
///   writer.endObject();
///   // -> {"template_name":"Flat_32x32","width":32}
/// @endcode
///
/// Does not validate structure (caller must match begin/end pairs).
class JsonWriter {
 public:
  JsonWriter() = default;

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key (must be followed by a value call).
  void key(std::string_view name);

  void value(std::string_view val);
  void value(const char* val) { value(std::string_view(val)); }
  void value(const std::string& val) { value(std::string_view(val)); }
  void value(int64_t val);
  void value(int val) { value(static_cast<int64_t>(val)); }
  void value(double val);
  void value(bool val);
  void valueNull();

  /// @brief Write `"name": val` in one call.
  template <typename T>
  void field(std::string_view name, const T& val) {
    key(name);
    value(val);
  }

  /// @brief Write `"name": val`, or `"name": null` when the optional is empty.
  template <typename T>
  void optionalField(std::string_view name, const std::optional<T>& val) {
    key(name);
    if (val.has_value()) {
      value(*val);
    } else {
      valueNull();
    }
  }

  /// @brief Get the accumulated JSON string.
  const std::string& toString() const { return buffer_; }

  /// @brief Get the accumulated JSON string with indentation.
  /// @param indent_size Number of spaces per indent level (default: 2).
  std::string toPrettyString(int indent_size = 2) const;

 private:
  /// @brief Open container bookkeeping.
  struct Scope {
    size_t elements = 0;        ///< Values written directly into this container.
    bool pending_key = false;   ///< A key was written and awaits its value.
  };

  void open(char bracket);
  void close(char bracket);

  /// Separator handling shared by every value and key.
  void beforeElement();
  void afterValue();

  static void appendEscaped(std::string& out, std::string_view input);

  std::string buffer_;
  std::vector<Scope> scopes_;
};

}  // namespace symforge

#endif  // SYMFORGE_CORE_JSON_HELPERS_H
