// SHA-256 for content addressing. Pure function over explicit input bytes,
// stable across platforms, no OS dependencies.

#ifndef SYMFORGE_CORE_SHA256_H
#define SYMFORGE_CORE_SHA256_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace symforge {

constexpr size_t kSha256DigestBytes = 32;

using Sha256Digest = std::array<uint8_t, kSha256DigestBytes>;

/// @brief Streaming SHA-256 state.
///
/// Each instance is used by one caller at a time; create one per hash.
class Sha256 {
 public:
  Sha256();

  /// @brief Absorb bytes into the hash state.
  void update(const uint8_t* data, size_t length);

  /// @brief Pad, process the final block and return the digest.
  /// The instance must not be updated afterwards.
  Sha256Digest finish();

 private:
  void processBlock(const uint8_t* block);

  std::array<uint32_t, 8> state_;
  std::array<uint8_t, 64> buffer_;
  uint64_t total_bytes_ = 0;
  size_t buffer_used_ = 0;
};

/// @brief Render a digest as lowercase hexadecimal (64 characters).
std::string digestToHex(const Sha256Digest& digest);

/// @brief One-shot SHA-256 rendered as lowercase hex.
std::string sha256Hex(const uint8_t* data, size_t length);

}  // namespace symforge

#endif  // SYMFORGE_CORE_SHA256_H
