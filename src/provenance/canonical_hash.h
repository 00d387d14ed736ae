// Canonical content hash for rasters.
//
// Preimage layout, in order:
//   "SL" | version (1 byte) | pixel type (1 byte) | width (u32 LE) |
//   height (u32 LE) | samples, row-major, one byte each
// The hash is SHA-256 of the preimage rendered as lowercase hex. It does
// not depend on how the raster stores its pixels in memory.

#ifndef SYMFORGE_PROVENANCE_CANONICAL_HASH_H
#define SYMFORGE_PROVENANCE_CANONICAL_HASH_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/raster.h"

namespace symforge {

constexpr uint8_t kHashFormatVersion = 1;
constexpr uint8_t kPixelTypeGray8 = 1;

/// Placeholder written before the hash of a capsule is known.
constexpr const char* kPendingHash = "pending-computation";

/// @brief Build the exact byte sequence that is hashed.
std::vector<uint8_t> canonicalHashPreimage(const Raster& raster);

/// @brief SHA-256 of the canonical preimage, lowercase hex (64 chars).
std::string computeCanonicalHash(const Raster& raster);

/// @brief True for the sentinel strings used before a hash is computed.
bool isPlaceholderHash(const std::string& hash);

}  // namespace symforge

#endif  // SYMFORGE_PROVENANCE_CANONICAL_HASH_H
