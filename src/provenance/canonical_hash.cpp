// Implementation of the canonical raster hash.

#include "provenance/canonical_hash.h"

#include "core/sha256.h"

namespace symforge {

namespace {

constexpr size_t kHeaderBytes = 12;

void appendLE32(std::vector<uint8_t>& buf, uint32_t value) {
  buf.push_back(static_cast<uint8_t>(value & 0xFF));
  buf.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  buf.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
  buf.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
}

void appendHeader(std::vector<uint8_t>& buf, const Raster& raster) {
  buf.push_back('S');
  buf.push_back('L');
  buf.push_back(kHashFormatVersion);
  buf.push_back(kPixelTypeGray8);
  appendLE32(buf, static_cast<uint32_t>(raster.width()));
  appendLE32(buf, static_cast<uint32_t>(raster.height()));
}

}  // namespace

std::vector<uint8_t> canonicalHashPreimage(const Raster& raster) {
  std::vector<uint8_t> preimage;
  preimage.reserve(kHeaderBytes + raster.pixelCount());
  appendHeader(preimage, raster);
  preimage.insert(preimage.end(), raster.data().begin(), raster.data().end());
  return preimage;
}

std::string computeCanonicalHash(const Raster& raster) {
  // Header and samples are fed separately to avoid copying the pixels.
  std::vector<uint8_t> header;
  header.reserve(kHeaderBytes);
  appendHeader(header, raster);

  Sha256 hasher;
  hasher.update(header.data(), header.size());
  hasher.update(raster.data().data(), raster.data().size());
  return digestToHex(hasher.finish());
}

bool isPlaceholderHash(const std::string& hash) {
  return hash == kPendingHash || hash == "unhashed" || hash == "fallback-no-hash";
}

}  // namespace symforge
