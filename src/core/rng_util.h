// Seeded random helpers for generators with a stochastic element.

#ifndef SYMFORGE_CORE_RNG_UTIL_H
#define SYMFORGE_CORE_RNG_UTIL_H

#include <cstdint>
#include <random>

namespace symforge {
namespace rng {

/// @brief Symmetric integer offset in [-amplitude, amplitude].
inline int rollJitter(std::mt19937& engine, int amplitude) {
  std::uniform_int_distribution<int> offset(-amplitude, amplitude);
  return offset(engine);
}

/// @brief Splitmix32 hash for decorrelating a seed from the request size.
///
/// Two requests with the same seed but different dimensions should not
/// jitter identically; mixing the seed with a size-derived index keeps the
/// streams apart while staying fully deterministic.
///
/// @param seed Base seed value.
/// @param index Sub-seed index.
/// @return Decorrelated 32-bit hash.
inline uint32_t splitmix32(uint32_t seed, uint32_t index) {
  uint32_t z = seed + index * 0x9E3779B9u;
  z = (z ^ (z >> 16)) * 0x85EBCA6Bu;
  z = (z ^ (z >> 13)) * 0xC2B2AE35u;
  return z ^ (z >> 16);
}

/// @brief Build a deterministic engine for a (seed, width, height) triple.
inline std::mt19937 makeEngine(int32_t seed, int width, int height) {
  uint32_t index = static_cast<uint32_t>(width) * 65599u + static_cast<uint32_t>(height);
  return std::mt19937(splitmix32(static_cast<uint32_t>(seed), index));
}

}  // namespace rng
}  // namespace symforge

#endif  // SYMFORGE_CORE_RNG_UTIL_H
