// Canonical ink/background classification.
//
// isInk() is the only place the ink threshold is applied. Every stage that
// needs a binary decision about a sample calls it instead of comparing
// against 0 or 255 directly; inverted ink logic was a recurring defect when
// stages carried their own comparisons.

#ifndef SYMFORGE_CORE_PIXEL_UTILS_H
#define SYMFORGE_CORE_PIXEL_UTILS_H

#include <cstddef>
#include <cstdint>

#include "core/raster.h"

namespace symforge {

/// Samples strictly below this value are ink.
constexpr uint8_t kInkThreshold = 128;

/// @brief Classify a sample as ink (foreground).
inline constexpr bool isInk(uint8_t value) { return value < kInkThreshold; }

/// @brief Classify a sample as background.
inline constexpr bool isBackground(uint8_t value) { return !isInk(value); }

/// @brief Canonical binary value for a sample: kInkValue or kBackgroundValue.
inline constexpr uint8_t canonicalSample(uint8_t value) {
  return isInk(value) ? kInkValue : kBackgroundValue;
}

/// @brief Count ink samples in a raster.
size_t countInkPixels(const Raster& raster);

/// @brief True if every sample is exactly kInkValue or kBackgroundValue.
bool isStrictlyBinary(const Raster& raster);

}  // namespace symforge

#endif  // SYMFORGE_CORE_PIXEL_UTILS_H
