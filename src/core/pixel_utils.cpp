// Implementation of raster-level classification helpers.

#include "core/pixel_utils.h"

#include <algorithm>

namespace symforge {

size_t countInkPixels(const Raster& raster) {
  const auto& pixels = raster.data();
  return static_cast<size_t>(std::count_if(pixels.begin(), pixels.end(),
                                           [](uint8_t value) { return isInk(value); }));
}

bool isStrictlyBinary(const Raster& raster) {
  for (uint8_t value : raster.data()) {
    if (value != kInkValue && value != kBackgroundValue) return false;
  }
  return true;
}

}  // namespace symforge
