// Implementation of the single-channel raster container.

#include "core/raster.h"

#include <algorithm>
#include <cassert>
#include <utility>

namespace symforge {

Raster::Raster(int width, int height, uint8_t fill)
    : width_(std::max(width, 0)),
      height_(std::max(height, 0)),
      pixels_(static_cast<size_t>(width_) * static_cast<size_t>(height_), fill) {}

Raster::Raster(int width, int height, std::vector<uint8_t> pixels)
    : width_(std::max(width, 0)),
      height_(std::max(height, 0)),
      pixels_(std::move(pixels)) {
  assert(pixels_.size() == static_cast<size_t>(width_) * static_cast<size_t>(height_) &&
         "pixel count must equal width * height");
  pixels_.resize(static_cast<size_t>(width_) * static_cast<size_t>(height_),
                 kBackgroundValue);
}

void Raster::fill(uint8_t value) {
  std::fill(pixels_.begin(), pixels_.end(), value);
}

bool Raster::operator==(const Raster& other) const {
  return width_ == other.width_ && height_ == other.height_ && pixels_ == other.pixels_;
}

}  // namespace symforge
