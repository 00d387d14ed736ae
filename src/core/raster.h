// Single-channel 8-bit raster: the pixel container used by every stage.

#ifndef SYMFORGE_CORE_RASTER_H
#define SYMFORGE_CORE_RASTER_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/basic_types.h"

namespace symforge {

/// Sample value written for ink pixels.
constexpr uint8_t kInkValue = 0;

/// Sample value written for background pixels.
constexpr uint8_t kBackgroundValue = 255;

/// @brief Row-major grid of unsigned 8-bit samples, one channel.
///
/// Samples are stored densely (stride == width), so data() is exactly the
/// byte sequence hashed by the canonical hash provider. Copying a Raster
/// deep-copies its pixels; use clone() where the copy is intentional.
class Raster {
 public:
  Raster() = default;

  /// @brief Create a raster filled with a single value.
  /// @param width Width in pixels (negative values are treated as 0).
  /// @param height Height in pixels (negative values are treated as 0).
  /// @param fill Initial sample value (default: background).
  Raster(int width, int height, uint8_t fill = kBackgroundValue);

  /// @brief Create a raster from existing row-major samples.
  /// @param width Width in pixels.
  /// @param height Height in pixels.
  /// @param pixels Exactly width * height samples. A mismatch is a caller bug:
  ///        it asserts in debug builds, and release builds pad with background
  ///        or truncate so the raster never reads out of bounds.
  Raster(int width, int height, std::vector<uint8_t> pixels);

  int width() const { return width_; }
  int height() const { return height_; }
  Dimensions dimensions() const { return {width_, height_}; }
  size_t pixelCount() const { return pixels_.size(); }
  bool empty() const { return pixels_.empty(); }

  /// @brief Read a sample. Coordinates must be in range.
  uint8_t at(int x, int y) const {
    return pixels_[static_cast<size_t>(y) * static_cast<size_t>(width_) +
                   static_cast<size_t>(x)];
  }

  /// @brief Write a sample. Coordinates must be in range.
  void set(int x, int y, uint8_t value) {
    pixels_[static_cast<size_t>(y) * static_cast<size_t>(width_) +
            static_cast<size_t>(x)] = value;
  }

  /// @brief True if (x, y) lies inside the raster.
  bool contains(int x, int y) const {
    return x >= 0 && y >= 0 && x < width_ && y < height_;
  }

  /// @brief Fill every sample with a value.
  void fill(uint8_t value);

  const std::vector<uint8_t>& data() const { return pixels_; }
  std::vector<uint8_t>& data() { return pixels_; }

  /// @brief Deep copy of this raster.
  Raster clone() const { return *this; }

  /// @brief Equal when dimensions and every sample match.
  bool operator==(const Raster& other) const;
  bool operator!=(const Raster& other) const { return !(*this == other); }

 private:
  int width_ = 0;
  int height_ = 0;
  std::vector<uint8_t> pixels_;
};

}  // namespace symforge

#endif  // SYMFORGE_CORE_RASTER_H
