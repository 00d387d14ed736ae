/// @file
/// @brief Accidental glyph geometry. All constants are fractions of the
/// raster size.

#include "generators/accidental_generators.h"

#include "generators/canvas.h"

namespace symforge {

namespace {

// Shared crossbar band used by sharp and natural.
constexpr double kBarLeft = 0.2;
constexpr double kBarRight = 0.8;
constexpr double kUpperBarTop = 0.4;
constexpr double kUpperBarBottom = 0.5;
constexpr double kLowerBarTop = 0.7;
constexpr double kLowerBarBottom = 0.8;

constexpr double kStemTop = 0.1;
constexpr double kStemBottom = 0.9;

void drawCrossbars(Canvas& canvas) {
  canvas.fillRect(kBarLeft, kUpperBarTop, kBarRight, kUpperBarBottom);
  canvas.fillRect(kBarLeft, kLowerBarTop, kBarRight, kLowerBarBottom);
}

}  // namespace

ForgeError FlatGenerator::generateRaw(Dimensions dims, std::optional<int32_t> /*seed*/,
                                      Raster& out) const {
  ForgeError err = prepareBlankRaster(dims, out);
  if (err != ForgeError::None) return err;

  Canvas canvas(out);
  canvas.fillRect(0.4, kStemTop, 0.5, kStemBottom);
  canvas.fillEllipse(0.6, 0.75, 0.25, 0.2);
  return ForgeError::None;
}

ForgeError SharpGenerator::generateRaw(Dimensions dims, std::optional<int32_t> /*seed*/,
                                       Raster& out) const {
  ForgeError err = prepareBlankRaster(dims, out);
  if (err != ForgeError::None) return err;

  Canvas canvas(out);
  canvas.fillRect(0.4, kStemTop, 0.5, kStemBottom);
  canvas.fillRect(0.6, kStemTop, 0.7, kStemBottom);
  drawCrossbars(canvas);
  return ForgeError::None;
}

ForgeError NaturalGenerator::generateRaw(Dimensions dims, std::optional<int32_t> /*seed*/,
                                         Raster& out) const {
  ForgeError err = prepareBlankRaster(dims, out);
  if (err != ForgeError::None) return err;

  Canvas canvas(out);
  canvas.fillRect(0.3, kStemTop, 0.4, kStemBottom);
  canvas.fillRect(0.6, kStemTop, 0.7, kStemBottom);
  drawCrossbars(canvas);
  return ForgeError::None;
}

ForgeError DoubleSharpGenerator::generateRaw(Dimensions dims,
                                             std::optional<int32_t> /*seed*/,
                                             Raster& out) const {
  ForgeError err = prepareBlankRaster(dims, out);
  if (err != ForgeError::None) return err;

  Canvas canvas(out);
  canvas.fillPolygon({{0.2, 0.2}, {0.3, 0.2}, {0.8, 0.7}, {0.7, 0.8}});
  canvas.fillPolygon({{0.2, 0.7}, {0.3, 0.8}, {0.8, 0.3}, {0.7, 0.2}});
  return ForgeError::None;
}

}  // namespace symforge
