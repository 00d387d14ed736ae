// Implementation of the pixel blending formulas.

#include "image/pixel_blender.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>
#include <vector>

namespace symforge {

namespace {

uint8_t clampToByte(long value) {
  return static_cast<uint8_t>(std::clamp(value, 0L, 255L));
}

bool isUnitInterval(double value) { return value >= 0.0 && value <= 1.0; }

ForgeError checkPair(const Raster* first, const Raster* second) {
  if (first == nullptr || second == nullptr) return ForgeError::MissingInput;
  if (first->dimensions() != second->dimensions()) return ForgeError::DimensionMismatch;
  return ForgeError::None;
}

/// @brief Apply a scalar formula sample by sample.
template <typename PixelFn>
void combine(const Raster& first, const Raster& second, Raster& out, PixelFn pixel_fn) {
  Raster result(first.width(), first.height());
  const std::vector<uint8_t>& lhs = first.data();
  const std::vector<uint8_t>& rhs = second.data();
  std::vector<uint8_t>& dst = result.data();
  for (size_t idx = 0; idx < dst.size(); ++idx) dst[idx] = pixel_fn(lhs[idx], rhs[idx]);
  out = std::move(result);
}

}  // namespace

const char* blendModeToString(BlendMode mode) {
  switch (mode) {
    case BlendMode::Linear:   return "Linear";
    case BlendMode::Alpha:    return "Alpha";
    case BlendMode::Additive: return "Additive";
    case BlendMode::Multiply: return "Multiply";
    case BlendMode::Screen:   return "Screen";
    case BlendMode::Overlay:  return "Overlay";
  }
  return "Unknown";
}

bool blendModeFromString(const std::string& str, BlendMode& out) {
  std::string lower = str;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char chr) { return static_cast<char>(std::tolower(chr)); });
  static const std::pair<const char*, BlendMode> kNames[] = {
      {"linear", BlendMode::Linear},     {"alpha", BlendMode::Alpha},
      {"additive", BlendMode::Additive}, {"multiply", BlendMode::Multiply},
      {"screen", BlendMode::Screen},     {"overlay", BlendMode::Overlay}};
  for (const auto& entry : kNames) {
    if (lower == entry.first) {
      out = entry.second;
      return true;
    }
  }
  return false;
}

// ---------------------------------------------------------------------------
// Scalar formulas
// ---------------------------------------------------------------------------

uint8_t linearPixel(uint8_t from, uint8_t to, double factor) {
  return clampToByte(std::lround(from * (1.0 - factor) + to * factor));
}

uint8_t alphaPixel(uint8_t background, uint8_t foreground, double alpha) {
  return clampToByte(std::lround(foreground * alpha + background * (1.0 - alpha)));
}

uint8_t additivePixel(uint8_t base, uint8_t add) {
  return clampToByte(static_cast<long>(base) + add);
}

uint8_t multiplyPixel(uint8_t base, uint8_t factor) {
  return static_cast<uint8_t>((base * factor) / 255);
}

uint8_t screenPixel(uint8_t base, uint8_t screen) {
  return static_cast<uint8_t>(255 - ((255 - base) * (255 - screen)) / 255);
}

uint8_t overlayPixel(uint8_t base, uint8_t overlay) {
  long value = base < 128 ? (2L * base * overlay) / 255
                          : 255L - (2L * (255 - base) * (255 - overlay)) / 255;
  return clampToByte(value);
}

// ---------------------------------------------------------------------------
// Raster formulas
// ---------------------------------------------------------------------------

ForgeError blendLinear(const Raster* from, const Raster* to, double factor, Raster& out) {
  ForgeError err = checkPair(from, to);
  if (err != ForgeError::None) return err;
  if (!isUnitInterval(factor)) return ForgeError::OutOfRange;
  combine(*from, *to, out,
          [factor](uint8_t lhs, uint8_t rhs) { return linearPixel(lhs, rhs, factor); });
  return ForgeError::None;
}

ForgeError blendAlpha(const Raster* background, const Raster* foreground, double alpha,
                      Raster& out) {
  ForgeError err = checkPair(background, foreground);
  if (err != ForgeError::None) return err;
  if (!isUnitInterval(alpha)) return ForgeError::OutOfRange;
  combine(*background, *foreground, out,
          [alpha](uint8_t lhs, uint8_t rhs) { return alphaPixel(lhs, rhs, alpha); });
  return ForgeError::None;
}

ForgeError blendAdditive(const Raster* base, const Raster* add, Raster& out) {
  ForgeError err = checkPair(base, add);
  if (err != ForgeError::None) return err;
  combine(*base, *add, out, additivePixel);
  return ForgeError::None;
}

ForgeError blendMultiply(const Raster* base, const Raster* factor, Raster& out) {
  ForgeError err = checkPair(base, factor);
  if (err != ForgeError::None) return err;
  combine(*base, *factor, out, multiplyPixel);
  return ForgeError::None;
}

ForgeError blendScreen(const Raster* base, const Raster* screen, Raster& out) {
  ForgeError err = checkPair(base, screen);
  if (err != ForgeError::None) return err;
  combine(*base, *screen, out, screenPixel);
  return ForgeError::None;
}

ForgeError blendOverlay(const Raster* base, const Raster* overlay, Raster& out) {
  ForgeError err = checkPair(base, overlay);
  if (err != ForgeError::None) return err;
  combine(*base, *overlay, out, overlayPixel);
  return ForgeError::None;
}

ForgeError blendRasters(BlendMode mode, const Raster* first, const Raster* second,
                        double factor, Raster& out) {
  switch (mode) {
    case BlendMode::Linear:   return blendLinear(first, second, factor, out);
    case BlendMode::Alpha:    return blendAlpha(first, second, factor, out);
    case BlendMode::Additive: return blendAdditive(first, second, out);
    case BlendMode::Multiply: return blendMultiply(first, second, out);
    case BlendMode::Screen:   return blendScreen(first, second, out);
    case BlendMode::Overlay:  return blendOverlay(first, second, out);
  }
  return ForgeError::OutOfRange;
}

}  // namespace symforge
