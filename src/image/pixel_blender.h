// Per-pixel compositing formulas used by the morph engine.
//
// Every raster-level function is pure: inputs are borrowed read-only and
// the product is written to a freshly sized output raster.

#ifndef SYMFORGE_IMAGE_PIXEL_BLENDER_H
#define SYMFORGE_IMAGE_PIXEL_BLENDER_H

#include <cstdint>
#include <string>

#include "core/basic_types.h"
#include "core/raster.h"

namespace symforge {

/// @brief Compositing formula selector.
enum class BlendMode : uint8_t {
  Linear,    ///< from * (1 - f) + to * f
  Alpha,     ///< fg * a + bg * (1 - a)
  Additive,  ///< min(255, base + add)
  Multiply,  ///< base * m / 255
  Screen,    ///< 255 - (255 - base) * (255 - s) / 255
  Overlay    ///< Multiply below mid-grey, screen above
};

const char* blendModeToString(BlendMode mode);

/// @brief Parse a blend mode name (case-insensitive).
bool blendModeFromString(const std::string& str, BlendMode& out);

// ---------------------------------------------------------------------------
// Scalar formulas
// ---------------------------------------------------------------------------

/// @brief Linear interpolation, rounded and clamped. factor in [0, 1].
uint8_t linearPixel(uint8_t from, uint8_t to, double factor);

/// @brief Alpha composite of fg over bg, rounded and clamped. alpha in [0, 1].
uint8_t alphaPixel(uint8_t background, uint8_t foreground, double alpha);

uint8_t additivePixel(uint8_t base, uint8_t add);

/// @brief Multiply with truncating integer division.
uint8_t multiplyPixel(uint8_t base, uint8_t factor);

uint8_t screenPixel(uint8_t base, uint8_t screen);
uint8_t overlayPixel(uint8_t base, uint8_t overlay);

// ---------------------------------------------------------------------------
// Raster formulas
// ---------------------------------------------------------------------------
//
// Errors: MissingInput if either raster is null, DimensionMismatch if sizes
// differ, OutOfRange if a factor or alpha lies outside [0, 1].

ForgeError blendLinear(const Raster* from, const Raster* to, double factor, Raster& out);
ForgeError blendAlpha(const Raster* background, const Raster* foreground, double alpha,
                      Raster& out);
ForgeError blendAdditive(const Raster* base, const Raster* add, Raster& out);
ForgeError blendMultiply(const Raster* base, const Raster* factor, Raster& out);
ForgeError blendScreen(const Raster* base, const Raster* screen, Raster& out);
ForgeError blendOverlay(const Raster* base, const Raster* overlay, Raster& out);

/// @brief Dispatch on a BlendMode.
///
/// `factor` is the interpolation factor for Linear and the alpha for Alpha;
/// the remaining modes ignore it.
ForgeError blendRasters(BlendMode mode, const Raster* first, const Raster* second,
                        double factor, Raster& out);

}  // namespace symforge

#endif  // SYMFORGE_IMAGE_PIXEL_BLENDER_H
