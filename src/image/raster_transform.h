// Geometric and photometric raster transforms used for edge-case variants
// and preprocessing.

#ifndef SYMFORGE_IMAGE_RASTER_TRANSFORM_H
#define SYMFORGE_IMAGE_RASTER_TRANSFORM_H

#include "core/basic_types.h"
#include "core/raster.h"

namespace symforge {

/// @brief Map every sample to kInkValue or kBackgroundValue via isInk().
Raster binarizeRaster(const Raster& input);

/// @brief Rotate about the centre onto an expanded canvas.
///
/// The output is large enough to hold the rotated bounds. Sampling is
/// nearest-neighbour; destination pixels with no source are background.
/// A rotation of 0 degrees returns an identical copy.
///
/// @param input Source raster.
/// @param degrees Rotation angle; positive turns clockwise as displayed
///        (y axis pointing down).
Raster rotateRaster(const Raster& input, double degrees);

/// @brief Remove a fixed margin from every side.
/// @param input Source raster.
/// @param margin_x Columns removed from the left and from the right.
/// @param margin_y Rows removed from the top and from the bottom.
/// @param out Receives the cropped raster on success.
/// @return OutOfRange for negative margins, InvalidDimensions when the
///         margins leave no pixels.
ForgeError cropRaster(const Raster& input, int margin_x, int margin_y, Raster& out);

/// @brief Separable Gaussian blur.
///
/// Kernel radius is ceil(3 * sigma), capped at the larger raster side; edges
/// are clamped and samples rounded to the nearest integer. A non-positive
/// sigma returns a copy.
Raster gaussianBlur(const Raster& input, double sigma);

}  // namespace symforge

#endif  // SYMFORGE_IMAGE_RASTER_TRANSFORM_H
