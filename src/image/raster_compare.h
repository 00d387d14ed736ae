// Pixel-level raster comparison for snapshot regression checks.

#ifndef SYMFORGE_IMAGE_RASTER_COMPARE_H
#define SYMFORGE_IMAGE_RASTER_COMPARE_H

#include <cstddef>

#include "core/basic_types.h"
#include "core/raster.h"

namespace symforge {

/// @brief Count samples that differ between two equally sized rasters.
/// @return DimensionMismatch if the sizes differ.
ForgeError countDifferingPixels(const Raster& expected, const Raster& actual, size_t& count);

/// @brief Fraction of differing samples in [0, 1]. Empty rasters give 0.
/// @return DimensionMismatch if the sizes differ.
ForgeError differenceRatio(const Raster& expected, const Raster& actual, double& ratio);

/// @brief Decide whether two rasters match within a tolerance.
///
/// Rasters of different sizes are never similar. Two empty rasters are
/// always similar. Otherwise similar when differenceRatio <= tolerance.
///
/// @param tolerance Allowed fraction of differing samples, in [0, 1].
/// @param similar Receives the verdict.
/// @return OutOfRange if tolerance lies outside [0, 1].
ForgeError areSimilar(const Raster& expected, const Raster& actual, double tolerance,
                      bool& similar);

}  // namespace symforge

#endif  // SYMFORGE_IMAGE_RASTER_COMPARE_H
