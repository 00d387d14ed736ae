// Zhang-Suen thinning: reduces filled ink regions to one-pixel-wide
// centre lines while preserving connectivity.

#ifndef SYMFORGE_IMAGE_SKELETONIZER_H
#define SYMFORGE_IMAGE_SKELETONIZER_H

#include <cstddef>

#include "core/raster.h"

namespace symforge {

/// @brief Counters describing one skeletonization run.
struct SkeletonizeStats {
  int rounds = 0;             ///< Full rounds (sub-pass 1 + sub-pass 2) executed.
  size_t removed_pixels = 0;  ///< Ink pixels turned into background.
};

/// @brief Thin a raster with the Zhang-Suen algorithm.
///
/// The input is never mutated. It is binarized through isInk() first, so
/// the result contains only kInkValue and kBackgroundValue. Only interior
/// pixels are scanned; the one-pixel border ring keeps its binarized value.
/// Removals found during a sub-pass are applied after the whole sub-pass
/// scan, and rounds repeat until neither sub-pass removes anything.
///
/// @param input Source raster.
/// @param stats Optional counters, filled when non-null.
/// @return Thinned copy of the input.
Raster skeletonize(const Raster& input, SkeletonizeStats* stats = nullptr);

}  // namespace symforge

#endif  // SYMFORGE_IMAGE_SKELETONIZER_H
