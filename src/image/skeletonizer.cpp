/// @file
/// @brief Zhang-Suen thinning with deferred (per sub-pass) removal.

#include "image/skeletonizer.h"

#include <array>
#include <vector>

#include "core/pixel_utils.h"
#include "image/raster_transform.h"

namespace symforge {

namespace {

/// Neighbour offsets p2..p9, clockwise from north.
constexpr std::array<int, 8> kNeighbourDx = {0, 1, 1, 1, 0, -1, -1, -1};
constexpr std::array<int, 8> kNeighbourDy = {-1, -1, 0, 1, 1, 1, 0, -1};

// Indices into the neighbour ring.
constexpr int kP2 = 0;
constexpr int kP4 = 2;
constexpr int kP6 = 4;
constexpr int kP8 = 6;

enum class SubPass : uint8_t { First, Second };

/// @brief Decide whether an interior ink pixel is removable in a sub-pass.
bool isRemovable(const Raster& raster, int x, int y, SubPass pass) {
  std::array<bool, 8> ink{};
  int ink_count = 0;
  for (size_t idx = 0; idx < ink.size(); ++idx) {
    ink[idx] = isInk(raster.at(x + kNeighbourDx[idx], y + kNeighbourDy[idx]));
    if (ink[idx]) ++ink_count;
  }
  if (ink_count < 2 || ink_count > 6) return false;

  int transitions = 0;
  for (size_t idx = 0; idx < ink.size(); ++idx) {
    if (!ink[idx] && ink[(idx + 1) % ink.size()]) ++transitions;
  }
  if (transitions != 1) return false;

  if (pass == SubPass::First) {
    return !(ink[kP2] && ink[kP4] && ink[kP6]) && !(ink[kP4] && ink[kP6] && ink[kP8]);
  }
  return !(ink[kP2] && ink[kP4] && ink[kP8]) && !(ink[kP2] && ink[kP6] && ink[kP8]);
}

/// @brief Scan all interior pixels, then clear every marked one.
/// @return Number of pixels removed.
size_t runSubPass(Raster& raster, SubPass pass, std::vector<size_t>& marked) {
  marked.clear();
  int width = raster.width();
  for (int y = 1; y < raster.height() - 1; ++y) {
    for (int x = 1; x < width - 1; ++x) {
      if (!isInk(raster.at(x, y))) continue;
      if (isRemovable(raster, x, y, pass)) {
        marked.push_back(static_cast<size_t>(y) * static_cast<size_t>(width) +
                         static_cast<size_t>(x));
      }
    }
  }
  std::vector<uint8_t>& pixels = raster.data();
  for (size_t index : marked) pixels[index] = kBackgroundValue;
  return marked.size();
}

}  // namespace

Raster skeletonize(const Raster& input, SkeletonizeStats* stats) {
  Raster result = binarizeRaster(input);
  SkeletonizeStats local;

  // Rasters narrower than 3 pixels have no interior.
  if (result.width() >= 3 && result.height() >= 3) {
    std::vector<size_t> marked;
    while (true) {
      size_t removed = runSubPass(result, SubPass::First, marked);
      removed += runSubPass(result, SubPass::Second, marked);
      ++local.rounds;
      local.removed_pixels += removed;
      if (removed == 0) break;
    }
  }

  if (stats != nullptr) *stats = local;
  return result;
}

}  // namespace symforge
