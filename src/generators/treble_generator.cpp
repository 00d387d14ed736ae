// Implementation of the treble clef generator.

#include "generators/treble_generator.h"

#include <random>
#include <vector>

#include "core/rng_util.h"
#include "generators/canvas.h"

namespace symforge {

namespace {

const std::vector<std::vector<ShapePoint>>& trebleOutline() {
  static const std::vector<std::vector<ShapePoint>> kOutline = {
      // Head
      {{0.5, 0.05}, {0.7, 0.1}, {0.5, 0.15}, {0.3, 0.1}},
      // Spine
      {{0.5, 0.1}, {0.55, 0.1}, {0.55, 0.9}, {0.45, 0.9}},
      // Sweep
      {{0.3, 0.7}, {0.7, 0.6}, {0.7, 0.7}, {0.3, 0.8}},
  };
  return kOutline;
}

}  // namespace

ForgeError TrebleGenerator::generateRaw(Dimensions dims, std::optional<int32_t> seed,
                                        Raster& out) const {
  ForgeError err = prepareBlankRaster(dims, out);
  if (err != ForgeError::None) return err;

  Canvas canvas(out);
  if (!seed.has_value()) {
    for (const auto& polygon : trebleOutline()) canvas.fillPolygon(polygon);
    return ForgeError::None;
  }

  std::mt19937 engine = rng::makeEngine(*seed, dims.width, dims.height);
  double pixel_x = 1.0 / static_cast<double>(dims.width);
  double pixel_y = 1.0 / static_cast<double>(dims.height);
  for (const auto& polygon : trebleOutline()) {
    std::vector<ShapePoint> jittered = polygon;
    for (auto& point : jittered) {
      point.x += rng::rollJitter(engine, 1) * pixel_x;
      point.y += rng::rollJitter(engine, 1) * pixel_y;
    }
    canvas.fillPolygon(jittered);
  }
  return ForgeError::None;
}

}  // namespace symforge
