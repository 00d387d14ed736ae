// Implementation of raster comparison.

#include "image/raster_compare.h"

namespace symforge {

ForgeError countDifferingPixels(const Raster& expected, const Raster& actual, size_t& count) {
  if (expected.dimensions() != actual.dimensions()) return ForgeError::DimensionMismatch;

  const std::vector<uint8_t>& lhs = expected.data();
  const std::vector<uint8_t>& rhs = actual.data();
  count = 0;
  for (size_t idx = 0; idx < lhs.size(); ++idx) {
    if (lhs[idx] != rhs[idx]) ++count;
  }
  return ForgeError::None;
}

ForgeError differenceRatio(const Raster& expected, const Raster& actual, double& ratio) {
  size_t count = 0;
  ForgeError err = countDifferingPixels(expected, actual, count);
  if (err != ForgeError::None) return err;

  ratio = expected.empty() ? 0.0
                           : static_cast<double>(count) /
                                 static_cast<double>(expected.pixelCount());
  return ForgeError::None;
}

ForgeError areSimilar(const Raster& expected, const Raster& actual, double tolerance,
                      bool& similar) {
  if (!(tolerance >= 0.0 && tolerance <= 1.0)) return ForgeError::OutOfRange;

  if (expected.dimensions() != actual.dimensions()) {
    similar = false;
    return ForgeError::None;
  }
  if (expected.empty()) {
    similar = true;
    return ForgeError::None;
  }

  double ratio = 0.0;
  ForgeError err = differenceRatio(expected, actual, ratio);
  if (err != ForgeError::None) return err;
  similar = ratio <= tolerance;
  return ForgeError::None;
}

}  // namespace symforge
