// Implementation of raster transforms.

#include "image/raster_transform.h"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

#include "core/pixel_utils.h"

namespace symforge {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Angles closer than this to a multiple of 360 are treated as no rotation.
constexpr double kAngleEpsilon = 1e-9;

std::vector<double> buildGaussianKernel(double sigma, int radius) {
  std::vector<double> kernel(static_cast<size_t>(2 * radius + 1));
  double sum = 0.0;
  for (int offset = -radius; offset <= radius; ++offset) {
    double distance = static_cast<double>(offset);
    double weight = std::exp(-(distance * distance) / (2.0 * sigma * sigma));
    kernel[static_cast<size_t>(offset + radius)] = weight;
    sum += weight;
  }
  for (double& weight : kernel) weight /= sum;
  return kernel;
}

}  // namespace

Raster binarizeRaster(const Raster& input) {
  Raster result = input.clone();
  for (uint8_t& sample : result.data()) sample = canonicalSample(sample);
  return result;
}

Raster rotateRaster(const Raster& input, double degrees) {
  double normalized = std::fmod(degrees, 360.0);
  if (input.empty() || std::fabs(normalized) < kAngleEpsilon) return input.clone();

  double radians = degrees * (kPi / 180.0);
  double cos_a = std::cos(radians);
  double sin_a = std::sin(radians);
  int width = input.width();
  int height = input.height();

  int new_w = static_cast<int>(
      std::llround(std::fabs(width * cos_a) + std::fabs(height * sin_a)));
  int new_h = static_cast<int>(
      std::llround(std::fabs(width * sin_a) + std::fabs(height * cos_a)));
  new_w = std::max(new_w, 1);
  new_h = std::max(new_h, 1);

  Raster result(new_w, new_h, kBackgroundValue);
  double src_cx = (width - 1) / 2.0;
  double src_cy = (height - 1) / 2.0;
  double dst_cx = (new_w - 1) / 2.0;
  double dst_cy = (new_h - 1) / 2.0;

  for (int y = 0; y < new_h; ++y) {
    for (int x = 0; x < new_w; ++x) {
      double rel_x = x - dst_cx;
      double rel_y = y - dst_cy;
      int src_x = static_cast<int>(std::llround(cos_a * rel_x + sin_a * rel_y + src_cx));
      int src_y = static_cast<int>(std::llround(-sin_a * rel_x + cos_a * rel_y + src_cy));
      if (input.contains(src_x, src_y)) result.set(x, y, input.at(src_x, src_y));
    }
  }
  return result;
}

ForgeError cropRaster(const Raster& input, int margin_x, int margin_y, Raster& out) {
  if (margin_x < 0 || margin_y < 0) return ForgeError::OutOfRange;

  int new_w = input.width() - 2 * margin_x;
  int new_h = input.height() - 2 * margin_y;
  if (new_w <= 0 || new_h <= 0) return ForgeError::InvalidDimensions;

  Raster result(new_w, new_h);
  for (int y = 0; y < new_h; ++y) {
    for (int x = 0; x < new_w; ++x) {
      result.set(x, y, input.at(x + margin_x, y + margin_y));
    }
  }
  out = std::move(result);
  return ForgeError::None;
}

Raster gaussianBlur(const Raster& input, double sigma) {
  if (input.empty() || !(sigma > 0.0)) return input.clone();

  int width = input.width();
  int height = input.height();
  // Taps beyond the larger side only ever read clamped edge samples.
  int max_radius = std::max(width, height);
  double wanted = std::ceil(3.0 * sigma);
  int radius = wanted < static_cast<double>(max_radius) ? static_cast<int>(wanted) : max_radius;
  std::vector<double> kernel = buildGaussianKernel(sigma, radius);

  // Horizontal pass keeps full precision; rounding happens once at the end.
  std::vector<double> horizontal(input.pixelCount());
  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      double acc = 0.0;
      for (int offset = -radius; offset <= radius; ++offset) {
        int sample_x = std::clamp(x + offset, 0, width - 1);
        acc += kernel[static_cast<size_t>(offset + radius)] * input.at(sample_x, y);
      }
      horizontal[static_cast<size_t>(y) * static_cast<size_t>(width) +
                 static_cast<size_t>(x)] = acc;
    }
  }

  Raster result(width, height);
  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      double acc = 0.0;
      for (int offset = -radius; offset <= radius; ++offset) {
        int sample_y = std::clamp(y + offset, 0, height - 1);
        acc += kernel[static_cast<size_t>(offset + radius)] *
               horizontal[static_cast<size_t>(sample_y) * static_cast<size_t>(width) +
                          static_cast<size_t>(x)];
      }
      long rounded = std::lround(acc);
      result.set(x, y, static_cast<uint8_t>(std::clamp(rounded, 0L, 255L)));
    }
  }
  return result;
}

}  // namespace symforge
