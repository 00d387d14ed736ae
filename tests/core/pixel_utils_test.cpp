// Tests for core/pixel_utils.h -- canonical ink classification.

#include "core/pixel_utils.h"

#include <gtest/gtest.h>

namespace symforge {
namespace {

TEST(PixelUtilsTest, InkThresholdIs128) {
  EXPECT_TRUE(isInk(0));
  EXPECT_TRUE(isInk(127));
  EXPECT_FALSE(isInk(128));
  EXPECT_FALSE(isInk(255));
  EXPECT_TRUE(isBackground(128));
}

TEST(PixelUtilsTest, CanonicalSampleSnapsToBinary) {
  EXPECT_EQ(canonicalSample(100), kInkValue);
  EXPECT_EQ(canonicalSample(200), kBackgroundValue);
}

TEST(PixelUtilsTest, CountInkPixelsUsesThreshold) {
  Raster raster(2, 2, std::vector<uint8_t>{0, 127, 128, 255});
  EXPECT_EQ(countInkPixels(raster), 2u);
}

TEST(PixelUtilsTest, StrictlyBinaryDetection) {
  EXPECT_TRUE(isStrictlyBinary(Raster(2, 2, std::vector<uint8_t>{0, 255, 255, 0})));
  EXPECT_FALSE(isStrictlyBinary(Raster(2, 2, std::vector<uint8_t>{0, 255, 1, 0})));
  EXPECT_TRUE(isStrictlyBinary(Raster()));
}

}  // namespace
}  // namespace symforge
