// Tests for image/pgm_io.h -- PGM encode/decode and file I/O.

#include "image/pgm_io.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <string>
#include <vector>

#include "test_helpers.h"

namespace symforge {
namespace {

std::vector<uint8_t> bytesOf(const std::string& text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------

TEST(PgmIoTest, EncodeWritesBinaryHeader) {
  Raster raster(3, 2, std::vector<uint8_t>{0, 1, 2, 3, 4, 5});
  std::vector<uint8_t> bytes = encodePgm(raster);
  std::string header = "P5\n3 2\n255\n";
  ASSERT_EQ(bytes.size(), header.size() + 6);
  EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + static_cast<long>(header.size())), header);
  EXPECT_EQ(bytes.back(), 5);
}

TEST(PgmIoTest, DecodeReadsEncodedRaster) {
  Raster raster = test_helpers::gradientRaster(7, 5);
  Raster decoded;
  ASSERT_EQ(decodePgm(encodePgm(raster), decoded), ForgeError::None);
  EXPECT_EQ(decoded, raster);
}

// ---------------------------------------------------------------------------
// Decoding variants
// ---------------------------------------------------------------------------

TEST(PgmIoTest, DecodeAsciiWithComment) {
  Raster decoded;
  ASSERT_EQ(decodePgm(bytesOf("P2\n# made by hand\n2 2\n255\n0 64\n128 255\n"), decoded),
            ForgeError::None);
  EXPECT_EQ(decoded, Raster(2, 2, std::vector<uint8_t>{0, 64, 128, 255}));
}

TEST(PgmIoTest, DecodeRescalesSmallerMaxval) {
  Raster decoded;
  ASSERT_EQ(decodePgm(bytesOf("P2 3 1 15 0 15 5"), decoded), ForgeError::None);
  EXPECT_EQ(decoded, Raster(3, 1, std::vector<uint8_t>{0, 255, 85}));
}

TEST(PgmIoTest, DecodeRejectsMalformedData) {
  Raster decoded(1, 1, 42);
  EXPECT_EQ(decodePgm(bytesOf("not an image"), decoded), ForgeError::SourceUnreadable);
  EXPECT_EQ(decodePgm(bytesOf("P5\n4 4\n255\n\x01\x02"), decoded), ForgeError::SourceUnreadable);
  EXPECT_EQ(decodePgm(bytesOf("P2\n2 1\n10\n3 11\n"), decoded), ForgeError::SourceUnreadable);
  EXPECT_EQ(decodePgm(bytesOf("P5\n0 4\n255\n"), decoded), ForgeError::SourceUnreadable);
  EXPECT_EQ(decoded, Raster(1, 1, 42));
}

TEST(PgmIoTest, HugeHeaderIsSourceUnreadable) {
  Raster decoded(1, 1, 42);
  std::string binary("P5\n1000000 1000000\n255\n\0", 24);
  EXPECT_EQ(decodePgm(bytesOf(binary), decoded), ForgeError::SourceUnreadable);
  EXPECT_EQ(decodePgm(bytesOf("P2\n1000000 1000000\n255\n0 0 0\n"), decoded),
            ForgeError::SourceUnreadable);
  EXPECT_EQ(decoded, Raster(1, 1, 42));
}

// ---------------------------------------------------------------------------
// Files
// ---------------------------------------------------------------------------

TEST(PgmIoTest, WriteThenReadFile) {
  std::string path = test_helpers::tempPath("pgm_io_test_roundtrip.pgm");
  Raster raster = test_helpers::rasterFromRows({"#..#", ".##.", "#..#"});
  ASSERT_TRUE(writePgm(path, raster));

  Raster loaded;
  ASSERT_EQ(readPgm(path, loaded), ForgeError::None);
  EXPECT_EQ(loaded, raster);
  std::remove(path.c_str());
}

TEST(PgmIoTest, MissingFileIsSourceNotFound) {
  Raster loaded;
  EXPECT_EQ(readPgm(test_helpers::tempPath("pgm_io_test_does_not_exist.pgm"), loaded),
            ForgeError::SourceNotFound);
}

TEST(PgmIoTest, GarbageFileIsSourceUnreadable) {
  std::string path = test_helpers::tempPath("pgm_io_test_garbage.pgm");
  FILE* file = std::fopen(path.c_str(), "wb");
  ASSERT_NE(file, nullptr);
  std::fputs("GIF89a", file);
  std::fclose(file);

  Raster loaded;
  EXPECT_EQ(readPgm(path, loaded), ForgeError::SourceUnreadable);
  std::remove(path.c_str());
}

}  // namespace
}  // namespace symforge
