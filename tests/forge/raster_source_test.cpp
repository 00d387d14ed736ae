// Tests for forge/raster_source.h -- file-backed morph sources.

#include "forge/raster_source.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <string>

#include "image/pgm_io.h"
#include "test_helpers.h"

namespace symforge {
namespace {

namespace fs = std::filesystem;

class FileRasterSourceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = test_helpers::tempPath("raster_source_test_assets");
    fs::create_directories(root_ + "/Snapshots/Flat");
  }

  void TearDown() override {
    std::error_code ignored;
    fs::remove_all(root_, ignored);
  }

  std::string root_;
};

TEST_F(FileRasterSourceTest, PathLayout) {
  FileRasterSource source("assets/");
  EXPECT_EQ(source.pathFor(SymbolType::DoubleSharp, "engraved"),
            "assets/Snapshots/DoubleSharp/engraved.pgm");
  EXPECT_EQ(source.assetRoot(), "assets/");
}

TEST_F(FileRasterSourceTest, LoadsStoredStyle) {
  Raster stored = test_helpers::rasterFromRows({"#..", ".#.", "..#"});
  ASSERT_TRUE(writePgm(root_ + "/Snapshots/Flat/handwritten.pgm", stored));

  FileRasterSource source(root_);
  Raster loaded;
  ASSERT_EQ(source.load(SymbolType::Flat, "handwritten", loaded), ForgeError::None);
  EXPECT_EQ(loaded, stored);
}

TEST_F(FileRasterSourceTest, MissingStyleIsSourceNotFound) {
  FileRasterSource source(root_);
  Raster loaded;
  EXPECT_EQ(source.load(SymbolType::Flat, "absent", loaded), ForgeError::SourceNotFound);
  EXPECT_EQ(source.load(SymbolType::Sharp, "handwritten", loaded), ForgeError::SourceNotFound);
}

TEST_F(FileRasterSourceTest, PathLikeStylesAreRejected) {
  ASSERT_TRUE(writePgm(root_ + "/Snapshots/Flat/inner.pgm", Raster(2, 2)));
  FileRasterSource source(root_ + "/Snapshots");
  Raster loaded;
  for (const char* style : {"", ".", "..", "../Flat/inner", "Flat/inner", "Flat\\inner"}) {
    EXPECT_EQ(source.load(SymbolType::Flat, style, loaded), ForgeError::SourceNotFound)
        << "style='" << style << "'";
  }
}

TEST_F(FileRasterSourceTest, CorruptFileIsSourceUnreadable) {
  std::string path = root_ + "/Snapshots/Flat/broken.pgm";
  FILE* file = std::fopen(path.c_str(), "wb");
  ASSERT_NE(file, nullptr);
  std::fputs("P5\n8 8\n255\n", file);
  std::fclose(file);

  FileRasterSource source(root_);
  Raster loaded;
  EXPECT_EQ(source.load(SymbolType::Flat, "broken", loaded), ForgeError::SourceUnreadable);
}

}  // namespace
}  // namespace symforge
