#include "lite_test.h"

#include "core/matte_clean.h"

#include <string>

using namespace hexprep::core;

namespace {

const Rgba kWhite{.r = 255, .g = 255, .b = 255, .a = 255};
const Rgba kBrick{.r = 200, .g = 30, .b = 30, .a = 255};

bool MarginIsTransparent(const RasterBuffer& buffer, int margin)
{
  for (int y = 0; y < buffer.height(); ++y) {
    for (int x = 0; x < buffer.width(); ++x) {
      const bool in_margin = x < margin || y < margin
        || x >= buffer.width() - margin || y >= buffer.height() - margin;
      if (in_margin && buffer.alpha(x, y) != 0) {
        return false;
      }
    }
  }
  return true;
}

RasterBuffer TileOnWhite()
{
  RasterBuffer buffer = SolidCanvas(10, 10, kWhite);
  for (int y = 3; y < 7; ++y) {
    for (int x = 3; x < 7; ++x) {
      buffer.set(x, y, kBrick);
    }
  }
  return buffer;
}

} // namespace

static void TestWhiteBackgroundRemoved()
{
  const MatteResult result = clean_matte(TileOnWhite(), MatteOptions{});
  EXPECT_FALSE(result.empty);
  EXPECT_EQ(result.raster.width(), 4 + (2 * k_matte_padding));
  EXPECT_EQ(result.raster.height(), 4 + (2 * k_matte_padding));
  EXPECT_TRUE(result.raster.at(2, 2) == kBrick);
  EXPECT_TRUE(result.raster.at(5, 5) == kBrick);
  EXPECT_TRUE(MarginIsTransparent(result.raster, k_matte_padding));
}

static void TestPureWhitePixelBecomesTransparent()
{
  RasterBuffer buffer = SolidCanvas(5, 5, kBrick);
  buffer.set(2, 2, kWhite);
  const MatteResult result = clean_matte(buffer, MatteOptions{});
  ASSERT_TRUE(!result.empty);
  EXPECT_EQ(result.raster.alpha(2 + k_matte_padding, 2 + k_matte_padding), 0);
  EXPECT_EQ(result.raster.alpha(1 + k_matte_padding, 2 + k_matte_padding), 255);
}

static void TestIdempotentOnCleanOutput()
{
  const MatteResult once = clean_matte(TileOnWhite(), MatteOptions{});
  ASSERT_TRUE(!once.empty);
  const MatteResult twice = clean_matte(once.raster, MatteOptions{});
  EXPECT_FALSE(twice.empty);
  EXPECT_TRUE(twice.raster == once.raster);
}

static RasterBuffer LightEdgeSample()
{
  RasterBuffer buffer = SolidCanvas(6, 6, Rgba{.r = 250, .g = 250, .b = 250, .a = 255});
  buffer.set(2, 2, Rgba{.r = 240, .g = 240, .b = 240, .a = 255});
  buffer.set(3, 2, Rgba{.r = 250, .g = 250, .b = 250, .a = 200});
  buffer.set(2, 3, Rgba{.r = 230, .g = 230, .b = 230, .a = 180});
  return buffer;
}

static void TestHaloDamping()
{
  const MatteResult result = clean_matte(LightEdgeSample(), MatteOptions{});
  ASSERT_TRUE(!result.empty);
  EXPECT_EQ(result.raster.width(), 6);
  EXPECT_EQ(result.raster.height(), 6);
  // Near-white and opaque: removed.
  EXPECT_EQ(result.raster.alpha(2, 2), 0);
  // Light, semi-transparent, next to the cleared matte: capped at 100.
  EXPECT_EQ(result.raster.alpha(3, 2), 100);
  EXPECT_EQ(result.raster.alpha(2, 3), 100);
  EXPECT_TRUE(MarginIsTransparent(result.raster, k_matte_padding));
}

static void TestDarkEdgesKeepAlpha()
{
  RasterBuffer buffer = SolidCanvas(6, 6, kWhite);
  buffer.set(2, 2, Rgba{.r = 20, .g = 20, .b = 20, .a = 90});
  buffer.set(3, 2, kBrick);
  const MatteResult result = clean_matte(buffer, MatteOptions{});
  ASSERT_TRUE(!result.empty);
  EXPECT_EQ(result.raster.alpha(2, 2), 90);
  EXPECT_TRUE(result.raster.at(3, 2) == kBrick);
}

static void TestStrictMode()
{
  MatteOptions options;
  options.mode = MatteMode::Strict;
  const MatteResult result = clean_matte(LightEdgeSample(), options);
  ASSERT_TRUE(!result.empty);
  EXPECT_EQ(result.raster.width(), 6);
  EXPECT_EQ(result.raster.height(), 6);
  EXPECT_EQ(result.raster.alpha(2, 2), 255);
  EXPECT_EQ(result.raster.alpha(3, 2), 200);
  EXPECT_EQ(result.raster.alpha(2, 3), 180);
  EXPECT_EQ(result.raster.alpha(3, 3), 0);
  EXPECT_TRUE(MarginIsTransparent(result.raster, k_matte_padding));
}

static void TestAllWhiteIsEmpty()
{
  const RasterBuffer buffer = SolidCanvas(8, 8, kWhite);
  const MatteResult result = clean_matte(buffer, MatteOptions{});
  EXPECT_TRUE(result.empty);
  EXPECT_TRUE(result.raster == buffer);

  const MatteResult nothing = clean_matte(RasterBuffer{}, MatteOptions{});
  EXPECT_TRUE(nothing.empty);
}

static void TestParseMode()
{
  MatteMode mode = MatteMode::Standard;
  std::string error;
  EXPECT_TRUE(parse_matte_mode(" Strict ", mode, error));
  EXPECT_TRUE(mode == MatteMode::Strict);
  EXPECT_TRUE(parse_matte_mode("standard", mode, error));
  EXPECT_TRUE(mode == MatteMode::Standard);
  EXPECT_FALSE(parse_matte_mode("quality", mode, error));
  EXPECT_FALSE(error.empty());
  EXPECT_EQ(std::string(matte_mode_name(MatteMode::Strict)), std::string("strict"));
}

int main()
{
  TestWhiteBackgroundRemoved();
  TestPureWhitePixelBecomesTransparent();
  TestIdempotentOnCleanOutput();
  TestHaloDamping();
  TestDarkEdgesKeepAlpha();
  TestStrictMode();
  TestAllWhiteIsEmpty();
  TestParseMode();

  return FinishTests("hexprep_matte_clean_tests");
}
