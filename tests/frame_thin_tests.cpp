#include "lite_test.h"

#include "core/frame_thin.h"

using namespace hexprep::core;

namespace {

const Rgba kRed{.r = 220, .g = 20, .b = 20, .a = 255};
const Rgba kBlue{.r = 20, .g = 40, .b = 200, .a = 255};

RasterBuffer GradientTile(int w, int h)
{
  RasterBuffer buffer(w, h);
  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      if ((x + y) < 3) {
        continue;
      }
      buffer.set(x, y, Rgba{
        .r = static_cast<std::uint8_t>((x * 13) % 256),
        .g = static_cast<std::uint8_t>((y * 29) % 256),
        .b = static_cast<std::uint8_t>((x * y) % 256),
        .a = static_cast<std::uint8_t>(128 + ((x + y) % 128)),
      });
    }
  }
  return buffer;
}

} // namespace

static void TestZeroShrinkIsIdentity()
{
  const RasterBuffer tile = GradientTile(17, 11);
  EXPECT_TRUE(thin_frame(tile, 0) == tile);
}

static void TestPreservesDimensions()
{
  const RasterBuffer tile = GradientTile(23, 9);
  const RasterBuffer out = thin_frame(tile, 3);
  EXPECT_EQ(out.width(), 23);
  EXPECT_EQ(out.height(), 9);
  EXPECT_TRUE(out.at(0, 0).is_transparent());
  EXPECT_TRUE(out.at(1, 1).is_transparent());
}

static void TestSmallUniformSquare()
{
  const RasterBuffer square = SolidCanvas(4, 4, kBlue);
  const RasterBuffer out = thin_frame(square, 1);
  EXPECT_TRUE(out == square);
  EXPECT_TRUE(out.at(1, 1) == kBlue);
  EXPECT_TRUE(out.at(2, 2) == kBlue);
}

static void TestUniformColorIsInvariant()
{
  const Rgba sand{.r = 201, .g = 177, .b = 93, .a = 255};
  const RasterBuffer tile = SolidCanvas(20, 20, sand);
  EXPECT_TRUE(thin_frame(tile, 3) == tile);
}

static void TestOuterRingIsPulledInward()
{
  RasterBuffer tile = SolidCanvas(20, 20, kRed);
  for (int y = 1; y < 19; ++y) {
    for (int x = 1; x < 19; ++x) {
      tile.set(x, y, kBlue);
    }
  }

  const RasterBuffer out = thin_frame(tile, 3);
  // Edge pixel (10,0) samples two pixels toward the center, inside the blue fill.
  EXPECT_TRUE(out.at(10, 0) == kBlue);
  EXPECT_TRUE(out.at(0, 10) == kBlue);
  EXPECT_TRUE(out.at(10, 10) == kBlue);
  EXPECT_TRUE(out.at(10, 5) == tile.at(10, 5));
}

static void TestTransparentStaysTransparent()
{
  RasterBuffer tile(12, 12);
  for (int y = 3; y < 9; ++y) {
    for (int x = 3; x < 9; ++x) {
      tile.set(x, y, kRed);
    }
  }
  const RasterBuffer out = thin_frame(tile, 2);
  for (int y = 0; y < 12; ++y) {
    for (int x = 0; x < 12; ++x) {
      if (tile.at(x, y).is_transparent()) {
        EXPECT_TRUE(out.at(x, y).is_transparent());
      }
    }
  }

  const RasterBuffer empty(6, 6);
  EXPECT_TRUE(thin_frame(empty, 3) == empty);
}

static void TestBilinearSampling()
{
  RasterBuffer buffer(2, 1);
  buffer.set(0, 0, Rgba{.r = 0, .g = 0, .b = 0, .a = 255});
  buffer.set(1, 0, Rgba{.r = 101, .g = 200, .b = 10, .a = 255});

  Rgba out;
  EXPECT_TRUE(sample_bilinear(buffer, 0.5, 0.0, out));
  EXPECT_EQ(out.r, 51);
  EXPECT_EQ(out.g, 100);
  EXPECT_EQ(out.b, 5);
  EXPECT_EQ(out.a, 255);

  EXPECT_TRUE(sample_bilinear(buffer, 1.0, 0.0, out));
  EXPECT_EQ(out.r, 101);

  const Rgba before = out;
  EXPECT_FALSE(sample_bilinear(buffer, 1.01, 0.0, out));
  EXPECT_FALSE(sample_bilinear(buffer, -0.01, 0.0, out));
  EXPECT_FALSE(sample_bilinear(buffer, 0.0, 0.5, out));
  EXPECT_TRUE(out == before);
}

int main()
{
  TestZeroShrinkIsIdentity();
  TestPreservesDimensions();
  TestSmallUniformSquare();
  TestUniformColorIsInvariant();
  TestOuterRingIsPulledInward();
  TestTransparentStaysTransparent();
  TestBilinearSampling();

  return FinishTests("hexprep_frame_thin_tests");
}
