#include "lite_test.h"

#include "core/grid_extract.h"

#include <vector>

using namespace hexprep::core;

namespace {

const Rgba kOpaque{.r = 40, .g = 120, .b = 60, .a = 255};

void PaintBlock(RasterBuffer& buffer, int x0, int y0, int w, int h, const Rgba& color)
{
  for (int y = y0; y < y0 + h; ++y) {
    for (int x = x0; x < x0 + w; ++x) {
      buffer.set(x, y, color);
    }
  }
}

} // namespace

static void TestOnePixelPerQuadrant()
{
  RasterBuffer sheet(64, 64);
  sheet.set(10, 12, kOpaque);
  sheet.set(45, 7, kOpaque);
  sheet.set(3, 50, kOpaque);
  sheet.set(60, 60, kOpaque);

  const std::vector<GridTile> tiles = extract_grid_tiles(sheet, GridOptions{});
  ASSERT_TRUE(tiles.size() == 4);
  for (size_t i = 0; i < tiles.size(); ++i) {
    const GridTile& tile = tiles[i];
    EXPECT_EQ(tile.index, static_cast<int>(i) + 1);
    EXPECT_FALSE(tile.raster.empty());
    EXPECT_TRUE(has_alpha_above(tile.raster, full_bounds(tile.raster), 254));
  }
  EXPECT_EQ(tiles[1].row, 0);
  EXPECT_EQ(tiles[1].col, 1);
  EXPECT_EQ(tiles[2].row, 1);
  EXPECT_EQ(tiles[2].col, 0);
  EXPECT_TRUE(tiles[1].source == (BoundingBox{.x_min = 45, .y_min = 7, .x_max = 46, .y_max = 8}));
}

static void TestTransparentCanvasHasNoTiles()
{
  RasterBuffer sheet(32, 32);
  EXPECT_TRUE(extract_grid_tiles(sheet, GridOptions{}).empty());

  // Alpha at the threshold is noise, not content.
  sheet.fill(Rgba{.r = 255, .g = 255, .b = 255, .a = 20});
  EXPECT_TRUE(extract_grid_tiles(sheet, GridOptions{}).empty());
}

static void TestCellCropsToBlock()
{
  RasterBuffer sheet(100, 100);
  PaintBlock(sheet, 50, 0, 10, 10, kOpaque);

  const std::vector<GridTile> tiles = extract_grid_tiles(sheet, GridOptions{});
  ASSERT_TRUE(tiles.size() == 1);
  const GridTile& tile = tiles[0];
  EXPECT_EQ(tile.index, 1);
  EXPECT_EQ(tile.row, 0);
  EXPECT_EQ(tile.col, 1);
  EXPECT_EQ(tile.raster.width(), 10);
  EXPECT_EQ(tile.raster.height(), 10);
  EXPECT_TRUE(tile.source == (BoundingBox{.x_min = 50, .y_min = 0, .x_max = 60, .y_max = 10}));
  EXPECT_TRUE(tile.raster.at(0, 0) == kOpaque);
  EXPECT_TRUE(tile.raster.at(9, 9) == kOpaque);
}

static void TestSkippedCellsConsumeNoIndex()
{
  RasterBuffer sheet(90, 60);
  // 3x2 grid of 30x30 cells; only cells (0,2) and (1,1) carry content.
  PaintBlock(sheet, 65, 5, 4, 4, kOpaque);
  PaintBlock(sheet, 40, 40, 6, 3, kOpaque);

  GridOptions options;
  options.cols = 3;
  options.rows = 2;
  const std::vector<GridTile> tiles = extract_grid_tiles(sheet, options);
  ASSERT_TRUE(tiles.size() == 2);
  EXPECT_EQ(tiles[0].index, 1);
  EXPECT_EQ(tiles[0].col, 2);
  EXPECT_EQ(tiles[1].index, 2);
  EXPECT_EQ(tiles[1].row, 1);
  EXPECT_EQ(tiles[1].raster.width(), 6);
  EXPECT_EQ(tiles[1].raster.height(), 3);
}

static void TestRemainderPixelsAreDiscarded()
{
  RasterBuffer sheet(101, 101);
  // Column 100 and row 100 fall outside the 50x50 cells.
  sheet.set(100, 100, kOpaque);
  sheet.set(100, 3, kOpaque);
  EXPECT_TRUE(extract_grid_tiles(sheet, GridOptions{}).empty());

  sheet.set(99, 3, kOpaque);
  const std::vector<GridTile> tiles = extract_grid_tiles(sheet, GridOptions{});
  ASSERT_TRUE(tiles.size() == 1);
  EXPECT_EQ(tiles[0].raster.width(), 1);
}

static void TestInvalidGrid()
{
  RasterBuffer sheet(16, 16);
  sheet.fill(kOpaque);

  GridOptions options;
  options.cols = 0;
  EXPECT_TRUE(extract_grid_tiles(sheet, options).empty());

  options.cols = 32;
  options.rows = 1;
  EXPECT_TRUE(extract_grid_tiles(sheet, options).empty());
}

int main()
{
  TestOnePixelPerQuadrant();
  TestTransparentCanvasHasNoTiles();
  TestCellCropsToBlock();
  TestSkippedCellsConsumeNoIndex();
  TestRemainderPixelsAreDiscarded();
  TestInvalidGrid();

  return FinishTests("hexprep_grid_extract_tests");
}
