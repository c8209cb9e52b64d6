#pragma once

#include "core/raster.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                          \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";               \
    }                                                                                                                \
  } while (0)

#define EXPECT_NE(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if ((_a == _b)) {                                                                                                \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NE failed: " << #a << " != " << #b << "\n";               \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                          \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

static std::filesystem::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  std::filesystem::path root = std::filesystem::temp_directory_path(ec);
  if (ec || root.empty()) {
    root = std::filesystem::current_path(ec);
    if (ec || root.empty()) {
      root = std::filesystem::path(".");
    }
  }

  const auto stamp = static_cast<std::uint64_t>(
    std::chrono::high_resolution_clock::now().time_since_epoch().count());
  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

static hexprep::core::RasterBuffer SolidCanvas(int w, int h, const hexprep::core::Rgba& color)
{
  hexprep::core::RasterBuffer buffer(w, h);
  buffer.fill(color);
  return buffer;
}

static int FinishTests(const char* name)
{
  if (g_failures == 0) {
    std::cout << name << ": OK\n";
    return 0;
  }

  std::cerr << name << ": FAILED (" << g_failures << ")\n";
  return 1;
}
