#pragma once

#include "raster.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace hexprep::core {

constexpr int k_max_image_dimension = 32768;
constexpr size_t k_max_total_pixels = 100000000;

enum class LoadStatus { Ok, SourceNotFound, UnsupportedFormat };

const char* load_status_name(LoadStatus status);

// Decodes any stb_image format and coerces it to 8-bit RGBA.
LoadStatus load_image(const std::filesystem::path& path, RasterBuffer& out, std::string& error);
LoadStatus decode_image(const std::vector<std::uint8_t>& bytes, RasterBuffer& out, std::string& error);

bool write_png(const std::filesystem::path& path, const RasterBuffer& raster, std::string& error);
bool encode_png(const RasterBuffer& raster, std::vector<std::uint8_t>& out, std::string& error);

} // namespace hexprep::core
