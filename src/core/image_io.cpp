#include "image_io.h"

#include <fstream>
#include <iterator>
#include <limits>
#include <system_error>
#include <utility>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace fs = std::filesystem;

namespace hexprep::core {

namespace {

LoadStatus adopt_decoded(unsigned char* data, int width, int height, RasterBuffer& out, std::string& error) {
    if (data == nullptr) {
        const char* reason = stbi_failure_reason();
        error = std::string("failed to decode image") + (reason != nullptr ? std::string(": ") + reason : std::string());
        return LoadStatus::UnsupportedFormat;
    }

    if (width <= 0 || height <= 0 || width > k_max_image_dimension || height > k_max_image_dimension) {
        error = "invalid image dimensions: " + std::to_string(width) + "x" + std::to_string(height);
        stbi_image_free(data);
        return LoadStatus::UnsupportedFormat;
    }

    const size_t total_pixels = static_cast<size_t>(width) * static_cast<size_t>(height);
    if (total_pixels > k_max_total_pixels) {
        error = "image too large: " + std::to_string(total_pixels) + " pixels";
        stbi_image_free(data);
        return LoadStatus::UnsupportedFormat;
    }

    std::vector<std::uint8_t> pixels(data, data + (total_pixels * NUM_CHANNELS));
    stbi_image_free(data);
    out = RasterBuffer(width, height, std::move(pixels));
    return LoadStatus::Ok;
}

void append_to_vector(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<std::uint8_t>*>(context);
    const auto* bytes = static_cast<const std::uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

} // namespace

const char* load_status_name(LoadStatus status) {
    switch (status) {
        case LoadStatus::Ok:
            return "ok";
        case LoadStatus::SourceNotFound:
            return "source not found";
        case LoadStatus::UnsupportedFormat:
            return "unsupported format";
    }
    return "unknown";
}

LoadStatus load_image(const fs::path& path, RasterBuffer& out, std::string& error) {
    std::error_code ec;
    if (!fs::exists(path, ec) || ec || !fs::is_regular_file(path, ec)) {
        error = "file does not exist or is not a file: " + path.string();
        return LoadStatus::SourceNotFound;
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        error = "failed to open '" + path.string() + "'";
        return LoadStatus::SourceNotFound;
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        error = "failed to read '" + path.string() + "'";
        return LoadStatus::SourceNotFound;
    }

    const LoadStatus status = decode_image(bytes, out, error);
    if (status != LoadStatus::Ok) {
        error += " (" + path.string() + ")";
    }
    return status;
}

LoadStatus decode_image(const std::vector<std::uint8_t>& bytes, RasterBuffer& out, std::string& error) {
    if (bytes.empty()) {
        error = "empty image data";
        return LoadStatus::UnsupportedFormat;
    }
    if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        error = "image data too large";
        return LoadStatus::UnsupportedFormat;
    }
    int width = 0;
    int height = 0;
    int channels = 0;
    unsigned char* data = stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()),
                                                &width, &height, &channels, static_cast<int>(NUM_CHANNELS));
    return adopt_decoded(data, width, height, out, error);
}

bool encode_png(const RasterBuffer& raster, std::vector<std::uint8_t>& out, std::string& error) {
    if (raster.empty()) {
        error = "cannot encode an empty raster";
        return false;
    }
    out.clear();
    const int stride = raster.width() * static_cast<int>(NUM_CHANNELS);
    if (stbi_write_png_to_func(append_to_vector, &out, raster.width(), raster.height(),
                               static_cast<int>(NUM_CHANNELS), raster.data().data(), stride) == 0) {
        error = "failed to encode PNG data";
        return false;
    }
    return true;
}

bool write_png(const fs::path& path, const RasterBuffer& raster, std::string& error) {
    std::vector<std::uint8_t> encoded;
    if (!encode_png(raster, encoded, error)) {
        return false;
    }

    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        error = "failed to open '" + path.string() + "' for writing";
        return false;
    }
    output.write(reinterpret_cast<const char*>(encoded.data()), static_cast<std::streamsize>(encoded.size()));
    if (!output) {
        error = "failed to write '" + path.string() + "'";
        return false;
    }
    return true;
}

} // namespace hexprep::core
