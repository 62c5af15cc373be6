#include <kra_image/png.hpp>
#include "decode_helpers.hpp"
#include <lodepng.h>

#include <fstream>
#include <limits>
#include <string>
#include <utility>

namespace kra_image {

namespace {

// PNG signature: 89 50 4E 47 0D 0A 1A 0A
constexpr std::uint8_t PNG_SIGNATURE[] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
constexpr std::size_t PNG_SIGNATURE_SIZE = sizeof(PNG_SIGNATURE);

} // namespace

// ============================================================================
// PNG Decoder
// ============================================================================

bool png_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < PNG_SIGNATURE_SIZE) {
        return false;
    }

    for (std::size_t i = 0; i < PNG_SIGNATURE_SIZE; ++i) {
        if (data[i] != PNG_SIGNATURE[i]) {
            return false;
        }
    }

    return true;
}

decode_result png_decoder::decode(std::span<const std::uint8_t> data,
                                  surface& surf,
                                  const decode_options& options) {
    if (!sniff(data)) {
        return decode_result::failure(decode_error::invalid_format, "Not a valid PNG file");
    }

    unsigned width = 0;
    unsigned height = 0;
    std::vector<std::uint8_t> pixels;

    // Decode as RGBA
    unsigned error = lodepng::decode(pixels, width, height, data.data(), data.size());
    if (error) {
        return decode_result::failure(decode_error::invalid_format,
            std::string("PNG decode error: ") + lodepng_error_text(error));
    }

    // Check for values that would overflow when cast to int
    constexpr auto max_int = static_cast<unsigned>(std::numeric_limits<int>::max());
    if (width > max_int || height > max_int) {
        return decode_result::failure(decode_error::dimensions_exceeded,
            "PNG dimensions exceed maximum supported size");
    }

    auto result = validate_dimensions(static_cast<int>(width), static_cast<int>(height), options);
    if (!result) return result;

    if (!surf.set_size(static_cast<int>(width), static_cast<int>(height), pixel_format::rgba8888)) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate surface");
    }

    write_rows(surf, pixels, static_cast<std::size_t>(width) * 4, static_cast<int>(height));

    return decode_result::success();
}

// ============================================================================
// PNG Encoder
// ============================================================================

std::vector<std::uint8_t> encode_png(const memory_surface& surf) {
    if (surf.width() <= 0 || surf.height() <= 0) {
        return {};
    }

    const auto w = static_cast<unsigned>(surf.width());
    const auto h = static_cast<unsigned>(surf.height());
    std::vector<std::uint8_t> png_data;
    unsigned error = 0;

    switch (surf.format()) {
        case pixel_format::rgba8888: {
            std::vector<std::uint8_t> rgba_pixels(surf.pixels().begin(), surf.pixels().end());
            error = lodepng::encode(png_data, rgba_pixels, w, h);
            break;
        }
        case pixel_format::rgba16: {
            // Samples are little-endian in memory, PNG wants big-endian
            std::vector<std::uint8_t> rgba_pixels(surf.pixels().begin(), surf.pixels().end());
            for (std::size_t i = 0; i + 1 < rgba_pixels.size(); i += 2) {
                std::swap(rgba_pixels[i], rgba_pixels[i + 1]);
            }
            error = lodepng::encode(png_data, rgba_pixels, w, h, LCT_RGBA, 16);
            break;
        }
    }

    if (error) {
        return {};
    }

    return png_data;
}

bool save_png(const memory_surface& surf, const std::filesystem::path& path) {
    auto png_data = encode_png(surf);
    if (png_data.empty()) {
        return false;
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    file.write(reinterpret_cast<const char*>(png_data.data()),
               static_cast<std::streamsize>(png_data.size()));

    return file.good();
}

} // namespace kra_image
