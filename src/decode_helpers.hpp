#pragma once

#include <kra_image/types.hpp>
#include <kra_image/surface.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace kra_image {

// Used when decode_options leaves a limit at 0
constexpr int DEFAULT_MAX_DIMENSION = 32768;

[[nodiscard]] constexpr int effective_limit(int requested) noexcept {
    return requested > 0 ? requested : DEFAULT_MAX_DIMENSION;
}

// Reject images larger than the configured limits
inline decode_result validate_dimensions(int width, int height, const decode_options& options) {
    const int max_w = effective_limit(options.max_width);
    const int max_h = effective_limit(options.max_height);
    if (width > max_w || height > max_h) {
        return decode_result::failure(decode_error::dimensions_exceeded,
            "Image dimensions " + std::to_string(width) + "x" + std::to_string(height) +
            " exceed limits " + std::to_string(max_w) + "x" + std::to_string(max_h));
    }
    return decode_result::success();
}

// Copy tightly packed rows into a surface already sized for them
inline void write_rows(surface& surf, std::span<const std::uint8_t> data,
                       std::size_t row_bytes, int height) {
    for (int y = 0; y < height; ++y) {
        const std::size_t offset = static_cast<std::size_t>(y) * row_bytes;
        if (offset + row_bytes > data.size()) {
            return;
        }
        surf.write_pixels(0, y, static_cast<int>(row_bytes), data.data() + offset);
    }
}

} // namespace kra_image
