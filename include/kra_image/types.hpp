#ifndef KRA_IMAGE_TYPES_HPP_
#define KRA_IMAGE_TYPES_HPP_

#include <kra_image/kra_image_export.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace kra_image {

// ============================================================================
// Pixel Formats
// ============================================================================

enum class pixel_format {
    rgba8888,   // 32-bit, 8-bit RGBA components
    rgba16      // 64-bit, 16-bit little-endian RGBA components
};

[[nodiscard]] constexpr std::size_t bytes_per_pixel(pixel_format fmt) noexcept {
    switch (fmt) {
        case pixel_format::rgba8888: return 4;
        case pixel_format::rgba16:   return 8;
    }
    return 0;
}

// ============================================================================
// Color Modes
// ============================================================================

/**
 * Krita color spaces this library can decode.
 * Matches the `colorspacename` attribute of maindoc.xml.
 */
enum class color_mode {
    rgba8,   // "RGBA"
    rgba16   // "RGBA16"
};

[[nodiscard]] KRA_IMAGE_EXPORT std::optional<color_mode> parse_color_mode(std::string_view name) noexcept;
[[nodiscard]] KRA_IMAGE_EXPORT const char* to_string(color_mode mode) noexcept;

[[nodiscard]] constexpr int bytes_per_channel(color_mode mode) noexcept {
    return mode == color_mode::rgba16 ? 2 : 1;
}

[[nodiscard]] constexpr pixel_format to_pixel_format(color_mode mode) noexcept {
    return mode == color_mode::rgba16 ? pixel_format::rgba16 : pixel_format::rgba8888;
}

// ============================================================================
// Layer Bounds
// ============================================================================

/**
 * Tile-space extents of a layer. Right and bottom are exclusive.
 */
struct layer_bounds {
    int left = 0;
    int top = 0;
    int right = 0;
    int bottom = 0;

    [[nodiscard]] constexpr int width() const noexcept { return right - left; }
    [[nodiscard]] constexpr int height() const noexcept { return bottom - top; }
    [[nodiscard]] constexpr bool empty() const noexcept { return width() <= 0 || height() <= 0; }

    [[nodiscard]] constexpr layer_bounds translated(int dx, int dy) const noexcept {
        return {left + dx, top + dy, right + dx, bottom + dy};
    }

    friend constexpr bool operator==(const layer_bounds&, const layer_bounds&) = default;
};

// ============================================================================
// Decode Errors
// ============================================================================

enum class decode_error {
    none,
    invalid_format,
    missing_entry,
    unsupported_color_mode,
    dimensions_exceeded,
    truncated_data,
    overflow,
    invalid_reference,
    corrupt_tile,
    unresolved_clone,
    clone_cycle,
    not_raster,
    empty_layer,
    io_error,
    internal_error
};

[[nodiscard]] KRA_IMAGE_EXPORT const char* to_string(decode_error err) noexcept;

// ============================================================================
// Decode Result
// ============================================================================

struct decode_result {
    bool ok = false;
    decode_error error = decode_error::none;
    std::string message;

    [[nodiscard]] static decode_result success() {
        return {true, decode_error::none, {}};
    }

    [[nodiscard]] static decode_result failure(decode_error err, std::string msg = {}) {
        return {false, err, std::move(msg)};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Decode Options
// ============================================================================

struct decode_options {
    // Maximum allowed document dimensions (0 = use default)
    int max_width = 32768;
    int max_height = 32768;

    // Maximum number of tile records accepted in one layer stream
    int max_tiles_per_layer = 1 << 20;
};

} // namespace kra_image

#endif // KRA_IMAGE_TYPES_HPP_
