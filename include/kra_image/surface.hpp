#ifndef KRA_IMAGE_SURFACE_HPP_
#define KRA_IMAGE_SURFACE_HPP_

#include <kra_image/kra_image_export.h>
#include <kra_image/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace kra_image {

// ============================================================================
// Surface Interface
// ============================================================================

/**
 * Abstract base class for image surfaces.
 * Layer extraction writes pixels to surfaces, allowing framework-agnostic decoding.
 *
 * Implement this interface to integrate with your rendering framework
 * (e.g., SDL_Surface, SDL_Texture, OpenGL texture, etc.)
 */
class KRA_IMAGE_EXPORT surface {
public:
    virtual ~surface() = default;

    /**
     * Set the surface dimensions and pixel format.
     * Called before any pixel writes. A 0x0 size is valid and describes
     * a layer with no painted pixels.
     * @param width Image width in pixels
     * @param height Image height in pixels
     * @param format Pixel format
     * @return true if allocation succeeded
     */
    virtual bool set_size(int width, int height, pixel_format format) = 0;

    /**
     * Write a horizontal run of pixel data.
     *
     * NOTE: The x parameter is a BYTE OFFSET within the row, not a pixel coordinate.
     * For RGBA, use x = pixel_x * 4; for RGBA16, use x = pixel_x * 8.
     *
     * @param x Starting byte offset within the row (NOT pixel coordinate)
     * @param y Y coordinate (row number)
     * @param count Number of bytes to write
     * @param pixels Pointer to pixel data
     */
    virtual void write_pixels(int x, int y, int count, const std::uint8_t* pixels) = 0;
};

// ============================================================================
// Memory Surface (default implementation)
// ============================================================================

/**
 * Simple in-memory surface implementation.
 * Stores tightly packed rows in a contiguous buffer.
 */
class KRA_IMAGE_EXPORT memory_surface : public surface {
public:
    memory_surface() = default;
    ~memory_surface() override = default;

    memory_surface(const memory_surface&) = delete;
    memory_surface& operator=(const memory_surface&) = delete;
    memory_surface(memory_surface&&) noexcept = default;
    memory_surface& operator=(memory_surface&&) noexcept = default;

    // Surface interface
    bool set_size(int width, int height, pixel_format format) override;
    void write_pixels(int x, int y, int count, const std::uint8_t* pixels) override;

    // Accessors (read-only)
    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] pixel_format format() const noexcept { return format_; }
    [[nodiscard]] std::span<const std::uint8_t> pixels() const noexcept { return pixels_; }
    [[nodiscard]] std::size_t pitch() const noexcept { return pitch_; }

    // Mutable accessors (for post-decode manipulation)
    [[nodiscard]] std::span<std::uint8_t> mutable_pixels() noexcept { return pixels_; }

private:
    std::vector<std::uint8_t> pixels_;
    int width_ = 0;
    int height_ = 0;
    std::size_t pitch_ = 0;
    pixel_format format_ = pixel_format::rgba8888;
};

} // namespace kra_image

#endif // KRA_IMAGE_SURFACE_HPP_
