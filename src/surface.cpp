#include <kra_image/surface.hpp>

#include <algorithm>
#include <cstring>
#include <new>

namespace kra_image {

namespace {

// Same cap as the composed layer buffer
constexpr std::size_t MAX_SURFACE_BYTES = 2048ULL * 1024ULL * 1024ULL;

// Row and total byte counts for a surface, or false if they do not fit
bool surface_layout(int width, int height, pixel_format format,
                    std::size_t& pitch, std::size_t& total) noexcept {
    if (width < 0 || height < 0) {
        return false;
    }

    const std::size_t bpp = bytes_per_pixel(format);
    const auto w = static_cast<std::size_t>(width);
    const auto h = static_cast<std::size_t>(height);

    if (w > MAX_SURFACE_BYTES / bpp) {
        return false;
    }
    pitch = w * bpp;

    if (h != 0 && pitch > MAX_SURFACE_BYTES / h) {
        return false;
    }
    total = pitch * h;
    return true;
}

} // namespace

bool memory_surface::set_size(int width, int height, pixel_format format) {
    std::size_t pitch = 0;
    std::size_t total = 0;
    if (!surface_layout(width, height, format, pitch, total)) {
        return false;
    }

    try {
        pixels_.assign(total, 0);
    } catch (const std::bad_alloc&) {
        return false;
    }

    width_ = width;
    height_ = height;
    format_ = format;
    pitch_ = pitch;
    return true;
}

void memory_surface::write_pixels(int x, int y, int count, const std::uint8_t* pixels) {
    if (!pixels || count <= 0 || x < 0 || y < 0 || y >= height_) {
        return;
    }

    const auto start = static_cast<std::size_t>(x);
    if (start >= pitch_) {
        return;
    }

    // Clip the run to the end of the row
    const std::size_t n = std::min(static_cast<std::size_t>(count), pitch_ - start);
    std::memcpy(pixels_.data() + static_cast<std::size_t>(y) * pitch_ + start, pixels, n);
}

} // namespace kra_image
