#include <kra_image/crop.hpp>

#include <algorithm>
#include <cstring>
#include <limits>

namespace kra_image {

namespace {

// Alpha is the fourth channel in both RGBA layouts
bool has_alpha(const std::uint8_t* pixel, pixel_format format) noexcept {
    switch (format) {
        case pixel_format::rgba8888: return pixel[3] > 0;
        case pixel_format::rgba16:   return pixel[6] > 0 || pixel[7] > 0;
    }
    return false;
}

} // namespace

layer_bounds content_rect(const composed_image& image) noexcept {
    const std::size_t bpp = bytes_per_pixel(image.format);
    const std::size_t pitch = image.pitch();
    if (image.width <= 0 || image.height <= 0 ||
        image.pixels.size() < pitch * static_cast<std::size_t>(image.height)) {
        return {};
    }

    int xmin = std::numeric_limits<int>::max();
    int ymin = std::numeric_limits<int>::max();
    int xmax = -1;
    int ymax = -1;

    for (int y = 0; y < image.height; ++y) {
        const std::uint8_t* row = image.pixels.data() + static_cast<std::size_t>(y) * pitch;
        for (int x = 0; x < image.width; ++x) {
            if (has_alpha(row + static_cast<std::size_t>(x) * bpp, image.format)) {
                xmin = std::min(xmin, x);
                xmax = std::max(xmax, x);
                ymin = std::min(ymin, y);
                ymax = std::max(ymax, y);
            }
        }
    }

    if (xmax < 0) {
        return {};
    }

    // Make the maximum exclusive
    return {xmin, ymin, xmax + 1, ymax + 1};
}

composed_image crop_to_content(const composed_image& image) {
    const layer_bounds rect = content_rect(image);

    composed_image out;
    out.format = image.format;

    if (rect.empty()) {
        out.bounds = {image.bounds.left, image.bounds.top, image.bounds.left, image.bounds.top};
        return out;
    }

    out.width = rect.width();
    out.height = rect.height();
    out.bounds = rect.translated(image.bounds.left, image.bounds.top);

    const std::size_t bpp = bytes_per_pixel(image.format);
    const std::size_t src_pitch = image.pitch();
    const std::size_t run_length = out.pitch();
    out.pixels.resize(run_length * static_cast<std::size_t>(out.height));

    for (int y = 0; y < out.height; ++y) {
        const std::size_t line_start = static_cast<std::size_t>(rect.top + y) * src_pitch +
                                       static_cast<std::size_t>(rect.left) * bpp;
        std::memcpy(out.pixels.data() + static_cast<std::size_t>(y) * run_length,
                    image.pixels.data() + line_start, run_length);
    }

    return out;
}

} // namespace kra_image
