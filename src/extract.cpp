#include <kra_image/extract.hpp>
#include <kra_image/crop.hpp>
#include "decode_helpers.hpp"

#include <climits>
#include <cstdint>
#include <string>
#include <utility>

namespace kra_image {

decode_result extract_image(const layer& l, composed_image& image, bool crop) {
    const auto* raster = l.raster();
    if (!raster) {
        return decode_result::failure(decode_error::not_raster,
            std::string(to_string(l.kind)) + " '" + l.name + "' has no raster data");
    }

    composed_image composed;
    auto result = compose_tiles(raster->stream, raster->mode, composed);
    if (!result) return result;

    if (crop) {
        composed = crop_to_content(composed);
    }

    const auto fits = [](int edge, int offset) {
        const auto moved = static_cast<std::int64_t>(edge) + offset;
        return moved >= INT_MIN && moved <= INT_MAX;
    };
    const auto& b = composed.bounds;
    if (!fits(b.left, l.x) || !fits(b.right, l.x) || !fits(b.top, l.y) || !fits(b.bottom, l.y)) {
        return decode_result::failure(decode_error::invalid_format,
            "Layer '" + l.name + "' offset moves it outside the coordinate range");
    }
    composed.bounds = composed.bounds.translated(l.x, l.y);
    image = std::move(composed);
    return decode_result::success();
}

decode_result extract_image(const layer& l, surface& surf, layer_bounds& bounds, bool crop) {
    composed_image image;
    auto result = extract_image(l, image, crop);
    if (!result) return result;

    if (!surf.set_size(image.width, image.height, image.format)) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate surface");
    }

    write_rows(surf, image.pixels, image.pitch(), image.height);
    bounds = image.bounds;
    return decode_result::success();
}

} // namespace kra_image
