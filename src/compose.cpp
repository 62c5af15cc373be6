#include <kra_image/compose.hpp>
#include <kra_image/lzf.hpp>

#include <algorithm>
#include <cstring>
#include <numeric>
#include <string>

namespace kra_image {

namespace {

constexpr int RGBA_CHANNELS = 4;

// Guard the composed buffer against absurd tile coordinates
constexpr std::size_t MAX_COMPOSED_SIZE = 2048ULL * 1024ULL * 1024ULL;

} // namespace

std::vector<std::size_t> channel_order(int pixel_size, int bytes_per_channel) {
    if (bytes_per_channel <= 0 || pixel_size < 3 * bytes_per_channel) {
        return {};
    }

    std::vector<std::size_t> order(static_cast<std::size_t>(pixel_size));
    std::iota(order.begin(), order.end(), std::size_t{0});

    const auto bpc = static_cast<std::size_t>(bytes_per_channel);
    std::swap_ranges(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(bpc),
                     order.begin() + static_cast<std::ptrdiff_t>(2 * bpc));
    return order;
}

void planar_to_interleaved(std::span<const std::uint8_t> planar,
                           std::span<std::uint8_t> interleaved,
                           std::span<const std::size_t> order,
                           std::size_t tile_area) {
    const std::size_t pixel_size = order.size();
    if (planar.size() < pixel_size * tile_area || interleaved.size() < pixel_size * tile_area) {
        return;
    }

    for (std::size_t p = 0; p < tile_area; ++p) {
        std::uint8_t* dst = interleaved.data() + p * pixel_size;
        for (std::size_t k = 0; k < pixel_size; ++k) {
            dst[k] = planar[order[k] * tile_area + p];
        }
    }
}

decode_result decode_tile(const tile& t,
                          const tile_stream_header& header,
                          color_mode mode,
                          std::vector<std::uint8_t>& interleaved) {
    const std::size_t tile_area = static_cast<std::size_t>(header.tile_width) *
                                  static_cast<std::size_t>(header.tile_height);
    const std::size_t tile_bytes = tile_area * static_cast<std::size_t>(header.pixel_size);

    const auto order = channel_order(header.pixel_size, bytes_per_channel(mode));
    if (order.empty() || header.pixel_size != bytes_per_channel(mode) * RGBA_CHANNELS) {
        return decode_result::failure(decode_error::unsupported_color_mode,
            "Pixel size " + std::to_string(header.pixel_size) + " does not match " + to_string(mode));
    }

    std::vector<std::uint8_t> planar(tile_bytes, 0);
    const auto payload = t.payload();

    if (t.encoding() == tile_encoding::raw) {
        if (payload.size() != tile_bytes) {
            return decode_result::failure(decode_error::corrupt_tile,
                "Raw tile at " + std::to_string(t.left()) + "," + std::to_string(t.top()) +
                " has " + std::to_string(payload.size()) + " bytes, expected " +
                std::to_string(tile_bytes));
        }
        std::memcpy(planar.data(), payload.data(), tile_bytes);
    } else {
        // A short run leaves the remainder of the tile transparent
        std::size_t written = 0;
        auto result = lzf_decompress(payload, planar, written);
        if (!result) {
            return decode_result::failure(decode_error::corrupt_tile,
                "Tile at " + std::to_string(t.left()) + "," + std::to_string(t.top()) +
                ": " + to_string(result.error) + ": " + result.message);
        }
    }

    interleaved.assign(tile_bytes, 0);
    planar_to_interleaved(planar, interleaved, order, tile_area);
    return decode_result::success();
}

decode_result compose_tiles(const tile_stream& stream,
                            color_mode mode,
                            composed_image& image) {
    const auto& header = stream.header;
    const layer_bounds bounds = stream.bounds;

    if (stream.tiles.empty() || bounds.empty()) {
        return decode_result::failure(decode_error::empty_layer, "Layer has no tiles");
    }

    const std::size_t pixel_size = static_cast<std::size_t>(header.pixel_size);
    const std::size_t width = static_cast<std::size_t>(bounds.width());
    const std::size_t height = static_cast<std::size_t>(bounds.height());
    const std::size_t row_length = width * pixel_size;

    if (height != 0 && row_length > MAX_COMPOSED_SIZE / height) {
        return decode_result::failure(decode_error::dimensions_exceeded,
            "Layer extent " + std::to_string(width) + "x" + std::to_string(height) + " is too large");
    }

    image.format = to_pixel_format(mode);
    image.width = bounds.width();
    image.height = bounds.height();
    image.bounds = bounds;
    image.pixels.assign(row_length * height, 0);

    const std::size_t tile_row_bytes = pixel_size * static_cast<std::size_t>(header.tile_width);
    std::vector<std::uint8_t> interleaved;

    for (const auto& t : stream.tiles) {
        auto result = decode_tile(t, header, mode, interleaved);
        if (!result) return result;

        const std::size_t rel_left = static_cast<std::size_t>(t.left() - bounds.left);
        const std::size_t rel_top = static_cast<std::size_t>(t.top() - bounds.top);

        // Each tile owns a disjoint rectangle of the composed buffer
        for (int row = 0; row < header.tile_height; ++row) {
            std::uint8_t* dst = image.pixels.data() +
                                (rel_top + static_cast<std::size_t>(row)) * row_length +
                                rel_left * pixel_size;
            const std::uint8_t* src = interleaved.data() + static_cast<std::size_t>(row) * tile_row_bytes;
            std::memcpy(dst, src, tile_row_bytes);
        }
    }

    return decode_result::success();
}

} // namespace kra_image
