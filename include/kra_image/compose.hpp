#ifndef KRA_IMAGE_COMPOSE_HPP_
#define KRA_IMAGE_COMPOSE_HPP_

#include <kra_image/kra_image_export.h>
#include <kra_image/types.hpp>
#include <kra_image/tile_stream.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace kra_image {

// ============================================================================
// Composed Image
// ============================================================================

/**
 * Interleaved, tightly packed pixel buffer of one layer.
 * bounds gives its position in layer tile space; width/height match bounds.
 */
struct composed_image {
    pixel_format format = pixel_format::rgba8888;
    int width = 0;
    int height = 0;
    layer_bounds bounds;
    std::vector<std::uint8_t> pixels;

    [[nodiscard]] std::size_t pitch() const noexcept {
        return static_cast<std::size_t>(width) * bytes_per_pixel(format);
    }
};

// ============================================================================
// Plane Reassembly
// ============================================================================

/**
 * Output channel order for a tile stored as B,G,R,A byte planes.
 * The first bytes_per_channel entries are swapped with the block starting at
 * 2 * bytes_per_channel, so slot k of an output pixel reads plane order[k].
 * @return Empty vector if pixel_size cannot hold three channels
 */
[[nodiscard]] KRA_IMAGE_EXPORT std::vector<std::size_t> channel_order(int pixel_size,
                                                                       int bytes_per_channel);

/**
 * Transpose a planar tile into interleaved pixels.
 * interleaved[p * order.size() + k] = planar[order[k] * tile_area + p]
 */
KRA_IMAGE_EXPORT void planar_to_interleaved(std::span<const std::uint8_t> planar,
                                            std::span<std::uint8_t> interleaved,
                                            std::span<const std::size_t> order,
                                            std::size_t tile_area);

/**
 * Decompress one tile and reorder it into interleaved RGBA.
 * @param t Tile to decode
 * @param header Stream header (tile size, pixel size)
 * @param mode Color mode of the layer
 * @param interleaved Receives pixel_size * tile_width * tile_height bytes
 * @return corrupt_tile if the payload cannot be decoded
 */
[[nodiscard]] KRA_IMAGE_EXPORT decode_result decode_tile(const tile& t,
                                                         const tile_stream_header& header,
                                                         color_mode mode,
                                                         std::vector<std::uint8_t>& interleaved);

/**
 * Reassemble every tile of a stream into one layer-sized buffer.
 * Each tile lands at (tile.left - bounds.left, tile.top - bounds.top).
 * @param stream Parsed tile stream
 * @param mode Color mode of the layer
 * @param image Receives the composed buffer
 * @return Decode result with success/error status
 */
[[nodiscard]] KRA_IMAGE_EXPORT decode_result compose_tiles(const tile_stream& stream,
                                                           color_mode mode,
                                                           composed_image& image);

} // namespace kra_image

#endif // KRA_IMAGE_COMPOSE_HPP_
