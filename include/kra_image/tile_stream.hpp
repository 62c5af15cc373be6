#ifndef KRA_IMAGE_TILE_STREAM_HPP_
#define KRA_IMAGE_TILE_STREAM_HPP_

#include <kra_image/kra_image_export.h>
#include <kra_image/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace kra_image {

// ============================================================================
// Tiles
// ============================================================================

enum class tile_encoding {
    lzf,    // payload is an LZF run
    raw     // payload is the uncompressed planar tile
};

/**
 * One tile of a layer's raster data, still compressed.
 * Decompression happens on demand and never modifies the stored payload.
 */
class KRA_IMAGE_EXPORT tile {
public:
    tile(int left, int top, tile_encoding encoding, std::vector<std::uint8_t> payload)
        : left_(left), top_(top), encoding_(encoding), payload_(std::move(payload)) {}

    [[nodiscard]] int left() const noexcept { return left_; }
    [[nodiscard]] int top() const noexcept { return top_; }
    [[nodiscard]] tile_encoding encoding() const noexcept { return encoding_; }
    [[nodiscard]] std::span<const std::uint8_t> payload() const noexcept { return payload_; }

private:
    int left_;
    int top_;
    tile_encoding encoding_;
    std::vector<std::uint8_t> payload_;
};

// ============================================================================
// Tile Stream
// ============================================================================

struct tile_stream_header {
    int version = 0;
    int tile_width = 0;
    int tile_height = 0;
    int pixel_size = 0;
    int tile_count = 0;   // DATA: number of records, empty ones included
};

struct tile_stream {
    tile_stream_header header;
    std::vector<tile> tiles;
    layer_bounds bounds;   // union of all tile rectangles

    // pixel_size * tile_width * tile_height
    [[nodiscard]] std::size_t tile_bytes() const noexcept {
        return static_cast<std::size_t>(header.pixel_size) *
               static_cast<std::size_t>(header.tile_width) *
               static_cast<std::size_t>(header.tile_height);
    }
};

/**
 * Parser for the per-layer binary stream stored under <image>/layers/.
 *
 * Layout:
 *   VERSION 2\n TILEWIDTH 64\n TILEHEIGHT 64\n PIXELSIZE 4\n DATA <n>\n
 *   n x ( left,top,flag,length\n <length payload bytes> )
 *
 * A numeric flag means the payload is a bare LZF run. The flag "LZF" (as
 * written by Krita) means the payload starts with one byte selecting
 * LZF (1) or raw (0) for the remaining bytes.
 */
class KRA_IMAGE_EXPORT tile_stream_reader {
public:
    /**
     * Parse a tile stream. Tiles are not decompressed.
     * @param data Raw stream bytes
     * @param stream Receives header, tiles and bounds
     * @param options Decode options (tile count limit)
     * @return Decode result with success/error status
     */
    [[nodiscard]] static decode_result read(std::span<const std::uint8_t> data,
                                            tile_stream& stream,
                                            const decode_options& options = {});
};

} // namespace kra_image

#endif // KRA_IMAGE_TILE_STREAM_HPP_
