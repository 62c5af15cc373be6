#include <kra_image/tile_stream.hpp>
#include "byte_cursor.hpp"

#include <algorithm>
#include <array>
#include <climits>
#include <cstdint>
#include <string>

namespace kra_image {

namespace {

constexpr std::size_t HEADER_LINE_COUNT = 5;
constexpr std::string_view KRITA_LZF_FLAG = "LZF";
constexpr std::uint8_t PAYLOAD_RAW = 0;
constexpr std::uint8_t PAYLOAD_LZF = 1;

enum header_key : std::size_t {
    key_version,
    key_tile_width,
    key_tile_height,
    key_pixel_size,
    key_data
};

constexpr std::array<std::string_view, HEADER_LINE_COUNT> HEADER_KEYS = {
    "VERSION", "TILEWIDTH", "TILEHEIGHT", "PIXELSIZE", "DATA"
};

decode_result parse_header(byte_cursor& cursor, tile_stream_header& header) {
    std::array<int, HEADER_LINE_COUNT> values{};
    std::array<bool, HEADER_LINE_COUNT> seen{};

    for (std::size_t i = 0; i < HEADER_LINE_COUNT; ++i) {
        std::string_view line;
        if (!cursor.read_line(line)) {
            return decode_result::failure(decode_error::truncated_data,
                "Tile stream header ends after " + std::to_string(i) + " lines");
        }

        const auto space = line.find(' ');
        if (space == std::string_view::npos) {
            return decode_result::failure(decode_error::invalid_format,
                "Malformed tile stream header line: " + std::string(line));
        }
        const std::string_view key = line.substr(0, space);
        const std::string_view value = line.substr(space + 1);

        const auto it = std::find(HEADER_KEYS.begin(), HEADER_KEYS.end(), key);
        if (it == HEADER_KEYS.end()) {
            return decode_result::failure(decode_error::invalid_format,
                "Unknown tile stream header key: " + std::string(key));
        }
        const auto index = static_cast<std::size_t>(it - HEADER_KEYS.begin());
        if (seen[index]) {
            return decode_result::failure(decode_error::invalid_format,
                "Duplicate tile stream header key: " + std::string(key));
        }
        if (!parse_int(value, values[index])) {
            return decode_result::failure(decode_error::invalid_format,
                "Invalid value for " + std::string(key) + ": " + std::string(value));
        }
        seen[index] = true;
    }

    header.version = values[key_version];
    header.tile_width = values[key_tile_width];
    header.tile_height = values[key_tile_height];
    header.pixel_size = values[key_pixel_size];
    header.tile_count = values[key_data];

    if (header.tile_width <= 0 || header.tile_height <= 0) {
        return decode_result::failure(decode_error::invalid_format, "Invalid tile dimensions");
    }
    if (header.pixel_size <= 0) {
        return decode_result::failure(decode_error::invalid_format, "Invalid pixel size");
    }
    if (header.tile_count < 0) {
        return decode_result::failure(decode_error::invalid_format, "Invalid tile count");
    }

    return decode_result::success();
}

decode_result parse_tile(byte_cursor& cursor, const tile_stream_header& header,
                         std::vector<tile>& tiles) {
    std::string_view line;
    if (!cursor.read_line(line)) {
        return decode_result::failure(decode_error::truncated_data,
            "Tile record missing at offset " + std::to_string(cursor.position()));
    }

    std::array<std::string_view, 4> fields;
    std::size_t field_count = 0;
    std::size_t start = 0;
    while (field_count < fields.size()) {
        const auto comma = line.find(',', start);
        if (comma == std::string_view::npos) {
            fields[field_count++] = line.substr(start);
            start = line.size() + 1;
            break;
        }
        fields[field_count++] = line.substr(start, comma - start);
        start = comma + 1;
    }
    if (field_count != fields.size() || start <= line.size()) {
        return decode_result::failure(decode_error::invalid_format,
            "Malformed tile record: " + std::string(line));
    }

    int left = 0;
    int top = 0;
    int length = 0;
    if (!parse_int(fields[0], left) || !parse_int(fields[1], top) ||
        !parse_int(fields[3], length) || length < 0) {
        return decode_result::failure(decode_error::invalid_format,
            "Malformed tile record: " + std::string(line));
    }

    // The far edge of the tile must stay representable
    if (static_cast<std::int64_t>(left) + header.tile_width > INT_MAX ||
        static_cast<std::int64_t>(top) + header.tile_height > INT_MAX) {
        return decode_result::failure(decode_error::invalid_format,
            "Tile at " + std::string(fields[0]) + "," + std::string(fields[1]) +
            " lies outside the coordinate range");
    }

    std::span<const std::uint8_t> payload;
    if (!cursor.read_bytes(static_cast<std::size_t>(length), payload)) {
        return decode_result::failure(decode_error::truncated_data,
            "Tile payload at " + std::string(fields[0]) + "," + std::string(fields[1]) +
            " exceeds stream size");
    }

    // Empty tile: nothing painted there
    if (length == 0) {
        return decode_result::success();
    }

    tile_encoding encoding = tile_encoding::lzf;
    if (fields[2] == KRITA_LZF_FLAG) {
        switch (payload[0]) {
            case PAYLOAD_LZF: encoding = tile_encoding::lzf; break;
            case PAYLOAD_RAW: encoding = tile_encoding::raw; break;
            default:
                return decode_result::failure(decode_error::invalid_format,
                    "Unknown tile payload flag: " + std::to_string(payload[0]));
        }
        payload = payload.subspan(1);
    } else {
        // Numeric flag field carries no information
        int flag = 0;
        if (!parse_int(fields[2], flag)) {
            return decode_result::failure(decode_error::invalid_format,
                "Unknown tile compression: " + std::string(fields[2]));
        }
    }

    tiles.emplace_back(left, top, encoding,
                       std::vector<std::uint8_t>(payload.begin(), payload.end()));
    return decode_result::success();
}

layer_bounds compute_bounds(const tile_stream_header& header, const std::vector<tile>& tiles) {
    if (tiles.empty()) {
        return {};
    }

    layer_bounds bounds{tiles.front().left(), tiles.front().top(),
                        tiles.front().left() + header.tile_width,
                        tiles.front().top() + header.tile_height};
    for (const auto& t : tiles) {
        bounds.left = std::min(bounds.left, t.left());
        bounds.top = std::min(bounds.top, t.top());
        bounds.right = std::max(bounds.right, t.left() + header.tile_width);
        bounds.bottom = std::max(bounds.bottom, t.top() + header.tile_height);
    }
    return bounds;
}

} // namespace

decode_result tile_stream_reader::read(std::span<const std::uint8_t> data,
                                       tile_stream& stream,
                                       const decode_options& options) {
    byte_cursor cursor(data);

    tile_stream_header header;
    auto result = parse_header(cursor, header);
    if (!result) return result;

    if (options.max_tiles_per_layer > 0 && header.tile_count > options.max_tiles_per_layer) {
        return decode_result::failure(decode_error::dimensions_exceeded,
            "Tile count " + std::to_string(header.tile_count) + " exceeds limit");
    }

    std::vector<tile> tiles;
    tiles.reserve(std::min<std::size_t>(static_cast<std::size_t>(header.tile_count), cursor.remaining()));
    for (int i = 0; i < header.tile_count; ++i) {
        result = parse_tile(cursor, header, tiles);
        if (!result) return result;
    }

    const auto bounds = compute_bounds(header, tiles);
    if (static_cast<std::int64_t>(bounds.right) - bounds.left > INT_MAX ||
        static_cast<std::int64_t>(bounds.bottom) - bounds.top > INT_MAX) {
        return decode_result::failure(decode_error::invalid_format,
            "Tile extent does not fit the coordinate range");
    }

    stream.header = header;
    stream.bounds = bounds;
    stream.tiles = std::move(tiles);

    return decode_result::success();
}

} // namespace kra_image
