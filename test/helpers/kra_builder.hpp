#pragma once

// Builders for in-memory tile streams and KRA packages.

#include <kra_image/container.hpp>

#include "lzf_compress.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kra_image::test {

struct tile_record {
    int left = 0;
    int top = 0;
    std::string flag = "1";
    std::vector<std::uint8_t> payload;
};

struct stream_header {
    int version = 2;
    int tile_width = 64;
    int tile_height = 64;
    int pixel_size = 4;
};

inline void append(std::vector<std::uint8_t>& out, std::string_view text) {
    out.insert(out.end(), text.begin(), text.end());
}

inline std::vector<std::uint8_t> make_tile_stream(const stream_header& header,
                                                  const std::vector<tile_record>& tiles) {
    std::vector<std::uint8_t> out;
    append(out, "VERSION " + std::to_string(header.version) + "\n");
    append(out, "TILEWIDTH " + std::to_string(header.tile_width) + "\n");
    append(out, "TILEHEIGHT " + std::to_string(header.tile_height) + "\n");
    append(out, "PIXELSIZE " + std::to_string(header.pixel_size) + "\n");
    append(out, "DATA " + std::to_string(tiles.size()) + "\n");

    for (const auto& t : tiles) {
        append(out, std::to_string(t.left) + "," + std::to_string(t.top) + "," + t.flag + "," +
                    std::to_string(t.payload.size()) + "\n");
        out.insert(out.end(), t.payload.begin(), t.payload.end());
    }
    return out;
}

// Straight RGBA color; 16-bit channels for rgba16 tiles
struct color {
    std::uint16_t r = 0;
    std::uint16_t g = 0;
    std::uint16_t b = 0;
    std::uint16_t a = 0;
};

// Planar tile as stored on disk: one plane per byte of a B,G,R,A pixel,
// 16-bit channels little-endian
template <typename PixelFn>
std::vector<std::uint8_t> planar_tile(int tile_width, int tile_height, int bytes_per_channel,
                                      PixelFn pixel) {
    const std::size_t area = static_cast<std::size_t>(tile_width) * static_cast<std::size_t>(tile_height);
    const std::size_t pixel_size = 4 * static_cast<std::size_t>(bytes_per_channel);
    std::vector<std::uint8_t> planar(area * pixel_size);

    for (int y = 0; y < tile_height; ++y) {
        for (int x = 0; x < tile_width; ++x) {
            const color c = pixel(x, y);
            const std::array<std::uint16_t, 4> stored = {c.b, c.g, c.r, c.a};
            const std::size_t p = static_cast<std::size_t>(y) * static_cast<std::size_t>(tile_width) +
                                  static_cast<std::size_t>(x);
            for (std::size_t ch = 0; ch < 4; ++ch) {
                if (bytes_per_channel == 1) {
                    planar[ch * area + p] = static_cast<std::uint8_t>(stored[ch]);
                } else {
                    planar[(ch * 2) * area + p] = static_cast<std::uint8_t>(stored[ch] & 0xFF);
                    planar[(ch * 2 + 1) * area + p] = static_cast<std::uint8_t>(stored[ch] >> 8);
                }
            }
        }
    }
    return planar;
}

inline std::vector<std::uint8_t> solid_tile(int tile_width, int tile_height, int bytes_per_channel,
                                            color c) {
    return planar_tile(tile_width, tile_height, bytes_per_channel, [c](int, int) { return c; });
}

inline tile_record lzf_tile(int left, int top, const std::vector<std::uint8_t>& planar) {
    return {left, top, "1", lzf_compress(planar)};
}

// Krita's own record form: "LZF" flag, then one byte selecting LZF (1) or raw (0)
inline tile_record krita_tile(int left, int top, const std::vector<std::uint8_t>& planar,
                              bool compressed = true) {
    tile_record t{left, top, "LZF", {}};
    t.payload.push_back(compressed ? 1 : 0);
    const auto body = compressed ? lzf_compress(planar) : planar;
    t.payload.insert(t.payload.end(), body.begin(), body.end());
    return t;
}

// ============================================================================
// Packages
// ============================================================================

inline std::string maindoc_xml(std::string_view layers,
                               std::string_view color_space = "RGBA",
                               int width = 64,
                               int height = 64,
                               std::string_view name = "Unnamed") {
    std::string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
                      "<DOC xmlns=\"http://www.calligra.org/DTD/krita\" syntaxVersion=\"2.0\""
                      " editor=\"Krita\" kritaVersion=\"5.2.2\">\n";
    xml += " <IMAGE name=\"" + std::string(name) + "\" mime=\"application/x-kra\"";
    xml += " width=\"" + std::to_string(width) + "\" height=\"" + std::to_string(height) + "\"";
    xml += " colorspacename=\"" + std::string(color_space) + "\"";
    xml += " x-res=\"300\" y-res=\"300\" description=\"\" profile=\"sRGB-elle-V2-srgbtrc.icc\">\n";
    xml += "  <layers>\n";
    xml += std::string(layers);
    xml += "  </layers>\n";
    xml += " </IMAGE>\n";
    xml += "</DOC>\n";
    return xml;
}

inline memory_container make_package(std::string_view layers,
                                     std::string_view color_space = "RGBA",
                                     int width = 64,
                                     int height = 64) {
    memory_container package;
    package.add_entry("mimetype", std::string_view("application/x-krita"));
    package.add_entry("maindoc.xml", std::string_view(maindoc_xml(layers, color_space, width, height)));
    return package;
}

inline std::string paint_layer_xml(std::string_view name, std::string_view uuid,
                                   std::string_view filename, std::string_view extra = {}) {
    return "<layer nodetype=\"paintlayer\" name=\"" + std::string(name) + "\" uuid=\"" +
           std::string(uuid) + "\" filename=\"" + std::string(filename) +
           "\" visible=\"1\" opacity=\"255\" compositeop=\"normal\" " + std::string(extra) + "/>\n";
}

} // namespace kra_image::test
