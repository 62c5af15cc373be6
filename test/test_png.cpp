#include <doctest/doctest.h>
#include <kra_image/document.hpp>
#include <kra_image/png.hpp>

#include <cstdint>
#include <filesystem>
#include <vector>

namespace {

kra_image::memory_surface make_surface(int width, int height, kra_image::pixel_format format) {
    kra_image::memory_surface surface;
    REQUIRE(surface.set_size(width, height, format));

    const std::size_t bpp = kra_image::bytes_per_pixel(format);
    std::vector<std::uint8_t> row(static_cast<std::size_t>(width) * bpp);
    for (int y = 0; y < height; ++y) {
        for (std::size_t i = 0; i < row.size(); ++i) {
            row[i] = static_cast<std::uint8_t>(y * 16 + static_cast<int>(i));
        }
        surface.write_pixels(0, y, static_cast<int>(row.size()), row.data());
    }
    return surface;
}

} // namespace

TEST_CASE("PNG decoder: sniff") {
    SUBCASE("Valid PNG signature") {
        std::vector<std::uint8_t> data = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
        CHECK(kra_image::png_decoder::sniff(data));
    }

    SUBCASE("Not a PNG") {
        std::vector<std::uint8_t> data = {'P', 'K', 0x03, 0x04, 0, 0, 0, 0};
        CHECK_FALSE(kra_image::png_decoder::sniff(data));
    }

    SUBCASE("Too short") {
        std::vector<std::uint8_t> data = {0x89, 0x50};
        CHECK_FALSE(kra_image::png_decoder::sniff(data));
    }
}

TEST_CASE("PNG encoder: export") {
    SUBCASE("RGBA8") {
        const auto surface = make_surface(3, 2, kra_image::pixel_format::rgba8888);
        const auto png = kra_image::encode_png(surface);
        REQUIRE(kra_image::png_decoder::sniff(png));

        kra_image::memory_surface decoded;
        auto result = kra_image::png_decoder::decode(png, decoded);
        REQUIRE(result.ok);
        CHECK(decoded.width() == 3);
        CHECK(decoded.height() == 2);
        CHECK(decoded.format() == kra_image::pixel_format::rgba8888);
        CHECK(std::vector<std::uint8_t>(decoded.pixels().begin(), decoded.pixels().end()) ==
              std::vector<std::uint8_t>(surface.pixels().begin(), surface.pixels().end()));
    }

    SUBCASE("RGBA16 keeps the high byte when read back as RGBA8") {
        const auto surface = make_surface(2, 2, kra_image::pixel_format::rgba16);
        const auto png = kra_image::encode_png(surface);
        REQUIRE(kra_image::png_decoder::sniff(png));

        kra_image::memory_surface decoded;
        auto result = kra_image::png_decoder::decode(png, decoded);
        REQUIRE(result.ok);
        REQUIRE(decoded.width() == 2);

        // Little-endian source: high byte of channel k sits at 2k + 1
        const auto src = surface.pixels();
        const auto dst = decoded.pixels();
        for (std::size_t k = 0; k < 4; ++k) {
            CHECK(dst[k] == src[2 * k + 1]);
        }
    }

    SUBCASE("Empty surface cannot be encoded") {
        kra_image::memory_surface surface;
        CHECK(kra_image::encode_png(surface).empty());
        CHECK_FALSE(kra_image::save_png(surface, std::filesystem::temp_directory_path() / "kra_image_empty.png"));
    }

    SUBCASE("Save to disk") {
        const auto surface = make_surface(4, 4, kra_image::pixel_format::rgba8888);
        const auto path = std::filesystem::temp_directory_path() / "kra_image_export_test.png";
        REQUIRE(kra_image::save_png(surface, path));
        CHECK(std::filesystem::file_size(path) > 8);
        std::filesystem::remove(path);
    }
}

TEST_CASE("PNG decoder: error handling") {
    SUBCASE("Corrupt data after signature") {
        std::vector<std::uint8_t> data = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A, 0, 0, 0, 0};
        kra_image::memory_surface surface;
        auto result = kra_image::png_decoder::decode(data, surface);
        CHECK_FALSE(result.ok);
        CHECK(result.error == kra_image::decode_error::invalid_format);
    }

    SUBCASE("Dimension limits exceeded") {
        const auto png = kra_image::encode_png(make_surface(8, 8, kra_image::pixel_format::rgba8888));
        kra_image::decode_options opts;
        opts.max_width = 4;
        opts.max_height = 4;

        kra_image::memory_surface surface;
        auto result = kra_image::png_decoder::decode(png, surface, opts);
        CHECK_FALSE(result.ok);
        CHECK(result.error == kra_image::decode_error::dimensions_exceeded);
    }
}

TEST_CASE("Document: merged image and preview") {
    kra_image::memory_container package;
    package.add_entry("mergedimage.png",
                      kra_image::encode_png(make_surface(5, 4, kra_image::pixel_format::rgba8888)));

    SUBCASE("Merged image") {
        kra_image::memory_surface surface;
        auto result = kra_image::document::read_merged_image(package, surface);
        REQUIRE(result.ok);
        CHECK(surface.width() == 5);
        CHECK(surface.height() == 4);
    }

    SUBCASE("Missing preview") {
        kra_image::memory_surface surface;
        auto result = kra_image::document::read_preview(package, surface);
        CHECK_FALSE(result.ok);
        CHECK(result.error == kra_image::decode_error::missing_entry);
    }
}
