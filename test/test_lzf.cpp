#include <doctest/doctest.h>
#include <kra_image/lzf.hpp>

#include "helpers/lzf_compress.hpp"

#include <cstdint>
#include <vector>

namespace {

std::vector<std::uint8_t> make_pattern(std::size_t size) {
    // Runs, repeats and noise so both literal and back-reference paths are hit
    std::vector<std::uint8_t> data(size);
    std::uint32_t state = 0x12345678;
    for (std::size_t i = 0; i < size; ++i) {
        if ((i / 97) % 3 == 0) {
            data[i] = 0;
        } else if ((i / 97) % 3 == 1) {
            data[i] = static_cast<std::uint8_t>(i % 7);
        } else {
            state = state * 1103515245u + 12345u;
            data[i] = static_cast<std::uint8_t>(state >> 16);
        }
    }
    return data;
}

} // namespace

TEST_CASE("LZF codec: round trip") {
    SUBCASE("Mixed content") {
        const auto input = make_pattern(4096);
        const auto compressed = kra_image::test::lzf_compress(input);

        std::vector<std::uint8_t> output(input.size());
        std::size_t written = 0;
        auto result = kra_image::lzf_decompress(compressed, output, written);

        REQUIRE(result.ok);
        CHECK(written == input.size());
        CHECK(output == input);
    }

    SUBCASE("Long constant run uses extended lengths") {
        const std::vector<std::uint8_t> input(16384, 0xAB);
        const auto compressed = kra_image::test::lzf_compress(input);
        CHECK(compressed.size() < input.size() / 10);

        std::vector<std::uint8_t> output(input.size());
        std::size_t written = 0;
        auto result = kra_image::lzf_decompress(compressed, output, written);

        REQUIRE(result.ok);
        CHECK(written == input.size());
        CHECK(output == input);
    }

    SUBCASE("Empty input produces nothing") {
        std::vector<std::uint8_t> compressed;
        std::vector<std::uint8_t> output(16, 0xFF);
        std::size_t written = 99;
        auto result = kra_image::lzf_decompress(compressed, output, written);

        CHECK(result.ok);
        CHECK(written == 0);
    }
}

TEST_CASE("LZF codec: back-references") {
    SUBCASE("Plain copy") {
        const std::vector<std::uint8_t> compressed = {0x02, 'a', 'b', 'c', 0x20, 0x02};
        std::vector<std::uint8_t> output(6);
        std::size_t written = 0;
        auto result = kra_image::lzf_decompress(compressed, output, written);

        REQUIRE(result.ok);
        CHECK(written == 6);
        CHECK(output == std::vector<std::uint8_t>{'a', 'b', 'c', 'a', 'b', 'c'});
    }

    SUBCASE("Overlapping copy repeats bytes") {
        const std::vector<std::uint8_t> compressed = {0x00, 'a', 0x60, 0x00};
        std::vector<std::uint8_t> output(6);
        std::size_t written = 0;
        auto result = kra_image::lzf_decompress(compressed, output, written);

        REQUIRE(result.ok);
        CHECK(written == 6);
        CHECK(output == std::vector<std::uint8_t>(6, 'a'));
    }

    SUBCASE("Extended length byte") {
        const std::vector<std::uint8_t> compressed = {0x00, 'z', 0xE0, 10, 0x00};
        std::vector<std::uint8_t> output(20);
        std::size_t written = 0;
        auto result = kra_image::lzf_decompress(compressed, output, written);

        REQUIRE(result.ok);
        CHECK(written == 20);
        CHECK(output == std::vector<std::uint8_t>(20, 'z'));
    }
}

TEST_CASE("LZF codec: error handling") {
    SUBCASE("Literal run overflows output") {
        const std::vector<std::uint8_t> compressed = {0x03, 1, 2, 3, 4};
        std::vector<std::uint8_t> output(2);
        std::size_t written = 0;
        auto result = kra_image::lzf_decompress(compressed, output, written);

        CHECK_FALSE(result.ok);
        CHECK(result.error == kra_image::decode_error::overflow);
        CHECK(written == 0);
    }

    SUBCASE("Back-reference overflows output") {
        const std::vector<std::uint8_t> compressed = {0x00, 'a', 0x60, 0x00};
        std::vector<std::uint8_t> output(3);
        std::size_t written = 0;
        auto result = kra_image::lzf_decompress(compressed, output, written);

        CHECK_FALSE(result.ok);
        CHECK(result.error == kra_image::decode_error::overflow);
        CHECK(written == 1);
    }

    SUBCASE("Reference before output start") {
        const std::vector<std::uint8_t> compressed = {0x20, 0x00};
        std::vector<std::uint8_t> output(8);
        std::size_t written = 0;
        auto result = kra_image::lzf_decompress(compressed, output, written);

        CHECK_FALSE(result.ok);
        CHECK(result.error == kra_image::decode_error::invalid_reference);
    }

    SUBCASE("Reference further back than the produced bytes") {
        const std::vector<std::uint8_t> compressed = {0x01, 'a', 'b', 0x20, 0x05};
        std::vector<std::uint8_t> output(8);
        std::size_t written = 0;
        auto result = kra_image::lzf_decompress(compressed, output, written);

        CHECK_FALSE(result.ok);
        CHECK(result.error == kra_image::decode_error::invalid_reference);
        CHECK(written == 2);
    }

    SUBCASE("Missing offset byte") {
        const std::vector<std::uint8_t> compressed = {0x00, 'a', 0x20};
        std::vector<std::uint8_t> output(8);
        std::size_t written = 0;
        auto result = kra_image::lzf_decompress(compressed, output, written);

        CHECK_FALSE(result.ok);
        CHECK(result.error == kra_image::decode_error::truncated_data);
    }

    SUBCASE("Missing length byte") {
        const std::vector<std::uint8_t> compressed = {0x00, 'a', 0xE0};
        std::vector<std::uint8_t> output(64);
        std::size_t written = 0;
        auto result = kra_image::lzf_decompress(compressed, output, written);

        CHECK_FALSE(result.ok);
        CHECK(result.error == kra_image::decode_error::truncated_data);
    }
}

TEST_CASE("LZF codec: short run") {
    const std::vector<std::uint8_t> compressed = {0x02, 9, 8, 7};
    std::vector<std::uint8_t> output(16, 0);
    std::size_t written = 0;
    auto result = kra_image::lzf_decompress(compressed, output, written);

    REQUIRE(result.ok);
    CHECK(written == 3);
    CHECK(output[0] == 9);
    CHECK(output[2] == 7);
    CHECK(output[3] == 0);
}

TEST_CASE("LZF codec: literal run cut short by the end of input") {
    SUBCASE("Copies the bytes that are present") {
        const std::vector<std::uint8_t> compressed = {0x05, 'a', 'b'};
        std::vector<std::uint8_t> output(8, 0xEE);
        std::size_t written = 0;
        auto result = kra_image::lzf_decompress(compressed, output, written);

        REQUIRE(result.ok);
        CHECK(written == 2);
        CHECK(output[0] == 'a');
        CHECK(output[1] == 'b');
        CHECK(output[2] == 0xEE);
    }

    SUBCASE("Control byte as the last input byte") {
        const std::vector<std::uint8_t> compressed = {0x01, 'x', 'y', 0x03};
        std::vector<std::uint8_t> output(8);
        std::size_t written = 0;
        auto result = kra_image::lzf_decompress(compressed, output, written);

        REQUIRE(result.ok);
        CHECK(written == 2);
    }

    SUBCASE("Available bytes still bounded by the output") {
        const std::vector<std::uint8_t> compressed = {0x1F, 1, 2, 3, 4, 5};
        std::vector<std::uint8_t> output(4);
        std::size_t written = 0;
        auto result = kra_image::lzf_decompress(compressed, output, written);

        CHECK_FALSE(result.ok);
        CHECK(result.error == kra_image::decode_error::overflow);
    }
}
