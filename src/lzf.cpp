#include <kra_image/lzf.hpp>

#include <algorithm>
#include <cstring>
#include <string>

namespace kra_image {

namespace {

constexpr unsigned LZF_LITERAL_LIMIT = 33;
constexpr std::size_t LZF_MIN_MATCH = 3;
constexpr std::size_t LZF_LENGTH_SATURATED = 6;

} // namespace

decode_result lzf_decompress(std::span<const std::uint8_t> compressed,
                             std::span<std::uint8_t> output,
                             std::size_t& written) {
    const std::uint8_t* ip = compressed.data();
    const std::size_t in_len = compressed.size();
    std::uint8_t* op = output.data();
    const std::size_t out_len = output.size();

    std::size_t in_pos = 0;
    std::size_t out_pos = 0;
    written = 0;

    while (in_pos < in_len) {
        const std::uint8_t c = ip[in_pos++];
        const unsigned ctrl = static_cast<unsigned>(c) + 1;

        if (ctrl < LZF_LITERAL_LIMIT) {
            // Literal run; one cut short by the end of input copies what is there
            const std::size_t run = std::min<std::size_t>(ctrl, in_len - in_pos);
            if (out_pos + run > out_len) {
                written = out_pos;
                return decode_result::failure(decode_error::overflow,
                    "Literal run exceeds tile size at output offset " + std::to_string(out_pos));
            }
            std::memcpy(op + out_pos, ip + in_pos, run);
            in_pos += run;
            out_pos += run;
            continue;
        }

        // Back-reference
        const std::size_t ofs = static_cast<std::size_t>(c & 31) << 8;
        std::size_t len = static_cast<std::size_t>(c >> 5) - 1;

        if (len == LZF_LENGTH_SATURATED) {
            if (in_pos >= in_len) {
                written = out_pos;
                return decode_result::failure(decode_error::truncated_data,
                    "Back-reference length byte missing");
            }
            len += ip[in_pos++];
        }

        if (in_pos >= in_len) {
            written = out_pos;
            return decode_result::failure(decode_error::truncated_data,
                "Back-reference offset byte missing");
        }
        const std::size_t distance = ofs + 1 + ip[in_pos++];

        if (distance > out_pos) {
            written = out_pos;
            return decode_result::failure(decode_error::invalid_reference,
                "Back-reference points " + std::to_string(distance - out_pos) +
                " bytes before output start");
        }
        if (out_pos + LZF_MIN_MATCH + len > out_len) {
            written = out_pos;
            return decode_result::failure(decode_error::overflow,
                "Back-reference exceeds tile size at output offset " + std::to_string(out_pos));
        }

        // Byte-wise copy; the source may overlap the bytes being written
        std::size_t ref = out_pos - distance;
        for (std::size_t i = 0; i < LZF_MIN_MATCH + len; ++i) {
            op[out_pos++] = op[ref++];
        }
    }

    written = out_pos;
    return decode_result::success();
}

} // namespace kra_image
