#ifndef KRA_IMAGE_LZF_HPP_
#define KRA_IMAGE_LZF_HPP_

#include <kra_image/kra_image_export.h>
#include <kra_image/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

namespace kra_image {

// ============================================================================
// LZF Tile Codec
// ============================================================================

/**
 * Decompress one LZF run as written by Krita's tile compressor.
 *
 * Control byte c:
 *   c < 32   literal run of c + 1 bytes
 *   c >= 32  back-reference of (c >> 5) + 2 bytes (plus one extension byte
 *            when the 3-bit length saturates), distance ((c & 31) << 8) + d + 1
 *
 * Back-references are copied byte by byte, so a reference that overlaps the
 * bytes being written repeats them.
 *
 * @param compressed Compressed run
 * @param output Destination; its size is the expected decompressed length
 * @param written Receives the number of bytes produced (may be less than output.size())
 * @return overflow if the run would write past output.size(),
 *         invalid_reference if a back-reference points before the output start,
 *         truncated_data if the run ends inside an instruction
 */
[[nodiscard]] KRA_IMAGE_EXPORT decode_result lzf_decompress(std::span<const std::uint8_t> compressed,
                                                             std::span<std::uint8_t> output,
                                                             std::size_t& written);

} // namespace kra_image

#endif // KRA_IMAGE_LZF_HPP_
