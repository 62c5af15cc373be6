#ifndef KRA_IMAGE_PNG_HPP_
#define KRA_IMAGE_PNG_HPP_

#include <kra_image/kra_image_export.h>
#include <kra_image/types.hpp>
#include <kra_image/surface.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace kra_image {

// ============================================================================
// PNG Decoder
// ============================================================================

/**
 * Decoder for the PNG entries of a package (mergedimage.png, preview.png).
 */
class KRA_IMAGE_EXPORT png_decoder {
public:
    static constexpr std::string_view name = "png";

    /**
     * Check if data appears to be a PNG file.
     * @param data Raw file data
     * @return true if the signature matches PNG format
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Decode PNG image data to a surface as RGBA8.
     * @param data Raw file data
     * @param surf Destination surface
     * @param options Decode options
     * @return Decode result with success/error status
     */
    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                              surface& surf,
                                              const decode_options& options = {});
};

// ============================================================================
// PNG Encoder Functions
// ============================================================================

/**
 * Encode a memory surface to PNG format.
 * RGBA8 surfaces are written as 8-bit RGBA, RGBA16 surfaces as 16-bit RGBA.
 * @param surf Source surface
 * @return PNG-encoded data, or empty vector on failure
 */
[[nodiscard]] KRA_IMAGE_EXPORT std::vector<std::uint8_t> encode_png(const memory_surface& surf);

/**
 * Save a memory surface to a PNG file.
 * @param surf Source surface
 * @param path Output file path
 * @return true on success
 */
[[nodiscard]] KRA_IMAGE_EXPORT bool save_png(const memory_surface& surf,
                                             const std::filesystem::path& path);

} // namespace kra_image

#endif // KRA_IMAGE_PNG_HPP_
