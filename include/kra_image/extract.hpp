#ifndef KRA_IMAGE_EXTRACT_HPP_
#define KRA_IMAGE_EXTRACT_HPP_

#include <kra_image/kra_image_export.h>
#include <kra_image/types.hpp>
#include <kra_image/compose.hpp>
#include <kra_image/layer.hpp>
#include <kra_image/surface.hpp>

namespace kra_image {

// ============================================================================
// Layer Extraction
// ============================================================================

/**
 * Decode the pixels of a paint layer.
 *
 * The layer itself is not modified, so layers of one document can be
 * extracted from several threads at once.
 *
 * @param l Layer to extract
 * @param image Receives interleaved RGBA8/RGBA16 rows; its bounds are in
 *              document space (tile space shifted by the layer's x/y)
 * @param crop Trim the result to pixels with non-zero alpha
 * @return not_raster if the layer owns no RGBA tiles,
 *         empty_layer if it has no tiles,
 *         corrupt_tile if a tile fails to decode
 */
[[nodiscard]] KRA_IMAGE_EXPORT decode_result extract_image(const layer& l,
                                                           composed_image& image,
                                                           bool crop = true);

/**
 * Decode the pixels of a paint layer into a surface.
 * @param l Layer to extract
 * @param surf Destination surface, sized to the (cropped) layer
 * @param bounds Receives the document-space bounds of the surface contents
 * @param crop Trim the result to pixels with non-zero alpha
 * @return Decode result with success/error status
 */
[[nodiscard]] KRA_IMAGE_EXPORT decode_result extract_image(const layer& l,
                                                           surface& surf,
                                                           layer_bounds& bounds,
                                                           bool crop = true);

} // namespace kra_image

#endif // KRA_IMAGE_EXTRACT_HPP_
