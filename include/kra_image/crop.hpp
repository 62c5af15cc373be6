#ifndef KRA_IMAGE_CROP_HPP_
#define KRA_IMAGE_CROP_HPP_

#include <kra_image/kra_image_export.h>
#include <kra_image/types.hpp>
#include <kra_image/compose.hpp>

namespace kra_image {

// ============================================================================
// Bounding-Box Crop
// ============================================================================

/**
 * Find the rectangle holding every pixel with alpha > 0.
 * @param image Composed image
 * @return Rectangle relative to the image origin, or an empty rectangle
 *         when no pixel has non-zero alpha
 */
[[nodiscard]] KRA_IMAGE_EXPORT layer_bounds content_rect(const composed_image& image) noexcept;

/**
 * Trim an image to its painted pixels.
 * A fully transparent image yields a 0x0 result positioned at the source
 * origin. Cropping an already cropped image returns it unchanged.
 * @param image Source image
 * @return Cropped copy with bounds moved to the new offset and extent
 */
[[nodiscard]] KRA_IMAGE_EXPORT composed_image crop_to_content(const composed_image& image);

} // namespace kra_image

#endif // KRA_IMAGE_CROP_HPP_
