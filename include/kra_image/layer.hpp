#ifndef KRA_IMAGE_LAYER_HPP_
#define KRA_IMAGE_LAYER_HPP_

#include <kra_image/kra_image_export.h>
#include <kra_image/types.hpp>
#include <kra_image/tile_stream.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace kra_image {

// ============================================================================
// Layer Kinds
// ============================================================================

enum class layer_kind {
    paint_layer,
    group_layer,
    clone_layer,
    vector_layer,
    fill_layer,
    file_layer,
    filter_layer,
    transform_mask,
    filter_mask,
    transparency_mask,
    colorize_mask,
    selection_mask
};

/**
 * Map a maindoc.xml `nodetype` value to a layer kind.
 * Accepts Krita's own names (shapelayer, generatorlayer, adjustmentlayer)
 * as well as vectorlayer, filllayer and filterlayer.
 * @return nullopt for node types this library does not know
 */
[[nodiscard]] KRA_IMAGE_EXPORT std::optional<layer_kind> parse_node_type(std::string_view node_type) noexcept;
[[nodiscard]] KRA_IMAGE_EXPORT const char* to_string(layer_kind kind) noexcept;

[[nodiscard]] constexpr bool is_mask(layer_kind kind) noexcept {
    switch (kind) {
        case layer_kind::transform_mask:
        case layer_kind::filter_mask:
        case layer_kind::transparency_mask:
        case layer_kind::colorize_mask:
        case layer_kind::selection_mask:
            return true;
        default:
            return false;
    }
}

// ============================================================================
// Blend Modes
// ============================================================================

/**
 * Krita composite operations, keyed by the `compositeop` attribute.
 */
enum class blend_mode {
    pass_through,
    normal,
    dissolve,
    darken,
    multiply,
    color_burn,
    linear_burn,
    darker_color,
    lighten,
    screen,
    color_dodge,
    linear_dodge,
    lighter_color,
    overlay,
    soft_light,
    hard_light,
    vivid_light,
    linear_light,
    pin_light,
    hard_mix,
    difference,
    exclusion,
    subtract,
    divide,
    hue,
    saturation,
    color,
    luminosity,
    unknown
};

[[nodiscard]] KRA_IMAGE_EXPORT blend_mode parse_blend_mode(std::string_view key) noexcept;

// Krita key of a blend mode ("normal", "burn", "diff", ...)
[[nodiscard]] KRA_IMAGE_EXPORT const char* to_string(blend_mode mode) noexcept;

// ============================================================================
// Layer Payloads
// ============================================================================

using layer_id = std::size_t;
inline constexpr layer_id invalid_layer = static_cast<layer_id>(-1);

// Paint layer pixels
struct raster_data {
    color_mode mode = color_mode::rgba8;
    tile_stream stream;
};

// Single-channel pixels of a transparency or selection mask
struct mask_data {
    tile_stream stream;
};

struct group_data {
    std::vector<layer_id> children;
    bool pass_through = false;
};

// Clone whose target has not been looked up yet; only exists while a
// document is being opened
struct clone_placeholder {
    std::string target_uuid;
};

struct clone_data {
    layer_id target = invalid_layer;
};

struct file_data {
    std::string source;
    std::string color_space;
};

using layer_payload = std::variant<std::monostate,
                                   raster_data,
                                   mask_data,
                                   group_data,
                                   clone_placeholder,
                                   clone_data,
                                   file_data>;

// ============================================================================
// Layer
// ============================================================================

/**
 * One node of a document's layer tree. Layers live in the document's arena
 * and refer to each other by layer_id.
 */
struct KRA_IMAGE_EXPORT layer {
    layer_kind kind = layer_kind::paint_layer;

    std::string name;
    std::string uuid;
    bool visible = true;
    bool locked = false;

    // Placement offset applied on extraction
    int x = 0;
    int y = 0;

    // Tile-space extents; width and height derive from these
    layer_bounds bounds;

    // Composite properties (layers only, masks keep the defaults)
    int opacity = 255;
    bool collapsed = false;
    int color_label = 0;
    blend_mode blend = blend_mode::normal;
    std::string composite_op = "normal";

    std::vector<layer_id> masks;
    layer_payload payload;

    [[nodiscard]] int width() const noexcept { return bounds.width(); }
    [[nodiscard]] int height() const noexcept { return bounds.height(); }

    [[nodiscard]] const raster_data* raster() const noexcept { return std::get_if<raster_data>(&payload); }
    [[nodiscard]] const mask_data* mask_pixels() const noexcept { return std::get_if<mask_data>(&payload); }
    [[nodiscard]] const group_data* group() const noexcept { return std::get_if<group_data>(&payload); }
    [[nodiscard]] const clone_data* clone() const noexcept { return std::get_if<clone_data>(&payload); }
    [[nodiscard]] const file_data* file() const noexcept { return std::get_if<file_data>(&payload); }
};

} // namespace kra_image

#endif // KRA_IMAGE_LAYER_HPP_
