#include <kra_image/layer.hpp>

#include <array>
#include <utility>

namespace kra_image {

namespace {

struct node_type_entry {
    std::string_view name;
    layer_kind kind;
};

constexpr std::array<node_type_entry, 15> NODE_TYPES = {{
    {"paintlayer", layer_kind::paint_layer},
    {"grouplayer", layer_kind::group_layer},
    {"clonelayer", layer_kind::clone_layer},
    {"vectorlayer", layer_kind::vector_layer},
    {"shapelayer", layer_kind::vector_layer},
    {"filllayer", layer_kind::fill_layer},
    {"generatorlayer", layer_kind::fill_layer},
    {"filelayer", layer_kind::file_layer},
    {"filterlayer", layer_kind::filter_layer},
    {"adjustmentlayer", layer_kind::filter_layer},
    {"transformmask", layer_kind::transform_mask},
    {"filtermask", layer_kind::filter_mask},
    {"transparencymask", layer_kind::transparency_mask},
    {"colorizemask", layer_kind::colorize_mask},
    {"selectionmask", layer_kind::selection_mask},
}};

struct blend_entry {
    std::string_view key;
    blend_mode mode;
};

constexpr std::array<blend_entry, 28> BLEND_MODES = {{
    {"pass through", blend_mode::pass_through},
    {"normal", blend_mode::normal},
    {"dissolve", blend_mode::dissolve},
    {"darken", blend_mode::darken},
    {"multiply", blend_mode::multiply},
    {"burn", blend_mode::color_burn},
    {"linear_burn", blend_mode::linear_burn},
    {"darker color", blend_mode::darker_color},
    {"lighten", blend_mode::lighten},
    {"screen", blend_mode::screen},
    {"dodge", blend_mode::color_dodge},
    {"linear_dodge", blend_mode::linear_dodge},
    {"lighter color", blend_mode::lighter_color},
    {"overlay", blend_mode::overlay},
    {"soft_light", blend_mode::soft_light},
    {"hard_light", blend_mode::hard_light},
    {"vivid_light", blend_mode::vivid_light},
    {"linear light", blend_mode::linear_light},
    {"pin_light", blend_mode::pin_light},
    {"hard mix", blend_mode::hard_mix},
    {"diff", blend_mode::difference},
    {"exclusion", blend_mode::exclusion},
    {"subtract", blend_mode::subtract},
    {"divide", blend_mode::divide},
    {"hue", blend_mode::hue},
    {"saturation", blend_mode::saturation},
    {"color", blend_mode::color},
    {"luminize", blend_mode::luminosity},
}};

} // namespace

std::optional<layer_kind> parse_node_type(std::string_view node_type) noexcept {
    for (const auto& entry : NODE_TYPES) {
        if (entry.name == node_type) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

const char* to_string(layer_kind kind) noexcept {
    switch (kind) {
        case layer_kind::paint_layer:       return "paintlayer";
        case layer_kind::group_layer:       return "grouplayer";
        case layer_kind::clone_layer:       return "clonelayer";
        case layer_kind::vector_layer:      return "vectorlayer";
        case layer_kind::fill_layer:        return "filllayer";
        case layer_kind::file_layer:        return "filelayer";
        case layer_kind::filter_layer:      return "filterlayer";
        case layer_kind::transform_mask:    return "transformmask";
        case layer_kind::filter_mask:       return "filtermask";
        case layer_kind::transparency_mask: return "transparencymask";
        case layer_kind::colorize_mask:     return "colorizemask";
        case layer_kind::selection_mask:    return "selectionmask";
    }
    return "unknown";
}

blend_mode parse_blend_mode(std::string_view key) noexcept {
    for (const auto& entry : BLEND_MODES) {
        if (entry.key == key) {
            return entry.mode;
        }
    }
    return blend_mode::unknown;
}

const char* to_string(blend_mode mode) noexcept {
    for (const auto& entry : BLEND_MODES) {
        if (entry.mode == mode) {
            return entry.key.data();
        }
    }
    return "unknown";
}

} // namespace kra_image
