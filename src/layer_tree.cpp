#include "layer_tree.hpp"

#include <kra_image/tile_stream.hpp>

#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace kra_image {

namespace {

constexpr std::string_view LAYER_TAG = "layer";
constexpr std::string_view LAYERS_TAG = "layers";
constexpr std::string_view MASK_TAG = "mask";
constexpr std::string_view MASKS_TAG = "masks";
constexpr std::string_view PIXEL_SELECTION_SUFFIX = ".pixelselection";
constexpr int RGBA_CHANNELS = 4;

std::string describe(const layer& l) {
    return std::string(to_string(l.kind)) + " '" + l.name + "'";
}

void read_common(const xml_element& elem, layer& l) {
    l.name = elem.attribute("name");
    l.uuid = elem.attribute("uuid");
    l.visible = elem.bool_attribute("visible", true);
    l.locked = elem.bool_attribute("locked", false);
    l.x = elem.int_attribute("x", 0);
    l.y = elem.int_attribute("y", 0);
}

void read_composite(const xml_element& elem, layer& l) {
    l.opacity = elem.int_attribute("opacity", 255);
    l.collapsed = elem.bool_attribute("collapsed", false);
    l.color_label = elem.int_attribute("colorlabel", 0);
    l.composite_op = elem.attribute("compositeop", "normal");
    l.blend = parse_blend_mode(l.composite_op);
}

} // namespace

decode_result layer_tree_builder::build(const xml_element& layers) {
    std::vector<layer_id> roots;
    auto result = build_list(layers, roots);
    if (!result) return result;

    doc_.roots_ = std::move(roots);
    return decode_result::success();
}

decode_result layer_tree_builder::build_list(const xml_element& list, std::vector<layer_id>& out) {
    for (const auto& elem : list.children) {
        if (elem.name != LAYER_TAG) {
            continue;
        }

        std::optional<layer_id> id;
        auto result = build_layer(elem, id);
        if (!result) return result;

        if (id) {
            out.push_back(*id);
        }
    }
    return decode_result::success();
}

decode_result layer_tree_builder::build_masks(const xml_element& list, std::vector<layer_id>& out) {
    for (const auto& elem : list.children) {
        if (elem.name != MASK_TAG) {
            continue;
        }

        std::optional<layer_id> id;
        auto result = build_layer(elem, id);
        if (!result) return result;

        if (id) {
            out.push_back(*id);
        }
    }
    return decode_result::success();
}

decode_result layer_tree_builder::build_layer(const xml_element& elem, std::optional<layer_id>& out) {
    const std::string node_type = elem.attribute("nodetype");
    const auto kind = parse_node_type(node_type);
    if (!kind) {
        warn("Skipping node '" + elem.attribute("name") + "' of unknown type '" + node_type + "'");
        return decode_result::success();
    }

    layer l;
    l.kind = *kind;
    read_common(elem, l);
    if (!is_mask(l.kind)) {
        read_composite(elem, l);
    }

    switch (l.kind) {
        case layer_kind::paint_layer: {
            bool rejected = false;
            auto result = load_paint_layer(elem, l, rejected);
            if (!result) return result;
            if (rejected) {
                return decode_result::success();
            }
            break;
        }
        case layer_kind::group_layer: {
            group_data group;
            group.pass_through = elem.bool_attribute("passthrough", false);
            if (const auto* children = elem.child(LAYERS_TAG)) {
                auto result = build_list(*children, group.children);
                if (!result) return result;
            }
            l.payload = std::move(group);
            break;
        }
        case layer_kind::clone_layer:
            // The target may come later in the document; resolved once the tree is complete
            l.payload = clone_placeholder{elem.attribute("clonefromuuid")};
            break;
        case layer_kind::file_layer:
            l.payload = file_data{elem.attribute("source"), elem.attribute("colorspacename")};
            break;
        case layer_kind::transparency_mask:
        case layer_kind::selection_mask:
            load_mask_pixels(elem, l);
            break;
        default:
            break;
    }

    if (const auto* masks = elem.child(MASKS_TAG)) {
        auto result = build_masks(*masks, l.masks);
        if (!result) return result;
    }

    out = add(std::move(l));
    return decode_result::success();
}

decode_result layer_tree_builder::load_paint_layer(const xml_element& elem, layer& l, bool& rejected) {
    rejected = false;

    const std::string color_space = elem.attribute("colorspacename", to_string(doc_.mode_));
    const auto mode = parse_color_mode(color_space);
    if (!mode) {
        return decode_result::failure(decode_error::unsupported_color_mode,
            describe(l) + " uses unsupported color space '" + color_space + "'");
    }

    const std::string filename = elem.attribute("filename");
    if (filename.empty()) {
        warn("Skipping " + describe(l) + ": no filename attribute");
        rejected = true;
        return decode_result::success();
    }

    std::vector<std::uint8_t> data;
    auto result = source_.read_entry(layer_path(filename), data);
    if (!result) {
        warn("Skipping " + describe(l) + ": " + result.message);
        rejected = true;
        return decode_result::success();
    }

    raster_data raster;
    raster.mode = *mode;
    result = tile_stream_reader::read(data, raster.stream, options_);
    if (!result) {
        warn("Skipping " + describe(l) + ": " + result.message);
        rejected = true;
        return decode_result::success();
    }

    if (raster.stream.header.pixel_size != bytes_per_channel(*mode) * RGBA_CHANNELS) {
        warn("Skipping " + describe(l) + ": pixel size " +
             std::to_string(raster.stream.header.pixel_size) + " does not match " + color_space);
        rejected = true;
        return decode_result::success();
    }

    // No tiles leaves the bounds empty and the layer not useful
    l.bounds = raster.stream.bounds;
    l.payload = std::move(raster);
    return decode_result::success();
}

void layer_tree_builder::load_mask_pixels(const xml_element& elem, layer& l) {
    const std::string filename = elem.attribute("filename");
    if (filename.empty()) {
        return;
    }

    const std::string path = layer_path(filename + std::string(PIXEL_SELECTION_SUFFIX));
    if (!source_.has_entry(path)) {
        return;
    }

    std::vector<std::uint8_t> data;
    auto result = source_.read_entry(path, data);
    mask_data pixels;
    if (result) {
        result = tile_stream_reader::read(data, pixels.stream, options_);
    }
    if (!result) {
        warn("Ignoring pixels of " + describe(l) + ": " + result.message);
        return;
    }

    l.bounds = pixels.stream.bounds;
    l.payload = std::move(pixels);
}

decode_result layer_tree_builder::resolve_clones() {
    auto& layers = doc_.layers_;

    // Layers are not added or removed from here on, so the views stay valid
    std::unordered_map<std::string_view, layer_id> by_uuid;
    by_uuid.reserve(layers.size());
    for (layer_id id = 0; id < layers.size(); ++id) {
        if (layers[id].uuid.empty()) {
            continue;
        }
        if (!by_uuid.emplace(layers[id].uuid, id).second) {
            warn("Duplicate layer uuid " + layers[id].uuid + " on " + describe(layers[id]));
        }
    }

    for (auto& l : layers) {
        const auto* placeholder = std::get_if<clone_placeholder>(&l.payload);
        if (!placeholder) {
            continue;
        }

        const auto it = by_uuid.find(placeholder->target_uuid);
        if (it == by_uuid.end()) {
            return decode_result::failure(decode_error::unresolved_clone,
                describe(l) + " clones missing layer '" + placeholder->target_uuid + "'");
        }
        l.payload = clone_data{it->second};
    }

    for (layer_id id = 0; id < layers.size(); ++id) {
        std::unordered_set<layer_id> visited;
        layer_id current = id;
        while (const auto* c = layers[current].clone()) {
            if (!visited.insert(current).second) {
                return decode_result::failure(decode_error::clone_cycle,
                    describe(layers[id]) + " is part of a clone cycle");
            }
            current = c->target;
        }
    }

    return decode_result::success();
}

layer_id layer_tree_builder::add(layer&& l) {
    doc_.layers_.push_back(std::move(l));
    return doc_.layers_.size() - 1;
}

void layer_tree_builder::warn(std::string message) {
    doc_.warnings_.push_back(std::move(message));
}

std::string layer_tree_builder::layer_path(const std::string& filename) const {
    return doc_.name_ + "/layers/" + filename;
}

} // namespace kra_image
