#include <kra_image/document.hpp>
#include <kra_image/png.hpp>
#include <kra_image/xml.hpp>
#include "decode_helpers.hpp"
#include "layer_tree.hpp"

#include <string>
#include <utility>

namespace kra_image {

namespace {

constexpr std::string_view MIMETYPE_ENTRY = "mimetype";
constexpr std::string_view MAINDOC_ENTRY = "maindoc.xml";
constexpr std::string_view MERGED_IMAGE_ENTRY = "mergedimage.png";
constexpr std::string_view PREVIEW_ENTRY = "preview.png";
constexpr std::string_view IMAGE_TAG = "IMAGE";
constexpr std::string_view LAYERS_TAG = "layers";

constexpr double DEFAULT_RESOLUTION = 72.0;

decode_result read_png_entry(const container& source, std::string_view entry, surface& surf) {
    std::vector<std::uint8_t> data;
    auto result = source.read_entry(entry, data);
    if (!result) return result;

    return png_decoder::decode(data, surf);
}

} // namespace

// ============================================================================
// Opening
// ============================================================================

decode_result document::open(const std::filesystem::path& path,
                             document& doc,
                             const decode_options& options) {
    zip_container source;
    auto result = zip_container::open(path, source);
    if (!result) return result;

    return open(source, doc, options);
}

decode_result document::open(const container& source,
                             document& doc,
                             const decode_options& options) {
    std::vector<std::uint8_t> data;

    if (!source.has_entry(MIMETYPE_ENTRY)) {
        return decode_result::failure(decode_error::missing_entry, "Package has no mimetype entry");
    }
    auto result = source.read_entry(MIMETYPE_ENTRY, data);
    if (!result) return result;

    const std::string_view mime(reinterpret_cast<const char*>(data.data()), data.size());
    if (mime != mimetype) {
        return decode_result::failure(decode_error::invalid_format,
            "Unexpected mimetype '" + std::string(mime) + "'");
    }

    if (!source.has_entry(MAINDOC_ENTRY)) {
        return decode_result::failure(decode_error::missing_entry, "Package has no maindoc.xml");
    }
    result = source.read_entry(MAINDOC_ENTRY, data);
    if (!result) return result;

    xml_element root;
    result = parse_xml(data, root);
    if (!result) return result;

    const auto* image = root.name == IMAGE_TAG ? &root : root.child(IMAGE_TAG);
    if (!image) {
        return decode_result::failure(decode_error::invalid_format, "maindoc.xml has no IMAGE element");
    }

    document built;
    built.name_ = image->attribute("name");
    built.width_ = image->int_attribute("width", 0);
    built.height_ = image->int_attribute("height", 0);
    if (built.width_ <= 0 || built.height_ <= 0) {
        return decode_result::failure(decode_error::invalid_format,
            "Invalid image dimensions " + std::to_string(built.width_) + "x" +
            std::to_string(built.height_));
    }

    result = validate_dimensions(built.width_, built.height_, options);
    if (!result) return result;

    const std::string color_space = image->attribute("colorspacename");
    const auto mode = parse_color_mode(color_space);
    if (!mode) {
        return decode_result::failure(decode_error::unsupported_color_mode,
            "Unsupported color space '" + color_space + "'");
    }
    built.mode_ = *mode;

    built.x_res_ = image->double_attribute("x-res", DEFAULT_RESOLUTION);
    built.y_res_ = image->double_attribute("y-res", DEFAULT_RESOLUTION);

    layer_tree_builder builder(source, built, options);
    if (const auto* layers = image->child(LAYERS_TAG)) {
        result = builder.build(*layers);
        if (!result) return result;
    }

    result = builder.resolve_clones();
    if (!result) return result;

    doc = std::move(built);
    return decode_result::success();
}

decode_result document::read_merged_image(const container& source, surface& surf) {
    return read_png_entry(source, MERGED_IMAGE_ENTRY, surf);
}

decode_result document::read_preview(const container& source, surface& surf) {
    return read_png_entry(source, PREVIEW_ENTRY, surf);
}

// ============================================================================
// Queries
// ============================================================================

std::span<const layer_id> document::children(layer_id id) const {
    if (const auto* group = layer_at(id).group()) {
        return group->children;
    }
    return {};
}

layer_id document::find_in(std::span<const layer_id> ids, std::string_view uuid) const {
    for (const auto id : ids) {
        const auto& l = layers_[id];
        if (l.uuid == uuid) {
            return id;
        }

        auto found = find_in(l.masks, uuid);
        if (found != invalid_layer) {
            return found;
        }

        if (const auto* group = l.group()) {
            found = find_in(group->children, uuid);
            if (found != invalid_layer) {
                return found;
            }
        }
    }
    return invalid_layer;
}

layer_id document::find_layer_id(std::string_view uuid) const {
    return find_in(roots_, uuid);
}

const layer* document::find_layer(std::string_view uuid) const {
    const auto id = find_layer_id(uuid);
    return id == invalid_layer ? nullptr : &layers_[id];
}

layer_id document::clone_source(layer_id id) const {
    // open() rejects clone cycles, so the chain ends
    layer_id current = id;
    while (const auto* c = layer_at(current).clone()) {
        current = c->target;
    }
    return current;
}

bool document::is_useful(layer_id id) const {
    const auto& l = layer_at(id);
    switch (l.kind) {
        case layer_kind::group_layer:
            return true;
        case layer_kind::selection_mask:
            return false;
        case layer_kind::clone_layer:
            return is_useful(clone_source(id));
        default:
            return !l.bounds.empty();
    }
}

} // namespace kra_image
