#pragma once

#include <kra_image/container.hpp>
#include <kra_image/document.hpp>
#include <kra_image/layer.hpp>
#include <kra_image/types.hpp>
#include <kra_image/xml.hpp>

#include <optional>
#include <string>
#include <vector>

namespace kra_image {

// Builds a document's layer arena from the <layers> element of maindoc.xml,
// then replaces clone placeholders with resolved clones.
class layer_tree_builder {
public:
    layer_tree_builder(const container& source, document& doc, const decode_options& options)
        : source_(source), doc_(doc), options_(options) {}

    decode_result build(const xml_element& layers);
    decode_result resolve_clones();

private:
    decode_result build_list(const xml_element& list, std::vector<layer_id>& out);
    decode_result build_layer(const xml_element& elem, std::optional<layer_id>& out);
    decode_result build_masks(const xml_element& list, std::vector<layer_id>& out);

    decode_result load_paint_layer(const xml_element& elem, layer& l, bool& rejected);
    void load_mask_pixels(const xml_element& elem, layer& l);

    layer_id add(layer&& l);
    void warn(std::string message);
    [[nodiscard]] std::string layer_path(const std::string& filename) const;

    const container& source_;
    document& doc_;
    decode_options options_;
};

} // namespace kra_image
