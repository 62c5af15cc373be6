#ifndef KRA_IMAGE_DOCUMENT_HPP_
#define KRA_IMAGE_DOCUMENT_HPP_

#include <kra_image/kra_image_export.h>
#include <kra_image/types.hpp>
#include <kra_image/container.hpp>
#include <kra_image/layer.hpp>
#include <kra_image/surface.hpp>

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kra_image {

// ============================================================================
// Document
// ============================================================================

/**
 * A decoded Krita document: image attributes and the layer forest.
 *
 * Layers are stored in an arena and addressed by layer_id. After open()
 * returns the document is immutable, every clone refers to its target by id
 * and no clone placeholder remains.
 */
class KRA_IMAGE_EXPORT document {
public:
    static constexpr std::string_view mimetype = "application/x-krita";

    document() = default;

    document(const document&) = delete;
    document& operator=(const document&) = delete;
    document(document&&) noexcept = default;
    document& operator=(document&&) noexcept = default;

    /**
     * Open a .kra/.krz file.
     * @param path Package path
     * @param doc Receives the document
     * @param options Decode options
     * @return Decode result with success/error status
     */
    [[nodiscard]] static decode_result open(const std::filesystem::path& path,
                                            document& doc,
                                            const decode_options& options = {});

    /**
     * Open a document from an already opened container.
     * Validates the mimetype entry, parses maindoc.xml, builds the layer
     * forest and resolves clone layers.
     * @param source Package entries
     * @param doc Receives the document
     * @param options Decode options
     * @return Decode result with success/error status
     */
    [[nodiscard]] static decode_result open(const container& source,
                                            document& doc,
                                            const decode_options& options = {});

    /**
     * Decode the flattened composite stored in mergedimage.png.
     * @param source Package entries
     * @param surf Destination surface (RGBA8)
     * @return missing_entry if the package carries no merged image
     */
    [[nodiscard]] static decode_result read_merged_image(const container& source, surface& surf);

    /**
     * Decode the thumbnail stored in preview.png.
     * @param source Package entries
     * @param surf Destination surface (RGBA8)
     * @return missing_entry if the package carries no preview
     */
    [[nodiscard]] static decode_result read_preview(const container& source, surface& surf);

    // Image attributes
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] color_mode mode() const noexcept { return mode_; }
    [[nodiscard]] double x_resolution() const noexcept { return x_res_; }
    [[nodiscard]] double y_resolution() const noexcept { return y_res_; }

    // Layer tree
    [[nodiscard]] std::span<const layer_id> roots() const noexcept { return roots_; }
    [[nodiscard]] std::size_t layer_count() const noexcept { return layers_.size(); }
    [[nodiscard]] const layer& layer_at(layer_id id) const { return layers_.at(id); }

    // Children of a group layer (empty for other kinds)
    [[nodiscard]] std::span<const layer_id> children(layer_id id) const;

    /**
     * Depth-first search over the forest, masks and group children included.
     * @return Layer with the given UUID, or nullptr
     */
    [[nodiscard]] const layer* find_layer(std::string_view uuid) const;
    [[nodiscard]] layer_id find_layer_id(std::string_view uuid) const;

    /**
     * Whether a layer contributes renderable content.
     * Groups always do, selection masks never do, clones follow their target,
     * every other kind needs a non-empty extent.
     */
    [[nodiscard]] bool is_useful(layer_id id) const;

    /**
     * Follow a chain of clones to the first layer that is not a clone.
     * @return The layer itself when it is not a clone
     */
    [[nodiscard]] layer_id clone_source(layer_id id) const;

    // Non-fatal problems met while opening (skipped layers, unknown nodes)
    [[nodiscard]] std::span<const std::string> warnings() const noexcept { return warnings_; }

private:
    friend class layer_tree_builder;

    layer_id find_in(std::span<const layer_id> ids, std::string_view uuid) const;

    std::string name_;
    int width_ = 0;
    int height_ = 0;
    color_mode mode_ = color_mode::rgba8;
    double x_res_ = 72.0;
    double y_res_ = 72.0;

    std::vector<layer> layers_;
    std::vector<layer_id> roots_;
    std::vector<std::string> warnings_;
};

} // namespace kra_image

#endif // KRA_IMAGE_DOCUMENT_HPP_
