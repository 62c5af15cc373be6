#ifndef KRA_IMAGE_XML_HPP_
#define KRA_IMAGE_XML_HPP_

#include <kra_image/kra_image_export.h>
#include <kra_image/types.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kra_image {

// ============================================================================
// XML Element Tree
// ============================================================================

/**
 * Element of a parsed XML document: tag name, attributes and child elements
 * in document order. Text content is not kept.
 */
struct KRA_IMAGE_EXPORT xml_element {
    std::string name;
    std::vector<std::pair<std::string, std::string>> attributes;
    std::vector<xml_element> children;

    [[nodiscard]] const std::string* find_attribute(std::string_view key) const noexcept;

    // Attribute getters fall back to the default when the attribute is
    // missing or does not parse as the requested type.
    [[nodiscard]] std::string attribute(std::string_view key, std::string_view fallback = {}) const;
    [[nodiscard]] int int_attribute(std::string_view key, int fallback) const noexcept;
    [[nodiscard]] double double_attribute(std::string_view key, double fallback) const noexcept;
    [[nodiscard]] bool bool_attribute(std::string_view key, bool fallback) const noexcept;

    // First child element with the given tag name, or nullptr
    [[nodiscard]] const xml_element* child(std::string_view tag) const noexcept;
};

/**
 * Parse an XML document with libxml2.
 * Network access and external entities are disabled.
 * @param data Document bytes
 * @param root Receives the root element
 * @return invalid_format if the document is not well-formed
 */
[[nodiscard]] KRA_IMAGE_EXPORT decode_result parse_xml(std::span<const std::uint8_t> data,
                                                       xml_element& root);

} // namespace kra_image

#endif // KRA_IMAGE_XML_HPP_
