// libxml2-based reader for maindoc.xml

#include <kra_image/xml.hpp>
#include "byte_cursor.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include <cstddef>
#include <limits>
#include <memory>

namespace kra_image {

namespace {

// Krita nests groups inside groups; anything deeper than this is hostile input
constexpr int MAX_ELEMENT_DEPTH = 256;

using xml_doc_ptr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;

std::string to_std_string(const xmlChar* text) {
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

bool convert_element(xmlDocPtr doc, xmlNodePtr node, xml_element& out, int depth) {
    if (depth > MAX_ELEMENT_DEPTH) {
        return false;
    }

    out.name = to_std_string(node->name);

    for (xmlAttrPtr attr = node->properties; attr; attr = attr->next) {
        xmlChar* value = xmlNodeListGetString(doc, attr->children, 1);
        out.attributes.emplace_back(to_std_string(attr->name), to_std_string(value));
        if (value) {
            xmlFree(value);
        }
    }

    for (xmlNodePtr child = node->children; child; child = child->next) {
        if (child->type != XML_ELEMENT_NODE) {
            continue;
        }
        out.children.emplace_back();
        if (!convert_element(doc, child, out.children.back(), depth + 1)) {
            return false;
        }
    }

    return true;
}

} // namespace

const std::string* xml_element::find_attribute(std::string_view key) const noexcept {
    for (const auto& [k, v] : attributes) {
        if (k == key) {
            return &v;
        }
    }
    return nullptr;
}

std::string xml_element::attribute(std::string_view key, std::string_view fallback) const {
    const auto* value = find_attribute(key);
    return value ? *value : std::string(fallback);
}

int xml_element::int_attribute(std::string_view key, int fallback) const noexcept {
    const auto* value = find_attribute(key);
    int result = 0;
    if (!value || !parse_int(*value, result)) {
        return fallback;
    }
    return result;
}

double xml_element::double_attribute(std::string_view key, double fallback) const noexcept {
    const auto* value = find_attribute(key);
    double result = 0.0;
    if (!value || !parse_double(*value, result)) {
        return fallback;
    }
    return result;
}

bool xml_element::bool_attribute(std::string_view key, bool fallback) const noexcept {
    return int_attribute(key, fallback ? 1 : 0) != 0;
}

const xml_element* xml_element::child(std::string_view tag) const noexcept {
    for (const auto& c : children) {
        if (c.name == tag) {
            return &c;
        }
    }
    return nullptr;
}

decode_result parse_xml(std::span<const std::uint8_t> data, xml_element& root) {
    if (data.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return decode_result::failure(decode_error::invalid_format, "XML document too large");
    }

    xml_doc_ptr doc(xmlReadMemory(reinterpret_cast<const char*>(data.data()),
                                  static_cast<int>(data.size()),
                                  "maindoc.xml", nullptr,
                                  XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING),
                    xmlFreeDoc);
    if (!doc) {
        const xmlError* err = xmlGetLastError();
        std::string msg = "Malformed XML";
        if (err && err->message) {
            msg += ": ";
            msg += err->message;
            while (!msg.empty() && msg.back() == '\n') {
                msg.pop_back();
            }
        }
        return decode_result::failure(decode_error::invalid_format, std::move(msg));
    }

    xmlNodePtr node = xmlDocGetRootElement(doc.get());
    if (!node) {
        return decode_result::failure(decode_error::invalid_format, "XML document has no root element");
    }

    xml_element result;
    if (!convert_element(doc.get(), node, result, 0)) {
        return decode_result::failure(decode_error::invalid_format, "XML elements nested too deeply");
    }

    root = std::move(result);
    return decode_result::success();
}

} // namespace kra_image
