#include <kra_image/types.hpp>

namespace kra_image {

const char* to_string(decode_error err) noexcept {
    switch (err) {
        case decode_error::none:                   return "none";
        case decode_error::invalid_format:         return "invalid_format";
        case decode_error::missing_entry:          return "missing_entry";
        case decode_error::unsupported_color_mode: return "unsupported_color_mode";
        case decode_error::dimensions_exceeded:    return "dimensions_exceeded";
        case decode_error::truncated_data:         return "truncated_data";
        case decode_error::overflow:               return "overflow";
        case decode_error::invalid_reference:      return "invalid_reference";
        case decode_error::corrupt_tile:           return "corrupt_tile";
        case decode_error::unresolved_clone:       return "unresolved_clone";
        case decode_error::clone_cycle:            return "clone_cycle";
        case decode_error::not_raster:             return "not_raster";
        case decode_error::empty_layer:            return "empty_layer";
        case decode_error::io_error:               return "io_error";
        case decode_error::internal_error:         return "internal_error";
    }
    return "unknown";
}

std::optional<color_mode> parse_color_mode(std::string_view name) noexcept {
    if (name == "RGBA") {
        return color_mode::rgba8;
    }
    if (name == "RGBA16") {
        return color_mode::rgba16;
    }
    return std::nullopt;
}

const char* to_string(color_mode mode) noexcept {
    switch (mode) {
        case color_mode::rgba8:  return "RGBA";
        case color_mode::rgba16: return "RGBA16";
    }
    return "unknown";
}

} // namespace kra_image
