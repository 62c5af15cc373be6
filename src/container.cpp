#include <kra_image/container.hpp>

namespace kra_image {

void memory_container::add_entry(std::string path, std::vector<std::uint8_t> data) {
    entries_.insert_or_assign(std::move(path), std::move(data));
}

void memory_container::add_entry(std::string path, std::string_view text) {
    add_entry(std::move(path), std::vector<std::uint8_t>(text.begin(), text.end()));
}

bool memory_container::has_entry(std::string_view path) const {
    return entries_.find(path) != entries_.end();
}

decode_result memory_container::read_entry(std::string_view path,
                                           std::vector<std::uint8_t>& data) const {
    const auto it = entries_.find(path);
    if (it == entries_.end()) {
        return decode_result::failure(decode_error::missing_entry,
            "Entry not found: " + std::string(path));
    }
    data = it->second;
    return decode_result::success();
}

} // namespace kra_image
