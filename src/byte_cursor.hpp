#pragma once

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <system_error>

namespace kra_image {

// Bounds-checked forward cursor over a byte buffer.
// Every read either succeeds completely or leaves the cursor untouched.
class byte_cursor {
public:
    explicit byte_cursor(std::span<const std::uint8_t> data) noexcept
        : data_(data) {}

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - pos_; }
    [[nodiscard]] bool at_end() const noexcept { return pos_ >= data_.size(); }

    // Read up to the next '\n'; the terminator is consumed but not returned
    [[nodiscard]] bool read_line(std::string_view& line) noexcept {
        for (std::size_t i = pos_; i < data_.size(); ++i) {
            if (data_[i] == '\n') {
                line = std::string_view(reinterpret_cast<const char*>(data_.data() + pos_), i - pos_);
                pos_ = i + 1;
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] bool read_bytes(std::size_t count, std::span<const std::uint8_t>& out) noexcept {
        if (count > remaining()) {
            return false;
        }
        out = data_.subspan(pos_, count);
        pos_ += count;
        return true;
    }

private:
    std::span<const std::uint8_t> data_;
    std::size_t pos_ = 0;
};

// Parse a whole decimal field; rejects empty input and trailing characters
inline bool parse_int(std::string_view text, int& value) noexcept {
    if (text.empty()) {
        return false;
    }
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (*first == '+') {
        ++first;
        if (first == last || *first == '-') {
            return false;
        }
    }
    auto [ptr, ec] = std::from_chars(first, last, value);
    return ec == std::errc() && ptr == last;
}

// Whole-field decimal number, independent of the C locale
inline bool parse_double(std::string_view text, double& value) noexcept {
    if (text.empty()) {
        return false;
    }
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (*first == '+') {
        ++first;
        if (first == last || *first == '-') {
            return false;
        }
    }
    auto [ptr, ec] = std::from_chars(first, last, value, std::chars_format::general);
    return ec == std::errc() && ptr == last;
}

} // namespace kra_image
