#ifndef KRA_IMAGE_CONTAINER_HPP_
#define KRA_IMAGE_CONTAINER_HPP_

#include <kra_image/kra_image_export.h>
#include <kra_image/types.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kra_image {

// ============================================================================
// Container Interface
// ============================================================================

/**
 * Read access to the entries of a KRA/KRZ package.
 * Entry paths use '/' separators and are relative to the package root.
 */
class KRA_IMAGE_EXPORT container {
public:
    virtual ~container() = default;

    [[nodiscard]] virtual bool has_entry(std::string_view path) const = 0;

    /**
     * Read a whole entry.
     * @param path Entry path (e.g. "maindoc.xml")
     * @param data Receives the entry bytes
     * @return missing_entry if the entry does not exist
     */
    [[nodiscard]] virtual decode_result read_entry(std::string_view path,
                                                   std::vector<std::uint8_t>& data) const = 0;
};

// ============================================================================
// Memory Container
// ============================================================================

/**
 * Container backed by an in-memory entry map.
 * Useful for embedding and for building documents in tests.
 */
class KRA_IMAGE_EXPORT memory_container : public container {
public:
    memory_container() = default;
    ~memory_container() override = default;

    memory_container(const memory_container&) = delete;
    memory_container& operator=(const memory_container&) = delete;
    memory_container(memory_container&&) noexcept = default;
    memory_container& operator=(memory_container&&) noexcept = default;

    void add_entry(std::string path, std::vector<std::uint8_t> data);
    void add_entry(std::string path, std::string_view text);

    [[nodiscard]] bool has_entry(std::string_view path) const override;
    [[nodiscard]] decode_result read_entry(std::string_view path,
                                           std::vector<std::uint8_t>& data) const override;

    [[nodiscard]] std::size_t entry_count() const noexcept { return entries_.size(); }

private:
    std::map<std::string, std::vector<std::uint8_t>, std::less<>> entries_;
};

// ============================================================================
// ZIP Container
// ============================================================================

/**
 * Container reading a ZIP package through libarchive.
 * All regular entries are inflated once when the package is opened.
 */
class KRA_IMAGE_EXPORT zip_container : public memory_container {
public:
    /**
     * Open a package from disk.
     * @param path Path to a .kra or .krz file
     * @param out Receives the entries
     * @return io_error if the file is missing, invalid_format if it is not a ZIP
     */
    [[nodiscard]] static decode_result open(const std::filesystem::path& path, zip_container& out);

    /**
     * Open a package held in memory.
     * @param data Package bytes
     * @param out Receives the entries
     * @return invalid_format if the data is not a ZIP
     */
    [[nodiscard]] static decode_result open(std::span<const std::uint8_t> data, zip_container& out);
};

} // namespace kra_image

#endif // KRA_IMAGE_CONTAINER_HPP_
