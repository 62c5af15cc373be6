// libarchive-based reader for KRA/KRZ packages

#include <kra_image/container.hpp>

#include <archive.h>
#include <archive_entry.h>

#include <memory>
#include <string>
#include <system_error>

namespace kra_image {

namespace {

constexpr std::size_t READ_BLOCK_SIZE = 64 * 1024;

using archive_ptr = std::unique_ptr<::archive, decltype(&archive_read_free)>;

archive_ptr new_zip_reader() {
    archive_ptr reader(archive_read_new(), archive_read_free);
    if (reader) {
        archive_read_support_format_zip(reader.get());
    }
    return reader;
}

std::string archive_message(::archive* reader) {
    const char* msg = archive_error_string(reader);
    return msg ? std::string(msg) : std::string("unknown libarchive error");
}

// Inflate every regular entry of an opened reader into the container
decode_result read_all_entries(::archive* reader, zip_container& out) {
    ::archive_entry* entry = nullptr;
    std::vector<std::uint8_t> block(READ_BLOCK_SIZE);

    int status = ARCHIVE_OK;
    while ((status = archive_read_next_header(reader, &entry)) == ARCHIVE_OK) {
        const char* name = archive_entry_pathname(entry);
        if (!name || archive_entry_filetype(entry) != AE_IFREG) {
            if (archive_read_data_skip(reader) != ARCHIVE_OK) {
                return decode_result::failure(decode_error::io_error, archive_message(reader));
            }
            continue;
        }

        std::vector<std::uint8_t> data;
        if (archive_entry_size_is_set(entry) && archive_entry_size(entry) > 0) {
            data.reserve(static_cast<std::size_t>(archive_entry_size(entry)));
        }

        la_ssize_t n = 0;
        while ((n = archive_read_data(reader, block.data(), block.size())) > 0) {
            data.insert(data.end(), block.begin(), block.begin() + n);
        }
        if (n < 0) {
            return decode_result::failure(decode_error::io_error,
                std::string("Failed to read entry ") + name + ": " + archive_message(reader));
        }

        out.add_entry(name, std::move(data));
    }

    if (status != ARCHIVE_EOF) {
        return decode_result::failure(decode_error::invalid_format, archive_message(reader));
    }

    return decode_result::success();
}

} // namespace

decode_result zip_container::open(const std::filesystem::path& path, zip_container& out) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return decode_result::failure(decode_error::io_error,
            "File not found: " + path.string());
    }

    archive_ptr reader = new_zip_reader();
    if (!reader) {
        return decode_result::failure(decode_error::internal_error, "Failed to create archive reader");
    }

    if (archive_read_open_filename(reader.get(), path.string().c_str(), READ_BLOCK_SIZE) != ARCHIVE_OK) {
        return decode_result::failure(decode_error::invalid_format,
            "Not a ZIP package: " + path.string() + ": " + archive_message(reader.get()));
    }

    return read_all_entries(reader.get(), out);
}

decode_result zip_container::open(std::span<const std::uint8_t> data, zip_container& out) {
    archive_ptr reader = new_zip_reader();
    if (!reader) {
        return decode_result::failure(decode_error::internal_error, "Failed to create archive reader");
    }

    if (archive_read_open_memory(reader.get(), data.data(), data.size()) != ARCHIVE_OK) {
        return decode_result::failure(decode_error::invalid_format,
            "Not a ZIP package: " + archive_message(reader.get()));
    }

    return read_all_entries(reader.get(), out);
}

} // namespace kra_image
