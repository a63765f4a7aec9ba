#pragma once

#include <archive.h>
#include <archive_entry.h>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tasvlib/defer.hh>
#include <tasvlib/macros/throw.hh>
#include <type_traits>

// Thrown when the data would decompress to more bytes than the allowed ceiling
class DecompressionLimitExceeded : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Runs @p entry_callback on every entry of the in-memory archive @p data
 *
 * @param data contents of the archive
 * @param setup_archive function to run before reading the archive, should take
 *   archive* as the argument, most useful to set the accepted archive formats
 * @param entry_callback function to call on every entry, should take two
 *   arguments - archive* and archive_entry*, if it return sth convertible to
 *   false the lookup will break
 */
template <class Func, class EntryFunc>
void skim_archive(std::string_view data, Func&& setup_archive, EntryFunc&& entry_callback) {
    struct archive* in = archive_read_new();
    throw_assert(in);
    Defer in_guard([&]() noexcept { archive_read_free(in); });

    setup_archive(in);

    if (archive_read_open_memory(in, data.data(), data.size())) {
        THROW("archive_read_open_memory() - ", archive_error_string(in));
    }

    for (;;) {
        struct archive_entry* entry = nullptr;
        int r = archive_read_next_header(in, &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r) {
            THROW("archive_read_next_header() - ", archive_error_string(in));
        }

        if constexpr (std::is_convertible_v<decltype(entry_callback(in, entry)), bool>) {
            if (not entry_callback(in, entry)) {
                break;
            }
        } else {
            entry_callback(in, entry);
        }
    }
}

// Appends the data of the current entry of @p in to @p out, throws DecompressionLimitExceeded
// once more than @p max_size bytes in total would be appended
void read_entry_data(struct archive* in, std::string& out, size_t max_size);

inline bool has_gzip_magic(std::string_view data) noexcept {
    return data.size() >= 2 and data[0] == '\x1f' and data[1] == '\x8b';
}

inline bool has_zip_magic(std::string_view data) noexcept {
    return data.size() >= 4 and data.substr(0, 4) == std::string_view{"PK\x03\x04", 4};
}

// Decompresses gzip-compressed @p data. Throws DecompressionLimitExceeded if the result would
// exceed @p max_size and std::runtime_error if @p data is not valid gzip stream
std::string gunzip(std::string_view data, size_t max_size);

std::string gzip(std::string_view data);

// Returns the total number of decompressed bytes of all entries of zip archive @p zip. The
// entries are really decompressed, the sizes declared in headers are not trusted. Throws
// DecompressionLimitExceeded as soon as the total exceeds @p max_size
size_t zip_decompressed_size(std::string_view zip, size_t max_size);

// Returns zip archive containing exactly one file @p filename with contents @p data
std::string zip_single_file(std::string_view filename, std::string_view data);
