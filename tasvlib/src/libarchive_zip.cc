#include <archive.h>
#include <archive_entry.h>
#include <string>
#include <tasvlib/defer.hh>
#include <tasvlib/libarchive_zip.hh>
#include <tasvlib/macros/throw.hh>

using std::string;
using std::string_view;

void read_entry_data(struct archive* in, string& out, size_t max_size) {
    constexpr size_t BUFF_SIZE = 1 << 16;
    char buff[BUFF_SIZE];
    for (;;) {
        auto rr = archive_read_data(in, buff, BUFF_SIZE);
        if (rr == 0) {
            return;
        }
        if (rr < 0) {
            THROW("archive_read_data() - ", archive_error_string(in));
        }
        if (out.size() + static_cast<size_t>(rr) > max_size) {
            throw DecompressionLimitExceeded{concat_tostr(
                "decompressed data exceeds the limit of ", max_size, " bytes"
            )};
        }
        out.append(buff, static_cast<size_t>(rr));
    }
}

string gunzip(string_view data, size_t max_size) {
    throw_assert(has_gzip_magic(data));
    string res;
    skim_archive(
        data,
        [](struct archive* in) {
            archive_read_support_filter_gzip(in);
            archive_read_support_format_raw(in);
        },
        [&](struct archive* in, struct archive_entry* /*entry*/) {
            read_entry_data(in, res, max_size);
            return false; // raw format has exactly one entry
        }
    );
    return res;
}

size_t zip_decompressed_size(string_view zip, size_t max_size) {
    size_t total = 0;
    string buff;
    skim_archive(zip, archive_read_support_format_zip, [&](struct archive* in, auto* /*entry*/) {
        buff.clear();
        read_entry_data(in, buff, max_size - total);
        total += buff.size();
    });
    return total;
}

namespace {

// Writes an archive set up by @p setup_archive into a string, @p write_entries is called with
// the write handle to add entries
template <class SetupFunc, class WriteFunc>
string write_archive_to_memory(SetupFunc&& setup_archive, WriteFunc&& write_entries) {
    string res;
    struct archive* out = archive_write_new();
    throw_assert(out);
    Defer out_guard([&]() noexcept { archive_write_free(out); });

    setup_archive(out);
    if (archive_write_set_bytes_per_block(out, 0)) {
        THROW("archive_write_set_bytes_per_block() - ", archive_error_string(out));
    }
    auto writer = [](struct archive* /*a*/, void* client_data, const void* buff, size_t len) {
        static_cast<string*>(client_data)->append(static_cast<const char*>(buff), len);
        return static_cast<la_ssize_t>(len);
    };
    if (archive_write_open(out, &res, nullptr, writer, nullptr)) {
        THROW("archive_write_open() - ", archive_error_string(out));
    }

    write_entries(out);

    if (archive_write_close(out)) {
        THROW("archive_write_close() - ", archive_error_string(out));
    }
    return res;
}

void write_file_entry(struct archive* out, string_view filename, string_view data) {
    struct archive_entry* entry = archive_entry_new();
    throw_assert(entry);
    Defer entry_guard([&]() noexcept { archive_entry_free(entry); });

    archive_entry_set_pathname(entry, string{filename}.c_str());
    archive_entry_set_size(entry, static_cast<la_int64_t>(data.size()));
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, 0644);
    if (archive_write_header(out, entry)) {
        THROW("archive_write_header() - ", archive_error_string(out));
    }
    if (!data.empty() and archive_write_data(out, data.data(), data.size()) < 0) {
        THROW("archive_write_data() - ", archive_error_string(out));
    }
    if (archive_write_finish_entry(out)) {
        THROW("archive_write_finish_entry() - ", archive_error_string(out));
    }
}

} // namespace

string gzip(string_view data) {
    return write_archive_to_memory(
        [](struct archive* out) {
            archive_write_set_format_raw(out);
            archive_write_add_filter_gzip(out);
        },
        [&](struct archive* out) { write_file_entry(out, "data", data); }
    );
}

string zip_single_file(string_view filename, string_view data) {
    return write_archive_to_memory(
        archive_write_set_format_zip,
        [&](struct archive* out) { write_file_entry(out, filename, data); }
    );
}
