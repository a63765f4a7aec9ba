#include <gtest/gtest.h>
#include <string>
#include <tasvlib/libarchive_zip.hh>

using std::string;

// NOLINTNEXTLINE
TEST(libarchive_zip, gzip_gunzip) {
    string data(100'000, 'a');
    auto compressed = gzip(data);
    EXPECT_TRUE(has_gzip_magic(compressed));
    EXPECT_LT(compressed.size(), data.size());
    EXPECT_EQ(gunzip(compressed, data.size()), data);
}

// NOLINTNEXTLINE
TEST(libarchive_zip, gunzip_respects_ceiling) {
    auto compressed = gzip(string(1 << 20, '\0'));
    EXPECT_THROW(gunzip(compressed, 1000), DecompressionLimitExceeded);
}

// NOLINTNEXTLINE
TEST(libarchive_zip, gunzip_of_corrupted_stream_throws) {
    auto compressed = gzip(string(10'000, 'q'));
    compressed.resize(compressed.size() / 2);
    EXPECT_THROW(gunzip(compressed, 1 << 20), std::runtime_error);
}

// NOLINTNEXTLINE
TEST(libarchive_zip, zip_single_file) {
    auto zip = zip_single_file("movie.bk2", "contents");
    EXPECT_TRUE(has_zip_magic(zip));

    std::vector<string> names;
    string contents;
    skim_archive(zip, archive_read_support_format_zip, [&](struct archive* in, auto* entry) {
        names.emplace_back(archive_entry_pathname(entry));
        read_entry_data(in, contents, 1000);
    });
    EXPECT_EQ(names, std::vector<string>{"movie.bk2"});
    EXPECT_EQ(contents, "contents");
    EXPECT_EQ(zip_decompressed_size(zip, 1000), 8);
}

// NOLINTNEXTLINE
TEST(libarchive_zip, zip_decompressed_size_respects_ceiling) {
    auto zip = zip_single_file("bomb", string(1 << 20, 'x'));
    EXPECT_THROW(zip_decompressed_size(zip, 1 << 10), DecompressionLimitExceeded);
}

// NOLINTNEXTLINE
TEST(libarchive_zip, magic) {
    EXPECT_FALSE(has_gzip_magic("\x1f"));
    EXPECT_FALSE(has_zip_magic("PK"));
    EXPECT_TRUE(has_zip_magic(std::string_view{"PK\x03\x04rest"}));
}
