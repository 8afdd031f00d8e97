#include "usync/metadata/manifest.hpp"

#include "usync/core/byte_buffer.hpp"
#include "usync/core/hash.hpp"

#include <gtest/gtest.h>
#include <zlib.h>

#include <algorithm>
#include <cctype>
#include <random>

using usync::ByteWriter;
using usync::ErrorCode;
using usync::metadata::build_manifest;
using usync::metadata::decode_manifest;
using usync::metadata::encode_manifest;
using usync::metadata::File;
using usync::metadata::ManifestFile;
using usync::metadata::ManifestFolder;
using usync::metadata::ManifestTree;

namespace {

File make_file(const std::string& path, std::uint64_t size, std::uint32_t segments, bool deleted = false) {
    File file;
    file.file_id = "id-" + path;
    file.folder_id = "docs";
    file.path = path;
    file.current_version = 1;
    file.current_size = size;
    file.current_hash = usync::hash::sha256_hex(path);
    file.modified_time = 1700000000;
    file.segment_count = segments;
    file.is_deleted = deleted;
    return file;
}

ManifestTree sample_tree() {
    return build_manifest("docs", 3, {
        make_file("readme.txt", 100000, 1),
        make_file("src/main.cpp", 700000, 1),
        make_file("src/lib/util.cpp", 2000000, 3),
        make_file("old.txt", 12, 1, true),
    });
}

std::vector<std::uint8_t> compress(const std::vector<std::uint8_t>& raw) {
    uLongf size = compressBound(static_cast<uLong>(raw.size()));
    std::vector<std::uint8_t> out(size);
    EXPECT_EQ(compress2(out.data(), &size, raw.data(), static_cast<uLong>(raw.size()), Z_BEST_COMPRESSION), Z_OK);
    out.resize(size);
    return out;
}

std::vector<std::uint8_t> raw_header(const char* magic, std::uint32_t folders, std::uint32_t files) {
    ByteWriter writer;
    writer.write_bytes(reinterpret_cast<const std::uint8_t*>(magic), 4);
    writer.write_uint16(usync::metadata::kManifestFormatVersion);
    writer.write_short_string("docs");
    writer.write_varint(1);
    writer.write_uint32(folders);
    writer.write_uint32(files);
    writer.write_uint64(0);
    writer.write_uint32(0);
    return writer.data();
}

} // namespace

TEST(ManifestTest, BuildSkipsDeletedFilesAndAddsAncestors) {
    const auto tree = sample_tree();

    ASSERT_EQ(tree.files.size(), 3u);
    EXPECT_EQ(tree.files[0].path, "readme.txt");
    EXPECT_EQ(tree.files[1].path, "src/lib/util.cpp");
    EXPECT_EQ(tree.files[2].path, "src/main.cpp");
    EXPECT_EQ(tree.total_size(), 2800000u);

    ASSERT_EQ(tree.folders.size(), 3u);
    EXPECT_EQ(tree.folders[0], (ManifestFolder{"", 1, 1}));
    EXPECT_EQ(tree.folders[1], (ManifestFolder{"src", 1, 1}));
    EXPECT_EQ(tree.folders[2], (ManifestFolder{"src/lib", 1, 0}));
}

TEST(ManifestTest, RoundTripPreservesTree) {
    const auto tree = sample_tree();
    auto blob = encode_manifest(tree);
    ASSERT_TRUE(blob.is_ok()) << blob.error().message;

    auto decoded = decode_manifest(blob.value());
    ASSERT_TRUE(decoded.is_ok()) << decoded.error().message;
    EXPECT_EQ(decoded.value().folder_id, "docs");
    EXPECT_EQ(decoded.value().folder_version, 3u);
    EXPECT_EQ(decoded.value(), tree);
    EXPECT_EQ(decoded.value().files[1].segment_count, 3u);
    EXPECT_EQ(decoded.value().files[1].hash, usync::hash::sha256_hex("src/lib/util.cpp"));
}

TEST(ManifestTest, EncodingIgnoresInputOrder) {
    auto tree = sample_tree();
    auto expected = encode_manifest(tree);
    ASSERT_TRUE(expected.is_ok());

    std::mt19937 rng(7);
    for (int round = 0; round < 5; ++round) {
        std::shuffle(tree.files.begin(), tree.files.end(), rng);
        std::shuffle(tree.folders.begin(), tree.folders.end(), rng);
        auto shuffled = encode_manifest(tree);
        ASSERT_TRUE(shuffled.is_ok());
        EXPECT_EQ(shuffled.value(), expected.value());
    }
}

TEST(ManifestTest, EmptyTreeRoundTrips) {
    const auto tree = build_manifest("empty", 1, {});
    auto blob = encode_manifest(tree);
    ASSERT_TRUE(blob.is_ok());
    auto decoded = decode_manifest(blob.value());
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_TRUE(decoded.value().files.empty());
    ASSERT_EQ(decoded.value().folders.size(), 1u);
    EXPECT_EQ(decoded.value().folders[0].path, "");
}

TEST(ManifestTest, RejectsInvalidTrees) {
    auto duplicate = sample_tree();
    duplicate.files.push_back(duplicate.files.front());
    auto result = encode_manifest(duplicate);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Validation);

    auto empty_path = sample_tree();
    empty_path.files.push_back(ManifestFile{"", 1, usync::hash::sha256_hex("x"), 0, 1});
    result = encode_manifest(empty_path);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Validation);

    auto empty_component = sample_tree();
    empty_component.files.push_back(ManifestFile{"a//b", 1, usync::hash::sha256_hex("x"), 0, 1});
    result = encode_manifest(empty_component);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Validation);

    auto bad_hash = sample_tree();
    bad_hash.files[0].hash = "not-a-hash";
    result = encode_manifest(bad_hash);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Validation);
}

TEST(ManifestTest, UppercaseHashIsRejected) {
    auto tree = sample_tree();
    auto upper = tree.files[0].hash;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    ASSERT_NE(upper, tree.files[0].hash);
    tree.files[0].hash = upper;

    auto result = encode_manifest(tree);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Validation);

    tree.files[0].hash = std::string(64, 'A');
    result = encode_manifest(tree);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Validation);
}

TEST(ManifestTest, CorruptCompressionIsFormatError) {
    const std::vector<std::uint8_t> garbage{0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07};
    auto decoded = decode_manifest(garbage);
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, ErrorCode::Format);
}

TEST(ManifestTest, TrailingBytesAreFormatError) {
    auto blob = encode_manifest(sample_tree());
    ASSERT_TRUE(blob.is_ok());
    blob.value().push_back(0x00);

    auto decoded = decode_manifest(blob.value());
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, ErrorCode::Format);
}

TEST(ManifestTest, BadMagicIsFormatError) {
    auto decoded = decode_manifest(compress(raw_header("NOPE", 0, 0)));
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, ErrorCode::Format);
}

TEST(ManifestTest, TruncatedBlobIsTruncationError) {
    auto blob = encode_manifest(sample_tree());
    ASSERT_TRUE(blob.is_ok());
    blob.value().resize(blob.value().size() / 2);

    auto decoded = decode_manifest(blob.value());
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, ErrorCode::Truncation);
}

TEST(ManifestTest, OversizedCountsAreTruncationError) {
    auto decoded = decode_manifest(compress(raw_header("USBI", 1000, 1000)));
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, ErrorCode::Truncation);
}

TEST(ManifestTest, CountsBeyond32BitsAreFormatError) {
    const std::uint64_t too_many = std::uint64_t{1} << 32;

    auto folder = raw_header("USBI", 1, 0);
    ByteWriter folder_record;
    folder_record.write_varint(0);          // root path
    folder_record.write_varint(too_many);   // files in folder
    folder_record.write_varint(0);
    folder.insert(folder.end(), folder_record.data().begin(), folder_record.data().end());

    auto decoded = decode_manifest(compress(folder));
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, ErrorCode::Format);

    auto file = raw_header("USBI", 0, 1);
    ByteWriter file_record;
    file_record.write_varint(0);
    file_record.write_varint(0);
    const std::vector<std::uint8_t> digest(32, 0xab);
    file_record.write_bytes(digest.data(), digest.size());
    file_record.write_varint(1700000000);
    file_record.write_varint(too_many + 3);  // segment count
    file.insert(file.end(), file_record.data().begin(), file_record.data().end());

    decoded = decode_manifest(compress(file));
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, ErrorCode::Format);
}
