#include "usync/sync/scanner.hpp"

#include "usync/core/hash.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using usync::ErrorCode;
using usync::sync::FolderScanner;

namespace {

fs::path create_temp_dir(const std::string& prefix) {
    auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    auto dir = base / fs::path(prefix + std::to_string(counter.fetch_add(1)));
    fs::create_directories(dir);
    return dir;
}

std::string write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    return content;
}

} // namespace

TEST(FolderScannerTest, TilesFilesAtSegmentBoundaries) {
    auto root = create_temp_dir("usync_scan_test");
    const auto content = write_file(root / "data.bin", std::string(25, 'x') + std::string(10, 'y'));
    write_file(root / "sub" / "small.txt", "hello");

    FolderScanner scanner(10, true, 2);
    auto result = scanner.scan(root);
    ASSERT_TRUE(result.is_ok()) << result.error().message;

    const auto& files = result.value().files;
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].path, "data.bin");
    EXPECT_EQ(files[1].path, "sub/small.txt");
    EXPECT_EQ(result.value().total_size, 40u);

    const auto& data = files[0];
    EXPECT_EQ(data.size, 35u);
    EXPECT_EQ(data.hash, usync::hash::sha256_hex(content));
    ASSERT_EQ(data.segments.size(), 4u);
    EXPECT_EQ(data.segments[3].index, 3u);
    EXPECT_EQ(data.segments[3].offset, 30u);
    EXPECT_EQ(data.segments[3].size, 5u);
    EXPECT_EQ(data.segments[0].hash, usync::hash::sha256_hex(std::string(10, 'x')));
    EXPECT_EQ(data.segments[2].hash, usync::hash::sha256_hex(std::string(5, 'x') + std::string(5, 'y')));

    ASSERT_EQ(files[1].segments.size(), 1u);
    EXPECT_EQ(files[1].segments[0].size, 5u);
}

TEST(FolderScannerTest, SkipsHiddenEntries) {
    auto root = create_temp_dir("usync_scan_hidden");
    write_file(root / "visible.txt", "a");
    write_file(root / ".secret", "b");
    write_file(root / ".git" / "config", "c");

    FolderScanner hiding(1024);
    auto hidden = hiding.scan(root);
    ASSERT_TRUE(hidden.is_ok());
    ASSERT_EQ(hidden.value().files.size(), 1u);
    EXPECT_EQ(hidden.value().files[0].path, "visible.txt");

    FolderScanner showing(1024, false);
    auto all = showing.scan(root);
    ASSERT_TRUE(all.is_ok());
    EXPECT_EQ(all.value().files.size(), 3u);
}

TEST(FolderScannerTest, EmptyFileHasNoSegments) {
    auto root = create_temp_dir("usync_scan_empty");
    write_file(root / "empty.txt", "");

    auto result = FolderScanner(1024).scan(root);
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().files.size(), 1u);
    EXPECT_EQ(result.value().files[0].size, 0u);
    EXPECT_TRUE(result.value().files[0].segments.empty());
    EXPECT_EQ(result.value().files[0].hash, usync::hash::sha256_hex(""));
}

TEST(FolderScannerTest, MissingRootIsIoError) {
    auto result = FolderScanner(1024).scan(fs::temp_directory_path() / "usync_scan_does_not_exist");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Io);
}
