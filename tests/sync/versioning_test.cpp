#include "usync/sync/versioning.hpp"

#include "usync/events/events.hpp"
#include "usync/metadata/memory_store.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using usync::ErrorCode;
using usync::metadata::ChangeType;
using usync::metadata::MemoryRecordStore;
using usync::metadata::Segment;
using namespace usync::sync;

namespace {

fs::path create_temp_dir(const std::string& prefix) {
    auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    auto dir = base / fs::path(prefix + std::to_string(counter.fetch_add(1)));
    fs::create_directories(dir);
    return dir;
}

void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

usync::config::SyncConfig small_segments(std::uint32_t redundancy = 0) {
    usync::config::SyncConfig config;
    config.segment_size = 10;
    config.redundancy_copies = redundancy;
    config.worker_threads = 2;
    return config;
}

class VersioningEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir("usync_versioning_test");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    std::vector<Segment> segments_of(const std::string& path) {
        auto all = store_.list_segments("docs", make_file_id("docs", path));
        EXPECT_TRUE(all.is_ok());
        return all.value();
    }

    usync::metadata::FileVersion latest_version_of(const std::string& path) {
        auto versions = store_.list_file_versions("docs", make_file_id("docs", path));
        EXPECT_TRUE(versions.is_ok());
        EXPECT_FALSE(versions.value().empty());
        return *std::max_element(versions.value().begin(), versions.value().end(),
                                 [](const auto& lhs, const auto& rhs) { return lhs.version < rhs.version; });
    }

    fs::path root_;
    MemoryRecordStore store_;
};

} // namespace

TEST_F(VersioningEngineTest, FirstIndexRecordsEverything) {
    write_file(root_ / "a.txt", std::string(25, 'a'));
    write_file(root_ / "sub" / "b.txt", "bbb");
    write_file(root_ / "empty.txt", "");

    VersioningEngine engine(store_, small_segments());
    ASSERT_TRUE(engine.create_folder("docs", "Docs", root_.string()).is_ok());

    auto result = engine.index_folder("docs");
    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_TRUE(result.value().changed);
    EXPECT_EQ(result.value().version, 1u);
    EXPECT_EQ(result.value().changes.added, 3u);
    EXPECT_EQ(result.value().new_segments, 4u);
    EXPECT_EQ(result.value().scheduled_bytes, 28u);

    auto header = store_.get_folder_version("docs", 1);
    ASSERT_TRUE(header.is_ok());
    EXPECT_EQ(header.value().file_count, 3u);
    EXPECT_EQ(header.value().total_size, 28u);
    EXPECT_EQ(store_.list_unuploaded_segments("docs").value().size(), 4u);
}

TEST_F(VersioningEngineTest, UnchangedFolderProducesNoVersion) {
    write_file(root_ / "a.txt", std::string(25, 'a'));
    VersioningEngine engine(store_, small_segments());
    ASSERT_TRUE(engine.create_folder("docs", "Docs", root_.string()).is_ok());
    ASSERT_TRUE(engine.index_folder("docs").is_ok());

    auto again = engine.index_folder("docs");
    ASSERT_TRUE(again.is_ok());
    EXPECT_FALSE(again.value().changed);
    EXPECT_EQ(again.value().version, 1u);
    EXPECT_EQ(again.value().changes.total(), 0u);
    EXPECT_EQ(again.value().new_segments, 0u);
    EXPECT_EQ(store_.get_folder("docs").value().current_version, 1u);
}

TEST_F(VersioningEngineTest, EditingLastSegmentKeepsEarlierLocators) {
    write_file(root_ / "big.bin", std::string(10, 'x') + std::string(10, 'y') + std::string(10, 'z'));
    VersioningEngine engine(store_, small_segments());
    ASSERT_TRUE(engine.create_folder("docs", "Docs", root_.string()).is_ok());
    ASSERT_TRUE(engine.index_folder("docs").is_ok());

    for (const auto& segment : segments_of("big.bin")) {
        ASSERT_TRUE(store_.attach_locator("docs", segment.segment_id,
                                          "pack-" + std::to_string(segment.segment_index) + "@usync").is_ok());
    }

    write_file(root_ / "big.bin", std::string(10, 'x') + std::string(10, 'y') + std::string(10, 'Z'));
    auto result = engine.index_folder("docs");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().version, 2u);
    EXPECT_EQ(result.value().changes.modified, 1u);
    EXPECT_EQ(result.value().new_segments, 1u);

    const auto version = latest_version_of("big.bin");
    EXPECT_EQ(version.change_type, ChangeType::Modify);
    EXPECT_EQ(version.changed_segments, (std::vector<std::uint32_t>{2}));

    const auto tiling = effective_segments(segments_of("big.bin"), 2, 3);
    ASSERT_EQ(tiling.size(), 3u);
    EXPECT_EQ(tiling[0].version, 1u);
    EXPECT_EQ(tiling[0].locator, "pack-0@usync");
    EXPECT_EQ(tiling[1].version, 1u);
    EXPECT_EQ(tiling[1].locator, "pack-1@usync");
    EXPECT_EQ(tiling[2].version, 2u);
    EXPECT_FALSE(tiling[2].uploaded);

    auto pending = store_.list_unuploaded_segments("docs");
    ASSERT_TRUE(pending.is_ok());
    ASSERT_EQ(pending.value().size(), 1u);
    EXPECT_EQ(pending.value()[0].segment_index, 2u);
}

TEST_F(VersioningEngineTest, OnlyDifferingSegmentsAreNew) {
    std::string content;
    for (char c = 'a'; c < 'a' + 10; ++c) {
        content += std::string(10, c);
    }
    write_file(root_ / "data.bin", content);
    VersioningEngine engine(store_, small_segments());
    ASSERT_TRUE(engine.create_folder("docs", "Docs", root_.string()).is_ok());
    ASSERT_TRUE(engine.index_folder("docs").is_ok());

    content[35] = '!';
    content[71] = '!';
    write_file(root_ / "data.bin", content);
    auto result = engine.index_folder("docs");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().new_segments, 2u);
    EXPECT_EQ(latest_version_of("data.bin").changed_segments, (std::vector<std::uint32_t>{3, 7}));
}

TEST_F(VersioningEngineTest, GrowingFileAddsTrailingSegments) {
    write_file(root_ / "log.txt", std::string(15, 'l'));
    VersioningEngine engine(store_, small_segments());
    ASSERT_TRUE(engine.create_folder("docs", "Docs", root_.string()).is_ok());
    ASSERT_TRUE(engine.index_folder("docs").is_ok());

    write_file(root_ / "log.txt", std::string(32, 'l'));
    ASSERT_TRUE(engine.index_folder("docs").is_ok());
    // Segment 0 is unchanged; 1 grew from 5 to 10 bytes; 2 and 3 are new
    EXPECT_EQ(latest_version_of("log.txt").changed_segments, (std::vector<std::uint32_t>{1, 2, 3}));
}

TEST_F(VersioningEngineTest, DeleteThenRecreate) {
    write_file(root_ / "keep.txt", "keep");
    write_file(root_ / "gone.txt", "gone");
    VersioningEngine engine(store_, small_segments());
    ASSERT_TRUE(engine.create_folder("docs", "Docs", root_.string()).is_ok());
    ASSERT_TRUE(engine.index_folder("docs").is_ok());

    fs::remove(root_ / "gone.txt");
    auto deleted = engine.index_folder("docs");
    ASSERT_TRUE(deleted.is_ok());
    EXPECT_EQ(deleted.value().changes.deleted, 1u);
    EXPECT_EQ(deleted.value().new_segments, 0u);
    EXPECT_EQ(latest_version_of("gone.txt").change_type, ChangeType::Delete);

    auto header = store_.get_folder_version("docs", 2);
    ASSERT_TRUE(header.is_ok());
    EXPECT_EQ(header.value().file_count, 1u);
    EXPECT_EQ(header.value().total_size, 4u);

    write_file(root_ / "gone.txt", "back again");
    auto recreated = engine.index_folder("docs");
    ASSERT_TRUE(recreated.is_ok());
    EXPECT_EQ(recreated.value().version, 3u);
    EXPECT_EQ(recreated.value().changes.added, 1u);
    EXPECT_EQ(latest_version_of("gone.txt").change_type, ChangeType::Create);

    auto files = store_.list_files("docs");
    ASSERT_TRUE(files.is_ok());
    for (const auto& file : files.value()) {
        EXPECT_FALSE(file.is_deleted) << file.path;
    }
}

TEST_F(VersioningEngineTest, RedundancyCopiesShareContent) {
    write_file(root_ / "a.txt", std::string(15, 'a'));
    VersioningEngine engine(store_, small_segments(2));
    ASSERT_TRUE(engine.create_folder("docs", "Docs", root_.string()).is_ok());

    auto result = engine.index_folder("docs");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().new_segments, 6u);

    const auto all = segments_of("a.txt");
    const auto primary = effective_segments(all, 1, 2, 0);
    const auto second_copy = effective_segments(all, 1, 2, 2);
    ASSERT_EQ(primary.size(), 2u);
    ASSERT_EQ(second_copy.size(), 2u);
    EXPECT_EQ(second_copy[1].content_hash, primary[1].content_hash);
    EXPECT_NE(second_copy[1].segment_id, primary[1].segment_id);
}

TEST_F(VersioningEngineTest, EmitsFolderIndexedEvent) {
    write_file(root_ / "a.txt", "a");
    usync::events::EventBus bus;
    std::vector<std::uint64_t> versions;
    bus.subscribe<usync::events::FolderIndexedEvent>(
        [&](const usync::events::FolderIndexedEvent& e) { versions.push_back(e.version); });

    VersioningEngine engine(store_, small_segments(), &bus);
    ASSERT_TRUE(engine.create_folder("docs", "Docs", root_.string()).is_ok());
    ASSERT_TRUE(engine.index_folder("docs").is_ok());
    ASSERT_TRUE(engine.index_folder("docs").is_ok());

    EXPECT_EQ(versions, (std::vector<std::uint64_t>{1}));
}

TEST_F(VersioningEngineTest, ConcurrentCommitConflicts) {
    write_file(root_ / "a.txt", "first");
    VersioningEngine engine(store_, small_segments());
    ASSERT_TRUE(engine.create_folder("docs", "Docs", root_.string()).is_ok());

    auto snapshot = load_snapshot(store_, "docs");
    ASSERT_TRUE(snapshot.is_ok());
    auto scan = FolderScanner(10).scan(root_);
    ASSERT_TRUE(scan.is_ok());
    auto delta = compute_delta(snapshot.value(), scan.value(), DeltaOptions{10, 0});
    ASSERT_TRUE(delta.is_ok());

    ASSERT_TRUE(engine.index_folder("docs").is_ok());

    auto late = store_.apply_delta(delta.value());
    ASSERT_TRUE(late.is_error());
    EXPECT_EQ(late.error().code, ErrorCode::ConcurrencyConflict);
}

TEST(ComputeDeltaTest, InconsistentSnapshotIsIntegrityError) {
    FolderSnapshot previous;
    previous.folder_id = "docs";
    previous.version = 1;
    previous.header = usync::metadata::FolderVersion{"docs", 1, 5, 100, {}};

    auto delta = compute_delta(previous, ScanResult{}, DeltaOptions{10, 0});
    ASSERT_TRUE(delta.is_error());
    EXPECT_EQ(delta.error().code, ErrorCode::Integrity);

    previous.header.reset();
    delta = compute_delta(previous, ScanResult{}, DeltaOptions{10, 0});
    ASSERT_TRUE(delta.is_error());
    EXPECT_EQ(delta.error().code, ErrorCode::Integrity);
}

TEST(ComputeDeltaTest, ScanWithOtherSegmentSizeRejected) {
    ScannedFile file;
    file.path = "a.txt";
    file.size = 20;
    file.segments = {ScannedSegment{0, 0, 20, "h"}};
    ScanResult scan;
    scan.files.push_back(file);

    FolderSnapshot previous;
    previous.folder_id = "docs";
    auto delta = compute_delta(previous, scan, DeltaOptions{10, 0});
    ASSERT_TRUE(delta.is_error());
    EXPECT_EQ(delta.error().code, ErrorCode::Validation);
}

TEST(ComputeDeltaTest, IdsAreDeterministic) {
    EXPECT_EQ(make_file_id("docs", "a.txt"), make_file_id("docs", "a.txt"));
    EXPECT_NE(make_file_id("docs", "a.txt"), make_file_id("other", "a.txt"));
    EXPECT_EQ(make_file_id("docs", "a.txt").size(), 32u);
    EXPECT_NE(make_segment_id("f", 1, 0, 0), make_segment_id("f", 1, 0, 1));
    EXPECT_NE(make_segment_id("f", 1, 0, 0), make_segment_id("f", 2, 0, 0));
}
