#include "usync/metadata/memory_store.hpp"
#include "usync/metadata/sharded_store.hpp"
#include "usync/metadata/sqlite_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>

namespace fs = std::filesystem;
using namespace usync::metadata;
using usync::ErrorCode;

namespace {

fs::path create_temp_dir(const std::string& prefix) {
    auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    auto dir = base / fs::path(prefix + std::to_string(counter.fetch_add(1)));
    fs::create_directories(dir);
    return dir;
}

struct BackendFactory {
    std::string name;
    std::function<std::unique_ptr<RecordStore>(const fs::path& dir)> make_store;
};

std::vector<BackendFactory> backends() {
    return {
        {"memory", [](const fs::path&) { return std::make_unique<MemoryRecordStore>(); }},
        {"sqlite", [](const fs::path& dir) {
             return std::make_unique<SqliteRecordStore>((dir / "usync.db").string());
         }},
        {"sharded", [](const fs::path& dir) {
             std::vector<std::unique_ptr<RecordStore>> shards;
             shards.push_back(std::make_unique<MemoryRecordStore>());
             shards.push_back(std::make_unique<SqliteRecordStore>((dir / "shard1.db").string()));
             shards.push_back(std::make_unique<MemoryRecordStore>());
             return std::make_unique<ShardedRecordStore>(std::move(shards));
         }},
    };
}

Segment make_segment(const std::string& id, const std::string& file_id, std::uint64_t version,
                     std::uint32_t index, std::uint32_t redundancy = 0) {
    Segment segment;
    segment.segment_id = id;
    segment.folder_id = "docs";
    segment.file_id = file_id;
    segment.version = version;
    segment.segment_index = index;
    segment.offset = static_cast<std::uint64_t>(index) * 100;
    segment.size = 100;
    segment.content_hash = "hash-" + id;
    segment.redundancy_index = redundancy;
    return segment;
}

FolderVersionDelta make_delta(std::uint64_t base) {
    FolderVersionDelta delta;
    delta.folder_id = "docs";
    delta.base_version = base;
    delta.folder_version.folder_id = "docs";
    delta.folder_version.version = base + 1;
    delta.folder_version.file_count = 1;
    delta.folder_version.total_size = 200;
    delta.folder_version.changes.added = base == 0 ? 1 : 0;
    delta.folder_version.changes.modified = base == 0 ? 0 : 1;

    File file;
    file.file_id = "file-a";
    file.folder_id = "docs";
    file.path = "a.txt";
    file.current_version = base + 1;
    file.current_size = 200;
    file.current_hash = "hash-v" + std::to_string(base + 1);
    file.segment_count = 2;
    delta.files.push_back(file);

    FileVersion version;
    version.file_id = "file-a";
    version.folder_id = "docs";
    version.version = base + 1;
    version.size = 200;
    version.hash = file.current_hash;
    version.change_type = base == 0 ? ChangeType::Create : ChangeType::Modify;
    version.segment_count = 2;
    delta.file_versions.push_back(version);

    const auto v = std::to_string(base + 1);
    delta.segments.push_back(make_segment("seg-" + v + "-0", "file-a", base + 1, 0));
    delta.segments.push_back(make_segment("seg-" + v + "-1", "file-a", base + 1, 1));
    return delta;
}

std::vector<SegmentProgress> make_progress(const std::string& session_id, std::size_t count) {
    std::vector<SegmentProgress> rows;
    for (std::size_t i = 0; i < count; ++i) {
        SegmentProgress row;
        row.session_id = session_id;
        row.segment_id = "seg-" + std::to_string(i);
        row.order = i;
        row.file_path = "a.txt";
        row.segment_index = static_cast<std::uint32_t>(i);
        rows.push_back(row);
    }
    return rows;
}

TransferSession make_session(const std::string& session_id, std::uint64_t total) {
    TransferSession session;
    session.session_id = session_id;
    session.direction = TransferDirection::Upload;
    session.target = "docs";
    session.folder_id = "docs";
    session.folder_version = 1;
    session.total_segments = total;
    return session;
}

} // namespace

class RecordStoreContractTest : public ::testing::TestWithParam<BackendFactory> {
protected:
    void SetUp() override {
        dir_ = create_temp_dir("usync_store_test");
        store_ = GetParam().make_store(dir_);
        ASSERT_TRUE(store_->create_folder(Folder{"docs", "Docs", "/data/docs", 0}).is_ok());
    }

    void TearDown() override {
        store_.reset();
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
    std::unique_ptr<RecordStore> store_;
};

TEST_P(RecordStoreContractTest, FolderLifecycle) {
    auto folder = store_->get_folder("docs");
    ASSERT_TRUE(folder.is_ok());
    EXPECT_EQ(folder.value().name, "Docs");
    EXPECT_EQ(folder.value().path, "/data/docs");
    EXPECT_EQ(folder.value().current_version, 0u);

    auto duplicate = store_->create_folder(Folder{"docs", "Again", "/elsewhere", 0});
    ASSERT_TRUE(duplicate.is_error());
    EXPECT_EQ(duplicate.error().code, ErrorCode::Validation);

    auto missing = store_->get_folder("nope");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    auto empty_id = store_->create_folder(Folder{"", "x", "/x", 0});
    ASSERT_TRUE(empty_id.is_error());
    EXPECT_EQ(empty_id.error().code, ErrorCode::Validation);
}

TEST_P(RecordStoreContractTest, ApplyDeltaAssignsVersions) {
    ASSERT_TRUE(store_->apply_delta(make_delta(0)).is_ok());
    ASSERT_TRUE(store_->apply_delta(make_delta(1)).is_ok());

    EXPECT_EQ(store_->get_folder("docs").value().current_version, 2u);

    auto header = store_->get_folder_version("docs", 2);
    ASSERT_TRUE(header.is_ok());
    EXPECT_EQ(header.value().changes.modified, 1u);
    EXPECT_EQ(header.value().total_size, 200u);

    auto files = store_->list_files("docs");
    ASSERT_TRUE(files.is_ok());
    ASSERT_EQ(files.value().size(), 1u);
    EXPECT_EQ(files.value()[0].current_version, 2u);
    EXPECT_EQ(files.value()[0].current_hash, "hash-v2");

    auto versions = store_->list_file_versions("docs", "file-a");
    ASSERT_TRUE(versions.is_ok());
    ASSERT_EQ(versions.value().size(), 2u);

    auto segments = store_->list_segments("docs", "file-a");
    ASSERT_TRUE(segments.is_ok());
    EXPECT_EQ(segments.value().size(), 4u);

    auto missing_version = store_->get_folder_version("docs", 7);
    ASSERT_TRUE(missing_version.is_error());
    EXPECT_EQ(missing_version.error().code, ErrorCode::NotFound);
}

TEST_P(RecordStoreContractTest, StaleBaseVersionConflicts) {
    ASSERT_TRUE(store_->apply_delta(make_delta(0)).is_ok());

    auto stale = make_delta(0);
    stale.segments.clear();
    auto result = store_->apply_delta(stale);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::ConcurrencyConflict);
    EXPECT_EQ(store_->get_folder("docs").value().current_version, 1u);
}

TEST_P(RecordStoreContractTest, MalformedDeltaRejected) {
    auto delta = make_delta(0);
    delta.folder_version.version = 5;
    auto result = store_->apply_delta(delta);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Validation);

    auto unknown = make_delta(0);
    unknown.folder_id = "ghost";
    unknown.folder_version.folder_id = "ghost";
    for (auto& file : unknown.files) file.folder_id = "ghost";
    for (auto& version : unknown.file_versions) version.folder_id = "ghost";
    for (auto& segment : unknown.segments) segment.folder_id = "ghost";
    result = store_->apply_delta(unknown);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST_P(RecordStoreContractTest, AttachLocatorMarksUploaded) {
    ASSERT_TRUE(store_->apply_delta(make_delta(0)).is_ok());

    auto pending = store_->list_unuploaded_segments("docs");
    ASSERT_TRUE(pending.is_ok());
    EXPECT_EQ(pending.value().size(), 2u);

    ASSERT_TRUE(store_->attach_locator("docs", "seg-1-0", "abc@usync").is_ok());
    ASSERT_TRUE(store_->attach_locator("docs", "seg-1-0", "abc@usync").is_ok());

    auto segment = store_->get_segment("docs", "seg-1-0");
    ASSERT_TRUE(segment.is_ok());
    EXPECT_TRUE(segment.value().uploaded);
    EXPECT_EQ(segment.value().locator, "abc@usync");

    pending = store_->list_unuploaded_segments("docs");
    ASSERT_TRUE(pending.is_ok());
    ASSERT_EQ(pending.value().size(), 1u);
    EXPECT_EQ(pending.value()[0].segment_id, "seg-1-1");

    auto missing = store_->attach_locator("docs", "seg-9", "x@usync");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    auto empty = store_->attach_locator("docs", "seg-1-1", "");
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error().code, ErrorCode::Validation);
}

TEST_P(RecordStoreContractTest, SharesRoundTrip) {
    Share share;
    share.token = "token-abc";
    share.folder_id = "docs";
    share.folder_version = 1;
    share.share_type = ShareType::Protected;
    share.metadata = R"({"note":"hi"})";
    share.manifest_locator = "m@usync";
    share.created_at = 1700000000;
    ASSERT_TRUE(store_->create_share(share).is_ok());

    auto loaded = store_->get_share("token-abc");
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().share_type, ShareType::Protected);
    EXPECT_EQ(loaded.value().metadata, share.metadata);
    EXPECT_EQ(loaded.value().manifest_locator, "m@usync");
    EXPECT_EQ(loaded.value().created_at, 1700000000);

    auto duplicate = store_->create_share(share);
    ASSERT_TRUE(duplicate.is_error());
    EXPECT_EQ(duplicate.error().code, ErrorCode::Validation);

    auto missing = store_->get_share("token-zzz");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST_P(RecordStoreContractTest, ProgressCompareAndSet) {
    ASSERT_TRUE(store_->create_session(make_session("s1", 3), make_progress("s1", 3)).is_ok());

    auto rows = store_->list_progress("s1");
    ASSERT_TRUE(rows.is_ok());
    ASSERT_EQ(rows.value().size(), 3u);
    EXPECT_EQ(rows.value()[2].segment_id, "seg-2");

    auto expected = rows.value()[0];
    auto claimed = expected;
    claimed.status = SegmentStatus::InProgress;
    claimed.attempts = 1;
    claimed.lease_owner = "worker-a";
    claimed.lease_expires_ms = 5000;

    auto first = store_->compare_and_set_progress(expected, claimed);
    ASSERT_TRUE(first.is_ok());
    EXPECT_TRUE(first.value());

    auto rival = expected;
    rival.lease_owner = "worker-b";
    rival.status = SegmentStatus::InProgress;
    auto second = store_->compare_and_set_progress(expected, rival);
    ASSERT_TRUE(second.is_ok());
    EXPECT_FALSE(second.value());

    auto stored = store_->list_progress("s1").value()[0];
    EXPECT_EQ(stored.lease_owner, "worker-a");
    EXPECT_EQ(stored.attempts, 1u);

    auto completing = claimed;
    completing.status = SegmentStatus::Complete;
    auto refused = store_->compare_and_set_progress(claimed, completing);
    ASSERT_TRUE(refused.is_error());
    EXPECT_EQ(refused.error().code, ErrorCode::Validation);

    auto ghost = expected;
    ghost.segment_id = "seg-99";
    auto not_found = store_->compare_and_set_progress(ghost, claimed);
    ASSERT_TRUE(not_found.is_error());
    EXPECT_EQ(not_found.error().code, ErrorCode::NotFound);
}

TEST_P(RecordStoreContractTest, CompleteSegmentIsIdempotentAndFinishesSession) {
    ASSERT_TRUE(store_->create_session(make_session("s2", 2), make_progress("s2", 2)).is_ok());

    auto done = store_->complete_segment("s2", "seg-0");
    ASSERT_TRUE(done.is_ok());
    EXPECT_TRUE(done.value());
    auto again = store_->complete_segment("s2", "seg-0");
    ASSERT_TRUE(again.is_ok());
    EXPECT_FALSE(again.value());

    auto session = store_->get_session("s2");
    ASSERT_TRUE(session.is_ok());
    EXPECT_EQ(session.value().completed_segments, 1u);
    EXPECT_EQ(session.value().state, SessionState::Active);
    EXPECT_EQ(session.value().last_completed, "seg-0");

    ASSERT_TRUE(store_->complete_segment("s2", "seg-1").is_ok());
    session = store_->get_session("s2");
    EXPECT_EQ(session.value().completed_segments, 2u);
    EXPECT_EQ(session.value().state, SessionState::Completed);

    auto missing = store_->complete_segment("s2", "seg-5");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST_P(RecordStoreContractTest, SessionStateAndLookups) {
    ASSERT_TRUE(store_->create_session(make_session("s3", 1), make_progress("s3", 1)).is_ok());

    auto duplicate = store_->create_session(make_session("s3", 1), make_progress("s3", 1));
    ASSERT_TRUE(duplicate.is_error());
    EXPECT_EQ(duplicate.error().code, ErrorCode::Validation);

    ASSERT_TRUE(store_->set_session_state("s3", SessionState::Paused).is_ok());
    EXPECT_EQ(store_->get_session("s3").value().state, SessionState::Paused);

    // A paused session does not flip to Completed by itself
    ASSERT_TRUE(store_->complete_segment("s3", "seg-0").is_ok());
    EXPECT_EQ(store_->get_session("s3").value().state, SessionState::Paused);

    auto missing = store_->get_session("nope");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
    EXPECT_EQ(store_->list_progress("nope").error().code, ErrorCode::NotFound);
    EXPECT_EQ(store_->set_session_state("nope", SessionState::Cancelled).error().code, ErrorCode::NotFound);
}

INSTANTIATE_TEST_SUITE_P(Backends,
                         RecordStoreContractTest,
                         ::testing::ValuesIn(backends()),
                         [](const ::testing::TestParamInfo<BackendFactory>& info) { return info.param.name; });

TEST(SqliteRecordStoreTest, ProgressSurvivesReopen) {
    auto dir = create_temp_dir("usync_sqlite_reopen");
    const auto path = (dir / "usync.db").string();
    {
        SqliteRecordStore store(path);
        ASSERT_TRUE(store.create_session(make_session("s1", 2), make_progress("s1", 2)).is_ok());
        ASSERT_TRUE(store.complete_segment("s1", "seg-1").is_ok());
    }

    SqliteRecordStore reopened(path);
    auto rows = reopened.list_progress("s1");
    ASSERT_TRUE(rows.is_ok());
    ASSERT_EQ(rows.value().size(), 2u);
    EXPECT_EQ(rows.value()[0].status, SegmentStatus::Pending);
    EXPECT_EQ(rows.value()[1].status, SegmentStatus::Complete);
    EXPECT_EQ(reopened.get_session("s1").value().completed_segments, 1u);

    std::error_code ec;
    fs::remove_all(dir, ec);
}
