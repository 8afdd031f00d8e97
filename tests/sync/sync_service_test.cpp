#include "usync/sync/service.hpp"

#include "usync/metadata/sharded_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using usync::ErrorCode;
using usync::metadata::ShareType;
using usync::sync::ServiceHooks;
using usync::sync::SyncService;
using usync::transfer::MemoryTransport;
using usync::transfer::RunOutcome;

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

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

ServiceHooks instant_hooks() {
    ServiceHooks hooks;
    hooks.sleeper = [](std::chrono::milliseconds) {};
    return hooks;
}

class SyncServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir("usync_service_test");
        source_ = root_ / "source";
        config_.segment_size = 1024;
        config_.max_pack_size = 8192;
        config_.worker_threads = 2;
        config_.retry.initial_delay = std::chrono::milliseconds(1);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    std::unique_ptr<SyncService> make_service() {
        auto service = SyncService::create(config_, transport_, root_ / "staging", nullptr, instant_hooks());
        EXPECT_TRUE(service.is_ok());
        return std::move(service.value());
    }

    fs::path root_;
    fs::path source_;
    usync::config::SyncConfig config_;
    MemoryTransport transport_;
};

} // namespace

TEST_F(SyncServiceTest, IndexUploadShareDownload) {
    const auto a = write_file(source_ / "a.txt", std::string(3000, 'a'));
    const auto b = write_file(source_ / "sub" / "b.txt", std::string(100, 'b'));

    auto service = make_service();
    ASSERT_TRUE(service->add_folder("docs", "Docs", source_.string()).is_ok());

    auto indexed = service->index("docs");
    ASSERT_TRUE(indexed.is_ok());
    EXPECT_TRUE(indexed.value().changed);
    EXPECT_EQ(indexed.value().version, 1u);
    EXPECT_EQ(indexed.value().new_segments, 4u);

    auto uploaded = service->upload("docs");
    ASSERT_TRUE(uploaded.is_ok());
    EXPECT_EQ(uploaded.value().outcome, RunOutcome::Succeeded);

    auto share = service->share("docs", ShareType::Public, {{"title", "Docs"}});
    ASSERT_TRUE(share.is_ok());
    EXPECT_EQ(share.value().folder_version, 1u);

    const auto dest = root_ / "dest";
    auto downloaded = service->download(share.value().token, dest);
    ASSERT_TRUE(downloaded.is_ok());
    EXPECT_EQ(downloaded.value().outcome, RunOutcome::Succeeded);
    EXPECT_EQ(read_file(dest / "a.txt"), a);
    EXPECT_EQ(read_file(dest / "sub" / "b.txt"), b);

    const auto& stats = service->stats();
    EXPECT_EQ(stats.folder_versions.load(), 1u);
    EXPECT_EQ(stats.segments_indexed.load(), 4u);
    EXPECT_EQ(stats.segments_uploaded.load(), 4u);
    EXPECT_GE(stats.packs_posted.load(), 1u);
    EXPECT_EQ(stats.segments_downloaded.load(), 4u);
    EXPECT_EQ(stats.bytes_downloaded.load(), 3100u);
    EXPECT_EQ(stats.sessions_completed.load(), 2u);
    EXPECT_EQ(stats.manifests_published.load(), 1u);
    EXPECT_EQ(stats.shares_created.load(), 1u);
    EXPECT_EQ(stats.segment_failures.load(), 0u);
}

TEST_F(SyncServiceTest, ReindexWithoutChangesKeepsVersion) {
    write_file(source_ / "a.txt", "hello");
    auto service = make_service();
    ASSERT_TRUE(service->add_folder("docs", "Docs", source_.string()).is_ok());
    ASSERT_TRUE(service->index("docs").is_ok());

    auto again = service->index("docs");
    ASSERT_TRUE(again.is_ok());
    EXPECT_FALSE(again.value().changed);
    EXPECT_EQ(again.value().version, 1u);
    EXPECT_EQ(service->stats().folder_versions.load(), 1u);
}

TEST_F(SyncServiceTest, UnknownFolderIsNotFound) {
    auto service = make_service();
    auto indexed = service->index("missing");
    ASSERT_TRUE(indexed.is_error());
    EXPECT_EQ(indexed.error().code, ErrorCode::NotFound);

    auto downloaded = service->download("no-such-token", root_ / "dest");
    ASSERT_TRUE(downloaded.is_error());
    EXPECT_EQ(downloaded.error().code, ErrorCode::NotFound);
}

TEST_F(SyncServiceTest, InvalidConfigIsRejected) {
    config_.segment_size = 0;
    auto no_segments = SyncService::create(config_, transport_, root_ / "staging");
    ASSERT_TRUE(no_segments.is_error());
    EXPECT_EQ(no_segments.error().code, ErrorCode::Validation);

    config_.segment_size = 1024;
    config_.max_pack_size = 100;
    auto tiny_packs = SyncService::create(config_, transport_, root_ / "staging");
    ASSERT_TRUE(tiny_packs.is_error());
    EXPECT_EQ(tiny_packs.error().code, ErrorCode::Validation);
}

TEST_F(SyncServiceTest, SqliteStateSurvivesRestart) {
    write_file(source_ / "a.txt", std::string(2000, 'x'));
    config_.database_path = (root_ / "usync.db").string();

    {
        auto service = make_service();
        ASSERT_TRUE(service->add_folder("docs", "Docs", source_.string()).is_ok());
        ASSERT_TRUE(service->index("docs").is_ok());
        auto uploaded = service->upload("docs");
        ASSERT_TRUE(uploaded.is_ok());
        EXPECT_EQ(uploaded.value().outcome, RunOutcome::Succeeded);
    }

    auto service = make_service();
    auto folder = service->store().get_folder("docs");
    ASSERT_TRUE(folder.is_ok());
    EXPECT_EQ(folder.value().current_version, 1u);

    auto again = service->index("docs");
    ASSERT_TRUE(again.is_ok());
    EXPECT_FALSE(again.value().changed);

    auto share = service->share("docs", ShareType::Private);
    ASSERT_TRUE(share.is_ok());
    auto downloaded = service->download(share.value().token, root_ / "dest");
    ASSERT_TRUE(downloaded.is_ok());
    EXPECT_EQ(downloaded.value().outcome, RunOutcome::Succeeded);
    EXPECT_EQ(read_file(root_ / "dest" / "a.txt"), std::string(2000, 'x'));
}

TEST_F(SyncServiceTest, ShardedSqliteStoreSpreadsFolders) {
    config_.shard_count = 3;
    config_.database_path = (root_ / "meta.db").string();

    auto store = SyncService::make_store(config_);
    ASSERT_TRUE(store.is_ok());
    EXPECT_NE(dynamic_cast<usync::metadata::ShardedRecordStore*>(store.value().get()), nullptr);
    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(fs::exists(root_ / ("meta.db." + std::to_string(i))));
    }

    write_file(source_ / "one" / "a.txt", "alpha");
    write_file(source_ / "two" / "b.txt", "beta");
    auto service = make_service();
    ASSERT_TRUE(service->add_folder("one", "One", (source_ / "one").string()).is_ok());
    ASSERT_TRUE(service->add_folder("two", "Two", (source_ / "two").string()).is_ok());
    ASSERT_TRUE(service->index("one").is_ok());
    ASSERT_TRUE(service->index("two").is_ok());

    EXPECT_EQ(service->store().get_folder("one").value().current_version, 1u);
    EXPECT_EQ(service->store().get_folder("two").value().current_version, 1u);
}

TEST_F(SyncServiceTest, UnopenableDatabaseIsStorageError) {
    config_.database_path = (root_ / "no" / "such" / "dir" / "usync.db").string();
    auto store = SyncService::make_store(config_);
    ASSERT_TRUE(store.is_error());
    EXPECT_EQ(store.error().code, ErrorCode::Storage);
}
