#include "usync/metadata/memory_store.hpp"
#include "usync/metadata/sharded_store.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

using namespace usync::metadata;

namespace {

std::unique_ptr<ShardedRecordStore> make_sharded(std::size_t count) {
    std::vector<std::unique_ptr<RecordStore>> shards;
    for (std::size_t i = 0; i < count; ++i) {
        shards.push_back(std::make_unique<MemoryRecordStore>());
    }
    return std::make_unique<ShardedRecordStore>(std::move(shards));
}

} // namespace

TEST(ShardedRecordStoreTest, RejectsEmptyOrNullShards) {
    EXPECT_THROW(ShardedRecordStore(std::vector<std::unique_ptr<RecordStore>>{}), std::invalid_argument);

    std::vector<std::unique_ptr<RecordStore>> shards;
    shards.push_back(std::make_unique<MemoryRecordStore>());
    shards.push_back(nullptr);
    EXPECT_THROW(ShardedRecordStore(std::move(shards)), std::invalid_argument);
}

TEST(ShardedRecordStoreTest, FolderLandsOnRoutedShardOnly) {
    auto store = make_sharded(3);
    ASSERT_EQ(store->shard_count(), 3u);

    for (const std::string id : {"folder-1", "photos", "music", "notes"}) {
        ASSERT_TRUE(store->create_folder(Folder{id, id, "/data/" + id, 0}).is_ok());
        const auto home = store->shard_of(id);
        for (std::size_t i = 0; i < store->shard_count(); ++i) {
            EXPECT_EQ(store->shard(i).get_folder(id).is_ok(), i == home) << id << " on shard " << i;
        }
        EXPECT_TRUE(store->get_folder(id).is_ok());
    }
}

TEST(ShardedRecordStoreTest, SharesRouteByToken) {
    auto store = make_sharded(4);
    ASSERT_TRUE(store->create_folder(Folder{"folder-1", "f", "/f", 0}).is_ok());

    Share share;
    share.token = "share-token";
    share.folder_id = "folder-1";
    share.folder_version = 1;
    ASSERT_TRUE(store->create_share(share).is_ok());

    const auto home = store->shard_of("share-token");
    EXPECT_EQ(home, 3u);
    EXPECT_TRUE(store->shard(home).get_share("share-token").is_ok());
    EXPECT_TRUE(store->get_share("share-token").is_ok());
}

TEST(ShardedRecordStoreTest, SessionAndProgressShareAShard) {
    auto store = make_sharded(7);

    TransferSession session;
    session.session_id = "upload-folder-1-v1";
    session.folder_id = "folder-1";
    session.total_segments = 1;
    SegmentProgress row;
    row.session_id = session.session_id;
    row.segment_id = "seg-0";
    ASSERT_TRUE(store->create_session(session, {row}).is_ok());

    auto claimed = row;
    claimed.status = SegmentStatus::InProgress;
    claimed.attempts = 1;
    auto swapped = store->compare_and_set_progress(row, claimed);
    ASSERT_TRUE(swapped.is_ok());
    EXPECT_TRUE(swapped.value());
    ASSERT_TRUE(store->complete_segment(session.session_id, "seg-0").is_ok());

    const auto home = store->shard_of(session.session_id);
    auto direct = store->shard(home).get_session(session.session_id);
    ASSERT_TRUE(direct.is_ok());
    EXPECT_EQ(direct.value().completed_segments, 1u);
    EXPECT_EQ(direct.value().state, SessionState::Completed);
}
