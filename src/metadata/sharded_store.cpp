#include "usync/metadata/sharded_store.hpp"

#include <stdexcept>

namespace usync::metadata {

namespace {

std::uint32_t checked_count(const std::vector<std::unique_ptr<RecordStore>>& shards) {
    if (shards.empty()) {
        throw std::invalid_argument("ShardedRecordStore needs at least one shard");
    }
    for (const auto& shard : shards) {
        if (!shard) {
            throw std::invalid_argument("ShardedRecordStore shard must not be null");
        }
    }
    return static_cast<std::uint32_t>(shards.size());
}

} // namespace

ShardedRecordStore::ShardedRecordStore(std::vector<std::unique_ptr<RecordStore>> shards)
    : router_(checked_count(shards)) {
    shards_ = std::move(shards);
}

RecordStore& ShardedRecordStore::route(const std::string& key) const {
    return *shards_[router_.shard_for(key)];
}

Result<void> ShardedRecordStore::create_folder(const Folder& folder) {
    return route(folder.folder_id).create_folder(folder);
}

Result<Folder> ShardedRecordStore::get_folder(const std::string& folder_id) const {
    return route(folder_id).get_folder(folder_id);
}

Result<void> ShardedRecordStore::apply_delta(const FolderVersionDelta& delta) {
    return route(delta.folder_id).apply_delta(delta);
}

Result<FolderVersion> ShardedRecordStore::get_folder_version(const std::string& folder_id,
                                                             std::uint64_t version) const {
    return route(folder_id).get_folder_version(folder_id, version);
}

Result<std::vector<File>> ShardedRecordStore::list_files(const std::string& folder_id) const {
    return route(folder_id).list_files(folder_id);
}

Result<std::vector<FileVersion>> ShardedRecordStore::list_file_versions(const std::string& folder_id,
                                                                        const std::string& file_id) const {
    return route(folder_id).list_file_versions(folder_id, file_id);
}

Result<std::vector<Segment>> ShardedRecordStore::list_segments(const std::string& folder_id,
                                                               const std::string& file_id) const {
    return route(folder_id).list_segments(folder_id, file_id);
}

Result<std::vector<Segment>> ShardedRecordStore::list_unuploaded_segments(const std::string& folder_id) const {
    return route(folder_id).list_unuploaded_segments(folder_id);
}

Result<Segment> ShardedRecordStore::get_segment(const std::string& folder_id,
                                                const std::string& segment_id) const {
    return route(folder_id).get_segment(folder_id, segment_id);
}

Result<void> ShardedRecordStore::attach_locator(const std::string& folder_id,
                                                const std::string& segment_id,
                                                const std::string& locator) {
    return route(folder_id).attach_locator(folder_id, segment_id, locator);
}

Result<void> ShardedRecordStore::create_share(const Share& share) {
    return route(share.token).create_share(share);
}

Result<Share> ShardedRecordStore::get_share(const std::string& token) const {
    return route(token).get_share(token);
}

Result<void> ShardedRecordStore::create_session(const TransferSession& session,
                                                const std::vector<SegmentProgress>& progress) {
    return route(session.session_id).create_session(session, progress);
}

Result<TransferSession> ShardedRecordStore::get_session(const std::string& session_id) const {
    return route(session_id).get_session(session_id);
}

Result<void> ShardedRecordStore::set_session_state(const std::string& session_id, SessionState state) {
    return route(session_id).set_session_state(session_id, state);
}

Result<std::vector<SegmentProgress>> ShardedRecordStore::list_progress(const std::string& session_id) const {
    return route(session_id).list_progress(session_id);
}

Result<bool> ShardedRecordStore::compare_and_set_progress(const SegmentProgress& expected,
                                                          const SegmentProgress& desired) {
    return route(expected.session_id).compare_and_set_progress(expected, desired);
}

Result<bool> ShardedRecordStore::complete_segment(const std::string& session_id,
                                                  const std::string& segment_id) {
    return route(session_id).complete_segment(session_id, segment_id);
}

} // namespace usync::metadata
