#pragma once

#include "usync/metadata/shard_router.hpp"
#include "usync/metadata/store.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace usync {
namespace metadata {

/**
 * @brief RecordStore spread over N child stores
 *
 * ROUTING KEYS:
 * - Folder, versions, files, segments: folder_id
 * - Share: token
 * - TransferSession and its progress rows: session_id
 *
 * Each call touches exactly one child, so every operation keeps the
 * atomicity of the child store that serves it.
 */
class ShardedRecordStore : public RecordStore {
public:
    /// Throws std::invalid_argument when shards is empty or holds a null store.
    explicit ShardedRecordStore(std::vector<std::unique_ptr<RecordStore>> shards);

    std::size_t shard_count() const { return shards_.size(); }
    std::uint32_t shard_of(const std::string& key) const { return router_.shard_for(key); }
    RecordStore& shard(std::size_t index) { return *shards_.at(index); }

    Result<void> create_folder(const Folder& folder) override;
    Result<Folder> get_folder(const std::string& folder_id) const override;
    Result<void> apply_delta(const FolderVersionDelta& delta) override;
    Result<FolderVersion> get_folder_version(const std::string& folder_id,
                                             std::uint64_t version) const override;
    Result<std::vector<File>> list_files(const std::string& folder_id) const override;
    Result<std::vector<FileVersion>> list_file_versions(const std::string& folder_id,
                                                        const std::string& file_id) const override;
    Result<std::vector<Segment>> list_segments(const std::string& folder_id,
                                               const std::string& file_id) const override;
    Result<std::vector<Segment>> list_unuploaded_segments(const std::string& folder_id) const override;
    Result<Segment> get_segment(const std::string& folder_id,
                                const std::string& segment_id) const override;
    Result<void> attach_locator(const std::string& folder_id,
                                const std::string& segment_id,
                                const std::string& locator) override;

    Result<void> create_share(const Share& share) override;
    Result<Share> get_share(const std::string& token) const override;

    Result<void> create_session(const TransferSession& session,
                                const std::vector<SegmentProgress>& progress) override;
    Result<TransferSession> get_session(const std::string& session_id) const override;
    Result<void> set_session_state(const std::string& session_id, SessionState state) override;
    Result<std::vector<SegmentProgress>> list_progress(const std::string& session_id) const override;
    Result<bool> compare_and_set_progress(const SegmentProgress& expected,
                                          const SegmentProgress& desired) override;
    Result<bool> complete_segment(const std::string& session_id,
                                  const std::string& segment_id) override;

private:
    RecordStore& route(const std::string& key) const;

    std::vector<std::unique_ptr<RecordStore>> shards_;
    ShardRouter router_;
};

} // namespace metadata
} // namespace usync
