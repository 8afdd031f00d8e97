#pragma once

#include "usync/metadata/store.hpp"

#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace usync {
namespace metadata {

/**
 * @brief Thread-safe in-memory RecordStore
 *
 * Reads take a shared lock, writes an exclusive one, so every mutation is
 * atomic with respect to concurrent transfer workers. Nothing survives the
 * process; use SqliteRecordStore when progress must outlive a crash.
 */
class MemoryRecordStore : public RecordStore {
public:
    MemoryRecordStore() = default;

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
    struct FolderData {
        Folder folder;
        std::map<std::uint64_t, FolderVersion> versions;
        std::map<std::string, File> files;                                // file_id -> head
        std::unordered_map<std::string, std::vector<FileVersion>> file_versions;
        std::map<std::string, Segment> segments;                          // segment_id -> segment
        std::unordered_map<std::string, std::vector<std::string>> segments_by_file;
    };

    struct SessionData {
        TransferSession session;
        std::unordered_map<std::string, SegmentProgress> progress;
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, FolderData> folders_;
    std::unordered_map<std::string, Share> shares_;
    std::unordered_map<std::string, SessionData> sessions_;
};

} // namespace metadata
} // namespace usync
