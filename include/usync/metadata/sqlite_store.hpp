#pragma once

#include "usync/metadata/sqlite_db.hpp"
#include "usync/metadata/store.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace usync {
namespace metadata {

/**
 * @brief Durable RecordStore on an embedded sqlite database
 *
 * All statements of one call run inside a single BEGIN IMMEDIATE
 * transaction on a connection serialized by mutex_, so compare-and-set
 * and completion writes are atomic across threads and processes.
 * Path ":memory:" gives a private, non-durable database.
 */
class SqliteRecordStore : public RecordStore {
public:
    explicit SqliteRecordStore(const std::string& path);

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
    Result<void> migrate();
    Result<Folder> load_folder(const std::string& folder_id) const;
    Result<std::vector<Segment>> query_segments(const std::string& sql,
                                                const std::string& first,
                                                const std::string& second) const;

    mutable std::mutex mutex_;
    std::unique_ptr<SqliteDb> db_;
};

} // namespace metadata
} // namespace usync
