#pragma once

/**
 * @file store.hpp
 * @brief Transactional record store used by every usync component
 *
 * Implementations:
 * - MemoryRecordStore: single process, reader/writer locked maps
 * - SqliteRecordStore: embedded durable store (WAL, immediate transactions)
 * - ShardedRecordStore: routes records across N child stores by ShardRouter
 *
 * Every mutating call is atomic and durable before it returns success.
 * Lookups of absent records fail with ErrorCode::NotFound.
 */

#include "usync/core/result.hpp"
#include "usync/metadata/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace usync {
namespace metadata {

class RecordStore {
public:
    virtual ~RecordStore() = default;

    // Folders
    virtual Result<void> create_folder(const Folder& folder) = 0;
    virtual Result<Folder> get_folder(const std::string& folder_id) const = 0;

    /**
     * @brief Insert a versioning pass atomically
     *
     * Fails with ConcurrencyConflict when the folder is no longer at
     * delta.base_version, so version numbers are assigned exactly once.
     */
    virtual Result<void> apply_delta(const FolderVersionDelta& delta) = 0;

    virtual Result<FolderVersion> get_folder_version(const std::string& folder_id,
                                                     std::uint64_t version) const = 0;
    virtual Result<std::vector<File>> list_files(const std::string& folder_id) const = 0;
    virtual Result<std::vector<FileVersion>> list_file_versions(const std::string& folder_id,
                                                                const std::string& file_id) const = 0;

    /// Every segment ever recorded for a file, all versions and redundancy copies.
    virtual Result<std::vector<Segment>> list_segments(const std::string& folder_id,
                                                       const std::string& file_id) const = 0;
    virtual Result<std::vector<Segment>> list_unuploaded_segments(const std::string& folder_id) const = 0;
    virtual Result<Segment> get_segment(const std::string& folder_id,
                                        const std::string& segment_id) const = 0;

    /// Record where a segment landed and flag it uploaded. Re-attaching the same locator is a no-op.
    virtual Result<void> attach_locator(const std::string& folder_id,
                                        const std::string& segment_id,
                                        const std::string& locator) = 0;

    // Shares
    virtual Result<void> create_share(const Share& share) = 0;
    virtual Result<Share> get_share(const std::string& token) const = 0;

    // Transfer sessions
    virtual Result<void> create_session(const TransferSession& session,
                                        const std::vector<SegmentProgress>& progress) = 0;
    virtual Result<TransferSession> get_session(const std::string& session_id) const = 0;
    virtual Result<void> set_session_state(const std::string& session_id, SessionState state) = 0;

    /// Progress rows ordered by SegmentProgress::order.
    virtual Result<std::vector<SegmentProgress>> list_progress(const std::string& session_id) const = 0;

    /**
     * @brief Replace a progress row only if it still matches `expected`
     *
     * Compared fields: status, attempts, lease_owner, lease_expires_ms.
     * Returns false (not an error) when another writer got there first.
     * Transitions to Complete must go through complete_segment().
     */
    virtual Result<bool> compare_and_set_progress(const SegmentProgress& expected,
                                                  const SegmentProgress& desired) = 0;

    /**
     * @brief Mark one segment complete and bump the session counter in one write
     *
     * Returns false when the segment was already complete (counter untouched).
     * The session flips to Completed when the last segment lands.
     */
    virtual Result<bool> complete_segment(const std::string& session_id,
                                          const std::string& segment_id) = 0;
};

/// Fields compare_and_set_progress() matches on.
inline bool progress_matches(const SegmentProgress& stored, const SegmentProgress& expected) {
    return stored.status == expected.status &&
           stored.attempts == expected.attempts &&
           stored.lease_owner == expected.lease_owner &&
           stored.lease_expires_ms == expected.lease_expires_ms;
}

/// Validation shared by store implementations before a delta is applied.
Result<void> validate_delta(const FolderVersionDelta& delta);

} // namespace metadata
} // namespace usync
