#pragma once

/**
 * @file versioning.hpp
 * @brief Turns a fresh folder scan into the minimal set of new versions
 *
 * FLOW:
 * 1. load_snapshot() reads the folder's latest state from the store
 * 2. FolderScanner hashes what is on disk now
 * 3. compute_delta() diffs the two (pure, deterministic)
 * 4. RecordStore::apply_delta() commits it, assigning the version number
 *
 * A file whose content hash and size are unchanged produces nothing. A
 * modified file gets new segments only at the aligned indices whose bytes
 * differ; the other indices keep pointing at older segments (and their
 * transport locators) through effective_segments().
 */

#include "usync/config/config.hpp"
#include "usync/core/result.hpp"
#include "usync/events/event_bus.hpp"
#include "usync/metadata/store.hpp"
#include "usync/metadata/types.hpp"
#include "usync/sync/scanner.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace usync::sync {

/**
 * @brief Latest committed state of one folder
 */
struct FolderSnapshot {
    std::string folder_id;
    std::uint64_t version = 0;
    std::optional<metadata::FolderVersion> header;     ///< Absent at version 0
    std::vector<metadata::File> files;                 ///< Every head, deleted ones included
    std::map<std::string, std::vector<metadata::Segment>> segments; ///< file_id -> primary tiling
};

struct DeltaOptions {
    std::uint32_t segment_size = 768000;
    std::uint32_t redundancy_copies = 0;
};

/// First 32 hex chars of SHA-256(folder_id ":" path).
std::string make_file_id(const std::string& folder_id, const std::string& path);

/// First 32 hex chars of SHA-256(file_id ":" version ":" index ":" redundancy_index).
std::string make_segment_id(const std::string& file_id,
                            std::uint64_t version,
                            std::uint32_t segment_index,
                            std::uint32_t redundancy_index);

/**
 * @brief Resolve the tiling of one file version
 *
 * For each index below segment_count, picks the segment with the highest
 * version not above `version` among those with the given redundancy index.
 * Indices with no candidate are simply absent from the result.
 */
std::vector<metadata::Segment> effective_segments(const std::vector<metadata::Segment>& all,
                                                  std::uint64_t version,
                                                  std::uint32_t segment_count,
                                                  std::uint32_t redundancy_index = 0);

Result<FolderSnapshot> load_snapshot(const metadata::RecordStore& store, const std::string& folder_id);

/**
 * @brief Diff a scan against the previous snapshot
 *
 * Never touches the store. Integrity error when the snapshot's declared
 * totals (file count, total size, segment tiling) disagree with its detail
 * records; Validation error when the scan used a different segment size.
 */
Result<metadata::FolderVersionDelta> compute_delta(const FolderSnapshot& previous,
                                                   const ScanResult& current,
                                                   const DeltaOptions& options);

struct IndexResult {
    std::uint64_t version = 0;         ///< Folder version after the pass
    bool changed = false;
    metadata::ChangeSummary changes;
    std::size_t new_segments = 0;      ///< Primary and redundant copies
    std::uint64_t scheduled_bytes = 0; ///< Bytes the new segments will carry
};

/**
 * @brief Folder registry plus scan/diff/commit driver
 */
class VersioningEngine {
public:
    VersioningEngine(metadata::RecordStore& store,
                     config::SyncConfig config,
                     events::EventBus* bus = nullptr);

    Result<metadata::Folder> create_folder(const std::string& folder_id,
                                           const std::string& name,
                                           const std::string& path);

    /**
     * @brief Scan the folder's path and commit a new version if anything changed
     *
     * ConcurrencyConflict when another writer committed a version between
     * the snapshot read and the commit; the caller may simply index again.
     */
    Result<IndexResult> index_folder(const std::string& folder_id);

private:
    metadata::RecordStore& store_;
    config::SyncConfig config_;
    events::EventBus* bus_;
};

} // namespace usync::sync
