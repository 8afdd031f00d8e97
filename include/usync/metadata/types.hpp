#pragma once

/**
 * @file types.hpp
 * @brief Typed records persisted by usync stores
 *
 * Versioned records (FolderVersion, FileVersion, Segment) are append-only.
 * The only mutation ever applied after creation is attaching a transport
 * locator to a Segment once its pack has been posted.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace usync {
namespace metadata {

enum class ChangeType : std::uint8_t {
    Create,
    Modify,
    Delete
};

struct ChangeSummary {
    std::uint32_t added = 0;
    std::uint32_t modified = 0;
    std::uint32_t deleted = 0;

    std::uint32_t total() const { return added + modified + deleted; }

    bool operator==(const ChangeSummary& other) const {
        return added == other.added && modified == other.modified && deleted == other.deleted;
    }
};

/**
 * @brief A synchronized folder; owns Files
 */
struct Folder {
    std::string folder_id;
    std::string name;
    std::string path;                  // Local root
    std::uint64_t current_version = 0; // 0 until the first index pass
};

/**
 * @brief Immutable snapshot header of one folder version
 */
struct FolderVersion {
    std::string folder_id;
    std::uint64_t version = 0;
    std::uint64_t file_count = 0;  // Live (non-deleted) files
    std::uint64_t total_size = 0;  // Sum of live file sizes
    ChangeSummary changes;
};

/**
 * @brief Latest state of one file inside a folder
 */
struct File {
    std::string file_id;
    std::string folder_id;
    std::string path;                  // Relative POSIX path
    std::uint64_t current_version = 0;
    std::uint64_t current_size = 0;
    std::string current_hash;          // SHA-256 hex
    std::int64_t modified_time = 0;    // Unix seconds
    std::uint32_t segment_count = 0;
    bool is_deleted = false;
};

struct FileVersion {
    std::string file_id;
    std::string folder_id;
    std::uint64_t version = 0;
    std::uint64_t size = 0;
    std::string hash;
    std::int64_t modified_time = 0;
    ChangeType change_type = ChangeType::Create;
    std::uint32_t segment_count = 0;
    std::vector<std::uint32_t> changed_segments; // Indices relative to the prior version
};

/**
 * @brief Fixed-offset chunk of one FileVersion's bytes
 *
 * redundancy_index 0 is the primary copy; >0 are duplicates carrying the
 * same content. locator is empty until the pack holding it is posted.
 */
struct Segment {
    std::string segment_id;
    std::string folder_id;
    std::string file_id;
    std::uint64_t version = 0;
    std::uint32_t segment_index = 0;
    std::uint64_t offset = 0;
    std::uint32_t size = 0;
    std::string content_hash;
    std::uint32_t redundancy_index = 0;
    std::string locator;
    bool uploaded = false;
};

/**
 * @brief Everything one versioning pass adds to the store
 *
 * Applied atomically: only if the folder is still at base_version.
 */
struct FolderVersionDelta {
    std::string folder_id;
    std::uint64_t base_version = 0;
    FolderVersion folder_version;
    std::vector<File> files;                // Upserted file heads
    std::vector<FileVersion> file_versions; // New versions only
    std::vector<Segment> segments;          // New segments only

    bool empty() const { return file_versions.empty(); }
};

enum class ShareType : std::uint8_t {
    Public,
    Private,
    Protected
};

struct Share {
    std::string token;           // Opaque, random; encodes nothing
    std::string folder_id;
    std::uint64_t folder_version = 0;
    ShareType share_type = ShareType::Public;
    std::string metadata;        // JSON object text
    std::string manifest_locator;
    std::int64_t created_at = 0;
};

enum class TransferDirection : std::uint8_t {
    Upload,
    Download
};

enum class SegmentStatus : std::uint8_t {
    Pending,
    InProgress,
    Complete,
    Failed
};

enum class SessionState : std::uint8_t {
    Active,
    Paused,
    Completed,
    Cancelled
};

struct TransferSession {
    std::string session_id;
    TransferDirection direction = TransferDirection::Upload;
    std::string target;                  // Folder id (upload) or share token (download)
    std::string folder_id;
    std::uint64_t folder_version = 0;
    std::uint64_t total_segments = 0;
    std::uint64_t completed_segments = 0;
    SessionState state = SessionState::Active;
    std::string last_completed;          // segment_id of the last durable completion
    std::int64_t created_at = 0;
    std::int64_t updated_at = 0;
};

/**
 * @brief Durable per-segment state of one TransferSession
 */
struct SegmentProgress {
    std::string session_id;
    std::string segment_id;
    std::uint64_t order = 0;             // Stable claim order
    std::string file_path;
    std::uint32_t segment_index = 0;
    SegmentStatus status = SegmentStatus::Pending;
    std::uint32_t attempts = 0;
    std::string lease_owner;
    std::int64_t lease_expires_ms = 0;   // Unix epoch milliseconds
    std::string last_error;
};

const char* to_string(ChangeType type);
const char* to_string(ShareType type);
const char* to_string(TransferDirection direction);
const char* to_string(SegmentStatus status);
const char* to_string(SessionState state);

ShareType share_type_from_string(const std::string& text);

} // namespace metadata
} // namespace usync
