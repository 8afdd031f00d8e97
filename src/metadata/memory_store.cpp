#include "usync/metadata/memory_store.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>

namespace usync::metadata {
namespace {

std::int64_t now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

Result<void> MemoryRecordStore::create_folder(const Folder& folder) {
    if (folder.folder_id.empty()) {
        return Err<void>(ErrorCode::Validation, "Folder id must not be empty");
    }

    std::unique_lock lock(mutex_);
    if (folders_.count(folder.folder_id) > 0) {
        return Err<void>(ErrorCode::Validation, "Folder already exists: " + folder.folder_id);
    }
    FolderData data;
    data.folder = folder;
    folders_.emplace(folder.folder_id, std::move(data));
    return Ok();
}

Result<Folder> MemoryRecordStore::get_folder(const std::string& folder_id) const {
    std::shared_lock lock(mutex_);
    auto it = folders_.find(folder_id);
    if (it == folders_.end()) {
        return Err<Folder>(ErrorCode::NotFound, "Folder not found: " + folder_id);
    }
    return Ok(it->second.folder);
}

Result<void> MemoryRecordStore::apply_delta(const FolderVersionDelta& delta) {
    if (auto valid = validate_delta(delta); valid.is_error()) {
        return valid;
    }

    std::unique_lock lock(mutex_);
    auto it = folders_.find(delta.folder_id);
    if (it == folders_.end()) {
        return Err<void>(ErrorCode::NotFound, "Folder not found: " + delta.folder_id);
    }
    auto& data = it->second;

    if (data.folder.current_version != delta.base_version) {
        return Err<void>(ErrorCode::ConcurrencyConflict,
                         "Folder " + delta.folder_id + " moved to version " +
                         std::to_string(data.folder.current_version) + " (expected " +
                         std::to_string(delta.base_version) + ")");
    }
    for (const auto& segment : delta.segments) {
        if (data.segments.count(segment.segment_id) > 0) {
            return Err<void>(ErrorCode::Validation, "Segment already exists: " + segment.segment_id);
        }
    }

    data.versions[delta.folder_version.version] = delta.folder_version;
    for (const auto& file : delta.files) {
        data.files[file.file_id] = file;
    }
    for (const auto& version : delta.file_versions) {
        data.file_versions[version.file_id].push_back(version);
    }
    for (const auto& segment : delta.segments) {
        data.segments.emplace(segment.segment_id, segment);
        data.segments_by_file[segment.file_id].push_back(segment.segment_id);
    }
    data.folder.current_version = delta.folder_version.version;
    return Ok();
}

Result<FolderVersion> MemoryRecordStore::get_folder_version(const std::string& folder_id,
                                                            std::uint64_t version) const {
    std::shared_lock lock(mutex_);
    auto it = folders_.find(folder_id);
    if (it == folders_.end()) {
        return Err<FolderVersion>(ErrorCode::NotFound, "Folder not found: " + folder_id);
    }
    auto version_it = it->second.versions.find(version);
    if (version_it == it->second.versions.end()) {
        return Err<FolderVersion>(ErrorCode::NotFound,
                                  "Folder version not found: " + folder_id + "@" + std::to_string(version));
    }
    return Ok(version_it->second);
}

Result<std::vector<File>> MemoryRecordStore::list_files(const std::string& folder_id) const {
    std::shared_lock lock(mutex_);
    auto it = folders_.find(folder_id);
    if (it == folders_.end()) {
        return Err<std::vector<File>>(ErrorCode::NotFound, "Folder not found: " + folder_id);
    }
    std::vector<File> files;
    files.reserve(it->second.files.size());
    for (const auto& [_, file] : it->second.files) {
        files.push_back(file);
    }
    return Ok(std::move(files));
}

Result<std::vector<FileVersion>> MemoryRecordStore::list_file_versions(const std::string& folder_id,
                                                                       const std::string& file_id) const {
    std::shared_lock lock(mutex_);
    auto it = folders_.find(folder_id);
    if (it == folders_.end()) {
        return Err<std::vector<FileVersion>>(ErrorCode::NotFound, "Folder not found: " + folder_id);
    }
    auto versions_it = it->second.file_versions.find(file_id);
    if (versions_it == it->second.file_versions.end()) {
        return Ok(std::vector<FileVersion>{});
    }
    return Ok(versions_it->second);
}

Result<std::vector<Segment>> MemoryRecordStore::list_segments(const std::string& folder_id,
                                                              const std::string& file_id) const {
    std::shared_lock lock(mutex_);
    auto it = folders_.find(folder_id);
    if (it == folders_.end()) {
        return Err<std::vector<Segment>>(ErrorCode::NotFound, "Folder not found: " + folder_id);
    }
    std::vector<Segment> segments;
    auto by_file = it->second.segments_by_file.find(file_id);
    if (by_file != it->second.segments_by_file.end()) {
        for (const auto& segment_id : by_file->second) {
            segments.push_back(it->second.segments.at(segment_id));
        }
    }
    return Ok(std::move(segments));
}

Result<std::vector<Segment>> MemoryRecordStore::list_unuploaded_segments(const std::string& folder_id) const {
    std::shared_lock lock(mutex_);
    auto it = folders_.find(folder_id);
    if (it == folders_.end()) {
        return Err<std::vector<Segment>>(ErrorCode::NotFound, "Folder not found: " + folder_id);
    }
    std::vector<Segment> segments;
    for (const auto& [_, segment] : it->second.segments) {
        if (!segment.uploaded) {
            segments.push_back(segment);
        }
    }
    return Ok(std::move(segments));
}

Result<Segment> MemoryRecordStore::get_segment(const std::string& folder_id,
                                               const std::string& segment_id) const {
    std::shared_lock lock(mutex_);
    auto it = folders_.find(folder_id);
    if (it == folders_.end()) {
        return Err<Segment>(ErrorCode::NotFound, "Folder not found: " + folder_id);
    }
    auto segment_it = it->second.segments.find(segment_id);
    if (segment_it == it->second.segments.end()) {
        return Err<Segment>(ErrorCode::NotFound, "Segment not found: " + segment_id);
    }
    return Ok(segment_it->second);
}

Result<void> MemoryRecordStore::attach_locator(const std::string& folder_id,
                                               const std::string& segment_id,
                                               const std::string& locator) {
    if (locator.empty()) {
        return Err<void>(ErrorCode::Validation, "Locator must not be empty");
    }

    std::unique_lock lock(mutex_);
    auto it = folders_.find(folder_id);
    if (it == folders_.end()) {
        return Err<void>(ErrorCode::NotFound, "Folder not found: " + folder_id);
    }
    auto segment_it = it->second.segments.find(segment_id);
    if (segment_it == it->second.segments.end()) {
        return Err<void>(ErrorCode::NotFound, "Segment not found: " + segment_id);
    }
    segment_it->second.locator = locator;
    segment_it->second.uploaded = true;
    return Ok();
}

Result<void> MemoryRecordStore::create_share(const Share& share) {
    if (share.token.empty()) {
        return Err<void>(ErrorCode::Validation, "Share token must not be empty");
    }

    std::unique_lock lock(mutex_);
    if (!shares_.emplace(share.token, share).second) {
        return Err<void>(ErrorCode::Validation, "Share token already in use");
    }
    return Ok();
}

Result<Share> MemoryRecordStore::get_share(const std::string& token) const {
    std::shared_lock lock(mutex_);
    auto it = shares_.find(token);
    if (it == shares_.end()) {
        return Err<Share>(ErrorCode::NotFound, "Share not found");
    }
    return Ok(it->second);
}

Result<void> MemoryRecordStore::create_session(const TransferSession& session,
                                               const std::vector<SegmentProgress>& progress) {
    std::unique_lock lock(mutex_);
    if (sessions_.count(session.session_id) > 0) {
        return Err<void>(ErrorCode::Validation, "Session already exists: " + session.session_id);
    }
    SessionData data;
    data.session = session;
    for (const auto& row : progress) {
        data.progress.emplace(row.segment_id, row);
    }
    sessions_.emplace(session.session_id, std::move(data));
    return Ok();
}

Result<TransferSession> MemoryRecordStore::get_session(const std::string& session_id) const {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return Err<TransferSession>(ErrorCode::NotFound, "Session not found: " + session_id);
    }
    return Ok(it->second.session);
}

Result<void> MemoryRecordStore::set_session_state(const std::string& session_id, SessionState state) {
    std::unique_lock lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return Err<void>(ErrorCode::NotFound, "Session not found: " + session_id);
    }
    it->second.session.state = state;
    it->second.session.updated_at = now_seconds();
    return Ok();
}

Result<std::vector<SegmentProgress>> MemoryRecordStore::list_progress(const std::string& session_id) const {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return Err<std::vector<SegmentProgress>>(ErrorCode::NotFound, "Session not found: " + session_id);
    }
    std::vector<SegmentProgress> rows;
    rows.reserve(it->second.progress.size());
    for (const auto& [_, row] : it->second.progress) {
        rows.push_back(row);
    }
    std::sort(rows.begin(), rows.end(), [](const SegmentProgress& lhs, const SegmentProgress& rhs) {
        return lhs.order < rhs.order;
    });
    return Ok(std::move(rows));
}

Result<bool> MemoryRecordStore::compare_and_set_progress(const SegmentProgress& expected,
                                                         const SegmentProgress& desired) {
    if (desired.status == SegmentStatus::Complete) {
        return Err<bool>(ErrorCode::Validation, "Use complete_segment to mark completion");
    }

    std::unique_lock lock(mutex_);
    auto it = sessions_.find(expected.session_id);
    if (it == sessions_.end()) {
        return Err<bool>(ErrorCode::NotFound, "Session not found: " + expected.session_id);
    }
    auto row = it->second.progress.find(expected.segment_id);
    if (row == it->second.progress.end()) {
        return Err<bool>(ErrorCode::NotFound, "Segment not in session: " + expected.segment_id);
    }
    if (!progress_matches(row->second, expected)) {
        return Ok(false);
    }

    SegmentProgress next = desired;
    next.session_id = row->second.session_id;
    next.segment_id = row->second.segment_id;
    next.order = row->second.order;
    row->second = std::move(next);
    return Ok(true);
}

Result<bool> MemoryRecordStore::complete_segment(const std::string& session_id,
                                                 const std::string& segment_id) {
    std::unique_lock lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return Err<bool>(ErrorCode::NotFound, "Session not found: " + session_id);
    }
    auto row = it->second.progress.find(segment_id);
    if (row == it->second.progress.end()) {
        return Err<bool>(ErrorCode::NotFound, "Segment not in session: " + segment_id);
    }
    if (row->second.status == SegmentStatus::Complete) {
        return Ok(false);
    }

    row->second.status = SegmentStatus::Complete;
    row->second.lease_owner.clear();
    row->second.lease_expires_ms = 0;
    row->second.last_error.clear();

    auto& session = it->second.session;
    session.completed_segments += 1;
    session.last_completed = segment_id;
    session.updated_at = now_seconds();
    if (session.completed_segments >= session.total_segments && session.state == SessionState::Active) {
        session.state = SessionState::Completed;
    }
    return Ok(true);
}

} // namespace usync::metadata
