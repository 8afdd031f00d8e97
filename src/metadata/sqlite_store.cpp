#include "usync/metadata/sqlite_store.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <sstream>
#include <stdexcept>

namespace usync::metadata {
namespace {

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS folders(
    folder_id TEXT PRIMARY KEY,
    name TEXT NOT NULL,
    path TEXT NOT NULL,
    current_version INTEGER NOT NULL DEFAULT 0);
CREATE TABLE IF NOT EXISTS folder_versions(
    folder_id TEXT NOT NULL REFERENCES folders(folder_id),
    version INTEGER NOT NULL,
    file_count INTEGER NOT NULL,
    total_size INTEGER NOT NULL,
    added INTEGER NOT NULL,
    modified INTEGER NOT NULL,
    deleted INTEGER NOT NULL,
    PRIMARY KEY(folder_id, version));
CREATE TABLE IF NOT EXISTS files(
    file_id TEXT PRIMARY KEY,
    folder_id TEXT NOT NULL REFERENCES folders(folder_id),
    path TEXT NOT NULL,
    current_version INTEGER NOT NULL,
    current_size INTEGER NOT NULL,
    current_hash TEXT NOT NULL,
    modified_time INTEGER NOT NULL,
    segment_count INTEGER NOT NULL,
    is_deleted INTEGER NOT NULL);
CREATE INDEX IF NOT EXISTS idx_files_folder ON files(folder_id);
CREATE TABLE IF NOT EXISTS file_versions(
    file_id TEXT NOT NULL,
    version INTEGER NOT NULL,
    folder_id TEXT NOT NULL REFERENCES folders(folder_id),
    size INTEGER NOT NULL,
    hash TEXT NOT NULL,
    modified_time INTEGER NOT NULL,
    change_type INTEGER NOT NULL,
    segment_count INTEGER NOT NULL,
    changed_segments TEXT NOT NULL,
    PRIMARY KEY(file_id, version));
CREATE TABLE IF NOT EXISTS segments(
    segment_id TEXT PRIMARY KEY,
    folder_id TEXT NOT NULL REFERENCES folders(folder_id),
    file_id TEXT NOT NULL,
    version INTEGER NOT NULL,
    segment_index INTEGER NOT NULL,
    byte_offset INTEGER NOT NULL,
    size INTEGER NOT NULL,
    content_hash TEXT NOT NULL,
    redundancy_index INTEGER NOT NULL,
    locator TEXT NOT NULL DEFAULT '',
    uploaded INTEGER NOT NULL DEFAULT 0);
CREATE INDEX IF NOT EXISTS idx_segments_file ON segments(file_id, segment_index);
CREATE INDEX IF NOT EXISTS idx_segments_pending ON segments(folder_id, uploaded);
CREATE TABLE IF NOT EXISTS shares(
    token TEXT PRIMARY KEY,
    folder_id TEXT NOT NULL,
    folder_version INTEGER NOT NULL,
    share_type INTEGER NOT NULL,
    metadata TEXT NOT NULL,
    manifest_locator TEXT NOT NULL,
    created_at INTEGER NOT NULL);
CREATE TABLE IF NOT EXISTS sessions(
    session_id TEXT PRIMARY KEY,
    direction INTEGER NOT NULL,
    target TEXT NOT NULL,
    folder_id TEXT NOT NULL,
    folder_version INTEGER NOT NULL,
    total_segments INTEGER NOT NULL,
    completed_segments INTEGER NOT NULL,
    state INTEGER NOT NULL,
    last_completed TEXT NOT NULL,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL);
CREATE TABLE IF NOT EXISTS segment_progress(
    session_id TEXT NOT NULL REFERENCES sessions(session_id),
    segment_id TEXT NOT NULL,
    ord INTEGER NOT NULL,
    file_path TEXT NOT NULL,
    segment_index INTEGER NOT NULL,
    status INTEGER NOT NULL,
    attempts INTEGER NOT NULL,
    lease_owner TEXT NOT NULL,
    lease_expires_ms INTEGER NOT NULL,
    last_error TEXT NOT NULL,
    PRIMARY KEY(session_id, segment_id));
)sql";

constexpr const char* kSegmentColumns =
    "segment_id,folder_id,file_id,version,segment_index,byte_offset,size,content_hash,"
    "redundancy_index,locator,uploaded";

constexpr const char* kSessionColumns =
    "session_id,direction,target,folder_id,folder_version,total_segments,completed_segments,"
    "state,last_completed,created_at,updated_at";

constexpr const char* kProgressColumns =
    "session_id,segment_id,ord,file_path,segment_index,status,attempts,lease_owner,"
    "lease_expires_ms,last_error";

std::int64_t now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string join_indices(const std::vector<std::uint32_t>& indices) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < indices.size(); ++i) {
        if (i > 0) {
            oss << ',';
        }
        oss << indices[i];
    }
    return oss.str();
}

std::vector<std::uint32_t> split_indices(const std::string& text) {
    std::vector<std::uint32_t> indices;
    std::istringstream iss(text);
    std::string part;
    while (std::getline(iss, part, ',')) {
        if (!part.empty()) {
            indices.push_back(static_cast<std::uint32_t>(std::stoul(part)));
        }
    }
    return indices;
}

Segment read_segment(const Statement& st) {
    Segment segment;
    segment.segment_id = st.column_text(0);
    segment.folder_id = st.column_text(1);
    segment.file_id = st.column_text(2);
    segment.version = st.column_u64(3);
    segment.segment_index = st.column_u32(4);
    segment.offset = st.column_u64(5);
    segment.size = st.column_u32(6);
    segment.content_hash = st.column_text(7);
    segment.redundancy_index = st.column_u32(8);
    segment.locator = st.column_text(9);
    segment.uploaded = st.column_int64(10) != 0;
    return segment;
}

TransferSession read_session(const Statement& st) {
    TransferSession session;
    session.session_id = st.column_text(0);
    session.direction = static_cast<TransferDirection>(st.column_int64(1));
    session.target = st.column_text(2);
    session.folder_id = st.column_text(3);
    session.folder_version = st.column_u64(4);
    session.total_segments = st.column_u64(5);
    session.completed_segments = st.column_u64(6);
    session.state = static_cast<SessionState>(st.column_int64(7));
    session.last_completed = st.column_text(8);
    session.created_at = st.column_int64(9);
    session.updated_at = st.column_int64(10);
    return session;
}

SegmentProgress read_progress(const Statement& st) {
    SegmentProgress row;
    row.session_id = st.column_text(0);
    row.segment_id = st.column_text(1);
    row.order = st.column_u64(2);
    row.file_path = st.column_text(3);
    row.segment_index = st.column_u32(4);
    row.status = static_cast<SegmentStatus>(st.column_int64(5));
    row.attempts = st.column_u32(6);
    row.lease_owner = st.column_text(7);
    row.lease_expires_ms = st.column_int64(8);
    row.last_error = st.column_text(9);
    return row;
}

} // namespace

SqliteRecordStore::SqliteRecordStore(const std::string& path)
    : db_(std::make_unique<SqliteDb>(path)) {
    auto migrated = migrate();
    if (migrated.is_error()) {
        throw std::runtime_error("Failed to migrate " + path + ": " + migrated.error().message);
    }
    spdlog::debug("Opened record store {}", path);
}

Result<void> SqliteRecordStore::migrate() {
    std::lock_guard lock(mutex_);
    return db_->exec(kSchema);
}

Result<void> SqliteRecordStore::create_folder(const Folder& folder) {
    if (folder.folder_id.empty()) {
        return Err<void>(ErrorCode::Validation, "Folder id must not be empty");
    }

    std::lock_guard lock(mutex_);
    auto prepared = db_->prepare("INSERT INTO folders(folder_id,name,path,current_version) VALUES(?,?,?,?);");
    if (prepared.is_error()) {
        return Err<void>(prepared.error());
    }
    auto& st = prepared.value();
    st.bind(1, folder.folder_id);
    st.bind(2, folder.name);
    st.bind(3, folder.path);
    st.bind(4, folder.current_version);
    const int rc = st.step();
    if (rc != SQLITE_DONE) {
        return Err<void>(db_->translate(rc, "Folder insert " + folder.folder_id));
    }
    return Ok();
}

Result<Folder> SqliteRecordStore::load_folder(const std::string& folder_id) const {
    auto prepared = db_->prepare("SELECT folder_id,name,path,current_version FROM folders WHERE folder_id=?;");
    if (prepared.is_error()) {
        return Err<Folder>(prepared.error());
    }
    auto& st = prepared.value();
    st.bind(1, folder_id);
    const int rc = st.step();
    if (rc == SQLITE_DONE) {
        return Err<Folder>(ErrorCode::NotFound, "Folder not found: " + folder_id);
    }
    if (rc != SQLITE_ROW) {
        return Err<Folder>(db_->translate(rc, "Folder lookup"));
    }
    Folder folder;
    folder.folder_id = st.column_text(0);
    folder.name = st.column_text(1);
    folder.path = st.column_text(2);
    folder.current_version = st.column_u64(3);
    return Ok(std::move(folder));
}

Result<Folder> SqliteRecordStore::get_folder(const std::string& folder_id) const {
    std::lock_guard lock(mutex_);
    return load_folder(folder_id);
}

Result<void> SqliteRecordStore::apply_delta(const FolderVersionDelta& delta) {
    if (auto valid = validate_delta(delta); valid.is_error()) {
        return valid;
    }

    std::lock_guard lock(mutex_);
    Transaction tx(*db_);
    if (auto begun = tx.begin(); begun.is_error()) {
        return begun;
    }

    // Version assignment: the folder row is the compare-and-set point
    auto bump = db_->prepare("UPDATE folders SET current_version=? WHERE folder_id=? AND current_version=?;");
    if (bump.is_error()) {
        return Err<void>(bump.error());
    }
    bump.value().bind(1, delta.folder_version.version);
    bump.value().bind(2, delta.folder_id);
    bump.value().bind(3, delta.base_version);
    if (const int rc = bump.value().step(); rc != SQLITE_DONE) {
        return Err<void>(db_->translate(rc, "Folder version bump"));
    }
    if (sqlite3_changes(db_->handle()) != 1) {
        auto folder = load_folder(delta.folder_id);
        if (folder.is_error()) {
            return Err<void>(folder.error());
        }
        return Err<void>(ErrorCode::ConcurrencyConflict,
                         "Folder " + delta.folder_id + " moved to version " +
                         std::to_string(folder.value().current_version) + " (expected " +
                         std::to_string(delta.base_version) + ")");
    }

    const auto& fv = delta.folder_version;
    auto version_st = db_->prepare(
        "INSERT INTO folder_versions(folder_id,version,file_count,total_size,added,modified,deleted) "
        "VALUES(?,?,?,?,?,?,?);");
    if (version_st.is_error()) {
        return Err<void>(version_st.error());
    }
    version_st.value().bind(1, fv.folder_id);
    version_st.value().bind(2, fv.version);
    version_st.value().bind(3, fv.file_count);
    version_st.value().bind(4, fv.total_size);
    version_st.value().bind(5, fv.changes.added);
    version_st.value().bind(6, fv.changes.modified);
    version_st.value().bind(7, fv.changes.deleted);
    if (const int rc = version_st.value().step(); rc != SQLITE_DONE) {
        return Err<void>(db_->translate(rc, "Folder version insert"));
    }

    auto file_st = db_->prepare(
        "INSERT INTO files(file_id,folder_id,path,current_version,current_size,current_hash,modified_time,"
        "segment_count,is_deleted) VALUES(?,?,?,?,?,?,?,?,?) "
        "ON CONFLICT(file_id) DO UPDATE SET path=excluded.path,current_version=excluded.current_version,"
        "current_size=excluded.current_size,current_hash=excluded.current_hash,"
        "modified_time=excluded.modified_time,segment_count=excluded.segment_count,"
        "is_deleted=excluded.is_deleted;");
    if (file_st.is_error()) {
        return Err<void>(file_st.error());
    }
    for (const auto& file : delta.files) {
        auto& st = file_st.value();
        st.reset();
        st.bind(1, file.file_id);
        st.bind(2, file.folder_id);
        st.bind(3, file.path);
        st.bind(4, file.current_version);
        st.bind(5, file.current_size);
        st.bind(6, file.current_hash);
        st.bind(7, file.modified_time);
        st.bind(8, file.segment_count);
        st.bind(9, file.is_deleted);
        if (const int rc = st.step(); rc != SQLITE_DONE) {
            return Err<void>(db_->translate(rc, "File upsert " + file.path));
        }
    }

    auto file_version_st = db_->prepare(
        "INSERT INTO file_versions(file_id,version,folder_id,size,hash,modified_time,change_type,"
        "segment_count,changed_segments) VALUES(?,?,?,?,?,?,?,?,?);");
    if (file_version_st.is_error()) {
        return Err<void>(file_version_st.error());
    }
    for (const auto& version : delta.file_versions) {
        auto& st = file_version_st.value();
        st.reset();
        st.bind(1, version.file_id);
        st.bind(2, version.version);
        st.bind(3, version.folder_id);
        st.bind(4, version.size);
        st.bind(5, version.hash);
        st.bind(6, version.modified_time);
        st.bind(7, static_cast<int>(version.change_type));
        st.bind(8, version.segment_count);
        st.bind(9, join_indices(version.changed_segments));
        if (const int rc = st.step(); rc != SQLITE_DONE) {
            return Err<void>(db_->translate(rc, "File version insert " + version.file_id));
        }
    }

    auto segment_st = db_->prepare(std::string("INSERT INTO segments(") + kSegmentColumns +
                                   ") VALUES(?,?,?,?,?,?,?,?,?,?,?);");
    if (segment_st.is_error()) {
        return Err<void>(segment_st.error());
    }
    for (const auto& segment : delta.segments) {
        auto& st = segment_st.value();
        st.reset();
        st.bind(1, segment.segment_id);
        st.bind(2, segment.folder_id);
        st.bind(3, segment.file_id);
        st.bind(4, segment.version);
        st.bind(5, segment.segment_index);
        st.bind(6, segment.offset);
        st.bind(7, segment.size);
        st.bind(8, segment.content_hash);
        st.bind(9, segment.redundancy_index);
        st.bind(10, segment.locator);
        st.bind(11, segment.uploaded);
        if (const int rc = st.step(); rc != SQLITE_DONE) {
            return Err<void>(db_->translate(rc, "Segment insert " + segment.segment_id));
        }
    }

    return tx.commit();
}

Result<FolderVersion> SqliteRecordStore::get_folder_version(const std::string& folder_id,
                                                            std::uint64_t version) const {
    std::lock_guard lock(mutex_);
    auto prepared = db_->prepare(
        "SELECT file_count,total_size,added,modified,deleted FROM folder_versions "
        "WHERE folder_id=? AND version=?;");
    if (prepared.is_error()) {
        return Err<FolderVersion>(prepared.error());
    }
    auto& st = prepared.value();
    st.bind(1, folder_id);
    st.bind(2, version);
    const int rc = st.step();
    if (rc == SQLITE_DONE) {
        return Err<FolderVersion>(ErrorCode::NotFound,
                                  "Folder version not found: " + folder_id + "@" + std::to_string(version));
    }
    if (rc != SQLITE_ROW) {
        return Err<FolderVersion>(db_->translate(rc, "Folder version lookup"));
    }
    FolderVersion result;
    result.folder_id = folder_id;
    result.version = version;
    result.file_count = st.column_u64(0);
    result.total_size = st.column_u64(1);
    result.changes.added = st.column_u32(2);
    result.changes.modified = st.column_u32(3);
    result.changes.deleted = st.column_u32(4);
    return Ok(std::move(result));
}

Result<std::vector<File>> SqliteRecordStore::list_files(const std::string& folder_id) const {
    std::lock_guard lock(mutex_);
    if (auto folder = load_folder(folder_id); folder.is_error()) {
        return Err<std::vector<File>>(folder.error());
    }
    auto prepared = db_->prepare(
        "SELECT file_id,folder_id,path,current_version,current_size,current_hash,modified_time,"
        "segment_count,is_deleted FROM files WHERE folder_id=? ORDER BY file_id;");
    if (prepared.is_error()) {
        return Err<std::vector<File>>(prepared.error());
    }
    auto& st = prepared.value();
    st.bind(1, folder_id);

    std::vector<File> files;
    int rc = SQLITE_OK;
    while ((rc = st.step()) == SQLITE_ROW) {
        File file;
        file.file_id = st.column_text(0);
        file.folder_id = st.column_text(1);
        file.path = st.column_text(2);
        file.current_version = st.column_u64(3);
        file.current_size = st.column_u64(4);
        file.current_hash = st.column_text(5);
        file.modified_time = st.column_int64(6);
        file.segment_count = st.column_u32(7);
        file.is_deleted = st.column_int64(8) != 0;
        files.push_back(std::move(file));
    }
    if (rc != SQLITE_DONE) {
        return Err<std::vector<File>>(db_->translate(rc, "File listing"));
    }
    return Ok(std::move(files));
}

Result<std::vector<FileVersion>> SqliteRecordStore::list_file_versions(const std::string& folder_id,
                                                                       const std::string& file_id) const {
    std::lock_guard lock(mutex_);
    if (auto folder = load_folder(folder_id); folder.is_error()) {
        return Err<std::vector<FileVersion>>(folder.error());
    }
    auto prepared = db_->prepare(
        "SELECT version,size,hash,modified_time,change_type,segment_count,changed_segments "
        "FROM file_versions WHERE folder_id=? AND file_id=? ORDER BY version;");
    if (prepared.is_error()) {
        return Err<std::vector<FileVersion>>(prepared.error());
    }
    auto& st = prepared.value();
    st.bind(1, folder_id);
    st.bind(2, file_id);

    std::vector<FileVersion> versions;
    int rc = SQLITE_OK;
    while ((rc = st.step()) == SQLITE_ROW) {
        FileVersion version;
        version.file_id = file_id;
        version.folder_id = folder_id;
        version.version = st.column_u64(0);
        version.size = st.column_u64(1);
        version.hash = st.column_text(2);
        version.modified_time = st.column_int64(3);
        version.change_type = static_cast<ChangeType>(st.column_int64(4));
        version.segment_count = st.column_u32(5);
        version.changed_segments = split_indices(st.column_text(6));
        versions.push_back(std::move(version));
    }
    if (rc != SQLITE_DONE) {
        return Err<std::vector<FileVersion>>(db_->translate(rc, "File version listing"));
    }
    return Ok(std::move(versions));
}

Result<std::vector<Segment>> SqliteRecordStore::query_segments(const std::string& sql,
                                                               const std::string& first,
                                                               const std::string& second) const {
    auto prepared = db_->prepare(sql);
    if (prepared.is_error()) {
        return Err<std::vector<Segment>>(prepared.error());
    }
    auto& st = prepared.value();
    st.bind(1, first);
    if (!second.empty()) {
        st.bind(2, second);
    }

    std::vector<Segment> segments;
    int rc = SQLITE_OK;
    while ((rc = st.step()) == SQLITE_ROW) {
        segments.push_back(read_segment(st));
    }
    if (rc != SQLITE_DONE) {
        return Err<std::vector<Segment>>(db_->translate(rc, "Segment query"));
    }
    return Ok(std::move(segments));
}

Result<std::vector<Segment>> SqliteRecordStore::list_segments(const std::string& folder_id,
                                                              const std::string& file_id) const {
    std::lock_guard lock(mutex_);
    if (auto folder = load_folder(folder_id); folder.is_error()) {
        return Err<std::vector<Segment>>(folder.error());
    }
    return query_segments(std::string("SELECT ") + kSegmentColumns +
                          " FROM segments WHERE folder_id=? AND file_id=? "
                          "ORDER BY version,segment_index,redundancy_index;",
                          folder_id, file_id);
}

Result<std::vector<Segment>> SqliteRecordStore::list_unuploaded_segments(const std::string& folder_id) const {
    std::lock_guard lock(mutex_);
    if (auto folder = load_folder(folder_id); folder.is_error()) {
        return Err<std::vector<Segment>>(folder.error());
    }
    return query_segments(std::string("SELECT ") + kSegmentColumns +
                          " FROM segments WHERE folder_id=? AND uploaded=0 ORDER BY segment_id;",
                          folder_id, std::string());
}

Result<Segment> SqliteRecordStore::get_segment(const std::string& folder_id,
                                               const std::string& segment_id) const {
    std::lock_guard lock(mutex_);
    auto rows = query_segments(std::string("SELECT ") + kSegmentColumns +
                               " FROM segments WHERE folder_id=? AND segment_id=?;",
                               folder_id, segment_id);
    if (rows.is_error()) {
        return Err<Segment>(rows.error());
    }
    if (rows.value().empty()) {
        return Err<Segment>(ErrorCode::NotFound, "Segment not found: " + segment_id);
    }
    return Ok(rows.value().front());
}

Result<void> SqliteRecordStore::attach_locator(const std::string& folder_id,
                                               const std::string& segment_id,
                                               const std::string& locator) {
    if (locator.empty()) {
        return Err<void>(ErrorCode::Validation, "Locator must not be empty");
    }

    std::lock_guard lock(mutex_);
    auto prepared = db_->prepare("UPDATE segments SET locator=?,uploaded=1 WHERE folder_id=? AND segment_id=?;");
    if (prepared.is_error()) {
        return Err<void>(prepared.error());
    }
    auto& st = prepared.value();
    st.bind(1, locator);
    st.bind(2, folder_id);
    st.bind(3, segment_id);
    if (const int rc = st.step(); rc != SQLITE_DONE) {
        return Err<void>(db_->translate(rc, "Locator update " + segment_id));
    }
    if (sqlite3_changes(db_->handle()) != 1) {
        return Err<void>(ErrorCode::NotFound, "Segment not found: " + segment_id);
    }
    return Ok();
}

Result<void> SqliteRecordStore::create_share(const Share& share) {
    if (share.token.empty()) {
        return Err<void>(ErrorCode::Validation, "Share token must not be empty");
    }

    std::lock_guard lock(mutex_);
    auto prepared = db_->prepare(
        "INSERT INTO shares(token,folder_id,folder_version,share_type,metadata,manifest_locator,created_at) "
        "VALUES(?,?,?,?,?,?,?);");
    if (prepared.is_error()) {
        return Err<void>(prepared.error());
    }
    auto& st = prepared.value();
    st.bind(1, share.token);
    st.bind(2, share.folder_id);
    st.bind(3, share.folder_version);
    st.bind(4, static_cast<int>(share.share_type));
    st.bind(5, share.metadata);
    st.bind(6, share.manifest_locator);
    st.bind(7, share.created_at);
    if (const int rc = st.step(); rc != SQLITE_DONE) {
        return Err<void>(db_->translate(rc, "Share insert"));
    }
    return Ok();
}

Result<Share> SqliteRecordStore::get_share(const std::string& token) const {
    std::lock_guard lock(mutex_);
    auto prepared = db_->prepare(
        "SELECT folder_id,folder_version,share_type,metadata,manifest_locator,created_at "
        "FROM shares WHERE token=?;");
    if (prepared.is_error()) {
        return Err<Share>(prepared.error());
    }
    auto& st = prepared.value();
    st.bind(1, token);
    const int rc = st.step();
    if (rc == SQLITE_DONE) {
        return Err<Share>(ErrorCode::NotFound, "Share not found");
    }
    if (rc != SQLITE_ROW) {
        return Err<Share>(db_->translate(rc, "Share lookup"));
    }
    Share share;
    share.token = token;
    share.folder_id = st.column_text(0);
    share.folder_version = st.column_u64(1);
    share.share_type = static_cast<ShareType>(st.column_int64(2));
    share.metadata = st.column_text(3);
    share.manifest_locator = st.column_text(4);
    share.created_at = st.column_int64(5);
    return Ok(std::move(share));
}

Result<void> SqliteRecordStore::create_session(const TransferSession& session,
                                               const std::vector<SegmentProgress>& progress) {
    std::lock_guard lock(mutex_);
    Transaction tx(*db_);
    if (auto begun = tx.begin(); begun.is_error()) {
        return begun;
    }

    auto session_st = db_->prepare(std::string("INSERT INTO sessions(") + kSessionColumns +
                                   ") VALUES(?,?,?,?,?,?,?,?,?,?,?);");
    if (session_st.is_error()) {
        return Err<void>(session_st.error());
    }
    auto& st = session_st.value();
    st.bind(1, session.session_id);
    st.bind(2, static_cast<int>(session.direction));
    st.bind(3, session.target);
    st.bind(4, session.folder_id);
    st.bind(5, session.folder_version);
    st.bind(6, session.total_segments);
    st.bind(7, session.completed_segments);
    st.bind(8, static_cast<int>(session.state));
    st.bind(9, session.last_completed);
    st.bind(10, session.created_at);
    st.bind(11, session.updated_at);
    if (const int rc = st.step(); rc != SQLITE_DONE) {
        return Err<void>(db_->translate(rc, "Session insert " + session.session_id));
    }

    auto progress_st = db_->prepare(std::string("INSERT INTO segment_progress(") + kProgressColumns +
                                    ") VALUES(?,?,?,?,?,?,?,?,?,?);");
    if (progress_st.is_error()) {
        return Err<void>(progress_st.error());
    }
    for (const auto& row : progress) {
        auto& ps = progress_st.value();
        ps.reset();
        ps.bind(1, row.session_id);
        ps.bind(2, row.segment_id);
        ps.bind(3, row.order);
        ps.bind(4, row.file_path);
        ps.bind(5, row.segment_index);
        ps.bind(6, static_cast<int>(row.status));
        ps.bind(7, row.attempts);
        ps.bind(8, row.lease_owner);
        ps.bind(9, row.lease_expires_ms);
        ps.bind(10, row.last_error);
        if (const int rc = ps.step(); rc != SQLITE_DONE) {
            return Err<void>(db_->translate(rc, "Progress insert " + row.segment_id));
        }
    }
    return tx.commit();
}

Result<TransferSession> SqliteRecordStore::get_session(const std::string& session_id) const {
    std::lock_guard lock(mutex_);
    auto prepared = db_->prepare(std::string("SELECT ") + kSessionColumns + " FROM sessions WHERE session_id=?;");
    if (prepared.is_error()) {
        return Err<TransferSession>(prepared.error());
    }
    auto& st = prepared.value();
    st.bind(1, session_id);
    const int rc = st.step();
    if (rc == SQLITE_DONE) {
        return Err<TransferSession>(ErrorCode::NotFound, "Session not found: " + session_id);
    }
    if (rc != SQLITE_ROW) {
        return Err<TransferSession>(db_->translate(rc, "Session lookup"));
    }
    return Ok(read_session(st));
}

Result<void> SqliteRecordStore::set_session_state(const std::string& session_id, SessionState state) {
    std::lock_guard lock(mutex_);
    auto prepared = db_->prepare("UPDATE sessions SET state=?,updated_at=? WHERE session_id=?;");
    if (prepared.is_error()) {
        return Err<void>(prepared.error());
    }
    auto& st = prepared.value();
    st.bind(1, static_cast<int>(state));
    st.bind(2, now_seconds());
    st.bind(3, session_id);
    if (const int rc = st.step(); rc != SQLITE_DONE) {
        return Err<void>(db_->translate(rc, "Session state update"));
    }
    if (sqlite3_changes(db_->handle()) != 1) {
        return Err<void>(ErrorCode::NotFound, "Session not found: " + session_id);
    }
    return Ok();
}

Result<std::vector<SegmentProgress>> SqliteRecordStore::list_progress(const std::string& session_id) const {
    std::lock_guard lock(mutex_);
    auto exists = db_->prepare("SELECT 1 FROM sessions WHERE session_id=?;");
    if (exists.is_error()) {
        return Err<std::vector<SegmentProgress>>(exists.error());
    }
    exists.value().bind(1, session_id);
    if (exists.value().step() != SQLITE_ROW) {
        return Err<std::vector<SegmentProgress>>(ErrorCode::NotFound, "Session not found: " + session_id);
    }

    auto prepared = db_->prepare(std::string("SELECT ") + kProgressColumns +
                                 " FROM segment_progress WHERE session_id=? ORDER BY ord;");
    if (prepared.is_error()) {
        return Err<std::vector<SegmentProgress>>(prepared.error());
    }
    auto& st = prepared.value();
    st.bind(1, session_id);

    std::vector<SegmentProgress> rows;
    int rc = SQLITE_OK;
    while ((rc = st.step()) == SQLITE_ROW) {
        rows.push_back(read_progress(st));
    }
    if (rc != SQLITE_DONE) {
        return Err<std::vector<SegmentProgress>>(db_->translate(rc, "Progress listing"));
    }
    return Ok(std::move(rows));
}

Result<bool> SqliteRecordStore::compare_and_set_progress(const SegmentProgress& expected,
                                                         const SegmentProgress& desired) {
    if (desired.status == SegmentStatus::Complete) {
        return Err<bool>(ErrorCode::Validation, "Use complete_segment to mark completion");
    }

    std::lock_guard lock(mutex_);
    auto prepared = db_->prepare(
        "UPDATE segment_progress SET status=?,attempts=?,lease_owner=?,lease_expires_ms=?,last_error=? "
        "WHERE session_id=? AND segment_id=? AND status=? AND attempts=? AND lease_owner=? "
        "AND lease_expires_ms=?;");
    if (prepared.is_error()) {
        return Err<bool>(prepared.error());
    }
    auto& st = prepared.value();
    st.bind(1, static_cast<int>(desired.status));
    st.bind(2, desired.attempts);
    st.bind(3, desired.lease_owner);
    st.bind(4, desired.lease_expires_ms);
    st.bind(5, desired.last_error);
    st.bind(6, expected.session_id);
    st.bind(7, expected.segment_id);
    st.bind(8, static_cast<int>(expected.status));
    st.bind(9, expected.attempts);
    st.bind(10, expected.lease_owner);
    st.bind(11, expected.lease_expires_ms);
    if (const int rc = st.step(); rc != SQLITE_DONE) {
        return Err<bool>(db_->translate(rc, "Progress compare-and-set"));
    }
    if (sqlite3_changes(db_->handle()) == 1) {
        return Ok(true);
    }

    auto exists = db_->prepare("SELECT 1 FROM segment_progress WHERE session_id=? AND segment_id=?;");
    if (exists.is_error()) {
        return Err<bool>(exists.error());
    }
    exists.value().bind(1, expected.session_id);
    exists.value().bind(2, expected.segment_id);
    if (exists.value().step() != SQLITE_ROW) {
        return Err<bool>(ErrorCode::NotFound, "Segment not in session: " + expected.segment_id);
    }
    return Ok(false);
}

Result<bool> SqliteRecordStore::complete_segment(const std::string& session_id,
                                                 const std::string& segment_id) {
    std::lock_guard lock(mutex_);
    Transaction tx(*db_);
    if (auto begun = tx.begin(); begun.is_error()) {
        return Err<bool>(begun.error());
    }

    auto current = db_->prepare("SELECT status FROM segment_progress WHERE session_id=? AND segment_id=?;");
    if (current.is_error()) {
        return Err<bool>(current.error());
    }
    current.value().bind(1, session_id);
    current.value().bind(2, segment_id);
    const int rc = current.value().step();
    if (rc == SQLITE_DONE) {
        return Err<bool>(ErrorCode::NotFound, "Segment not in session: " + segment_id);
    }
    if (rc != SQLITE_ROW) {
        return Err<bool>(db_->translate(rc, "Progress lookup"));
    }
    if (static_cast<SegmentStatus>(current.value().column_int64(0)) == SegmentStatus::Complete) {
        return Ok(false);
    }

    auto mark = db_->prepare(
        "UPDATE segment_progress SET status=?,lease_owner='',lease_expires_ms=0,last_error='' "
        "WHERE session_id=? AND segment_id=?;");
    if (mark.is_error()) {
        return Err<bool>(mark.error());
    }
    mark.value().bind(1, static_cast<int>(SegmentStatus::Complete));
    mark.value().bind(2, session_id);
    mark.value().bind(3, segment_id);
    if (const int mark_rc = mark.value().step(); mark_rc != SQLITE_DONE) {
        return Err<bool>(db_->translate(mark_rc, "Progress completion"));
    }

    auto counter = db_->prepare(
        "UPDATE sessions SET completed_segments=completed_segments+1,last_completed=?,updated_at=?,"
        "state=CASE WHEN completed_segments+1>=total_segments AND state=? THEN ? ELSE state END "
        "WHERE session_id=?;");
    if (counter.is_error()) {
        return Err<bool>(counter.error());
    }
    counter.value().bind(1, segment_id);
    counter.value().bind(2, now_seconds());
    counter.value().bind(3, static_cast<int>(SessionState::Active));
    counter.value().bind(4, static_cast<int>(SessionState::Completed));
    counter.value().bind(5, session_id);
    if (const int counter_rc = counter.value().step(); counter_rc != SQLITE_DONE) {
        return Err<bool>(db_->translate(counter_rc, "Session counter update"));
    }

    auto committed = tx.commit();
    if (committed.is_error()) {
        return Err<bool>(committed.error());
    }
    return Ok(true);
}

} // namespace usync::metadata
