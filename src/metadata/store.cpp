#include "usync/metadata/store.hpp"

#include <unordered_set>

namespace usync::metadata {

Result<void> validate_delta(const FolderVersionDelta& delta) {
    if (delta.folder_id.empty()) {
        return Err<void>(ErrorCode::Validation, "Delta has no folder id");
    }
    if (delta.folder_version.folder_id != delta.folder_id) {
        return Err<void>(ErrorCode::Validation, "Delta folder version belongs to another folder");
    }
    if (delta.folder_version.version != delta.base_version + 1) {
        return Err<void>(ErrorCode::Validation,
                         "Delta version " + std::to_string(delta.folder_version.version) +
                         " does not follow base " + std::to_string(delta.base_version));
    }

    for (const auto& file : delta.files) {
        if (file.folder_id != delta.folder_id || file.file_id.empty()) {
            return Err<void>(ErrorCode::Validation, "Delta file record is malformed: " + file.path);
        }
    }
    for (const auto& version : delta.file_versions) {
        if (version.folder_id != delta.folder_id || version.version == 0) {
            return Err<void>(ErrorCode::Validation, "Delta file version is malformed: " + version.file_id);
        }
    }

    std::unordered_set<std::string> segment_ids;
    for (const auto& segment : delta.segments) {
        if (segment.folder_id != delta.folder_id) {
            return Err<void>(ErrorCode::Validation, "Delta segment belongs to another folder: " + segment.segment_id);
        }
        if (segment.size == 0) {
            return Err<void>(ErrorCode::Validation, "Delta segment is empty: " + segment.segment_id);
        }
        if (!segment_ids.insert(segment.segment_id).second) {
            return Err<void>(ErrorCode::Validation, "Duplicate segment id in delta: " + segment.segment_id);
        }
    }
    return Ok();
}

} // namespace usync::metadata
