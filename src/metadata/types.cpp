#include "usync/metadata/types.hpp"

namespace usync::metadata {

const char* to_string(ChangeType type) {
    switch (type) {
        case ChangeType::Create: return "create";
        case ChangeType::Modify: return "modify";
        case ChangeType::Delete: return "delete";
    }
    return "unknown";
}

const char* to_string(ShareType type) {
    switch (type) {
        case ShareType::Public: return "public";
        case ShareType::Private: return "private";
        case ShareType::Protected: return "protected";
    }
    return "unknown";
}

const char* to_string(TransferDirection direction) {
    return direction == TransferDirection::Upload ? "upload" : "download";
}

const char* to_string(SegmentStatus status) {
    switch (status) {
        case SegmentStatus::Pending: return "pending";
        case SegmentStatus::InProgress: return "in_progress";
        case SegmentStatus::Complete: return "complete";
        case SegmentStatus::Failed: return "failed";
    }
    return "unknown";
}

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Active: return "active";
        case SessionState::Paused: return "paused";
        case SessionState::Completed: return "completed";
        case SessionState::Cancelled: return "cancelled";
    }
    return "unknown";
}

ShareType share_type_from_string(const std::string& text) {
    if (text == "private") return ShareType::Private;
    if (text == "protected") return ShareType::Protected;
    return ShareType::Public;
}

} // namespace usync::metadata
