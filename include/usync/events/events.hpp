/**
 * @file events.hpp
 * @brief Domain events emitted while indexing, publishing and transferring
 *
 * NAMING CONVENTION:
 * Events are past-tense: FolderIndexedEvent, PackPostedEvent.
 */

#pragma once

#include "usync/metadata/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace usync::events {

// ════════════════════════════════════════════════════════
// Indexing Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted after a versioning pass committed a new folder version
 *
 * Not emitted for passes that found nothing to change.
 */
struct FolderIndexedEvent {
    std::string folder_id;
    std::uint64_t version;
    metadata::ChangeSummary changes;
    std::size_t new_segments;
    std::chrono::system_clock::time_point timestamp;

    FolderIndexedEvent(std::string id, std::uint64_t v, metadata::ChangeSummary c, std::size_t segments)
        : folder_id(std::move(id)),
          version(v),
          changes(c),
          new_segments(segments),
          timestamp(std::chrono::system_clock::now())
    {}
};

// ════════════════════════════════════════════════════════
// Transfer Events
// ════════════════════════════════════════════════════════

struct PackPostedEvent {
    std::string session_id;
    std::string locator;
    std::size_t segment_count;
    std::size_t bytes;
    std::chrono::system_clock::time_point timestamp;

    PackPostedEvent(std::string session, std::string loc, std::size_t segments, std::size_t size)
        : session_id(std::move(session)),
          locator(std::move(loc)),
          segment_count(segments),
          bytes(size),
          timestamp(std::chrono::system_clock::now())
    {}
};

struct SegmentCompletedEvent {
    std::string session_id;
    std::string segment_id;
    metadata::TransferDirection direction;
    std::size_t bytes;
    std::chrono::system_clock::time_point timestamp;

    SegmentCompletedEvent(std::string session, std::string segment,
                          metadata::TransferDirection dir, std::size_t size)
        : session_id(std::move(session)),
          segment_id(std::move(segment)),
          direction(dir),
          bytes(size),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Emitted for every failed attempt
 *
 * terminal is set once the segment's attempt budget for the run is spent.
 */
struct SegmentFailedEvent {
    std::string session_id;
    std::string segment_id;
    std::string file_path;
    std::uint32_t segment_index;
    std::uint32_t attempts;
    std::string reason;
    bool terminal;
    std::chrono::system_clock::time_point timestamp;

    SegmentFailedEvent(std::string session, std::string segment, std::string path,
                       std::uint32_t index, std::uint32_t tries, std::string why, bool is_terminal)
        : session_id(std::move(session)),
          segment_id(std::move(segment)),
          file_path(std::move(path)),
          segment_index(index),
          attempts(tries),
          reason(std::move(why)),
          terminal(is_terminal),
          timestamp(std::chrono::system_clock::now())
    {}
};

struct SessionCompletedEvent {
    std::string session_id;
    metadata::TransferDirection direction;
    std::size_t completed_segments;
    std::size_t failed_segments;
    std::chrono::milliseconds duration;
    std::chrono::system_clock::time_point timestamp;

    SessionCompletedEvent(std::string session, metadata::TransferDirection dir,
                          std::size_t completed, std::size_t failed, std::chrono::milliseconds dur)
        : session_id(std::move(session)),
          direction(dir),
          completed_segments(completed),
          failed_segments(failed),
          duration(dur),
          timestamp(std::chrono::system_clock::now())
    {}
};

// ════════════════════════════════════════════════════════
// Publishing Events
// ════════════════════════════════════════════════════════

struct ManifestPublishedEvent {
    std::string folder_id;
    std::uint64_t version;
    std::string locator;
    std::size_t bytes;
    std::chrono::system_clock::time_point timestamp;

    ManifestPublishedEvent(std::string id, std::uint64_t v, std::string loc, std::size_t size)
        : folder_id(std::move(id)),
          version(v),
          locator(std::move(loc)),
          bytes(size),
          timestamp(std::chrono::system_clock::now())
    {}
};

struct ShareCreatedEvent {
    std::string folder_id;
    std::uint64_t version;
    metadata::ShareType share_type;
    std::chrono::system_clock::time_point timestamp;

    ShareCreatedEvent(std::string id, std::uint64_t v, metadata::ShareType type)
        : folder_id(std::move(id)),
          version(v),
          share_type(type),
          timestamp(std::chrono::system_clock::now())
    {}
};

} // namespace usync::events
