/**
 * @file components.hpp
 * @brief Event subscribers for logging and counters
 */

#pragma once

#include "usync/events/event_bus.hpp"
#include "usync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace usync::events {

/**
 * @brief Turns domain events into log lines
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<FolderIndexedEvent>([this](const FolderIndexedEvent& e) { on_folder_indexed(e); });
        bus_.subscribe<PackPostedEvent>([this](const PackPostedEvent& e) { on_pack_posted(e); });
        bus_.subscribe<SegmentCompletedEvent>([this](const SegmentCompletedEvent& e) { on_segment_completed(e); });
        bus_.subscribe<SegmentFailedEvent>([this](const SegmentFailedEvent& e) { on_segment_failed(e); });
        bus_.subscribe<SessionCompletedEvent>([this](const SessionCompletedEvent& e) { on_session_completed(e); });
        bus_.subscribe<ManifestPublishedEvent>([this](const ManifestPublishedEvent& e) { on_manifest_published(e); });
        bus_.subscribe<ShareCreatedEvent>([this](const ShareCreatedEvent& e) { on_share_created(e); });
    }

private:
    void on_folder_indexed(const FolderIndexedEvent& e) {
        spdlog::info("[FolderIndexed] folder={} version={} added={} modified={} deleted={} segments={}",
                     e.folder_id, e.version, e.changes.added, e.changes.modified,
                     e.changes.deleted, e.new_segments);
    }

    void on_pack_posted(const PackPostedEvent& e) {
        spdlog::info("[PackPosted] session={} segments={} bytes={}", e.session_id, e.segment_count, e.bytes);
    }

    void on_segment_completed(const SegmentCompletedEvent& e) {
        spdlog::debug("[SegmentCompleted] session={} segment={} direction={}",
                      e.session_id, e.segment_id, metadata::to_string(e.direction));
    }

    void on_segment_failed(const SegmentFailedEvent& e) {
        spdlog::warn("[SegmentFailed] session={} path={} index={} attempts={} terminal={} reason={}",
                     e.session_id, e.file_path, e.segment_index, e.attempts, e.terminal, e.reason);
    }

    void on_session_completed(const SessionCompletedEvent& e) {
        spdlog::info("[SessionCompleted] session={} direction={} completed={} failed={} duration={}ms",
                     e.session_id, metadata::to_string(e.direction), e.completed_segments,
                     e.failed_segments, e.duration.count());
    }

    void on_manifest_published(const ManifestPublishedEvent& e) {
        spdlog::info("[ManifestPublished] folder={} version={} bytes={}", e.folder_id, e.version, e.bytes);
    }

    void on_share_created(const ShareCreatedEvent& e) {
        spdlog::info("[ShareCreated] folder={} version={} type={}",
                     e.folder_id, e.version, metadata::to_string(e.share_type));
    }

    EventBus& bus_;
};

/**
 * @brief Lock-free counters fed by domain events
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> folder_versions{0};
        std::atomic<std::uint64_t> segments_indexed{0};
        std::atomic<std::uint64_t> packs_posted{0};
        std::atomic<std::uint64_t> bytes_posted{0};
        std::atomic<std::uint64_t> segments_uploaded{0};
        std::atomic<std::uint64_t> segments_downloaded{0};
        std::atomic<std::uint64_t> bytes_downloaded{0};
        std::atomic<std::uint64_t> segment_failures{0};
        std::atomic<std::uint64_t> terminal_failures{0};
        std::atomic<std::uint64_t> sessions_completed{0};
        std::atomic<std::uint64_t> manifests_published{0};
        std::atomic<std::uint64_t> shares_created{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<FolderIndexedEvent>([this](const FolderIndexedEvent& e) {
            stats_.folder_versions++;
            stats_.segments_indexed += e.new_segments;
        });

        bus_.subscribe<PackPostedEvent>([this](const PackPostedEvent& e) {
            stats_.packs_posted++;
            stats_.bytes_posted += e.bytes;
        });

        bus_.subscribe<SegmentCompletedEvent>([this](const SegmentCompletedEvent& e) {
            on_segment_completed(e);
        });

        bus_.subscribe<SegmentFailedEvent>([this](const SegmentFailedEvent& e) {
            stats_.segment_failures++;
            if (e.terminal) {
                stats_.terminal_failures++;
            }
        });

        bus_.subscribe<SessionCompletedEvent>([this](const SessionCompletedEvent&) {
            stats_.sessions_completed++;
        });

        bus_.subscribe<ManifestPublishedEvent>([this](const ManifestPublishedEvent&) {
            stats_.manifests_published++;
        });

        bus_.subscribe<ShareCreatedEvent>([this](const ShareCreatedEvent&) {
            stats_.shares_created++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("Transfer statistics:");
        spdlog::info("  Folder versions:     {}", stats_.folder_versions.load());
        spdlog::info("  Segments indexed:    {}", stats_.segments_indexed.load());
        spdlog::info("  Packs posted:        {}", stats_.packs_posted.load());
        spdlog::info("  Bytes posted:        {}", stats_.bytes_posted.load());
        spdlog::info("  Segments uploaded:   {}", stats_.segments_uploaded.load());
        spdlog::info("  Segments downloaded: {}", stats_.segments_downloaded.load());
        spdlog::info("  Bytes downloaded:    {}", stats_.bytes_downloaded.load());
        spdlog::info("  Segment failures:    {} ({} terminal)",
                     stats_.segment_failures.load(), stats_.terminal_failures.load());
        spdlog::info("  Sessions completed:  {}", stats_.sessions_completed.load());
    }

private:
    void on_segment_completed(const SegmentCompletedEvent& e) {
        if (e.direction == metadata::TransferDirection::Upload) {
            stats_.segments_uploaded++;
        } else {
            stats_.segments_downloaded++;
            stats_.bytes_downloaded += e.bytes;
        }
    }

    EventBus& bus_;
    Stats stats_;
};

} // namespace usync::events
