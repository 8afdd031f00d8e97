#pragma once

/**
 * @file queue.hpp
 * @brief Resumable, lease-based work queue over persisted segment progress
 *
 * SEGMENT STATES:
 * Pending -> InProgress (claim, CAS) -> Complete | Failed
 * InProgress -> Pending when the lease expires or a retryable attempt fails
 * Failed -> Pending on the next start_or_resume()
 * Complete is terminal.
 *
 * SESSION STATES:
 * Active <-> Paused, Active|Paused -> Cancelled, Active -> Completed (set by
 * the store when the last segment completes). Completed is final. Cancelled
 * only leaves through start_or_resume(), which restarts it as a fresh run.
 *
 * Every state lives in the RecordStore, so a fresh TransferQueue over the
 * same store picks up exactly where a crashed one stopped.
 */

#include "usync/config/config.hpp"
#include "usync/core/result.hpp"
#include "usync/events/event_bus.hpp"
#include "usync/metadata/store.hpp"
#include "usync/metadata/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace usync::transfer {

/// Milliseconds since the Unix epoch.
using Clock = std::function<std::int64_t()>;

Clock system_clock_ms();

struct SegmentWork {
    std::string segment_id;
    std::string file_path;
    std::uint32_t segment_index = 0;
};

/**
 * @brief Everything needed to create a session that does not exist yet
 *
 * Ignored (apart from session_id) when the session is already persisted.
 */
struct SessionPlan {
    std::string session_id;
    metadata::TransferDirection direction = metadata::TransferDirection::Upload;
    std::string target;
    std::string folder_id;
    std::uint64_t folder_version = 0;
    std::vector<SegmentWork> segments;  ///< Claim order
};

struct ProgressCounts {
    std::size_t pending = 0;
    std::size_t in_progress = 0;
    std::size_t complete = 0;
    std::size_t failed = 0;
    std::size_t total = 0;
    metadata::SessionState state = metadata::SessionState::Active;
};

enum class RunOutcome {
    Succeeded,
    PartiallySucceeded,
    Failed
};

const char* to_string(RunOutcome outcome);

struct SegmentFailure {
    std::string file_path;
    std::uint32_t segment_index = 0;
    std::string segment_id;
    std::string reason;
};

/**
 * @brief What a caller needs to know after a run, including what to retry
 */
struct RunReport {
    std::string session_id;
    RunOutcome outcome = RunOutcome::Failed;
    metadata::SessionState state = metadata::SessionState::Active;
    std::size_t completed = 0;     ///< Complete segments in the session
    std::size_t total = 0;
    std::size_t remaining = 0;     ///< Neither complete nor failed (paused or cancelled runs)
    std::vector<SegmentFailure> failures;
};

struct QueueOptions {
    std::chrono::milliseconds lease_duration{300000};
    std::uint32_t max_segment_attempts = 3;
    std::chrono::milliseconds idle_wait{5};  ///< Worker back-off while others hold leases

    static QueueOptions from_config(const config::SyncConfig& config);
};

class TransferQueue {
public:
    /// Returns the number of bytes moved for the segment.
    using SegmentHandler = std::function<Result<std::size_t>(const metadata::SegmentProgress&)>;

    /// One result per claim, in claim order.
    using BatchHandler = std::function<std::vector<Result<std::size_t>>(
        const std::vector<metadata::SegmentProgress>&)>;

    TransferQueue(metadata::RecordStore& store,
                  QueueOptions options,
                  Clock clock = system_clock_ms(),
                  events::EventBus* bus = nullptr);

    /**
     * @brief Load a session or create it from the plan
     *
     * On resume: Failed segments go back to Pending with a fresh attempt
     * budget, expired leases are reclaimed and a Paused session is
     * reactivated. A Cancelled session restarts: every unfinished segment
     * returns to Pending with no attempts used and the session is Active again.
     */
    Result<metadata::TransferSession> start_or_resume(const SessionPlan& plan);

    /**
     * @brief Claim the first claimable segment in order
     *
     * A segment is claimable when Pending or when its lease has expired.
     * Returns nullopt when nothing is claimable or the session is not Active.
     * A lost CAS race moves on to the next candidate.
     */
    Result<std::optional<metadata::SegmentProgress>> next_pending_segment(const std::string& session_id,
                                                                          const std::string& worker_id);

    /// Same as next_pending_segment() but claims up to `limit` segments in one pass.
    Result<std::vector<metadata::SegmentProgress>> next_pending_segments(const std::string& session_id,
                                                                         const std::string& worker_id,
                                                                         std::size_t limit);

    /// Extend a held lease; ConcurrencyConflict if the lease was lost.
    Result<metadata::SegmentProgress> renew_lease(const metadata::SegmentProgress& claim);

    /// Idempotent; false when the segment was already complete.
    Result<bool> mark_segment_complete(const std::string& session_id, const std::string& segment_id);

    /**
     * @brief Release a claim after a failed attempt
     *
     * Retryable errors send the segment back to Pending while attempts
     * remain; anything else, or a spent budget, leaves it Failed.
     * Returns the status written.
     */
    Result<metadata::SegmentStatus> mark_segment_failed(const metadata::SegmentProgress& claim,
                                                        const Error& error);

    Result<void> pause(const std::string& session_id);
    Result<void> cancel(const std::string& session_id);

    Result<ProgressCounts> progress(const std::string& session_id) const;

    /// Revert every expired lease to Pending; returns how many were reverted.
    Result<std::size_t> reclaim_expired_leases(const std::string& session_id);

    /**
     * @brief Drain the session with `workers` concurrent claim loops
     *
     * Workers stop when nothing is left to claim or the session is paused or
     * cancelled; in-flight segments finish first. Store errors abort the run.
     */
    Result<RunReport> run(const std::string& session_id, const SegmentHandler& handler, std::size_t workers);

    /// Like run(), but each worker claims up to batch_size segments at a time.
    Result<RunReport> run_batches(const std::string& session_id,
                                  const BatchHandler& handler,
                                  std::size_t workers,
                                  std::size_t batch_size);

    Result<RunReport> report(const std::string& session_id) const;

    static bool can_transition(metadata::SessionState from, metadata::SessionState to) noexcept;

private:
    Result<void> transition(const std::string& session_id, metadata::SessionState target);
    Result<void> reset_failed(const std::string& session_id);
    Result<metadata::TransferSession> restart_cancelled(const metadata::TransferSession& session);
    Result<void> settle(const metadata::SegmentProgress& claim,
                        const Result<std::size_t>& outcome,
                        metadata::TransferDirection direction);
    bool stop_requested(const std::string& session_id) const;
    void clear_stop(const std::string& session_id);
    std::string make_worker_id(std::size_t index) const;

    metadata::RecordStore& store_;
    QueueOptions options_;
    Clock clock_;
    events::EventBus* bus_;
    std::string instance_id_;

    mutable std::mutex stop_mutex_;
    std::unordered_set<std::string> stop_requested_;
};

} // namespace usync::transfer
