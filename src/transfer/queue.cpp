#include "usync/transfer/queue.hpp"

#include "usync/core/hash.hpp"
#include "usync/events/events.hpp"
#include "usync/transfer/retry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <random>
#include <string>
#include <thread>
#include <unordered_set>

namespace usync::transfer {

using metadata::SegmentProgress;
using metadata::SegmentStatus;
using metadata::SessionState;
using metadata::TransferSession;

Clock system_clock_ms() {
    return [] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    };
}

const char* to_string(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::Succeeded: return "succeeded";
        case RunOutcome::PartiallySucceeded: return "partially_succeeded";
        case RunOutcome::Failed: return "failed";
    }
    return "unknown";
}

QueueOptions QueueOptions::from_config(const config::SyncConfig& config) {
    QueueOptions options;
    options.lease_duration = std::chrono::duration_cast<std::chrono::milliseconds>(config.lease_duration);
    options.max_segment_attempts = config.max_segment_attempts;
    return options;
}

TransferQueue::TransferQueue(metadata::RecordStore& store,
                             QueueOptions options,
                             Clock clock,
                             events::EventBus* bus)
    : store_(store), options_(options), clock_(std::move(clock)), bus_(bus) {
    std::random_device device;
    std::uint8_t nonce[8];
    for (auto& byte : nonce) {
        byte = static_cast<std::uint8_t>(device());
    }
    instance_id_ = hash::to_hex(nonce, sizeof(nonce));
}

bool TransferQueue::can_transition(SessionState from, SessionState to) noexcept {
    switch (from) {
        case SessionState::Active:
            return to == SessionState::Paused || to == SessionState::Cancelled || to == SessionState::Completed;
        case SessionState::Paused:
            return to == SessionState::Active || to == SessionState::Cancelled || to == SessionState::Completed;
        case SessionState::Completed:
        case SessionState::Cancelled:
            return false;
    }
    return false;
}

Result<TransferSession> TransferQueue::start_or_resume(const SessionPlan& plan) {
    if (plan.session_id.empty()) {
        return Err<TransferSession>(ErrorCode::Validation, "Session id must not be empty");
    }

    auto existing = store_.get_session(plan.session_id);
    if (existing.is_ok()) {
        const auto& session = existing.value();
        if (session.state == SessionState::Cancelled) {
            return restart_cancelled(session);
        }
        if (session.state == SessionState::Completed) {
            return existing;
        }

        clear_stop(plan.session_id);
        if (auto reset = reset_failed(plan.session_id); reset.is_error()) {
            return Err<TransferSession>(reset.error());
        }
        if (auto reclaimed = reclaim_expired_leases(plan.session_id); reclaimed.is_error()) {
            return Err<TransferSession>(reclaimed.error());
        }

        const auto target = session.completed_segments >= session.total_segments ? SessionState::Completed
                                                                                   : SessionState::Active;
        if (session.state != target) {
            if (auto moved = transition(plan.session_id, target); moved.is_error()) {
                return Err<TransferSession>(moved.error());
            }
        }

        spdlog::info("Resuming session {} ({}/{} segments complete)", session.session_id,
                     session.completed_segments, session.total_segments);
        return store_.get_session(plan.session_id);
    }
    if (existing.error().code != ErrorCode::NotFound) {
        return existing;
    }

    std::unordered_set<std::string> seen;
    std::vector<SegmentProgress> rows;
    rows.reserve(plan.segments.size());
    for (const auto& work : plan.segments) {
        if (!seen.insert(work.segment_id).second) {
            return Err<TransferSession>(ErrorCode::Validation,
                                        "Segment listed twice in session plan: " + work.segment_id);
        }
        SegmentProgress row;
        row.session_id = plan.session_id;
        row.segment_id = work.segment_id;
        row.order = rows.size();
        row.file_path = work.file_path;
        row.segment_index = work.segment_index;
        rows.push_back(std::move(row));
    }

    const auto now_seconds = clock_() / 1000;
    TransferSession session;
    session.session_id = plan.session_id;
    session.direction = plan.direction;
    session.target = plan.target;
    session.folder_id = plan.folder_id;
    session.folder_version = plan.folder_version;
    session.total_segments = rows.size();
    session.state = rows.empty() ? SessionState::Completed : SessionState::Active;
    session.created_at = now_seconds;
    session.updated_at = now_seconds;

    if (auto created = store_.create_session(session, rows); created.is_error()) {
        return Err<TransferSession>(created.error());
    }
    clear_stop(plan.session_id);

    spdlog::info("Started {} session {} with {} segments", metadata::to_string(plan.direction),
                 plan.session_id, rows.size());
    return Ok(std::move(session));
}

Result<std::optional<SegmentProgress>> TransferQueue::next_pending_segment(const std::string& session_id,
                                                                          const std::string& worker_id) {
    auto claimed = next_pending_segments(session_id, worker_id, 1);
    if (claimed.is_error()) {
        return Err<std::optional<SegmentProgress>>(claimed.error());
    }
    if (claimed.value().empty()) {
        return Ok(std::optional<SegmentProgress>());
    }
    return Ok(std::optional<SegmentProgress>(std::move(claimed.value().front())));
}

Result<std::vector<SegmentProgress>> TransferQueue::next_pending_segments(const std::string& session_id,
                                                                         const std::string& worker_id,
                                                                         std::size_t limit) {
    std::vector<SegmentProgress> claimed;

    auto session = store_.get_session(session_id);
    if (session.is_error()) {
        return Err<std::vector<SegmentProgress>>(session.error());
    }
    if (session.value().state != SessionState::Active || limit == 0) {
        return Ok(std::move(claimed));
    }

    auto rows = store_.list_progress(session_id);
    if (rows.is_error()) {
        return Err<std::vector<SegmentProgress>>(rows.error());
    }

    const auto now = clock_();
    for (const auto& row : rows.value()) {
        if (claimed.size() >= limit) {
            break;
        }
        const bool expired = row.status == SegmentStatus::InProgress && row.lease_expires_ms <= now;
        if (row.status != SegmentStatus::Pending && !expired) {
            continue;
        }

        SegmentProgress desired = row;
        desired.status = SegmentStatus::InProgress;
        desired.attempts = row.attempts + 1;
        desired.lease_owner = worker_id;
        desired.lease_expires_ms = now + options_.lease_duration.count();

        auto swapped = store_.compare_and_set_progress(row, desired);
        if (swapped.is_error()) {
            return Err<std::vector<SegmentProgress>>(swapped.error());
        }
        if (!swapped.value()) {
            spdlog::debug("Lost claim race for segment {} in session {}", row.segment_id, session_id);
            continue;
        }
        if (expired) {
            spdlog::info("Reclaimed expired lease of {} on segment {}", row.lease_owner, row.segment_id);
        }
        claimed.push_back(std::move(desired));
    }
    return Ok(std::move(claimed));
}

Result<SegmentProgress> TransferQueue::renew_lease(const SegmentProgress& claim) {
    SegmentProgress desired = claim;
    desired.lease_expires_ms = clock_() + options_.lease_duration.count();

    auto swapped = store_.compare_and_set_progress(claim, desired);
    if (swapped.is_error()) {
        return Err<SegmentProgress>(swapped.error());
    }
    if (!swapped.value()) {
        return Err<SegmentProgress>(ErrorCode::ConcurrencyConflict,
                                    "Lease on segment " + claim.segment_id + " is no longer held");
    }
    return Ok(std::move(desired));
}

Result<bool> TransferQueue::mark_segment_complete(const std::string& session_id, const std::string& segment_id) {
    return store_.complete_segment(session_id, segment_id);
}

Result<SegmentStatus> TransferQueue::mark_segment_failed(const SegmentProgress& claim, const Error& error) {
    SegmentProgress desired = claim;
    desired.lease_owner.clear();
    desired.lease_expires_ms = 0;
    desired.last_error = to_string(error);

    if (error.code == ErrorCode::Cancelled) {
        // Interrupted, not attempted: give the attempt back.
        desired.status = SegmentStatus::Pending;
        desired.attempts = claim.attempts > 0 ? claim.attempts - 1 : 0;
    } else if (RetryPolicy::is_retryable(error) && claim.attempts < options_.max_segment_attempts) {
        desired.status = SegmentStatus::Pending;
    } else {
        desired.status = SegmentStatus::Failed;
    }

    auto swapped = store_.compare_and_set_progress(claim, desired);
    if (swapped.is_error()) {
        return Err<SegmentStatus>(swapped.error());
    }
    if (!swapped.value()) {
        return Err<SegmentStatus>(ErrorCode::ConcurrencyConflict,
                                  "Lease on segment " + claim.segment_id + " is no longer held");
    }
    return Ok(desired.status);
}

Result<void> TransferQueue::pause(const std::string& session_id) {
    {
        std::lock_guard lock(stop_mutex_);
        stop_requested_.insert(session_id);
    }
    return transition(session_id, SessionState::Paused);
}

Result<void> TransferQueue::cancel(const std::string& session_id) {
    {
        std::lock_guard lock(stop_mutex_);
        stop_requested_.insert(session_id);
    }
    return transition(session_id, SessionState::Cancelled);
}

Result<ProgressCounts> TransferQueue::progress(const std::string& session_id) const {
    auto session = store_.get_session(session_id);
    if (session.is_error()) {
        return Err<ProgressCounts>(session.error());
    }
    auto rows = store_.list_progress(session_id);
    if (rows.is_error()) {
        return Err<ProgressCounts>(rows.error());
    }

    ProgressCounts counts;
    counts.state = session.value().state;
    counts.total = rows.value().size();
    for (const auto& row : rows.value()) {
        switch (row.status) {
            case SegmentStatus::Pending: ++counts.pending; break;
            case SegmentStatus::InProgress: ++counts.in_progress; break;
            case SegmentStatus::Complete: ++counts.complete; break;
            case SegmentStatus::Failed: ++counts.failed; break;
        }
    }
    return Ok(counts);
}

Result<std::size_t> TransferQueue::reclaim_expired_leases(const std::string& session_id) {
    auto rows = store_.list_progress(session_id);
    if (rows.is_error()) {
        return Err<std::size_t>(rows.error());
    }

    const auto now = clock_();
    std::size_t reclaimed = 0;
    for (const auto& row : rows.value()) {
        if (row.status != SegmentStatus::InProgress || row.lease_expires_ms > now) {
            continue;
        }
        SegmentProgress desired = row;
        desired.status = SegmentStatus::Pending;
        desired.lease_owner.clear();
        desired.lease_expires_ms = 0;

        auto swapped = store_.compare_and_set_progress(row, desired);
        if (swapped.is_error()) {
            return Err<std::size_t>(swapped.error());
        }
        if (swapped.value()) {
            ++reclaimed;
        }
    }
    if (reclaimed > 0) {
        spdlog::info("Reclaimed {} expired leases in session {}", reclaimed, session_id);
    }
    return Ok(reclaimed);
}

Result<RunReport> TransferQueue::run(const std::string& session_id,
                                     const SegmentHandler& handler,
                                     std::size_t workers) {
    return run_batches(
        session_id,
        [&handler](const std::vector<SegmentProgress>& claims) {
            std::vector<Result<std::size_t>> results;
            results.reserve(claims.size());
            for (const auto& claim : claims) {
                results.push_back(handler(claim));
            }
            return results;
        },
        workers, 1);
}

Result<RunReport> TransferQueue::run_batches(const std::string& session_id,
                                             const BatchHandler& handler,
                                             std::size_t workers,
                                             std::size_t batch_size) {
    auto session = store_.get_session(session_id);
    if (session.is_error()) {
        return Err<RunReport>(session.error());
    }
    const auto direction = session.value().direction;
    const auto started = std::chrono::steady_clock::now();

    workers = std::max<std::size_t>(workers, 1);
    batch_size = std::max<std::size_t>(batch_size, 1);

    // Claimed or about to claim; a worker that finds nothing only exits once this is zero.
    std::atomic<std::size_t> in_flight{0};
    std::mutex fatal_mutex;
    std::optional<Error> fatal;

    auto has_fatal = [&] {
        std::lock_guard lock(fatal_mutex);
        return fatal.has_value();
    };
    auto set_fatal = [&](const Error& error) {
        std::lock_guard lock(fatal_mutex);
        if (!fatal) {
            fatal = error;
        }
    };

    auto worker_loop = [&](std::size_t index) {
        const auto worker_id = make_worker_id(index);
        while (!has_fatal() && !stop_requested(session_id)) {
            in_flight.fetch_add(1);
            auto claims = next_pending_segments(session_id, worker_id, batch_size);
            if (claims.is_error()) {
                in_flight.fetch_sub(1);
                set_fatal(claims.error());
                return;
            }
            if (claims.value().empty()) {
                if (in_flight.fetch_sub(1) == 1) {
                    return;
                }
                std::this_thread::sleep_for(options_.idle_wait);
                continue;
            }

            const auto& batch = claims.value();
            std::vector<Result<std::size_t>> results;
            try {
                results = handler(batch);
            } catch (const std::exception& e) {
                // A throwing handler fails its claims; the worker keeps going
                spdlog::error("Handler threw in session {}: {}", session_id, e.what());
                results.assign(batch.size(),
                               Err<std::size_t>(ErrorCode::Io, std::string("Handler threw: ") + e.what()));
            }
            for (std::size_t i = 0; i < batch.size(); ++i) {
                const auto outcome = i < results.size()
                    ? results[i]
                    : Err<std::size_t>(ErrorCode::Validation, "Handler returned no result for segment");
                if (auto settled = settle(batch[i], outcome, direction); settled.is_error()) {
                    set_fatal(settled.error());
                }
            }
            in_flight.fetch_sub(1);
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        threads.emplace_back(worker_loop, i);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    if (fatal) {
        spdlog::error("Session {} aborted: {}", session_id, to_string(*fatal));
        return Err<RunReport>(*fatal);
    }

    auto result = report(session_id);
    if (result.is_error()) {
        return result;
    }
    const auto& summary = result.value();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    spdlog::info("Session {} {}: {}/{} complete, {} failed, {} remaining ({} ms)", session_id,
                 to_string(summary.outcome), summary.completed, summary.total, summary.failures.size(),
                 summary.remaining, elapsed.count());
    if (bus_ != nullptr && summary.state == SessionState::Completed) {
        bus_->emit(events::SessionCompletedEvent(session_id, direction, summary.completed,
                                                 summary.failures.size(), elapsed));
    }
    return result;
}

Result<RunReport> TransferQueue::report(const std::string& session_id) const {
    auto session = store_.get_session(session_id);
    if (session.is_error()) {
        return Err<RunReport>(session.error());
    }
    auto rows = store_.list_progress(session_id);
    if (rows.is_error()) {
        return Err<RunReport>(rows.error());
    }

    RunReport summary;
    summary.session_id = session_id;
    summary.state = session.value().state;
    summary.total = rows.value().size();
    for (const auto& row : rows.value()) {
        if (row.status == SegmentStatus::Complete) {
            ++summary.completed;
        } else if (row.status == SegmentStatus::Failed) {
            summary.failures.push_back({row.file_path, row.segment_index, row.segment_id, row.last_error});
        } else {
            ++summary.remaining;
        }
    }

    if (summary.completed == summary.total) {
        summary.outcome = RunOutcome::Succeeded;
    } else if (summary.completed > 0) {
        summary.outcome = RunOutcome::PartiallySucceeded;
    } else {
        summary.outcome = RunOutcome::Failed;
    }
    return Ok(std::move(summary));
}

Result<void> TransferQueue::transition(const std::string& session_id, SessionState target) {
    auto session = store_.get_session(session_id);
    if (session.is_error()) {
        return Err<void>(session.error());
    }
    const auto current = session.value().state;
    if (current == target) {
        return Ok();
    }
    if (!can_transition(current, target)) {
        return Err<void>(ErrorCode::Validation,
                         "Session " + session_id + " cannot move from " + metadata::to_string(current) +
                         " to " + metadata::to_string(target));
    }
    spdlog::debug("Session {}: {} -> {}", session_id, metadata::to_string(current), metadata::to_string(target));
    return store_.set_session_state(session_id, target);
}

Result<void> TransferQueue::reset_failed(const std::string& session_id) {
    auto rows = store_.list_progress(session_id);
    if (rows.is_error()) {
        return Err<void>(rows.error());
    }
    for (const auto& row : rows.value()) {
        if (row.status != SegmentStatus::Failed) {
            continue;
        }
        SegmentProgress desired = row;
        desired.status = SegmentStatus::Pending;
        desired.attempts = 0;
        desired.last_error.clear();
        auto swapped = store_.compare_and_set_progress(row, desired);
        if (swapped.is_error()) {
            return Err<void>(swapped.error());
        }
    }
    return Ok();
}

// A cancelled run is retried from scratch: every unfinished segment goes back to
// Pending with a full retry budget. Completed segments are kept.
Result<TransferSession> TransferQueue::restart_cancelled(const TransferSession& session) {
    auto rows = store_.list_progress(session.session_id);
    if (rows.is_error()) {
        return Err<TransferSession>(rows.error());
    }
    std::size_t completed = 0;
    for (const auto& row : rows.value()) {
        if (row.status == SegmentStatus::Complete) {
            ++completed;
            continue;
        }
        SegmentProgress desired = row;
        desired.status = SegmentStatus::Pending;
        desired.attempts = 0;
        desired.last_error.clear();
        desired.lease_owner.clear();
        desired.lease_expires_ms = 0;
        auto swapped = store_.compare_and_set_progress(row, desired);
        if (swapped.is_error()) {
            return Err<TransferSession>(swapped.error());
        }
        if (!swapped.value()) {
            return Err<TransferSession>(ErrorCode::ConcurrencyConflict,
                                        "Segment changed while restarting " + session.session_id + ": " +
                                            row.segment_id);
        }
    }

    clear_stop(session.session_id);
    const auto target = completed >= rows.value().size() ? SessionState::Completed : SessionState::Active;
    if (auto moved = store_.set_session_state(session.session_id, target); moved.is_error()) {
        return Err<TransferSession>(moved.error());
    }
    spdlog::info("Restarting cancelled session {} ({}/{} segments complete)", session.session_id, completed,
                 rows.value().size());
    return store_.get_session(session.session_id);
}

Result<void> TransferQueue::settle(const SegmentProgress& claim,
                                   const Result<std::size_t>& outcome,
                                   metadata::TransferDirection direction) {
    if (outcome.is_ok()) {
        auto done = mark_segment_complete(claim.session_id, claim.segment_id);
        if (done.is_error()) {
            return Err<void>(done.error());
        }
        if (done.value() && bus_ != nullptr) {
            bus_->emit(events::SegmentCompletedEvent(claim.session_id, claim.segment_id, direction,
                                                     outcome.value()));
        }
        return Ok();
    }

    auto status = mark_segment_failed(claim, outcome.error());
    if (status.is_error()) {
        if (status.error().code == ErrorCode::ConcurrencyConflict) {
            spdlog::warn("Segment {}: {}", claim.segment_id, status.error().message);
            return Ok();
        }
        return Err<void>(status.error());
    }

    const bool terminal = status.value() == SegmentStatus::Failed;
    spdlog::warn("Segment {} of {} (index {}) failed attempt {}{}: {}", claim.segment_id, claim.file_path,
                 claim.segment_index, claim.attempts, terminal ? ", giving up" : "",
                 to_string(outcome.error()));
    if (bus_ != nullptr) {
        bus_->emit(events::SegmentFailedEvent(claim.session_id, claim.segment_id, claim.file_path,
                                              claim.segment_index, claim.attempts,
                                              to_string(outcome.error()), terminal));
    }
    return Ok();
}

bool TransferQueue::stop_requested(const std::string& session_id) const {
    std::lock_guard lock(stop_mutex_);
    return stop_requested_.count(session_id) > 0;
}

void TransferQueue::clear_stop(const std::string& session_id) {
    std::lock_guard lock(stop_mutex_);
    stop_requested_.erase(session_id);
}

std::string TransferQueue::make_worker_id(std::size_t index) const {
    return instance_id_ + "/" + std::to_string(index);
}

} // namespace usync::transfer
