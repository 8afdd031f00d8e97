#pragma once

#include "usync/config/config.hpp"
#include "usync/core/result.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <random>
#include <string>

namespace usync::transfer {

/**
 * @brief Bounded exponential backoff with jitter
 *
 * Delay before retry n (1-based) is initial_delay * multiplier^(n-1), capped
 * at max_delay, then scaled by a uniform factor in [1 - jitter, 1 + jitter].
 * Only errors the predicate accepts are retried; the default accepts
 * TransientTransport and StorageBusy.
 */
class RetryPolicy {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using Predicate = std::function<bool(const Error&)>;

    explicit RetryPolicy(config::RetrySettings settings,
                         Sleeper sleeper = default_sleeper(),
                         Predicate retryable = is_retryable,
                         std::uint64_t seed = std::random_device{}());

    static bool is_retryable(const Error& error);
    static Sleeper default_sleeper();

    std::chrono::milliseconds delay_for(std::uint32_t retry);

    const config::RetrySettings& settings() const noexcept { return settings_; }

    /**
     * @brief Run op until it succeeds, fails permanently or the budget is spent
     *
     * The last error is returned unchanged, so callers can still tell a
     * spent budget (transient code) from a rejection (terminal code).
     */
    template<typename T>
    Result<T> run(const std::string& what, const std::function<Result<T>()>& op) {
        for (std::uint32_t attempt = 1;; ++attempt) {
            auto result = op();
            if (result.is_ok()) {
                return result;
            }
            const Error& error = result.error();
            if (!retryable_(error) || attempt >= settings_.max_attempts) {
                if (attempt > 1) {
                    spdlog::warn("{} gave up after {} attempts: {}", what, attempt, to_string(error));
                }
                return result;
            }
            const auto delay = delay_for(attempt);
            spdlog::debug("{} attempt {} failed ({}), retrying in {}ms", what, attempt, to_string(error),
                          delay.count());
            sleeper_(delay);
        }
    }

private:
    config::RetrySettings settings_;
    Sleeper sleeper_;
    Predicate retryable_;
    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

} // namespace usync::transfer
