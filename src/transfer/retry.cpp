#include "usync/transfer/retry.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

namespace usync::transfer {

RetryPolicy::RetryPolicy(config::RetrySettings settings, Sleeper sleeper, Predicate retryable, std::uint64_t seed)
    : settings_(settings), sleeper_(std::move(sleeper)), retryable_(std::move(retryable)), rng_(seed) {}

bool RetryPolicy::is_retryable(const Error& error) {
    return error.code == ErrorCode::TransientTransport || error.code == ErrorCode::StorageBusy;
}

RetryPolicy::Sleeper RetryPolicy::default_sleeper() {
    return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

std::chrono::milliseconds RetryPolicy::delay_for(std::uint32_t retry) {
    const double base = static_cast<double>(settings_.initial_delay.count()) *
                        std::pow(settings_.multiplier, static_cast<double>(retry > 0 ? retry - 1 : 0));
    const double capped = std::min(base, static_cast<double>(settings_.max_delay.count()));

    double factor = 1.0;
    if (settings_.jitter > 0.0) {
        std::uniform_real_distribution<double> spread(1.0 - settings_.jitter, 1.0 + settings_.jitter);
        std::lock_guard lock(rng_mutex_);
        factor = spread(rng_);
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(std::max(0.0, capped * factor))));
}

} // namespace usync::transfer
