#include "katafetch/backoff_policy.hpp"

#include <algorithm>
#include <thread>

namespace katafetch {

Clock::time_point SteadyClock::now() {
    return std::chrono::steady_clock::now();
}

void SteadyClock::sleep_for(std::chrono::milliseconds duration) {
    if (duration.count() <= 0) return;
    if (!interrupted_) {
        std::this_thread::sleep_for(duration);
        return;
    }

    constexpr std::chrono::milliseconds slice{100};
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!interrupted_()) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) return;
        std::this_thread::sleep_for(std::min(left, slice));
    }
}

BackoffPolicy::BackoffPolicy(const BackoffConfig& config, Clock& clock)
    : config_(config), clock_(clock) {
    if (config_.multiplier_ceiling == 0) config_.multiplier_ceiling = 1;
}

void BackoffPolicy::wait_for_slot() {
    if (!last_request_end_) return;
    auto ready_at = *last_request_end_ + config_.min_delay;
    auto now = clock_.now();
    if (now < ready_at) {
        // Round up so the floor is never undershot by truncation
        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(ready_at - now);
        clock_.sleep_for(remaining);
    }
}

void BackoffPolicy::mark_request_complete() {
    last_request_end_ = clock_.now();
}

std::chrono::milliseconds BackoffPolicy::next_backoff_delay() const {
    uint32_t next = std::min(multiplier_ * 2, config_.multiplier_ceiling);
    return config_.min_delay * next;
}

std::chrono::milliseconds BackoffPolicy::backoff() {
    multiplier_ = std::min(multiplier_ * 2, config_.multiplier_ceiling);
    ++consecutive_throttles_;
    auto delay = config_.min_delay * multiplier_;
    clock_.sleep_for(delay);
    return delay;
}

void BackoffPolicy::reset() {
    multiplier_ = 1;
    consecutive_throttles_ = 0;
}

}  // namespace katafetch
