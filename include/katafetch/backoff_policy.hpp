#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

namespace katafetch {

/// Time source used for pacing. Tests substitute a fake that records sleeps.
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;
    virtual time_point now() = 0;
    virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

/// Wall-clock sleeps. When an interrupt predicate is given, sleeps are cut
/// short as soon as it returns true.
class SteadyClock : public Clock {
public:
    explicit SteadyClock(std::function<bool()> interrupted = {})
        : interrupted_(std::move(interrupted)) {}

    time_point now() override;
    void sleep_for(std::chrono::milliseconds duration) override;

private:
    std::function<bool()> interrupted_;
};

struct BackoffConfig {
    std::chrono::milliseconds min_delay{2000};  // Pacing floor between requests
    uint32_t multiplier_ceiling = 30;           // Cap on the backoff multiplier
    uint32_t max_attempts = 5;                  // Requests per fetch before giving up
};

/// Pacing floor plus exponential backoff for one origin.
///
/// Every request waits until min_delay has elapsed since the previous request
/// completed. Each throttled (or transiently failed) attempt doubles the
/// multiplier, capped at multiplier_ceiling, and sleeps min_delay * multiplier.
/// Any non-throttled response resets the multiplier to 1.
class BackoffPolicy {
public:
    BackoffPolicy(const BackoffConfig& config, Clock& clock);

    /// Block until the pacing floor since the last completed request has passed.
    void wait_for_slot();

    /// Record that a request (successful or not) just finished.
    void mark_request_complete();

    /// Double the multiplier (capped), sleep min_delay * multiplier and
    /// return the delay slept.
    std::chrono::milliseconds backoff();

    /// Delay the next backoff() would sleep, without changing state.
    std::chrono::milliseconds next_backoff_delay() const;

    /// Back to baseline after a non-throttled response.
    void reset();

    uint32_t multiplier() const { return multiplier_; }
    uint32_t consecutive_throttles() const { return consecutive_throttles_; }
    const BackoffConfig& config() const { return config_; }

private:
    BackoffConfig config_;
    Clock& clock_;

    uint32_t multiplier_ = 1;
    uint32_t consecutive_throttles_ = 0;
    std::optional<Clock::time_point> last_request_end_;
};

}  // namespace katafetch
