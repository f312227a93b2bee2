#pragma once

#include "katafetch/backoff_policy.hpp"
#include "katafetch/http_session.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace katafetch {

enum class FetchStatus {
    Ok,                   // Body fully streamed to the sink
    RangeNotSatisfiable,  // 416: resume offset at or beyond the origin's size
    ThrottledExhausted,   // Throttled on every attempt
    PermanentError,       // Non-retryable origin response
    TransientExhausted,   // Network / 5xx failures on every attempt
    SinkError,            // The sink rejected the body (local I/O or offset mismatch)
    Cancelled,            // The sink asked to stop; nothing is retried
};

const char* to_string(FetchStatus status);

/// Destination of a fetched body. begin() may be called more than once per
/// fetch when a dropped connection is resumed; offset 0 means rewrite from scratch.
class FetchSink {
public:
    virtual ~FetchSink() = default;

    /// The body that follows starts at byte `offset` of the object.
    /// @param total  Object size reported by the origin, if any.
    /// @return false to refuse the body (offset does not match local state).
    virtual bool begin(uint64_t offset, std::optional<uint64_t> total) = 0;

    /// @return false on local write failure.
    virtual bool write(const char* data, size_t size) = 0;

    /// Description of the last refusal or write failure.
    virtual std::string error() const = 0;

    /// True once the caller wants the fetch abandoned. Checked before every
    /// request and while a body is streaming.
    virtual bool cancelled() const { return false; }
};

struct FetchOutcome {
    FetchStatus status = FetchStatus::PermanentError;
    int http_status = 0;
    std::optional<uint64_t> total;  // Origin-reported object size
    uint64_t bytes_received = 0;    // Body bytes accepted by the sink, all attempts
    uint32_t attempts = 0;
    std::string error;

    bool ok() const { return status == FetchStatus::Ok; }
};

/// Counters for metrics export (monotonic over the transport's lifetime).
struct TransportStats {
    uint64_t requests = 0;
    uint64_t throttle_responses = 0;
    uint64_t transient_errors = 0;
    uint64_t bytes_received = 0;
};

/// Retrieves one object, possibly resuming at an offset.
class Transport {
public:
    virtual ~Transport() = default;

    virtual FetchOutcome fetch(const std::string& url, uint64_t range_start, FetchSink& sink) = 0;

    virtual TransportStats stats() const = 0;
};

/// Transport over one persistent HTTP session that enforces the pacing floor
/// before every request and retries throttled or transiently failed requests
/// with exponential backoff.
///
/// Retries after a dropped connection resume from the last byte the sink
/// accepted. 4xx responses other than 429/416 are returned immediately.
class PacedTransport : public Transport {
public:
    PacedTransport(std::unique_ptr<HttpSession> session, const BackoffConfig& config, Clock& clock);

    PacedTransport(const PacedTransport&) = delete;
    PacedTransport& operator=(const PacedTransport&) = delete;

    FetchOutcome fetch(const std::string& url, uint64_t range_start, FetchSink& sink) override;

    TransportStats stats() const override { return stats_; }

    const BackoffPolicy& backoff() const { return policy_; }

private:
    std::unique_ptr<HttpSession> session_;
    BackoffPolicy policy_;
    TransportStats stats_;
};

}  // namespace katafetch
