#include "katafetch/paced_transport.hpp"
#include "katafetch/log.hpp"

#include <algorithm>

namespace katafetch {

const char* to_string(FetchStatus status) {
    switch (status) {
        case FetchStatus::Ok: return "ok";
        case FetchStatus::RangeNotSatisfiable: return "range_not_satisfiable";
        case FetchStatus::ThrottledExhausted: return "throttled_exhausted";
        case FetchStatus::PermanentError: return "permanent_error";
        case FetchStatus::TransientExhausted: return "transient_exhausted";
        case FetchStatus::SinkError: return "sink_error";
        case FetchStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

namespace {

// Bridges one HTTP response to the FetchSink: works out where the body
// starts and what total the origin reported.
class SinkAdapter : public ResponseHandler {
public:
    explicit SinkAdapter(FetchSink& sink) : sink_(sink) {}

    bool on_response(int status_code, const HttpHeaders& headers) override {
        if (!is_success_status(status_code)) return false;

        uint64_t offset = 0;
        std::optional<uint64_t> total;
        if (status_code == static_cast<int>(HttpStatus::PartialContent)) {
            auto value = headers.get("Content-Range");
            auto range = value ? parse_content_range(*value) : std::nullopt;
            if (!range || !range->first) {
                protocol_error_ = "206 response without a usable Content-Range";
                return false;
            }
            offset = *range->first;
            total = range->total;
        } else {
            // Full body: either no range was asked for or the origin ignored it
            total = headers.content_length();
        }

        if (!sink_.begin(offset, total)) {
            sink_rejected_ = true;
            return false;
        }
        began_ = true;
        offset_ = offset;
        total_ = total;
        return true;
    }

    bool on_data(const char* data, size_t size) override {
        if (!sink_.write(data, size)) {
            sink_rejected_ = true;
            return false;
        }
        received_ += size;
        return true;
    }

    bool keep_going() override { return !sink_.cancelled(); }

    bool began() const { return began_; }
    bool sink_rejected() const { return sink_rejected_; }
    const std::string& protocol_error() const { return protocol_error_; }
    uint64_t offset() const { return offset_; }
    uint64_t received() const { return received_; }
    std::optional<uint64_t> total() const { return total_; }

private:
    FetchSink& sink_;
    bool began_ = false;
    bool sink_rejected_ = false;
    std::string protocol_error_;
    uint64_t offset_ = 0;
    uint64_t received_ = 0;
    std::optional<uint64_t> total_;
};

}  // namespace

PacedTransport::PacedTransport(std::unique_ptr<HttpSession> session,
                               const BackoffConfig& config, Clock& clock)
    : session_(std::move(session)), policy_(config, clock) {}

FetchOutcome PacedTransport::fetch(const std::string& url, uint64_t range_start, FetchSink& sink) {
    FetchOutcome outcome;
    uint64_t position = range_start;
    const uint32_t max_attempts = std::max<uint32_t>(1, policy_.config().max_attempts);

    while (true) {
        policy_.wait_for_slot();
        if (sink.cancelled()) {
            outcome.status = FetchStatus::Cancelled;
            outcome.error = "cancelled before request";
            return outcome;
        }

        HttpRequest request;
        request.url = url;
        if (position > 0) request.range_start = position;

        SinkAdapter adapter(sink);
        ++outcome.attempts;
        ++stats_.requests;
        HttpResult result = session_->get(request, adapter);
        policy_.mark_request_complete();

        outcome.http_status = result.status_code;
        outcome.bytes_received += adapter.received();
        stats_.bytes_received += adapter.received();
        if (adapter.began()) {
            position = adapter.offset() + adapter.received();
            if (adapter.total()) outcome.total = adapter.total();
        }

        if (sink.cancelled()) {
            outcome.status = FetchStatus::Cancelled;
            outcome.error = "cancelled after " + std::to_string(outcome.bytes_received) + " bytes";
            return outcome;
        }

        if (adapter.sink_rejected()) {
            policy_.reset();
            outcome.status = FetchStatus::SinkError;
            outcome.error = sink.error();
            return outcome;
        }

        bool throttled = !result.is_network_error && is_throttle_status(result.status_code);
        bool transient = result.is_network_error || is_transient_status(result.status_code);

        if (throttled || transient) {
            if (throttled) {
                ++stats_.throttle_responses;
            } else {
                ++stats_.transient_errors;
            }

            std::string reason = result.is_network_error
                                     ? result.error
                                     : "HTTP " + std::to_string(result.status_code);
            if (outcome.attempts >= max_attempts) {
                outcome.status = throttled ? FetchStatus::ThrottledExhausted
                                           : FetchStatus::TransientExhausted;
                outcome.error = reason + " after " + std::to_string(outcome.attempts) + " attempts";
                return outcome;
            }

            auto delay = policy_.next_backoff_delay();
            log_warn("%s: %s (attempt %u/%u), backing off %lld ms",
                     url.c_str(), reason.c_str(), outcome.attempts, max_attempts,
                     static_cast<long long>(delay.count()));
            policy_.backoff();
            continue;
        }

        // Any other response ends the throttling streak
        policy_.reset();

        if (is_success_status(result.status_code)) {
            if (!adapter.protocol_error().empty()) {
                outcome.status = FetchStatus::PermanentError;
                outcome.error = adapter.protocol_error();
                return outcome;
            }
            outcome.status = FetchStatus::Ok;
            return outcome;
        }

        if (result.status_code == static_cast<int>(HttpStatus::RangeNotSatisfiable)) {
            if (auto value = result.headers.get("Content-Range")) {
                if (auto range = parse_content_range(*value)) outcome.total = range->total;
            }
            outcome.status = FetchStatus::RangeNotSatisfiable;
            outcome.error = "HTTP 416 for range starting at " + std::to_string(position);
            return outcome;
        }

        outcome.status = FetchStatus::PermanentError;
        outcome.error = "HTTP " + std::to_string(result.status_code);
        return outcome;
    }
}

}  // namespace katafetch
