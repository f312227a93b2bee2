#include "katafetch/transfer_manager.hpp"
#include "katafetch/digest.hpp"
#include "katafetch/log.hpp"

#include <algorithm>
#include <cerrno>
#include <cinttypes>
#include <cstring>
#include <deque>
#include <exception>
#include <fcntl.h>
#include <unistd.h>

namespace katafetch {

const char* to_string(TransferOutcome outcome) {
    switch (outcome) {
        case TransferOutcome::Completed: return "completed";
        case TransferOutcome::AlreadyComplete: return "already_complete";
        case TransferOutcome::SkippedFailed: return "skipped_failed";
        case TransferOutcome::Requeued: return "requeued";
        case TransferOutcome::Failed: return "failed";
        case TransferOutcome::Interrupted: return "interrupted";
    }
    return "unknown";
}

namespace {

constexpr uint64_t PROGRESS_STEP_UNKNOWN_TOTAL = 64ULL * 1024 * 1024;

std::optional<uint64_t> file_size_of(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) return std::nullopt;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) return std::nullopt;
    return size;
}

void discard_file(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) log_warn("Could not remove %s: %s", path.c_str(), ec.message().c_str());
}

double to_mib(uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

// Write the whole buffer, retrying on short writes and EINTR.
bool write_all(int fd, const char* data, size_t len) {
    while (len > 0) {
        ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

// Appends body bytes to the destination file in place and mirrors the
// growing size into the ledger entry. The file is opened on the first
// begin() so a request that never gets a body leaves the disk untouched.
class DestinationSink : public FetchSink {
public:
    DestinationSink(const TransferTask& task, StatusLedger& ledger, TransferState& state,
                    uint64_t existing_size, const std::function<bool()>& stop_requested)
        : task_(task), ledger_(ledger), state_(state), stop_requested_(stop_requested)
        , size_(existing_size) {}

    ~DestinationSink() override {
        if (fd_ >= 0) ::close(fd_);
    }

    DestinationSink(const DestinationSink&) = delete;
    DestinationSink& operator=(const DestinationSink&) = delete;

    bool begin(uint64_t offset, std::optional<uint64_t> total) override {
        if (offset != size_) {
            if (offset != 0) {
                return reject(ErrorKind::SizeMismatch,
                              "origin resumed at byte " + std::to_string(offset) +
                              " but the local file has " + std::to_string(size_));
            }
            log_warn("%s: origin ignored the range request, rewriting from byte 0",
                     task_.id.c_str());
        }

        if (fd_ < 0) {
            fd_ = ::open(task_.destination.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
            if (fd_ < 0) {
                return reject(ErrorKind::LocalIoError, "cannot open " + task_.destination.string() +
                                                       ": " + std::strerror(errno));
            }
        }
        if (offset == 0 && size_ > 0) {
            if (::ftruncate(fd_, 0) != 0) {
                return reject(ErrorKind::LocalIoError, "cannot truncate " +
                                                       task_.destination.string() + ": " +
                                                       std::strerror(errno));
            }
            size_ = 0;
        }

        if (total) {
            if (size_ > *total) {
                return reject(ErrorKind::SizeMismatch,
                              "local file has " + std::to_string(size_) +
                              " bytes but the origin reports " + std::to_string(*total));
            }
            state_.total_bytes = total;
        }
        next_progress_ = next_progress_mark();
        return update_ledger();
    }

    bool write(const char* data, size_t size) override {
        if (cancelled()) return reject(ErrorKind::LocalIoError, "stop requested");
        if (state_.total_bytes && size_ + size > *state_.total_bytes) {
            return reject(ErrorKind::SizeMismatch,
                          "origin sent more than the reported " +
                          std::to_string(*state_.total_bytes) + " bytes");
        }
        if (!write_all(fd_, data, size)) {
            return reject(ErrorKind::LocalIoError, "write to " + task_.destination.string() +
                                                   " failed: " + std::strerror(errno));
        }
        size_ += size;
        written_ += size;

        if (size_ >= next_progress_) {
            if (state_.total_bytes && *state_.total_bytes > 0) {
                log_info("%s: %.1f%% (%.1f / %.1f MiB)", task_.id.c_str(),
                         100.0 * static_cast<double>(size_) / static_cast<double>(*state_.total_bytes),
                         to_mib(size_), to_mib(*state_.total_bytes));
            } else {
                log_info("%s: %.1f MiB", task_.id.c_str(), to_mib(size_));
            }
            next_progress_ = next_progress_mark();
        }
        return update_ledger();
    }

    std::string error() const override { return error_; }

    bool cancelled() const override { return stop_requested_ && stop_requested_(); }

    /// Flush file data to disk and close. False on failure (see error()).
    bool finish() {
        if (fd_ < 0) return true;
        int rc = ::fdatasync(fd_);
        int saved = errno;
        int close_rc = ::close(fd_);
        fd_ = -1;
        if (rc != 0 || close_rc != 0) {
            return reject(ErrorKind::LocalIoError, "cannot sync " + task_.destination.string() +
                                                   ": " + std::strerror(rc != 0 ? saved : errno));
        }
        return true;
    }

    ErrorKind error_kind() const { return error_kind_; }
    std::exception_ptr ledger_failure() const { return ledger_failure_; }
    uint64_t written() const { return written_; }

private:
    bool reject(ErrorKind kind, std::string message) {
        error_kind_ = kind;
        error_ = std::move(message);
        return false;
    }

    uint64_t next_progress_mark() const {
        if (state_.total_bytes && *state_.total_bytes > 0) {
            uint64_t step = std::max<uint64_t>(*state_.total_bytes / 10, 1);
            return (size_ / step + 1) * step;
        }
        return (size_ / PROGRESS_STEP_UNKNOWN_TOTAL + 1) * PROGRESS_STEP_UNKNOWN_TOTAL;
    }

    // The ledger throws from inside a libcurl callback; park the exception
    // and abort the transfer so the manager can rethrow it.
    bool update_ledger() {
        state_.bytes_downloaded = size_;
        try {
            ledger_.set(task_.id, state_);
        } catch (const LedgerWriteError& e) {
            ledger_failure_ = std::current_exception();
            return reject(ErrorKind::LocalIoError, e.what());
        }
        return true;
    }

    const TransferTask& task_;
    StatusLedger& ledger_;
    TransferState& state_;
    const std::function<bool()>& stop_requested_;

    int fd_ = -1;
    uint64_t size_;
    uint64_t written_ = 0;
    uint64_t next_progress_ = 0;

    ErrorKind error_kind_ = ErrorKind::LocalIoError;
    std::string error_;
    std::exception_ptr ledger_failure_;
};

}  // namespace

TransferManager::TransferManager(FetchContext context) : ctx_(std::move(context)) {}

// ============================================================================
// Run loop
// ============================================================================

RunSummary TransferManager::run(const std::vector<TransferTask>& tasks) {
    RunSummary summary;
    std::deque<const TransferTask*> queue;
    for (const auto& task : tasks) queue.push_back(&task);

    size_t position = 0;
    const size_t total = tasks.size();

    while (!queue.empty()) {
        if (ctx_.stop_requested && ctx_.stop_requested()) {
            summary.interrupted = true;
            log_warn("Stop requested, leaving %zu archive(s) for the next run", queue.size());
            break;
        }

        const TransferTask& task = *queue.front();
        queue.pop_front();
        ++position;

        if (position <= total) {
            log_debug("[%zu/%zu] %s", position, total, task.id.c_str());
        } else {
            log_debug("[retry] %s", task.id.c_str());
        }

        TransferResult result = transfer(task);
        summary.bytes_transferred += result.bytes_transferred;

        switch (result.outcome) {
            case TransferOutcome::Completed:
                ++summary.completed;
                if (ctx_.metrics) ctx_.metrics->transfers_completed().Increment();
                extract(task, false, summary);
                break;
            case TransferOutcome::AlreadyComplete:
                ++summary.already_complete;
                if (ctx_.metrics) ctx_.metrics->transfers_skipped().Increment();
                extract(task, true, summary);
                break;
            case TransferOutcome::SkippedFailed:
                ++summary.skipped_failed;
                if (ctx_.metrics) ctx_.metrics->transfers_skipped().Increment();
                break;
            case TransferOutcome::Requeued:
                ++summary.retried;
                if (ctx_.metrics) ctx_.metrics->transfers_retried().Increment();
                queue.push_back(&task);
                break;
            case TransferOutcome::Failed:
                ++summary.failed;
                if (ctx_.metrics) ctx_.metrics->transfers_failed().Increment();
                break;
            case TransferOutcome::Interrupted:
                summary.interrupted = true;
                break;
        }
        publish_metrics();

        if (result.outcome == TransferOutcome::Interrupted) {
            log_warn("Stop requested, leaving %zu archive(s) for the next run", queue.size() + 1);
            break;
        }
    }

    return summary;
}

// ============================================================================
// One attempt
// ============================================================================

TransferResult TransferManager::transfer(const TransferTask& task) {
    StatusLedger& ledger = ctx_.ledger;
    TransferState state = ledger.get(task.id);
    auto on_disk = file_size_of(task.destination);

    // --- Selection ---

    if (state.status == TransferStatus::Completed) {
        if (on_disk && state.total_bytes && *on_disk == *state.total_bytes) {
            log_debug("%s: already complete, skipping", task.id.c_str());
            TransferResult result;
            result.outcome = TransferOutcome::AlreadyComplete;
            return result;
        }
        log_warn("%s: marked completed but %s, downloading again", task.id.c_str(),
                 on_disk ? "the file size differs" : "the file is missing");
        state = TransferState{};
        ledger.set(task.id, state);
        on_disk = file_size_of(task.destination);
    }

    if (state.status == TransferStatus::Failed) {
        if (!ctx_.config.force_retry) {
            log_info("Skipping %s: failed after %u attempts (%s); use --force-retry",
                     task.id.c_str(), state.retry_count,
                     state.last_error.value_or("no error recorded").c_str());
            TransferResult result;
            result.outcome = TransferOutcome::SkippedFailed;
            result.error = state.last_error.value_or("");
            return result;
        }
        log_info("%s: retrying previously failed archive", task.id.c_str());
        state.status = TransferStatus::Pending;
        state.retry_count = 0;
        state.last_error.reset();
        ledger.set(task.id, state);
    }

    std::optional<ScopedTimer> timer;
    if (ctx_.metrics) timer.emplace(ctx_.metrics->transfer_duration());

    // --- Resume point: the file on disk wins over the ledger ---

    uint64_t offset = on_disk.value_or(0);
    if (state.bytes_downloaded != offset) {
        log_warn("%s: ledger records %" PRIu64 " bytes but the file has %" PRIu64
                 ", using the file size", task.id.c_str(), state.bytes_downloaded, offset);
        state.bytes_downloaded = offset;
    }

    if (state.total_bytes) {
        if (on_disk && offset == *state.total_bytes) {
            log_info("%s: file already has all %" PRIu64 " bytes, no request needed",
                     task.id.c_str(), offset);
            return complete(task, state, 0, 0);
        }
        if (offset > *state.total_bytes) {
            discard_file(task.destination);
            state.bytes_downloaded = 0;
            return fail(task, state, ErrorKind::SizeMismatch,
                        "local file had " + std::to_string(offset) + " bytes but the origin reports " +
                        std::to_string(*state.total_bytes) + "; discarded",
                        0, 0);
        }
    }

    state.status = TransferStatus::InProgress;
    ledger.set(task.id, state);

    if (offset > 0) {
        log_info("Resuming %s from byte %" PRIu64, task.id.c_str(), offset);
    } else {
        log_info("Downloading %s", task.url.c_str());
    }

    // --- Fetch ---

    DestinationSink sink(task, ledger, state, offset, ctx_.stop_requested);
    FetchOutcome outcome = ctx_.transport.fetch(task.url, offset, sink);
    if (auto failure = sink.ledger_failure()) std::rethrow_exception(failure);
    bool synced = sink.finish();

    const uint64_t transferred = sink.written();
    const uint32_t requests = outcome.attempts;
    if (transferred > 0) ledger.record_download(transferred);

    uint64_t local = file_size_of(task.destination).value_or(0);
    state.bytes_downloaded = local;
    if (outcome.total) state.total_bytes = outcome.total;

    if (!synced) {
        return fail(task, state, ErrorKind::LocalIoError, sink.error(), transferred, requests);
    }

    // --- Verify ---

    switch (outcome.status) {
        case FetchStatus::Ok:
            if (!state.total_bytes) {
                // No length from the origin: the completed stream defines the size
                state.total_bytes = local;
            }
            if (local != *state.total_bytes) {
                return fail(task, state, ErrorKind::SizeMismatch,
                            "stream ended at " + std::to_string(local) + " of " +
                            std::to_string(*state.total_bytes) + " bytes",
                            transferred, requests);
            }
            return complete(task, state, transferred, requests);

        case FetchStatus::RangeNotSatisfiable:
            if (outcome.total && local == *outcome.total) {
                return complete(task, state, transferred, requests);
            }
            discard_file(task.destination);
            state.bytes_downloaded = 0;
            return fail(task, state, ErrorKind::SizeMismatch,
                        "origin rejected resume at byte " + std::to_string(local) +
                        (outcome.total ? " (size " + std::to_string(*outcome.total) + ")" : "") +
                        "; discarded",
                        transferred, requests);

        case FetchStatus::ThrottledExhausted:
            return fail(task, state, ErrorKind::ThrottledExhausted, outcome.error,
                        transferred, requests);

        case FetchStatus::TransientExhausted:
            return fail(task, state, ErrorKind::TransientFetchError, outcome.error,
                        transferred, requests);

        case FetchStatus::PermanentError:
            return fail(task, state, ErrorKind::PermanentFetchError, outcome.error,
                        transferred, requests);

        case FetchStatus::SinkError:
            return fail(task, state, sink.error_kind(), outcome.error, transferred, requests);

        case FetchStatus::Cancelled: {
            // Keep the partial file and its position; the next run resumes it
            ledger.set(task.id, state);
            ledger.flush();
            log_warn("%s: stopped at byte %" PRIu64 ", will resume on the next run",
                     task.id.c_str(), local);
            TransferResult result;
            result.outcome = TransferOutcome::Interrupted;
            result.bytes_transferred = transferred;
            result.requests = requests;
            result.error = outcome.error;
            return result;
        }
    }
    return fail(task, state, ErrorKind::PermanentFetchError,
                std::string("unexpected fetch status ") + to_string(outcome.status),
                transferred, requests);
}

TransferResult TransferManager::complete(const TransferTask& task, TransferState& state,
                                         uint64_t bytes_transferred, uint32_t requests) {
    state.status = TransferStatus::Completed;
    state.total_bytes = state.bytes_downloaded;
    state.last_error.reset();
    state.sha256.clear();
    if (ctx_.config.record_digest) {
        if (auto digest = sha256_file(task.destination)) {
            state.sha256 = *digest;
        } else {
            log_warn("%s: could not compute SHA-256 of %s", task.id.c_str(),
                     task.destination.c_str());
        }
    }
    ctx_.ledger.set(task.id, state);

    log_info("Completed %s (%.1f MiB, %.1f MiB transferred)", task.id.c_str(),
             to_mib(state.bytes_downloaded), to_mib(bytes_transferred));

    TransferResult result;
    result.outcome = TransferOutcome::Completed;
    result.bytes_transferred = bytes_transferred;
    result.requests = requests;
    return result;
}

TransferResult TransferManager::fail(const TransferTask& task, TransferState& state,
                                     ErrorKind kind, const std::string& message,
                                     uint64_t bytes_transferred, uint32_t requests) {
    if (state.total_bytes && state.bytes_downloaded > *state.total_bytes) {
        discard_file(task.destination);
        state.bytes_downloaded = 0;
    }

    const uint32_t max_retries = std::max<uint32_t>(1, ctx_.config.max_retries);
    if (kind == ErrorKind::PermanentFetchError) {
        // Not worth another request: use up the budget
        state.retry_count = max_retries;
    } else {
        state.retry_count = std::min(state.retry_count + 1, max_retries);
    }
    state.last_error = std::string(to_string(kind)) + ": " + message;
    state.status = state.retry_count >= max_retries ? TransferStatus::Failed
                                                    : TransferStatus::InProgress;
    ctx_.ledger.set(task.id, state);

    TransferResult result;
    result.bytes_transferred = bytes_transferred;
    result.requests = requests;
    result.error_kind = kind;
    result.error = *state.last_error;

    if (state.status == TransferStatus::Failed) {
        log_error("Failed %s after %u attempt(s): %s", task.id.c_str(), state.retry_count,
                  result.error.c_str());
        result.outcome = TransferOutcome::Failed;
    } else {
        log_warn("%s: attempt %u/%u failed: %s; requeued", task.id.c_str(), state.retry_count,
                 max_retries, result.error.c_str());
        result.outcome = TransferOutcome::Requeued;
    }
    return result;
}

// ============================================================================
// Post-download
// ============================================================================

void TransferManager::extract(const TransferTask& task, bool only_if_missing,
                              RunSummary& summary) {
    if (!ctx_.extractor) return;

    if (only_if_missing) {
        auto out_dir = ctx_.extractor->config().extract_root / task.id;
        std::error_code ec;
        if (std::filesystem::is_directory(out_dir, ec) &&
            !std::filesystem::is_empty(out_dir, ec) && !ec) {
            return;
        }
    }

    auto result = ctx_.extractor->extract(task.destination, task.id);
    if (result.success) {
        ++summary.extracted;
        if (ctx_.metrics) ctx_.metrics->extractions_success().Increment();
        log_info("Extracted %s into %s (%zu files)", task.id.c_str(),
                 result.output_dir.c_str(), result.files_present);
    } else {
        ++summary.extraction_failures;
        if (ctx_.metrics) ctx_.metrics->extractions_failure().Increment();
        log_error("%s: %s: %s", task.id.c_str(), to_string(ErrorKind::ExtractionError),
                  result.error_message.c_str());
    }
}

void TransferManager::publish_metrics() {
    if (!ctx_.metrics) return;
    if (!ctx_.metrics->snapshot(ctx_.ledger.counts(), ctx_.transport.stats())) {
        log_warn("Could not write metrics file %s", ctx_.metrics->path().c_str());
    }
}

}  // namespace katafetch
