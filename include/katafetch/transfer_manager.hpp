#pragma once

#include "katafetch/errors.hpp"
#include "katafetch/extractor.hpp"
#include "katafetch/fetch_config.hpp"
#include "katafetch/metrics.hpp"
#include "katafetch/paced_transport.hpp"
#include "katafetch/status_ledger.hpp"
#include "katafetch/target_enumerator.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace katafetch {

/// Everything one run needs, built once by the caller and threaded through.
/// Nothing here is owned.
struct FetchContext {
    const FetchConfig& config;
    StatusLedger& ledger;
    Transport& transport;
    const Extractor* extractor = nullptr;   // Null when extraction is off
    MetricsExporter* metrics = nullptr;     // Null when metrics are off
    std::function<bool()> stop_requested;   // Checked between archives and while streaming
};

enum class TransferOutcome {
    Completed,        // Archive is complete on disk and in the ledger
    AlreadyComplete,  // Nothing to do: ledger said Completed and the file agrees
    SkippedFailed,    // Failed earlier and force_retry is off
    Requeued,         // Attempt failed, retry budget left
    Failed,           // Attempt failed, retry budget used up
    Interrupted,      // Stop requested mid-transfer; left InProgress, no retry spent
};

const char* to_string(TransferOutcome outcome);

/// Result of one attempt at one archive.
struct TransferResult {
    TransferOutcome outcome = TransferOutcome::Failed;
    uint64_t bytes_transferred = 0;  // Body bytes written during this attempt
    uint32_t requests = 0;           // HTTP requests issued during this attempt
    std::optional<ErrorKind> error_kind;
    std::string error;
};

struct RunSummary {
    size_t completed = 0;          // Completed during this run
    size_t already_complete = 0;   // Skipped, complete before the run
    size_t skipped_failed = 0;     // Skipped, failed in an earlier run
    size_t failed = 0;             // Marked failed during this run
    size_t retried = 0;            // Requeued attempts
    size_t extracted = 0;
    size_t extraction_failures = 0;
    uint64_t bytes_transferred = 0;
    bool interrupted = false;      // Stopped before the queue drained

    bool any_failed() const { return failed > 0 || skipped_failed > 0; }
};

/// Drives archives through the ledger state machine one at a time:
/// Pending -> InProgress -> Completed, or back to InProgress (requeued at
/// the end of the run's queue) until max_retries failures mark it Failed.
///
/// The destination file size is the source of truth for resume offsets; the
/// ledger is corrected when it disagrees. Per-archive failures are recorded
/// and never abort the run. A LedgerWriteError does.
class TransferManager {
public:
    explicit TransferManager(FetchContext context);

    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    /// Process the tasks in order, requeueing failures, until every task is
    /// Completed/Failed or a stop is requested. A stop cuts the current
    /// transfer short; the partial file resumes on the next run.
    RunSummary run(const std::vector<TransferTask>& tasks);

    /// One attempt at one archive, including the ledger bookkeeping.
    TransferResult transfer(const TransferTask& task);

private:
    TransferResult complete(const TransferTask& task, TransferState& state,
                            uint64_t bytes_transferred, uint32_t requests);
    TransferResult fail(const TransferTask& task, TransferState& state, ErrorKind kind,
                        const std::string& message, uint64_t bytes_transferred,
                        uint32_t requests);
    // only_if_missing: skip when the per-date output directory already has files
    void extract(const TransferTask& task, bool only_if_missing, RunSummary& summary);
    void publish_metrics();

    FetchContext ctx_;
};

}  // namespace katafetch
