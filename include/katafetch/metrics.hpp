#pragma once

#include "katafetch/paced_transport.hpp"
#include "katafetch/status_ledger.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace katafetch {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        histogram_.Observe(std::chrono::duration<double>(elapsed).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports katafetch metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. The transfer loop
/// calls snapshot() after every object; the file is replaced atomically with
/// temp+rename so a scraper never reads a half-written file.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    const std::map<std::string, std::string>& labels = {});

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Refresh gauges from the ledger, fold in transport counter deltas and
    /// rewrite the file. Returns false if the file could not be written.
    bool snapshot(const StatusLedger::Counts& counts, const TransportStats& transport);

    // --- Counter accessors ---
    prometheus::Counter& transfers_completed() { return *transfers_completed_; }
    prometheus::Counter& transfers_failed() { return *transfers_failed_; }
    prometheus::Counter& transfers_retried() { return *transfers_retried_; }
    prometheus::Counter& transfers_skipped() { return *transfers_skipped_; }
    prometheus::Counter& extractions_success() { return *extractions_success_; }
    prometheus::Counter& extractions_failure() { return *extractions_failure_; }

    // --- Histogram accessors ---
    prometheus::Histogram& transfer_duration() { return *transfer_duration_; }

    const std::filesystem::path& path() const { return prom_file_path_; }

private:
    void update_gauges(const StatusLedger::Counts& counts);
    void update_transport(const TransportStats& transport);
    bool write_file();

    std::filesystem::path prom_file_path_;
    std::shared_ptr<prometheus::Registry> registry_;

    // Previous transport stats for delta computation
    TransportStats prev_transport_;

    // --- Counters ---
    prometheus::Counter* transfers_completed_;
    prometheus::Counter* transfers_failed_;
    prometheus::Counter* transfers_retried_;
    prometheus::Counter* transfers_skipped_;
    prometheus::Counter* bytes_downloaded_total_;
    prometheus::Counter* http_requests_total_;
    prometheus::Counter* throttle_responses_total_;
    prometheus::Counter* transient_errors_total_;
    prometheus::Counter* extractions_success_;
    prometheus::Counter* extractions_failure_;

    // --- Gauges ---
    prometheus::Gauge* tasks_pending_;
    prometheus::Gauge* tasks_in_progress_;
    prometheus::Gauge* tasks_completed_;
    prometheus::Gauge* tasks_failed_;
    prometheus::Gauge* completed_bytes_;

    // --- Histograms ---
    prometheus::Histogram* transfer_duration_;
};

}  // namespace katafetch
