#include "katafetch/metrics.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace katafetch {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& transfers_family = prometheus::BuildCounter()
        .Name("katafetch_transfers_total")
        .Help("Archive transfers by outcome")
        .Labels(labels)
        .Register(*registry_);
    transfers_completed_ = &transfers_family.Add({{"result", "completed"}});
    transfers_failed_ = &transfers_family.Add({{"result", "failed"}});
    transfers_retried_ = &transfers_family.Add({{"result", "retried"}});
    transfers_skipped_ = &transfers_family.Add({{"result", "skipped"}});

    auto counter_reg = [&](const std::string& name, const std::string& help) -> prometheus::Counter& {
        return prometheus::BuildCounter()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    bytes_downloaded_total_ = &counter_reg("katafetch_bytes_downloaded_total",
                                           "Body bytes received from the origin");
    http_requests_total_ = &counter_reg("katafetch_http_requests_total",
                                        "HTTP requests issued");
    throttle_responses_total_ = &counter_reg("katafetch_throttle_responses_total",
                                             "Throttling responses (429/503) received");
    transient_errors_total_ = &counter_reg("katafetch_transient_errors_total",
                                           "Network failures and transient 5xx responses");

    auto& extractions_family = prometheus::BuildCounter()
        .Name("katafetch_extractions_total")
        .Help("Archive extractions by outcome")
        .Labels(labels)
        .Register(*registry_);
    extractions_success_ = &extractions_family.Add({{"result", "success"}});
    extractions_failure_ = &extractions_family.Add({{"result", "failure"}});

    // --- Gauges ---

    auto& tasks_family = prometheus::BuildGauge()
        .Name("katafetch_tasks")
        .Help("Ledger entries by status")
        .Labels(labels)
        .Register(*registry_);
    tasks_pending_ = &tasks_family.Add({{"status", "pending"}});
    tasks_in_progress_ = &tasks_family.Add({{"status", "in_progress"}});
    tasks_completed_ = &tasks_family.Add({{"status", "completed"}});
    tasks_failed_ = &tasks_family.Add({{"status", "failed"}});

    completed_bytes_ = &prometheus::BuildGauge()
        .Name("katafetch_completed_bytes")
        .Help("Total size of completed archives in the ledger")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Histograms ---

    transfer_duration_ = &prometheus::BuildHistogram()
        .Name("katafetch_transfer_duration_seconds")
        .Help("Time to bring one archive to a terminal or requeued state")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.1, 0.5, 1, 5, 10, 30, 60, 120, 300, 600, 1800, 3600});
}

bool MetricsExporter::snapshot(const StatusLedger::Counts& counts, const TransportStats& transport) {
    update_gauges(counts);
    update_transport(transport);
    return write_file();
}

void MetricsExporter::update_gauges(const StatusLedger::Counts& counts) {
    tasks_pending_->Set(static_cast<double>(counts.pending));
    tasks_in_progress_->Set(static_cast<double>(counts.in_progress));
    tasks_completed_->Set(static_cast<double>(counts.completed));
    tasks_failed_->Set(static_cast<double>(counts.failed));
    completed_bytes_->Set(static_cast<double>(counts.completed_bytes));
}

void MetricsExporter::update_transport(const TransportStats& ts) {
    // Increment counters by deltas since last snapshot
    if (ts.requests > prev_transport_.requests) {
        http_requests_total_->Increment(
            static_cast<double>(ts.requests - prev_transport_.requests));
    }
    if (ts.throttle_responses > prev_transport_.throttle_responses) {
        throttle_responses_total_->Increment(
            static_cast<double>(ts.throttle_responses - prev_transport_.throttle_responses));
    }
    if (ts.transient_errors > prev_transport_.transient_errors) {
        transient_errors_total_->Increment(
            static_cast<double>(ts.transient_errors - prev_transport_.transient_errors));
    }
    if (ts.bytes_received > prev_transport_.bytes_received) {
        bytes_downloaded_total_->Increment(
            static_cast<double>(ts.bytes_received - prev_transport_.bytes_received));
    }
    prev_transport_ = ts;
}

bool MetricsExporter::write_file() {
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) return false;
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return false;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    return !ec;
}

}  // namespace katafetch
