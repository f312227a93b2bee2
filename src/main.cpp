#include "katafetch/calendar.hpp"
#include "katafetch/errors.hpp"
#include "katafetch/extractor.hpp"
#include "katafetch/fetch_config.hpp"
#include "katafetch/http_session.hpp"
#include "katafetch/log.hpp"
#include "katafetch/metrics.hpp"
#include "katafetch/paced_transport.hpp"
#include "katafetch/status_ledger.hpp"
#include "katafetch/target_enumerator.hpp"
#include "katafetch/transfer_manager.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

constexpr int EXIT_ALL_OK = 0;
constexpr int EXIT_FATAL = 1;
constexpr int EXIT_SOME_FAILED = 2;

double to_gib(uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0);
}

// Load the ledger, moving an unreadable one aside when the operator asked for it.
bool load_ledger(katafetch::StatusLedger& ledger, bool reset_corrupt) {
    try {
        ledger.load();
        return true;
    } catch (const katafetch::CorruptLedgerError& e) {
        if (!reset_corrupt) {
            katafetch::log_error("%s", e.what());
            katafetch::log_error("Fix or remove the ledger, or rerun with --reset-corrupt-ledger");
            return false;
        }

        auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
        auto aside = ledger.path();
        aside += ".corrupt-" + std::to_string(epoch);

        std::error_code ec;
        std::filesystem::rename(ledger.path(), aside, ec);
        if (ec) {
            katafetch::log_error("%s", e.what());
            katafetch::log_error("Cannot move corrupt ledger aside: %s", ec.message().c_str());
            return false;
        }
        katafetch::log_warn("%s", e.what());
        katafetch::log_warn("Moved corrupt ledger to %s and starting fresh", aside.c_str());
        ledger.load();
        return true;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace katafetch;

    auto config_opt = FetchConfig::from_args(argc, argv);
    if (!config_opt) {
        return EXIT_FATAL;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return EXIT_FATAL;
    }

    set_log_verbose(config.verbose);
    if (!log_open_file(config.log_file)) {
        std::cerr << "Warning: cannot open log file " << config.log_file
                  << ", logging to the console only\n";
    }

    // --- Targets (before any network use) ---

    std::vector<TransferTask> tasks;
    try {
        tasks = enumerate_targets(config.enumerate_options());
    } catch (const InvalidRangeError& e) {
        log_error("%s", e.what());
        return EXIT_FATAL;
    }

    log_info("katafetch starting");
    log_info("  base-url: %s", config.base_url.c_str());
    log_info("  dir: %s", config.download_dir.c_str());
    log_info("  range: %s .. %s (%zu archive(s)%s)", config.start_date.c_str(),
             config.end_date.empty() ? format_date(today_local()).c_str() : config.end_date.c_str(),
             tasks.size(), config.newest_first ? ", newest first" : "");
    log_info("  delay: %.1f s, max-retries: %u, throttle-attempts: %u, backoff-ceiling: %u",
             static_cast<double>(config.min_delay.count()) / 1000.0, config.max_retries,
             config.throttle_attempts, config.backoff_ceiling);
    log_info("  ledger: %s", config.ledger_path.c_str());
    if (config.extract) {
        log_info("  extract: %s (%s)", config.extract_dir.c_str(),
                 config.extract_pattern.empty() ? "all members" : config.extract_pattern.c_str());
    }

    // Install signal handlers: the first signal cuts the current archive short
    // and leaves it resumable, a second one terminates the process
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESETHAND;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    try {
        std::error_code ec;
        std::filesystem::create_directories(config.download_dir, ec);
        if (ec) {
            log_error("Cannot create download directory %s: %s", config.download_dir.c_str(),
                      ec.message().c_str());
            return EXIT_FATAL;
        }

        // --- Ledger ---

        StatusLedger ledger(config.ledger_path, config.flush_threshold_bytes);
        if (!load_ledger(ledger, config.reset_corrupt_ledger)) {
            return EXIT_FATAL;
        }
        size_t added = ledger.merge(tasks);
        ledger.flush();
        auto before = ledger.counts();
        log_info("Ledger: %zu entries (%zu new), %zu completed, %zu failed",
                 ledger.entries().size(), added, before.completed, before.failed);

        // --- Context ---

        SteadyClock clock([] { return g_shutdown_requested != 0; });
        PacedTransport transport(std::make_unique<CurlSession>(config.session_config()),
                                 config.backoff_config(), clock);

        std::optional<Extractor> extractor;
        if (config.extract) extractor.emplace(config.extractor_config());

        std::unique_ptr<MetricsExporter> metrics;
        if (!config.metrics_file.empty()) {
            metrics = std::make_unique<MetricsExporter>(config.metrics_file);
        }

        FetchContext ctx{config, ledger, transport,
                         extractor ? &*extractor : nullptr, metrics.get(),
                         [] { return g_shutdown_requested != 0; }};
        TransferManager manager(std::move(ctx));

        auto summary = manager.run(tasks);

        // --- Summary ---

        auto after = ledger.counts();
        log_info("============================================================");
        log_info("%s", summary.interrupted ? "Stopped early" : "Run finished");
        log_info("Completed: %zu, already complete: %zu", summary.completed,
                 summary.already_complete);
        log_info("Failed: %zu, skipped (failed earlier): %zu, retried: %zu", summary.failed,
                 summary.skipped_failed, summary.retried);
        if (extractor) {
            log_info("Extracted: %zu, extraction failures: %zu", summary.extracted,
                     summary.extraction_failures);
        }
        log_info("Transferred this run: %.2f GB", to_gib(summary.bytes_transferred));
        log_info("Ledger: %zu completed (%.2f GB), %zu in progress, %zu pending, %zu failed",
                 after.completed, to_gib(after.completed_bytes), after.in_progress,
                 after.pending, after.failed);
        log_info("Total downloaded across runs: %.2f GB", to_gib(ledger.downloaded_bytes()));
        log_info("============================================================");

        log_close_file();
        return summary.any_failed() ? EXIT_SOME_FAILED : EXIT_ALL_OK;
    } catch (const FetchError& e) {
        log_error("Fatal (%s): %s", to_string(e.kind()), e.what());
        log_close_file();
        return EXIT_FATAL;
    } catch (const std::exception& e) {
        log_error("Fatal: %s", e.what());
        log_close_file();
        return EXIT_FATAL;
    }
}
