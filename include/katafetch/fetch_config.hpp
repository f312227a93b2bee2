#pragma once

#include "katafetch/backoff_policy.hpp"
#include "katafetch/extractor.hpp"
#include "katafetch/http_session.hpp"
#include "katafetch/target_enumerator.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace katafetch {

/// Configuration for one katafetch run.
/// Built from the command line, optionally overlaid by a JSON file.
struct FetchConfig {
    // Destination
    std::filesystem::path download_dir = "katago_games";

    // Origin
    std::string base_url = "https://katagoarchive.org/kata1/traininggames/";
    std::string referer = "https://katagoarchive.org/kata1/";
    std::string user_agent = "katafetch/1.0";

    // Date range (YYYY-MM-DD). Empty end_date means today.
    std::string start_date;
    std::string end_date;
    std::optional<size_t> max_files;
    bool newest_first = false;

    // Pacing and retries
    std::chrono::milliseconds min_delay{2000};
    uint32_t max_retries = 3;        // Failed fetches per archive before it is marked failed
    uint32_t throttle_attempts = 5;  // Requests per fetch while throttled
    uint32_t backoff_ceiling = 30;   // Cap on the backoff multiplier

    // Ledger
    std::filesystem::path ledger_path;  // Default: <download_dir>/download_status.json
    uint64_t flush_threshold_bytes = 8ULL * 1024 * 1024;
    bool reset_corrupt_ledger = false;
    bool force_retry = false;
    bool record_digest = true;

    // Network
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds stall_timeout{60};

    // Extraction
    bool extract = false;
    std::filesystem::path extract_dir;  // Default: <download_dir>/extracted
    std::string extract_pattern = "*.sgf";

    // Logging / metrics
    bool verbose = false;
    std::filesystem::path log_file;      // Default: <download_dir>/download.log
    std::filesystem::path metrics_file;  // Empty disables the exporter

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error or --help (prints usage to stderr).
    static std::optional<FetchConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in paths derived from download_dir.
    void apply_defaults();

    /// Validate fields. Returns error message or empty string.
    std::string validate() const;

    // --- Views for the components (call after validate()) ---
    EnumerateOptions enumerate_options() const;
    BackoffConfig backoff_config() const;
    HttpSessionConfig session_config() const;
    ExtractorConfig extractor_config() const;
};

}  // namespace katafetch
