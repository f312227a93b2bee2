#include "katafetch/fetch_config.hpp"
#include "katafetch/calendar.hpp"
#include "katafetch/errors.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>
#include <type_traits>

namespace katafetch {

namespace {

// Unsigned decimal; rejects signs, trailing garbage and overflow.
bool parse_unsigned(const char* text, uint64_t& out) {
    if (!text || *text < '0' || *text > '9') return false;
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(text, &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = v;
    return true;
}

// Seconds, possibly fractional ("0.5"), to milliseconds.
bool parse_seconds(const char* text, std::chrono::milliseconds& out) {
    if (!text || !*text) return false;
    errno = 0;
    char* end = nullptr;
    double secs = std::strtod(text, &end);
    if (errno != 0 || *end != '\0' || !std::isfinite(secs)) return false;
    out = std::chrono::milliseconds(static_cast<int64_t>(std::llround(secs * 1000.0)));
    return true;
}

void print_usage() {
    std::cerr <<
        "Usage: katafetch --start-date YYYY-MM-DD [options]\n"
        "\n"
        "Downloads the daily KataGo self-play archives (<date>sgfs.tar.bz2) one at\n"
        "a time, resuming partial files and recording progress in a JSON ledger.\n"
        "\n"
        "Range:\n"
        "  --start-date <YYYY-MM-DD>        First archive date (required)\n"
        "  --end-date <YYYY-MM-DD>          Last archive date (default: today)\n"
        "  --max-files <N>                  Fetch at most N archives\n"
        "  --newest-first                   Start from the end date and walk backwards\n"
        "\n"
        "Destination:\n"
        "  -d, --dir <path>                 Download directory (default: katago_games)\n"
        "  --ledger <path>                  Status ledger (default: <dir>/download_status.json)\n"
        "  --flush-mb <N>                   Persist progress every N MiB per archive (default: 8)\n"
        "  --no-digest                      Do not record SHA-256 of completed archives\n"
        "\n"
        "Origin:\n"
        "  --base-url <url>                 Archive directory URL\n"
        "                                   (default: https://katagoarchive.org/kata1/traininggames/)\n"
        "  --referer <url>                  Referer header (default: https://katagoarchive.org/kata1/)\n"
        "  --user-agent <string>            User-Agent header (default: katafetch/1.0)\n"
        "  --connect-timeout <secs>         Connection timeout (default: 30)\n"
        "  --stall-timeout <secs>           Abort a stalled transfer after this long (default: 60)\n"
        "\n"
        "Pacing:\n"
        "  --delay <secs>                   Minimum gap between requests, fractional (default: 2.0)\n"
        "  --throttle-attempts <N>          Requests per fetch while throttled (default: 5)\n"
        "  --backoff-ceiling <N>            Maximum backoff multiplier (default: 30)\n"
        "  --max-retries <N>                Failed fetches before an archive is marked failed (default: 3)\n"
        "  --force-retry                    Retry archives previously marked failed\n"
        "\n"
        "Extraction:\n"
        "  --extract                        Unpack completed archives\n"
        "  --extract-dir <path>             Output root (default: <dir>/extracted)\n"
        "  --extract-pattern <glob>         Members to unpack (default: *.sgf, empty for all)\n"
        "\n"
        "Other:\n"
        "  --config <path>                  JSON config file\n"
        "  --reset-corrupt-ledger           Move an unreadable ledger aside and start fresh\n"
        "  --log-file <path>                Log file path (default: <dir>/download.log)\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --verbose                        Verbose output\n"
        "  --help                           Show this help\n";
}

}  // namespace

std::optional<FetchConfig> FetchConfig::from_args(int argc, char* argv[]) {
    FetchConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    auto bad_value = [](const std::string& name, const char* value) {
        std::cerr << "Error: invalid value for " << name << ": " << value << "\n";
    };

    // Unsigned option into a field of any integer width
    auto next_unsigned = [&](int& i, const std::string& name, auto& field) -> bool {
        auto* v = next_arg(i, name.c_str());
        if (!v) return false;
        uint64_t n = 0;
        using Field = std::remove_reference_t<decltype(field)>;
        if (!parse_unsigned(v, n) || n > std::numeric_limits<Field>::max()) {
            bad_value(name, v);
            return false;
        }
        field = static_cast<Field>(n);
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--dir" || arg == "-d") {
            auto* v = next_arg(i, arg.c_str());
            if (!v) return std::nullopt;
            config.download_dir = v;
        } else if (arg == "--base-url") {
            auto* v = next_arg(i, "--base-url");
            if (!v) return std::nullopt;
            config.base_url = v;
        } else if (arg == "--referer") {
            auto* v = next_arg(i, "--referer");
            if (!v) return std::nullopt;
            config.referer = v;
        } else if (arg == "--user-agent") {
            auto* v = next_arg(i, "--user-agent");
            if (!v) return std::nullopt;
            config.user_agent = v;
        } else if (arg == "--start-date") {
            auto* v = next_arg(i, "--start-date");
            if (!v) return std::nullopt;
            config.start_date = v;
        } else if (arg == "--end-date") {
            auto* v = next_arg(i, "--end-date");
            if (!v) return std::nullopt;
            config.end_date = v;
        } else if (arg == "--max-files") {
            size_t n = 0;
            if (!next_unsigned(i, arg, n)) return std::nullopt;
            config.max_files = n;
        } else if (arg == "--newest-first") {
            config.newest_first = true;
        } else if (arg == "--delay") {
            auto* v = next_arg(i, "--delay");
            if (!v) return std::nullopt;
            if (!parse_seconds(v, config.min_delay)) {
                bad_value(arg, v);
                return std::nullopt;
            }
        } else if (arg == "--max-retries") {
            if (!next_unsigned(i, arg, config.max_retries)) return std::nullopt;
        } else if (arg == "--throttle-attempts") {
            if (!next_unsigned(i, arg, config.throttle_attempts)) return std::nullopt;
        } else if (arg == "--backoff-ceiling") {
            if (!next_unsigned(i, arg, config.backoff_ceiling)) return std::nullopt;
        } else if (arg == "--flush-mb") {
            uint64_t mb = 0;
            if (!next_unsigned(i, arg, mb)) return std::nullopt;
            config.flush_threshold_bytes = mb * 1024ULL * 1024;
        } else if (arg == "--connect-timeout") {
            uint64_t secs = 0;
            if (!next_unsigned(i, arg, secs)) return std::nullopt;
            config.connect_timeout = std::chrono::seconds(secs);
        } else if (arg == "--stall-timeout") {
            uint64_t secs = 0;
            if (!next_unsigned(i, arg, secs)) return std::nullopt;
            config.stall_timeout = std::chrono::seconds(secs);
        } else if (arg == "--extract") {
            config.extract = true;
        } else if (arg == "--extract-dir") {
            auto* v = next_arg(i, "--extract-dir");
            if (!v) return std::nullopt;
            config.extract_dir = v;
        } else if (arg == "--extract-pattern") {
            auto* v = next_arg(i, "--extract-pattern");
            if (!v) return std::nullopt;
            config.extract_pattern = v;
        } else if (arg == "--force-retry") {
            config.force_retry = true;
        } else if (arg == "--reset-corrupt-ledger") {
            config.reset_corrupt_ledger = true;
        } else if (arg == "--no-digest") {
            config.record_digest = false;
        } else if (arg == "--ledger") {
            auto* v = next_arg(i, "--ledger");
            if (!v) return std::nullopt;
            config.ledger_path = v;
        } else if (arg == "--log-file") {
            auto* v = next_arg(i, "--log-file");
            if (!v) return std::nullopt;
            config.log_file = v;
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, "--metrics-file");
            if (!v) return std::nullopt;
            config.metrics_file = v;
        } else if (arg == "--config") {
            auto* v = next_arg(i, "--config");
            if (!v) return std::nullopt;
            if (!config.load_json(v)) return std::nullopt;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return std::nullopt;
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }

    config.apply_defaults();
    return config;
}

bool FetchConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("dir")) download_dir = j["dir"].get<std::string>();
        if (j.contains("base_url")) base_url = j["base_url"].get<std::string>();
        if (j.contains("referer")) referer = j["referer"].get<std::string>();
        if (j.contains("user_agent")) user_agent = j["user_agent"].get<std::string>();
        if (j.contains("start_date")) start_date = j["start_date"].get<std::string>();
        if (j.contains("end_date")) end_date = j["end_date"].get<std::string>();
        if (j.contains("max_files")) max_files = j["max_files"].get<size_t>();
        if (j.contains("newest_first")) newest_first = j["newest_first"].get<bool>();
        if (j.contains("delay")) {
            min_delay = std::chrono::milliseconds(
                static_cast<int64_t>(std::llround(j["delay"].get<double>() * 1000.0)));
        }
        if (j.contains("max_retries")) max_retries = j["max_retries"].get<uint32_t>();
        if (j.contains("throttle_attempts")) throttle_attempts = j["throttle_attempts"].get<uint32_t>();
        if (j.contains("backoff_ceiling")) backoff_ceiling = j["backoff_ceiling"].get<uint32_t>();
        if (j.contains("flush_mb"))
            flush_threshold_bytes = j["flush_mb"].get<uint64_t>() * 1024ULL * 1024;
        if (j.contains("connect_timeout"))
            connect_timeout = std::chrono::seconds(j["connect_timeout"].get<uint32_t>());
        if (j.contains("stall_timeout"))
            stall_timeout = std::chrono::seconds(j["stall_timeout"].get<uint32_t>());
        if (j.contains("extract")) extract = j["extract"].get<bool>();
        if (j.contains("extract_dir")) extract_dir = j["extract_dir"].get<std::string>();
        if (j.contains("extract_pattern")) extract_pattern = j["extract_pattern"].get<std::string>();
        if (j.contains("force_retry")) force_retry = j["force_retry"].get<bool>();
        if (j.contains("record_digest")) record_digest = j["record_digest"].get<bool>();
        if (j.contains("ledger")) ledger_path = j["ledger"].get<std::string>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void FetchConfig::apply_defaults() {
    if (ledger_path.empty()) ledger_path = download_dir / "download_status.json";
    if (log_file.empty()) log_file = download_dir / "download.log";
    if (extract_dir.empty()) extract_dir = download_dir / "extracted";
}

std::string FetchConfig::validate() const {
    if (start_date.empty()) return "start_date is required (--start-date)";
    if (!parse_date(start_date)) return "start_date is not a valid YYYY-MM-DD date: " + start_date;
    if (!end_date.empty() && !parse_date(end_date))
        return "end_date is not a valid YYYY-MM-DD date: " + end_date;
    if (max_files && *max_files == 0) return "max_files must be > 0";
    if (base_url.empty()) return "base_url must not be empty";
    if (download_dir.empty()) return "download directory must not be empty";
    if (min_delay.count() < 0) return "delay must be >= 0";
    if (max_retries == 0) return "max_retries must be > 0";
    if (throttle_attempts == 0) return "throttle_attempts must be > 0";
    if (backoff_ceiling == 0) return "backoff_ceiling must be > 0";
    if (backoff_ceiling > 1024) return "backoff_ceiling must be <= 1024";
    if (flush_threshold_bytes == 0) return "flush threshold must be > 0";
    return {};
}

EnumerateOptions FetchConfig::enumerate_options() const {
    auto start = parse_date(start_date);
    if (!start) throw InvalidRangeError("invalid start date: " + start_date);

    EnumerateOptions opts;
    opts.start = *start;
    if (!end_date.empty()) {
        auto end = parse_date(end_date);
        if (!end) throw InvalidRangeError("invalid end date: " + end_date);
        opts.end = *end;
    }
    opts.max_count = max_files;
    opts.newest_first = newest_first;
    opts.base_url = base_url;
    opts.download_dir = download_dir;
    return opts;
}

BackoffConfig FetchConfig::backoff_config() const {
    BackoffConfig bc;
    bc.min_delay = min_delay;
    bc.multiplier_ceiling = backoff_ceiling;
    bc.max_attempts = throttle_attempts;
    return bc;
}

HttpSessionConfig FetchConfig::session_config() const {
    HttpSessionConfig sc;
    sc.user_agent = user_agent;
    sc.referer = referer;
    sc.connect_timeout = connect_timeout;
    sc.stall_timeout = stall_timeout;
    sc.verbose = verbose;
    return sc;
}

ExtractorConfig FetchConfig::extractor_config() const {
    ExtractorConfig ec;
    ec.extract_root = extract_dir;
    ec.member_pattern = extract_pattern;
    return ec;
}

}  // namespace katafetch
