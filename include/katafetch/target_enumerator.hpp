#pragma once

#include "katafetch/calendar.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace katafetch {

/// One remote archive: the daily self-play bundle for a single date.
/// Immutable once enumerated; recomputed on every run.
struct TransferTask {
    std::string id;                     // "YYYY-MM-DD", stable ledger key
    Date date;
    std::string url;                    // <base_url><id>sgfs.tar.bz2
    std::filesystem::path destination;  // <download_dir>/<id>sgfs.tar.bz2
};

struct EnumerateOptions {
    Date start;
    std::optional<Date> end;  // Default: today
    std::optional<size_t> max_count;
    bool newest_first = false;
    std::string base_url;
    std::filesystem::path download_dir;
};

/// Archive file name for a date, e.g. "2021-01-01sgfs.tar.bz2".
std::string archive_name(const Date& date);

/// One task per calendar day in [start, end], ordered oldest-first (or
/// newest-first), truncated to max_count. Throws InvalidRangeError if start > end.
std::vector<TransferTask> enumerate_targets(const EnumerateOptions& options);

}  // namespace katafetch
