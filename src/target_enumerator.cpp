#include "katafetch/target_enumerator.hpp"
#include "katafetch/errors.hpp"

#include <algorithm>

namespace katafetch {

std::string archive_name(const Date& date) {
    return format_date(date) + "sgfs.tar.bz2";
}

std::vector<TransferTask> enumerate_targets(const EnumerateOptions& options) {
    Date end = options.end ? *options.end : today_local();
    if (!options.start.ok() || !end.ok()) {
        throw InvalidRangeError("invalid calendar date in range");
    }
    if (options.start > end) {
        throw InvalidRangeError("start date " + format_date(options.start) +
                                " is after end date " + format_date(end));
    }

    std::string base = options.base_url;
    if (!base.empty() && base.back() != '/') base += '/';

    std::chrono::sys_days first{options.start};
    std::chrono::sys_days last{end};
    auto span_days = static_cast<size_t>((last - first).count()) + 1;
    size_t count = options.max_count ? std::min(*options.max_count, span_days) : span_days;

    std::vector<TransferTask> tasks;
    tasks.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        std::chrono::days offset{static_cast<int>(i)};
        Date date{options.newest_first ? last - offset : first + offset};

        TransferTask task;
        task.id = format_date(date);
        task.date = date;
        task.url = base + archive_name(date);
        task.destination = options.download_dir / archive_name(date);
        tasks.push_back(std::move(task));
    }
    return tasks;
}

}  // namespace katafetch
