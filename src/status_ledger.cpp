#include "katafetch/status_ledger.hpp"
#include "katafetch/calendar.hpp"
#include "katafetch/errors.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <unistd.h>

namespace katafetch {

namespace {

constexpr int LEDGER_VERSION = 1;

nlohmann::json state_to_json(const TransferState& s) {
    nlohmann::json j;
    j["status"] = to_string(s.status);
    j["bytes_downloaded"] = s.bytes_downloaded;
    j["total_bytes"] = s.total_bytes ? nlohmann::json(*s.total_bytes) : nlohmann::json(nullptr);
    j["retry_count"] = s.retry_count;
    j["last_error"] = s.last_error ? nlohmann::json(*s.last_error) : nlohmann::json(nullptr);
    if (!s.sha256.empty()) j["sha256"] = s.sha256;
    if (!s.updated_at.empty()) j["updated_at"] = s.updated_at;
    return j;
}

// Throws std::runtime_error (or nlohmann::json::exception) on malformed entries.
TransferState state_from_json(const std::string& id, const nlohmann::json& j) {
    if (!j.is_object()) throw std::runtime_error("entry " + id + " is not an object");

    TransferState s;
    auto status = parse_transfer_status(j.at("status").get<std::string>());
    if (!status) {
        throw std::runtime_error("entry " + id + " has unknown status '" +
                                 j.at("status").get<std::string>() + "'");
    }
    s.status = *status;
    if (!j.at("bytes_downloaded").is_number_unsigned()) {
        throw std::runtime_error("entry " + id + " has invalid bytes_downloaded");
    }
    s.bytes_downloaded = j["bytes_downloaded"].get<uint64_t>();
    if (j.contains("total_bytes") && !j["total_bytes"].is_null()) {
        if (!j["total_bytes"].is_number_unsigned()) {
            throw std::runtime_error("entry " + id + " has invalid total_bytes");
        }
        s.total_bytes = j["total_bytes"].get<uint64_t>();
    }
    if (j.contains("retry_count")) {
        const auto& count = j["retry_count"];
        if (!count.is_number_unsigned() ||
            count.get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
            throw std::runtime_error("entry " + id + " has invalid retry_count");
        }
        s.retry_count = count.get<uint32_t>();
    }
    if (j.contains("last_error") && !j["last_error"].is_null()) {
        s.last_error = j["last_error"].get<std::string>();
    }
    if (j.contains("sha256")) s.sha256 = j["sha256"].get<std::string>();
    if (j.contains("updated_at")) s.updated_at = j["updated_at"].get<std::string>();

    if (s.total_bytes && s.bytes_downloaded > *s.total_bytes) {
        throw std::runtime_error("entry " + id + " has bytes_downloaded > total_bytes");
    }
    return s;
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

void fsync_directory(const std::filesystem::path& dir) {
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd < 0) {
        throw LedgerWriteError("cannot open ledger directory " + dir.string() + ": " +
                               std::strerror(errno));
    }
    int rc = ::fsync(dfd);
    int saved = errno;
    ::close(dfd);
    if (rc != 0) {
        throw LedgerWriteError("fsync of ledger directory failed: " + std::string(std::strerror(saved)));
    }
}

}  // namespace

const char* to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::Pending: return "pending";
        case TransferStatus::InProgress: return "in_progress";
        case TransferStatus::Completed: return "completed";
        case TransferStatus::Failed: return "failed";
    }
    return "pending";
}

std::optional<TransferStatus> parse_transfer_status(const std::string& text) {
    if (text == "pending") return TransferStatus::Pending;
    if (text == "in_progress") return TransferStatus::InProgress;
    if (text == "completed") return TransferStatus::Completed;
    if (text == "failed") return TransferStatus::Failed;
    return std::nullopt;
}

StatusLedger::StatusLedger(std::filesystem::path path, uint64_t flush_threshold_bytes)
    : path_(std::move(path)), flush_threshold_bytes_(flush_threshold_bytes) {}

// --- Persistence ---

void StatusLedger::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        entries_.clear();
        flushed_bytes_.clear();
        downloaded_bytes_ = 0;
        last_download_.clear();
        return;
    }

    std::ifstream ifs(path_);
    if (!ifs) {
        throw CorruptLedgerError("cannot open ledger " + path_.string());
    }

    std::map<std::string, TransferState> loaded;
    uint64_t downloaded = 0;
    std::string last_download;
    try {
        auto j = nlohmann::json::parse(ifs);
        if (!j.is_object()) throw std::runtime_error("top level is not an object");
        if (!j.contains("tasks") || !j["tasks"].is_object()) {
            throw std::runtime_error("missing 'tasks' object");
        }
        if (j.contains("downloaded_bytes")) downloaded = j["downloaded_bytes"].get<uint64_t>();
        if (j.contains("last_download") && !j["last_download"].is_null()) {
            last_download = j["last_download"].get<std::string>();
        }
        for (auto& [id, entry] : j["tasks"].items()) {
            loaded.emplace(id, state_from_json(id, entry));
        }
    } catch (const std::exception& e) {
        throw CorruptLedgerError("ledger " + path_.string() + " is corrupt: " + e.what());
    }

    entries_ = std::move(loaded);
    downloaded_bytes_ = downloaded;
    last_download_ = std::move(last_download);
    flushed_bytes_.clear();
    for (const auto& [id, state] : entries_) {
        flushed_bytes_[id] = state.bytes_downloaded;
    }
}

void StatusLedger::flush() {
    nlohmann::json j;
    j["version"] = LEDGER_VERSION;
    j["last_download"] = last_download_.empty() ? nlohmann::json(nullptr)
                                                : nlohmann::json(last_download_);
    j["downloaded_bytes"] = downloaded_bytes_;
    j["tasks"] = nlohmann::json::object();
    for (const auto& [id, state] : entries_) {
        j["tasks"][id] = state_to_json(state);
    }
    std::string data = j.dump(2);
    data += '\n';

    auto dir = path_.has_parent_path() ? path_.parent_path() : std::filesystem::path(".");
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);

    auto tmp_path = path_;
    tmp_path += ".tmp";

    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw LedgerWriteError("cannot create " + tmp_path.string() + ": " + std::strerror(errno));
    }
    if (!write_all(fd, data.data(), data.size())) {
        int saved = errno;
        ::close(fd);
        ::unlink(tmp_path.c_str());
        throw LedgerWriteError("write to " + tmp_path.string() + " failed: " + std::strerror(saved));
    }
    if (::fsync(fd) != 0) {
        int saved = errno;
        ::close(fd);
        ::unlink(tmp_path.c_str());
        throw LedgerWriteError("fsync of " + tmp_path.string() + " failed: " + std::strerror(saved));
    }
    if (::close(fd) != 0) {
        int saved = errno;
        ::unlink(tmp_path.c_str());
        throw LedgerWriteError("close of " + tmp_path.string() + " failed: " + std::strerror(saved));
    }

    if (::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        int saved = errno;
        ::unlink(tmp_path.c_str());
        throw LedgerWriteError("rename to " + path_.string() + " failed: " + std::strerror(saved));
    }
    fsync_directory(dir);

    for (const auto& [id, state] : entries_) {
        flushed_bytes_[id] = state.bytes_downloaded;
    }
    ++flush_count_;
}

// --- In-memory accessors ---

size_t StatusLedger::merge(const std::vector<TransferTask>& tasks) {
    size_t inserted = 0;
    for (const auto& task : tasks) {
        auto [it, added] = entries_.try_emplace(task.id);
        if (added) {
            it->second.updated_at = utc_timestamp_now();
            flushed_bytes_[task.id] = 0;
            ++inserted;
        }
    }
    return inserted;
}

bool StatusLedger::contains(const std::string& id) const {
    return entries_.count(id) != 0;
}

TransferState StatusLedger::get(const std::string& id) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) return {};
    return it->second;
}

void StatusLedger::set(const std::string& id, const TransferState& state) {
    auto it = entries_.find(id);
    bool must_flush = it == entries_.end() ||
                      it->second.status != state.status ||
                      it->second.retry_count != state.retry_count;

    TransferState next = state;
    next.updated_at = utc_timestamp_now();
    entries_[id] = next;

    uint64_t last = flushed_bytes_.count(id) ? flushed_bytes_[id] : 0;
    if (next.bytes_downloaded < last ||
        next.bytes_downloaded - last >= flush_threshold_bytes_) {
        must_flush = true;
    }

    if (must_flush) flush();
}

void StatusLedger::record_download(uint64_t bytes) {
    downloaded_bytes_ += bytes;
    last_download_ = utc_timestamp_now();
}

StatusLedger::Counts StatusLedger::counts() const {
    Counts c;
    for (const auto& [id, state] : entries_) {
        switch (state.status) {
            case TransferStatus::Pending: ++c.pending; break;
            case TransferStatus::InProgress: ++c.in_progress; break;
            case TransferStatus::Completed:
                ++c.completed;
                c.completed_bytes += state.bytes_downloaded;
                break;
            case TransferStatus::Failed: ++c.failed; break;
        }
    }
    return c;
}

}  // namespace katafetch
