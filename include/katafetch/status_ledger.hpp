#pragma once

#include "katafetch/target_enumerator.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace katafetch {

enum class TransferStatus {
    Pending,
    InProgress,
    Completed,
    Failed,
};

const char* to_string(TransferStatus status);
std::optional<TransferStatus> parse_transfer_status(const std::string& text);

/// Persisted progress of one TransferTask.
///
/// Completed implies bytes_downloaded == total_bytes and the destination file
/// has exactly that size. Failed implies retry_count reached the configured maximum.
struct TransferState {
    TransferStatus status = TransferStatus::Pending;
    uint64_t bytes_downloaded = 0;
    std::optional<uint64_t> total_bytes;  // Unknown until the origin reports it
    uint32_t retry_count = 0;
    std::optional<std::string> last_error;
    std::string sha256;      // Hex digest of a completed archive (may be empty)
    std::string updated_at;  // UTC timestamp of the last change

    bool operator==(const TransferState&) const = default;
};

/// Durable mapping task-id -> TransferState, stored as one JSON document.
///
/// Every flush writes a sibling temp file, fsyncs it, renames it over the
/// ledger and fsyncs the directory, so a reader (or a restarted process)
/// only ever sees a complete ledger. Entries are never deleted.
///
/// Single-writer: exactly one TransferManager mutates a ledger instance.
/// External processes may read the file at any time.
class StatusLedger {
public:
    /// @param path                   Ledger file (e.g. <dir>/download_status.json).
    /// @param flush_threshold_bytes  Byte growth per entry that forces a flush.
    explicit StatusLedger(std::filesystem::path path,
                          uint64_t flush_threshold_bytes = 8ULL * 1024 * 1024);

    StatusLedger(const StatusLedger&) = delete;
    StatusLedger& operator=(const StatusLedger&) = delete;

    /// Replace the in-memory mapping with the persisted one. A missing file
    /// yields an empty ledger. Throws CorruptLedgerError if the file exists
    /// but does not parse or violates the entry invariants.
    void load();

    /// Insert a Pending entry for every task id not yet present.
    /// Existing entries are left untouched. Returns the number inserted.
    size_t merge(const std::vector<TransferTask>& tasks);

    bool contains(const std::string& id) const;

    /// Returns a default (Pending) state for unknown ids.
    TransferState get(const std::string& id) const;

    /// Store a state. Flushes when status or retry_count changed, or when
    /// bytes_downloaded grew by at least the threshold since the last flush.
    void set(const std::string& id, const TransferState& state);

    /// Atomically persist the full mapping. Throws LedgerWriteError.
    void flush();

    /// Add bytes actually transferred to the aggregate counter and stamp
    /// last_download. Persisted with the next flush.
    void record_download(uint64_t bytes);

    struct Counts {
        size_t pending = 0;
        size_t in_progress = 0;
        size_t completed = 0;
        size_t failed = 0;
        uint64_t completed_bytes = 0;
    };
    Counts counts() const;

    const std::map<std::string, TransferState>& entries() const { return entries_; }
    const std::filesystem::path& path() const { return path_; }
    uint64_t downloaded_bytes() const { return downloaded_bytes_; }
    const std::string& last_download() const { return last_download_; }
    size_t flush_count() const { return flush_count_; }

private:
    std::filesystem::path path_;
    uint64_t flush_threshold_bytes_;

    std::map<std::string, TransferState> entries_;
    std::map<std::string, uint64_t> flushed_bytes_;  // bytes_downloaded at last flush

    uint64_t downloaded_bytes_ = 0;
    std::string last_download_;
    size_t flush_count_ = 0;
};

}  // namespace katafetch
