#pragma once

#include <stdexcept>
#include <string>

namespace katafetch {

/// Failure categories shared by the transport, the transfer manager and the ledger.
enum class ErrorKind {
    InvalidRange,         // start date after end date (fatal)
    CorruptLedger,        // ledger file exists but does not parse (fatal unless reset)
    LedgerWrite,          // ledger flush failed (fatal)
    ThrottledExhausted,   // throttling backoff budget used up for one object
    PermanentFetchError,  // non-retryable origin response
    TransientFetchError,  // network / 5xx failures exhausted the attempt budget
    SizeMismatch,         // stream or resume size inconsistent with the origin total
    LocalIoError,         // destination file could not be opened or written
    ExtractionError,      // post-download decompression failed (never affects transfer state)
};

const char* to_string(ErrorKind kind);

/// Base class for the fatal conditions that abort a run.
class FetchError : public std::runtime_error {
public:
    FetchError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class InvalidRangeError : public FetchError {
public:
    explicit InvalidRangeError(const std::string& message)
        : FetchError(ErrorKind::InvalidRange, message) {}
};

class CorruptLedgerError : public FetchError {
public:
    explicit CorruptLedgerError(const std::string& message)
        : FetchError(ErrorKind::CorruptLedger, message) {}
};

class LedgerWriteError : public FetchError {
public:
    explicit LedgerWriteError(const std::string& message)
        : FetchError(ErrorKind::LedgerWrite, message) {}
};

}  // namespace katafetch
