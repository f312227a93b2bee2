#include "katafetch/errors.hpp"

namespace katafetch {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidRange: return "InvalidRange";
        case ErrorKind::CorruptLedger: return "CorruptLedger";
        case ErrorKind::LedgerWrite: return "LedgerWrite";
        case ErrorKind::ThrottledExhausted: return "ThrottledExhausted";
        case ErrorKind::PermanentFetchError: return "PermanentFetchError";
        case ErrorKind::TransientFetchError: return "TransientFetchError";
        case ErrorKind::SizeMismatch: return "SizeMismatch";
        case ErrorKind::LocalIoError: return "LocalIoError";
        case ErrorKind::ExtractionError: return "ExtractionError";
    }
    return "Unknown";
}

}  // namespace katafetch
