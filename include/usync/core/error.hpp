#pragma once

#include <string>

namespace usync {

/**
 * @brief Failure categories surfaced by every fallible usync operation
 */
enum class ErrorCode {
    Validation,          ///< Malformed input (empty segment, size mismatch, bad config)
    Integrity,           ///< Stored totals disagree with detail records
    Format,              ///< Wire blob with wrong magic/version or corrupt compression
    Truncation,          ///< Declared counts/lengths exceed the remaining buffer
    TransientTransport,  ///< Busy/unavailable/timeout, retryable
    TerminalTransport,   ///< Transport rejected the request for good
    ConcurrencyConflict, ///< Lost a compare-and-set race
    NotFound,
    Storage,
    StorageBusy,         ///< Store locked, retryable
    Cancelled,
    Io
};

struct Error {
    ErrorCode code = ErrorCode::Validation;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message;
    }
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Validation: return "ValidationError";
        case ErrorCode::Integrity: return "IntegrityError";
        case ErrorCode::Format: return "FormatError";
        case ErrorCode::Truncation: return "TruncationError";
        case ErrorCode::TransientTransport: return "TransientTransportError";
        case ErrorCode::TerminalTransport: return "TerminalTransportError";
        case ErrorCode::ConcurrencyConflict: return "ConcurrencyConflictError";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::Storage: return "StorageError";
        case ErrorCode::StorageBusy: return "StorageBusy";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::Io: return "IoError";
    }
    return "Unknown";
}

inline std::string to_string(const Error& error) {
    return std::string(error_code_name(error.code)) + ": " + error.message;
}

} // namespace usync
