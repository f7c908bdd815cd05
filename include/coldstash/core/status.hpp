#pragma once

#include <string>

namespace coldstash {

/// Error classes shared by backends, the upload pipeline and the restore path.
enum class ErrorCode {
    Ok,
    InvalidURI,         // unknown scheme, malformed URI, scheme/adapter mismatch
    InvalidConfig,      // out-of-range settings (chunk size, concurrency...)
    InvalidPrefix,      // malformed key prefix
    InvalidChecksum,    // checksum is not hex of the digest length
    ChecksumMismatch,   // provider rejected the payload digest
    NotFound,           // missing object, bucket or local source
    SourceUnavailable,  // local source exists but cannot be read
    Transient,          // network failure, throttling, 5xx
    Provider,           // any other provider-side rejection
    RestoreInProgress,  // archival restore already requested by someone else
    RestoreTimeout,     // restore did not complete within the poll budget
    Cancelled,
    Closed,             // backend used after close()
};

const char* error_code_name(ErrorCode code);

/// Outcome of a backend or pipeline operation.
struct Status {
    ErrorCode code = ErrorCode::Ok;
    std::string message;
    int http_status = 0;             // 0 when no HTTP exchange took place
    std::string provider_code;       // e.g. "NoSuchKey", "RestoreAlreadyInProgress"

    bool ok() const { return code == ErrorCode::Ok; }

    /// "NotFound: object not found: foo" style rendering for logs.
    std::string to_string() const;

    static Status success() { return {}; }
    static Status error(ErrorCode code, std::string message) {
        Status s;
        s.code = code;
        s.message = std::move(message);
        return s;
    }
};

/// Transient errors are retried with backoff; everything else is final.
bool is_retryable(const Status& status);

/// Configuration and data errors that must never be retried.
inline bool is_permanent(const Status& status) {
    return !status.ok() && !is_retryable(status) && status.code != ErrorCode::Cancelled;
}

} // namespace coldstash
