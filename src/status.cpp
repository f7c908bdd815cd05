#include "coldstash/core/status.hpp"

namespace coldstash {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::InvalidURI: return "InvalidURI";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        case ErrorCode::InvalidPrefix: return "InvalidPrefix";
        case ErrorCode::InvalidChecksum: return "InvalidChecksum";
        case ErrorCode::ChecksumMismatch: return "ChecksumMismatch";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::SourceUnavailable: return "SourceUnavailable";
        case ErrorCode::Transient: return "Transient";
        case ErrorCode::Provider: return "Provider";
        case ErrorCode::RestoreInProgress: return "RestoreInProgress";
        case ErrorCode::RestoreTimeout: return "RestoreTimeout";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::Closed: return "Closed";
    }
    return "Unknown";
}

std::string Status::to_string() const {
    if (ok()) return "Ok";
    std::string out = error_code_name(code);
    if (!message.empty()) {
        out += ": " + message;
    }
    if (!provider_code.empty()) {
        out += " [" + provider_code + "]";
    }
    if (http_status != 0) {
        out += " (HTTP " + std::to_string(http_status) + ")";
    }
    return out;
}

bool is_retryable(const Status& status) {
    return status.code == ErrorCode::Transient;
}

} // namespace coldstash
