// ============================================================================
// error.cpp — implementation for error.hpp
// ============================================================================

#include "rovy/error.hpp"

namespace rovy {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::PermissionDenied:       return "permission_denied";
        case ErrorCode::AdapterUnavailable:     return "adapter_unavailable";
        case ErrorCode::ServiceNotFound:        return "service_not_found";
        case ErrorCode::CharacteristicNotFound: return "characteristic_not_found";
        case ErrorCode::NotConnected:           return "not_connected";
        case ErrorCode::ConnectFailed:          return "connect_failed";
        case ErrorCode::WriteFailed:            return "write_failed";
        case ErrorCode::ScanFailed:             return "scan_failed";
        case ErrorCode::InvalidArgument:        return "invalid_argument";
        case ErrorCode::NotConfigured:          return "not_configured";
        case ErrorCode::RequestFailed:          return "request_failed";
        case ErrorCode::Timeout:                return "timeout";
        case ErrorCode::AuthRejected:           return "auth_rejected";
        case ErrorCode::MalformedResponse:      return "malformed_response";
    }
    return "unknown";
}

const char* to_string(ProbeOutcome outcome) {
    switch (outcome) {
        case ProbeOutcome::Ok:          return "ok";
        case ProbeOutcome::Timeout:     return "timeout";
        case ProbeOutcome::Rejected:    return "rejected";
        case ProbeOutcome::Unreachable: return "unreachable";
        case ProbeOutcome::NotJson:     return "not_json";
    }
    return "unknown";
}

} // namespace rovy
