#pragma once
/**
 * @file error.hpp
 * @brief Error taxonomy shared by the provisioning link, the robot API and the session layer.
 *
 * @details
 * Two propagation styles live side by side in rovy:
 *  - Operations a user is waiting on (radio scan/connect/configure, pairing,
 *    Wi-Fi join over HTTP) throw `LinkError`. The caller turns it into a prompt.
 *  - Background work (discovery probes, the polling refresh) never throws.
 *    Probes classify their failure as a `ProbeOutcome`; refresh failures land
 *    in `ConnectionSession::last_error`.
 *
 * `to_string(ErrorCode)` returns stable snake_case tokens. The CLI prints them
 * as `status=error reason=<token>`, so treat them as part of the output contract.
 */

#include <stdexcept>
#include <string>

namespace rovy {

enum class ErrorCode {
    PermissionDenied,        ///< host OS refused radio scan/connect permission
    AdapterUnavailable,      ///< radio off, unsupported, or no backend in this build
    ServiceNotFound,         ///< provisioning service missing: firmware/app mismatch
    CharacteristicNotFound,  ///< config or status characteristic missing
    NotConnected,            ///< operation needs an active radio connection
    ConnectFailed,           ///< radio connection could not be opened
    WriteFailed,             ///< acknowledged write was rejected or lost
    ScanFailed,              ///< radio stack aborted the scan
    InvalidArgument,         ///< bad SSID, bad PIN, bad URL
    NotConfigured,           ///< no base URL to talk to
    RequestFailed,           ///< HTTP transport error or non-2xx status
    Timeout,                 ///< HTTP request exceeded its time box
    AuthRejected,            ///< robot refused the token/PIN (401/403 or no token)
    MalformedResponse        ///< robot answered with something we cannot read
};

const char* to_string(ErrorCode code);

/**
 * @brief Exception raised by user-facing operations.
 *
 * `what()` is a human-readable sentence; `code()` is what callers switch on.
 */
class LinkError : public std::runtime_error {
public:
    LinkError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/**
 * @brief Result classification for a single liveness probe.
 *
 * Every value other than Ok means "try the next candidate".
 */
enum class ProbeOutcome {
    Ok,            ///< 2xx with a JSON body
    Timeout,       ///< no answer inside the probe time box
    Rejected,      ///< answered with a non-2xx status
    Unreachable,   ///< connection refused / no route / DNS
    NotJson        ///< 2xx but not JSON: captive portal or some other service
};

const char* to_string(ProbeOutcome outcome);

} // namespace rovy
