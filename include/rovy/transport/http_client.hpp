#pragma once
/**
 * @file http_client.hpp
 * @brief Minimal HTTP request/response seam used by discovery and the robot API.
 *
 * @details
 * PURPOSE
 * -------
 * Everything that talks to a robot goes through HttpClient::send(). The
 * production implementation is CurlHttpClient (http_curl.hpp); tests plug in a
 * scripted fake. Keeping the seam this small means the discovery sweep and the
 * session logic can be exercised without a network.
 *
 * ERROR MODEL
 * -----------
 * send() never throws for network conditions. Transport failures are reported
 * by value in HttpResponse::error; an HTTP error status (404, 500...) is a
 * successful transport with a non-2xx `status`. Callers decide what is fatal.
 *
 * THREADING
 * ---------
 * Implementations must allow concurrent send() calls from different threads;
 * the session refresh issues its three fetches in parallel.
 */

#include <map>
#include <string>

namespace rovy {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;                 // sent only when non-empty
    int timeout_ms = 5000;            // whole request, connect included
};

enum class HttpError {
    None,
    Timeout,            ///< time box expired before a full response
    ConnectionFailed,   ///< refused, unreachable, name resolution
    Other               ///< anything else the transport reports
};

struct HttpResponse {
    int status = 0;                   // 0 when the transport failed
    std::string content_type;         // lower-cased, parameters kept
    std::string body;
    HttpError error = HttpError::None;
    std::string error_message;

    bool transport_ok() const { return error == HttpError::None; }
    bool ok() const { return transport_ok() && status >= 200 && status < 300; }
};

class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

} // namespace rovy
