#pragma once
/**
 * @file http_curl.hpp
 * @brief libcurl-backed HttpClient.
 *
 * One easy handle per request, so instances are safe to share between
 * threads. curl_global_init() runs once per process on first construction.
 * Signals are disabled (CURLOPT_NOSIGNAL) so timeouts work off the main thread.
 */

#include "rovy/transport/http_client.hpp"

namespace rovy {

class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();
    HttpResponse send(const HttpRequest& request) override;
};

} // namespace rovy
