// ============================================================================
// http_curl.cpp — implementation for transport/http_curl.hpp
// ============================================================================

#include "rovy/transport/http_curl.hpp"
#include "rovy/log.hpp"
#include "rovy/net_util.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace rovy {

// ---------------------------------------------------------------------------
// Process-wide libcurl init. Lives until exit; curl_global_cleanup() runs from
// the static destructor after every client is gone.
// ---------------------------------------------------------------------------
namespace {

struct CurlGlobal {
    CURLcode rc;
    CurlGlobal() : rc(curl_global_init(CURL_GLOBAL_DEFAULT)) {}
    ~CurlGlobal() { if (rc == CURLE_OK) curl_global_cleanup(); }
};

CurlGlobal& curl_global() {
    static CurlGlobal g;
    return g;
}

struct EasyDeleter  { void operator()(CURL* h) const { curl_easy_cleanup(h); } };
struct SlistDeleter { void operator()(curl_slist* l) const { curl_slist_free_all(l); } };

using EasyPtr  = std::unique_ptr<CURL, EasyDeleter>;
using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;

size_t on_body(char* data, size_t size, size_t nmemb, void* user) {
    auto* out = static_cast<std::string*>(user);
    out->append(data, size * nmemb);
    return size * nmemb;
}

HttpError classify(CURLcode rc) {
    switch (rc) {
        case CURLE_OK:                  return HttpError::None;
        case CURLE_OPERATION_TIMEDOUT:  return HttpError::Timeout;
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:         return HttpError::ConnectionFailed;
        default:                        return HttpError::Other;
    }
}

} // namespace

CurlHttpClient::CurlHttpClient() {
    if (curl_global().rc != CURLE_OK) {
        log_error("http", std::string("curl_global_init failed: ") + curl_easy_strerror(curl_global().rc));
    }
}

HttpResponse CurlHttpClient::send(const HttpRequest& request) {
    HttpResponse resp;

    EasyPtr h(curl_easy_init());
    if (!h) {
        resp.error = HttpError::Other;
        resp.error_message = "curl_easy_init failed";
        return resp;
    }

    curl_slist* raw = nullptr;
    for (const auto& kv : request.headers) {
        const std::string line = kv.first + ": " + kv.second;
        curl_slist* next = curl_slist_append(raw, line.c_str());
        if (!next) {
            curl_slist_free_all(raw);
            resp.error = HttpError::Other;
            resp.error_message = "out of memory building headers";
            return resp;
        }
        raw = next;
    }
    SlistPtr headers(raw);

    const long timeout = request.timeout_ms > 0 ? request.timeout_ms : 5000;

    curl_easy_setopt(h.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h.get(), CURLOPT_TIMEOUT_MS, timeout);
    curl_easy_setopt(h.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout);
    curl_easy_setopt(h.get(), CURLOPT_FOLLOWLOCATION, 0L);   // a redirect is not the robot
    curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, &on_body);
    curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, &resp.body);
    if (headers) curl_easy_setopt(h.get(), CURLOPT_HTTPHEADER, headers.get());

    if (request.method == "POST") {
        curl_easy_setopt(h.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(h.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        curl_easy_setopt(h.get(), CURLOPT_POSTFIELDS, request.body.c_str());
    } else if (request.method != "GET") {
        curl_easy_setopt(h.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
        if (!request.body.empty()) {
            curl_easy_setopt(h.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
            curl_easy_setopt(h.get(), CURLOPT_POSTFIELDS, request.body.c_str());
        }
    }

    const CURLcode rc = curl_easy_perform(h.get());
    resp.error = classify(rc);
    if (rc != CURLE_OK) {
        resp.error_message = curl_easy_strerror(rc);
        resp.body.clear();
        log_debug("http", request.method + " " + request.url + " -> " + resp.error_message);
        return resp;
    }

    long code = 0;
    curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &code);
    resp.status = static_cast<int>(code);

    char* ctype = nullptr;
    curl_easy_getinfo(h.get(), CURLINFO_CONTENT_TYPE, &ctype);
    if (ctype) resp.content_type = to_lower(ctype);

    log_debug("http", request.method + " " + request.url + " -> " + std::to_string(resp.status));
    return resp;
}

} // namespace rovy
