// ============================================================================
// robot_api.cpp — implementation for robot_api.hpp
// ============================================================================

#include "rovy/robot_api.hpp"
#include "rovy/error.hpp"
#include "rovy/log.hpp"
#include "rovy/net_util.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

using json = nlohmann::json;

namespace rovy {

// ---------------------------------------------------------------------------
// Field helpers: robots are not consistent about types, so numbers may come
// as strings and booleans as 0/1. Anything unusable reads as absent.
// ---------------------------------------------------------------------------
namespace {

const json* member(const json& obj, const char* key) {
    if (!obj.is_object()) return nullptr;
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return nullptr;
    return &*it;
}

std::optional<double> num_field(const json& obj, const char* key) {
    const json* v = member(obj, key);
    if (!v) return std::nullopt;
    std::optional<double> d;
    if (v->is_number()) d = v->get<double>();
    if (v->is_string()) {
        const std::string s = v->get<std::string>();
        char* end = nullptr;
        const double parsed = std::strtod(s.c_str(), &end);
        if (end && end != s.c_str() && *end == '\0') d = parsed;
    }
    if (d && !std::isfinite(*d)) return std::nullopt;      // "nan", "inf", 1e999
    return d;
}

// Integer view of a numeric field; values the target type cannot hold are absent.
template <typename T>
std::optional<T> int_field(const json& obj, const char* key) {
    const auto d = num_field(obj, key);
    if (!d) return std::nullopt;
    // lowest() is -2^k, exactly representable; the valid range is [-2^k, 2^k)
    const double lo = static_cast<double>(std::numeric_limits<T>::lowest());
    if (*d < lo || *d >= -lo) return std::nullopt;
    return static_cast<T>(*d);
}

std::optional<std::string> str_field(const json& obj, const char* key) {
    const json* v = member(obj, key);
    if (!v) return std::nullopt;
    if (v->is_string()) {
        std::string s = v->get<std::string>();
        if (s.empty()) return std::nullopt;
        return s;
    }
    if (v->is_number_integer()) return std::to_string(v->get<int64_t>());
    return std::nullopt;
}

std::optional<bool> bool_field(const json& obj, const char* key) {
    const json* v = member(obj, key);
    if (!v) return std::nullopt;
    if (v->is_boolean())        return v->get<bool>();
    if (v->is_number_integer()) return v->get<int64_t>() != 0;
    return std::nullopt;
}

template <typename T>
std::optional<T> first_of(std::optional<T> a, std::optional<T> b) { return a ? a : b; }

} // namespace

// ---------------------------------------------------------------------------
// Status model
// ---------------------------------------------------------------------------

std::vector<std::string> parse_network_list(const json& payload) {
    const json* list = &payload;
    if (payload.is_object()) {
        list = member(payload, "networks");
        if (!list) list = member(payload, "availableNetworks");
        if (!list) return {};
    }
    std::vector<std::string> out;
    if (!list->is_array()) return out;
    for (const auto& item : *list) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        } else if (auto ssid = str_field(item, "ssid")) {
            out.push_back(*ssid);
        }
    }
    return out;
}

NetworkInfo parse_network_info(const json& payload) {
    NetworkInfo n;
    if (!payload.is_object()) return n;

    const json* src = member(payload, "network");
    if (!src || !src->is_object()) src = member(payload, "wifi");
    if (!src || !src->is_object()) src = &payload;

    n.ip        = first_of(str_field(*src, "ip"), str_field(*src, "ipAddress"));
    n.wifi_ssid = first_of(str_field(*src, "wifiSsid"), str_field(*src, "ssid"));

    n.signal_strength = first_of(int_field<int>(*src, "signalStrength"), int_field<int>(*src, "rssi"));

    n.available_networks = parse_network_list(*src);
    if (n.ip && !is_valid_ipv4(*n.ip)) {
        log_warn("api", "ignoring non-IPv4 network ip '" + *n.ip + "'");
        n.ip.reset();
    }
    return n;
}

RobotStatus parse_robot_status(const json& payload) {
    RobotStatus s;
    if (!payload.is_object()) return s;
    s.raw           = payload;
    s.battery       = num_field(payload, "battery");
    s.cpu_load      = num_field(payload, "cpuLoad");
    s.temperature_c = num_field(payload, "temperatureC");
    s.humidity      = num_field(payload, "humidity");
    s.uptime_seconds = int_field<int64_t>(payload, "uptimeSeconds");
    s.network       = parse_network_info(payload);
    s.claimed       = bool_field(payload, "claimed");
    s.token_valid   = bool_field(payload, "tokenValid");
    s.robot_id      = first_of(str_field(payload, "robotId"), str_field(payload, "robot_id"));
    s.name          = str_field(payload, "name");
    return s;
}

bool is_valid_pin(const std::string& pin) {
    if (pin.size() != 6) return false;
    for (char c : pin) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// RobotApi
// ---------------------------------------------------------------------------

RobotApi::RobotApi(HttpClient& http, std::string base_url, int timeout_ms)
: http_(&http), timeout_ms_(timeout_ms) {
    set_base_url(base_url);
}

void RobotApi::set_base_url(const std::string& url) {
    base_url_ = normalize_url(url);
}

void RobotApi::set_auth(std::optional<std::string> control_token, std::optional<std::string> session_id) {
    control_token_ = std::move(control_token);
    session_id_    = std::move(session_id);
}

HttpResponse RobotApi::perform(const std::string& method, const std::string& path, const json* body) {
    if (base_url_.empty()) {
        throw LinkError(ErrorCode::NotConfigured, "Robot base URL is not configured.");
    }

    HttpRequest req;
    req.method     = method;
    req.url        = base_url_ + path;
    req.timeout_ms = timeout_ms_;
    req.headers["Accept"] = "application/json";
    if (body) {
        req.headers["Content-Type"] = "application/json";
        req.body = body->dump();
    }
    if (control_token_) req.headers["x-control-token"] = *control_token_;
    if (session_id_)    req.headers["session-id"]      = *session_id_;

    HttpResponse resp = http_->send(req);
    switch (resp.error) {
        case HttpError::None:
            break;
        case HttpError::Timeout:
            throw LinkError(ErrorCode::Timeout,
                            "Network request timed out after " + std::to_string(timeout_ms_) + "ms");
        case HttpError::ConnectionFailed:
        case HttpError::Other:
            throw LinkError(ErrorCode::RequestFailed, "Robot request failed: " + resp.error_message);
    }
    return resp;
}

json RobotApi::decode(const std::string& path, const HttpResponse& resp) const {
    if (resp.status == 401 || resp.status == 403) {
        throw LinkError(ErrorCode::AuthRejected,
                        "Robot rejected credentials (" + std::to_string(resp.status) + ")");
    }
    if (!resp.ok()) {
        throw LinkError(ErrorCode::RequestFailed,
                        "Robot request failed (" + std::to_string(resp.status) + "): " + resp.body);
    }
    if (resp.status == 204 || trim(resp.body).empty()) return json::object();

    json j = json::parse(resp.body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        log_warn("api", path + " returned a non-JSON body");
        throw LinkError(ErrorCode::MalformedResponse, "Robot returned a non-JSON response for " + path);
    }
    return j;
}

json RobotApi::request(const std::string& method, const std::string& path, const json* body) {
    return decode(path, perform(method, path, body));
}

json RobotApi::health()    { return request("GET", "/health"); }
json RobotApi::telemetry() { return request("GET", "/status"); }

json RobotApi::network_info() {
    HttpResponse resp = perform("GET", "/network-info", nullptr);
    if (resp.status == 404) {
        log_debug("api", "/network-info missing, trying /wifi/status");
        return request("GET", "/wifi/status");
    }
    return decode("/network-info", resp);
}

json RobotApi::connect_wifi(const WifiCredentials& credentials) {
    const std::string ssid = trim(credentials.ssid);
    if (ssid.empty()) {
        throw LinkError(ErrorCode::InvalidArgument, "Wi-Fi network name must not be empty.");
    }
    json body = {{"ssid", ssid}, {"password", credentials.password}};
    log_info("api", "wifi connect ssid=" + redact_ssid(ssid));
    return request("POST", "/wifi/connect", &body);
}

std::vector<std::string> RobotApi::scan_wifi() {
    HttpResponse resp = perform("GET", "/wifi/scan", nullptr);
    json j;
    if (resp.status == 404) {
        log_debug("api", "/wifi/scan missing, trying /wifi/networks");
        j = request("GET", "/wifi/networks");
    } else {
        j = decode("/wifi/scan", resp);
    }
    return parse_network_list(j);
}

json RobotApi::request_claim() {
    return request("POST", "/claim/request");
}

ClaimResult RobotApi::confirm_claim(const std::string& pin) {
    if (!is_valid_pin(pin)) {
        throw LinkError(ErrorCode::InvalidArgument, "Please enter a valid 6-digit PIN.");
    }
    json body = {{"pin", pin}};
    json j = request("POST", "/claim/confirm", &body);

    ClaimResult r;
    r.raw = j;
    auto token = str_field(j, "controlToken");
    if (!token) token = str_field(j, "control_token");
    if (!token) {
        throw LinkError(ErrorCode::AuthRejected, "Pairing succeeded but no control token was received.");
    }
    r.control_token = *token;
    r.session_id = str_field(j, "sessionId");
    if (!r.session_id) r.session_id = str_field(j, "session_id");
    if (!r.session_id) r.session_id = str_field(j, "session");
    r.robot_id = first_of(str_field(j, "robotId"), str_field(j, "robot_id"));
    return r;
}

} // namespace rovy
