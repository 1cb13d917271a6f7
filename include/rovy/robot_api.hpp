#pragma once
/**
 * @file robot_api.hpp
 * @brief Typed client for the robot's HTTP endpoints, plus the status model.
 *
 * @details
 * ENDPOINTS (relative to the base URL)
 * ------------------------------------
 *   GET  /health                    liveness + coarse status
 *   GET  /status                    telemetry
 *   GET  /network-info              network details (falls back to /wifi/status on 404)
 *   POST /wifi/connect {ssid,password}
 *   GET  /wifi/scan                 visible networks (falls back to /wifi/networks on 404)
 *   POST /claim/request             robot shows a 6-digit PIN
 *   POST /claim/confirm {pin}       returns controlToken (+ session id)
 *
 * Requests carry `Accept: application/json`; bodies are sent as
 * `application/json`. Once authenticated, `x-control-token` and `session-id`
 * headers are attached to every request.
 *
 * ERRORS
 * ------
 * Every call throws LinkError:
 *   NotConfigured      empty base URL
 *   Timeout            no answer inside timeout_ms
 *   AuthRejected       401 / 403, or a claim without a token
 *   RequestFailed      other non-2xx or transport failure
 *   MalformedResponse  body is not JSON where JSON is required
 *   InvalidArgument    bad SSID or PIN, raised before any I/O
 *
 * RobotApi holds no mutable state across calls other than its
 * configuration, so copies can be used concurrently from worker threads.
 */

#include "rovy/transport/http_client.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rovy {

struct WifiCredentials {
    std::string ssid;        ///< non-empty after trimming
    std::string password;    ///< may be empty for open networks
};

struct NetworkInfo {
    std::optional<std::string> ip;
    std::optional<std::string> wifi_ssid;
    std::optional<int>         signal_strength;
    std::vector<std::string>   available_networks;

    bool empty() const {
        return !ip && !wifi_ssid && !signal_strength && available_networks.empty();
    }
};

struct RobotStatus {
    std::optional<double>      battery;
    std::optional<double>      cpu_load;
    std::optional<double>      temperature_c;
    std::optional<double>      humidity;
    std::optional<int64_t>     uptime_seconds;
    NetworkInfo                network;
    std::optional<bool>        claimed;
    std::optional<bool>        token_valid;
    std::optional<std::string> robot_id;
    std::optional<std::string> name;
    nlohmann::json             raw = nlohmann::json::object();   ///< merged source payloads
};

/// Read the known status fields out of a /status or /health payload.
RobotStatus parse_robot_status(const nlohmann::json& payload);

/**
 * @brief Read network details from any of the shapes robots report:
 * `{network:{...}}`, `{wifi:{...}}` or a flat object (`ip`, `ssid`, `rssi`...).
 */
NetworkInfo parse_network_info(const nlohmann::json& payload);

/// Network names from `{networks:[...]}` or a bare array; items are strings or `{ssid}`.
std::vector<std::string> parse_network_list(const nlohmann::json& payload);

/// True for exactly six ASCII digits.
bool is_valid_pin(const std::string& pin);

struct ClaimResult {
    std::string                control_token;
    std::optional<std::string> session_id;
    std::optional<std::string> robot_id;
    nlohmann::json             raw = nlohmann::json::object();
};

class RobotApi {
public:
    RobotApi(HttpClient& http, std::string base_url, int timeout_ms = 5000);

    void set_base_url(const std::string& url);
    const std::string& base_url() const { return base_url_; }

    void set_auth(std::optional<std::string> control_token, std::optional<std::string> session_id);
    void set_timeout_ms(int ms) { timeout_ms_ = ms; }
    int  timeout_ms() const { return timeout_ms_; }

    nlohmann::json health();
    nlohmann::json telemetry();
    nlohmann::json network_info();
    nlohmann::json connect_wifi(const WifiCredentials& credentials);
    std::vector<std::string> scan_wifi();

    nlohmann::json request_claim();
    ClaimResult    confirm_claim(const std::string& pin);

    std::string stream_url() const { return base_url_ + "/camera/stream"; }

private:
    HttpResponse   perform(const std::string& method, const std::string& path,
                           const nlohmann::json* body);
    nlohmann::json decode(const std::string& path, const HttpResponse& resp) const;
    nlohmann::json request(const std::string& method, const std::string& path,
                           const nlohmann::json* body = nullptr);

    HttpClient*                http_;
    std::string                base_url_;
    int                        timeout_ms_;
    std::optional<std::string> control_token_;
    std::optional<std::string> session_id_;
};

} // namespace rovy
