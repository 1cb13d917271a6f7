// ============================================================================
// session_manager.cpp — implementation for session_manager.hpp
// For the refresh/merge rules and polling model see the matching .hpp.
// ============================================================================

#include "rovy/session_manager.hpp"
#include "rovy/error.hpp"
#include "rovy/log.hpp"
#include "rovy/net_util.hpp"

#include <future>

using json = nlohmann::json;

namespace rovy {

static const char* MOD = "session";

// ---------------------------------------------------------------------------
// Refresh helpers
// ---------------------------------------------------------------------------
namespace {

struct Fetch {
    std::optional<json> body;
    std::string         error;
};

Fetch fetch(RobotApi api, json (RobotApi::*call)()) {
    Fetch f;
    try {
        f.body = (api.*call)();
    } catch (const LinkError& e) {
        f.error = e.what();
    }
    return f;
}

template <typename T>
std::optional<T> pick(const std::optional<T>& a, const std::optional<T>& b,
                      const std::optional<T>& c = std::nullopt) {
    if (a) return a;
    if (b) return b;
    return c;
}

NetworkInfo merge_network(const NetworkInfo& telemetry, const NetworkInfo& health,
                          const NetworkInfo& dedicated) {
    NetworkInfo n;
    n.ip              = pick(telemetry.ip, health.ip, dedicated.ip);
    n.wifi_ssid       = pick(telemetry.wifi_ssid, health.wifi_ssid, dedicated.wifi_ssid);
    n.signal_strength = pick(telemetry.signal_strength, health.signal_strength, dedicated.signal_strength);
    if      (!telemetry.available_networks.empty()) n.available_networks = telemetry.available_networks;
    else if (!health.available_networks.empty())    n.available_networks = health.available_networks;
    else                                            n.available_networks = dedicated.available_networks;
    return n;
}

json network_json(const NetworkInfo& n) {
    json j = json::object();
    if (n.ip)              j["ip"] = *n.ip;
    if (n.wifi_ssid)       j["wifiSsid"] = *n.wifi_ssid;
    if (n.signal_strength) j["signalStrength"] = *n.signal_strength;
    if (!n.available_networks.empty()) j["availableNetworks"] = n.available_networks;
    return j;
}

RobotStatus merge_status(const std::optional<json>& health, const std::optional<json>& telemetry,
                         const std::optional<json>& netinfo, const std::string& base_url) {
    const RobotStatus h = health    ? parse_robot_status(*health)    : RobotStatus{};
    const RobotStatus t = telemetry ? parse_robot_status(*telemetry) : RobotStatus{};
    const NetworkInfo d = netinfo   ? parse_network_info(*netinfo)   : NetworkInfo{};

    RobotStatus s;
    s.battery        = pick(t.battery, h.battery);
    s.cpu_load       = pick(t.cpu_load, h.cpu_load);
    s.temperature_c  = pick(t.temperature_c, h.temperature_c);
    s.humidity       = pick(t.humidity, h.humidity);
    s.uptime_seconds = pick(t.uptime_seconds, h.uptime_seconds);
    s.claimed        = pick(t.claimed, h.claimed);
    s.token_valid    = pick(t.token_valid, h.token_valid);
    s.robot_id       = pick(t.robot_id, h.robot_id);
    s.name           = pick(t.name, h.name);
    s.network        = merge_network(t.network, h.network, d);
    if (!s.network.ip) s.network.ip = ipv4_from_url(base_url);

    s.raw = json::object();
    if (health && health->is_object())       s.raw.update(*health);
    if (telemetry && telemetry->is_object()) s.raw.update(*telemetry);
    s.raw["network"] = network_json(s.network);
    return s;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / persistence
// ---------------------------------------------------------------------------
SessionManager::SessionManager(HttpClient& http, KeyValueStore& store, DeviceIdentity& identity,
                               Settings settings)
: http_(http),
  store_(store),
  identity_(identity),
  settings_(std::move(settings)),
  directory_(store) {
    session_.base_url = normalize_url(settings_.default_base_url);
}

static std::optional<std::string> non_empty(std::optional<std::string> v) {
    if (v && trim(*v).empty()) return std::nullopt;
    if (v) return trim(*v);
    return v;
}

void SessionManager::load() {
    std::lock_guard<std::mutex> lk(mu_);
    const auto url = non_empty(store_.get(keys::BASE_URL));
    session_.base_url        = normalize_url(url ? *url : settings_.default_base_url);
    session_.control_token   = non_empty(store_.get(keys::CONTROL_TOKEN));
    session_.session_id      = non_empty(store_.get(keys::SESSION_ID));
    session_.active_robot_id = non_empty(store_.get(keys::ACTIVE_ROBOT_ID));
    log_info(MOD, "loaded session url=" + session_.base_url
             + (session_.control_token ? " token=yes" : " token=no"));
}

// Writes each field under its own key; absent fields are erased.
void SessionManager::persist_locked() {
    auto save = [this](const char* key, const std::optional<std::string>& v) {
        const bool ok = v ? store_.put(key, *v) : store_.erase(key);
        if (!ok) log_warn(MOD, std::string("failed to persist ") + key);
    };
    save(keys::BASE_URL,        session_.base_url);
    save(keys::CONTROL_TOKEN,   session_.control_token);
    save(keys::SESSION_ID,      session_.session_id);
    save(keys::ACTIVE_ROBOT_ID, session_.active_robot_id);
}

ConnectionSession SessionManager::session() const {
    std::lock_guard<std::mutex> lk(mu_);
    return session_;
}

std::optional<RobotStatus> SessionManager::status() const {
    std::lock_guard<std::mutex> lk(mu_);
    return status_;
}

RobotApi SessionManager::make_api_locked() const {
    RobotApi api(http_, session_.base_url, settings_.request_timeout_ms);
    api.set_auth(session_.control_token, session_.session_id);
    return api;
}

RobotApi SessionManager::api() const {
    std::lock_guard<std::mutex> lk(mu_);
    return make_api_locked();
}

// ---------------------------------------------------------------------------
// Address
// ---------------------------------------------------------------------------
void SessionManager::set_base_url(const std::string& url) {
    const std::string next = normalize_url(url);
    if (next.empty()) {
        throw LinkError(ErrorCode::InvalidArgument, "Robot address must not be empty.");
    }
    std::lock_guard<std::mutex> lk(mu_);
    log_info(MOD, "base url " + session_.base_url + " -> " + next);
    session_.base_url = next;
    session_.last_error.reset();
    void_inflight_locked();          // results for the old address are stale
    persist_locked();
}

void SessionManager::adopt_discovered(const std::string& url) {
    set_base_url(url);

    const auto active = session().active_robot_id;
    const auto ip = ipv4_from_url(url);
    if (active && ip) directory_.update_last_ip(*active, *ip);

    refresh_status();
}

DiscoveryInputs SessionManager::discovery_inputs(const std::string& host_ip) const {
    DiscoveryInputs in;
    in.host_ip = host_ip;
    {
        std::lock_guard<std::mutex> lk(mu_);
        in.known_base_url = session_.base_url;
        if (status_) in.known_status_ip = status_->network.ip;
    }
    for (const auto& r : directory_.list()) {
        auto ip = r.last_ip ? r.last_ip : ipv4_from_url(r.base_url);
        if (ip) in.known_ips.push_back(*ip);
    }
    return in;
}

// ---------------------------------------------------------------------------
// Refresh
// ---------------------------------------------------------------------------
bool SessionManager::refresh_status() {
    uint64_t ticket = 0;
    std::string base;
    std::optional<RobotApi> api;
    {
        std::lock_guard<std::mutex> lk(mu_);
        ticket = ++next_ticket_;
        base   = session_.base_url;
        api.emplace(make_api_locked());
    }
    log_debug(MOD, "refresh #" + std::to_string(ticket) + " from " + base);

    auto f_health    = std::async(std::launch::async, fetch, *api, &RobotApi::health);
    auto f_telemetry = std::async(std::launch::async, fetch, *api, &RobotApi::telemetry);
    auto f_network   = std::async(std::launch::async, fetch, *api, &RobotApi::network_info);

    const Fetch health    = f_health.get();
    const Fetch telemetry = f_telemetry.get();
    const Fetch network   = f_network.get();

    const bool any = health.body || telemetry.body || network.body;

    std::lock_guard<std::mutex> lk(mu_);
    if (ticket <= applied_ticket_) {
        log_debug(MOD, "refresh #" + std::to_string(ticket) + " superseded, dropped");
        return any;
    }
    applied_ticket_ = ticket;

    if (!any) {
        const std::string& why = !telemetry.error.empty() ? telemetry.error
                               : !health.error.empty()    ? health.error
                                                          : network.error;
        status_.reset();
        session_.last_error = why;
        log_warn(MOD, "failed to refresh robot status: " + why);
        return false;
    }

    status_ = merge_status(health.body, telemetry.body, network.body, base);
    session_.last_updated = iso8601_now();
    session_.last_error.reset();
    log_debug(MOD, "robot status updated");
    return true;
}

// ---------------------------------------------------------------------------
// Polling
// ---------------------------------------------------------------------------
void SessionManager::set_polling(bool enabled, uint64_t now_ms) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (session_.is_polling == enabled) return;     // no second schedule
        session_.is_polling = enabled;
        if (!enabled) {
            next_poll_due_.reset();
            log_info(MOD, "polling stopped");
            return;
        }
        next_poll_due_ = now_ms + settings_.poll_interval_ms;
        log_info(MOD, "polling every " + std::to_string(settings_.poll_interval_ms) + "ms");
    }
    refresh_status();
}

bool SessionManager::tick(uint64_t now_ms) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!session_.is_polling || !next_poll_due_ || now_ms < *next_poll_due_) return false;
        next_poll_due_ = now_ms + settings_.poll_interval_ms;
    }
    refresh_status();
    return true;
}

bool SessionManager::is_polling() const {
    std::lock_guard<std::mutex> lk(mu_);
    return session_.is_polling;
}

std::optional<uint64_t> SessionManager::next_poll_due() const {
    std::lock_guard<std::mutex> lk(mu_);
    return next_poll_due_;
}

// ---------------------------------------------------------------------------
// Directory
// ---------------------------------------------------------------------------
bool SessionManager::connect_to_stored_robot(const std::string& url) {
    const auto record = directory_.find_by_url(url);
    if (!record) {
        log_info(MOD, "no stored robot for " + url);
        return false;
    }
    if (record->device_id != identity_.id()) {
        log_warn(MOD, "stored robot " + record->robot_id + " was paired by another device, ignoring");
        return false;
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        session_.base_url        = normalize_url(record->base_url);
        session_.control_token   = record->control_token.empty()
                                 ? std::nullopt : std::optional<std::string>(record->control_token);
        session_.active_robot_id = record->robot_id;
        session_.session_id.reset();            // belonged to the previous robot
        session_.last_error.reset();
        status_.reset();
        void_inflight_locked();
        persist_locked();
    }
    directory_.mark_seen(record->robot_id);
    log_info(MOD, "adopted stored robot " + record->robot_id + " at " + record->base_url);

    // unreachable right now is fine: the robot is still ours
    refresh_status();
    return true;
}

void SessionManager::clear_connection() {
    std::lock_guard<std::mutex> lk(mu_);
    session_ = ConnectionSession{};
    session_.base_url = normalize_url(settings_.default_base_url);
    status_.reset();
    next_poll_due_.reset();
    void_inflight_locked();

    for (const char* key : {keys::BASE_URL, keys::CONTROL_TOKEN, keys::SESSION_ID, keys::ACTIVE_ROBOT_ID}) {
        if (!store_.erase(key)) log_warn(MOD, std::string("failed to erase ") + key);
    }
    log_info(MOD, "connection cleared");
}

// ---------------------------------------------------------------------------
// Pairing
// ---------------------------------------------------------------------------
json SessionManager::request_pairing() {
    log_info(MOD, "requesting pairing");
    return api().request_claim();
}

void SessionManager::set_control_token(const std::string& token) {
    std::lock_guard<std::mutex> lk(mu_);
    const std::string t = trim(token);
    session_.control_token = t.empty() ? std::nullopt : std::optional<std::string>(t);
    persist_locked();
}

void SessionManager::set_session_id(const std::string& session_id) {
    std::lock_guard<std::mutex> lk(mu_);
    const std::string s = trim(session_id);
    session_.session_id = s.empty() ? std::nullopt : std::optional<std::string>(s);
    persist_locked();
}

ClaimResult SessionManager::confirm_pairing(const std::string& pin) {
    ClaimResult claim = api().confirm_claim(pin);      // throws on bad PIN / rejection

    StoredRobotRecord rec;
    {
        std::lock_guard<std::mutex> lk(mu_);
        session_.control_token = claim.control_token;
        session_.session_id    = claim.session_id;

        rec.robot_id = claim.robot_id.value_or("");
        if (rec.robot_id.empty() && status_ && status_->robot_id) rec.robot_id = *status_->robot_id;
        if (rec.robot_id.empty()) rec.robot_id = ipv4_from_url(session_.base_url).value_or(session_.base_url);

        rec.name          = status_ ? status_->name : std::nullopt;
        rec.base_url      = session_.base_url;
        rec.device_id     = identity_.id();
        rec.control_token = claim.control_token;
        rec.last_ip       = status_ && status_->network.ip ? status_->network.ip
                                                           : ipv4_from_url(session_.base_url);
        if (status_) rec.last_wifi_ssid = status_->network.wifi_ssid;

        session_.active_robot_id = rec.robot_id;
        persist_locked();
    }
    directory_.save(rec);
    log_info(MOD, "paired with robot " + rec.robot_id + " token=yes");
    return claim;
}

// ---------------------------------------------------------------------------
// Robot Wi-Fi
// ---------------------------------------------------------------------------
json SessionManager::connect_wifi(const WifiCredentials& credentials) {
    json resp = api().connect_wifi(credentials);

    const auto active = session().active_robot_id;
    if (active) directory_.update_last_wifi_ssid(*active, trim(credentials.ssid));

    refresh_status();
    return resp;
}

std::vector<std::string> SessionManager::scan_wifi() {
    return api().scan_wifi();
}

} // namespace rovy
