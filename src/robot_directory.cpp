// ============================================================================
// robot_directory.cpp — implementation for robot_directory.hpp
// ============================================================================

#include "rovy/robot_directory.hpp"
#include "rovy/error.hpp"
#include "rovy/log.hpp"
#include "rovy/net_util.hpp"
#include "rovy/settings.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>

using json = nlohmann::json;

namespace rovy {

// ---------------------------------------------------------------------------
// JSON mapping. Key names match what earlier app builds wrote.
// ---------------------------------------------------------------------------
static void put_opt(json& j, const char* key, const std::optional<std::string>& v) {
    if (v) j[key] = *v;
}

static std::optional<std::string> get_opt(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

void to_json(json& j, const StoredRobotRecord& r) {
    j = json::object();
    j["robot_id"]      = r.robot_id;
    put_opt(j, "name", r.name);
    j["baseUrl"]       = r.base_url;
    j["device_id"]     = r.device_id;
    j["control_token"] = r.control_token;
    put_opt(j, "last_ip",        r.last_ip);
    put_opt(j, "last_wifi_ssid", r.last_wifi_ssid);
    put_opt(j, "last_seen",      r.last_seen);
}

void from_json(const json& j, StoredRobotRecord& r) {
    r.robot_id       = get_opt(j, "robot_id").value_or("");
    r.name           = get_opt(j, "name");
    r.base_url       = get_opt(j, "baseUrl").value_or("");
    r.device_id      = get_opt(j, "device_id").value_or("");
    r.control_token  = get_opt(j, "control_token").value_or("");
    r.last_ip        = get_opt(j, "last_ip");
    r.last_wifi_ssid = get_opt(j, "last_wifi_ssid");
    r.last_seen      = get_opt(j, "last_seen");
}

std::string iso8601_now() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t secs = system_clock::to_time_t(now);
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms));
    return out;
}

// ---------------------------------------------------------------------------
// RobotDirectory
// ---------------------------------------------------------------------------
RobotDirectory::RobotDirectory(KeyValueStore& store)
: store_(store), now_(&iso8601_now) {}

std::vector<StoredRobotRecord> RobotDirectory::list() const {
    std::vector<StoredRobotRecord> out;
    const auto raw = store_.get(keys::PAIRED_ROBOTS);
    if (!raw || trim(*raw).empty()) return out;

    const json j = json::parse(*raw, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_array()) {
        log_warn("directory", "stored robot list is malformed, ignoring it");
        return out;
    }

    for (const auto& item : j) {
        if (!item.is_object()) continue;
        StoredRobotRecord r = item.get<StoredRobotRecord>();
        if (r.robot_id.empty() || r.base_url.empty()) {
            log_warn("directory", "skipping incomplete robot record");
            continue;
        }
        out.push_back(std::move(r));
    }
    return out;
}

bool RobotDirectory::write(const std::vector<StoredRobotRecord>& robots) {
    const json j = robots;
    if (!store_.put(keys::PAIRED_ROBOTS, j.dump())) {
        log_error("directory", "failed to persist robot list");
        return false;
    }
    return true;
}

std::optional<StoredRobotRecord> RobotDirectory::find_by_id(const std::string& robot_id) const {
    for (auto& r : list()) {
        if (r.robot_id == robot_id) return r;
    }
    return std::nullopt;
}

std::optional<StoredRobotRecord> RobotDirectory::find_by_url(const std::string& url) const {
    const auto robots = list();
    const std::string want = to_lower(normalize_url(url));

    for (const auto& r : robots) {
        if (to_lower(normalize_url(r.base_url)) == want) return r;
    }

    const auto ip = ipv4_from_url(url);
    if (!ip) return std::nullopt;
    for (const auto& r : robots) {
        const auto stored = r.last_ip ? r.last_ip : ipv4_from_url(r.base_url);
        if (stored && *stored == *ip) return r;
    }
    return std::nullopt;
}

bool RobotDirectory::save(StoredRobotRecord record) {
    if (record.robot_id.empty()) {
        log_warn("directory", "refusing to save a robot without an id");
        return false;
    }
    record.last_seen = now_();

    auto robots = list();
    bool replaced = false;
    for (auto& r : robots) {
        if (r.robot_id == record.robot_id) {
            r = record;
            replaced = true;
            break;
        }
    }
    if (!replaced) robots.push_back(record);

    if (!write(robots)) return false;
    log_info("directory", std::string(replaced ? "updated" : "saved") + " robot " + record.robot_id);
    return true;
}

bool RobotDirectory::remove(const std::string& robot_id) {
    auto robots = list();
    const auto before = robots.size();
    robots.erase(std::remove_if(robots.begin(), robots.end(),
                                [&](const StoredRobotRecord& r) { return r.robot_id == robot_id; }),
                 robots.end());
    if (robots.size() == before) return true;      // nothing to do
    if (!write(robots)) return false;
    log_info("directory", "removed robot " + robot_id);
    return true;
}

bool RobotDirectory::update(const std::string& robot_id,
                            const std::function<void(StoredRobotRecord&)>& change) {
    auto robots = list();
    for (auto& r : robots) {
        if (r.robot_id == robot_id) {
            change(r);
            return write(robots);
        }
    }
    return false;
}

bool RobotDirectory::mark_seen(const std::string& robot_id) {
    return update(robot_id, [this](StoredRobotRecord& r) { r.last_seen = now_(); });
}

bool RobotDirectory::update_last_ip(const std::string& robot_id, const std::string& ip) {
    return update(robot_id, [&ip](StoredRobotRecord& r) { r.last_ip = ip; });
}

bool RobotDirectory::update_last_wifi_ssid(const std::string& robot_id, const std::string& ssid) {
    return update(robot_id, [&ssid](StoredRobotRecord& r) { r.last_wifi_ssid = ssid; });
}

// ---------------------------------------------------------------------------
// check_robot()
// ---------------------------------------------------------------------------
const char* to_string(RobotAvailability a) {
    switch (a) {
        case RobotAvailability::Ready:       return "ready";
        case RobotAvailability::NeedsRepair: return "needs_repair";
        case RobotAvailability::Offline:     return "offline";
    }
    return "offline";
}

RobotCheck check_robot(HttpClient& http, const StoredRobotRecord& robot, int timeout_ms) {
    RobotCheck out;
    out.robot = robot;

    std::string base = robot.base_url;
    if (base.empty() && robot.last_ip) base = "http://" + *robot.last_ip + ":" ROVY_DEFAULT_PORT;
    if (base.empty()) return out;

    RobotApi api(http, base, timeout_ms);
    if (!robot.control_token.empty()) api.set_auth(robot.control_token, std::nullopt);

    try {
        RobotStatus st = parse_robot_status(api.telemetry());
        if (st.claimed == false || st.token_valid == false) {
            out.availability = RobotAvailability::NeedsRepair;
        } else {
            out.availability = RobotAvailability::Ready;
        }
        out.status = std::move(st);
    } catch (const LinkError& e) {
        log_info("directory", "robot " + robot.robot_id + " status check failed: " + e.what());
        out.availability = RobotAvailability::Offline;
    }
    return out;
}

} // namespace rovy
