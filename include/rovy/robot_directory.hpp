#pragma once
/**
 * @file robot_directory.hpp
 * @brief Durable list of robots this installation has paired with.
 *
 * @details
 * PURPOSE
 * -------
 * After a successful pairing the robot's URL, control token and the pairing
 * device's id are remembered, so the next launch can reconnect silently
 * instead of repeating provisioning and the PIN exchange.
 *
 * STORAGE
 * -------
 * One JSON array under the `paired_robots` key. The format is plain JSON and
 * safe to read or edit by hand:
 * @code
 *   [{"robot_id":"rovy-7f3a","name":"Rovy","baseUrl":"http://10.0.0.15:8000",
 *     "device_id":"6a1e...","control_token":"...","last_ip":"10.0.0.15",
 *     "last_wifi_ssid":"HomeNet","last_seen":"2026-10-19T08:15:02.113Z"}]
 * @endcode
 * An unreadable or malformed array is logged and read as empty; entries
 * missing robot_id or baseUrl are skipped.
 *
 * TRUST
 * -----
 * A record is only good for auto-reconnect when its device_id matches the
 * current installation (see SessionManager::connect_to_stored_robot). The
 * directory itself does not enforce that; it only stores.
 */

#include "rovy/kv_store.hpp"
#include "rovy/robot_api.hpp"
#include "rovy/transport/http_client.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace rovy {

struct StoredRobotRecord {
    std::string                robot_id;
    std::optional<std::string> name;
    std::string                base_url;
    std::string                device_id;
    std::string                control_token;
    std::optional<std::string> last_ip;
    std::optional<std::string> last_wifi_ssid;
    std::optional<std::string> last_seen;       ///< ISO 8601, UTC
};

void to_json(nlohmann::json& j, const StoredRobotRecord& r);
void from_json(const nlohmann::json& j, StoredRobotRecord& r);

/// Current UTC time as `YYYY-MM-DDTHH:MM:SS.mmmZ`.
std::string iso8601_now();

class RobotDirectory {
public:
    using TimestampFn = std::function<std::string()>;

    explicit RobotDirectory(KeyValueStore& store);

    std::vector<StoredRobotRecord>   list() const;
    std::optional<StoredRobotRecord> find_by_id(const std::string& robot_id) const;

    /// Exact URL (case-insensitive) first, then IPv4 match against last_ip or the record's URL host.
    std::optional<StoredRobotRecord> find_by_url(const std::string& url) const;

    /// Insert or replace by robot_id; stamps last_seen.
    bool save(StoredRobotRecord record);
    bool remove(const std::string& robot_id);

    // Field updates. False when the robot is unknown or the store refused the write.
    bool mark_seen(const std::string& robot_id);
    bool update_last_ip(const std::string& robot_id, const std::string& ip);
    bool update_last_wifi_ssid(const std::string& robot_id, const std::string& ssid);

    /// Test hook for deterministic last_seen values.
    void set_timestamp_fn(TimestampFn fn) { now_ = std::move(fn); }

private:
    bool write(const std::vector<StoredRobotRecord>& robots);
    bool update(const std::string& robot_id, const std::function<void(StoredRobotRecord&)>& change);

    KeyValueStore& store_;
    TimestampFn    now_;
};

// --- availability ---

enum class RobotAvailability { Ready, NeedsRepair, Offline };

const char* to_string(RobotAvailability a);

struct RobotCheck {
    StoredRobotRecord          robot;
    RobotAvailability          availability = RobotAvailability::Offline;
    std::optional<RobotStatus> status;
};

/**
 * @brief Ask a stored robot whether it is reachable and still honors our token.
 *
 * Fetches telemetry from the record's URL (or http://<last_ip>:8000).
 * claimed == false or tokenValid == false means NeedsRepair; any failure
 * means Offline. Never throws.
 */
RobotCheck check_robot(HttpClient& http, const StoredRobotRecord& robot, int timeout_ms = 3000);

} // namespace rovy
