#pragma once
/**
 * @file session_manager.hpp
 * @brief Single source of truth for "where is the robot and are we authenticated".
 *
 * @details
 * PURPOSE
 * -------
 * The session manager owns the active base URL, the control token and
 * session id, the cached robot status and the polling schedule. The UI (or
 * rovyctl) talks only to this class; everything else it composes: the robot
 * HTTP API, the stored-robot directory and the device identity.
 *
 * PERSISTENCE
 * -----------
 * Every mutation is written through to the key/value store under its own key
 * (robot_base_url, robot_control_token, robot_session_id, active_robot_id),
 * so losing one key never costs the others. load() restores them at startup.
 *
 * REFRESH
 * -------
 * refresh_status() fetches /health, /status and /network-info in parallel.
 * Each fetch fails on its own; the merge runs after all three are done:
 *
 *   field       = telemetry, else health
 *   network.*   = telemetry.network, else health.network, else network-info
 *   network.ip  = ... else the IPv4 host of the base URL
 *
 * All three failing clears the cached status and records last_error. Refreshes
 * may overlap (poller plus a manual refresh). Each one takes a ticket when it
 * starts; a result is applied only if no later-started refresh has already
 * applied, so an older failure can never overwrite a newer success. Changing
 * the base URL or clearing the connection voids every in-flight ticket.
 *
 * POLLING
 * -------
 * Cooperative, driven by the owner's loop:
 * @code
 *   mgr.set_polling(true, now_ms());      // refreshes right away
 *   while (running) {
 *     mgr.tick(now_ms());                 // refreshes when due (every 10 s)
 *     sleep_for(100ms);
 *   }
 * @endcode
 * Enabling twice keeps one schedule; after set_polling(false) no tick refreshes.
 */

#include "rovy/device_identity.hpp"
#include "rovy/discovery.hpp"
#include "rovy/kv_store.hpp"
#include "rovy/robot_api.hpp"
#include "rovy/robot_directory.hpp"
#include "rovy/settings.hpp"
#include "rovy/transport/http_client.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rovy {

struct ConnectionSession {
    std::string                base_url;
    std::optional<std::string> control_token;
    std::optional<std::string> session_id;
    bool                       is_polling = false;
    std::optional<std::string> last_updated;     ///< ISO 8601, last successful refresh
    std::optional<std::string> last_error;
    std::optional<std::string> active_robot_id;  ///< directory entry this session came from
};

class SessionManager {
public:
    SessionManager(HttpClient& http, KeyValueStore& store, DeviceIdentity& identity,
                   Settings settings = Settings{});

    /// Restore the persisted session; missing keys fall back to defaults.
    void load();

    ConnectionSession          session() const;
    std::optional<RobotStatus> status() const;
    RobotDirectory&            directory() { return directory_; }
    const Settings&            settings() const { return settings_; }

    /// RobotApi configured with the current URL and credentials.
    RobotApi api() const;

    // --- address ---
    void set_base_url(const std::string& url);
    void adopt_discovered(const std::string& url);
    DiscoveryInputs discovery_inputs(const std::string& host_ip) const;

    // --- status ---
    bool refresh_status();

    void set_polling(bool enabled, uint64_t now_ms);
    bool tick(uint64_t now_ms);
    bool is_polling() const;
    std::optional<uint64_t> next_poll_due() const;

    // --- directory ---
    bool connect_to_stored_robot(const std::string& url);
    void clear_connection();

    // --- pairing ---
    nlohmann::json request_pairing();
    ClaimResult    confirm_pairing(const std::string& pin);
    void set_control_token(const std::string& token);
    void set_session_id(const std::string& session_id);

    // --- robot wifi ---
    nlohmann::json           connect_wifi(const WifiCredentials& credentials);
    std::vector<std::string> scan_wifi();

private:
    RobotApi make_api_locked() const;
    void     persist_locked();
    void     void_inflight_locked() { applied_ticket_ = next_ticket_; }

    HttpClient&     http_;
    KeyValueStore&  store_;
    DeviceIdentity& identity_;
    Settings        settings_;
    RobotDirectory  directory_;

    mutable std::mutex         mu_;
    ConnectionSession          session_;
    std::optional<RobotStatus> status_;
    std::optional<uint64_t>    next_poll_due_;
    uint64_t                   next_ticket_    = 0;   ///< last ticket handed out
    uint64_t                   applied_ticket_ = 0;   ///< newest ticket whose result is applied
};

} // namespace rovy
