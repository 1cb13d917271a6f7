#pragma once
/**
 * @file provisioning_link.hpp
 * @brief Hands a robot its Wi-Fi credentials over a BLE GATT service.
 *
 * @details
 * PURPOSE
 * -------
 * Before the robot has any IP connectivity, the only way to reach it is the
 * short-range radio. The robot advertises as `ROVY-xxxx` and exposes one
 * provisioning service:
 *
 *   service  1234abcd-0000-1000-8000-00805f9b34fb
 *     config 1234abcd-0001-1000-8000-00805f9b34fb  write: base64({"ssid","password"})
 *     status 1234abcd-0002-1000-8000-00805f9b34fb  read/notify: idle|connecting|connected|failed
 *
 * STATE MACHINE
 * -------------
 *   Idle -> Scanning -> Idle
 *   Idle -> Connecting -> Connected -> Configuring -> Connected | Failed
 *   Any failure during connect lands in Failed. Idle and Failed can start over.
 *
 * THREADING
 * ---------
 * All public calls belong to one owner thread. Status notifications may
 * arrive on a radio thread; they are parked in a bounded inbox and applied by
 * poll() (or wait_for_status()) on the owner thread, so listeners and the
 * session state are only ever touched from there. A notification that lands
 * after disconnect() goes into an inbox nobody reads any more.
 *
 * ERRORS
 * ------
 * Operations throw LinkError. ServiceNotFound / CharacteristicNotFound mean the
 * firmware and this build disagree on the contract and are not retried.
 */

#include "rovy/error.hpp"
#include "rovy/scan_handle.hpp"
#include "rovy/settings.hpp"
#include "rovy/transport/radio_backend.hpp"
#include "rovy/wire.hpp"

#include <etl/deque.h>

#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rovy {

#define ROVY_WIFI_SERVICE_UUID       "1234abcd-0000-1000-8000-00805f9b34fb"
#define ROVY_WIFI_CONFIG_CHAR_UUID   "1234abcd-0001-1000-8000-00805f9b34fb"
#define ROVY_WIFI_STATUS_CHAR_UUID   "1234abcd-0002-1000-8000-00805f9b34fb"

constexpr size_t STATUS_INBOX_CAP = 16;

enum class ProvisioningState { Idle, Scanning, Connecting, Connected, Configuring, Failed };

const char* to_string(ProvisioningState state);

struct ProvisioningSession {
    ProvisioningState          state = ProvisioningState::Idle;
    std::optional<std::string> connected_device_id;
    WifiStatus                 last_status = WifiStatus::Idle;
};

class ProvisioningLink {
public:
    using DeviceFn = std::function<void(const RadioDevice&)>;
    using StatusFn = std::function<void(WifiStatus)>;

    /// backend may be null only when support is unavailable. Both must outlive the link.
    ProvisioningLink(RadioSupport support, RadioBackend* backend, PermissionGate& permissions,
                     Settings settings = Settings{});
    ~ProvisioningLink();

    ProvisioningLink(const ProvisioningLink&) = delete;
    ProvisioningLink& operator=(const ProvisioningLink&) = delete;

    // --- capability ---
    const RadioSupport& support() const { return support_; }
    std::optional<std::string> unavailable_reason() const;

    // --- scanning ---
    /**
     * @brief Start a raw scan; advertisements stream through the returned handle.
     * The handle must not outlive the link. Destroying it stops the scan.
     */
    std::unique_ptr<ScanHandle> start_scan(int timeout_ms);

    /**
     * @brief Scan for robots for timeout_ms and return them.
     * Only named devices with the robot prefix are kept; each id is reported to
     * on_found once, and the returned list carries the latest signal strength.
     */
    std::vector<RadioDevice> scan(int timeout_ms, DeviceFn on_found = DeviceFn{});

    // --- connection ---
    void connect(const std::string& device_id);
    void send_config(const std::string& ssid, const std::string& password);
    void disconnect();

    // --- status ---
    /// Apply queued notifications; returns how many were applied.
    size_t poll();

    /// Poll until the robot reports connected or failed, or timeout_ms passes.
    WifiStatus wait_for_status(int timeout_ms);

    /// Registers a listener and immediately calls it with the current status.
    int  on_status_change(StatusFn fn);
    void remove_status_callback(int id);

    WifiStatus current_status() const { return session_.last_status; }
    bool is_connected() const { return static_cast<bool>(conn_); }
    const ProvisioningSession& session() const { return session_; }
    ProvisioningState state() const { return session_.state; }

private:
    struct Inbox {
        std::mutex                                mu;
        std::condition_variable                   cv;
        etl::deque<std::string, STATUS_INBOX_CAP> values;
    };

    void ensure_ready();
    void apply_status_value(const std::string& transport_value);
    void apply_status(WifiStatus status);
    void drop_connection();

    RadioSupport     support_;
    RadioBackend*    backend_;
    PermissionGate&  permissions_;
    Settings         settings_;

    ProvisioningSession             session_;
    std::unique_ptr<GattConnection> conn_;
    std::shared_ptr<Inbox>          inbox_;

    std::map<int, StatusFn> listeners_;
    int                     next_listener_id_ = 1;
};

} // namespace rovy
