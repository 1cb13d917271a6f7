// ============================================================================
// provisioning_link.cpp — implementation for provisioning_link.hpp
// For the GATT contract and state machine see the matching .hpp.
// ============================================================================

#include "rovy/provisioning_link.hpp"
#include "rovy/log.hpp"
#include "rovy/net_util.hpp"

#include <algorithm>
#include <chrono>

namespace rovy {

static const char* MOD = "ble";

const char* to_string(ProvisioningState state) {
    switch (state) {
        case ProvisioningState::Idle:        return "idle";
        case ProvisioningState::Scanning:    return "scanning";
        case ProvisioningState::Connecting:  return "connecting";
        case ProvisioningState::Connected:   return "connected";
        case ProvisioningState::Configuring: return "configuring";
        case ProvisioningState::Failed:      return "failed";
    }
    return "idle";
}

static bool same_uuid(const std::string& a, const std::string& b) {
    return to_lower(a) == to_lower(b);
}

ProvisioningLink::ProvisioningLink(RadioSupport support, RadioBackend* backend,
                                   PermissionGate& permissions, Settings settings)
: support_(std::move(support)),
  backend_(backend),
  permissions_(permissions),
  settings_(std::move(settings)),
  inbox_(std::make_shared<Inbox>()) {
    if (support_.available && !backend_) {
        support_ = RadioSupport::unavailable("Bluetooth backend not initialized");
    }
    if (!support_.available) log_info(MOD, "radio unavailable: " + support_.reason);
}

ProvisioningLink::~ProvisioningLink() {
    disconnect();
}

std::optional<std::string> ProvisioningLink::unavailable_reason() const {
    if (support_.available) return std::nullopt;
    return support_.reason;
}

// ---------------------------------------------------------------------------
// ensure_ready(): capability, permissions, adapter power, in that order.
// ---------------------------------------------------------------------------
void ProvisioningLink::ensure_ready() {
    if (!support_.available) {
        throw LinkError(ErrorCode::AdapterUnavailable, support_.reason);
    }

    const auto needed = permissions_.required_permissions();
    if (!needed.empty() && !permissions_.request(needed)) {
        throw LinkError(ErrorCode::PermissionDenied, "Bluetooth permissions not granted");
    }

    const AdapterState st = backend_->adapter_state();
    switch (st) {
        case AdapterState::PoweredOn:
            return;
        case AdapterState::Unauthorized:
            throw LinkError(ErrorCode::PermissionDenied,
                            "Bluetooth permission denied. Please grant Bluetooth permissions in settings.");
        case AdapterState::PoweredOff:
            throw LinkError(ErrorCode::AdapterUnavailable, "Bluetooth is turned off. Please enable Bluetooth.");
        case AdapterState::Unsupported:
            throw LinkError(ErrorCode::AdapterUnavailable,
                            "Bluetooth Low Energy is not supported on this device.");
        case AdapterState::Resetting:
        case AdapterState::Unknown:
            break;
    }
    throw LinkError(ErrorCode::AdapterUnavailable,
                    std::string("Bluetooth is not ready. Current state: ") + to_string(st));
}

// ---------------------------------------------------------------------------
// Scanning
// ---------------------------------------------------------------------------
std::unique_ptr<ScanHandle> ProvisioningLink::start_scan(int timeout_ms) {
    ensure_ready();
    RadioBackend* backend = backend_;
    auto handle = std::make_unique<ScanHandle>(timeout_ms, [backend] { backend->stop_scan(); });
    backend_->start_scan(*handle);
    return handle;
}

std::vector<RadioDevice> ProvisioningLink::scan(int timeout_ms, DeviceFn on_found) {
    if (timeout_ms <= 0) timeout_ms = settings_.scan_timeout_ms;

    auto handle = start_scan(timeout_ms);

    // Scanning only while this call runs
    struct StateGuard {
        ProvisioningLink& link;
        ~StateGuard() {
            if (link.session_.state == ProvisioningState::Scanning) {
                link.session_.state = link.conn_ ? ProvisioningState::Connected : ProvisioningState::Idle;
            }
        }
    } guard{*this};
    session_.state = ProvisioningState::Scanning;
    log_info(MOD, "scanning for " + settings_.device_name_prefix + "* devices");

    std::vector<RadioDevice> found;
    std::map<std::string, size_t> index;   // id -> position in found

    RadioDevice dev;
    while (!handle->finished()) {
        if (!handle->next(dev, 100)) continue;

        if (!dev.display_name) continue;
        if (dev.display_name->rfind(settings_.device_name_prefix, 0) != 0) continue;

        auto it = index.find(dev.id);
        if (it != index.end()) {
            RadioDevice& known = found[it->second];        // latest reading wins
            known.display_name = dev.display_name;
            if (dev.signal_strength) known.signal_strength = dev.signal_strength;
            continue;
        }

        index.emplace(dev.id, found.size());
        found.push_back(dev);
        log_info(MOD, "found " + *dev.display_name + " id=" + dev.id);
        if (on_found) on_found(dev);
    }

    if (auto err = handle->error()) {
        throw LinkError(ErrorCode::ScanFailed, "Bluetooth scan failed: " + *err);
    }
    log_info(MOD, "scan completed, " + std::to_string(found.size()) + " device(s)");
    return found;
}

// ---------------------------------------------------------------------------
// Connection
// ---------------------------------------------------------------------------
void ProvisioningLink::connect(const std::string& device_id) {
    ensure_ready();
    if (conn_) disconnect();

    session_ = ProvisioningSession{};
    session_.state = ProvisioningState::Connecting;
    log_info(MOD, "connecting to " + device_id);

    std::unique_ptr<GattConnection> conn;
    auto inbox = std::make_shared<Inbox>();
    std::optional<std::string> initial;

    try {
        conn = backend_->connect(device_id, settings_.scan_timeout_ms);
        if (!conn) throw LinkError(ErrorCode::ConnectFailed, "Failed to connect to " + device_id);

        const auto services = conn->services();
        auto svc = std::find_if(services.begin(), services.end(),
                                [](const GattService& s) { return same_uuid(s.uuid, ROVY_WIFI_SERVICE_UUID); });
        if (svc == services.end()) {
            throw LinkError(ErrorCode::ServiceNotFound,
                            "Wi-Fi service not found. Expected UUID: " ROVY_WIFI_SERVICE_UUID);
        }

        auto has_char = [&](const char* uuid) {
            return std::any_of(svc->characteristics.begin(), svc->characteristics.end(),
                               [uuid](const GattCharacteristic& c) { return same_uuid(c.uuid, uuid); });
        };
        if (!has_char(ROVY_WIFI_CONFIG_CHAR_UUID)) {
            throw LinkError(ErrorCode::CharacteristicNotFound,
                            "Wi-Fi config characteristic not found. Expected UUID: " ROVY_WIFI_CONFIG_CHAR_UUID);
        }
        if (!has_char(ROVY_WIFI_STATUS_CHAR_UUID)) {
            throw LinkError(ErrorCode::CharacteristicNotFound,
                            "Wi-Fi status characteristic not found. Expected UUID: " ROVY_WIFI_STATUS_CHAR_UUID);
        }

        // seed from one read; a failed read is not fatal, notifications follow
        try {
            initial = conn->read(ROVY_WIFI_SERVICE_UUID, ROVY_WIFI_STATUS_CHAR_UUID);
        } catch (const LinkError& e) {
            log_warn(MOD, std::string("failed to read initial status: ") + e.what());
        }

        conn->subscribe(ROVY_WIFI_SERVICE_UUID, ROVY_WIFI_STATUS_CHAR_UUID,
                        [inbox](const std::string& value) {
                            {
                                std::lock_guard<std::mutex> lk(inbox->mu);
                                if (inbox->values.full()) inbox->values.pop_front();
                                inbox->values.push_back(value);
                            }
                            inbox->cv.notify_all();
                        });
    } catch (const LinkError& e) {
        log_error(MOD, std::string("connect failed: ") + e.what());
        if (conn) conn->cancel();
        session_ = ProvisioningSession{};
        session_.state = ProvisioningState::Failed;
        throw;
    }

    conn_  = std::move(conn);
    inbox_ = std::move(inbox);
    session_.connected_device_id = device_id;
    session_.state = ProvisioningState::Connected;
    log_info(MOD, "connected and subscribed to status updates");

    if (initial) apply_status_value(*initial);
}

void ProvisioningLink::send_config(const std::string& ssid, const std::string& password) {
    if (!conn_) {
        throw LinkError(ErrorCode::NotConnected, "Not connected to ROVY device");
    }
    const std::string name = trim(ssid);
    if (name.empty()) {
        throw LinkError(ErrorCode::InvalidArgument, "SSID cannot be empty");
    }

    log_info(MOD, "sending wifi config ssid=" + redact_ssid(name));
    const std::string payload = encode_wifi_config(name, password);

    try {
        conn_->write_with_response(ROVY_WIFI_SERVICE_UUID, ROVY_WIFI_CONFIG_CHAR_UUID, payload);
    } catch (const std::exception& e) {
        session_.state = ProvisioningState::Failed;
        log_error(MOD, std::string("config write failed: ") + e.what());
        throw LinkError(ErrorCode::WriteFailed, std::string("Failed to send Wi-Fi configuration: ") + e.what());
    }

    session_.state = ProvisioningState::Configuring;   // outcome arrives by notification
}

void ProvisioningLink::drop_connection() {
    try {
        conn_->unsubscribe();
    } catch (const std::exception& e) {
        log_warn(MOD, std::string("unsubscribe failed: ") + e.what());
    }
    try {
        conn_->cancel();
    } catch (const std::exception& e) {
        log_warn(MOD, std::string("cancel failed: ") + e.what());
    }
    conn_.reset();
    inbox_ = std::make_shared<Inbox>();     // late notifications land in the old one
}

void ProvisioningLink::disconnect() {
    if (!conn_) return;
    log_info(MOD, "disconnecting");
    drop_connection();
    session_ = ProvisioningSession{};
}

// ---------------------------------------------------------------------------
// Status
// ---------------------------------------------------------------------------
void ProvisioningLink::apply_status_value(const std::string& transport_value) {
    const WifiStatusReading r = decode_status_value(transport_value);
    if (!r.recognized) {
        log_warn(MOD, "unknown status value '" + transport_value + "', treating as idle");
    }
    apply_status(r.status);
}

void ProvisioningLink::apply_status(WifiStatus status) {
    session_.last_status = status;
    if (session_.state == ProvisioningState::Configuring) {
        if (status == WifiStatus::Connected)   session_.state = ProvisioningState::Connected;
        else if (status == WifiStatus::Failed) session_.state = ProvisioningState::Failed;
    }
    log_info(MOD, std::string("wifi status ") + to_string(status));

    const auto snapshot = listeners_;      // listeners may unregister themselves
    for (const auto& kv : snapshot) {
        try {
            kv.second(status);
        } catch (const std::exception& e) {
            log_error(MOD, std::string("status listener threw: ") + e.what());
        }
    }
}

size_t ProvisioningLink::poll() {
    std::vector<std::string> pending;
    {
        std::lock_guard<std::mutex> lk(inbox_->mu);
        while (!inbox_->values.empty()) {
            pending.push_back(inbox_->values.front());
            inbox_->values.pop_front();
        }
    }
    for (const auto& v : pending) apply_status_value(v);
    return pending.size();
}

WifiStatus ProvisioningLink::wait_for_status(int timeout_ms) {
    using Clock = std::chrono::steady_clock;
    const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms > 0 ? timeout_ms : 0);

    auto settled = [this] {
        if (session_.state == ProvisioningState::Failed) return true;
        if (session_.state == ProvisioningState::Configuring) return false;
        return session_.last_status == WifiStatus::Connected || session_.last_status == WifiStatus::Failed;
    };

    poll();
    while (!settled() && conn_) {
        const auto now = Clock::now();
        if (now >= deadline) break;

        auto inbox = inbox_;
        {
            std::unique_lock<std::mutex> lk(inbox->mu);
            inbox->cv.wait_until(lk, std::min(deadline, now + std::chrono::milliseconds(200)),
                                 [&inbox] { return !inbox->values.empty(); });
        }
        poll();
    }
    return session_.last_status;
}

int ProvisioningLink::on_status_change(StatusFn fn) {
    const int id = next_listener_id_++;
    listeners_.emplace(id, fn);
    try {
        fn(session_.last_status);
    } catch (const std::exception& e) {
        log_error(MOD, std::string("status listener threw: ") + e.what());
    }
    return id;
}

void ProvisioningLink::remove_status_callback(int id) {
    listeners_.erase(id);
}

} // namespace rovy
