#pragma once
/**
 * @file radio_backend.hpp
 * @brief Platform seam for the short-range radio (BLE GATT) used during provisioning.
 *
 * The provisioning logic only ever sees these interfaces. A platform build
 * plugs in a real backend (BlueZ, CoreBluetooth, Android); tests plug in
 * fakes. Whether any backend exists is decided once at startup and carried
 * as RadioSupport; nothing probes for the stack at runtime.
 *
 * Characteristic values cross this seam base64-encoded, the way GATT stacks
 * hand them to applications.
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace rovy {

class ScanHandle;

struct RadioDevice {
  std::string                id;               // opaque, backend-specific
  std::optional<std::string> display_name;
  std::optional<int>         signal_strength;  // RSSI, dBm
};

enum class AdapterState : uint8_t { Unknown, Resetting, Unsupported, Unauthorized, PoweredOff, PoweredOn };

inline const char* to_string(AdapterState s) {
  switch (s) {
    case AdapterState::Unknown:      return "Unknown";
    case AdapterState::Resetting:    return "Resetting";
    case AdapterState::Unsupported:  return "Unsupported";
    case AdapterState::Unauthorized: return "Unauthorized";
    case AdapterState::PoweredOff:   return "PoweredOff";
    case AdapterState::PoweredOn:    return "PoweredOn";
  }
  return "Unknown";
}

/// Resolved once at startup: is there a radio stack in this build at all.
struct RadioSupport {
  bool        available = false;
  std::string reason;              // why not, when !available

  static RadioSupport ok() { return RadioSupport{true, {}}; }
  static RadioSupport unavailable(std::string why) { return RadioSupport{false, std::move(why)}; }
};

enum class Permission : uint8_t { BluetoothScan, BluetoothConnect, FineLocation };

inline const char* to_string(Permission p) {
  switch (p) {
    case Permission::BluetoothScan:    return "bluetooth_scan";
    case Permission::BluetoothConnect: return "bluetooth_connect";
    case Permission::FineLocation:     return "fine_location";
  }
  return "unknown";
}

/**
 * @brief Per-platform runtime permission policy.
 * Contract:
 *  - required_permissions() lists what the host OS wants before scanning.
 *  - request() asks for them; true only if every one was granted.
 */
class PermissionGate {
public:
  virtual ~PermissionGate() = default;
  virtual std::set<Permission> required_permissions() const = 0;
  virtual bool request(const std::set<Permission>& permissions) = 0;
};

/// Hosts where radio access is governed outside the process (Linux/BlueZ group policy).
class NoPermissionGate : public PermissionGate {
public:
  std::set<Permission> required_permissions() const override { return {}; }
  bool request(const std::set<Permission>&) override { return true; }
};

struct GattCharacteristic {
  std::string uuid;
  bool        readable   = false;
  bool        writable   = false;
  bool        notifiable = false;
};

struct GattService {
  std::string                     uuid;
  std::vector<GattCharacteristic> characteristics;
};

/**
 * @brief One open GATT connection.
 * Contract:
 *  - services() enumerates what the peer advertises (throws LinkError on I/O failure).
 *  - read() / write_with_response() move base64 values; both throw LinkError.
 *  - subscribe() may invoke the callback from any thread, until unsubscribe().
 *  - cancel() drops the link; must be safe to call more than once.
 */
class GattConnection {
public:
  using NotifyFn = std::function<void(const std::string& base64_value)>;

  virtual ~GattConnection() = default;
  virtual std::vector<GattService> services() = 0;
  virtual std::string read(const std::string& service, const std::string& characteristic) = 0;
  virtual void write_with_response(const std::string& service, const std::string& characteristic,
                                   const std::string& base64_value) = 0;
  virtual void subscribe(const std::string& service, const std::string& characteristic, NotifyFn fn) = 0;
  virtual void unsubscribe() = 0;
  virtual void cancel() = 0;
};

/**
 * @brief The adapter.
 * Contract:
 *  - start_scan() feeds every advertisement into the handle until stop_scan();
 *    scan errors are reported through ScanHandle::fail().
 *  - connect() blocks up to timeout_ms and throws LinkError(ConnectFailed).
 */
class RadioBackend {
public:
  virtual ~RadioBackend() = default;
  virtual AdapterState adapter_state() = 0;
  virtual void start_scan(ScanHandle& sink) = 0;
  virtual void stop_scan() = 0;
  virtual std::unique_ptr<GattConnection> connect(const std::string& device_id, int timeout_ms) = 0;
};

} // namespace rovy
