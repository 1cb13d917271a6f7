#pragma once
/**
 * @file device_identity.hpp
 * @brief Stable per-installation identifier used to bind paired robots to this device.
 *
 * The first call generates a random UUID v4 and stores it under `device_id`.
 * Later calls return the stored value. When the store refuses the write, a
 * `temp-<uuid>` identifier is returned and cached for the process lifetime,
 * so pairing still works but will not survive a restart.
 */

#include "rovy/kv_store.hpp"

#include <string>

namespace rovy {

/// Random RFC 4122 version 4 UUID, lower-case, 36 chars.
std::string generate_uuid_v4();

class DeviceIdentity {
public:
    explicit DeviceIdentity(KeyValueStore& store) : store_(store) {}

    /// Get or create the identifier. Never empty.
    const std::string& id();

    /// True when id() had to fall back to a non-persisted identifier.
    bool is_temporary() const { return temporary_; }

private:
    KeyValueStore& store_;
    std::string    cached_;
    bool           temporary_ = false;
};

} // namespace rovy
