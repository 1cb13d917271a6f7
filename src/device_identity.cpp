// ============================================================================
// device_identity.cpp — implementation for device_identity.hpp
// ============================================================================

#include "rovy/device_identity.hpp"
#include "rovy/log.hpp"
#include "rovy/net_util.hpp"

#include <cstdint>
#include <cstdio>
#include <random>

namespace rovy {

std::string generate_uuid_v4() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi = rng();
    uint64_t lo = rng();

    hi = (hi & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;  // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;  // variant 10xx

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFull));
    return std::string(buf);
}

const std::string& DeviceIdentity::id() {
    if (!cached_.empty()) return cached_;

    if (auto stored = store_.get(keys::DEVICE_ID)) {
        std::string v = trim(*stored);
        if (!v.empty()) {
            cached_ = v;
            return cached_;
        }
    }

    std::string fresh = generate_uuid_v4();
    if (store_.put(keys::DEVICE_ID, fresh)) {
        cached_ = fresh;
        log_info("device", "generated device id");
    } else {
        cached_ = "temp-" + fresh;
        temporary_ = true;
        log_warn("device", "device id not persisted, using temporary id");
    }
    return cached_;
}

} // namespace rovy
