// ============================================================================
// settings.cpp — implementation for settings.hpp
// ============================================================================

#include "rovy/settings.hpp"
#include "rovy/log.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <system_error>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace rovy {

fs::path default_state_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return fs::path(xdg) / "rovy";
    const char* home = std::getenv("HOME");
    return fs::path(home ? home : ".") / ".config" / "rovy";
}

// Copy j[key] into out when present and of the right JSON type.
template <typename T>
static void overlay(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        log_warn("config", std::string("ignoring ") + key + ": " + e.what());
    }
}

Settings load_settings(const fs::path& file) {
    Settings s;

    std::error_code ec;
    if (!fs::exists(file, ec)) return s;           // first run: defaults

    std::ifstream in(file);
    if (!in) {
        log_warn("config", "cannot read " + file.string());
        return s;
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        log_warn("config", "malformed " + file.string() + ": " + e.what());
        return s;
    }
    if (!j.is_object()) {
        log_warn("config", "expected an object in " + file.string());
        return s;
    }

    overlay(j, "default_base_url",        s.default_base_url);
    overlay(j, "default_port",            s.default_port);
    overlay(j, "hotspot_prefix",          s.hotspot_prefix);
    overlay(j, "hotspot_host",            s.hotspot_host);
    overlay(j, "health_path",             s.health_path);
    overlay(j, "probe_timeout_ms",        s.probe_timeout_ms);
    overlay(j, "sweep_timeout_ms",        s.sweep_timeout_ms);
    overlay(j, "max_sweep_candidates",    s.max_sweep_candidates);
    overlay(j, "request_timeout_ms",      s.request_timeout_ms);
    overlay(j, "status_check_timeout_ms", s.status_check_timeout_ms);
    overlay(j, "poll_interval_ms",        s.poll_interval_ms);
    overlay(j, "scan_timeout_ms",         s.scan_timeout_ms);
    overlay(j, "device_name_prefix",      s.device_name_prefix);

    log_debug("config", "loaded " + file.string());
    return s;
}

} // namespace rovy
