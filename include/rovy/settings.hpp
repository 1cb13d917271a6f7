#pragma once
/**
 * @file settings.hpp
 * @brief Tunables for discovery, polling, the radio scan and HTTP timeouts.
 *
 * @details
 * All knobs live in one plain struct with field defaults, so a default-built
 * `Settings{}` is a working configuration. `load_settings()` overlays values
 * from `<state dir>/config.json`; keys that are missing keep their defaults
 * and a malformed file is logged and ignored. The CLI then overlays its own
 * options for the current run.
 *
 * Example config.json:
 * @code
 *   {
 *     "default_base_url": "http://192.168.1.10:8000",
 *     "probe_timeout_ms": 1200,
 *     "poll_interval_ms": 5000
 *   }
 * @endcode
 */

#include <cstdint>
#include <filesystem>
#include <string>

namespace rovy {

#define ROVY_DEFAULT_BASE_URL   "http://192.168.1.10:8000"
#define ROVY_DEFAULT_PORT       "8000"
#define ROVY_HOTSPOT_PREFIX     "192.168.4"
#define ROVY_HOTSPOT_HOST       "192.168.4.1"
#define ROVY_DEVICE_NAME_PREFIX "ROVY-"

struct Settings {
    // --- addressing ---
    std::string default_base_url   = ROVY_DEFAULT_BASE_URL;
    std::string default_port       = ROVY_DEFAULT_PORT;
    std::string hotspot_prefix     = ROVY_HOTSPOT_PREFIX;   ///< robot's own AP subnet (/24)
    std::string hotspot_host       = ROVY_HOTSPOT_HOST;     ///< robot address on its AP
    std::string health_path        = "/health";

    // --- discovery ---
    int      probe_timeout_ms      = 1500;     ///< per candidate
    int      sweep_timeout_ms      = 120000;   ///< whole sweep, wall clock
    int      max_sweep_candidates  = 260;      ///< hard cap on probes per sweep

    // --- session ---
    int      request_timeout_ms      = 5000;
    int      status_check_timeout_ms = 3000;   ///< directory availability checks
    uint32_t poll_interval_ms        = 10000;

    // --- radio ---
    int         scan_timeout_ms    = 10000;
    std::string device_name_prefix = ROVY_DEVICE_NAME_PREFIX;
};

/**
 * @brief Per-user state directory: $XDG_CONFIG_HOME/rovy or $HOME/.config/rovy.
 */
std::filesystem::path default_state_dir();

/**
 * @brief Overlay values from a JSON file onto defaults.
 *
 * Never throws. A missing file is normal (first run); an unreadable or
 * malformed one is logged at warn level.
 */
Settings load_settings(const std::filesystem::path& file);

} // namespace rovy
