#pragma once
/**
 * @page rovy-log Rovy Logging
 * @file log.hpp
 * @brief Leveled, thread-safe logging with a bounded in-memory history.
 *
 * @details
 * PURPOSE
 * -------
 * Every module in rovy reports what it is doing through these four calls.
 * Output is one `key=value` line per event on stderr so it can be grepped or
 * piped the same way the CLI output is:
 *
 *   level=warn mod=discovery sweep exhausted prefix=10.0.0
 *
 * A copy of each accepted line is kept in a fixed-size ring so a front end can
 * show recent history without scraping stderr.
 *
 * RULES FOR CALLERS
 * -----------------
 * - Never pass passwords, control tokens or session ids, not even shortened.
 *   Abbreviate SSIDs with redact_ssid().
 * - `mod` is a short static token (e.g. "ble", "discovery", "session").
 *
 * CAPACITY
 * --------
 * - LOG_RING_CAP entries, each truncated to LOG_LINE_MAX characters.
 * - When the ring is full the oldest entry is overwritten.
 */

#include <string>
#include <vector>
#include <cstddef>

namespace rovy {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

static constexpr size_t LOG_RING_CAP = 128;  ///< lines kept in memory
static constexpr size_t LOG_LINE_MAX = 160;  ///< chars kept per line

/// Lines below this level are dropped (default: Info).
void set_log_level(LogLevel level);
LogLevel log_level();

/// Enable/disable the stderr sink. The ring buffer is always fed.
void set_log_to_stderr(bool enabled);

void log_message(LogLevel level, const char* mod, const std::string& text);

inline void log_debug(const char* mod, const std::string& text) { log_message(LogLevel::Debug, mod, text); }
inline void log_info (const char* mod, const std::string& text) { log_message(LogLevel::Info,  mod, text); }
inline void log_warn (const char* mod, const std::string& text) { log_message(LogLevel::Warn,  mod, text); }
inline void log_error(const char* mod, const std::string& text) { log_message(LogLevel::Error, mod, text); }

/**
 * @brief Copy of the in-memory ring, oldest first.
 */
std::vector<std::string> recent_logs();

/// Drop all buffered lines (tests, `clear`).
void clear_recent_logs();

/**
 * @brief Shorten an SSID for logs: "HomeNet" -> "Hom...".
 */
std::string redact_ssid(const std::string& ssid);

const char* to_string(LogLevel level);

} // namespace rovy
