// ============================================================================
// log.cpp — implementation for log.hpp
// For API/overview see the matching .hpp.
// ============================================================================

#include "rovy/log.hpp"

#include "etl/circular_buffer.h"
#include "etl/string.h"

#include <atomic>
#include <iostream>
#include <mutex>

namespace rovy {

namespace {

using LogLine = etl::string<LOG_LINE_MAX>;

// Ring of accepted lines. Writers hold g_mutex; stderr is written under the
// same lock so lines from different threads never interleave.
std::mutex                                    g_mutex;
etl::circular_buffer<LogLine, LOG_RING_CAP>   g_ring;
std::atomic<int>                              g_level{static_cast<int>(LogLevel::Info)};
std::atomic<bool>                             g_stderr{true};

} // namespace

void set_log_level(LogLevel level) { g_level.store(static_cast<int>(level)); }

LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }

void set_log_to_stderr(bool enabled) { g_stderr.store(enabled); }

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

void log_message(LogLevel level, const char* mod, const std::string& text) {
    if (static_cast<int>(level) < g_level.load()) return;

    std::string line = "level=";
    line += to_string(level);
    line += " mod=";
    line += (mod && *mod) ? mod : "-";
    line += ' ';
    line += text;

    std::lock_guard<std::mutex> lock(g_mutex);

    // bounded copy; etl::string truncates at capacity
    LogLine stored;
    stored.assign(line.c_str(), line.size() < LOG_LINE_MAX ? line.size() : LOG_LINE_MAX);
    g_ring.push(stored);                       // overwrites oldest when full

    if (g_stderr.load()) std::cerr << line << "\n";
}

std::vector<std::string> recent_logs() {
    std::lock_guard<std::mutex> lock(g_mutex);
    std::vector<std::string> out;
    out.reserve(g_ring.size());
    for (const auto& l : g_ring) out.emplace_back(l.c_str());
    return out;
}

void clear_recent_logs() {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_ring.clear();
}

std::string redact_ssid(const std::string& ssid) {
    if (ssid.size() <= 3) return ssid + "...";
    return ssid.substr(0, 3) + "...";
}

} // namespace rovy
