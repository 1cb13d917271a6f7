#pragma once
/**
 * @file discovery.hpp
 * @brief Find the robot's current address on the LAN without user input.
 *
 * @details
 * PURPOSE
 * -------
 * A robot's address changes every time it joins a new Wi-Fi network or falls
 * back to its own hotspot. The engine turns what we know (the host's IPv4,
 * the last base URL, an address the robot reported, addresses of paired
 * robots) into an ordered candidate list and probes it one URL at a time
 * until something answers like a robot.
 *
 * CANDIDATE ORDER
 * ---------------
 *   host in hotspot /24   ->  hotspot address only (192.168.4.1)
 *   otherwise, on the host's /24 prefix P:
 *     1. reported status IP, if it is on P
 *     2. P.<last octet of the known base URL host>
 *     3. P.<last octet of the default address>
 *     4. P.<last octet of each paired robot's last IP>
 *     5. P.1 .. P.254 ascending
 *   The host's own address is never a candidate; duplicates collapse by
 *   normalized URL. Scheme and port come from the known URL, else the default.
 *   When the host has no usable IPv4, the list degrades to the reported IP,
 *   the known URL and the default URL.
 *
 * PROBE
 * -----
 *   GET <url><health_path>, time-boxed. Only a 2xx with a JSON content type and
 *   a body that parses as JSON counts. A captive portal answering 200 text/html
 *   is "not the robot". Probes never throw.
 *
 * SWEEP
 * -----
 * One sweep at a time (a second caller gets Busy). Candidates are probed
 * strictly in order; the first success wins. URLs probed in this
 * DiscoverySession are skipped on later sweeps while the /24 prefix is
 * unchanged; a prefix change throws the tried set away. The sweep ends early
 * when cancel() is called, when the host's prefix changes mid-sweep, when
 * `sweep_timeout_ms` of wall clock is spent, or after `max_sweep_candidates`
 * probes.
 */

#include "rovy/error.hpp"
#include "rovy/settings.hpp"
#include "rovy/transport/http_client.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace rovy {

struct DiscoveryCandidate {
    std::string url;
    bool        tried = false;
};

struct DiscoverySession {
    std::optional<std::string> ip_prefix;     ///< host /24 this session belongs to
    std::set<std::string>      tried_urls;
    std::optional<std::string> found_url;
    bool                       running = false;
};

struct DiscoveryInputs {
    std::string                host_ip;          ///< may be empty when unknown
    std::string                known_base_url;
    std::optional<std::string> known_status_ip;  ///< IPv4 the robot last reported
    std::vector<std::string>   known_ips;        ///< last IPs of paired robots
};

enum class SweepResult { Found, NotFound, Cancelled, Busy };

const char* to_string(SweepResult result);

struct SweepReport {
    SweepResult                result = SweepResult::NotFound;
    std::optional<std::string> url;      ///< set when Found
    std::string                hint;     ///< user-facing text when not Found
    int                        probed  = 0;
    int                        skipped = 0;   ///< already tried this session
};

class DiscoveryEngine {
public:
    using HostIpFn = std::function<std::optional<std::string>()>;
    using ClockFn  = std::function<uint64_t()>;

    explicit DiscoveryEngine(HttpClient& http, Settings settings = Settings{});

    /// Ordered, deduplicated candidate URLs. Pure: no I/O, no session change.
    std::vector<std::string> candidates(const DiscoveryInputs& in) const;

    /// candidates() annotated with the current session's tried set.
    std::vector<DiscoveryCandidate> plan(const DiscoveryInputs& in) const;

    /// Liveness check; true only for a JSON-answering robot.
    bool probe(const std::string& url, int timeout_ms);
    ProbeOutcome probe_outcome(const std::string& url, int timeout_ms);

    /**
     * @brief Probe candidates in order until one answers.
     * @param current_host_ip Polled between probes; a different /24 cancels the sweep.
     */
    SweepReport sweep(const DiscoveryInputs& in, HostIpFn current_host_ip = HostIpFn{});

    /// Ask a running sweep to stop before its next probe. Thread-safe.
    void cancel() { cancel_.store(true); }

    /// Forget tried URLs and any found URL.
    void reset();

    DiscoverySession session() const;

    const Settings& settings() const { return settings_; }

    /// Test hook: replace the steady clock used for the sweep time box.
    void set_clock(ClockFn clock) { clock_ = std::move(clock); }

    static std::string not_found_hint(const std::optional<std::string>& prefix);

private:
    void enter_prefix_locked(const std::optional<std::string>& prefix);
    uint64_t now_ms() const;

    HttpClient&       http_;
    Settings          settings_;
    ClockFn           clock_;

    mutable std::mutex mu_;
    DiscoverySession   session_;
    std::atomic<bool>  cancel_{false};
};

} // namespace rovy
