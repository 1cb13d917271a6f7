// ============================================================================
// discovery.cpp — implementation for discovery.hpp
// For the candidate order and sweep rules see the matching .hpp.
// ============================================================================

#include "rovy/discovery.hpp"
#include "rovy/log.hpp"
#include "rovy/net_util.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>

namespace rovy {

const char* to_string(SweepResult result) {
    switch (result) {
        case SweepResult::Found:     return "found";
        case SweepResult::NotFound:  return "not_found";
        case SweepResult::Cancelled: return "cancelled";
        case SweepResult::Busy:      return "busy";
    }
    return "not_found";
}

DiscoveryEngine::DiscoveryEngine(HttpClient& http, Settings settings)
: http_(http), settings_(std::move(settings)) {}

uint64_t DiscoveryEngine::now_ms() const {
    if (clock_) return clock_();
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

std::string DiscoveryEngine::not_found_hint(const std::optional<std::string>& prefix) {
    if (!prefix) return "robot not found - enter IP manually if needed";
    return "searching on " + *prefix + ".x - enter IP manually if needed";
}

// ---------------------------------------------------------------------------
// candidates()
// ---------------------------------------------------------------------------
// Small ordered set: first insertion wins, keyed by normalized URL.
namespace {
struct OrderedUrls {
    std::vector<std::string> list;
    std::set<std::string>    seen;

    void add(const std::string& url) {
        std::string key = normalize_url(url);
        if (key.empty() || !seen.insert(key).second) return;
        list.push_back(key);
    }
};
} // namespace

std::vector<std::string> DiscoveryEngine::candidates(const DiscoveryInputs& in) const {
    OrderedUrls out;

    const auto known_parts   = parse_url(in.known_base_url);
    const auto default_parts = parse_url(settings_.default_base_url);

    UrlParts like;
    if (known_parts)        like = *known_parts;
    else if (default_parts) like = *default_parts;
    else                    like = UrlParts{"http", "", settings_.default_port};

    const std::string host = trim(in.host_ip);
    const bool host_ok = is_valid_ipv4(host) && host != "0.0.0.0";

    // --- no usable host address: best guesses only, no sweep ---
    if (!host_ok) {
        if (in.known_status_ip && is_valid_ipv4(*in.known_status_ip)) {
            out.add(build_url(like, *in.known_status_ip));
        }
        if (known_parts)   out.add(in.known_base_url);
        if (default_parts) out.add(settings_.default_base_url);
        return out.list;
    }

    const std::string prefix = *prefix24(host);

    // --- robot hotspot: the robot is the gateway, nothing to sweep ---
    if (prefix == settings_.hotspot_prefix) {
        if (settings_.hotspot_host != host) out.add(build_url(like, settings_.hotspot_host));
        return out.list;
    }

    auto add_on_prefix = [&](const UrlParts& parts, int octet) {
        if (octet < 1 || octet > 254) return;
        const std::string ip = prefix + "." + std::to_string(octet);
        if (ip == host) return;                     // never probe ourselves
        out.add(build_url(parts, ip));
    };

    // 1. address the robot reported, if it is reachable from here
    if (in.known_status_ip && is_valid_ipv4(*in.known_status_ip)) {
        const std::string& sip = *in.known_status_ip;
        if (prefix24(sip) == prefix) {
            add_on_prefix(like, *last_octet(sip));
        } else {
            log_debug("discovery", "status ip " + sip + " is off-prefix, skipped");
        }
    }

    // 2./3. robots tend to keep their last octet across networks
    if (known_parts && is_valid_ipv4(known_parts->host)) {
        add_on_prefix(*known_parts, *last_octet(known_parts->host));
    }
    if (default_parts && is_valid_ipv4(default_parts->host)) {
        add_on_prefix(*default_parts, *last_octet(default_parts->host));
    }

    // 4. paired robots
    for (const auto& ip : in.known_ips) {
        if (auto oct = last_octet(ip)) add_on_prefix(like, *oct);
    }

    // 5. everything else
    for (int oct = 1; oct <= 254; ++oct) add_on_prefix(like, oct);

    return out.list;
}

std::vector<DiscoveryCandidate> DiscoveryEngine::plan(const DiscoveryInputs& in) const {
    const auto urls = candidates(in);
    const auto prefix = prefix24(trim(in.host_ip));

    std::lock_guard<std::mutex> lk(mu_);
    const bool same_prefix = session_.ip_prefix == prefix;

    std::vector<DiscoveryCandidate> out;
    out.reserve(urls.size());
    for (const auto& u : urls) {
        out.push_back({u, same_prefix && session_.tried_urls.count(u) > 0});
    }
    return out;
}

// ---------------------------------------------------------------------------
// probe()
// ---------------------------------------------------------------------------
ProbeOutcome DiscoveryEngine::probe_outcome(const std::string& url, int timeout_ms) {
    HttpRequest req;
    req.method     = "GET";
    req.url        = normalize_url(url) + settings_.health_path;
    req.timeout_ms = timeout_ms;
    req.headers["Accept"] = "application/json";

    const HttpResponse resp = http_.send(req);

    if (resp.error == HttpError::Timeout) return ProbeOutcome::Timeout;
    if (!resp.transport_ok())             return ProbeOutcome::Unreachable;
    if (!resp.ok())                       return ProbeOutcome::Rejected;
    if (to_lower(resp.content_type).find("json") == std::string::npos) return ProbeOutcome::NotJson;
    if (!nlohmann::json::accept(resp.body)) return ProbeOutcome::NotJson;
    return ProbeOutcome::Ok;
}

bool DiscoveryEngine::probe(const std::string& url, int timeout_ms) {
    const ProbeOutcome outcome = probe_outcome(url, timeout_ms);
    log_debug("discovery", "probe " + url + " -> " + to_string(outcome));
    return outcome == ProbeOutcome::Ok;
}

// ---------------------------------------------------------------------------
// sweep()
// ---------------------------------------------------------------------------
void DiscoveryEngine::enter_prefix_locked(const std::optional<std::string>& prefix) {
    if (session_.ip_prefix == prefix) return;
    if (session_.ip_prefix) {
        log_info("discovery", "network prefix changed, dropping "
                 + std::to_string(session_.tried_urls.size()) + " tried candidates");
    }
    session_.ip_prefix = prefix;
    session_.tried_urls.clear();
    session_.found_url.reset();
}

void DiscoveryEngine::reset() {
    std::lock_guard<std::mutex> lk(mu_);
    session_.tried_urls.clear();
    session_.found_url.reset();
}

DiscoverySession DiscoveryEngine::session() const {
    std::lock_guard<std::mutex> lk(mu_);
    return session_;
}

SweepReport DiscoveryEngine::sweep(const DiscoveryInputs& in, HostIpFn current_host_ip) {
    SweepReport report;
    const auto prefix = prefix24(trim(in.host_ip));

    {
        std::lock_guard<std::mutex> lk(mu_);
        if (session_.running) {
            report.result = SweepResult::Busy;
            report.hint   = "discovery already running";
            return report;
        }
        session_.running = true;
        enter_prefix_locked(prefix);
    }
    cancel_.store(false);

    // clears `running` on every exit path
    struct RunningGuard {
        DiscoveryEngine& e;
        ~RunningGuard() {
            std::lock_guard<std::mutex> lk(e.mu_);
            e.session_.running = false;
        }
    } guard{*this};

    const auto urls     = candidates(in);
    const uint64_t t0   = now_ms();
    const uint64_t stop = t0 + static_cast<uint64_t>(std::max(0, settings_.sweep_timeout_ms));

    log_info("discovery", "sweep start prefix=" + prefix.value_or("none")
             + " candidates=" + std::to_string(urls.size()));

    for (const auto& url : urls) {
        if (cancel_.load()) {
            report.result = SweepResult::Cancelled;
            report.hint   = "discovery cancelled";
            log_info("discovery", "sweep cancelled");
            return report;
        }

        if (current_host_ip) {
            const auto now_ip = current_host_ip();
            const auto now_prefix = now_ip ? prefix24(*now_ip) : std::nullopt;
            if (now_prefix != prefix) {
                std::lock_guard<std::mutex> lk(mu_);
                enter_prefix_locked(now_prefix);
                report.result = SweepResult::Cancelled;
                report.hint   = "host network changed";
                return report;
            }
        }

        {
            std::lock_guard<std::mutex> lk(mu_);
            if (session_.tried_urls.count(url)) {
                ++report.skipped;
                continue;
            }
        }

        if (report.probed >= settings_.max_sweep_candidates) {
            log_warn("discovery", "sweep hit candidate cap");
            break;
        }
        const uint64_t now = now_ms();
        if (now >= stop) {
            log_warn("discovery", "sweep hit time limit");
            break;
        }
        const int budget = static_cast<int>(std::min<uint64_t>(
            static_cast<uint64_t>(settings_.probe_timeout_ms), stop - now));

        {
            std::lock_guard<std::mutex> lk(mu_);
            session_.tried_urls.insert(url);
        }
        ++report.probed;

        if (probe(url, budget)) {
            std::lock_guard<std::mutex> lk(mu_);
            session_.found_url = url;
            session_.tried_urls.clear();
            report.result = SweepResult::Found;
            report.url    = url;
            log_info("discovery", "found robot at " + url + " after "
                     + std::to_string(report.probed) + " probes");
            return report;
        }
    }

    report.result = SweepResult::NotFound;
    report.hint   = not_found_hint(prefix);
    log_info("discovery", "sweep done, " + report.hint);
    return report;
}

} // namespace rovy
