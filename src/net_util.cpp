// ============================================================================
// net_util.cpp — implementation for net_util.hpp
// ============================================================================

#include "rovy/net_util.hpp"

#include <cctype>
#include <cstdlib>

namespace rovy {

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string trim(const std::string& value) {
    size_t b = 0, e = value.size();
    while (b < e && is_space(value[b])) ++b;
    while (e > b && is_space(value[e - 1])) --e;
    return value.substr(b, e - b);
}

std::string to_lower(std::string value) {
    for (char& c : value) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return value;
}

bool is_valid_ipv4(const std::string& value) {
    int segments = 0;
    size_t i = 0;
    while (i <= value.size()) {
        size_t dot = value.find('.', i);
        if (dot == std::string::npos) dot = value.size();
        const std::string seg = value.substr(i, dot - i);

        if (seg.empty() || seg.size() > 3) return false;
        for (char c : seg) if (c < '0' || c > '9') return false;
        if (seg.size() > 1 && seg[0] == '0') return false;    // "04" is not an octet, same as inet_pton
        if (std::atoi(seg.c_str()) > 255) return false;

        ++segments;
        i = dot + 1;
        if (dot == value.size()) break;
    }
    return segments == 4;
}

std::optional<UrlParts> parse_url(const std::string& url) {
    std::string s = trim(url);
    if (s.empty()) return std::nullopt;

    UrlParts parts;
    const size_t sep = s.find("://");
    if (sep != std::string::npos) {
        parts.scheme = to_lower(s.substr(0, sep));
        s = s.substr(sep + 3);
    } else {
        parts.scheme = "http";
    }
    if (parts.scheme.empty()) return std::nullopt;

    // authority ends at the first path/query/fragment marker
    const size_t end = s.find_first_of("/?#");
    std::string authority = (end == std::string::npos) ? s : s.substr(0, end);

    // drop userinfo if someone pasted one
    const size_t at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);

    const size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
        for (char c : parts.port) if (c < '0' || c > '9') return std::nullopt;
    } else {
        parts.host = authority;
    }
    parts.host = to_lower(parts.host);
    if (parts.host.empty()) return std::nullopt;
    return parts;
}

std::string normalize_url(const std::string& url) {
    std::string s = trim(url);
    while (!s.empty() && s.back() == '/') s.pop_back();

    auto parts = parse_url(s);
    if (!parts) return s;

    // keep any path the caller gave us; only the authority is canonicalized
    const size_t sep  = s.find("://");
    const size_t from = (sep == std::string::npos) ? 0 : sep + 3;
    const size_t path = s.find_first_of("/?#", from);

    std::string out = parts->scheme + "://" + parts->host;
    if (!parts->port.empty()) out += ":" + parts->port;
    if (path != std::string::npos) out += s.substr(path);
    return out;
}

std::optional<std::string> ipv4_from_url(const std::string& url) {
    auto parts = parse_url(url);
    if (!parts || !is_valid_ipv4(parts->host)) return std::nullopt;
    return parts->host;
}

std::string build_url(const UrlParts& like, const std::string& ip) {
    std::string out = (like.scheme.empty() ? std::string("http") : like.scheme) + "://" + ip;
    if (!like.port.empty()) out += ":" + like.port;
    return out;
}

std::optional<std::string> prefix24(const std::string& ip) {
    if (!is_valid_ipv4(ip)) return std::nullopt;
    return ip.substr(0, ip.rfind('.'));
}

std::optional<int> last_octet(const std::string& ip) {
    if (!is_valid_ipv4(ip)) return std::nullopt;
    return std::atoi(ip.substr(ip.rfind('.') + 1).c_str());
}

} // namespace rovy
