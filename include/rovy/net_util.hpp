#pragma once
/**
 * @file net_util.hpp
 * @brief IPv4 and base-URL helpers shared by discovery, the directory and the session layer.
 *
 * @details
 * Robots are addressed by a base URL such as `http://10.0.0.15:8000`. The
 * helpers here take those apart and put them back together without a URL
 * library: the inputs are short, user-typed or robot-reported strings and the
 * only hosts we ever synthesize are dotted-quad IPv4 addresses.
 *
 * Normalization (normalize_url) is the single definition of "same URL" used
 * for dedupe and directory lookups: trimmed, lower-cased scheme and host,
 * no trailing slashes.
 */

#include <optional>
#include <string>

namespace rovy {

/**
 * @brief Pieces of a base URL.
 *
 * `scheme` has no "://" and no ':' (e.g. "http"); `port` is empty when the
 * URL did not carry one.
 */
struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
};

/// Strict dotted-quad check: four 0..255 decimal segments without leading zeros, nothing else.
bool is_valid_ipv4(const std::string& value);

/// Trim ASCII whitespace on both ends.
std::string trim(const std::string& value);

/// Lower-case ASCII copy.
std::string to_lower(std::string value);

/**
 * @brief Split a base URL. A missing scheme is read as "http".
 * @return std::nullopt when no host can be found.
 */
std::optional<UrlParts> parse_url(const std::string& url);

/**
 * @brief Canonical form used for comparisons and persistence.
 *
 * Trims, strips trailing '/', lower-cases scheme and host, keeps the port.
 * A value that does not parse is only trimmed and stripped.
 */
std::string normalize_url(const std::string& url);

/// Host of @p url when it is a dotted-quad IPv4 address.
std::optional<std::string> ipv4_from_url(const std::string& url);

/// "scheme://ip[:port]" using the scheme/port of @p like.
std::string build_url(const UrlParts& like, const std::string& ip);

/// First three octets of a valid IPv4 ("10.0.0.42" -> "10.0.0").
std::optional<std::string> prefix24(const std::string& ip);

/// Last octet of a valid IPv4 (0..255).
std::optional<int> last_octet(const std::string& ip);

} // namespace rovy
