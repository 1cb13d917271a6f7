#pragma once
/**
 * @file host_network.hpp
 * @brief The host's own IPv4 address, the anchor for the discovery sweep.
 */

#include <optional>
#include <string>

namespace rovy {

/**
 * @brief First up, non-loopback IPv4 address of this host.
 *
 * Wireless interfaces (wl*, wlan*) are preferred over wired ones since the
 * robot lives on the Wi-Fi LAN. `0.0.0.0` counts as no address.
 */
std::optional<std::string> primary_ipv4();

} // namespace rovy
