// ============================================================================
// host_network.cpp — implementation for host_network.hpp
// ============================================================================

#include "rovy/host_network.hpp"
#include "rovy/log.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <cerrno>
#include <cstring>

namespace rovy {

std::optional<std::string> primary_ipv4() {
    struct ifaddrs* list = nullptr;
    if (getifaddrs(&list) != 0) {
        log_warn("net", std::string("getifaddrs failed: ") + std::strerror(errno));
        return std::nullopt;
    }

    std::optional<std::string> wired, wireless;
    for (struct ifaddrs* it = list; it; it = it->ifa_next) {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
        if (!(it->ifa_flags & IFF_UP))      continue;
        if (it->ifa_flags & IFF_LOOPBACK)   continue;

        const auto* sin = reinterpret_cast<const struct sockaddr_in*>(it->ifa_addr);
        char buf[INET_ADDRSTRLEN] = {0};
        if (!inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) continue;

        std::string ip(buf);
        if (ip == "0.0.0.0") continue;

        const bool is_wl = it->ifa_name && std::strncmp(it->ifa_name, "wl", 2) == 0;
        if (is_wl && !wireless) wireless = ip;
        if (!is_wl && !wired)   wired = ip;
    }
    freeifaddrs(list);

    if (wireless) return wireless;
    return wired;
}

} // namespace rovy
