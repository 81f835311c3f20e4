// ============================================================
// interface_provider.cpp -- getifaddrs() interface enumeration
// ============================================================

#include "interface_provider.hpp"
#include "../common/logger.hpp"

#ifndef _WIN32
#  include <ifaddrs.h>
#  include <net/if.h>
#endif

static const char* LIMITED_BROADCAST = "255.255.255.255";

SystemInterfaceProvider::SystemInterfaceProvider(std::string pinned)
    : pinned_(std::move(pinned)) {}

std::vector<InterfaceInfo> SystemInterfaceProvider::list() {
    std::vector<InterfaceInfo> result;
#ifndef _WIN32
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) != 0) {
        LOG_WARN("getifaddrs failed: " + socket_error_str(errno));
        return result;
    }
    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
        if (!(ifa->ifa_flags & IFF_UP)) continue;
        if (ifa->ifa_flags & IFF_LOOPBACK) continue;

        char buf[INET_ADDRSTRLEN] = {0};
        auto* sin = reinterpret_cast<sockaddr_in*>(ifa->ifa_addr);
        if (!inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) continue;

        InterfaceInfo info;
        info.name    = ifa->ifa_name ? ifa->ifa_name : "";
        info.address = buf;
        info.broadcast = LIMITED_BROADCAST;
        if ((ifa->ifa_flags & IFF_BROADCAST) && ifa->ifa_broadaddr) {
            auto* bsin = reinterpret_cast<sockaddr_in*>(ifa->ifa_broadaddr);
            char bbuf[INET_ADDRSTRLEN] = {0};
            if (inet_ntop(AF_INET, &bsin->sin_addr, bbuf, sizeof(bbuf))) {
                info.broadcast = bbuf;
            }
        }
        result.push_back(std::move(info));
    }
    freeifaddrs(ifaddr);
#endif
    return result;
}

bool SystemInterfaceProvider::active(InterfaceInfo& out) {
    for (auto& info : list()) {
        if (!pinned_.empty() && info.name != pinned_) continue;
        out = info;
        return true;
    }
    return false;
}
