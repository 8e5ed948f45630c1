/**
 * @file HostNetwork.cpp
 * @brief POSIX interface enumeration
 */

#include "landrop/HostNetwork.h"
#include "landrop/AddressUtils.h"
#include "landrop/Debug.h"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <memory>
#include <sstream>

namespace LanDrop {

namespace {

    // Probe targets for the default source address; connect() on a UDP
    // socket sends nothing.
    constexpr const char* PROBE_V6 = "2001:4860:4860::8888";
    constexpr const char* PROBE_V4 = "8.8.8.8";
    constexpr uint16_t PROBE_PORT = 53;

    std::string numericHost(const sockaddr* addr) {
        if (!addr) {
            return {};
        }
        const socklen_t len = addr->sa_family == AF_INET6 ? sizeof(sockaddr_in6) : sizeof(sockaddr_in);
        char host[NI_MAXHOST] = {};
        if (getnameinfo(addr, len, host, sizeof(host), nullptr, 0, NI_NUMERICHOST) != 0) {
            return {};
        }
        return host;
    }

    struct IfAddrsDeleter {
        void operator()(ifaddrs* list) const { freeifaddrs(list); }
    };

    template <typename Fn>
    void forEachInterfaceAddress(Fn&& fn) {
        ifaddrs* raw = nullptr;
        if (getifaddrs(&raw) != 0) {
            LOG_WARNING("[HostNetwork] getifaddrs failed: " << std::strerror(errno));
            return;
        }
        std::unique_ptr<ifaddrs, IfAddrsDeleter> list(raw);
        for (ifaddrs* it = list.get(); it; it = it->ifa_next) {
            if (!it->ifa_addr) {
                continue;
            }
            const int family = it->ifa_addr->sa_family;
            if (family != AF_INET && family != AF_INET6) {
                continue;
            }
            const std::string host = numericHost(it->ifa_addr);
            if (!host.empty()) {
                fn(std::string(it->ifa_name ? it->ifa_name : ""), host);
            }
        }
    }

    std::string sourceAddressTowards(int family, const char* target) {
        const int fd = socket(family, SOCK_DGRAM, 0);
        if (fd < 0) {
            return {};
        }

        sockaddr_storage remote{};
        socklen_t remoteLen = 0;
        if (family == AF_INET6) {
            auto* sin6 = reinterpret_cast<sockaddr_in6*>(&remote);
            sin6->sin6_family = AF_INET6;
            sin6->sin6_port = htons(PROBE_PORT);
            inet_pton(AF_INET6, target, &sin6->sin6_addr);
            remoteLen = sizeof(sockaddr_in6);
        } else {
            auto* sin = reinterpret_cast<sockaddr_in*>(&remote);
            sin->sin_family = AF_INET;
            sin->sin_port = htons(PROBE_PORT);
            inet_pton(AF_INET, target, &sin->sin_addr);
            remoteLen = sizeof(sockaddr_in);
        }

        std::string result;
        if (connect(fd, reinterpret_cast<sockaddr*>(&remote), remoteLen) == 0) {
            sockaddr_storage local{};
            socklen_t localLen = sizeof(local);
            if (getsockname(fd, reinterpret_cast<sockaddr*>(&local), &localLen) == 0) {
                result = numericHost(reinterpret_cast<sockaddr*>(&local));
            }
        }
        close(fd);
        return result;
    }

} // namespace

//=============================================================================
// HostNetwork
//=============================================================================

bool HostNetwork::isLocalAddress(const std::string& address) const {
    const std::string bare = AddressUtils::withoutScope(AddressUtils::normalizeMapped(address));
    const auto addresses = localAddresses();
    return std::any_of(addresses.begin(), addresses.end(), [&bare](const std::string& local) {
        return AddressUtils::withoutScope(local) == bare;
    });
}

//=============================================================================
// PosixHostNetwork
//=============================================================================

std::vector<std::string> PosixHostNetwork::localAddresses() const {
    std::vector<std::string> addresses;
    forEachInterfaceAddress([&addresses](const std::string&, const std::string& host) {
        if (host == "::1" || host == "127.0.0.1") {
            return;
        }
        if (std::find(addresses.begin(), addresses.end(), host) == addresses.end()) {
            addresses.push_back(host);
        }
    });
    return addresses;
}

std::string PosixHostNetwork::defaultAddress() const {
    std::string address = sourceAddressTowards(AF_INET6, PROBE_V6);
    if (address.empty()) {
        address = sourceAddressTowards(AF_INET, PROBE_V4);
    }
    return address;
}

std::vector<std::string> PosixHostNetwork::defaultInterfaceIpv6Addresses() const {
    std::vector<std::string> addresses;
    const std::string iface = defaultRouteInterface();
    if (iface.empty()) {
        return addresses;
    }

    forEachInterfaceAddress([&](const std::string& name, const std::string& host) {
        if (name == iface && AddressUtils::isIpv6(host)) {
            addresses.push_back(host);
        }
    });
    return addresses;
}

unsigned int PosixHostNetwork::interfaceIndexFor(const std::string& address) const {
    const std::string bare = AddressUtils::withoutScope(AddressUtils::stripBrackets(address));
    std::string match;
    forEachInterfaceAddress([&](const std::string& name, const std::string& host) {
        if (match.empty() && AddressUtils::withoutScope(host) == bare) {
            match = name;
        }
    });
    return match.empty() ? 0 : if_nametoindex(match.c_str());
}

std::string PosixHostNetwork::defaultRouteInterface() const {
    // /proc/net/ipv6_route: dest destlen src srclen nexthop metric refcnt use flags iface
    std::ifstream v6("/proc/net/ipv6_route");
    std::string line;
    while (std::getline(v6, line)) {
        std::istringstream fields(line);
        std::string dest, destLen, src, srcLen, nextHop, metric, refCnt, use, flags, iface;
        if (!(fields >> dest >> destLen >> src >> srcLen >> nextHop >> metric >> refCnt >> use >> flags >> iface)) {
            continue;
        }
        if (destLen == "00" && dest == std::string(32, '0') && iface != "lo") {
            return iface;
        }
    }

    // /proc/net/route: Iface Destination Gateway Flags ...
    std::ifstream v4("/proc/net/route");
    std::getline(v4, line);  // header
    while (std::getline(v4, line)) {
        std::istringstream fields(line);
        std::string iface, dest;
        if (fields >> iface >> dest && dest == "00000000") {
            return iface;
        }
    }
    return {};
}

}  // namespace LanDrop
