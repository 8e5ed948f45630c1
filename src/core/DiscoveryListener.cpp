/**
 * @file DiscoveryListener.cpp
 * @brief Multicast receive path
 */

#include "landrop/DiscoveryListener.h"
#include "landrop/AddressUtils.h"
#include "landrop/Debug.h"
#include "landrop/HostNetwork.h"
#include "landrop/LinkLocalCache.h"
#include "landrop/SocketUtils.h"
#include "landrop/ThreadSafeLog.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <vector>

namespace LanDrop {

DiscoveryListener::DiscoveryListener(const HostNetwork& network, LinkLocalCache& linkLocalCache,
                                     ProbeCallback onProbe)
    : m_network(network)
    , m_linkLocalCache(linkLocalCache)
    , m_onProbe(std::move(onProbe))
{
}

DiscoveryListener::~DiscoveryListener() {
    stop();
}

bool DiscoveryListener::start(std::string& errorMsg, uint16_t port) {
    if (m_running.load()) {
        errorMsg = "Discovery listener already running";
        return false;
    }

    if (!initializeSocket(port, errorMsg)) {
        return false;
    }

    m_stopRequested.store(false);
    m_running.store(true);
    m_listenerThread = std::thread(&DiscoveryListener::listenerThreadFunc, this);
    ThreadSafeLog::log("DiscoveryListener started");
    return true;
}

void DiscoveryListener::stop() {
    if (!m_running.load()) {
        return;
    }

    m_stopRequested.store(true);
    if (m_listenerThread.joinable()) {
        m_listenerThread.join();
    }

    if (m_socket >= 0) {
        ::close(m_socket);
        m_socket = -1;
    }

    m_running.store(false);
    ThreadSafeLog::log("DiscoveryListener stopped");
}

bool DiscoveryListener::initializeSocket(uint16_t port, std::string& errorMsg) {
    ScopedSocket sock(::socket(AF_INET6, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_UDP));
    if (!sock.valid()) {
        errorMsg = std::string("IPv6 UDP socket() failed: ") + std::strerror(errno);
        return false;
    }

    const int reuse = 1;
    (void)setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in6 local{};
    local.sin6_family = AF_INET6;
    local.sin6_port = htons(port);
    local.sin6_addr = in6addr_any;
    if (::bind(sock.get(), reinterpret_cast<const sockaddr*>(&local), sizeof(local)) != 0) {
        errorMsg = "bind([::]:" + std::to_string(port) + ") failed: " + std::strerror(errno);
        return false;
    }

    // Join on the default-route interface; fall back to the interface that
    // owns the default address when the default route is IPv4 only
    unsigned int ifIndex = 0;
    const std::vector<std::string> v6 = m_network.defaultInterfaceIpv6Addresses();
    if (!v6.empty()) {
        ifIndex = m_network.interfaceIndexFor(v6.front());
    }
    if (ifIndex == 0) {
        const std::string defaultAddress = m_network.defaultAddress();
        if (!defaultAddress.empty()) {
            ifIndex = m_network.interfaceIndexFor(defaultAddress);
        }
    }

    ipv6_mreq membership{};
    if (inet_pton(AF_INET6, MULTICAST_ADDRESS, &membership.ipv6mr_multiaddr) != 1) {
        errorMsg = std::string("Bad multicast address ") + MULTICAST_ADDRESS;
        return false;
    }
    membership.ipv6mr_interface = ifIndex;
    if (setsockopt(sock.get(), IPPROTO_IPV6, IPV6_JOIN_GROUP, &membership, sizeof(membership)) != 0) {
        errorMsg = std::string("IPV6_JOIN_GROUP failed: ") + std::strerror(errno);
        return false;
    }

    m_socket = sock.release();
    LOG_INFO("[Discovery] Listening for probes on [" << MULTICAST_ADDRESS << "]:" << port
             << " (interface " << ifIndex << ")");
    return true;
}

void DiscoveryListener::listenerThreadFunc() {
    std::vector<char> buffer(MAX_DATAGRAM_SIZE);

    while (!m_stopRequested.load()) {
        pollfd pfd{};
        pfd.fd = m_socket;
        pfd.events = POLLIN;
        const int ready = ::poll(&pfd, 1, static_cast<int>(LISTENER_POLL_MS));
        if (ready <= 0) {
            continue;
        }

        sockaddr_storage sender{};
        socklen_t senderLen = sizeof(sender);
        const ssize_t received = ::recvfrom(m_socket, buffer.data(), buffer.size(), 0,
                                            reinterpret_cast<sockaddr*>(&sender), &senderLen);
        if (received < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_WARNING("[Discovery] recvfrom() failed: " << std::strerror(errno));
            }
            continue;
        }

        const std::string senderAddress = numericAddress(sender, senderLen);
        if (senderAddress.empty()) {
            continue;
        }

        handleDatagram(senderAddress, std::string(buffer.data(), static_cast<size_t>(received)));
    }
}

void DiscoveryListener::handleDatagram(const std::string& senderAddress, const std::string& payload) {
    const std::string address = AddressUtils::normalizeMapped(senderAddress);

    if (m_network.isLocalAddress(address)) {
        return;
    }

    if (AddressUtils::isLinkLocalIpv6(address) && AddressUtils::hasScope(address)) {
        m_linkLocalCache.remember(address);
    }

    // Payload content is not interpreted
    (void)payload;

    if (m_onProbe) {
        m_onProbe(address);
    }
}

}  // namespace LanDrop
