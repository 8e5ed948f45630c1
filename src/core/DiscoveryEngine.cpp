/**
 * @file DiscoveryEngine.cpp
 * @brief Multicast announce loop and peer liveness sweep
 */

#include "landrop/DiscoveryEngine.h"
#include "landrop/AddressUtils.h"
#include "landrop/Debug.h"
#include "landrop/ErrorCodes.h"
#include "landrop/EventQueue.h"
#include "landrop/HostNetwork.h"
#include "landrop/PeerDirectory.h"
#include "landrop/ThreadSafeLog.h"
#include "landrop/TransactionRegistry.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace LanDrop {

namespace {
    std::string trimmed(const std::string& s) {
        const auto first = s.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) {
            return {};
        }
        const auto last = s.find_last_not_of(" \t\r\n");
        return s.substr(first, last - first + 1);
    }
} // anonymous namespace

//=============================================================================
// Constructor / Destructor
//=============================================================================

DiscoveryEngine::DiscoveryEngine(PeerDirectory& peers,
                                 TransactionRegistry& transactions,
                                 EventQueue& events,
                                 const HostNetwork& network)
    : m_peers(peers)
    , m_transactions(transactions)
    , m_events(events)
    , m_network(network)
{
}

DiscoveryEngine::~DiscoveryEngine() {
    stop();
}

//=============================================================================
// start() / stop()
//=============================================================================

bool DiscoveryEngine::start(std::string& errorMsg) {
    if (m_running.load()) {
        errorMsg = "Discovery already running";
        return false;
    }

    if (!initializeSocket(errorMsg)) {
        return false;
    }

    m_stopRequested.store(false);
    m_running.store(true);
    m_announceThread = std::thread(&DiscoveryEngine::announceThreadFunc, this);

    ThreadSafeLog::log("DiscoveryEngine started");
    return true;
}

void DiscoveryEngine::stop() {
    if (!m_running.load()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_stopCvMutex);
        m_stopRequested.store(true);
    }
    m_stopCv.notify_all();

    if (m_announceThread.joinable()) {
        m_announceThread.join();
    }

    if (m_socket >= 0) {
        ::close(m_socket);
        m_socket = -1;
    }

    m_running.store(false);
    ThreadSafeLog::log("DiscoveryEngine stopped");
}

//=============================================================================
// Socket
//=============================================================================

bool DiscoveryEngine::initializeSocket(std::string& errorMsg) {
    const int sock = ::socket(AF_INET6, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_UDP);
    if (sock < 0) {
        errorMsg = std::string("IPv6 UDP socket() failed: ") + std::strerror(errno);
        return false;
    }

    const int hops = MULTICAST_HOPS;
    (void)setsockopt(sock, IPPROTO_IPV6, IPV6_MULTICAST_HOPS, &hops, sizeof(hops));

    // Own probes are of no interest
    const unsigned int loop = 0;
    (void)setsockopt(sock, IPPROTO_IPV6, IPV6_MULTICAST_LOOP, &loop, sizeof(loop));

    const std::string defaultAddress = m_network.defaultAddress();
    const unsigned int ifIndex = defaultAddress.empty() ? 0 : m_network.interfaceIndexFor(defaultAddress);
    if (ifIndex != 0) {
        if (setsockopt(sock, IPPROTO_IPV6, IPV6_MULTICAST_IF, &ifIndex, sizeof(ifIndex)) != 0) {
            LOG_WARNING("[Discovery] IPV6_MULTICAST_IF(" << ifIndex << ") failed: " << std::strerror(errno)
                        << ", using the system default interface");
        }
    } else {
        LOG_WARNING("[Discovery] No interface for default address '" << defaultAddress
                    << "', using the system default interface");
    }

    m_socket = sock;
    m_lastSendFailed = false;
    LOG_INFO("[Discovery] Announcing to [" << MULTICAST_ADDRESS << "]:" << PORT
             << " via interface " << ifIndex << " (" << defaultAddress << ")");
    return true;
}

bool DiscoveryEngine::sendProbe() {
    sockaddr_in6 group{};
    group.sin6_family = AF_INET6;
    group.sin6_port = htons(PORT);
    if (inet_pton(AF_INET6, MULTICAST_ADDRESS, &group.sin6_addr) != 1) {
        return false;
    }

    const std::string probe = DISCOVERY_PROBE;
    const ssize_t sent = ::sendto(m_socket, probe.data(), probe.size(), 0,
                                  reinterpret_cast<const sockaddr*>(&group), sizeof(group));
    const bool ok = sent == static_cast<ssize_t>(probe.size());

    // Log transitions only; the loop runs four times a second
    if (!ok && !m_lastSendFailed) {
        LOG_WARNING("[Discovery] Multicast send failed: " << std::strerror(errno));
    } else if (ok && m_lastSendFailed) {
        LOG_INFO("[Discovery] Multicast send recovered");
    }
    m_lastSendFailed = !ok;
    return ok;
}

//=============================================================================
// Announce loop
//=============================================================================

void DiscoveryEngine::announceThreadFunc() {
    while (!m_stopRequested.load()) {
        sendProbe();
        sweep(std::chrono::steady_clock::now());
        notifyPeersChanged();

        std::unique_lock<std::mutex> waitLock(m_stopCvMutex);
        m_stopCv.wait_for(waitLock,
                          std::chrono::milliseconds(ANNOUNCE_INTERVAL_MS),
                          [this]() { return m_stopRequested.load(); });
    }
}

std::vector<std::string> DiscoveryEngine::sweep(std::chrono::steady_clock::time_point now) {
    const std::vector<std::string> removed = m_peers.removeExpired(now, PEER_TTL_MS);

    for (const std::string& address : removed) {
        const std::vector<std::string> canceled = m_transactions.cancelInboundFor(address);
        LOG_INFO("[Discovery] Peer " << address << " expired, canceled " << canceled.size()
                 << " inbound transaction(s)");

        for (const std::string& id : canceled) {
            TransactionFinishedEvent event;
            event.id = id;
            event.direction = TransactionDirection::Inbound;
            event.stage = TransactionStage::Canceled;
            event.detail = "peer " + address + " went away";
            m_events.push(std::move(event));
        }
    }
    return removed;
}

bool DiscoveryEngine::addManually(const std::string& displayName, const std::string& address,
                                  std::string& errorMsg) {
    const std::string normalized = AddressUtils::normalize(address);

    if (!AddressUtils::isValidAddress(normalized)) {
        errorMsg = std::string(ErrorCodes::ADDR_MALFORMED) + ": invalid address '" + address + "'";
        LOG_WARNING("[Discovery] " << errorMsg);
        return false;
    }

    if (m_peers.contains(normalized)) {
        errorMsg = std::string(ErrorCodes::ADDR_DUPLICATE) + ": " + normalized + " is already known";
        return false;
    }

    const std::string name = trimmed(displayName);
    m_peers.upsert(normalized, name.substr(0, MAX_DISPLAY_NAME), "", false);
    LOG_INFO("[Discovery] Added peer " << normalized << " manually");
    notifyPeersChanged();
    return true;
}

void DiscoveryEngine::notifyPeersChanged() {
    m_events.push(PeersChangedEvent{m_peers.summaries(m_transactions)});
}

}  // namespace LanDrop
