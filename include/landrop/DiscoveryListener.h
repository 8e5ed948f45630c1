/**
 * @file DiscoveryListener.h
 * @brief Multicast receive path: answers probes with a /connect call
 */

#pragma once

#include "config.h"

#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace LanDrop {

class HostNetwork;
class LinkLocalCache;

/**
 * @class DiscoveryListener
 * @brief Joins the discovery group and reports every probe sender
 *
 * The payload is not interpreted. For each datagram the sender address is
 * taken as seen by recvfrom(); link-local senders arrive scope-qualified
 * ("fe80::1%eth0") and are remembered in the LinkLocalCache before the
 * callback runs. The callback runs on the listener thread.
 */
class DiscoveryListener {
public:
    using ProbeCallback = std::function<void(const std::string& senderAddress)>;

    DiscoveryListener(const HostNetwork& network, LinkLocalCache& linkLocalCache,
                      ProbeCallback onProbe);
    ~DiscoveryListener();

    DiscoveryListener(const DiscoveryListener&) = delete;
    DiscoveryListener& operator=(const DiscoveryListener&) = delete;

    /**
     * @brief Bind [::]:port, join MULTICAST_ADDRESS and start receiving
     */
    bool start(std::string& errorMsg, uint16_t port = PORT);
    void stop();
    bool isRunning() const { return m_running.load(); }

    /**
     * @brief Process one received datagram
     */
    void handleDatagram(const std::string& senderAddress, const std::string& payload);

private:
    bool initializeSocket(uint16_t port, std::string& errorMsg);
    void listenerThreadFunc();

    const HostNetwork& m_network;
    LinkLocalCache& m_linkLocalCache;
    ProbeCallback m_onProbe;

    int m_socket = -1;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopRequested{false};
    std::thread m_listenerThread;
};

}  // namespace LanDrop
