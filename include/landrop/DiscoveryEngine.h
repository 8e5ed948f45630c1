/**
 * @file DiscoveryEngine.h
 * @brief Multicast announce loop and peer liveness sweep
 */

#pragma once

#include "config.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace LanDrop {

class EventQueue;
class HostNetwork;
class PeerDirectory;
class TransactionRegistry;

/**
 * @class DiscoveryEngine
 * @brief Announces this host to the multicast group and expires silent peers
 *
 * One thread runs the announce cycle every ANNOUNCE_INTERVAL_MS:
 * 1. Send DISCOVERY_PROBE to [MULTICAST_ADDRESS]:PORT from the interface
 *    of the default outbound address
 * 2. sweep(): drop discovered peers not refreshed within PEER_TTL_MS and
 *    cancel their inbound transactions
 * 3. Push one PeersChangedEvent
 *
 * Peers are refreshed by the /connect calls other hosts send after
 * hearing the probe (see DiscoveryListener).
 */
class DiscoveryEngine {
public:
    DiscoveryEngine(PeerDirectory& peers,
                    TransactionRegistry& transactions,
                    EventQueue& events,
                    const HostNetwork& network);

    ~DiscoveryEngine();

    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    /**
     * @brief Open the multicast send socket and start the announce thread
     */
    bool start(std::string& errorMsg);

    void stop();

    bool isRunning() const { return m_running.load(); }

    /**
     * @brief Expire stale discovered peers as of now
     * @return Addresses removed
     *
     * Manually added peers are never removed. Every inbound transaction of a
     * removed peer that is still live becomes Canceled.
     */
    std::vector<std::string> sweep(std::chrono::steady_clock::time_point now);

    /**
     * @brief Add a peer by hand (discovered = false)
     * @param errorMsg LD-ADDR code and reason on failure
     * @return false if address is malformed or already known
     */
    bool addManually(const std::string& displayName, const std::string& address,
                     std::string& errorMsg);

    /**
     * @brief Push a PeersChangedEvent with the current directory
     */
    void notifyPeersChanged();

private:
    bool initializeSocket(std::string& errorMsg);
    void announceThreadFunc();
    bool sendProbe();

    PeerDirectory& m_peers;
    TransactionRegistry& m_transactions;
    EventQueue& m_events;
    const HostNetwork& m_network;

    int m_socket = -1;
    bool m_lastSendFailed = false;

    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopRequested{false};
    std::thread m_announceThread;
    std::mutex m_stopCvMutex;
    std::condition_variable m_stopCv;
};

}  // namespace LanDrop
