/**
 * @file Node.h
 * @brief Composition root: stores, transport, discovery and event dispatch
 */

#pragma once

#include "DiscoveryEngine.h"
#include "DiscoveryListener.h"
#include "EventQueue.h"
#include "HostNetwork.h"
#include "LinkLocalCache.h"
#include "PeerDirectory.h"
#include "Settings.h"
#include "TransactionRegistry.h"
#include "TransportClient.h"
#include "TransportServer.h"
#include "UploadWorkers.h"

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace LanDrop {

struct NodeOptions {
    std::filesystem::path configPath;   ///< Empty: AppPaths::configJsonPath()
    std::filesystem::path certDir;      ///< Empty: AppPaths::certsDir()
    uint16_t port = PORT;
    bool discovery = true;              ///< Announce and listen for probes
};

/**
 * @class Node
 * @brief One running LanDrop instance
 *
 * Server handlers and the discovery loop push events to an internal queue.
 * A dispatcher thread drains it: TransactionConfirmed starts the upload on
 * its own thread, and every event is forwarded to events() for the
 * front-end to consume at its own pace.
 */
class Node {
public:
    explicit Node(NodeOptions options = {}, std::unique_ptr<HostNetwork> network = nullptr);
    ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    /**
     * @brief Load settings, ensure the certificate, start servers and discovery
     *
     * Only a failure to start any server is fatal. Discovery problems are
     * logged; manually added peers still work.
     */
    bool start(std::string& errorMsg);

    void stop();

    bool isRunning() const { return m_running.load(); }

    /**
     * @brief Queue read by the front-end
     */
    EventQueue& events() { return m_frontEndEvents; }

    Settings& settings() { return m_settings; }

    //=========================================================================
    // Front-end entry points
    //=========================================================================

    bool connect(const std::string& address);
    std::string requestTransaction(const std::string& address, const std::filesystem::path& filePath);

    /**
     * @brief Accept an inbound transaction
     *
     * A new folder also becomes the default save folder, in memory and in
     * the settings file.
     */
    bool confirmTransaction(const std::string& id,
                            const std::optional<std::filesystem::path>& newSaveFolder = std::nullopt);

    bool cancelTransaction(const std::string& id);
    bool startTransaction(const std::string& id);

    bool addPeer(const std::string& displayName, const std::string& address, std::string& errorMsg);

    std::vector<PeerSummary> peers() const;
    std::vector<Transaction> transactions(TransactionDirection direction) const;

    LocalIdentity identity() const;

private:
    bool startServers(std::string& errorMsg);
    void dispatcherThreadFunc();
    void runUpload(const std::string& id);

    NodeOptions m_options;
    std::unique_ptr<HostNetwork> m_network;
    Settings m_settings;

    PeerDirectory m_peers;
    TransactionRegistry m_transactions;
    LinkLocalCache m_linkLocalCache;
    EventQueue m_internalEvents;
    EventQueue m_frontEndEvents;

    TransportClient m_client;
    std::vector<std::unique_ptr<TransportServer>> m_servers;
    DiscoveryEngine m_discovery;
    DiscoveryListener m_listener;

    std::atomic<bool> m_running{false};
    std::thread m_dispatcherThread;

    UploadWorkers m_uploads;
};

}  // namespace LanDrop
