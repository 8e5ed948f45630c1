/**
 * @file TransportServer.h
 * @brief HTTPS listener exposing the five protocol endpoints
 */

#pragma once

#include "config.h"
#include "TlsSocket.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

namespace LanDrop {

class EventQueue;
class HostNetwork;
class PeerDirectory;
class TransactionRegistry;

/**
 * @brief Reply produced by a request handler
 */
struct ServerResponse {
    int status = 200;
    std::string contentType = "application/json";
    std::string body;
};

//=============================================================================
// TransportServer Class
//=============================================================================

/**
 * @class TransportServer
 * @brief One TLS/HTTP listener bound to a single address family
 *
 * Each accepted connection is served on its own detached thread: TLS
 * handshake, one request, one response, close. The number of live
 * connection threads is capped at MAX_CONCURRENT_CLIENT_THREADS; above it
 * new connections are closed immediately.
 *
 * Every endpoint answers HTTP 200 with a JSON status. Protocol rejections
 * (unknown caller, unknown id, wrong stage) are reported in the body.
 *
 * Dual-stack hosts run either one IPv6 listener with v6only disabled, or
 * two instances (IPv4 and IPv6 with v6only set).
 *
 * Thread Safety:
 * - handleRequest() may run concurrently; all shared state lives in the
 *   mutex-guarded PeerDirectory and TransactionRegistry
 * - start() and stop() must be called from the same thread
 */
class TransportServer {
public:
    using SaveFolderProvider = std::function<std::filesystem::path()>;

    TransportServer(PeerDirectory& peers,
                    TransactionRegistry& transactions,
                    EventQueue& events,
                    const HostNetwork& network,
                    SaveFolderProvider saveFolder);

    /**
     * @brief Destructor
     *
     * Stops the listener and waits for connection threads to finish.
     */
    ~TransportServer();

    TransportServer(const TransportServer&) = delete;
    TransportServer& operator=(const TransportServer&) = delete;

    /**
     * @brief Bind, listen and start the accept thread
     * @param bindAddress Numeric address ("::", "0.0.0.0", ...)
     * @param port TCP port, 0 for an ephemeral one (see boundPort())
     * @param v6Only IPV6_V6ONLY for IPv6 listeners
     * @param certDir Directory holding server.crt / server.key
     * @param errorMsg Output error message on failure
     */
    bool start(const std::string& bindAddress, uint16_t port, bool v6Only,
               const std::filesystem::path& certDir, std::string& errorMsg);

    /**
     * @brief Stop accepting, abort live connections, wait for their threads
     */
    void stop();

    bool isRunning() const { return m_running.load(); }
    uint16_t boundPort() const { return m_boundPort; }
    const std::string& bindAddress() const { return m_bindAddress; }

    /**
     * @brief Dispatch one request; socket-free entry point of every handler
     * @param callerAddress Numeric peer address as accepted (may be ::ffff: mapped)
     * @param target Request target, e.g. "/connect"
     */
    ServerResponse handleRequest(const std::string& callerAddress,
                                 const std::string& method,
                                 const std::string& target,
                                 const std::string& contentType,
                                 const std::string& body);

private:
    //=========================================================================
    // Endpoint handlers (caller already normalized)
    //=========================================================================

    nlohmann::json handleConnect(const std::string& caller, const std::string& body);
    nlohmann::json handleRequestTransaction(const std::string& caller, const std::string& body);
    nlohmann::json handleConfirmTransaction(const std::string& caller, const std::string& body);
    nlohmann::json handleCancelTransaction(const std::string& caller, const std::string& body);
    nlohmann::json handleStartTransaction(const std::string& caller,
                                          const std::string& contentType,
                                          const std::string& body);

    /**
     * @brief Write an incoming file under folder with a collision-free name
     * @return Saved path, empty on failure (errorMsg set)
     */
    std::filesystem::path saveIncomingFile(const std::filesystem::path& folder,
                                           const std::string& fileName,
                                           const std::string& data,
                                           std::string& errorMsg);

    //=========================================================================
    // Socket side
    //=========================================================================

    bool initializeSocket(const std::string& bindAddress, uint16_t port, bool v6Only,
                          std::string& errorMsg);
    void listenerThreadFunc();
    void handleClient(int clientFd, const std::string& callerAddress);

    PeerDirectory& m_peers;
    TransactionRegistry& m_transactions;
    EventQueue& m_events;
    const HostNetwork& m_network;
    SaveFolderProvider m_saveFolder;

    // Built once in start(); shared by every connection
    TlsContextPtr m_tlsContext;
    std::string m_bindAddress;
    uint16_t m_boundPort = 0;
    int m_listenFd = -1;

    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopRequested{false};
    std::thread m_listenerThread;

    // Live connection threads
    std::mutex m_activeClientsMutex;
    std::unordered_set<int> m_activeClientFds;
    std::atomic<size_t> m_activeClientThreadCount{0};
    std::mutex m_activeClientsCvMutex;
    std::condition_variable m_activeClientsCv;

    // Serializes unique-name selection with file creation
    std::mutex m_saveMutex;
};

}  // namespace LanDrop
