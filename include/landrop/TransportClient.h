/**
 * @file TransportClient.h
 * @brief Outbound protocol calls (connect, request, confirm, cancel, start)
 */

#pragma once

#include "config.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <string>

namespace LanDrop {

class PeerDirectory;
class TransactionRegistry;
class LinkLocalCache;

/**
 * @brief Identity announced by connect() and requestTransaction()
 */
struct LocalIdentity {
    std::string address;
    std::string hostname;
    std::string username;
};

/**
 * @brief One fully built HTTPS POST, before it hits the wire
 */
struct OutboundRequest {
    std::string address;        ///< Resolved (scope-qualified if known) address
    uint16_t port = PORT;
    std::string endpoint;       ///< Endpoint name without leading slash
    std::string url;            ///< For logs
    std::string contentType;
    std::string body;
};

/**
 * @brief Raw reply of a request executor
 */
struct HttpReply {
    bool delivered = false;     ///< false: connect/TLS/I-O failure, see code/error
    int status = 0;
    std::string body;
    std::string code;           ///< ErrorCodes value when !delivered
    std::string error;
};

/**
 * @brief Outcome of TransportClient::call
 */
struct TransportResult {
    bool ok = false;
    std::string code;           ///< ErrorCodes value when !ok
    std::string error;
    nlohmann::json body;        ///< Parsed response when ok
};

/**
 * @brief Performs one request; the default one speaks HTTPS over TlsSocket
 */
using RequestExecutor = std::function<HttpReply(OutboundRequest)>;

/**
 * @brief File handed to call(); closed exactly once when this object dies
 */
class FileAttachment {
public:
    explicit FileAttachment(const std::filesystem::path& path);

    FileAttachment(const FileAttachment&) = delete;
    FileAttachment& operator=(const FileAttachment&) = delete;

    bool isOpen() const { return m_stream.is_open(); }
    const std::filesystem::path& path() const { return m_path; }
    std::string fileName() const { return m_path.filename().string(); }

    /**
     * @brief Read the whole file
     */
    bool readAll(std::string& out, std::string& errorMsg);

private:
    std::filesystem::path m_path;
    std::ifstream m_stream;
};

/**
 * @class TransportClient
 * @brief Issues protocol calls to peers and records their effect locally
 *
 * Every call is a single blocking POST with a CONNECTION_TIMEOUT_MS bound.
 * Failures are logged and returned, never thrown, and never retried.
 * Registry locks are only taken before and after the network round trip.
 */
class TransportClient {
public:
    using IdentityProvider = std::function<LocalIdentity()>;

    TransportClient(PeerDirectory& peers,
                    TransactionRegistry& transactions,
                    LinkLocalCache& linkLocalCache,
                    IdentityProvider identity,
                    uint16_t port = PORT);

    TransportClient(const TransportClient&) = delete;
    TransportClient& operator=(const TransportClient&) = delete;

    /**
     * @brief Replace the HTTPS executor (tests)
     */
    void setRequestExecutor(RequestExecutor executor);

    /**
     * @brief POST to https://<address>:<port>/<endpoint>
     *
     * Without a file the body is JSON. With a file the request is multipart:
     * a "file" part (omitted if the file could not be opened) and a "json"
     * part carrying body.
     */
    TransportResult call(const std::string& remoteAddress,
                         const std::string& endpoint,
                         const std::optional<nlohmann::json>& body,
                         FileAttachment* file = nullptr);

    /**
     * @brief Announce this host to a peer
     */
    bool connect(const std::string& remoteAddress);

    /**
     * @brief Ask a peer to accept filePath
     * @return Transaction id assigned by the peer, empty on failure
     */
    std::string requestTransaction(const std::string& remoteAddress,
                                   const std::filesystem::path& filePath);

    /**
     * @brief Accept an inbound transaction, optionally into another folder
     */
    bool confirmTransaction(const std::string& id,
                            const std::optional<std::filesystem::path>& newSaveFolder = std::nullopt);

    /**
     * @brief Decline an inbound transaction; always canceled locally
     */
    bool cancelTransaction(const std::string& id);

    /**
     * @brief Upload the file of a Confirmed outbound transaction
     *
     * Does nothing (no call, no stage change) unless the stage is exactly
     * Confirmed. Afterwards the stage is Completed whatever the outcome.
     *
     * @return true if the peer answered {status: ok}
     */
    bool startTransaction(const std::string& id);

private:
    HttpReply executeHttps(OutboundRequest request) const;

    PeerDirectory& m_peers;
    TransactionRegistry& m_transactions;
    LinkLocalCache& m_linkLocalCache;
    IdentityProvider m_identity;
    uint16_t m_port;
    RequestExecutor m_executor;
};

}  // namespace LanDrop
