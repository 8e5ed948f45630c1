/**
 * @file TransportServer.cpp
 * @brief HTTPS listener exposing the five protocol endpoints
 */

#include "landrop/TransportServer.h"
#include "landrop/AddressUtils.h"
#include "landrop/Debug.h"
#include "landrop/ErrorCodes.h"
#include "landrop/EventQueue.h"
#include "landrop/HostNetwork.h"
#include "landrop/JsonFields.h"
#include "landrop/Multipart.h"
#include "landrop/PathUtils.h"
#include "landrop/PeerDirectory.h"
#include "landrop/SocketUtils.h"
#include "landrop/ThreadSafeLog.h"
#include "landrop/TlsSocket.h"
#include "landrop/TransactionRegistry.h"
#include "landrop/UuidGenerator.h"

#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <limits>
#include <memory>
#include <vector>

using json = nlohmann::json;

namespace LanDrop {

namespace http = boost::beast::http;

namespace {
    json statusReply(const char* status) {
        return json{{"status", status}};
    }

    // Body of a JSON request; anything else is treated as an empty object
    json parseBody(const std::string& body) {
        json parsed = json::parse(body, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            return json::object();
        }
        return parsed;
    }
} // anonymous namespace

//=============================================================================
// Constructor / Destructor
//=============================================================================

TransportServer::TransportServer(PeerDirectory& peers,
                                 TransactionRegistry& transactions,
                                 EventQueue& events,
                                 const HostNetwork& network,
                                 SaveFolderProvider saveFolder)
    : m_peers(peers)
    , m_transactions(transactions)
    , m_events(events)
    , m_network(network)
    , m_saveFolder(std::move(saveFolder))
{
}

TransportServer::~TransportServer() {
    stop();
}

//=============================================================================
// TransportServer: start() / stop()
//=============================================================================

bool TransportServer::start(const std::string& bindAddress, uint16_t port, bool v6Only,
                            const std::filesystem::path& certDir, std::string& errorMsg) {
    if (m_running.load()) {
        errorMsg = "Server already running";
        return false;
    }

    ignoreSigpipe();

    // Certificate problems surface here, not as a failed handshake per connection
    TlsContextPtr context = TlsSocket::createContext(TlsRole::SERVER, certDir.string(), errorMsg);
    if (!context) {
        LOG_ERROR("[TransportServer] " << errorMsg);
        return false;
    }

    if (!initializeSocket(bindAddress, port, v6Only, errorMsg)) {
        return false;
    }

    m_tlsContext = std::move(context);
    m_stopRequested.store(false);
    m_running.store(true);
    m_listenerThread = std::thread(&TransportServer::listenerThreadFunc, this);

    ThreadSafeLog::log("TransportServer started on " + AddressUtils::urlHost(m_bindAddress) +
                       ":" + std::to_string(m_boundPort));
    return true;
}

void TransportServer::stop() {
    if (!m_running.load()) {
        return;
    }

    ThreadSafeLog::log("=== TransportServer::stop START (" + m_bindAddress + ") ===");

    m_stopRequested.store(true);

    if (m_listenerThread.joinable()) {
        m_listenerThread.join();
    }

    if (m_listenFd >= 0) {
        ::close(m_listenFd);
        m_listenFd = -1;
    }

    // Abort connections still in flight; their threads then unwind on I/O errors
    {
        std::lock_guard<std::mutex> lock(m_activeClientsMutex);
        for (int fd : m_activeClientFds) {
            (void)::shutdown(fd, SHUT_RDWR);
        }
    }

    {
        std::unique_lock<std::mutex> lock(m_activeClientsCvMutex);
        m_activeClientsCv.wait(lock, [this]() {
            return m_activeClientThreadCount.load(std::memory_order_acquire) == 0;
        });
    }

    m_boundPort = 0;
    m_running.store(false);
    ThreadSafeLog::log("=== TransportServer::stop END ===");
}

//=============================================================================
// TransportServer: initializeSocket()
//=============================================================================

bool TransportServer::initializeSocket(const std::string& bindAddress, uint16_t port, bool v6Only,
                                       std::string& errorMsg) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICHOST | AI_NUMERICSERV | AI_PASSIVE;

    addrinfo* result = nullptr;
    const std::string portStr = std::to_string(port);
    const int gai = getaddrinfo(bindAddress.c_str(), portStr.c_str(), &hints, &result);
    if (gai != 0 || !result) {
        errorMsg = "Invalid bind address '" + bindAddress + "': " + gai_strerror(gai);
        return false;
    }
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> info(result, &freeaddrinfo);

    ScopedSocket sock(::socket(info->ai_family, info->ai_socktype | SOCK_CLOEXEC, info->ai_protocol));
    if (!sock.valid()) {
        errorMsg = std::string("socket() failed: ") + std::strerror(errno);
        return false;
    }

    const int reuse = 1;
    (void)setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    if (info->ai_family == AF_INET6) {
        const int only = v6Only ? 1 : 0;
        if (setsockopt(sock.get(), IPPROTO_IPV6, IPV6_V6ONLY, &only, sizeof(only)) != 0) {
            errorMsg = std::string("IPV6_V6ONLY failed: ") + std::strerror(errno);
            return false;
        }
    }

    if (::bind(sock.get(), info->ai_addr, info->ai_addrlen) != 0) {
        errorMsg = "bind(" + bindAddress + ":" + portStr + ") failed: " + std::strerror(errno);
        return false;
    }

    if (::listen(sock.get(), LISTEN_BACKLOG) != 0) {
        errorMsg = std::string("listen() failed: ") + std::strerror(errno);
        return false;
    }

    sockaddr_storage bound{};
    socklen_t boundLen = sizeof(bound);
    if (getsockname(sock.get(), reinterpret_cast<sockaddr*>(&bound), &boundLen) != 0) {
        errorMsg = std::string("getsockname() failed: ") + std::strerror(errno);
        return false;
    }
    m_boundPort = (bound.ss_family == AF_INET6)
        ? ntohs(reinterpret_cast<const sockaddr_in6*>(&bound)->sin6_port)
        : ntohs(reinterpret_cast<const sockaddr_in*>(&bound)->sin_port);

    m_bindAddress = bindAddress;
    m_listenFd = sock.release();

    LOG_INFO("[TransportServer] Listening on " << AddressUtils::urlHost(bindAddress) << ":" << m_boundPort
             << (info->ai_family == AF_INET6 ? (v6Only ? " (IPv6 only)" : " (dual-stack)") : ""));
    return true;
}

//=============================================================================
// TransportServer: listenerThreadFunc()
//=============================================================================

void TransportServer::listenerThreadFunc() {
    while (!m_stopRequested.load()) {
        pollfd pfd{};
        pfd.fd = m_listenFd;
        pfd.events = POLLIN;

        const int ready = ::poll(&pfd, 1, static_cast<int>(ACCEPT_POLL_MS));
        if (ready <= 0) {
            if (ready < 0 && errno != EINTR) {
                LOG_ERROR("[TransportServer] poll() failed: " << std::strerror(errno));
            }
            continue;
        }

        sockaddr_storage clientAddr{};
        socklen_t addrLen = sizeof(clientAddr);
        const int clientFd = ::accept4(m_listenFd, reinterpret_cast<sockaddr*>(&clientAddr),
                                       &addrLen, SOCK_CLOEXEC);
        if (clientFd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                LOG_WARNING("[TransportServer] accept() failed: " << std::strerror(errno));
            }
            continue;
        }

        const std::string callerAddress = numericAddress(clientAddr, addrLen);

        // Cap concurrent connection threads before spawning
        size_t prev = m_activeClientThreadCount.load(std::memory_order_relaxed);
        bool admitted = false;
        while (prev < MAX_CONCURRENT_CLIENT_THREADS) {
            if (m_activeClientThreadCount.compare_exchange_weak(prev, prev + 1,
                                                                 std::memory_order_acq_rel,
                                                                 std::memory_order_relaxed)) {
                admitted = true;
                break;
            }
        }
        if (!admitted) {
            LOG_WARNING("[TransportServer] Too many connections, dropping " << callerAddress);
            ::close(clientFd);
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(m_activeClientsMutex);
            m_activeClientFds.insert(clientFd);
        }

        std::thread clientThread([this, clientFd, callerAddress]() {
            try {
                this->handleClient(clientFd, callerAddress);
            } catch (const std::exception& e) {
                LOG_ERROR("[TransportServer] Connection from " << callerAddress << " failed: " << e.what());
                ThreadSafeLog::log(std::string("=== handleClient: EXCEPTION === ") + e.what());
            }

            {
                std::lock_guard<std::mutex> lock(m_activeClientsMutex);
                m_activeClientFds.erase(clientFd);
            }
            ::close(clientFd);

            // Notify under the lock: once the count hits zero stop() may return and
            // the server (and this condition variable) may be destroyed
            std::lock_guard<std::mutex> lock(m_activeClientsCvMutex);
            m_activeClientThreadCount.fetch_sub(1, std::memory_order_acq_rel);
            m_activeClientsCv.notify_all();
        });
        clientThread.detach();
    }
}

//=============================================================================
// TransportServer: handleClient()
//=============================================================================

void TransportServer::handleClient(int clientFd, const std::string& callerAddress) {
    std::string errorMsg;
    if (!setSocketTimeouts(clientFd, SERVER_IO_TIMEOUT_MS, errorMsg)) {
        LOG_WARNING("[TransportServer] " << errorMsg);
        return;
    }

    TlsSocket tls(clientFd, TlsRole::SERVER, m_tlsContext);
    if (!tls.handshake(errorMsg)) {
        LOG_DEBUG("[TransportServer] TLS handshake with " << callerAddress << " failed: " << errorMsg);
        return;
    }

    boost::beast::flat_buffer buffer;
    http::request_parser<http::string_body> parser;
    parser.body_limit((std::numeric_limits<std::uint64_t>::max)());

    boost::system::error_code ec;
    http::read(tls, buffer, parser, ec);
    if (ec) {
        LOG_WARNING("[TransportServer] Reading request from " << callerAddress << " failed: "
                    << (tls.lastError().empty() ? ec.message() : tls.lastError()));
        return;
    }

    http::request<http::string_body> req = parser.release();

    const ServerResponse reply = handleRequest(callerAddress,
                                               std::string(req.method_string()),
                                               std::string(req.target()),
                                               std::string(req[http::field::content_type]),
                                               req.body());

    http::response<http::string_body> res{static_cast<http::status>(reply.status), req.version()};
    res.set(http::field::server, HTTP_AGENT);
    res.set(http::field::content_type, reply.contentType);
    res.keep_alive(false);
    res.body() = reply.body;
    res.prepare_payload();

    http::write(tls, res, ec);
    if (ec) {
        LOG_WARNING("[TransportServer] Writing response to " << callerAddress << " failed: "
                    << (tls.lastError().empty() ? ec.message() : tls.lastError()));
        return;
    }

    tls.shutdown();
}

//=============================================================================
// TransportServer: handleRequest()
//=============================================================================

ServerResponse TransportServer::handleRequest(const std::string& callerAddress,
                                              const std::string& method,
                                              const std::string& target,
                                              const std::string& contentType,
                                              const std::string& body) {
    ServerResponse response;

    if (method != "POST") {
        response.status = 405;
        response.contentType = "text/plain";
        response.body = "method not allowed";
        return response;
    }

    std::string path = target.substr(0, target.find('?'));
    while (!path.empty() && path.front() == '/') {
        path.erase(0, 1);
    }

    const std::string caller = AddressUtils::normalizeMapped(callerAddress);

    json reply;
    try {
        if (path == ENDPOINT_CONNECT) {
            reply = handleConnect(caller, body);
        } else if (path == ENDPOINT_REQUEST_TRANSACTION) {
            reply = handleRequestTransaction(caller, body);
        } else if (path == ENDPOINT_CONFIRM_TRANSACTION) {
            reply = handleConfirmTransaction(caller, body);
        } else if (path == ENDPOINT_CANCEL_TRANSACTION) {
            reply = handleCancelTransaction(caller, body);
        } else if (path == ENDPOINT_START_TRANSACTION) {
            reply = handleStartTransaction(caller, contentType, body);
        } else {
            response.contentType = "text/plain";
            response.body = path + " unknown";
            return response;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[TransportServer] /" << path << " from " << caller << " failed: " << e.what());
        ThreadSafeLog::log("TransportServer handler /" + path + " exception: " + e.what());
        reply = statusReply(STATUS_ERROR);
    }

    response.body = dumpJson(reply);
    return response;
}

//=============================================================================
// Endpoint handlers
//=============================================================================

json TransportServer::handleConnect(const std::string& caller, const std::string& body) {
    if (m_network.isLocalAddress(caller)) {
        LOG_DEBUG("[TransportServer] Ignoring connect from own address " << caller);
        return statusReply(STATUS_OK);
    }

    const json data = parseBody(body);
    const bool known = m_peers.contains(caller);
    m_peers.upsert(caller, jsonString(data, "hostname"), jsonString(data, "username"), true);

    if (!known) {
        LOG_INFO("[TransportServer] New peer " << caller << " (" << jsonString(data, "hostname") << ")");
    }
    return statusReply(STATUS_OK);
}

json TransportServer::handleRequestTransaction(const std::string& caller, const std::string& body) {
    const auto peer = m_peers.get(caller);
    if (!peer) {
        LOG_WARNING("[TransportServer] request-transaction from unknown caller " << caller);
        return statusReply(STATUS_ERROR);
    }

    const json data = parseBody(body);
    const std::string fileName = jsonString(data, "file_name");
    const std::filesystem::path saveFolder = m_saveFolder ? m_saveFolder() : std::filesystem::path();

    const auto tx = m_transactions.createInbound(caller, fileName, saveFolder);
    if (!tx) {
        LOG_ERROR("[TransportServer] Could not allocate a transaction id for " << caller);
        return statusReply(STATUS_ERROR);
    }

    TransactionRequestedEvent event;
    event.id = tx->id;
    event.address = caller;
    event.hostname = jsonString(data, "hostname");
    event.username = jsonString(data, "username");
    event.fileName = fileName;
    event.saveFolder = saveFolder;
    m_events.push(std::move(event));

    LOG_INFO("[TransportServer] Inbound transaction " << tx->id << ": '" << fileName << "' from " << caller);
    return json{{"transaction_id", tx->id}};
}

json TransportServer::handleConfirmTransaction(const std::string& caller, const std::string& body) {
    const json data = parseBody(body);
    const std::string id = jsonString(data, "transaction_id");

    if (id.empty() || !m_peers.contains(caller)) {
        return statusReply(STATUS_ERROR);
    }

    const StageChange change = m_transactions.setStage(TransactionDirection::Outbound, id,
                                                       TransactionStage::Confirmed);
    switch (change) {
    case StageChange::Applied:
        m_events.push(TransactionConfirmedEvent{id});
        LOG_INFO("[TransportServer] Transaction " << id << " confirmed by " << caller);
        return json{{"transaction_id", id}};
    case StageChange::Unknown:
        return statusReply(STATUS_UNKNOWN);
    case StageChange::Rejected:
        break;
    }

    LOG_WARNING("[TransportServer] confirm of " << id << " from " << caller << " rejected: not at requested");
    return statusReply(STATUS_ERROR);
}

json TransportServer::handleCancelTransaction(const std::string& caller, const std::string& body) {
    const json data = parseBody(body);
    const std::string id = jsonString(data, "transaction_id");

    if (id.empty() || !m_peers.contains(caller)) {
        return statusReply(STATUS_ERROR);
    }

    const StageChange change = m_transactions.setStage(TransactionDirection::Outbound, id,
                                                       TransactionStage::Canceled);
    switch (change) {
    case StageChange::Applied: {
        TransactionFinishedEvent event;
        event.id = id;
        event.direction = TransactionDirection::Outbound;
        event.stage = TransactionStage::Canceled;
        event.detail = "declined by " + caller;
        m_events.push(std::move(event));
        LOG_INFO("[TransportServer] Transaction " << id << " canceled by " << caller);
        return statusReply(STATUS_OK);
    }
    case StageChange::Unknown:
        return statusReply(STATUS_UNKNOWN);
    case StageChange::Rejected:
        break;
    }
    return statusReply(STATUS_ERROR);
}

json TransportServer::handleStartTransaction(const std::string& caller,
                                             const std::string& contentType,
                                             const std::string& body) {
    std::vector<MultipartPart> parts;
    std::string errorMsg;
    const std::string boundary = Multipart::boundaryFromContentType(contentType);
    if (boundary.empty() || !Multipart::parse(body, boundary, parts, errorMsg)) {
        LOG_WARNING("[TransportServer] start-transaction from " << caller << ": malformed multipart ("
                    << (errorMsg.empty() ? contentType : errorMsg) << ")");
        return statusReply(STATUS_ERROR);
    }

    const MultipartPart* jsonPart = Multipart::find(parts, PART_JSON);
    const std::string id = jsonPart ? jsonString(parseBody(jsonPart->data), "transaction_id") : std::string();
    // Inbound ids are always ours
    if (!UuidGenerator::isWellFormed(id) || !m_peers.contains(caller)) {
        return statusReply(STATUS_ERROR);
    }

    const auto tx = m_transactions.get(TransactionDirection::Inbound, id);
    if (!tx) {
        return statusReply(STATUS_ERROR);
    }

    bool saved = false;
    std::string detail;
    const MultipartPart* filePart = Multipart::find(parts, PART_FILE);
    if (isTerminal(tx->stage)) {
        detail = std::string("transaction already ") + stageToString(tx->stage);
    } else if (!filePart) {
        detail = "no file attached";
    } else {
        const std::string name = filePart->fileName.empty() ? tx->fileName : filePart->fileName;
        const std::filesystem::path path = saveIncomingFile(tx->saveFolder, name, filePart->data, errorMsg);
        saved = !path.empty();
        detail = saved ? path.string() : errorMsg;
    }

    // Completed whatever the save outcome; terminal stages are kept
    m_transactions.setStage(TransactionDirection::Inbound, id, TransactionStage::Completed);
    const auto finished = m_transactions.get(TransactionDirection::Inbound, id);

    TransactionFinishedEvent event;
    event.id = id;
    event.direction = TransactionDirection::Inbound;
    event.stage = finished ? finished->stage : TransactionStage::Completed;
    event.success = saved;
    event.detail = detail;
    m_events.push(std::move(event));

    if (saved) {
        LOG_INFO("[TransportServer] Transaction " << id << " saved to " << detail);
    } else {
        LOG_WARNING("[TransportServer] Transaction " << id << " from " << caller << " not saved: " << detail);
    }
    return statusReply(saved ? STATUS_OK : STATUS_ERROR);
}

std::filesystem::path TransportServer::saveIncomingFile(const std::filesystem::path& folder,
                                                        const std::string& fileName,
                                                        const std::string& data,
                                                        std::string& errorMsg) {
    const std::string safeName = PathUtils::safeFileName(fileName);
    if (safeName.empty()) {
        errorMsg = std::string(ErrorCodes::IO_BAD_FILENAME) + ": unusable file name '" + fileName + "'";
        return {};
    }

    std::error_code ec;
    std::filesystem::create_directories(folder, ec);
    if (ec) {
        errorMsg = std::string(ErrorCodes::IO_OPEN_FAILED) + ": cannot create " + folder.string() +
                   ": " + ec.message();
        return {};
    }

    std::filesystem::path target;
    std::ofstream out;
    {
        std::lock_guard<std::mutex> lock(m_saveMutex);
        target = PathUtils::uniqueFilePath(folder, safeName);
        out.open(target, std::ios::out | std::ios::binary | std::ios::trunc);
    }
    if (!out.is_open()) {
        errorMsg = std::string(ErrorCodes::IO_OPEN_FAILED) + ": cannot open " + target.string();
        return {};
    }

    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.close();
    if (out.fail()) {
        errorMsg = std::string(ErrorCodes::IO_WRITE_FAILED) + ": write to " + target.string() + " failed";
        return {};
    }
    return target;
}

}  // namespace LanDrop
