/**
 * @file TransportClient.cpp
 * @brief Outbound HTTPS protocol calls
 */

#include "landrop/TransportClient.h"
#include "landrop/AddressUtils.h"
#include "landrop/Debug.h"
#include "landrop/ErrorCodes.h"
#include "landrop/JsonFields.h"
#include "landrop/LinkLocalCache.h"
#include "landrop/Multipart.h"
#include "landrop/PathUtils.h"
#include "landrop/PeerDirectory.h"
#include "landrop/SocketUtils.h"
#include "landrop/TlsSocket.h"
#include "landrop/TransactionRegistry.h"

#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

#include <iterator>
#include <limits>

using json = nlohmann::json;

namespace LanDrop {

namespace http = boost::beast::http;

//=============================================================================
// FileAttachment
//=============================================================================

FileAttachment::FileAttachment(const std::filesystem::path& path)
    : m_path(path)
    , m_stream(path, std::ios::in | std::ios::binary)
{
}

bool FileAttachment::readAll(std::string& out, std::string& errorMsg) {
    if (!m_stream.is_open()) {
        errorMsg = "File is not open: " + m_path.string();
        return false;
    }

    std::error_code ec;
    const auto size = std::filesystem::file_size(m_path, ec);
    out.clear();
    if (!ec) {
        out.reserve(static_cast<size_t>(size));
    }
    out.assign(std::istreambuf_iterator<char>(m_stream), std::istreambuf_iterator<char>());

    if (m_stream.bad()) {
        errorMsg = "Read error on " + m_path.string();
        return false;
    }
    return true;
}

//=============================================================================
// Construction
//=============================================================================

TransportClient::TransportClient(PeerDirectory& peers,
                                 TransactionRegistry& transactions,
                                 LinkLocalCache& linkLocalCache,
                                 IdentityProvider identity,
                                 uint16_t port)
    : m_peers(peers)
    , m_transactions(transactions)
    , m_linkLocalCache(linkLocalCache)
    , m_identity(std::move(identity))
    , m_port(port)
{
    ignoreSigpipe();
}

void TransportClient::setRequestExecutor(RequestExecutor executor) {
    m_executor = std::move(executor);
}

//=============================================================================
// call()
//=============================================================================

TransportResult TransportClient::call(const std::string& remoteAddress,
                                      const std::string& endpoint,
                                      const std::optional<json>& body,
                                      FileAttachment* file) {
    TransportResult result;

    const std::string address = m_linkLocalCache.resolve(remoteAddress);
    const std::string url = AddressUtils::endpointUrl(address, m_port, endpoint);

    if (!AddressUtils::isValidAddress(address)) {
        result.code = ErrorCodes::NET_ADDRESS_INVALID;
        result.error = "Invalid remote address '" + remoteAddress + "'";
        LOG_WARNING("[TransportClient] " << url << ": " << result.error);
        return result;
    }

    OutboundRequest request;
    request.address = address;
    request.port = m_port;
    request.endpoint = endpoint;
    request.url = url;

    const std::string jsonText = body ? dumpJson(*body) : std::string("{}");
    if (file) {
        std::vector<MultipartPart> parts;
        if (file->isOpen()) {
            MultipartPart filePart;
            filePart.name = PART_FILE;
            filePart.fileName = file->fileName();
            filePart.contentType = "application/octet-stream";
            std::string readError;
            if (file->readAll(filePart.data, readError)) {
                parts.push_back(std::move(filePart));
            } else {
                LOG_WARNING("[TransportClient] " << readError << ", sending without file part");
            }
        } else {
            LOG_WARNING("[TransportClient] Cannot open " << file->path().string()
                        << ", sending without file part");
        }

        MultipartPart jsonPart;
        jsonPart.name = PART_JSON;
        jsonPart.fileName = "json";
        jsonPart.contentType = "application/json";
        jsonPart.data = jsonText;
        parts.push_back(std::move(jsonPart));

        const std::string boundary = Multipart::generateBoundary();
        request.contentType = Multipart::contentType(boundary);
        request.body = Multipart::encode(parts, boundary);
    } else {
        request.contentType = "application/json";
        request.body = jsonText;
    }

    const HttpReply reply = m_executor ? m_executor(std::move(request)) : executeHttps(std::move(request));

    if (!reply.delivered) {
        result.code = reply.code.empty() ? ErrorCodes::NET_CONNECT_FAILED : reply.code;
        result.error = reply.error;
        LOG_WARNING("[TransportClient] " << url << " failed [" << result.code << "]: " << result.error);
        return result;
    }

    if (reply.status != static_cast<int>(http::status::ok)) {
        result.code = ErrorCodes::NET_HTTP_STATUS;
        result.error = "HTTP status " + std::to_string(reply.status);
        LOG_WARNING("[TransportClient] " << url << " failed [" << result.code << "]: " << result.error);
        return result;
    }

    json parsed = json::parse(reply.body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        result.code = ErrorCodes::NET_BAD_RESPONSE;
        result.error = "Malformed JSON response";
        LOG_WARNING("[TransportClient] " << url << " failed [" << result.code << "]: "
                    << result.error << ": " << reply.body.substr(0, 200));
        return result;
    }

    result.ok = true;
    result.body = std::move(parsed);
    return result;
}

HttpReply TransportClient::executeHttps(OutboundRequest request) const {
    HttpReply reply;
    std::string errorMsg;

    ScopedSocket sock = connectWithTimeout(request.address, request.port, CONNECTION_TIMEOUT_MS, errorMsg);
    if (!sock.valid()) {
        reply.code = ErrorCodes::NET_CONNECT_FAILED;
        reply.error = errorMsg;
        return reply;
    }

    TlsContextPtr context = TlsSocket::createContext(TlsRole::CLIENT, {}, errorMsg);
    if (!context) {
        reply.code = ErrorCodes::NET_TLS_FAILED;
        reply.error = errorMsg;
        return reply;
    }

    TlsSocket tls(sock.get(), TlsRole::CLIENT, std::move(context));
    if (!tls.handshake(errorMsg)) {
        reply.code = ErrorCodes::NET_TLS_FAILED;
        reply.error = errorMsg;
        return reply;
    }

    http::request<http::string_body> req{http::verb::post, "/" + request.endpoint, 11};
    req.set(http::field::host, AddressUtils::urlHost(request.address) + ":" + std::to_string(request.port));
    req.set(http::field::user_agent, HTTP_AGENT);
    req.set(http::field::content_type, request.contentType);
    req.set(http::field::connection, "close");
    req.body() = std::move(request.body);
    req.prepare_payload();

    boost::system::error_code ec;
    http::write(tls, req, ec);
    if (ec) {
        reply.code = ErrorCodes::NET_WRITE_FAILED;
        reply.error = tls.lastError().empty() ? ec.message() : tls.lastError();
        return reply;
    }

    boost::beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
    http::read(tls, buffer, parser, ec);
    if (ec) {
        reply.code = ErrorCodes::NET_READ_FAILED;
        reply.error = tls.lastError().empty() ? ec.message() : tls.lastError();
        return reply;
    }

    tls.shutdown();

    auto response = parser.release();
    reply.delivered = true;
    reply.status = static_cast<int>(response.result_int());
    reply.body = std::move(response.body());
    return reply;
}

//=============================================================================
// Protocol operations
//=============================================================================

bool TransportClient::connect(const std::string& remoteAddress) {
    const LocalIdentity identity = m_identity ? m_identity() : LocalIdentity{};
    json body = {
        {"address", identity.address},
        {"hostname", identity.hostname},
        {"username", identity.username}
    };
    return call(remoteAddress, ENDPOINT_CONNECT, body).ok;
}

std::string TransportClient::requestTransaction(const std::string& remoteAddress,
                                                const std::filesystem::path& filePath) {
    const std::filesystem::path path(PathUtils::stripFileUrl(filePath.string()));
    // Same key the peer table uses, so the busy flag finds this transaction
    const std::string address = AddressUtils::normalize(remoteAddress);

    if (m_peers.isBusy(address, m_transactions)) {
        LOG_WARNING("[TransportClient] Peer " << address << " is busy, requesting anyway");
    }

    const LocalIdentity identity = m_identity ? m_identity() : LocalIdentity{};
    json body = {
        {"hostname", identity.hostname},
        {"username", identity.username},
        {"file_name", path.filename().string()}
    };

    const TransportResult result = call(address, ENDPOINT_REQUEST_TRANSACTION, body);
    if (!result.ok) {
        return {};
    }

    const std::string id = jsonString(result.body, "transaction_id");
    if (id.empty()) {
        LOG_WARNING("[TransportClient] " << address << " rejected transaction request (status="
                    << jsonString(result.body, "status") << ")");
        return {};
    }

    if (!m_transactions.createOutbound(id, address, path)) {
        LOG_ERROR("[TransportClient] Duplicate outbound transaction id " << id << " from " << address);
        return {};
    }

    LOG_INFO("[TransportClient] Outbound transaction " << id << " requested: "
             << path.filename().string() << " -> " << address);
    return id;
}

bool TransportClient::confirmTransaction(const std::string& id,
                                         const std::optional<std::filesystem::path>& newSaveFolder) {
    const auto tx = m_transactions.get(TransactionDirection::Inbound, id);
    if (!tx) {
        LOG_WARNING("[TransportClient] confirm: unknown inbound transaction " << id);
        return false;
    }

    if (newSaveFolder && !newSaveFolder->empty()) {
        m_transactions.setSaveFolder(id, std::filesystem::path(PathUtils::stripFileUrl(newSaveFolder->string())));
    }

    // Confirmed before the call: the sender may start the upload before
    // its confirm response reaches us.
    const StageChange change = m_transactions.setStage(TransactionDirection::Inbound, id,
                                                       TransactionStage::Confirmed);
    if (change != StageChange::Applied) {
        LOG_WARNING("[TransportClient] confirm: transaction " << id << " is "
                    << stageToString(tx->stage) << ", not confirmable (" << stageChangeToString(change) << ")");
        return false;
    }

    const TransportResult result = call(tx->address, ENDPOINT_CONFIRM_TRANSACTION, json{{"transaction_id", id}});
    if (!result.ok) {
        return false;
    }

    if (jsonString(result.body, "transaction_id") != id) {
        // The sender no longer has it at Requested; it will never start.
        LOG_WARNING("[TransportClient] confirm of " << id << " rejected by " << tx->address
                    << " (status=" << jsonString(result.body, "status") << ")");
        m_transactions.setStage(TransactionDirection::Inbound, id, TransactionStage::Canceled);
        return false;
    }
    return true;
}

bool TransportClient::cancelTransaction(const std::string& id) {
    const auto tx = m_transactions.get(TransactionDirection::Inbound, id);
    if (!tx) {
        LOG_WARNING("[TransportClient] cancel: unknown inbound transaction " << id);
        return false;
    }

    const TransportResult result = call(tx->address, ENDPOINT_CANCEL_TRANSACTION, json{{"transaction_id", id}});

    const StageChange change = m_transactions.setStage(TransactionDirection::Inbound, id,
                                                       TransactionStage::Canceled);
    if (change == StageChange::Rejected) {
        LOG_DEBUG("[TransportClient] cancel: " << id << " already terminal");
    }

    return result.ok && jsonString(result.body, "status") == STATUS_OK;
}

bool TransportClient::startTransaction(const std::string& id) {
    const auto tx = m_transactions.get(TransactionDirection::Outbound, id);
    if (!tx || tx->stage != TransactionStage::Confirmed) {
        LOG_DEBUG("[TransportClient] start: " << id << " not confirmed, skipping");
        return false;
    }

    TransportResult result;
    {
        FileAttachment file(tx->filePath);
        result = call(tx->address, ENDPOINT_START_TRANSACTION, json{{"transaction_id", id}}, &file);
    }

    m_transactions.setStage(TransactionDirection::Outbound, id, TransactionStage::Completed);

    const bool delivered = result.ok && jsonString(result.body, "status") == STATUS_OK;
    if (delivered) {
        LOG_INFO("[TransportClient] Transaction " << id << " delivered to " << tx->address);
    } else {
        LOG_WARNING("[TransportClient] Transaction " << id << " finished without confirmation of delivery");
    }
    return delivered;
}

}  // namespace LanDrop
