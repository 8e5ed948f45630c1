/**
 * @file Node.cpp
 * @brief Composition root
 */

#include "landrop/Node.h"
#include "landrop/AppPaths.h"
#include "landrop/CertificateManager.h"
#include "landrop/Debug.h"
#include "landrop/PathUtils.h"
#include "landrop/ThreadSafeLog.h"

#include <chrono>
#include <variant>

namespace LanDrop {

//=============================================================================
// Constructor / Destructor
//=============================================================================

Node::Node(NodeOptions options, std::unique_ptr<HostNetwork> network)
    : m_options(std::move(options))
    , m_network(network ? std::move(network) : std::make_unique<PosixHostNetwork>())
    , m_settings(m_options.configPath)
    , m_client(m_peers, m_transactions, m_linkLocalCache,
               [this]() { return identity(); }, m_options.port)
    , m_discovery(m_peers, m_transactions, m_internalEvents, *m_network)
    , m_listener(*m_network, m_linkLocalCache,
                 [this](const std::string& sender) { m_client.connect(sender); })
{
}

Node::~Node() {
    stop();
}

//=============================================================================
// start() / stop()
//=============================================================================

bool Node::start(std::string& errorMsg) {
    if (m_running.load()) {
        errorMsg = "Node already running";
        return false;
    }

    std::string settingsError;
    if (!m_settings.load(settingsError)) {
        LOG_WARNING("[Node] " << settingsError << ", using defaults");
        if (!m_settings.save(settingsError)) {
            LOG_WARNING("[Node] Could not write settings: " << settingsError);
        }
    }

    if (m_settings.traceLogEnabled() && !ThreadSafeLog::isEnabled()) {
        if (!ThreadSafeLog::initialize(AppPaths::traceLogPath())) {
            LOG_WARNING("[Node] Cannot open trace log " << AppPaths::traceLogPath().string());
        }
    }

    const std::filesystem::path certDir = m_options.certDir.empty() ? AppPaths::certsDir() : m_options.certDir;
    if (!CertificateManager::ensureCertificateExists(certDir.string(), m_settings.displayName(), errorMsg)) {
        LOG_ERROR("[Node] Certificate setup failed: " << errorMsg);
        return false;
    }
    m_options.certDir = certDir;

    if (!startServers(errorMsg)) {
        return false;
    }

    m_running.store(true);
    m_dispatcherThread = std::thread(&Node::dispatcherThreadFunc, this);

    if (m_options.discovery) {
        std::string discoveryError;
        if (!m_discovery.start(discoveryError)) {
            LOG_WARNING("[Node] Discovery announce unavailable: " << discoveryError);
        }
        if (!m_listener.start(discoveryError, m_options.port)) {
            LOG_WARNING("[Node] Discovery listener unavailable: " << discoveryError);
        }
    }

    const LocalIdentity self = identity();
    LOG_INFO("[Node] Running as '" << self.hostname << "' (" << self.username << ") at "
             << (self.address.empty() ? "<no default address>" : self.address));
    ThreadSafeLog::log("Node started");
    return true;
}

bool Node::startServers(std::string& errorMsg) {
    auto makeServer = [this]() {
        return std::make_unique<TransportServer>(m_peers, m_transactions, m_internalEvents, *m_network,
                                                 [this]() { return m_settings.saveFolder(); });
    };

    std::string v6Error;
    std::string v4Error;

    if (m_settings.separateIpv4Listener()) {
        auto v6 = makeServer();
        if (v6->start("::", m_options.port, true, m_options.certDir, v6Error)) {
            m_servers.push_back(std::move(v6));
        }
        auto v4 = makeServer();
        if (v4->start("0.0.0.0", m_options.port, false, m_options.certDir, v4Error)) {
            m_servers.push_back(std::move(v4));
        }
    } else {
        auto dual = makeServer();
        if (dual->start("::", m_options.port, false, m_options.certDir, v6Error)) {
            m_servers.push_back(std::move(dual));
        } else {
            LOG_WARNING("[Node] Dual-stack listener failed (" << v6Error << "), trying IPv4 only");
            auto v4 = makeServer();
            if (v4->start("0.0.0.0", m_options.port, false, m_options.certDir, v4Error)) {
                m_servers.push_back(std::move(v4));
            }
        }
    }

    if (m_servers.empty()) {
        errorMsg = "No listener could be started: " + v6Error + (v4Error.empty() ? "" : "; " + v4Error);
        LOG_ERROR("[Node] " << errorMsg);
        return false;
    }
    return true;
}

void Node::stop() {
    if (!m_running.load()) {
        return;
    }

    ThreadSafeLog::log("=== Node::stop START ===");

    m_listener.stop();
    m_discovery.stop();
    for (auto& server : m_servers) {
        server->stop();
    }
    m_servers.clear();

    m_internalEvents.close();
    if (m_dispatcherThread.joinable()) {
        m_dispatcherThread.join();
    }

    m_uploads.joinAll();

    m_frontEndEvents.close();
    m_running.store(false);
    ThreadSafeLog::log("=== Node::stop END ===");
}

//=============================================================================
// Dispatcher
//=============================================================================

void Node::dispatcherThreadFunc() {
    while (true) {
        std::optional<Event> event = m_internalEvents.pop(std::chrono::milliseconds(200));
        if (!event) {
            if (m_internalEvents.isClosed() && m_internalEvents.size() == 0) {
                break;
            }
            continue;
        }

        if (const auto* confirmed = std::get_if<TransactionConfirmedEvent>(&*event)) {
            const std::string id = confirmed->id;
            m_uploads.launch([this, id]() { runUpload(id); });
        }

        m_frontEndEvents.push(std::move(*event));
    }
}

void Node::runUpload(const std::string& id) {
    const bool delivered = m_client.startTransaction(id);
    const auto tx = m_transactions.get(TransactionDirection::Outbound, id);

    TransactionFinishedEvent event;
    event.id = id;
    event.direction = TransactionDirection::Outbound;
    event.stage = tx ? tx->stage : TransactionStage::Completed;
    event.success = delivered;
    event.detail = tx ? tx->filePath.string() : std::string();
    m_frontEndEvents.push(std::move(event));
}

//=============================================================================
// Entry points
//=============================================================================

bool Node::connect(const std::string& address) {
    return m_client.connect(address);
}

std::string Node::requestTransaction(const std::string& address, const std::filesystem::path& filePath) {
    const std::string id = m_client.requestTransaction(address, filePath);
    if (!id.empty()) {
        m_discovery.notifyPeersChanged();
    }
    return id;
}

bool Node::confirmTransaction(const std::string& id, const std::optional<std::filesystem::path>& newSaveFolder) {
    // A bad id must not change the default folder
    const auto tx = m_transactions.get(TransactionDirection::Inbound, id);
    if (!tx || tx->stage != TransactionStage::Requested) {
        LOG_WARNING("[Node] confirm: no inbound transaction " << id << " awaiting confirmation");
        return false;
    }

    if (newSaveFolder && !newSaveFolder->empty()) {
        const std::filesystem::path folder(PathUtils::stripFileUrl(newSaveFolder->string()));
        if (folder != m_settings.saveFolder()) {
            m_settings.setSaveFolder(folder);
            std::string errorMsg;
            if (!m_settings.save(errorMsg)) {
                LOG_WARNING("[Node] Could not persist save folder: " << errorMsg);
            }
        }
    }
    return m_client.confirmTransaction(id, newSaveFolder);
}

bool Node::cancelTransaction(const std::string& id) {
    const bool ok = m_client.cancelTransaction(id);
    m_discovery.notifyPeersChanged();
    return ok;
}

bool Node::startTransaction(const std::string& id) {
    return m_client.startTransaction(id);
}

bool Node::addPeer(const std::string& displayName, const std::string& address, std::string& errorMsg) {
    return m_discovery.addManually(displayName, address, errorMsg);
}

std::vector<PeerSummary> Node::peers() const {
    return m_peers.summaries(m_transactions);
}

std::vector<Transaction> Node::transactions(TransactionDirection direction) const {
    return m_transactions.all(direction);
}

LocalIdentity Node::identity() const {
    LocalIdentity self;
    self.address = m_network->defaultAddress();
    self.hostname = m_settings.displayName();
    self.username = m_settings.userLabel();
    return self;
}

}  // namespace LanDrop
