/**
 * @file PeerDirectory.cpp
 * @brief Known-peers table
 */

#include "landrop/PeerDirectory.h"
#include "landrop/TransactionRegistry.h"

#include <algorithm>

namespace LanDrop {

Peer PeerDirectory::upsert(const std::string& address, const std::string& displayName,
                           const std::string& userLabel, bool discovered) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_peers.find(address);
    if (it == m_peers.end()) {
        Peer peer(address, displayName, userLabel, discovered);
        return m_peers.emplace(address, peer).first->second;
    }

    Peer& peer = it->second;
    if (!displayName.empty()) {
        peer.displayName = displayName;
    }
    if (!userLabel.empty()) {
        peer.userLabel = userLabel;
    }
    // Manual entries stay manual
    peer.discovered = peer.discovered && discovered;
    peer.lastSeen = std::chrono::steady_clock::now();
    return peer;
}

std::optional<Peer> PeerDirectory::get(const std::string& address) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_peers.find(address);
    if (it == m_peers.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool PeerDirectory::contains(const std::string& address) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_peers.find(address) != m_peers.end();
}

bool PeerDirectory::remove(const std::string& address) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_peers.erase(address) > 0;
}

std::vector<Peer> PeerDirectory::all() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Peer> peers;
    peers.reserve(m_peers.size());
    for (const auto& [address, peer] : m_peers) {
        peers.push_back(peer);
    }
    return peers;
}

bool PeerDirectory::isBusy(const std::string& address, const TransactionRegistry& registry) const {
    return registry.hasLiveTransactionWith(address);
}

std::vector<std::string> PeerDirectory::removeExpired(std::chrono::steady_clock::time_point now,
                                                      uint32_t ttlMs) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> removed;
    for (auto it = m_peers.begin(); it != m_peers.end();) {
        if (it->second.isExpired(now, ttlMs)) {
            removed.push_back(it->first);
            it = m_peers.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<PeerSummary> PeerDirectory::summaries(const TransactionRegistry& registry) const {
    // Copy first: the registry takes its own lock
    std::vector<Peer> peers = all();
    std::sort(peers.begin(), peers.end(),
              [](const Peer& a, const Peer& b) { return a.address < b.address; });

    std::vector<PeerSummary> result;
    result.reserve(peers.size());
    for (auto& peer : peers) {
        PeerSummary summary;
        summary.busy = registry.hasLiveTransactionWith(peer.address);
        summary.peer = std::move(peer);
        result.push_back(std::move(summary));
    }
    return result;
}

}  // namespace LanDrop
