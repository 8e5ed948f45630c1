/**
 * @file PeerDirectory.h
 * @brief Table of known peers
 */

#pragma once

#include "Peer.h"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace LanDrop {

class TransactionRegistry;

/**
 * @class PeerDirectory
 * @brief Mutex-guarded map of peers keyed by address
 *
 * Pure data: no I/O. All accessors return copies.
 */
class PeerDirectory {
public:
    PeerDirectory() = default;
    PeerDirectory(const PeerDirectory&) = delete;
    PeerDirectory& operator=(const PeerDirectory&) = delete;

    /**
     * @brief Create or refresh a peer and its lastSeen
     *
     * An existing manual entry (discovered == false) stays manual even when
     * discovered is true here; names are refreshed when non-empty.
     *
     * @return The stored peer after the update
     */
    Peer upsert(const std::string& address, const std::string& displayName,
                const std::string& userLabel, bool discovered);

    std::optional<Peer> get(const std::string& address) const;
    bool contains(const std::string& address) const;

    /**
     * @return true if a peer was removed
     */
    bool remove(const std::string& address);

    std::vector<Peer> all() const;

    /**
     * @brief Live busy flag; queries both transaction collections
     */
    bool isBusy(const std::string& address, const TransactionRegistry& registry) const;

    /**
     * @brief Remove discovered peers whose lastSeen is older than ttlMs at time now
     * @return Addresses removed
     */
    std::vector<std::string> removeExpired(std::chrono::steady_clock::time_point now,
                                           uint32_t ttlMs);

    /**
     * @brief Every peer with its busy flag, sorted by address
     */
    std::vector<PeerSummary> summaries(const TransactionRegistry& registry) const;

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Peer> m_peers;
};

}  // namespace LanDrop
