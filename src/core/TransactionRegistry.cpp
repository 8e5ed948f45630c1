/**
 * @file TransactionRegistry.cpp
 * @brief Inbound/outbound transaction store and stage machine
 */

#include "landrop/TransactionRegistry.h"
#include "landrop/UuidGenerator.h"

#include <algorithm>

namespace LanDrop {

//=============================================================================
// Creation
//=============================================================================

std::optional<Transaction> TransactionRegistry::createOutbound(const std::string& id,
                                                               const std::string& address,
                                                               const std::filesystem::path& filePath) {
    if (id.empty()) {
        return std::nullopt;
    }

    Transaction tx;
    tx.id = id;
    tx.address = address;
    tx.direction = TransactionDirection::Outbound;
    tx.stage = TransactionStage::Requested;
    tx.filePath = filePath;
    tx.fileName = filePath.filename().string();

    std::lock_guard<std::mutex> lock(m_mutex);
    auto [it, inserted] = m_outbound.emplace(id, tx);
    if (!inserted) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Transaction> TransactionRegistry::createInbound(const std::string& address,
                                                              const std::string& fileName,
                                                              const std::filesystem::path& saveFolder) {
    Transaction tx;
    tx.address = address;
    tx.direction = TransactionDirection::Inbound;
    tx.stage = TransactionStage::Requested;
    tx.fileName = fileName;
    tx.saveFolder = saveFolder;

    std::lock_guard<std::mutex> lock(m_mutex);
    // A v4 collision is practically impossible; retry a few times anyway
    // instead of silently replacing a live transaction.
    for (int attempt = 0; attempt < 4; ++attempt) {
        tx.id = UuidGenerator::generate();
        if (tx.id.empty()) {
            return std::nullopt;
        }
        auto [it, inserted] = m_inbound.emplace(tx.id, tx);
        if (inserted) {
            return it->second;
        }
    }
    return std::nullopt;
}

//=============================================================================
// Queries
//=============================================================================

std::optional<Transaction> TransactionRegistry::get(TransactionDirection direction,
                                                    const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto& map = mapFor(direction);
    auto it = map.find(id);
    if (it == map.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool TransactionRegistry::hasLiveTransactionWith(const std::string& address) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto live = [&address](const TransactionMap::value_type& entry) {
        return entry.second.address == address && !isTerminal(entry.second.stage);
    };
    return std::any_of(m_inbound.begin(), m_inbound.end(), live)
        || std::any_of(m_outbound.begin(), m_outbound.end(), live);
}

std::vector<Transaction> TransactionRegistry::all(TransactionDirection direction) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Transaction> result;
    const auto& map = mapFor(direction);
    result.reserve(map.size());
    for (const auto& [id, tx] : map) {
        result.push_back(tx);
    }
    return result;
}

//=============================================================================
// Mutation
//=============================================================================

StageChange TransactionRegistry::setStage(TransactionDirection direction, const std::string& id,
                                          TransactionStage stage) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto& map = mapFor(direction);
    auto it = map.find(id);
    if (it == map.end()) {
        return StageChange::Unknown;
    }
    if (!isValidTransition(it->second.stage, stage)) {
        return StageChange::Rejected;
    }
    it->second.stage = stage;
    return StageChange::Applied;
}

bool TransactionRegistry::setSaveFolder(const std::string& id, const std::filesystem::path& folder) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_inbound.find(id);
    if (it == m_inbound.end() || isTerminal(it->second.stage)) {
        return false;
    }
    it->second.saveFolder = folder;
    return true;
}

std::vector<std::string> TransactionRegistry::cancelInboundFor(const std::string& address) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> canceled;
    for (auto& [id, tx] : m_inbound) {
        if (tx.address == address && isValidTransition(tx.stage, TransactionStage::Canceled)) {
            tx.stage = TransactionStage::Canceled;
            canceled.push_back(id);
        }
    }
    return canceled;
}

//=============================================================================
// Private helpers
//=============================================================================

TransactionRegistry::TransactionMap& TransactionRegistry::mapFor(TransactionDirection direction) {
    return direction == TransactionDirection::Inbound ? m_inbound : m_outbound;
}

const TransactionRegistry::TransactionMap& TransactionRegistry::mapFor(TransactionDirection direction) const {
    return direction == TransactionDirection::Inbound ? m_inbound : m_outbound;
}

}  // namespace LanDrop
