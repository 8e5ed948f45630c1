/**
 * @file TransactionRegistry.h
 * @brief In-flight transactions, split by direction
 */

#pragma once

#include "Transaction.h"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace LanDrop {

/**
 * @brief Outcome of TransactionRegistry::setStage
 */
enum class StageChange : uint8_t {
    Applied,    ///< Stage updated
    Unknown,    ///< No transaction with that id in that direction
    Rejected    ///< Transition not allowed from the current stage
};

inline const char* stageChangeToString(StageChange change) {
    switch (change) {
        case StageChange::Applied: return "applied";
        case StageChange::Unknown: return "unknown";
        case StageChange::Rejected: return "rejected";
        default: return "unknown";
    }
}

/**
 * @class TransactionRegistry
 * @brief Mutex-guarded store of inbound and outbound transactions
 *
 * The two collections are independent: an id is unique within its
 * direction only. Every stage change goes through setStage(), which
 * enforces isValidTransition().
 *
 * Thread Safety: every public method locks the registry mutex for its own
 * duration and returns copies, so callers never hold the lock across I/O.
 */
class TransactionRegistry {
public:
    TransactionRegistry() = default;
    TransactionRegistry(const TransactionRegistry&) = delete;
    TransactionRegistry& operator=(const TransactionRegistry&) = delete;

    /**
     * @brief Record an outbound transaction under the id returned by the receiver
     * @return The stored transaction, or nullopt if id is empty or already used
     */
    std::optional<Transaction> createOutbound(const std::string& id,
                                              const std::string& address,
                                              const std::filesystem::path& filePath);

    /**
     * @brief Create an inbound transaction with a freshly generated id
     * @param saveFolder Default save folder at creation time
     * @return The stored transaction, or nullopt if no id could be generated
     */
    std::optional<Transaction> createInbound(const std::string& address,
                                             const std::string& fileName,
                                             const std::filesystem::path& saveFolder);

    std::optional<Transaction> get(TransactionDirection direction, const std::string& id) const;

    /**
     * @brief Single mutation entry point for stages
     */
    StageChange setStage(TransactionDirection direction, const std::string& id,
                         TransactionStage stage);

    /**
     * @brief Change the save folder of a live inbound transaction
     * @return false if unknown or already terminal
     */
    bool setSaveFolder(const std::string& id, const std::filesystem::path& folder);

    /**
     * @brief True if any transaction in either direction with this address is Requested or Confirmed
     */
    bool hasLiveTransactionWith(const std::string& address) const;

    /**
     * @brief Cancel every live inbound transaction of address
     * @return Ids that moved to Canceled
     */
    std::vector<std::string> cancelInboundFor(const std::string& address);

    std::vector<Transaction> all(TransactionDirection direction) const;

private:
    using TransactionMap = std::unordered_map<std::string, Transaction>;

    TransactionMap& mapFor(TransactionDirection direction);
    const TransactionMap& mapFor(TransactionDirection direction) const;

    mutable std::mutex m_mutex;
    TransactionMap m_inbound;
    TransactionMap m_outbound;
};

}  // namespace LanDrop
