/**
 * @file Events.h
 * @brief Typed notifications from the node to the presentation layer
 */

#pragma once

#include "Peer.h"
#include "Transaction.h"

#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace LanDrop {

/**
 * @brief The peer set may have changed; carries a full snapshot
 */
struct PeersChangedEvent {
    std::vector<PeerSummary> peers;
};

/**
 * @brief A peer asks to send us a file
 */
struct TransactionRequestedEvent {
    std::string id;
    std::string address;
    std::string hostname;
    std::string username;
    std::string fileName;
    std::filesystem::path saveFolder;
};

/**
 * @brief The receiver accepted one of our outbound transactions; the upload should start
 */
struct TransactionConfirmedEvent {
    std::string id;
};

/**
 * @brief A transaction reached a terminal stage
 */
struct TransactionFinishedEvent {
    std::string id;
    TransactionDirection direction = TransactionDirection::Inbound;
    TransactionStage stage = TransactionStage::Completed;
    bool success = false;
    std::string detail;     ///< Saved path, or reason of failure
};

using Event = std::variant<PeersChangedEvent,
                           TransactionRequestedEvent,
                           TransactionConfirmedEvent,
                           TransactionFinishedEvent>;

}  // namespace LanDrop
