/**
 * @file Transaction.h
 * @brief One file-transfer negotiation and its lifecycle stage
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace LanDrop {

/**
 * @brief Position of a transaction in its lifecycle
 *
 * Requested -> Confirmed -> Completed is the normal path. Canceled and
 * Completed are terminal.
 */
enum class TransactionStage : uint8_t {
    Requested,
    Confirmed,
    Canceled,
    Completed
};

/**
 * @brief Which side of the transfer this host is on
 */
enum class TransactionDirection : uint8_t {
    Inbound,    ///< This host receives the file
    Outbound    ///< This host sends the file
};

inline const char* stageToString(TransactionStage stage) {
    switch (stage) {
        case TransactionStage::Requested: return "requested";
        case TransactionStage::Confirmed: return "confirmed";
        case TransactionStage::Canceled: return "canceled";
        case TransactionStage::Completed: return "completed";
        default: return "unknown";
    }
}

inline const char* directionToString(TransactionDirection direction) {
    return direction == TransactionDirection::Inbound ? "inbound" : "outbound";
}

inline bool isTerminal(TransactionStage stage) {
    return stage == TransactionStage::Canceled || stage == TransactionStage::Completed;
}

/**
 * @brief Transition table enforced by TransactionRegistry::setStage
 *
 * Requested may also jump straight to Completed: the receiving server
 * completes its inbound transaction whenever the sender starts the upload.
 */
inline bool isValidTransition(TransactionStage from, TransactionStage to) {
    switch (from) {
        case TransactionStage::Requested:
            return to == TransactionStage::Confirmed
                || to == TransactionStage::Canceled
                || to == TransactionStage::Completed;
        case TransactionStage::Confirmed:
            return to == TransactionStage::Canceled
                || to == TransactionStage::Completed;
        default:
            return false;
    }
}

/**
 * @brief Transaction record (one side only; the peer keeps its own copy)
 */
struct Transaction {
    std::string id;                         ///< Generated by the receiving side
    std::string address;                    ///< Counterpart peer address
    TransactionDirection direction = TransactionDirection::Inbound;
    TransactionStage stage = TransactionStage::Requested;
    std::filesystem::path filePath;         ///< Outbound only: file to send
    std::string fileName;                   ///< Announced file name
    std::filesystem::path saveFolder;       ///< Inbound only: destination directory
};

}  // namespace LanDrop
