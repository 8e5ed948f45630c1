/**
 * @file landrop.cpp
 * @brief Console front-end for LanDrop
 *
 * Reads commands from stdin and prints node events as they arrive.
 */

#include "landrop/Node.h"
#include "landrop/ThreadSafeLog.h"
#include "landrop/config.h"

#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <type_traits>
#include <variant>

// Global flag for graceful shutdown
std::atomic<bool> g_running(true);

/**
 * @brief Signal handler for Ctrl+C
 */
void signalHandler(int signal) {
    if (signal == SIGINT) {
        g_running = false;
    }
}

namespace {

std::string restOfLine(std::istringstream& in) {
    std::string rest;
    std::getline(in >> std::ws, rest);
    return rest;
}

void printHelp() {
    std::cout << "Commands:\n";
    std::cout << "  peers                      List known peers\n";
    std::cout << "  add <name> <address>       Add a peer by hand\n";
    std::cout << "  send <address> <path>      Offer a file to a peer\n";
    std::cout << "  accept <id> [folder]       Accept an incoming file\n";
    std::cout << "  decline <id>               Decline an incoming file\n";
    std::cout << "  transactions               List transactions\n";
    std::cout << "  help                       Show this help\n";
    std::cout << "  quit                       Exit\n";
}

void printPeers(const std::vector<LanDrop::PeerSummary>& peers) {
    std::cout << "\n==============================================\n";
    std::cout << "         Peers (" << peers.size() << ")\n";
    std::cout << "==============================================\n";
    if (peers.empty()) {
        std::cout << "  No peers yet.\n";
        return;
    }

    const auto now = std::chrono::steady_clock::now();
    for (const auto& summary : peers) {
        const auto& peer = summary.peer;
        const auto ageMs = std::chrono::duration_cast<std::chrono::milliseconds>(now - peer.lastSeen).count();
        std::cout << "  " << std::left
                  << std::setw(40) << peer.address
                  << std::setw(20) << peer.displayName.substr(0, 19)
                  << std::setw(24) << peer.userLabel.substr(0, 23)
                  << (peer.discovered ? "" : "[manual] ")
                  << (summary.busy ? "[busy] " : "")
                  << (peer.discovered ? std::to_string(ageMs / 1000) + "s ago" : std::string())
                  << "\n";
    }
}

void printTransactions(const LanDrop::Node& node) {
    using LanDrop::TransactionDirection;
    for (TransactionDirection direction : {TransactionDirection::Inbound, TransactionDirection::Outbound}) {
        const auto list = node.transactions(direction);
        std::cout << (direction == TransactionDirection::Inbound ? "Incoming" : "Outgoing")
                  << " (" << list.size() << ")\n";
        for (const auto& tx : list) {
            std::cout << "  " << tx.id << "  " << std::left << std::setw(10) << LanDrop::stageToString(tx.stage)
                      << std::setw(40) << tx.address
                      << (direction == TransactionDirection::Inbound ? tx.fileName : tx.filePath.string())
                      << "\n";
        }
    }
}

// Peer list fingerprint; PeersChanged arrives four times a second
std::string peersKey(const std::vector<LanDrop::PeerSummary>& peers) {
    std::string key;
    for (const auto& summary : peers) {
        key += summary.peer.address + "|" + summary.peer.displayName + "|" + (summary.busy ? "b" : "") + ";";
    }
    return key;
}

void printEvent(const LanDrop::Event& event, std::string& lastPeersKey) {
    std::visit([&lastPeersKey](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, LanDrop::PeersChangedEvent>) {
            const std::string key = peersKey(e.peers);
            if (key != lastPeersKey) {
                lastPeersKey = key;
                printPeers(e.peers);
            }
        } else if constexpr (std::is_same_v<T, LanDrop::TransactionRequestedEvent>) {
            std::cout << "\n>>> " << (e.hostname.empty() ? e.address : e.hostname)
                      << (e.username.empty() ? "" : " (" + e.username + ")")
                      << " wants to send '" << e.fileName << "'\n"
                      << "    accept " << e.id << "   (saves to " << e.saveFolder.string() << ")\n"
                      << "    decline " << e.id << "\n";
        } else if constexpr (std::is_same_v<T, LanDrop::TransactionConfirmedEvent>) {
            std::cout << "\n>>> Transaction " << e.id << " accepted, sending...\n";
        } else if constexpr (std::is_same_v<T, LanDrop::TransactionFinishedEvent>) {
            std::cout << "\n>>> Transaction " << e.id << " (" << LanDrop::directionToString(e.direction)
                      << ") " << LanDrop::stageToString(e.stage)
                      << (e.success ? " OK" : " FAILED")
                      << (e.detail.empty() ? "" : ": " + e.detail) << "\n";
        }
    }, event);
}

bool handleCommand(LanDrop::Node& node, const std::string& line) {
    std::istringstream in(line);
    std::string command;
    in >> command;

    if (command.empty()) {
        return true;
    }

    if (command == "quit" || command == "exit") {
        return false;
    } else if (command == "help") {
        printHelp();
    } else if (command == "peers") {
        printPeers(node.peers());
    } else if (command == "add") {
        std::string name;
        std::string address;
        in >> name >> address;
        std::string errorMsg;
        if (address.empty()) {
            std::cout << "Usage: add <name> <address>\n";
        } else if (node.addPeer(name, address, errorMsg)) {
            std::cout << "Added " << address << "\n";
        } else {
            std::cout << "Not added: " << errorMsg << "\n";
        }
    } else if (command == "send") {
        std::string address;
        in >> address;
        const std::string path = restOfLine(in);
        if (address.empty() || path.empty()) {
            std::cout << "Usage: send <address> <path>\n";
        } else {
            const std::string id = node.requestTransaction(address, path);
            std::cout << (id.empty() ? "Request failed\n" : "Requested, transaction " + id + "\n");
        }
    } else if (command == "accept") {
        std::string id;
        in >> id;
        const std::string folder = restOfLine(in);
        if (id.empty()) {
            std::cout << "Usage: accept <id> [folder]\n";
        } else {
            const bool ok = folder.empty()
                ? node.confirmTransaction(id)
                : node.confirmTransaction(id, std::filesystem::path(folder));
            std::cout << (ok ? "Accepted, waiting for the file\n" : "Accept failed\n");
        }
    } else if (command == "decline") {
        std::string id;
        in >> id;
        if (id.empty()) {
            std::cout << "Usage: decline <id>\n";
        } else {
            std::cout << (node.cancelTransaction(id) ? "Declined\n" : "Declined locally, peer not informed\n");
        }
    } else if (command == "transactions") {
        printTransactions(node);
    } else {
        std::cout << "Unknown command '" << command << "', try 'help'\n";
    }
    return true;
}

}  // namespace

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    std::string customName;
    std::string saveDir;
    std::string tracePath;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--name" && i + 1 < argc) {
            customName = argv[++i];
        } else if (arg == "--save-dir" && i + 1 < argc) {
            saveDir = argv[++i];
        } else if (arg == "--trace" && i + 1 < argc) {
            tracePath = argv[++i];
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [options]\n";
            std::cout << "Options:\n";
            std::cout << "  --name <name>       Display name announced to peers\n";
            std::cout << "  --save-dir <dir>    Default folder for received files\n";
            std::cout << "  --trace <file>      Append a trace log to file\n";
            std::cout << "  --help              Show this help message\n";
            return 0;
        } else {
            std::cerr << "Unknown option '" << arg << "', see --help\n";
            return 2;
        }
    }

    std::signal(SIGINT, signalHandler);

    if (!tracePath.empty()) {
        if (!LanDrop::ThreadSafeLog::initialize(tracePath)) {
            std::cerr << "Cannot open trace file " << tracePath << "\n";
            return 1;
        }
    }

    LanDrop::Node node;

    std::string errorMsg;
    if (!node.start(errorMsg)) {
        std::cerr << "Failed to start: " << errorMsg << "\n";
        return 1;
    }

    if (!customName.empty()) {
        node.settings().setDisplayName(customName);
    }
    if (!saveDir.empty()) {
        node.settings().setSaveFolder(saveDir);
    }

    std::cout << "LanDrop listening on port " << LanDrop::PORT
              << ", saving to " << node.settings().saveFolder().string() << "\n";
    printHelp();

    std::string lastPeersKey;
    std::string pending;
    bool inputOpen = true;

    while (g_running) {
        while (auto event = node.events().tryPop()) {
            printEvent(*event, lastPeersKey);
        }

        if (!inputOpen) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            continue;
        }

        pollfd pfd{};
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN;
        if (::poll(&pfd, 1, 200) <= 0) {
            continue;
        }

        char buffer[512];
        const ssize_t n = ::read(STDIN_FILENO, buffer, sizeof(buffer));
        if (n <= 0) {
            // stdin closed: keep serving until SIGINT
            inputOpen = false;
            continue;
        }
        pending.append(buffer, static_cast<size_t>(n));

        size_t newline;
        while (g_running && (newline = pending.find('\n')) != std::string::npos) {
            const std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            if (!handleCommand(node, line)) {
                g_running = false;
            }
        }
    }

    std::cout << "\nStopping...\n";
    node.stop();
    LanDrop::ThreadSafeLog::shutdown();
    return 0;
}
