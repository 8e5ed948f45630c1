/**
 * @file Peer.h
 * @brief Known remote host
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace LanDrop {

    /**
     * @brief A remote host known to this node
     *
     * Keyed by address. Discovered peers are refreshed by every /connect and
     * expire after PEER_TTL_MS; manually added peers never expire.
     */
    struct Peer {
        std::string address;                                ///< Network address (primary key)
        std::string displayName;                            ///< Host name announced by the peer
        std::string userLabel;                              ///< Full name of the user on that host
        std::chrono::steady_clock::time_point lastSeen;     ///< Last /connect or manual add
        bool discovered = false;                            ///< Learned via multicast (false: added by hand)

        Peer() : lastSeen(std::chrono::steady_clock::now()) {}

        Peer(const std::string& address_, const std::string& name,
             const std::string& user, bool discovered_)
            : address(address_), displayName(name), userLabel(user),
              lastSeen(std::chrono::steady_clock::now()), discovered(discovered_) {}

        /**
         * @brief True if this is a discovered peer not seen for more than ttlMs at time now
         */
        bool isExpired(std::chrono::steady_clock::time_point now, uint32_t ttlMs) const {
            if (!discovered) {
                return false;
            }
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastSeen);
            return elapsed.count() > static_cast<int64_t>(ttlMs);
        }
    };

    /**
     * @brief Peer plus its live busy flag, as handed to observers
     */
    struct PeerSummary {
        Peer peer;
        bool busy = false;
    };

}  // namespace LanDrop
