/**
 * @file LinkLocalCache.h
 * @brief Scope-qualified forms of IPv6 link-local peer addresses
 */

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace LanDrop {

/**
 * @brief Maps "fe80::1" to "fe80::1%eth0" as learned from inbound discovery traffic
 *
 * An unscoped link-local address is not routable on a host with more than
 * one interface; the cache remembers which interface the peer spoke on.
 */
class LinkLocalCache {
public:
    /**
     * @brief Remember a scoped link-local address; other addresses are ignored
     */
    void remember(const std::string& scopedAddress);

    std::optional<std::string> lookup(const std::string& address) const;

    /**
     * @brief Scoped form if address is an unscoped link-local one with a cache hit,
     *        address unchanged otherwise
     */
    std::string resolve(const std::string& address) const;

    size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::string> m_scoped;
};

}  // namespace LanDrop
