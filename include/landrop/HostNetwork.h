/**
 * @file HostNetwork.h
 * @brief Local interface enumeration used by discovery and the server
 */

#pragma once

#include <string>
#include <vector>

namespace LanDrop {

/**
 * @brief Read-only view of this host's network interfaces
 *
 * Abstract so that discovery and the server can be driven by a fixed set of
 * addresses in tests.
 */
class HostNetwork {
public:
    virtual ~HostNetwork() = default;

    /**
     * @brief Every interface address except ::1 and 127.0.0.1
     *
     * Link-local IPv6 addresses carry their "%iface" scope.
     */
    virtual std::vector<std::string> localAddresses() const = 0;

    /**
     * @brief Local address used for outbound traffic, IPv6 preferred; empty if offline
     */
    virtual std::string defaultAddress() const = 0;

    /**
     * @brief IPv6 addresses on the interface holding the default route (may be empty)
     */
    virtual std::vector<std::string> defaultInterfaceIpv6Addresses() const = 0;

    /**
     * @brief Index of the interface owning address, 0 if none matches
     */
    virtual unsigned int interfaceIndexFor(const std::string& address) const = 0;

    /**
     * @brief True if address (scope ignored) is one of localAddresses()
     */
    bool isLocalAddress(const std::string& address) const;
};

/**
 * @brief HostNetwork backed by getifaddrs() and the /proc/net routing tables
 */
class PosixHostNetwork : public HostNetwork {
public:
    std::vector<std::string> localAddresses() const override;
    std::string defaultAddress() const override;
    std::vector<std::string> defaultInterfaceIpv6Addresses() const override;
    unsigned int interfaceIndexFor(const std::string& address) const override;

private:
    /**
     * @brief Interface name of the default route, IPv6 table first, then IPv4
     */
    std::string defaultRouteInterface() const;
};

}  // namespace LanDrop
