/**
 * @file AddressUtils.h
 * @brief Parsing and normalization of textual IP addresses
 */

#pragma once

#include <cstdint>
#include <string>

namespace LanDrop {

class AddressUtils {
public:
    /**
     * @brief Strip the IPv4-mapped prefix: "::ffff:192.0.2.5" -> "192.0.2.5"
     *
     * Anything that is not a mapped IPv4 address is returned unchanged.
     */
    static std::string normalizeMapped(const std::string& address);

    /**
     * @brief Remove surrounding brackets ("[fe80::1]" -> "fe80::1")
     */
    static std::string stripBrackets(const std::string& address);

    /**
     * @brief Form used as the peer table key: trimmed, unbracketed, unmapped
     */
    static std::string normalize(const std::string& address);

    static bool isIpv6(const std::string& address);

    /**
     * @brief True for fe80::/10 addresses (scope suffix ignored)
     */
    static bool isLinkLocalIpv6(const std::string& address);

    /**
     * @brief True if the address carries a "%zone" suffix
     */
    static bool hasScope(const std::string& address);

    static std::string withoutScope(const std::string& address);

    /**
     * @brief Numeric IPv4 or IPv6 literal, optionally bracketed and scoped
     */
    static bool isValidAddress(const std::string& address);

    /**
     * @brief Host part of a URL: IPv6 is bracketed, '%' becomes "%25"
     */
    static std::string urlHost(const std::string& address);

    /**
     * @brief "https://<host>:<port>/<endpoint>"
     */
    static std::string endpointUrl(const std::string& address, uint16_t port,
                                   const std::string& endpoint);

private:
    AddressUtils() = delete;
};

}  // namespace LanDrop
