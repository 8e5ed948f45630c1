/**
 * @file AddressUtils.cpp
 * @brief Textual IP address helpers
 */

#include "landrop/AddressUtils.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <algorithm>
#include <cctype>

namespace LanDrop {

namespace {
    constexpr const char* MAPPED_PREFIX = "::ffff:";
}

std::string AddressUtils::normalizeMapped(const std::string& address) {
    const std::string prefix(MAPPED_PREFIX);
    if (address.size() <= prefix.size()) {
        return address;
    }

    std::string head = address.substr(0, prefix.size());
    std::transform(head.begin(), head.end(), head.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (head != prefix) {
        return address;
    }

    const std::string tail = address.substr(prefix.size());
    in_addr v4{};
    if (inet_pton(AF_INET, tail.c_str(), &v4) != 1) {
        return address;
    }
    return tail;
}

std::string AddressUtils::stripBrackets(const std::string& address) {
    if (address.size() >= 2 && address.front() == '[' && address.back() == ']') {
        return address.substr(1, address.size() - 2);
    }
    return address;
}

std::string AddressUtils::normalize(const std::string& address) {
    const auto first = address.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = address.find_last_not_of(" \t\r\n");
    return normalizeMapped(stripBrackets(address.substr(first, last - first + 1)));
}

bool AddressUtils::isIpv6(const std::string& address) {
    return address.find(':') != std::string::npos;
}

bool AddressUtils::hasScope(const std::string& address) {
    return address.find('%') != std::string::npos;
}

std::string AddressUtils::withoutScope(const std::string& address) {
    return address.substr(0, address.find('%'));
}

bool AddressUtils::isLinkLocalIpv6(const std::string& address) {
    const std::string bare = withoutScope(stripBrackets(address));
    in6_addr v6{};
    if (inet_pton(AF_INET6, bare.c_str(), &v6) != 1) {
        return false;
    }
    return v6.s6_addr[0] == 0xfe && (v6.s6_addr[1] & 0xc0) == 0x80;
}

bool AddressUtils::isValidAddress(const std::string& address) {
    const std::string bare = stripBrackets(address);
    if (bare.empty()) {
        return false;
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_flags = AI_NUMERICHOST;
    addrinfo* result = nullptr;
    if (getaddrinfo(bare.c_str(), nullptr, &hints, &result) != 0) {
        return false;
    }
    freeaddrinfo(result);
    return true;
}

std::string AddressUtils::urlHost(const std::string& address) {
    const std::string bare = stripBrackets(address);
    if (!isIpv6(bare)) {
        return bare;
    }

    std::string host = "[";
    for (char c : bare) {
        if (c == '%') {
            host += "%25";
        } else {
            host += c;
        }
    }
    host += "]";
    return host;
}

std::string AddressUtils::endpointUrl(const std::string& address, uint16_t port,
                                      const std::string& endpoint) {
    return "https://" + urlHost(address) + ":" + std::to_string(port) + "/" + endpoint;
}

}  // namespace LanDrop
