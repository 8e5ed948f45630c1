/**
 * @file LinkLocalCache.cpp
 */

#include "landrop/LinkLocalCache.h"
#include "landrop/AddressUtils.h"

namespace LanDrop {

void LinkLocalCache::remember(const std::string& scopedAddress) {
    if (!AddressUtils::hasScope(scopedAddress) || !AddressUtils::isLinkLocalIpv6(scopedAddress)) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_scoped[AddressUtils::withoutScope(scopedAddress)] = scopedAddress;
}

std::optional<std::string> LinkLocalCache::lookup(const std::string& address) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_scoped.find(address);
    if (it == m_scoped.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string LinkLocalCache::resolve(const std::string& address) const {
    const std::string bare = AddressUtils::stripBrackets(address);
    if (AddressUtils::hasScope(bare) || !AddressUtils::isLinkLocalIpv6(bare)) {
        return bare;
    }
    auto scoped = lookup(bare);
    return scoped ? *scoped : bare;
}

size_t LinkLocalCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_scoped.size();
}

}  // namespace LanDrop
