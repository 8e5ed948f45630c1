/**
 * @file HostIdentity.h
 * @brief Default names announced to peers
 */

#pragma once

#include <string>

namespace LanDrop {

class HostIdentity {
public:
    /**
     * @brief gethostname() up to the first '.', "localhost" if unavailable
     */
    static std::string hostDisplayName();

    /**
     * @brief Full name from the account's GECOS field, login name as fallback
     */
    static std::string accountFullName();

private:
    HostIdentity() = delete;
};

}  // namespace LanDrop
