/**
 * @file HostIdentity.cpp
 */

#include "landrop/HostIdentity.h"

#include <pwd.h>
#include <unistd.h>

#include <cstdlib>
#include <vector>

namespace LanDrop {

std::string HostIdentity::hostDisplayName() {
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname) - 1) != 0 || hostname[0] == '\0') {
        return "localhost";
    }
    std::string name(hostname);
    return name.substr(0, name.find('.'));
}

std::string HostIdentity::accountFullName() {
    long bufSize = sysconf(_SC_GETPW_R_SIZE_MAX);
    if (bufSize <= 0) {
        bufSize = 16384;
    }
    std::vector<char> buffer(static_cast<size_t>(bufSize));
    passwd pwd{};
    passwd* result = nullptr;

    if (getpwuid_r(getuid(), &pwd, buffer.data(), buffer.size(), &result) == 0 && result) {
        std::string gecos = pwd.pw_gecos ? pwd.pw_gecos : "";
        const size_t first = gecos.find_first_not_of(',');
        const size_t last = gecos.find_last_not_of(',');
        if (first != std::string::npos) {
            return gecos.substr(first, last - first + 1);
        }
        if (pwd.pw_name && pwd.pw_name[0] != '\0') {
            return pwd.pw_name;
        }
    }

    const char* user = std::getenv("USER");
    return user ? user : "unknown";
}

}  // namespace LanDrop
