/**
 * @file SocketUtils.h
 * @brief POSIX socket helpers shared by the transport and discovery
 */

#pragma once

#include <sys/socket.h>

#include <cstdint>
#include <string>

namespace LanDrop {

/**
 * @brief Owning wrapper for a socket file descriptor
 */
class ScopedSocket {
public:
    ScopedSocket() = default;
    explicit ScopedSocket(int fd) : m_fd(fd) {}
    ~ScopedSocket() { reset(); }

    ScopedSocket(const ScopedSocket&) = delete;
    ScopedSocket& operator=(const ScopedSocket&) = delete;

    ScopedSocket(ScopedSocket&& other) noexcept : m_fd(other.release()) {}
    ScopedSocket& operator=(ScopedSocket&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    int get() const { return m_fd; }
    bool valid() const { return m_fd >= 0; }

    int release() {
        const int fd = m_fd;
        m_fd = -1;
        return fd;
    }

    void reset(int fd = -1);

private:
    int m_fd = -1;
};

/**
 * @brief Apply SO_RCVTIMEO and SO_SNDTIMEO
 */
bool setSocketTimeouts(int fd, uint32_t timeoutMs, std::string& errorMsg);

/**
 * @brief Resolve a numeric (optionally scoped) address and connect within timeoutMs
 * @return Connected blocking socket, invalid on failure
 */
ScopedSocket connectWithTimeout(const std::string& address, uint16_t port,
                                uint32_t timeoutMs, std::string& errorMsg);

/**
 * @brief Numeric host of a socket address ("fe80::1%eth0", "::ffff:10.0.0.2", ...)
 */
std::string numericAddress(const sockaddr_storage& addr, socklen_t len);

/**
 * @brief Writes to a closed peer must fail with EPIPE, not kill the process
 */
void ignoreSigpipe();

}  // namespace LanDrop
