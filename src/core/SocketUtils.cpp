/**
 * @file SocketUtils.cpp
 * @brief POSIX socket helpers
 */

#include "landrop/SocketUtils.h"
#include "landrop/AddressUtils.h"

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>

namespace LanDrop {

void ScopedSocket::reset(int fd) {
    if (m_fd >= 0) {
        ::close(m_fd);
    }
    m_fd = fd;
}

bool setSocketTimeouts(int fd, uint32_t timeoutMs, std::string& errorMsg) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeoutMs / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeoutMs % 1000) * 1000);

    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        errorMsg = std::string("setsockopt(timeout) failed: ") + std::strerror(errno);
        return false;
    }
    return true;
}

ScopedSocket connectWithTimeout(const std::string& address, uint16_t port,
                                uint32_t timeoutMs, std::string& errorMsg) {
    const std::string host = AddressUtils::stripBrackets(address);
    const std::string service = std::to_string(port);

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICHOST | AI_NUMERICSERV;

    addrinfo* result = nullptr;
    const int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
    if (rc != 0) {
        errorMsg = "Invalid address '" + host + "': " + gai_strerror(rc);
        return ScopedSocket();
    }

    ScopedSocket sock(socket(result->ai_family, result->ai_socktype, result->ai_protocol));
    if (!sock.valid()) {
        errorMsg = std::string("socket() failed: ") + std::strerror(errno);
        freeaddrinfo(result);
        return ScopedSocket();
    }

    const int flags = fcntl(sock.get(), F_GETFL, 0);
    fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK);

    int connectResult = ::connect(sock.get(), result->ai_addr, result->ai_addrlen);
    freeaddrinfo(result);

    if (connectResult != 0 && errno != EINPROGRESS) {
        errorMsg = std::string("connect() failed: ") + std::strerror(errno);
        return ScopedSocket();
    }

    if (connectResult != 0) {
        pollfd pfd{};
        pfd.fd = sock.get();
        pfd.events = POLLOUT;

        int ready;
        do {
            ready = poll(&pfd, 1, static_cast<int>(timeoutMs));
        } while (ready < 0 && errno == EINTR);

        if (ready == 0) {
            errorMsg = "connect() timed out after " + std::to_string(timeoutMs) + " ms";
            return ScopedSocket();
        }
        if (ready < 0) {
            errorMsg = std::string("poll() failed: ") + std::strerror(errno);
            return ScopedSocket();
        }

        int soError = 0;
        socklen_t len = sizeof(soError);
        getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &soError, &len);
        if (soError != 0) {
            errorMsg = std::string("connect() failed: ") + std::strerror(soError);
            return ScopedSocket();
        }
    }

    // Back to blocking; SO_RCVTIMEO/SO_SNDTIMEO bound every later read and write
    fcntl(sock.get(), F_SETFL, flags & ~O_NONBLOCK);
    if (!setSocketTimeouts(sock.get(), timeoutMs, errorMsg)) {
        return ScopedSocket();
    }
    return sock;
}

std::string numericAddress(const sockaddr_storage& addr, socklen_t len) {
    char host[NI_MAXHOST] = {};
    if (getnameinfo(reinterpret_cast<const sockaddr*>(&addr), len, host, sizeof(host),
                    nullptr, 0, NI_NUMERICHOST) != 0) {
        return {};
    }
    return host;
}

void ignoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

}  // namespace LanDrop
