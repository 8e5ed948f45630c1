/**
 * @file TlsSocket.cpp
 * @brief TLS/SSL wrapper for the HTTPS transport
 */

#include "landrop/TlsSocket.h"
#include "landrop/CertificateManager.h"
#include "landrop/config.h"

#include <boost/asio/error.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <utility>

namespace LanDrop {

//=============================================================================
// TlsSocket: Constructor / Destructor
//=============================================================================

TlsSocket::TlsSocket(int fd, TlsRole role, TlsContextPtr context)
    : m_fd(fd)
    , m_ctx(std::move(context))
    , m_ssl(nullptr)
    , m_role(role)
    , m_connected(false)
{
}

TlsSocket::~TlsSocket() {
    shutdown();

    if (m_ssl) {
        SSL_free(m_ssl);
        m_ssl = nullptr;
    }
}

//=============================================================================
// TlsSocket: SSL Context Creation
//=============================================================================

TlsContextPtr TlsSocket::createContext(TlsRole role, const std::string& certDir, std::string& errorMsg) {
    const SSL_METHOD* method = (role == TlsRole::SERVER) ? TLS_server_method() : TLS_client_method();

    TlsContextPtr ctx(SSL_CTX_new(method), SSL_CTX_free);
    if (!ctx) {
        errorMsg = "Failed to create SSL context: " + getLastError();
        return nullptr;
    }

    // TLS 1.3 only; both ends are LanDrop
    if (SSL_CTX_set_min_proto_version(ctx.get(), TLS1_3_VERSION) != 1 ||
        SSL_CTX_set_max_proto_version(ctx.get(), TLS1_3_VERSION) != 1) {
        errorMsg = "Failed to set TLS version: " + getLastError();
        return nullptr;
    }
    if (SSL_CTX_set_ciphersuites(ctx.get(), TLS13_CIPHER_SUITES) != 1) {
        errorMsg = "Failed to set TLS 1.3 cipher suites: " + getLastError();
        return nullptr;
    }
    if (SSL_CTX_set1_groups_list(ctx.get(), TLS_GROUPS_LIST) != 1) {
        errorMsg = "Failed to set TLS groups list: " + getLastError();
        return nullptr;
    }

    long options = SSL_OP_NO_COMPRESSION;
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // Peers close right after the response; a missing close_notify is not an error
    options |= SSL_OP_IGNORE_UNEXPECTED_EOF;
#endif
    SSL_CTX_set_options(ctx.get(), options);

    // Self-signed peers: no verification in either direction
    SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);

    if (role == TlsRole::SERVER) {
        if (certDir.empty()) {
            errorMsg = "No certificate directory configured for TLS server";
            return nullptr;
        }
        if (!CertificateManager::loadCertificate(ctx.get(),
                                                 CertificateManager::getCertFilePath(certDir),
                                                 CertificateManager::getKeyFilePath(certDir),
                                                 errorMsg)) {
            return nullptr;
        }
    }
    return ctx;
}

bool TlsSocket::createSsl(std::string& errorMsg) {
    if (!m_ctx) {
        errorMsg = "No TLS context";
        return false;
    }
    m_ssl = SSL_new(m_ctx.get());
    if (!m_ssl) {
        errorMsg = "Failed to create SSL object: " + getLastError();
        return false;
    }
    if (SSL_set_fd(m_ssl, m_fd) != 1) {
        errorMsg = "Failed to set SSL file descriptor: " + getLastError();
        return false;
    }
    return true;
}

//=============================================================================
// TlsSocket: TLS Handshake
//=============================================================================

bool TlsSocket::handshake(std::string& errorMsg) {
    if (!createSsl(errorMsg)) {
        return false;
    }

    ERR_clear_error();
    const int result = (m_role == TlsRole::SERVER) ? SSL_accept(m_ssl) : SSL_connect(m_ssl);
    if (result != 1) {
        const int savedErrno = errno;
        const int err = SSL_get_error(m_ssl, result);
        std::string detail = getLastError();
        if (err == SSL_ERROR_SYSCALL || err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
            detail = savedErrno != 0 ? std::strerror(savedErrno) : "peer closed the connection";
        }
        errorMsg = "TLS handshake failed (" + getErrorDescription(err) + "): " + detail;
        return false;
    }

    m_connected = true;
    return true;
}

//=============================================================================
// TlsSocket: Read / Write
//=============================================================================

std::size_t TlsSocket::readSome(void* buffer, std::size_t size, boost::system::error_code& ec) {
    if (!m_connected || !m_ssl) {
        m_lastError = "TLS not connected";
        ec = boost::asio::error::not_connected;
        return 0;
    }

    ERR_clear_error();
    errno = 0;
    const int chunk = static_cast<int>(std::min<std::size_t>(size, INT_MAX));
    const int received = SSL_read(m_ssl, buffer, chunk);
    if (received > 0) {
        ec = {};
        return static_cast<std::size_t>(received);
    }

    ec = translateError(received, errno, "read");
    return 0;
}

std::size_t TlsSocket::writeSome(const void* data, std::size_t size, boost::system::error_code& ec) {
    if (!m_connected || !m_ssl) {
        m_lastError = "TLS not connected";
        ec = boost::asio::error::not_connected;
        return 0;
    }

    ERR_clear_error();
    errno = 0;
    const int chunk = static_cast<int>(std::min<std::size_t>(size, INT_MAX));
    const int sent = SSL_write(m_ssl, data, chunk);
    if (sent > 0) {
        ec = {};
        return static_cast<std::size_t>(sent);
    }

    ec = translateError(sent, errno, "write");
    return 0;
}

boost::system::error_code TlsSocket::translateError(int result, int savedErrno, const char* operation) {
    const int err = SSL_get_error(m_ssl, result);

    if (err == SSL_ERROR_ZERO_RETURN) {
        m_lastError = "Connection closed by peer";
        m_connected = false;
        return boost::asio::error::eof;
    }

    // With SO_RCVTIMEO/SO_SNDTIMEO on a blocking socket, an expired timer
    // surfaces as WANT_READ/WANT_WRITE with errno EAGAIN.
    if ((err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_SYSCALL) &&
        (savedErrno == EAGAIN || savedErrno == EWOULDBLOCK)) {
        m_lastError = std::string("TLS ") + operation + " timed out";
        return boost::asio::error::timed_out;
    }

    if (err == SSL_ERROR_SYSCALL) {
        m_connected = false;
        if (savedErrno == 0) {
            m_lastError = "Connection closed without close_notify";
            return boost::asio::error::eof;
        }
        m_lastError = std::string("TLS ") + operation + " failed: " + std::strerror(savedErrno);
        return boost::system::error_code(savedErrno, boost::system::system_category());
    }

    m_lastError = std::string("TLS ") + operation + " failed (" + getErrorDescription(err) + "): " +
                  getLastError();
    m_connected = false;
    return boost::asio::error::connection_aborted;
}

//=============================================================================
// TlsSocket: Connection Management
//=============================================================================

void TlsSocket::shutdown() {
    if (m_ssl && m_connected) {
        SSL_shutdown(m_ssl);
        m_connected = false;
    }
}

//=============================================================================
// TlsSocket: Error Handling
//=============================================================================

std::string TlsSocket::getLastError() {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "Unknown error";
    }

    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

std::string TlsSocket::getErrorDescription(int sslErrorCode) {
    switch (sslErrorCode) {
        case SSL_ERROR_NONE:
            return "SSL_ERROR_NONE";
        case SSL_ERROR_ZERO_RETURN:
            return "SSL_ERROR_ZERO_RETURN (connection closed)";
        case SSL_ERROR_WANT_READ:
            return "SSL_ERROR_WANT_READ (retry needed)";
        case SSL_ERROR_WANT_WRITE:
            return "SSL_ERROR_WANT_WRITE (retry needed)";
        case SSL_ERROR_SYSCALL:
            return "SSL_ERROR_SYSCALL (I/O error)";
        case SSL_ERROR_SSL:
            return "SSL_ERROR_SSL (protocol error)";
        default:
            return "SSL_ERROR_UNKNOWN (" + std::to_string(sslErrorCode) + ")";
    }
}

}  // namespace LanDrop
