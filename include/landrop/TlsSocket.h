/**
 * @file TlsSocket.h
 * @brief OpenSSL wrapper over a connected socket
 */

#pragma once

#include <boost/asio/buffer.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

// Forward declarations for OpenSSL types
struct ssl_ctx_st;
typedef struct ssl_ctx_st SSL_CTX;
struct ssl_st;
typedef struct ssl_st SSL;

namespace LanDrop {

enum class TlsRole {
    SERVER,
    CLIENT
};

/**
 * @brief Shared SSL_CTX; one per listener, reused by every connection thread
 */
using TlsContextPtr = std::shared_ptr<SSL_CTX>;

/**
 * @class TlsSocket
 * @brief TLS 1.3 session on a blocking socket with SO_RCVTIMEO/SO_SNDTIMEO set
 *
 * Neither side verifies the peer certificate. The server presents the
 * certificate found in certDir; the client presents none.
 *
 * read_some()/write_some() make the socket a Beast SyncReadStream and
 * SyncWriteStream, so boost::beast::http::read/write work on it directly.
 * A clean close_notify maps to boost::asio::error::eof and an expired socket
 * timeout to boost::asio::error::timed_out.
 *
 * The socket descriptor is not owned. The context is built once with
 * createContext() and shared; SSL_new() on it is safe from any thread.
 */
class TlsSocket {
public:
    /**
     * @brief Build a TLS 1.3 context
     * @param certDir Directory holding server.crt/server.key (SERVER only)
     * @return nullptr on failure (errorMsg set)
     */
    static TlsContextPtr createContext(TlsRole role, const std::string& certDir, std::string& errorMsg);

    /**
     * @param fd Connected socket
     * @param role SERVER for accepted connections
     * @param context From createContext() with the same role
     */
    TlsSocket(int fd, TlsRole role, TlsContextPtr context);
    ~TlsSocket();

    TlsSocket(const TlsSocket&) = delete;
    TlsSocket& operator=(const TlsSocket&) = delete;

    /**
     * @brief SSL_accept / SSL_connect
     */
    bool handshake(std::string& errorMsg);

    std::size_t readSome(void* buffer, std::size_t size, boost::system::error_code& ec);
    std::size_t writeSome(const void* data, std::size_t size, boost::system::error_code& ec);

    /**
     * @brief Send close_notify (best effort)
     */
    void shutdown();

    /**
     * @brief Human-readable detail of the last failed read or write
     */
    const std::string& lastError() const { return m_lastError; }

    static std::string getErrorDescription(int sslErrorCode);

    //=========================================================================
    // Beast SyncReadStream / SyncWriteStream
    //=========================================================================

    template <class MutableBufferSequence>
    std::size_t read_some(const MutableBufferSequence& buffers, boost::system::error_code& ec) {
        for (auto it = boost::asio::buffer_sequence_begin(buffers);
             it != boost::asio::buffer_sequence_end(buffers); ++it) {
            boost::asio::mutable_buffer buffer(*it);
            if (buffer.size() > 0) {
                return readSome(buffer.data(), buffer.size(), ec);
            }
        }
        ec = {};
        return 0;
    }

    template <class MutableBufferSequence>
    std::size_t read_some(const MutableBufferSequence& buffers) {
        boost::system::error_code ec;
        const std::size_t n = read_some(buffers, ec);
        if (ec) {
            throw boost::system::system_error(ec);
        }
        return n;
    }

    template <class ConstBufferSequence>
    std::size_t write_some(const ConstBufferSequence& buffers, boost::system::error_code& ec) {
        for (auto it = boost::asio::buffer_sequence_begin(buffers);
             it != boost::asio::buffer_sequence_end(buffers); ++it) {
            boost::asio::const_buffer buffer(*it);
            if (buffer.size() > 0) {
                return writeSome(buffer.data(), buffer.size(), ec);
            }
        }
        ec = {};
        return 0;
    }

    template <class ConstBufferSequence>
    std::size_t write_some(const ConstBufferSequence& buffers) {
        boost::system::error_code ec;
        const std::size_t n = write_some(buffers, ec);
        if (ec) {
            throw boost::system::system_error(ec);
        }
        return n;
    }

private:
    bool createSsl(std::string& errorMsg);

    /**
     * @brief Translate a failed SSL_read/SSL_write into an error_code
     */
    boost::system::error_code translateError(int result, int savedErrno, const char* operation);

    static std::string getLastError();

    int m_fd;
    TlsContextPtr m_ctx;
    SSL* m_ssl;
    TlsRole m_role;
    bool m_connected;
    std::string m_lastError;
};

}  // namespace LanDrop
