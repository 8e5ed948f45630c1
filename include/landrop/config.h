/**
 * @file config.h
 * @brief Configuration constants for LanDrop
 *
 * Compile-time constants shared by discovery, the transaction protocol and
 * the HTTPS transport. Peers only interoperate when the port, the multicast
 * group and the endpoint names match, so treat the NetworkPorts, Discovery
 * and Endpoints groups as part of the wire protocol.
 */

#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @namespace LanDrop
 * @brief LanDrop namespace containing all public APIs
 */
namespace LanDrop {

//=========================================================================
// Network Ports
//=========================================================================

/** @defgroup NetworkPorts Network Ports Configuration
 * @brief Single fixed port shared by the HTTPS listeners and the multicast group
 * @{
 */

/**
 * @brief TCP port of the HTTPS listeners (both address families).
 *
 * The same number, rendered in hex, is the last group of the multicast
 * address, so changing it also moves the discovery group.
 */
constexpr uint16_t PORT = 56934;

/** @} */ // end of NetworkPorts

//=========================================================================
// Discovery
//=========================================================================

/** @defgroup Discovery Discovery Configuration
 * @brief Multicast announce loop and liveness sweep
 * @{
 */

/**
 * @brief IPv6 site-local multicast group: ff05::dead:beef:cafe:<PORT in hex>.
 */
constexpr const char* MULTICAST_ADDRESS = "ff05::dead:beef:cafe:de66";

/**
 * @brief Probe payload. Receivers never interpret it.
 */
constexpr const char* DISCOVERY_PROBE = "is there anybody out there?";

/**
 * @brief Interval between two announce/sweep cycles.
 */
constexpr uint32_t ANNOUNCE_INTERVAL_MS = 250;

/**
 * @brief A discovered peer not refreshed by /connect for longer than this is removed.
 */
constexpr uint32_t PEER_TTL_MS = 15000;

/**
 * @brief Multicast hop limit for the probe datagram.
 */
constexpr int MULTICAST_HOPS = 8;

/**
 * @brief Largest datagram the listener reads; longer probes are truncated.
 */
constexpr size_t MAX_DATAGRAM_SIZE = 1024;

/**
 * @brief Poll granularity of the listener so stop() is honoured quickly.
 */
constexpr uint32_t LISTENER_POLL_MS = 200;

/** @} */ // end of Discovery

//=========================================================================
// Transport
//=========================================================================

/** @defgroup Transport Transport Configuration
 * @brief HTTPS client and server parameters
 * @{
 */

/**
 * @brief Connect, send and receive timeout of every outbound call.
 */
constexpr uint32_t CONNECTION_TIMEOUT_MS = 30000;  // 30 seconds

/**
 * @brief Receive timeout applied to accepted connections.
 */
constexpr uint32_t SERVER_IO_TIMEOUT_MS = 30000;

/**
 * @brief Poll interval of the accept loop.
 */
constexpr uint32_t ACCEPT_POLL_MS = 200;

/**
 * @brief Upper bound on concurrently served connections per listener.
 */
constexpr size_t MAX_CONCURRENT_CLIENT_THREADS = 32;

/**
 * @brief Listen backlog.
 */
constexpr int LISTEN_BACKLOG = 64;

/**
 * @brief User-Agent and Server header value.
 */
constexpr const char* HTTP_AGENT = "LanDrop/1.0";

/** @} */ // end of Transport

//=========================================================================
// Endpoints
//=========================================================================

/** @defgroup Endpoints Protocol Endpoints
 * @brief Endpoint names (without leading slash) and JSON vocabulary
 * @{
 */

constexpr const char* ENDPOINT_CONNECT = "connect";
constexpr const char* ENDPOINT_REQUEST_TRANSACTION = "request-transaction";
constexpr const char* ENDPOINT_CONFIRM_TRANSACTION = "confirm-transaction";
constexpr const char* ENDPOINT_CANCEL_TRANSACTION = "cancel-transaction";
constexpr const char* ENDPOINT_START_TRANSACTION = "start-transaction";

constexpr const char* STATUS_OK = "ok";
constexpr const char* STATUS_ERROR = "error";
constexpr const char* STATUS_UNKNOWN = "unknown";

/**
 * @brief Multipart part names of /start-transaction.
 */
constexpr const char* PART_FILE = "file";
constexpr const char* PART_JSON = "json";

/** @} */ // end of Endpoints

//=========================================================================
// TLS
//=========================================================================

/** @defgroup TLS TLS/SSL Configuration
 * @brief Self-signed certificates, no peer verification
 * @{
 */

/**
 * @brief TLS 1.3 cipher suites (OpenSSL names).
 */
constexpr const char* TLS13_CIPHER_SUITES =
    "TLS_AES_256_GCM_SHA384:TLS_CHACHA20_POLY1305_SHA256:TLS_AES_128_GCM_SHA256";

/**
 * @brief Key exchange groups.
 */
constexpr const char* TLS_GROUPS_LIST = "X25519:P-256:P-384";

constexpr const char* CERT_FILE = "server.crt";
constexpr const char* KEY_FILE = "server.key";
constexpr int CERT_VALIDITY_DAYS = 365;         // 1 year self-signed cert
constexpr int CERT_KEY_BITS = 2048;
constexpr const char* CERT_ORGANIZATION = "LanDrop";

/** @} */ // end of TLS

//=========================================================================
// Storage
//=========================================================================

/** @defgroup Storage Storage Configuration
 * @{
 */

constexpr const char* APP_DIR_NAME = "LanDrop";
constexpr const char* CONFIG_FILE_NAME = "config.json";
constexpr const char* TRACE_LOG_FILE_NAME = "landrop_trace.txt";
constexpr const char* ENV_CONFIG_DIR = "LANDROP_CONFIG_DIR";
constexpr const char* ENV_CERT_DIR = "LANDROP_CERT_DIR";

/**
 * @brief Maximum display name length accepted from peers and settings.
 */
constexpr size_t MAX_DISPLAY_NAME = 64;

/** @} */ // end of Storage

}  // namespace LanDrop
