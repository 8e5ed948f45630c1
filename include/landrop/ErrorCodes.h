/**
 * @file ErrorCodes.h
 * @brief Stable, searchable error codes attached to failed operations.
 *
 * Codes never change meaning once shipped; the accompanying message is free text.
 */

#pragma once

namespace LanDrop {
namespace ErrorCodes {

// Transport (outbound HTTPS calls)
inline constexpr const char* NET_ADDRESS_INVALID = "LD-NET-1000";
inline constexpr const char* NET_CONNECT_FAILED = "LD-NET-1001";
inline constexpr const char* NET_TLS_FAILED = "LD-NET-1002";
inline constexpr const char* NET_WRITE_FAILED = "LD-NET-1003";
inline constexpr const char* NET_READ_FAILED = "LD-NET-1004";
inline constexpr const char* NET_HTTP_STATUS = "LD-NET-1005";
inline constexpr const char* NET_BAD_RESPONSE = "LD-NET-1006";

// Protocol (structured rejections and local preconditions)
inline constexpr const char* PROTO_REJECTED = "LD-PROTO-2000";
inline constexpr const char* PROTO_UNKNOWN_TRANSACTION = "LD-PROTO-2001";
inline constexpr const char* PROTO_WRONG_STAGE = "LD-PROTO-2002";
inline constexpr const char* PROTO_MISSING_ID = "LD-PROTO-2003";

// Address validation (manual peers)
inline constexpr const char* ADDR_MALFORMED = "LD-ADDR-3000";
inline constexpr const char* ADDR_DUPLICATE = "LD-ADDR-3001";

// File I/O
inline constexpr const char* IO_OPEN_FAILED = "LD-IO-4000";
inline constexpr const char* IO_WRITE_FAILED = "LD-IO-4001";
inline constexpr const char* IO_BAD_FILENAME = "LD-IO-4002";

}  // namespace ErrorCodes
}  // namespace LanDrop
