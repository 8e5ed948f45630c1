/**
 * @file Debug.h
 * @brief Timestamped stderr logging macros
 *
 * LOG_DEBUG lines are printed only when LANDROP_DEBUG is set in the
 * environment; the other levels always are.
 */

#pragma once

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <mutex>
#include <string>

namespace LanDrop {

// Serializes stderr between the discovery, server and client threads
inline std::mutex g_logMutex;

/**
 * @brief Wall-clock time as "[HH:MM:SS.mmm]"
 */
inline std::string logTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const int millis = static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);

    std::tm local{};
    localtime_r(&seconds, &local);

    char buffer[20];
    std::snprintf(buffer, sizeof(buffer), "[%02d:%02d:%02d.%03d]",
                  local.tm_hour, local.tm_min, local.tm_sec, millis);
    return buffer;
}

inline bool debugLoggingEnabled() {
    static const bool enabled = std::getenv("LANDROP_DEBUG") != nullptr;
    return enabled;
}

}  // namespace LanDrop

#define LANDROP_LOG(level, msg) \
    do { \
        std::lock_guard<std::mutex> landropLogLock(LanDrop::g_logMutex); \
        std::cerr << LanDrop::logTimestamp() << " [" level "] " << msg << std::endl; \
    } while (0)

#define LOG_INFO(msg) LANDROP_LOG("INFO", msg)
#define LOG_WARNING(msg) LANDROP_LOG("WARNING", msg)
#define LOG_ERROR(msg) LANDROP_LOG("ERROR", msg)
#define LOG_DEBUG(msg) \
    do { \
        if (LanDrop::debugLoggingEnabled()) { \
            LANDROP_LOG("DEBUG", msg); \
        } \
    } while (0)
