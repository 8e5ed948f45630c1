/**
 * @file ThreadSafeLog.h
 * @brief Optional append-only trace file shared by every node thread
 */

#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace LanDrop {

/**
 * @brief Process-wide trace sink
 *
 * Lines come from the announce loop, the discovery listener, the accept
 * loops and the connection threads; one mutex serializes them. Until
 * initialize() is given a path, log() is a no-op.
 */
class ThreadSafeLog {
public:
    /**
     * @brief Open (append) the trace file; an empty path turns tracing off
     * @return false if the file could not be opened
     */
    static bool initialize(const std::filesystem::path& logPath);

    /**
     * @brief Flush and close the trace file
     */
    static void shutdown();

    static void log(const std::string& message);
    static void log(const char* message);

    static bool isEnabled();

private:
    static std::mutex s_mutex;
    static std::ofstream s_file;
};

}  // namespace LanDrop
