/**
 * @file ThreadSafeLog.cpp
 * @brief Trace file sink
 */

#include "landrop/ThreadSafeLog.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <thread>

namespace LanDrop {

std::mutex ThreadSafeLog::s_mutex;
std::ofstream ThreadSafeLog::s_file;

namespace {

// "2026-10-19 14:03:07.412"
std::string traceStamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const long millis = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);

    std::tm local{};
    localtime_r(&seconds, &local);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local);
    char stamp[48];
    std::snprintf(stamp, sizeof(stamp), "%s.%03ld", date, millis);
    return stamp;
}

}  // namespace

bool ThreadSafeLog::initialize(const std::filesystem::path& logPath) {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_file.is_open()) {
        s_file.close();
    }
    if (logPath.empty()) {
        return true;
    }

    std::error_code ec;
    if (logPath.has_parent_path()) {
        std::filesystem::create_directories(logPath.parent_path(), ec);
    }
    s_file.open(logPath, std::ios::out | std::ios::app);
    return s_file.is_open();
}

void ThreadSafeLog::shutdown() {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_file.is_open()) {
        s_file.flush();
        s_file.close();
    }
}

bool ThreadSafeLog::isEnabled() {
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_file.is_open();
}

void ThreadSafeLog::log(const std::string& message) {
    const std::string stamp = traceStamp();
    const size_t thread = std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000;

    std::lock_guard<std::mutex> lock(s_mutex);
    if (!s_file.is_open()) {
        return;
    }
    s_file << stamp << " [" << thread << "] " << message << '\n';
    s_file.flush();
}

void ThreadSafeLog::log(const char* message) {
    log(std::string(message ? message : ""));
}

}  // namespace LanDrop
