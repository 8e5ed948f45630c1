/**
 * @file Settings.h
 * @brief Persistent user settings (config.json)
 */

#pragma once

#include <filesystem>
#include <mutex>
#include <string>

namespace LanDrop {

/**
 * @class Settings
 * @brief JSON-backed settings, thread-safe
 *
 * Read by the server threads (default save folder) while the front-end may
 * change values, so every accessor locks. Setters only change memory;
 * call save() to persist.
 */
class Settings {
public:
    /**
     * @param configPath File to load from and save to (AppPaths::configJsonPath() by default)
     */
    explicit Settings(std::filesystem::path configPath = {});

    /**
     * @brief Load the file, falling back to defaults
     *
     * A missing file is created with defaults. A corrupt file leaves the
     * defaults in place and returns false with errorMsg set; the next save()
     * rewrites it.
     */
    bool load(std::string& errorMsg);

    /**
     * @brief Write pretty-printed JSON atomically
     */
    bool save(std::string& errorMsg) const;

    void resetToDefaults();

    std::string displayName() const;
    void setDisplayName(const std::string& name);

    std::string userLabel() const;
    void setUserLabel(const std::string& label);

    std::filesystem::path saveFolder() const;
    void setSaveFolder(const std::filesystem::path& folder);

    bool traceLogEnabled() const;
    void setTraceLogEnabled(bool enabled);

    /**
     * @brief Run a separate IPv4 listener next to a v6-only IPv6 one
     */
    bool separateIpv4Listener() const;
    void setSeparateIpv4Listener(bool enabled);

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;

    mutable std::mutex m_mutex;
    std::string m_displayName;
    std::string m_userLabel;
    std::filesystem::path m_saveFolder;
    bool m_traceLogEnabled;
    bool m_separateIpv4Listener;
};

}  // namespace LanDrop
