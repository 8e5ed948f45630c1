/**
 * @file Settings.cpp
 * @brief Settings persistence implementation
 */

#include "landrop/Settings.h"
#include "landrop/AppPaths.h"
#include "landrop/HostIdentity.h"
#include "landrop/ThreadSafeLog.h"
#include "landrop/config.h"

#include <nlohmann/json.hpp>

#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QString>

using json = nlohmann::json;

namespace LanDrop {

namespace {
    constexpr const char* SETTINGS_VERSION = "1";

    std::string clampName(const std::string& name) {
        return name.size() > MAX_DISPLAY_NAME ? name.substr(0, MAX_DISPLAY_NAME) : name;
    }
}

// ========================================================================
// Construction
// ========================================================================

Settings::Settings(std::filesystem::path configPath)
    : m_path(configPath.empty() ? AppPaths::configJsonPath() : std::move(configPath))
    , m_traceLogEnabled(false)
    , m_separateIpv4Listener(false)
{
    resetToDefaults();
}

void Settings::resetToDefaults()
{
    const std::string displayName = clampName(HostIdentity::hostDisplayName());
    const std::string userLabel = HostIdentity::accountFullName();
    const std::filesystem::path saveFolder = AppPaths::defaultDownloadDir();

    std::lock_guard<std::mutex> lock(m_mutex);
    m_displayName = displayName;
    m_userLabel = userLabel;
    m_saveFolder = saveFolder;
    m_traceLogEnabled = false;
    m_separateIpv4Listener = false;
}

// ========================================================================
// Persistence
// ========================================================================

bool Settings::load(std::string& errorMsg)
{
    const QString configPath = QString::fromStdString(m_path.string());
    QFile configFile(configPath);

    if (!configFile.exists()) {
        // First run - write defaults
        return save(errorMsg);
    }

    if (!configFile.open(QIODevice::ReadOnly | QIODevice::Text)) {
        errorMsg = "Cannot open settings file: " + m_path.string();
        return false;
    }

    const QByteArray data = configFile.readAll();
    configFile.close();

    json j = json::parse(data.constData(), data.constData() + data.size(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        errorMsg = "Settings file is not valid JSON, using defaults: " + m_path.string();
        ThreadSafeLog::log("SETTINGS_WARN: " + errorMsg);
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (j.contains("display_name") && j["display_name"].is_string()) {
        const std::string name = clampName(j["display_name"].get<std::string>());
        if (!name.empty()) {
            m_displayName = name;
        }
    }
    if (j.contains("user_label") && j["user_label"].is_string()) {
        const std::string label = j["user_label"].get<std::string>();
        if (!label.empty()) {
            m_userLabel = label;
        }
    }
    if (j.contains("save_folder") && j["save_folder"].is_string()) {
        const std::string folder = j["save_folder"].get<std::string>();
        if (!folder.empty()) {
            m_saveFolder = folder;
        }
    }
    if (j.contains("trace_log") && j["trace_log"].is_boolean()) {
        m_traceLogEnabled = j["trace_log"].get<bool>();
    }
    if (j.contains("separate_ipv4_listener") && j["separate_ipv4_listener"].is_boolean()) {
        m_separateIpv4Listener = j["separate_ipv4_listener"].get<bool>();
    }
    return true;
}

bool Settings::save(std::string& errorMsg) const
{
    const QString configPath = QString::fromStdString(m_path.string());
    QDir dir = QFileInfo(configPath).dir();
    if (!dir.exists() && !dir.mkpath(".")) {
        errorMsg = "Cannot create settings directory: " + dir.path().toStdString();
        return false;
    }

    json j;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        j["display_name"] = m_displayName;
        j["user_label"] = m_userLabel;
        j["save_folder"] = m_saveFolder.string();
        j["trace_log"] = m_traceLogEnabled;
        j["separate_ipv4_listener"] = m_separateIpv4Listener;
        j["settings_version"] = SETTINGS_VERSION;
    }

    const std::string text = j.dump(4);

    QSaveFile out(configPath);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Text)) {
        errorMsg = "Cannot write settings file: " + m_path.string();
        return false;
    }
    if (out.write(text.data(), static_cast<qint64>(text.size())) != static_cast<qint64>(text.size())) {
        out.cancelWriting();
        errorMsg = "Short write to settings file: " + m_path.string();
        return false;
    }
    if (!out.commit()) {
        errorMsg = "Cannot commit settings file: " + m_path.string();
        return false;
    }
    return true;
}

// ========================================================================
// Accessors
// ========================================================================

std::string Settings::displayName() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_displayName;
}

void Settings::setDisplayName(const std::string& name)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_displayName = clampName(name);
}

std::string Settings::userLabel() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_userLabel;
}

void Settings::setUserLabel(const std::string& label)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_userLabel = label;
}

std::filesystem::path Settings::saveFolder() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_saveFolder;
}

void Settings::setSaveFolder(const std::filesystem::path& folder)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_saveFolder = folder;
}

bool Settings::traceLogEnabled() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_traceLogEnabled;
}

void Settings::setTraceLogEnabled(bool enabled)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_traceLogEnabled = enabled;
}

bool Settings::separateIpv4Listener() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_separateIpv4Listener;
}

void Settings::setSeparateIpv4Listener(bool enabled)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_separateIpv4Listener = enabled;
}

}  // namespace LanDrop
