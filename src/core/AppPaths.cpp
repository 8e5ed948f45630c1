/**
 * @file AppPaths.cpp
 * @brief Canonical storage paths for LanDrop.
 */

#include "landrop/AppPaths.h"
#include "landrop/config.h"

#include <QDir>
#include <QStandardPaths>
#include <QString>

namespace LanDrop {

namespace {

std::filesystem::path fromQString(const QString& path) {
    return std::filesystem::path(path.toStdString());
}

std::filesystem::path envOverride(const char* name) {
    const QString value = qEnvironmentVariable(name).trimmed();
    if (value.isEmpty()) {
        return {};
    }
    return fromQString(value);
}

std::filesystem::path standardLocation(QStandardPaths::StandardLocation location,
                                       const char* homeFallback) {
    QString dir = QStandardPaths::writableLocation(location);
    if (dir.isEmpty()) {
        dir = QDir::homePath() + homeFallback;
    }
    return fromQString(dir);
}

} // namespace

std::filesystem::path AppPaths::dataRoot() {
    return standardLocation(QStandardPaths::GenericDataLocation, "/.local/share") / APP_DIR_NAME;
}

std::filesystem::path AppPaths::configDir() {
    const auto overrideDir = envOverride(ENV_CONFIG_DIR);
    if (!overrideDir.empty()) {
        if (overrideDir.extension() == ".json") {
            return overrideDir.parent_path();
        }
        return overrideDir;
    }
    return standardLocation(QStandardPaths::GenericConfigLocation, "/.config") / APP_DIR_NAME;
}

std::filesystem::path AppPaths::configJsonPath() {
    const auto overrideDir = envOverride(ENV_CONFIG_DIR);
    if (!overrideDir.empty() && overrideDir.extension() == ".json") {
        return overrideDir;
    }
    return configDir() / CONFIG_FILE_NAME;
}

std::filesystem::path AppPaths::certsDir() {
    const auto overrideDir = envOverride(ENV_CERT_DIR);
    if (!overrideDir.empty()) {
        return overrideDir;
    }
    return dataRoot() / "certs";
}

std::filesystem::path AppPaths::logsDir() {
    return dataRoot() / "logs";
}

std::filesystem::path AppPaths::traceLogPath() {
    return logsDir() / TRACE_LOG_FILE_NAME;
}

std::filesystem::path AppPaths::defaultDownloadDir() {
    const QString downloads = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    if (!downloads.isEmpty() && QDir(downloads).exists()) {
        return fromQString(downloads);
    }
    const QString fallback = QDir::homePath() + "/Downloads";
    if (QDir(fallback).exists()) {
        return fromQString(fallback);
    }
    return fromQString(QDir::homePath());
}

}  // namespace LanDrop
