/**
 * @file AppPaths.h
 * @brief Canonical storage paths for LanDrop
 *
 * Layout (XDG on Linux, resolved through QStandardPaths):
 * - Config: <GenericConfigLocation>/LanDrop/config.json
 * - Certs:  <GenericDataLocation>/LanDrop/certs/
 * - Logs:   <GenericDataLocation>/LanDrop/logs/
 *
 * LANDROP_CONFIG_DIR and LANDROP_CERT_DIR override the config and cert
 * directories (tests point them at temporary directories).
 */

#pragma once

#include <filesystem>

namespace LanDrop {

class AppPaths {
public:
    /**
     * @brief Per-user data root, e.g. ~/.local/share/LanDrop
     */
    static std::filesystem::path dataRoot();

    static std::filesystem::path configDir();

    /**
     * @return configDir()/config.json, or the override itself when it names a .json file
     */
    static std::filesystem::path configJsonPath();

    static std::filesystem::path certsDir();

    static std::filesystem::path logsDir();

    static std::filesystem::path traceLogPath();

    /**
     * @brief Default save folder: the Downloads directory if it exists, else home
     */
    static std::filesystem::path defaultDownloadDir();

private:
    AppPaths() = delete;
};

}  // namespace LanDrop
