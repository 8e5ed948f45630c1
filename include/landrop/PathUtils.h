/**
 * @file PathUtils.h
 * @brief File name helpers for received and selected files
 */

#pragma once

#include <filesystem>
#include <string>

namespace LanDrop {

class PathUtils {
public:
    /**
     * @brief "file:///home/a/b.txt" -> "/home/a/b.txt"; other input unchanged
     */
    static std::string stripFileUrl(const std::string& path);

    /**
     * @brief Last path component of a name announced by a peer
     * @return Empty string if nothing usable remains ("", ".", "..")
     */
    static std::string safeFileName(const std::string& name);

    /**
     * @brief First free path in folder for name
     *
     * "report.txt" -> "report.txt", then "report_1.txt", "report_2.txt", ...
     * The counter goes before the last extension only ("a.tar.gz" -> "a.tar_1.gz").
     */
    static std::filesystem::path uniqueFilePath(const std::filesystem::path& folder,
                                                const std::string& name);

private:
    PathUtils() = delete;
};

}  // namespace LanDrop
