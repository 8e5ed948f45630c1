/**
 * @file PathUtils.cpp
 * @brief File name helpers
 */

#include "landrop/PathUtils.h"

namespace LanDrop {

std::string PathUtils::stripFileUrl(const std::string& path) {
    const std::string prefix = "file://";
    if (path.compare(0, prefix.size(), prefix) == 0) {
        return path.substr(prefix.size());
    }
    return path;
}

std::string PathUtils::safeFileName(const std::string& name) {
    std::string normalized = name;
    for (char& c : normalized) {
        if (c == '\\') {
            c = '/';
        }
    }
    while (!normalized.empty() && normalized.back() == '/') {
        normalized.pop_back();
    }

    const std::string base = std::filesystem::path(normalized).filename().string();
    if (base.empty() || base == "." || base == "..") {
        return {};
    }
    return base;
}

std::filesystem::path PathUtils::uniqueFilePath(const std::filesystem::path& folder,
                                                const std::string& name) {
    std::filesystem::path candidate = folder / name;
    std::error_code ec;
    if (!std::filesystem::exists(candidate, ec)) {
        return candidate;
    }

    const std::filesystem::path original(name);
    const std::string stem = original.stem().string();
    const std::string extension = original.extension().string();

    for (int counter = 1;; ++counter) {
        candidate = folder / (stem + "_" + std::to_string(counter) + extension);
        if (!std::filesystem::exists(candidate, ec)) {
            return candidate;
        }
    }
}

}  // namespace LanDrop
