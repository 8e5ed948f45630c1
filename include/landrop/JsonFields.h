/**
 * @file JsonFields.h
 * @brief Lenient accessors for peer-supplied JSON
 */

#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace LanDrop {

/**
 * @brief String member of an object, empty if absent or not a string
 */
inline std::string jsonString(const nlohmann::json& j, const char* key) {
    if (!j.is_object()) {
        return {};
    }
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

/**
 * @brief Compact dump; invalid UTF-8 from host names is replaced, not thrown
 */
inline std::string dumpJson(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace LanDrop
