/**
 * @file Multipart.h
 * @brief multipart/form-data encoding and parsing for /start-transaction
 */

#pragma once

#include <string>
#include <vector>

namespace LanDrop {

/**
 * @brief One form-data part
 */
struct MultipartPart {
    std::string name;           ///< Content-Disposition name
    std::string fileName;       ///< Content-Disposition filename (may be empty)
    std::string contentType;    ///< Part Content-Type (may be empty)
    std::string data;           ///< Raw part body
};

class Multipart {
public:
    /**
     * @brief Random boundary token
     */
    static std::string generateBoundary();

    /**
     * @brief "multipart/form-data; boundary=<boundary>"
     */
    static std::string contentType(const std::string& boundary);

    /**
     * @brief Extract the boundary parameter of a multipart Content-Type header
     * @return Empty if the header is not multipart/form-data or has no boundary
     */
    static std::string boundaryFromContentType(const std::string& contentType);

    static std::string encode(const std::vector<MultipartPart>& parts, const std::string& boundary);

    /**
     * @brief Split a multipart body into parts
     * @return false if the body is not well-formed for this boundary
     */
    static bool parse(const std::string& body, const std::string& boundary,
                      std::vector<MultipartPart>& parts, std::string& errorMsg);

    /**
     * @brief First part named name, nullptr if absent
     */
    static const MultipartPart* find(const std::vector<MultipartPart>& parts, const std::string& name);

private:
    Multipart() = delete;
};

}  // namespace LanDrop
