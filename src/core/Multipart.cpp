/**
 * @file Multipart.cpp
 * @brief multipart/form-data codec (RFC 7578 subset)
 */

#include "landrop/Multipart.h"
#include "landrop/UuidGenerator.h"

#include <algorithm>
#include <cctype>

namespace LanDrop {

namespace {

constexpr const char* CRLF = "\r\n";

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    const size_t first = s.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    const size_t last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        std::string out;
        out.reserve(value.size() - 2);
        for (size_t i = 1; i + 1 < value.size(); ++i) {
            if (value[i] == '\\' && i + 2 < value.size()) {
                ++i;
            }
            out.push_back(value[i]);
        }
        return out;
    }
    return value;
}

/**
 * @brief Value of a ';'-separated header parameter (quoted strings may contain ';')
 */
std::string headerParameter(const std::string& header, const std::string& parameter) {
    size_t pos = 0;
    while (pos < header.size()) {
        // Find the end of this parameter, skipping quoted sections
        size_t end = pos;
        bool quoted = false;
        while (end < header.size() && (quoted || header[end] != ';')) {
            if (header[end] == '"') {
                quoted = !quoted;
            } else if (header[end] == '\\' && quoted) {
                ++end;
            }
            ++end;
        }

        const std::string item = trim(header.substr(pos, end - pos));
        const size_t eq = item.find('=');
        if (eq != std::string::npos && toLower(trim(item.substr(0, eq))) == parameter) {
            return unquote(trim(item.substr(eq + 1)));
        }
        pos = end + 1;
    }
    return {};
}

std::string escapeQuoted(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
        }
        if (c == '\r' || c == '\n') {
            continue;
        }
        out.push_back(c);
    }
    return out;
}

/**
 * @brief Next CRLF--boundary that is a real delimiter line
 *
 * The boundary must be followed by "--" or by optional padding and CRLF;
 * anything else is part data that happens to contain the boundary text.
 */
size_t findDelimiter(const std::string& body, const std::string& nextDelimiter, size_t from) {
    size_t pos = body.find(nextDelimiter, from);
    while (pos != std::string::npos) {
        size_t after = pos + nextDelimiter.size();
        if (body.compare(after, 2, "--") == 0) {
            return pos;
        }
        while (after < body.size() && (body[after] == ' ' || body[after] == '\t')) {
            ++after;
        }
        if (body.compare(after, 2, CRLF) == 0) {
            return pos;
        }
        pos = body.find(nextDelimiter, pos + 1);
    }
    return std::string::npos;
}

} // namespace

//=============================================================================
// Header helpers
//=============================================================================

std::string Multipart::generateBoundary() {
    std::string token = UuidGenerator::generate();
    token.erase(std::remove(token.begin(), token.end(), '-'), token.end());
    return "----LanDropBoundary" + token;
}

std::string Multipart::contentType(const std::string& boundary) {
    return "multipart/form-data; boundary=" + boundary;
}

std::string Multipart::boundaryFromContentType(const std::string& contentType) {
    const size_t semicolon = contentType.find(';');
    const std::string mediaType = toLower(trim(contentType.substr(0, semicolon)));
    if (mediaType != "multipart/form-data" || semicolon == std::string::npos) {
        return {};
    }
    return headerParameter(contentType.substr(semicolon + 1), "boundary");
}

//=============================================================================
// Encoding
//=============================================================================

std::string Multipart::encode(const std::vector<MultipartPart>& parts, const std::string& boundary) {
    size_t total = 0;
    for (const auto& part : parts) {
        total += part.data.size() + 256;
    }

    std::string body;
    body.reserve(total + boundary.size() + 8);

    for (const auto& part : parts) {
        body += "--" + boundary + CRLF;
        body += "Content-Disposition: form-data; name=\"" + escapeQuoted(part.name) + "\"";
        if (!part.fileName.empty()) {
            body += "; filename=\"" + escapeQuoted(part.fileName) + "\"";
        }
        body += CRLF;
        if (!part.contentType.empty()) {
            body += "Content-Type: " + part.contentType + CRLF;
        }
        body += CRLF;
        body += part.data;
        body += CRLF;
    }
    body += "--" + boundary + "--" + CRLF;
    return body;
}

//=============================================================================
// Parsing
//=============================================================================

bool Multipart::parse(const std::string& body, const std::string& boundary,
                      std::vector<MultipartPart>& parts, std::string& errorMsg) {
    parts.clear();
    if (boundary.empty()) {
        errorMsg = "Missing multipart boundary";
        return false;
    }

    const std::string delimiter = "--" + boundary;
    const std::string nextDelimiter = std::string(CRLF) + delimiter;

    size_t pos = 0;
    if (body.compare(0, delimiter.size(), delimiter) != 0) {
        // Skip the preamble
        pos = findDelimiter(body, nextDelimiter, 0);
        if (pos == std::string::npos) {
            errorMsg = "Multipart boundary not found";
            return false;
        }
        pos += 2;
    }

    while (true) {
        pos += delimiter.size();
        if (body.compare(pos, 2, "--") == 0) {
            return true;  // close delimiter
        }

        // Transport padding, then CRLF
        while (pos < body.size() && (body[pos] == ' ' || body[pos] == '\t')) {
            ++pos;
        }
        if (body.compare(pos, 2, CRLF) != 0) {
            errorMsg = "Malformed multipart delimiter line";
            return false;
        }
        pos += 2;

        const size_t headersEnd = body.find("\r\n\r\n", pos);
        const bool noHeaders = body.compare(pos, 2, CRLF) == 0;
        if (headersEnd == std::string::npos && !noHeaders) {
            errorMsg = "Unterminated multipart headers";
            return false;
        }

        MultipartPart part;
        size_t dataStart = pos + 2;
        if (!noHeaders) {
            size_t lineStart = pos;
            while (lineStart < headersEnd) {
                size_t lineEnd = body.find(CRLF, lineStart);
                if (lineEnd == std::string::npos || lineEnd > headersEnd) {
                    lineEnd = headersEnd;
                }
                const std::string line = body.substr(lineStart, lineEnd - lineStart);
                const size_t colon = line.find(':');
                if (colon != std::string::npos) {
                    const std::string key = toLower(trim(line.substr(0, colon)));
                    const std::string value = trim(line.substr(colon + 1));
                    if (key == "content-disposition") {
                        part.name = headerParameter(value, "name");
                        part.fileName = headerParameter(value, "filename");
                    } else if (key == "content-type") {
                        part.contentType = value;
                    }
                }
                lineStart = lineEnd + 2;
            }
            dataStart = headersEnd + 4;
        }

        const size_t dataEnd = findDelimiter(body, nextDelimiter, dataStart);
        if (dataEnd == std::string::npos) {
            errorMsg = "Unterminated multipart part '" + part.name + "'";
            return false;
        }

        part.data = body.substr(dataStart, dataEnd - dataStart);
        parts.push_back(std::move(part));
        pos = dataEnd + 2;
    }
}

const MultipartPart* Multipart::find(const std::vector<MultipartPart>& parts, const std::string& name) {
    auto it = std::find_if(parts.begin(), parts.end(),
                           [&name](const MultipartPart& part) { return part.name == name; });
    return it == parts.end() ? nullptr : &*it;
}

}  // namespace LanDrop
