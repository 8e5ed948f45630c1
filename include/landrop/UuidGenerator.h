/**
 * @file UuidGenerator.h
 * @brief Random RFC 4122 version 4 identifiers
 *
 * Transaction ids are minted by the receiving side; multipart boundaries
 * and temporary test directories reuse the same source.
 */

#pragma once

#include <cstdint>
#include <string>

#include <openssl/rand.h>

namespace LanDrop {

class UuidGenerator {
public:
    UuidGenerator() = delete;

    /**
     * @brief Lower-case 8-4-4-4-12 UUID v4 from the OpenSSL CSPRNG
     * @return Empty string if RAND_bytes failed
     */
    static std::string generate() {
        unsigned char raw[16];
        if (RAND_bytes(raw, sizeof(raw)) != 1) {
            return {};
        }
        raw[6] = static_cast<unsigned char>(0x40 | (raw[6] & 0x0F));
        raw[8] = static_cast<unsigned char>(0x80 | (raw[8] & 0x3F));

        static const char hexDigits[] = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (int i = 0; i < 16; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                out.push_back('-');
            }
            out.push_back(hexDigits[raw[i] >> 4]);
            out.push_back(hexDigits[raw[i] & 0x0F]);
        }
        return out;
    }

    /**
     * @brief True for strings shaped like generate() output
     */
    static bool isWellFormed(const std::string& id) {
        if (id.size() != 36) {
            return false;
        }
        for (size_t i = 0; i < id.size(); ++i) {
            const char c = id[i];
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (c != '-') {
                    return false;
                }
            } else if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F'))) {
                return false;
            }
        }
        return true;
    }
};

}  // namespace LanDrop
