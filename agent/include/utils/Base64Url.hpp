#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace ctrlhost::utils {

/**
 * @brief Base64 URL-safe кодирование без padding ('=' не добавляется)
 *
 * Алфавит: A-Z a-z 0-9 '-' '_'. 32 байта → 43 символа.
 */
inline std::string base64UrlEncode(const uint8_t* data, std::size_t size) {
    static const char* chars =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
    std::string result;
    result.reserve((size * 4 + 2) / 3);

    uint32_t val = 0;
    int valb = -6;
    for (std::size_t i = 0; i < size; ++i) {
        val = ((val << 8) | data[i]) & 0xFFFFFFu;
        valb += 8;
        while (valb >= 0) {
            result.push_back(chars[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) {
        result.push_back(chars[((val << 8) >> (valb + 8)) & 0x3F]);
    }
    return result;
}

/**
 * @brief Проверить, что строка состоит только из символов base64url
 */
inline bool isBase64Url(const std::string& text) {
    for (unsigned char c : text) {
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z')
               || (c >= '0' && c <= '9') || c == '-' || c == '_';
        if (!ok) return false;
    }
    return true;
}

} // namespace ctrlhost::utils
