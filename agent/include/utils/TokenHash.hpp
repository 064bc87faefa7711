#pragma once

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>
#include <string>

namespace ctrlhost::utils {

/**
 * @brief Ключ rate limiter'а: hex SHA-256 от полного значения токена
 *
 * Хэшируется весь токен, а не префикс: токены с общим началом не должны
 * делить одно окно неудач.
 */
inline std::string rateLimitKey(const std::string& token) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(token.data()), token.size(), hash);

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        ss << std::setw(2) << static_cast<int>(hash[i]);
    }
    return ss.str();
}

/**
 * @brief Короткий отпечаток ключа для журнала (первые 12 hex-символов)
 */
inline std::string keyFingerprint(const std::string& key) {
    return key.substr(0, 12);
}

} // namespace ctrlhost::utils
