#pragma once

#include "domain/Timestamp.hpp"
#include <string>

namespace ctrlhost::domain {

/**
 * @brief Capability token - непрозрачный bearer-токен сессии управления
 *
 * Значение - 32 байта из криптографического ГСЧ в base64url без padding
 * (43 символа). Никакой информации внутри токена нет: всё, что известно
 * о нём, хранит TokenAuthority.
 */
struct CapabilityToken {
    std::string value;          ///< Значение токена (ключ в таблице активных)
    std::string ownerTag;       ///< Тег владельца (свободный текст, например installation id)
    Timestamp issuedAt;         ///< Время выдачи
    Timestamp expiresAt;        ///< Время истечения

    CapabilityToken() = default;

    CapabilityToken(std::string value,
                    std::string ownerTag,
                    Timestamp issuedAt,
                    Timestamp expiresAt)
        : value(std::move(value))
        , ownerTag(std::move(ownerTag))
        , issuedAt(issuedAt)
        , expiresAt(expiresAt)
    {}

    /**
     * @brief Истёк ли токен к моменту now
     *
     * Граница включительная: при expiresAt == now токен уже недействителен.
     */
    bool isExpiredAt(const Timestamp& now) const {
        return expiresAt <= now;
    }
};

} // namespace ctrlhost::domain
