#pragma once

#include "domain/Timestamp.hpp"
#include "domain/enums/SessionState.hpp"
#include <string>

namespace ctrlhost::domain {

/**
 * @brief Сессия управления рабочим столом
 *
 * Связана 1:1 с capability token. Брокер хранит только значение токена,
 * жизненным циклом токена владеет TokenAuthority.
 */
struct DesktopSession {
    std::string sessionId;      ///< UUID v4
    std::string ownerTag;       ///< Тег владельца (совпадает с тегом токена)
    Timestamp createdAt;        ///< Время создания
    Timestamp expiresAt;        ///< Время истечения (совпадает с токеном)
    std::string token;          ///< Значение привязанного токена
    bool active = false;        ///< false только у снимка завершённой сессии

    /**
     * @brief Состояние строки реестра на момент now
     *
     * REVOKED брокер сам определить не может - об отзыве знает только
     * TokenAuthority.
     */
    SessionState stateAt(const Timestamp& now) const {
        if (!active) return SessionState::ENDED;
        if (expiresAt <= now) return SessionState::EXPIRED;
        return SessionState::ACTIVE;
    }

    bool isLiveAt(const Timestamp& now) const {
        return active && expiresAt > now;
    }

    /**
     * @brief Оставшееся время жизни в секундах (0 если истекла)
     */
    int64_t remainingSeconds(const Timestamp& now) const {
        if (expiresAt <= now) return 0;
        return std::chrono::duration_cast<std::chrono::seconds>(
            expiresAt.value - now.value).count();
    }
};

} // namespace ctrlhost::domain
