#pragma once

#include <string>

namespace ctrlhost::domain {

/**
 * @brief Состояние сессии управления рабочим столом
 *
 * Переходы: CREATED → ACTIVE → {ENDED | EXPIRED | REVOKED}.
 * Терминальные состояния необратимы: новая сессия всегда получает
 * новый id и новый токен.
 */
enum class SessionState {
    CREATED,    ///< Строка создаётся (токен ещё не выдан)
    ACTIVE,     ///< Зарегистрирована, токен действителен
    ENDED,      ///< Завершена явно (EndSession)
    EXPIRED,    ///< Истёк TTL
    REVOKED     ///< Токен отозван независимо от сессии
};

inline std::string toString(SessionState state) {
    switch (state) {
        case SessionState::CREATED: return "created";
        case SessionState::ACTIVE:  return "active";
        case SessionState::ENDED:   return "ended";
        case SessionState::EXPIRED: return "expired";
        case SessionState::REVOKED: return "revoked";
    }
    return "unknown";
}

/**
 * @brief Терминальное ли состояние
 */
inline bool isTerminal(SessionState state) {
    return state == SessionState::ENDED
        || state == SessionState::EXPIRED
        || state == SessionState::REVOKED;
}

} // namespace ctrlhost::domain
