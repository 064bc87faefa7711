#pragma once

#include "domain/Timestamp.hpp"
#include "domain/enums/SecurityEventType.hpp"
#include <string>

namespace ctrlhost::domain {

enum class EventSeverity {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

inline std::string toString(EventSeverity severity) {
    switch (severity) {
        case EventSeverity::DEBUG: return "debug";
        case EventSeverity::INFO:  return "info";
        case EventSeverity::WARN:  return "warn";
        case EventSeverity::ERROR: return "error";
    }
    return "unknown";
}

/**
 * @brief Структурированное событие безопасности
 *
 * Значение токена в событие никогда не попадает - только keyFingerprint
 * (первые 12 hex-символов SHA-256 токена).
 */
struct SecurityEvent {
    SecurityEventType type = SecurityEventType::TOKEN_ISSUED;
    EventSeverity severity = EventSeverity::INFO;
    std::string component;          ///< Источник: "TokenAuthority", "SessionBroker", ...
    Timestamp at;                   ///< Время события (по IClock)
    std::string ownerTag;           ///< Тег владельца, если известен
    std::string sessionId;          ///< ID сессии, если известен
    std::string keyFingerprint;     ///< Отпечаток токена
    std::string detail;             ///< Человекочитаемое описание
};

} // namespace ctrlhost::domain
