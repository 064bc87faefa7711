#pragma once

#include <string>

namespace ctrlhost::domain {

/**
 * @brief Тип события безопасности для журнала
 */
enum class SecurityEventType {
    TOKEN_ISSUED,
    VALIDATION_FAILED,
    RATE_LIMITED,
    TOKEN_REVOKED,
    CLEANUP,
    SESSION_STARTED,
    SESSION_ENDED,
    CAPACITY_REJECTED,
    CONNECTION_REJECTED
};

inline std::string toString(SecurityEventType type) {
    switch (type) {
        case SecurityEventType::TOKEN_ISSUED:        return "token.issued";
        case SecurityEventType::VALIDATION_FAILED:   return "token.validation_failed";
        case SecurityEventType::RATE_LIMITED:        return "token.rate_limited";
        case SecurityEventType::TOKEN_REVOKED:       return "token.revoked";
        case SecurityEventType::CLEANUP:             return "cleanup";
        case SecurityEventType::SESSION_STARTED:     return "session.started";
        case SecurityEventType::SESSION_ENDED:       return "session.ended";
        case SecurityEventType::CAPACITY_REJECTED:   return "session.capacity_rejected";
        case SecurityEventType::CONNECTION_REJECTED: return "connection.rejected";
    }
    return "unknown";
}

} // namespace ctrlhost::domain
