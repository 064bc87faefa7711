#pragma once

#include <string>

namespace ctrlhost::domain {

/**
 * @brief Внутренняя причина результата валидации токена
 *
 * Наружу не отдаётся: публичный результат - только valid/invalid,
 * чтобы атакующий не мог отличить «неверный токен» от «отозванного»
 * или «заблокированного rate limiter'ом». Используется для логов
 * и счётчиков ValidationStats.
 */
enum class ValidationOutcome {
    VALID,
    NOT_FOUND,
    EXPIRED,
    REVOKED,
    RATE_LIMITED
};

inline std::string toString(ValidationOutcome outcome) {
    switch (outcome) {
        case ValidationOutcome::VALID:        return "valid";
        case ValidationOutcome::NOT_FOUND:    return "not_found";
        case ValidationOutcome::EXPIRED:      return "expired";
        case ValidationOutcome::REVOKED:      return "revoked";
        case ValidationOutcome::RATE_LIMITED: return "rate_limited";
    }
    return "unknown";
}

} // namespace ctrlhost::domain
