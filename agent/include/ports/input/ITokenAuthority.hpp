#pragma once

#include "domain/CapabilityToken.hpp"
#include "domain/ValidationStats.hpp"
#include <chrono>
#include <cstddef>
#include <string>

namespace ctrlhost::ports::input {

/**
 * @brief Результат валидации токена для транспорта
 *
 * Причина отказа намеренно отсутствует - она пишется только в журнал.
 */
struct TokenValidation {
    bool valid = false;
    std::string ownerTag;       ///< Заполнен только при valid == true
};

/**
 * @brief Итог одного прохода sweep
 */
struct SweepReport {
    std::size_t expiredTokens = 0;          ///< Удалено истёкших токенов
    std::size_t revocationsDropped = 0;     ///< Удалено записей об отзыве
    std::size_t failureWindowsPruned = 0;   ///< Удалено истёкших окон rate limiter'а

    bool empty() const {
        return expiredTokens == 0 && revocationsDropped == 0 && failureWindowsPruned == 0;
    }
};

/**
 * @brief Token Authority - владелец пространства capability-токенов
 *
 * Выдача, валидация, отзыв, фоновая очистка и защита от перебора.
 * Таблица активных токенов, список отозванных и таблица неудач
 * rate limiter'а меняются под одной эксклюзивной блокировкой.
 *
 * TokenAuthority никогда не вызывает SessionBroker: зависимость
 * строго односторонняя.
 */
class ITokenAuthority {
public:
    virtual ~ITokenAuthority() = default;

    /**
     * @brief Выдать новый токен
     *
     * @param ownerTag Тег владельца (не пустой)
     * @param ttl Время жизни (> 0)
     * @throws domain::EntropyUnavailableException если ГСЧ недоступен
     * @throws std::invalid_argument при пустом ownerTag или ttl <= 0
     */
    virtual domain::CapabilityToken issueToken(
        const std::string& ownerTag,
        std::chrono::milliseconds ttl
    ) = 0;

    /**
     * @brief Проверить токен
     *
     * Порядок: отзыв → rate limit → поиск/истечение. Никогда не бросает
     * исключений из-за плохого токена.
     */
    virtual TokenValidation validateToken(const std::string& token) = 0;

    /**
     * @brief Отозвать токен (идемпотентно)
     */
    virtual void revokeToken(const std::string& token) = 0;

    /**
     * @brief Один проход очистки (его же выполняет фоновый поток)
     */
    virtual SweepReport sweep() = 0;

    virtual std::size_t activeTokenCount() const = 0;
    virtual std::size_t revokedTokenCount() const = 0;
    virtual bool isRevoked(const std::string& token) const = 0;

    /**
     * @brief Токен есть в таблице активных и ещё не истёк
     *
     * В отличие от validateToken не трогает rate limiter и статистику.
     * Отозванный токен активным не бывает, даже если запись о его отзыве
     * уже вытеснена из списка отозванных.
     */
    virtual bool isActive(const std::string& token) const = 0;
    virtual domain::ValidationStats getStats() const = 0;

    /**
     * @brief Остановить фоновый sweep (идемпотентно)
     */
    virtual void shutdown() = 0;
};

} // namespace ctrlhost::ports::input
