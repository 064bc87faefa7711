#pragma once

#include "domain/DesktopSession.hpp"
#include "ports/output/IConnectionHandle.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ctrlhost::ports::input {

/**
 * @brief Session Broker - допуск и жизненный цикл сессий управления
 *
 * Типичный флоу транспорта:
 *   1. startSession() - сессия + токен (или CapacityExceededException)
 *   2. ITokenAuthority::validateToken() при открытии stream-соединения
 *   3. registerConnection() - брокер запоминает weak_ptr на handle
 *   4. endSession() - отзыв токена и cancel() живого соединения
 */
class ISessionBroker {
public:
    virtual ~ISessionBroker() = default;

    /**
     * @brief Открыть сессию
     *
     * Проверка лимита и вставка - одна критическая секция.
     *
     * @throws domain::CapacityExceededException если лимит достигнут
     * @throws domain::EntropyUnavailableException если токен не удалось выдать
     * @throws std::invalid_argument при пустом ownerTag или ttl <= 0
     */
    virtual domain::DesktopSession startSession(
        const std::string& ownerTag,
        std::chrono::milliseconds ttl
    ) = 0;

    /**
     * @brief Найти сессию (без фильтрации по истечению)
     */
    virtual std::optional<domain::DesktopSession> tryGetSession(
        const std::string& sessionId
    ) const = 0;

    /**
     * @brief Завершить сессию (идемпотентно)
     *
     * @return Снимок завершённой сессии или nullopt, если её не было
     */
    virtual std::optional<domain::DesktopSession> endSession(
        const std::string& sessionId
    ) = 0;

    /**
     * @brief Снимок неистёкших сессий с действующим токеном
     */
    virtual std::vector<domain::DesktopSession> getActiveSessions() const = 0;

    virtual std::size_t activeSessionCount() const = 0;

    // ========================================================================
    // СОЕДИНЕНИЯ ТРАНСПОРТА
    // ========================================================================

    /**
     * @brief Привязать handle живого соединения к сессии
     *
     * Брокер хранит только weak_ptr. Повторная регистрация заменяет
     * предыдущий handle.
     *
     * @return false если сессии нет
     */
    virtual bool registerConnection(
        const std::string& sessionId,
        std::weak_ptr<ports::output::IConnectionHandle> handle
    ) = 0;

    /**
     * @brief Отвязать handle
     *
     * Привязка удаляется, только если она всё ещё указывает на handle.
     * Сравнение по адресу: вызывается в том числе из деструктора handle.
     */
    virtual void unregisterConnection(
        const std::string& sessionId,
        const ports::output::IConnectionHandle* handle
    ) = 0;

    // ========================================================================
    // ОБСЛУЖИВАНИЕ
    // ========================================================================

    /**
     * @brief Удалить истёкшие строки реестра и строки с отозванным токеном
     *
     * Живые соединения не прерываются: TTL носит рекомендательный характер.
     *
     * @return Количество удалённых сессий
     */
    virtual std::size_t removeExpiredSessions() = 0;

    /**
     * @brief Остановить фоновую очистку (идемпотентно)
     */
    virtual void shutdown() = 0;
};

} // namespace ctrlhost::ports::input
