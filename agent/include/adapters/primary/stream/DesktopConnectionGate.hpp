#pragma once

#include "adapters/primary/stream/DesktopConnection.hpp"
#include "application/SafeEventLog.hpp"
#include "ports/input/ISessionBroker.hpp"
#include "ports/input/ITokenAuthority.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IEventLogger.hpp"
#include <iostream>
#include <memory>
#include <string>

namespace ctrlhost::adapters::primary {

enum class GateStatus {
    OK,
    INVALID_REQUEST,    ///< Нет sessionId или токена
    UNAUTHORIZED,       ///< Токен не прошёл валидацию
    SESSION_MISMATCH    ///< Сессии нет, она истекла или привязана к другому токену
};

inline std::string toString(GateStatus status) {
    switch (status) {
        case GateStatus::OK:               return "ok";
        case GateStatus::INVALID_REQUEST:  return "invalid_request";
        case GateStatus::UNAUTHORIZED:     return "unauthorized";
        case GateStatus::SESSION_MISMATCH: return "session_mismatch";
    }
    return "unknown";
}

struct GateResult {
    GateStatus status = GateStatus::INVALID_REQUEST;
    std::shared_ptr<DesktopConnection> connection;   ///< Только при OK

    bool ok() const { return status == GateStatus::OK; }
};

/**
 * @brief Допуск stream-соединения рабочего стола
 *
 * Порядок проверок:
 *   1. sessionId и токен не пустые
 *   2. ITokenAuthority::validateToken (учитывает отзыв и rate limit)
 *   3. сессия существует, не истекла и привязана к этому же токену
 *   4. handle соединения регистрируется в брокере
 *
 * Транспорт держит возвращённый shared_ptr всё время жизни соединения.
 */
class DesktopConnectionGate {
public:
    DesktopConnectionGate(
        std::shared_ptr<ports::input::ISessionBroker> broker,
        std::shared_ptr<ports::input::ITokenAuthority> authority,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::output::IEventLogger> logger
    ) : broker_(std::move(broker))
      , authority_(std::move(authority))
      , clock_(std::move(clock))
      , events_(std::move(logger), clock_, "DesktopConnectionGate")
    {
        std::cout << "[DesktopConnectionGate] Created" << std::endl;
    }

    GateResult open(const std::string& sessionId, const std::string& token) {
        if (sessionId.empty() || token.empty()) {
            return reject(GateStatus::INVALID_REQUEST, sessionId);
        }

        auto validation = authority_->validateToken(token);
        if (!validation.valid) {
            return reject(GateStatus::UNAUTHORIZED, sessionId);
        }

        auto session = broker_->tryGetSession(sessionId);
        if (!session || !session->isLiveAt(clock_->now()) || session->token != token) {
            return reject(GateStatus::SESSION_MISMATCH, sessionId);
        }

        auto connection = std::make_shared<DesktopConnection>(broker_, sessionId, session->ownerTag);
        if (!broker_->registerConnection(sessionId, connection)) {
            // Сессия завершилась между проверкой и регистрацией
            return reject(GateStatus::SESSION_MISMATCH, sessionId);
        }

        std::cout << "[DesktopConnectionGate] Connection opened for session " << sessionId << std::endl;

        GateResult result;
        result.status = GateStatus::OK;
        result.connection = std::move(connection);
        return result;
    }

private:
    std::shared_ptr<ports::input::ISessionBroker> broker_;
    std::shared_ptr<ports::input::ITokenAuthority> authority_;
    std::shared_ptr<ports::output::IClock> clock_;
    application::SafeEventLog events_;

    GateResult reject(GateStatus status, const std::string& sessionId) {
        events_.emit(domain::SecurityEventType::CONNECTION_REJECTED,
                     domain::EventSeverity::WARN,
                     "reason=" + toString(status),
                     "", sessionId);
        GateResult result;
        result.status = status;
        return result;
    }
};

} // namespace ctrlhost::adapters::primary
