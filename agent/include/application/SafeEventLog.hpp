#pragma once

#include "ports/output/IEventLogger.hpp"
#include "ports/output/IClock.hpp"
#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace ctrlhost::application {

/**
 * @brief Обёртка над IEventLogger, которая не пропускает исключения
 *
 * Вызывается в том числе под блокировками TokenAuthority и SessionBroker,
 * поэтому сбой журнала не должен ни менять результат операции, ни
 * оставлять состояние наполовину изменённым.
 */
class SafeEventLog {
public:
    SafeEventLog(std::shared_ptr<ports::output::IEventLogger> logger,
                 std::shared_ptr<ports::output::IClock> clock,
                 std::string component)
        : logger_(std::move(logger))
        , clock_(std::move(clock))
        , component_(std::move(component))
    {}

    /**
     * @brief Записать событие, заполнив component и время
     */
    void emit(domain::SecurityEvent event) const noexcept {
        if (!logger_) return;
        try {
            event.component = component_;
            event.at = clock_->now();
            logger_->log(event);
        } catch (const std::exception& e) {
            reportFailure(e.what());
        } catch (...) {
            reportFailure("unknown");
        }
    }

    void emit(domain::SecurityEventType type,
              domain::EventSeverity severity,
              const std::string& detail,
              const std::string& ownerTag = "",
              const std::string& sessionId = "",
              const std::string& keyFingerprint = "") const noexcept {
        try {
            domain::SecurityEvent event;
            event.type = type;
            event.severity = severity;
            event.detail = detail;
            event.ownerTag = ownerTag;
            event.sessionId = sessionId;
            event.keyFingerprint = keyFingerprint;
            emit(std::move(event));
        } catch (const std::exception& e) {
            reportFailure(e.what());
        } catch (...) {
            reportFailure("unknown");
        }
    }

private:
    std::shared_ptr<ports::output::IEventLogger> logger_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::string component_;

    void reportFailure(const char* what) const noexcept {
        std::cerr << "[" << component_ << "] Event logger failed: " << what << std::endl;
    }
};

} // namespace ctrlhost::application
