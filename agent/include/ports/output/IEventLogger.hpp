#pragma once

#include "domain/SecurityEvent.hpp"

namespace ctrlhost::ports::output {

/**
 * @brief Приёмник структурированных событий безопасности
 *
 * Реализация может бросать исключения (переполнен диск, закрыт поток) -
 * вызывающий код обязан их гасить: сбой журнала не должен менять
 * результат операции. См. application::SafeEventLog.
 */
class IEventLogger {
public:
    virtual ~IEventLogger() = default;

    virtual void log(const domain::SecurityEvent& event) = 0;
};

} // namespace ctrlhost::ports::output
