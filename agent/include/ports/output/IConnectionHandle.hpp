#pragma once

#include <string>

namespace ctrlhost::ports::output {

/**
 * @brief Handle живого соединения транспорта (desktop stream)
 *
 * Принадлежит транспорту. Брокер получает его через registerConnection()
 * в виде weak_ptr и только вызывает cancel() при EndSession - никогда
 * не создаёт и не продлевает ему жизнь.
 */
class IConnectionHandle {
public:
    virtual ~IConnectionHandle() = default;

    /**
     * @brief Попросить соединение завершиться
     *
     * Вызывается вне блокировок брокера. Должен быть быстрым и не бросать.
     */
    virtual void cancel(const std::string& reason) = 0;
};

} // namespace ctrlhost::ports::output
