#pragma once

namespace ctrlhost::ports::output {

/**
 * @brief Настройки допуска сессий
 *
 * Значения читаются при каждом вызове: изменение конфигурации
 * применяется сразу, без перезапуска брокера.
 */
class ISessionSettings {
public:
    virtual ~ISessionSettings() = default;

    /// Максимум одновременных активных сессий (>= 1)
    virtual int getMaxSessions() const = 0;

    /// TTL сессии, если клиент его не указал
    virtual int getDefaultTtlSeconds() const = 0;

    /// Нижняя граница TTL, запрошенного клиентом
    virtual int getMinTtlSeconds() const = 0;

    /// Верхняя граница TTL, запрошенного клиентом
    virtual int getMaxTtlSeconds() const = 0;
};

} // namespace ctrlhost::ports::output
