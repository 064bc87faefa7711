#pragma once

#include "domain/enums/RevocationPolicy.hpp"
#include <cstddef>
#include <string>

namespace ctrlhost::ports::output {

/**
 * @brief Настройки TokenAuthority и REST-аутентификации
 *
 * Параметры rate limiter'а, sweep и политики отзыва TokenAuthority
 * читает один раз в конструкторе. API-ключ читается при каждом запросе.
 */
class ISecuritySettings {
public:
    virtual ~ISecuritySettings() = default;

    /// API-ключ для management endpoints (пустой - проверка отключена)
    virtual std::string getApiKey() const = 0;

    /// Период фонового sweep в секундах (0 - фоновый поток не запускается)
    virtual int getSweepIntervalSeconds() const = 0;

    /// Сколько неудачных валидаций допускается в одном окне
    virtual int getMaxFailuresPerWindow() const = 0;

    /// Длина окна rate limiter'а в секундах
    virtual int getFailureWindowSeconds() const = 0;

    virtual domain::RevocationPolicy getRevocationPolicy() const = 0;

    /// Лимит записей для BOUNDED_RESET
    virtual std::size_t getMaxRevocationEntries() const = 0;

    /// Сколько хранить запись об отзыве для TIME_BASED
    virtual int getRevocationRetentionSeconds() const = 0;
};

} // namespace ctrlhost::ports::output
