#pragma once

#include "domain/Timestamp.hpp"

namespace ctrlhost::ports::output {

/**
 * @brief Источник текущего времени
 *
 * Все проверки истечения и окна rate limiter'а идут через этот порт.
 * Реализации:
 * - SystemClock - system_clock
 * - ManualClock (tests) - время двигается вручную
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual domain::Timestamp now() const = 0;
};

} // namespace ctrlhost::ports::output
