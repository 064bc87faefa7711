#pragma once

#include "domain/enums/ValidationOutcome.hpp"
#include <cstdint>

namespace ctrlhost::domain {

/**
 * @brief Счётчики исходов валидации токенов (снимок)
 */
struct ValidationStats {
    uint64_t succeeded = 0;
    uint64_t notFound = 0;
    uint64_t expired = 0;
    uint64_t revoked = 0;
    uint64_t rateLimited = 0;

    void record(ValidationOutcome outcome) {
        switch (outcome) {
            case ValidationOutcome::VALID:        ++succeeded; break;
            case ValidationOutcome::NOT_FOUND:    ++notFound; break;
            case ValidationOutcome::EXPIRED:      ++expired; break;
            case ValidationOutcome::REVOKED:      ++revoked; break;
            case ValidationOutcome::RATE_LIMITED: ++rateLimited; break;
        }
    }

    uint64_t failed() const {
        return notFound + expired + revoked + rateLimited;
    }
};

} // namespace ctrlhost::domain
