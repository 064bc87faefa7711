#pragma once

#include <stdexcept>
#include <string>

namespace ctrlhost::domain {

/**
 * @brief Превышен лимит одновременных сессий
 *
 * Штатная, восстановимая ситуация: клиент может повторить позже
 * или завершить другую сессию.
 */
class CapacityExceededException : public std::runtime_error {
public:
    explicit CapacityExceededException(int maxSessions)
        : std::runtime_error("Maximum sessions limit (" + std::to_string(maxSessions) + ") reached")
        , maxSessions_(maxSessions) {}

    int maxSessions() const { return maxSessions_; }

private:
    int maxSessions_;
};

} // namespace ctrlhost::domain
