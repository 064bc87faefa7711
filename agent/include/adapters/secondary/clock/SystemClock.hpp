#pragma once

#include "ports/output/IClock.hpp"
#include <chrono>

namespace ctrlhost::adapters::secondary {

/**
 * @brief IClock поверх std::chrono::system_clock
 */
class SystemClock : public ports::output::IClock {
public:
    domain::Timestamp now() const override {
        return domain::Timestamp(std::chrono::system_clock::now());
    }
};

} // namespace ctrlhost::adapters::secondary
