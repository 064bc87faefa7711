#pragma once

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace ctrlhost::utils {

/**
 * @brief Генератор UUID v4 для идентификаторов сессий
 *
 * ID сессии не является секретом (секрет - токен), поэтому достаточно
 * mt19937_64 с засевом из random_device.
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class UuidGenerator {
public:
    /**
     * @brief Сгенерировать UUID v4
     *
     * Формат: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx, y ∈ [8, 9, a, b]
     */
    static std::string generate() {
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen(seed(rd));
        std::uniform_int_distribution<uint64_t> dist;

        uint64_t hi = dist(gen);
        uint64_t lo = dist(gen);

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        ss << std::setw(8) << ((hi >> 32) & 0xFFFFFFFFULL) << "-";
        ss << std::setw(4) << ((hi >> 16) & 0xFFFFULL) << "-";
        ss << std::setw(4) << ((hi & 0x0FFFULL) | 0x4000ULL) << "-";
        ss << std::setw(4) << (((lo >> 48) & 0x3FFFULL) | 0x8000ULL) << "-";
        ss << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
        return ss.str();
    }

private:
    static uint64_t seed(std::random_device& rd) {
        return (static_cast<uint64_t>(rd()) << 32) ^ rd();
    }
};

} // namespace ctrlhost::utils
