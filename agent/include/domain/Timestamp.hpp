#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace ctrlhost::domain {

/**
 * @brief Временная метка с миллисекундной точностью
 *
 * Обёртка над system_clock::time_point. Текущее время берётся только
 * через IClock - сама структура часы не читает, чтобы тесты могли
 * управлять временем.
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() = default;

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    /**
     * @brief Преобразовать в ISO 8601 строку (UTC, с миллисекундами)
     *
     * Формат: "2026-10-19T10:30:00.250Z"
     */
    std::string toString() const {
        auto timeT = std::chrono::system_clock::to_time_t(value);
        std::tm tm{};
        gmtime_r(&timeT, &tm);

        auto millis = toUnixMillis() % 1000;
        if (millis < 0) millis += 1000;

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
        return ss.str();
    }

    /**
     * @brief Unix timestamp в секундах
     */
    int64_t toUnixSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            value.time_since_epoch()
        ).count();
    }

    /**
     * @brief Unix timestamp в миллисекундах
     */
    int64_t toUnixMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            value.time_since_epoch()
        ).count();
    }

    static Timestamp fromUnixSeconds(int64_t seconds) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::seconds(seconds)
        ));
    }

    static Timestamp fromUnixMillis(int64_t millis) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::milliseconds(millis))
        ));
    }

    /**
     * @brief Сдвинуть метку на произвольную длительность
     */
    template <typename Rep, typename Period>
    Timestamp plus(std::chrono::duration<Rep, Period> delta) const {
        return Timestamp(value + std::chrono::duration_cast<
            std::chrono::system_clock::duration>(delta));
    }

    Timestamp addSeconds(int64_t seconds) const {
        return plus(std::chrono::seconds(seconds));
    }

    Timestamp addMilliseconds(int64_t millis) const {
        return plus(std::chrono::milliseconds(millis));
    }

    /**
     * @brief Длительность от other до this (может быть отрицательной)
     */
    std::chrono::milliseconds since(const Timestamp& other) const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(value - other.value);
    }

    // Операторы сравнения
    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
};

} // namespace ctrlhost::domain
