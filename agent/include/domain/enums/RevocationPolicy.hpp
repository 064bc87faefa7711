#pragma once

#include <string>
#include <stdexcept>

namespace ctrlhost::domain {

/**
 * @brief Политика сборки мусора в списке отозванных токенов
 *
 * BOUNDED_RESET - при превышении лимита записей список очищается целиком.
 * Так работал исходный агент. Риск: отозванный токен с длинным TTL
 * может выпасть из списка раньше, чем истечёт.
 *
 * TIME_BASED - запись удаляется, когда истёк сам токен или прошло
 * retention с момента отзыва. Используется по умолчанию.
 */
enum class RevocationPolicy {
    BOUNDED_RESET,
    TIME_BASED
};

inline std::string toString(RevocationPolicy policy) {
    switch (policy) {
        case RevocationPolicy::BOUNDED_RESET: return "bounded_reset";
        case RevocationPolicy::TIME_BASED:    return "time_based";
    }
    return "unknown";
}

/**
 * @brief Создать RevocationPolicy из строки
 *
 * @param str "bounded_reset" или "time_based"
 * @throws std::invalid_argument если строка не распознана
 */
inline RevocationPolicy revocationPolicyFromString(const std::string& str) {
    if (str == "bounded_reset") return RevocationPolicy::BOUNDED_RESET;
    if (str == "time_based")    return RevocationPolicy::TIME_BASED;
    throw std::invalid_argument("Unknown RevocationPolicy: " + str);
}

} // namespace ctrlhost::domain
