#pragma once

#include "domain/Timestamp.hpp"
#include <chrono>
#include <cstddef>
#include <string>
#include <unordered_map>

namespace ctrlhost::application {

/**
 * @brief Окно неудач для одного ключа
 */
struct FailureWindow {
    int count = 0;
    domain::Timestamp windowStart;
};

/**
 * @brief Счётчик неудачных попыток с фиксированным окном
 *
 * Ключ блокируется, когда в текущем окне набралось maxFailures неудач.
 * Окно начинается с первой неудачи и сбрасывается целиком, когда
 * с его начала прошло больше window.
 *
 * @warning Не потокобезопасен: живёт внутри TokenAuthority и защищается
 *          её мьютексом вместе с таблицей токенов.
 */
class RateLimiter {
public:
    RateLimiter(int maxFailures, std::chrono::milliseconds window)
        : maxFailures_(maxFailures)
        , window_(window)
    {}

    /**
     * @brief Заблокирован ли ключ на момент now
     *
     * Истёкшее окно удаляется сразу.
     */
    bool isLimited(const std::string& key, const domain::Timestamp& now) {
        auto it = windows_.find(key);
        if (it == windows_.end()) {
            return false;
        }

        if (now.since(it->second.windowStart) > window_) {
            windows_.erase(it);
            return false;
        }

        return it->second.count >= maxFailures_;
    }

    /**
     * @brief Учесть неудачу
     *
     * @return Количество неудач в текущем окне после учёта
     */
    int recordFailure(const std::string& key, const domain::Timestamp& now) {
        auto it = windows_.find(key);
        if (it == windows_.end() || now.since(it->second.windowStart) > window_) {
            windows_[key] = FailureWindow{1, now};
            return 1;
        }

        return ++it->second.count;
    }

    /**
     * @brief Удалить окна, которые уже истекли
     *
     * @return Количество удалённых окон
     */
    std::size_t prune(const domain::Timestamp& now) {
        std::size_t removed = 0;
        for (auto it = windows_.begin(); it != windows_.end();) {
            if (now.since(it->second.windowStart) > window_) {
                it = windows_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    /**
     * @brief Неудач в текущем окне (0 если окна нет)
     */
    int failureCount(const std::string& key) const {
        auto it = windows_.find(key);
        return it == windows_.end() ? 0 : it->second.count;
    }

    std::size_t trackedKeys() const { return windows_.size(); }

    int maxFailures() const { return maxFailures_; }
    std::chrono::milliseconds window() const { return window_; }

private:
    int maxFailures_;
    std::chrono::milliseconds window_;
    std::unordered_map<std::string, FailureWindow> windows_;
};

} // namespace ctrlhost::application
