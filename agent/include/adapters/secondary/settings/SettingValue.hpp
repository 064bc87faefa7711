#pragma once

#include <IEnvironment.hpp>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace ctrlhost::adapters::secondary {

/**
 * @brief Чтение целочисленного ключа из IEnvironment с нижней границей
 *
 * Значение ниже minimum заменяется на fallback. Предупреждение
 * выводится один раз на ключ, чтобы чтение на каждом запросе
 * не засоряло вывод.
 */
class SettingValue {
public:
    SettingValue(std::shared_ptr<IEnvironment> env, std::string owner)
        : env_(std::move(env))
        , owner_(std::move(owner))
    {}

    int atLeast(const std::string& key, int fallback, int minimum) const {
        int value = env_->get<int>(key, fallback);
        if (value < minimum) {
            warnOnce(key, std::to_string(value) + " is below " + std::to_string(minimum)
                          + ", using " + std::to_string(fallback));
            return fallback;
        }
        return value;
    }

    std::string text(const std::string& key, const std::string& fallback) const {
        return env_->get<std::string>(key, fallback);
    }

    void warnOnce(const std::string& key, const std::string& message) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (warned_.insert(key).second) {
            std::cerr << "[" << owner_ << "] " << key << ": " << message << std::endl;
        }
    }

private:
    std::shared_ptr<IEnvironment> env_;
    std::string owner_;
    mutable std::mutex mutex_;
    mutable std::set<std::string> warned_;
};

} // namespace ctrlhost::adapters::secondary
