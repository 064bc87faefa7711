#pragma once

#include "ports/output/ISessionSettings.hpp"
#include "adapters/secondary/settings/SettingValue.hpp"
#include <IEnvironment.hpp>
#include <memory>

namespace ctrlhost::adapters::secondary {

/**
 * @brief Реализация ISessionSettings, получает данные из IEnvironment
 *
 * Ключи в config.json / Environment:
 * - sessions.max_sessions        (default: 1, min 1)
 * - sessions.default_ttl_seconds (default: 900)
 * - sessions.min_ttl_seconds     (default: 60)
 * - sessions.max_ttl_seconds     (default: 3600)
 *
 * Значения читаются при каждом вызове.
 */
class SessionSettings : public ports::output::ISessionSettings {
public:
    static constexpr int DEFAULT_MAX_SESSIONS = 1;
    static constexpr int DEFAULT_TTL_SECONDS = 900;
    static constexpr int DEFAULT_MIN_TTL_SECONDS = 60;
    static constexpr int DEFAULT_MAX_TTL_SECONDS = 3600;

    explicit SessionSettings(std::shared_ptr<IEnvironment> env)
        : values_(std::move(env), "SessionSettings")
    {
    }

    int getMaxSessions() const override {
        return values_.atLeast("sessions.max_sessions", DEFAULT_MAX_SESSIONS, 1);
    }

    int getDefaultTtlSeconds() const override {
        return values_.atLeast("sessions.default_ttl_seconds", DEFAULT_TTL_SECONDS, 1);
    }

    int getMinTtlSeconds() const override {
        return values_.atLeast("sessions.min_ttl_seconds", DEFAULT_MIN_TTL_SECONDS, 1);
    }

    int getMaxTtlSeconds() const override {
        int minTtl = getMinTtlSeconds();
        int maxTtl = values_.atLeast("sessions.max_ttl_seconds", DEFAULT_MAX_TTL_SECONDS, 1);
        if (maxTtl < minTtl) {
            values_.warnOnce("sessions.max_ttl_seconds", "lower than min_ttl_seconds, using min");
            return minTtl;
        }
        return maxTtl;
    }

private:
    SettingValue values_;
};

} // namespace ctrlhost::adapters::secondary
