#pragma once

#include "ports/output/ISecuritySettings.hpp"
#include "adapters/secondary/settings/SettingValue.hpp"
#include <IEnvironment.hpp>
#include <memory>
#include <stdexcept>
#include <string>

namespace ctrlhost::adapters::secondary {

/**
 * @brief Реализация ISecuritySettings, получает данные из IEnvironment
 *
 * Ключи в config.json / Environment:
 * - security.api_key                      (default: "" - проверка отключена)
 * - security.sweep_interval_seconds       (default: 60, 0 - без фоновой очистки)
 * - security.rate_limit.max_failures      (default: 5)
 * - security.rate_limit.window_seconds    (default: 60)
 * - security.revocation.policy            (default: "time_based" | "bounded_reset")
 * - security.revocation.max_entries       (default: 1000)
 * - security.revocation.retention_seconds (default: 86400)
 *
 * Пример config.json:
 * {
 *   "security.api_key": "change-me",
 *   "security.revocation.policy": "bounded_reset"
 * }
 */
class SecuritySettings : public ports::output::ISecuritySettings {
public:
    static constexpr int DEFAULT_SWEEP_INTERVAL_SECONDS = 60;
    static constexpr int DEFAULT_MAX_FAILURES = 5;
    static constexpr int DEFAULT_FAILURE_WINDOW_SECONDS = 60;
    static constexpr int DEFAULT_MAX_REVOCATION_ENTRIES = 1000;
    static constexpr int DEFAULT_RETENTION_SECONDS = 86400;

    explicit SecuritySettings(std::shared_ptr<IEnvironment> env)
        : values_(std::move(env), "SecuritySettings")
    {
    }

    std::string getApiKey() const override {
        return values_.text("security.api_key", "");
    }

    int getSweepIntervalSeconds() const override {
        return values_.atLeast("security.sweep_interval_seconds", DEFAULT_SWEEP_INTERVAL_SECONDS, 0);
    }

    int getMaxFailuresPerWindow() const override {
        return values_.atLeast("security.rate_limit.max_failures", DEFAULT_MAX_FAILURES, 1);
    }

    int getFailureWindowSeconds() const override {
        return values_.atLeast("security.rate_limit.window_seconds", DEFAULT_FAILURE_WINDOW_SECONDS, 1);
    }

    domain::RevocationPolicy getRevocationPolicy() const override {
        std::string name = values_.text("security.revocation.policy", "time_based");
        try {
            return domain::revocationPolicyFromString(name);
        } catch (const std::invalid_argument& e) {
            values_.warnOnce("security.revocation.policy", std::string(e.what()) + ", using time_based");
            return domain::RevocationPolicy::TIME_BASED;
        }
    }

    std::size_t getMaxRevocationEntries() const override {
        return static_cast<std::size_t>(values_.atLeast(
            "security.revocation.max_entries", DEFAULT_MAX_REVOCATION_ENTRIES, 1));
    }

    int getRevocationRetentionSeconds() const override {
        return values_.atLeast("security.revocation.retention_seconds", DEFAULT_RETENTION_SECONDS, 1);
    }

private:
    SettingValue values_;
};

} // namespace ctrlhost::adapters::secondary
