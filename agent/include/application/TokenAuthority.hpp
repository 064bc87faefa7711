#pragma once

#include "ports/input/ITokenAuthority.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IEntropySource.hpp"
#include "ports/output/IEventLogger.hpp"
#include "ports/output/ISecuritySettings.hpp"
#include "domain/exceptions/EntropyUnavailableException.hpp"
#include "domain/enums/ValidationOutcome.hpp"
#include "domain/enums/RevocationPolicy.hpp"
#include "application/RateLimiter.hpp"
#include "application/PeriodicSweeper.hpp"
#include "application/SafeEventLog.hpp"
#include "utils/Base64Url.hpp"
#include "utils/TokenHash.hpp"
#include <algorithm>
#include <array>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace ctrlhost::application {

/**
 * @brief Запись в списке отозванных токенов
 */
struct RevocationEntry {
    domain::Timestamp revokedAt;
    std::optional<domain::Timestamp> tokenExpiresAt;   ///< Известно, если токен был активен
};

/**
 * @brief Реализация ITokenAuthority
 *
 * Таблица активных токенов, список отозванных, окна rate limiter'а
 * и счётчики ValidationStats защищены одним мьютексом.
 *
 * Фоновый sweep запускается в конструкторе
 * (security.sweep_interval_seconds, 0 - не запускать) и
 * останавливается в shutdown() или деструкторе.
 */
class TokenAuthority : public ports::input::ITokenAuthority {
public:
    static constexpr std::size_t TOKEN_BYTES = 32;
    static constexpr int MAX_ISSUE_ATTEMPTS = 8;

    TokenAuthority(
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::output::IEntropySource> entropy,
        std::shared_ptr<ports::output::IEventLogger> logger,
        std::shared_ptr<ports::output::ISecuritySettings> settings
    )
        : clock_(std::move(clock))
        , entropy_(std::move(entropy))
        , events_(std::move(logger), clock_, "TokenAuthority")
        , policy_(settings->getRevocationPolicy())
        , maxRevocationEntries_(settings->getMaxRevocationEntries())
        , revocationRetention_(std::chrono::seconds(settings->getRevocationRetentionSeconds()))
        , rateLimiter_(settings->getMaxFailuresPerWindow(),
                       std::chrono::seconds(settings->getFailureWindowSeconds()))
        , sweeper_("TokenAuthority", [this]() { sweep(); })
    {
        int interval = settings->getSweepIntervalSeconds();
        if (interval > 0) {
            sweeper_.start(std::chrono::seconds(interval));
        }

        std::cout << "[TokenAuthority] Created (revocation policy: " << domain::toString(policy_)
                  << ", sweep every " << interval << "s)" << std::endl;
    }

    ~TokenAuthority() override {
        shutdown();
    }

    // ========================================================================
    // ITokenAuthority
    // ========================================================================

    domain::CapabilityToken issueToken(
        const std::string& ownerTag,
        std::chrono::milliseconds ttl
    ) override {
        if (ownerTag.empty()) {
            throw std::invalid_argument("Owner tag is required");
        }
        if (ttl.count() <= 0) {
            throw std::invalid_argument("Token TTL must be positive");
        }

        for (int attempt = 0; attempt < MAX_ISSUE_ATTEMPTS; ++attempt) {
            // ГСЧ вызывается вне блокировки, коллизия проверяется под ней
            std::string value = generateValue();

            std::lock_guard<std::mutex> lock(mutex_);
            if (active_.count(value) > 0 || revoked_.count(value) > 0) {
                continue;
            }

            auto now = clock_->now();
            domain::CapabilityToken token(value, ownerTag, now, now.plus(ttl));
            active_.emplace(value, token);

            events_.emit(domain::SecurityEventType::TOKEN_ISSUED,
                         domain::EventSeverity::INFO,
                         "Token issued, expires at " + token.expiresAt.toString(),
                         ownerTag, "", fingerprintOf(value));
            return token;
        }

        throw domain::EntropyUnavailableException(
            "Entropy source keeps producing colliding token values");
    }

    ports::input::TokenValidation validateToken(const std::string& token) override {
        std::string key = utils::rateLimitKey(token);

        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_->now();

        if (revoked_.count(token) > 0) {
            return reject(domain::ValidationOutcome::REVOKED, key, now);
        }

        if (rateLimiter_.isLimited(key, now)) {
            return reject(domain::ValidationOutcome::RATE_LIMITED, key, now);
        }

        auto it = active_.find(token);
        if (it == active_.end()) {
            return reject(domain::ValidationOutcome::NOT_FOUND, key, now);
        }

        if (it->second.isExpiredAt(now)) {
            active_.erase(it);
            return reject(domain::ValidationOutcome::EXPIRED, key, now);
        }

        stats_.record(domain::ValidationOutcome::VALID);

        ports::input::TokenValidation result;
        result.valid = true;
        result.ownerTag = it->second.ownerTag;
        return result;
    }

    void revokeToken(const std::string& token) override {
        if (token.empty()) {
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_->now();

        std::string ownerTag;
        std::optional<domain::Timestamp> expiresAt;

        auto it = active_.find(token);
        if (it != active_.end()) {
            ownerTag = it->second.ownerTag;
            expiresAt = it->second.expiresAt;
            active_.erase(it);
        }

        auto& entry = revoked_[token];
        entry.revokedAt = now;
        if (expiresAt) {
            entry.tokenExpiresAt = expiresAt;
        }

        events_.emit(domain::SecurityEventType::TOKEN_REVOKED,
                     domain::EventSeverity::INFO,
                     ownerTag.empty() ? "Token revoked (owner unknown)" : "Token revoked",
                     ownerTag, "", fingerprintOf(token));
    }

    ports::input::SweepReport sweep() override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_->now();

        ports::input::SweepReport report;

        for (auto it = active_.begin(); it != active_.end();) {
            if (it->second.isExpiredAt(now)) {
                report.revocationsDropped += revoked_.erase(it->first);
                it = active_.erase(it);
                ++report.expiredTokens;
            } else {
                ++it;
            }
        }

        report.failureWindowsPruned = rateLimiter_.prune(now);
        report.revocationsDropped += collectRevocations(now);

        if (!report.empty()) {
            events_.emit(domain::SecurityEventType::CLEANUP,
                         domain::EventSeverity::DEBUG,
                         "expired_tokens=" + std::to_string(report.expiredTokens)
                         + " revocations_dropped=" + std::to_string(report.revocationsDropped)
                         + " failure_windows_pruned=" + std::to_string(report.failureWindowsPruned));
        }

        return report;
    }

    std::size_t activeTokenCount() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_.size();
    }

    std::size_t revokedTokenCount() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return revoked_.size();
    }

    bool isRevoked(const std::string& token) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return revoked_.count(token) > 0;
    }

    bool isActive(const std::string& token) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(token);
        return it != active_.end() && !it->second.isExpiredAt(clock_->now());
    }

    domain::ValidationStats getStats() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

    void shutdown() override {
        if (sweeper_.isRunning()) {
            sweeper_.stop();
            std::cout << "[TokenAuthority] Sweeper stopped" << std::endl;
        }
    }

    // ========================================================================
    // ДИАГНОСТИКА
    // ========================================================================

    /**
     * @brief Неудач в текущем окне rate limiter'а для токена
     */
    int failureCount(const std::string& token) const {
        std::string key = utils::rateLimitKey(token);
        std::lock_guard<std::mutex> lock(mutex_);
        return rateLimiter_.failureCount(key);
    }

    domain::RevocationPolicy revocationPolicy() const { return policy_; }

    bool isSweeperRunning() const { return sweeper_.isRunning(); }

private:
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::output::IEntropySource> entropy_;
    SafeEventLog events_;

    domain::RevocationPolicy policy_;
    std::size_t maxRevocationEntries_;
    std::chrono::milliseconds revocationRetention_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, domain::CapabilityToken> active_;
    std::unordered_map<std::string, RevocationEntry> revoked_;
    RateLimiter rateLimiter_;
    domain::ValidationStats stats_;

    PeriodicSweeper sweeper_;

    std::string generateValue() {
        std::array<uint8_t, TOKEN_BYTES> bytes{};
        entropy_->fill(bytes.data(), bytes.size());
        return utils::base64UrlEncode(bytes.data(), bytes.size());
    }

    static std::string fingerprintOf(const std::string& token) {
        return utils::keyFingerprint(utils::rateLimitKey(token));
    }

    /**
     * @brief Учесть отказ (вызывается под mutex_)
     *
     * Неудача записывается в окно только для NOT_FOUND и EXPIRED:
     * отозванный токен и уже заблокированный ключ окно не продлевают.
     */
    ports::input::TokenValidation reject(
        domain::ValidationOutcome outcome,
        const std::string& key,
        const domain::Timestamp& now
    ) {
        stats_.record(outcome);
        std::string fingerprint = utils::keyFingerprint(key);

        if (outcome == domain::ValidationOutcome::RATE_LIMITED) {
            events_.emit(domain::SecurityEventType::RATE_LIMITED,
                         domain::EventSeverity::WARN,
                         "Too many failed validations for key",
                         "", "", fingerprint);
            return {};
        }

        std::string detail = "reason=" + domain::toString(outcome);
        if (outcome == domain::ValidationOutcome::NOT_FOUND
            || outcome == domain::ValidationOutcome::EXPIRED) {
            int failures = rateLimiter_.recordFailure(key, now);
            detail += " failures=" + std::to_string(failures);
        }

        events_.emit(domain::SecurityEventType::VALIDATION_FAILED,
                     domain::EventSeverity::WARN,
                     detail, "", "", fingerprint);
        return {};
    }

    /**
     * @brief Сборка мусора в списке отозванных (вызывается под mutex_)
     */
    std::size_t collectRevocations(const domain::Timestamp& now) {
        if (policy_ == domain::RevocationPolicy::BOUNDED_RESET) {
            if (revoked_.size() <= maxRevocationEntries_) {
                return 0;
            }
            std::size_t dropped = revoked_.size();
            revoked_.clear();
            return dropped;
        }

        std::size_t dropped = 0;
        for (auto it = revoked_.begin(); it != revoked_.end();) {
            const auto& entry = it->second;
            bool tokenExpired = entry.tokenExpiresAt && *entry.tokenExpiresAt <= now;
            bool retentionElapsed = now.since(entry.revokedAt) > revocationRetention_;
            if (tokenExpired || retentionElapsed) {
                it = revoked_.erase(it);
                ++dropped;
            } else {
                ++it;
            }
        }
        return dropped + trimRevocations();
    }

    /**
     * @brief Ограничить список отозванных сверху maxRevocationEntries_
     *
     * Первыми вытесняются записи без известного срока токена (отзыв
     * неизвестной строки), внутри группы - самые старые по revokedAt.
     * Вытесненный токен уже удалён из active_, поэтому валидацию
     * он не проходит и без записи. Вызывается под mutex_.
     */
    std::size_t trimRevocations() {
        if (revoked_.size() <= maxRevocationEntries_) {
            return 0;
        }

        using Slot = std::unordered_map<std::string, RevocationEntry>::const_iterator;
        std::vector<Slot> order;
        order.reserve(revoked_.size());
        for (auto it = revoked_.cbegin(); it != revoked_.cend(); ++it) {
            order.push_back(it);
        }

        std::size_t excess = revoked_.size() - maxRevocationEntries_;
        std::partial_sort(order.begin(), order.begin() + excess, order.end(),
            [](const Slot& a, const Slot& b) {
                bool aKnown = a->second.tokenExpiresAt.has_value();
                bool bKnown = b->second.tokenExpiresAt.has_value();
                if (aKnown != bKnown) {
                    return !aKnown;
                }
                return a->second.revokedAt < b->second.revokedAt;
            });

        for (std::size_t i = 0; i < excess; ++i) {
            revoked_.erase(order[i]);
        }
        return excess;
    }
};

} // namespace ctrlhost::application
