#pragma once

#include "ports/input/ISessionBroker.hpp"
#include "ports/input/ITokenAuthority.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IEventLogger.hpp"
#include "ports/output/ISessionSettings.hpp"
#include "ports/output/ISecuritySettings.hpp"
#include "domain/exceptions/CapacityExceededException.hpp"
#include "application/PeriodicSweeper.hpp"
#include "application/SafeEventLog.hpp"
#include "utils/UuidGenerator.hpp"
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace ctrlhost::application {

/**
 * @brief Реализация ISessionBroker
 *
 * Реестр сессий и реестр соединений защищены одним мьютексом.
 * Под ним брокер может вызывать ITokenAuthority (issueToken, revokeToken,
 * isActive), обратного направления нет. cancel() у handle соединения вызывается
 * уже после освобождения мьютекса.
 *
 * Строка, чей токен отозван в обход EndSession, живой не считается:
 * она не занимает слот лимита и удаляется при очередной очистке.
 */
class SessionBroker : public ports::input::ISessionBroker {
public:
    SessionBroker(
        std::shared_ptr<ports::input::ITokenAuthority> authority,
        std::shared_ptr<ports::output::ISessionSettings> sessionSettings,
        std::shared_ptr<ports::output::ISecuritySettings> securitySettings,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::output::IEventLogger> logger
    )
        : authority_(std::move(authority))
        , settings_(std::move(sessionSettings))
        , clock_(std::move(clock))
        , events_(std::move(logger), clock_, "SessionBroker")
        , sweeper_("SessionBroker", [this]() { removeExpiredSessions(); })
    {
        int interval = securitySettings->getSweepIntervalSeconds();
        if (interval > 0) {
            sweeper_.start(std::chrono::seconds(interval));
        }

        std::cout << "[SessionBroker] Created" << std::endl;
    }

    ~SessionBroker() override {
        shutdown();
    }

    // ========================================================================
    // СЕССИИ
    // ========================================================================

    domain::DesktopSession startSession(
        const std::string& ownerTag,
        std::chrono::milliseconds ttl
    ) override {
        if (ownerTag.empty()) {
            throw std::invalid_argument("Owner tag is required");
        }
        if (ttl.count() <= 0) {
            throw std::invalid_argument("Session TTL must be positive");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_->now();

        int maxSessions = settings_->getMaxSessions();
        if (static_cast<int>(countLive(now)) >= maxSessions) {
            events_.emit(domain::SecurityEventType::CAPACITY_REJECTED,
                         domain::EventSeverity::WARN,
                         "Maximum sessions limit (" + std::to_string(maxSessions) + ") reached",
                         ownerTag);
            throw domain::CapacityExceededException(maxSessions);
        }

        std::string sessionId = utils::UuidGenerator::generate();
        while (sessions_.count(sessionId) > 0) {
            sessionId = utils::UuidGenerator::generate();
        }

        // Бросает EntropyUnavailableException: в этом случае строка не создаётся
        auto token = authority_->issueToken(ownerTag, ttl);

        domain::DesktopSession session;
        session.sessionId = sessionId;
        session.ownerTag = ownerTag;
        session.createdAt = token.issuedAt;
        session.expiresAt = token.expiresAt;
        session.token = token.value;
        session.active = true;

        sessions_.emplace(sessionId, session);

        events_.emit(domain::SecurityEventType::SESSION_STARTED,
                     domain::EventSeverity::INFO,
                     "Session started, expires at " + session.expiresAt.toString(),
                     ownerTag, sessionId);
        return session;
    }

    std::optional<domain::DesktopSession> tryGetSession(
        const std::string& sessionId
    ) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<domain::DesktopSession> endSession(const std::string& sessionId) override {
        std::shared_ptr<ports::output::IConnectionHandle> handle;
        domain::DesktopSession ended;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = sessions_.find(sessionId);
            if (it == sessions_.end()) {
                return std::nullopt;
            }

            ended = it->second;
            ended.active = false;
            sessions_.erase(it);

            authority_->revokeToken(ended.token);

            auto conn = connections_.find(sessionId);
            if (conn != connections_.end()) {
                handle = conn->second.handle.lock();
                connections_.erase(conn);
            }

            events_.emit(domain::SecurityEventType::SESSION_ENDED,
                         domain::EventSeverity::INFO,
                         handle ? "Session ended, cancelling live connection" : "Session ended",
                         ended.ownerTag, sessionId);
        }

        if (handle) {
            try {
                handle->cancel("session ended");
            } catch (const std::exception& e) {
                std::cerr << "[SessionBroker] Connection cancel failed for session "
                          << sessionId << ": " << e.what() << std::endl;
            }
        }

        return ended;
    }

    std::vector<domain::DesktopSession> getActiveSessions() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_->now();

        std::vector<domain::DesktopSession> result;
        for (const auto& [id, session] : sessions_) {
            if (isLive(session, now)) {
                result.push_back(session);
            }
        }
        return result;
    }

    std::size_t activeSessionCount() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return countLive(clock_->now());
    }

    // ========================================================================
    // СОЕДИНЕНИЯ
    // ========================================================================

    bool registerConnection(
        const std::string& sessionId,
        std::weak_ptr<ports::output::IConnectionHandle> handle
    ) override {
        auto locked = handle.lock();
        if (!locked) {
            return false;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (sessions_.count(sessionId) == 0) {
            return false;
        }

        connections_[sessionId] = ConnectionBinding{handle, locked.get()};
        return true;
    }

    void unregisterConnection(
        const std::string& sessionId,
        const ports::output::IConnectionHandle* handle
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(sessionId);
        if (it != connections_.end() && it->second.identity == handle) {
            connections_.erase(it);
        }
    }

    /**
     * @brief Есть ли привязанное соединение (для тестов и health)
     */
    bool hasConnection(const std::string& sessionId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connections_.count(sessionId) > 0;
    }

    // ========================================================================
    // ОБСЛУЖИВАНИЕ
    // ========================================================================

    std::size_t removeExpiredSessions() override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_->now();

        std::size_t expired = 0;
        std::size_t revoked = 0;
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->second.expiresAt <= now) {
                ++expired;
            } else if (!authority_->isActive(it->second.token)) {
                ++revoked;
            } else {
                ++it;
                continue;
            }
            connections_.erase(it->first);
            it = sessions_.erase(it);
        }

        if (expired + revoked > 0) {
            events_.emit(domain::SecurityEventType::CLEANUP,
                         domain::EventSeverity::DEBUG,
                         "expired_sessions=" + std::to_string(expired)
                             + " revoked_sessions=" + std::to_string(revoked));
        }
        return expired + revoked;
    }

    void shutdown() override {
        if (sweeper_.isRunning()) {
            sweeper_.stop();
            std::cout << "[SessionBroker] Sweeper stopped" << std::endl;
        }
    }

    bool isSweeperRunning() const { return sweeper_.isRunning(); }

private:
    struct ConnectionBinding {
        std::weak_ptr<ports::output::IConnectionHandle> handle;
        const ports::output::IConnectionHandle* identity = nullptr;
    };

    std::shared_ptr<ports::input::ITokenAuthority> authority_;
    std::shared_ptr<ports::output::ISessionSettings> settings_;
    std::shared_ptr<ports::output::IClock> clock_;
    SafeEventLog events_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, domain::DesktopSession> sessions_;
    std::unordered_map<std::string, ConnectionBinding> connections_;

    PeriodicSweeper sweeper_;

    bool isLive(const domain::DesktopSession& session, const domain::Timestamp& now) const {
        return session.isLiveAt(now) && authority_->isActive(session.token);
    }

    std::size_t countLive(const domain::Timestamp& now) const {
        std::size_t count = 0;
        for (const auto& [id, session] : sessions_) {
            if (isLive(session, now)) {
                ++count;
            }
        }
        return count;
    }
};

} // namespace ctrlhost::application
