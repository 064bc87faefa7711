/**
 * @file TokenAuthorityTest.cpp
 * @brief Тесты TokenAuthority: выдача, валидация, отзыв, sweep, rate limit
 */

#include <gtest/gtest.h>
#include "application/TokenAuthority.hpp"
#include "adapters/secondary/entropy/OpenSslEntropySource.hpp"
#include "utils/Base64Url.hpp"
#include "utils/TokenHash.hpp"

#include "mocks/ManualClock.hpp"
#include "mocks/RecordingEventLogger.hpp"
#include "mocks/ScriptedEntropySource.hpp"
#include "mocks/StaticSettings.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

using namespace ctrlhost;
using namespace ctrlhost::application;
using namespace ctrlhost::tests;
using namespace std::chrono_literals;

// ============================================================================
// TEST FIXTURE
// ============================================================================

class TokenAuthorityTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>();
        entropy_ = std::make_shared<adapters::secondary::OpenSslEntropySource>();
        logger_ = std::make_shared<RecordingEventLogger>();
        settings_ = std::make_shared<StaticSettings>();
    }

    std::unique_ptr<TokenAuthority> makeAuthority(
        std::shared_ptr<ports::output::IEntropySource> entropy = nullptr
    ) {
        if (!entropy) {
            entropy = entropy_;
        }
        return std::make_unique<TokenAuthority>(clock_, entropy, logger_, settings_);
    }

    void failTimes(TokenAuthority& authority, const std::string& token, int times) {
        for (int i = 0; i < times; ++i) {
            EXPECT_FALSE(authority.validateToken(token).valid);
        }
    }

    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<adapters::secondary::OpenSslEntropySource> entropy_;
    std::shared_ptr<RecordingEventLogger> logger_;
    std::shared_ptr<StaticSettings> settings_;
};

// ============================================================================
// ISSUE / VALIDATE
// ============================================================================

TEST_F(TokenAuthorityTest, IssuedTokenValidatesWithOwner) {
    auto authority = makeAuthority();

    auto token = authority->issueToken("ha-1", 15min);
    auto result = authority->validateToken(token.value);

    EXPECT_TRUE(result.valid);
    EXPECT_EQ(result.ownerTag, "ha-1");
    EXPECT_EQ(authority->getStats().succeeded, 1u);
}

TEST_F(TokenAuthorityTest, TokenIsUrlSafe256Bit) {
    auto authority = makeAuthority();

    auto token = authority->issueToken("ha-1", 1min);

    EXPECT_EQ(token.value.size(), 43u);
    EXPECT_TRUE(utils::isBase64Url(token.value));
    EXPECT_EQ(token.ownerTag, "ha-1");
    EXPECT_EQ(token.issuedAt, clock_->now());
    EXPECT_EQ(token.expiresAt, clock_->now().plus(1min));
}

TEST_F(TokenAuthorityTest, HundredThousandTokensAreDistinct) {
    TokenAuthority authority(clock_, entropy_, nullptr, settings_);

    std::unordered_set<std::string> values;
    values.reserve(100000);
    for (int i = 0; i < 100000; ++i) {
        values.insert(authority.issueToken("bulk", 1h).value);
    }

    EXPECT_EQ(values.size(), 100000u);
    EXPECT_EQ(authority.activeTokenCount(), 100000u);
}

TEST_F(TokenAuthorityTest, UnknownTokenIsInvalid) {
    auto authority = makeAuthority();

    auto result = authority->validateToken("does-not-exist");

    EXPECT_FALSE(result.valid);
    EXPECT_TRUE(result.ownerTag.empty());
    EXPECT_EQ(authority->getStats().notFound, 1u);
}

TEST_F(TokenAuthorityTest, EmptyTokenIsNotFound) {
    auto authority = makeAuthority();

    EXPECT_FALSE(authority->validateToken("").valid);
    EXPECT_EQ(authority->getStats().notFound, 1u);
}

TEST_F(TokenAuthorityTest, IssueRejectsBadArguments) {
    auto authority = makeAuthority();

    EXPECT_THROW(authority->issueToken("", 1min), std::invalid_argument);
    EXPECT_THROW(authority->issueToken("ha-1", 0ms), std::invalid_argument);
    EXPECT_THROW(authority->issueToken("ha-1", -5s), std::invalid_argument);
    EXPECT_EQ(authority->activeTokenCount(), 0u);
}

// ============================================================================
// EXPIRY
// ============================================================================

TEST_F(TokenAuthorityTest, OneMillisecondTtlExpiresAndIsEvicted) {
    auto authority = makeAuthority();
    auto token = authority->issueToken("ha-1", 1ms);

    clock_->advance(1ms);

    EXPECT_FALSE(authority->validateToken(token.value).valid);
    EXPECT_EQ(authority->activeTokenCount(), 0u);
    EXPECT_EQ(authority->getStats().expired, 1u);

    // Второй раз токена уже нет в таблице
    EXPECT_FALSE(authority->validateToken(token.value).valid);
    EXPECT_EQ(authority->getStats().notFound, 1u);
}

TEST_F(TokenAuthorityTest, ValidJustBeforeExpiry) {
    auto authority = makeAuthority();
    auto token = authority->issueToken("ha-1", 10s);

    clock_->advance(10s - 1ms);
    EXPECT_TRUE(authority->validateToken(token.value).valid);

    clock_->advance(1ms);
    EXPECT_FALSE(authority->validateToken(token.value).valid);
}

// ============================================================================
// REVOCATION
// ============================================================================

TEST_F(TokenAuthorityTest, RevokedTokenIsInvalid) {
    auto authority = makeAuthority();
    auto token = authority->issueToken("ha-1", 15min);

    authority->revokeToken(token.value);

    EXPECT_FALSE(authority->validateToken(token.value).valid);
    EXPECT_TRUE(authority->isRevoked(token.value));
    EXPECT_EQ(authority->activeTokenCount(), 0u);
    EXPECT_EQ(authority->getStats().revoked, 1u);
}

TEST_F(TokenAuthorityTest, RevokeIsIdempotent) {
    auto authority = makeAuthority();
    auto token = authority->issueToken("ha-1", 15min);

    authority->revokeToken(token.value);
    authority->revokeToken(token.value);
    authority->revokeToken("never-issued");

    EXPECT_EQ(authority->revokedTokenCount(), 2u);
    EXPECT_EQ(logger_->count(domain::SecurityEventType::TOKEN_REVOKED), 3u);
}

TEST_F(TokenAuthorityTest, RevokedCheckWinsOverRateLimit) {
    auto authority = makeAuthority();
    auto token = authority->issueToken("ha-1", 15min);
    authority->revokeToken(token.value);

    failTimes(*authority, token.value, 8);

    auto stats = authority->getStats();
    EXPECT_EQ(stats.revoked, 8u);
    EXPECT_EQ(stats.rateLimited, 0u);
    EXPECT_EQ(authority->failureCount(token.value), 0);
}

// ============================================================================
// RATE LIMITING
// ============================================================================

TEST_F(TokenAuthorityTest, FiveFailuresThenRateLimited) {
    auto authority = makeAuthority();

    failTimes(*authority, "guess", 5);
    EXPECT_EQ(authority->getStats().notFound, 5u);
    EXPECT_EQ(authority->failureCount("guess"), 5);

    EXPECT_FALSE(authority->validateToken("guess").valid);

    auto stats = authority->getStats();
    EXPECT_EQ(stats.notFound, 5u);
    EXPECT_EQ(stats.rateLimited, 1u);
    EXPECT_EQ(logger_->count(domain::SecurityEventType::RATE_LIMITED), 1u);
}

TEST_F(TokenAuthorityTest, RateLimitedKeyDoesNotTouchActiveTable) {
    auto authority = makeAuthority();
    auto token = authority->issueToken("ha-1", 10s);

    clock_->advance(10s);
    failTimes(*authority, token.value, 5);   // 1 expired + 4 not found

    // Ключ заблокирован: даже без токена в таблице ответ - rate limited
    EXPECT_FALSE(authority->validateToken(token.value).valid);
    EXPECT_EQ(authority->getStats().expired, 1u);
    EXPECT_EQ(authority->getStats().notFound, 4u);
    EXPECT_EQ(authority->getStats().rateLimited, 1u);
}

TEST_F(TokenAuthorityTest, RateLimitWindowResets) {
    auto authority = makeAuthority();

    failTimes(*authority, "guess", 5);
    clock_->advance(61s);

    EXPECT_FALSE(authority->validateToken("guess").valid);

    auto stats = authority->getStats();
    EXPECT_EQ(stats.notFound, 6u);
    EXPECT_EQ(stats.rateLimited, 0u);
    EXPECT_EQ(authority->failureCount("guess"), 1);
}

TEST_F(TokenAuthorityTest, RateLimitKeyCoversWholeToken) {
    auto authority = makeAuthority();
    std::string prefix(40, 'x');

    failTimes(*authority, prefix + "AAA", 5);
    EXPECT_FALSE(authority->validateToken(prefix + "AAB").valid);

    EXPECT_EQ(authority->getStats().rateLimited, 0u);
    EXPECT_EQ(authority->failureCount(prefix + "AAB"), 1);
}

TEST_F(TokenAuthorityTest, RateLimitUsesConfiguredThreshold) {
    settings_->maxFailures = 2;
    settings_->failureWindowSeconds = 5;
    auto authority = makeAuthority();

    failTimes(*authority, "guess", 2);
    EXPECT_FALSE(authority->validateToken("guess").valid);
    EXPECT_EQ(authority->getStats().rateLimited, 1u);

    clock_->advance(6s);
    EXPECT_FALSE(authority->validateToken("guess").valid);
    EXPECT_EQ(authority->getStats().rateLimited, 1u);
}

// ============================================================================
// ENTROPY
// ============================================================================

TEST_F(TokenAuthorityTest, EntropyFailurePropagates) {
    auto scripted = std::make_shared<ScriptedEntropySource>();
    scripted->setFailing(true);
    auto authority = makeAuthority(scripted);

    EXPECT_THROW(authority->issueToken("ha-1", 1min), domain::EntropyUnavailableException);
    EXPECT_EQ(authority->activeTokenCount(), 0u);
}

TEST_F(TokenAuthorityTest, CollisionWithActiveTokenRegenerates) {
    auto scripted = std::make_shared<ScriptedEntropySource>();
    scripted->push(0x11);
    scripted->push(0x11);
    scripted->push(0x22);
    auto authority = makeAuthority(scripted);

    auto first = authority->issueToken("a", 1min);
    auto second = authority->issueToken("b", 1min);

    EXPECT_NE(first.value, second.value);
    EXPECT_EQ(scripted->calls(), 3);
    EXPECT_EQ(authority->validateToken(first.value).ownerTag, "a");
    EXPECT_EQ(authority->validateToken(second.value).ownerTag, "b");
}

TEST_F(TokenAuthorityTest, CollisionWithRevokedTokenRegenerates) {
    auto scripted = std::make_shared<ScriptedEntropySource>();
    scripted->push(0x33);
    auto authority = makeAuthority(scripted);

    auto first = authority->issueToken("a", 1min);
    authority->revokeToken(first.value);

    scripted->push(0x33);
    scripted->push(0x44);
    auto second = authority->issueToken("b", 1min);

    EXPECT_NE(first.value, second.value);
    EXPECT_TRUE(authority->validateToken(second.value).valid);
}

TEST_F(TokenAuthorityTest, EndlessCollisionsFailIssuance) {
    auto scripted = std::make_shared<ScriptedEntropySource>();
    scripted->push(0x55);
    auto authority = makeAuthority(scripted);

    authority->issueToken("a", 1min);

    EXPECT_THROW(authority->issueToken("b", 1min), domain::EntropyUnavailableException);
    EXPECT_EQ(authority->activeTokenCount(), 1u);
}

// ============================================================================
// SWEEP
// ============================================================================

TEST_F(TokenAuthorityTest, SweepRemovesExpiredTokens) {
    auto authority = makeAuthority();
    authority->issueToken("short", 1s);
    auto longLived = authority->issueToken("long", 1h);

    clock_->advance(2s);
    auto report = authority->sweep();

    EXPECT_EQ(report.expiredTokens, 1u);
    EXPECT_EQ(authority->activeTokenCount(), 1u);
    EXPECT_TRUE(authority->validateToken(longLived.value).valid);
    EXPECT_EQ(logger_->count(domain::SecurityEventType::CLEANUP), 1u);
}

TEST_F(TokenAuthorityTest, EmptySweepLogsNothing) {
    auto authority = makeAuthority();
    authority->issueToken("long", 1h);

    auto report = authority->sweep();

    EXPECT_TRUE(report.empty());
    EXPECT_EQ(logger_->count(domain::SecurityEventType::CLEANUP), 0u);
}

TEST_F(TokenAuthorityTest, SweepPrunesElapsedFailureWindows) {
    auto authority = makeAuthority();
    failTimes(*authority, "guess", 3);

    clock_->advance(61s);
    auto report = authority->sweep();

    EXPECT_EQ(report.failureWindowsPruned, 1u);
    EXPECT_EQ(authority->failureCount("guess"), 0);
}

TEST_F(TokenAuthorityTest, BoundedResetClearsRecordOverLimit) {
    settings_->revocationPolicy = domain::RevocationPolicy::BOUNDED_RESET;
    auto authority = makeAuthority();

    for (int i = 0; i < 1001; ++i) {
        authority->revokeToken("revoked-" + std::to_string(i));
    }
    EXPECT_EQ(authority->revokedTokenCount(), 1001u);

    auto report = authority->sweep();

    EXPECT_EQ(report.revocationsDropped, 1001u);
    EXPECT_EQ(authority->revokedTokenCount(), 0u);
}

TEST_F(TokenAuthorityTest, BoundedResetKeepsRecordAtLimit) {
    settings_->revocationPolicy = domain::RevocationPolicy::BOUNDED_RESET;
    auto authority = makeAuthority();

    for (int i = 0; i < 1000; ++i) {
        authority->revokeToken("revoked-" + std::to_string(i));
    }
    clock_->advance(48h);
    authority->sweep();

    EXPECT_EQ(authority->revokedTokenCount(), 1000u);
    EXPECT_TRUE(authority->isRevoked("revoked-0"));
}

TEST_F(TokenAuthorityTest, TimeBasedKeepsRevocationUntilRetentionElapses) {
    auto authority = makeAuthority();
    authority->revokeToken("unknown-token");

    clock_->advance(24h);
    authority->sweep();
    EXPECT_TRUE(authority->isRevoked("unknown-token"));

    clock_->advance(1s);
    auto report = authority->sweep();
    EXPECT_EQ(report.revocationsDropped, 1u);
    EXPECT_FALSE(authority->isRevoked("unknown-token"));
}

TEST_F(TokenAuthorityTest, TimeBasedDropsRevocationOnceTokenExpired) {
    auto authority = makeAuthority();
    auto token = authority->issueToken("ha-1", 10s);
    authority->revokeToken(token.value);

    clock_->advance(5s);
    authority->sweep();
    EXPECT_TRUE(authority->isRevoked(token.value));

    clock_->advance(5s);
    authority->sweep();
    EXPECT_FALSE(authority->isRevoked(token.value));

    // Запись удалена, но токен всё равно не проходит
    EXPECT_FALSE(authority->validateToken(token.value).valid);
}

TEST_F(TokenAuthorityTest, TimeBasedIsDefault) {
    auto authority = makeAuthority();
    EXPECT_EQ(authority->revocationPolicy(), domain::RevocationPolicy::TIME_BASED);
}

TEST_F(TokenAuthorityTest, TimeBasedRecordStaysWithinMaxEntries) {
    auto authority = makeAuthority();

    for (int i = 0; i < 1500; ++i) {
        authority->revokeToken("unknown-" + std::to_string(i));
        clock_->advance(1ms);
    }

    auto report = authority->sweep();

    EXPECT_EQ(report.revocationsDropped, 500u);
    EXPECT_EQ(authority->revokedTokenCount(), 1000u);
    EXPECT_FALSE(authority->isRevoked("unknown-0"));
    EXPECT_FALSE(authority->isRevoked("unknown-499"));
    EXPECT_TRUE(authority->isRevoked("unknown-500"));
    EXPECT_TRUE(authority->isRevoked("unknown-1499"));
}

TEST_F(TokenAuthorityTest, TrimEvictsUnknownStringsBeforeIssuedTokens) {
    settings_->maxRevocationEntries = 3;
    auto authority = makeAuthority();

    auto issued = authority->issueToken("ha-1", 1h);
    authority->revokeToken(issued.value);
    for (int i = 0; i < 5; ++i) {
        clock_->advance(1s);
        authority->revokeToken("unknown-" + std::to_string(i));
    }

    authority->sweep();

    EXPECT_EQ(authority->revokedTokenCount(), 3u);
    EXPECT_TRUE(authority->isRevoked(issued.value));
    EXPECT_TRUE(authority->isRevoked("unknown-4"));
    EXPECT_TRUE(authority->isRevoked("unknown-3"));
    EXPECT_FALSE(authority->isRevoked("unknown-2"));
    EXPECT_FALSE(authority->validateToken(issued.value).valid);
}

TEST_F(TokenAuthorityTest, EvictedRevocationStillFailsValidation) {
    settings_->maxRevocationEntries = 1;
    auto authority = makeAuthority();

    auto token = authority->issueToken("ha-1", 1h);
    authority->revokeToken(token.value);
    clock_->advance(1s);
    auto other = authority->issueToken("ha-2", 1h);
    authority->revokeToken(other.value);

    authority->sweep();

    EXPECT_FALSE(authority->isRevoked(token.value));
    EXPECT_FALSE(authority->validateToken(token.value).valid);
    EXPECT_EQ(authority->activeTokenCount(), 0u);
}

// ============================================================================
// BACKGROUND SWEEP & LIFECYCLE
// ============================================================================

TEST_F(TokenAuthorityTest, NoBackgroundSweepWhenIntervalIsZero) {
    auto authority = makeAuthority();
    EXPECT_FALSE(authority->isSweeperRunning());
}

TEST_F(TokenAuthorityTest, BackgroundSweepRemovesExpiredTokens) {
    settings_->sweepIntervalSeconds = 1;
    auto authority = makeAuthority();
    EXPECT_TRUE(authority->isSweeperRunning());

    authority->issueToken("ha-1", 1ms);
    clock_->advance(1s);

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (authority->activeTokenCount() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(20ms);
    }

    EXPECT_EQ(authority->activeTokenCount(), 0u);
    EXPECT_EQ(authority->getStats().expired, 0u);   // удалён sweep'ом, а не валидацией

    authority->shutdown();
    authority->shutdown();
    EXPECT_FALSE(authority->isSweeperRunning());
}

// ============================================================================
// LOGGING
// ============================================================================

TEST_F(TokenAuthorityTest, BrokenLoggerDoesNotChangeResults) {
    logger_->setFailing(true);
    auto authority = makeAuthority();

    auto token = authority->issueToken("ha-1", 1min);
    EXPECT_TRUE(authority->validateToken(token.value).valid);
    EXPECT_FALSE(authority->validateToken("guess").valid);

    authority->revokeToken(token.value);
    EXPECT_FALSE(authority->validateToken(token.value).valid);
    EXPECT_TRUE(authority->isRevoked(token.value));
}

TEST_F(TokenAuthorityTest, LoggerThrowingNonStandardValueIsContained) {
    logger_->setThrowingNonStandard(true);
    auto authority = makeAuthority();

    auto token = authority->issueToken("ha-1", 1min);
    EXPECT_TRUE(authority->validateToken(token.value).valid);
    EXPECT_FALSE(authority->validateToken("guess").valid);

    authority->revokeToken(token.value);
    EXPECT_TRUE(authority->isRevoked(token.value));
    EXPECT_EQ(authority->sweep().expiredTokens, 0u);
}

TEST_F(TokenAuthorityTest, EventsCarryFingerprintNotToken) {
    auto authority = makeAuthority();
    auto token = authority->issueToken("ha-1", 1min);
    authority->validateToken(token.value + "x");
    authority->revokeToken(token.value);

    auto events = logger_->events();
    ASSERT_FALSE(events.empty());

    std::string fingerprint = utils::keyFingerprint(utils::rateLimitKey(token.value));
    for (const auto& event : events) {
        EXPECT_EQ(event.component, "TokenAuthority");
        EXPECT_EQ(event.detail.find(token.value), std::string::npos);
        EXPECT_EQ(event.keyFingerprint.size(), 12u);
    }
    EXPECT_EQ(events.front().type, domain::SecurityEventType::TOKEN_ISSUED);
    EXPECT_EQ(events.front().keyFingerprint, fingerprint);
    EXPECT_EQ(events.front().ownerTag, "ha-1");
}

// ============================================================================
// CONCURRENCY
// ============================================================================

TEST_F(TokenAuthorityTest, ConcurrentIssueValidateRevoke) {
    auto authority = makeAuthority();
    std::atomic<int> validCount{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 200; ++i) {
                auto token = authority->issueToken("owner-" + std::to_string(t), 1min);
                if (authority->validateToken(token.value).valid) {
                    ++validCount;
                }
                authority->revokeToken(token.value);
                EXPECT_FALSE(authority->validateToken(token.value).valid);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(validCount.load(), 1600);
    EXPECT_EQ(authority->activeTokenCount(), 0u);
    EXPECT_EQ(authority->revokedTokenCount(), 1600u);
}
