#include <gtest/gtest.h>
#include "application/RateLimiter.hpp"
#include <chrono>

using namespace ctrlhost::application;
using namespace ctrlhost::domain;
using namespace std::chrono_literals;

class RateLimiterTest : public ::testing::Test {
protected:
    RateLimiter limiter{5, 60s};
    Timestamp t0 = Timestamp::fromUnixSeconds(1767225600);

    void fail(const std::string& key, int times, const Timestamp& at) {
        for (int i = 0; i < times; ++i) {
            limiter.recordFailure(key, at);
        }
    }
};

TEST_F(RateLimiterTest, UnknownKeyIsNotLimited) {
    EXPECT_FALSE(limiter.isLimited("k", t0));
    EXPECT_EQ(limiter.failureCount("k"), 0);
}

TEST_F(RateLimiterTest, LimitedAfterMaxFailures) {
    fail("k", 4, t0);
    EXPECT_FALSE(limiter.isLimited("k", t0));

    EXPECT_EQ(limiter.recordFailure("k", t0), 5);
    EXPECT_TRUE(limiter.isLimited("k", t0));
}

TEST_F(RateLimiterTest, WindowLastsExactlyWindowLength) {
    fail("k", 5, t0);

    EXPECT_TRUE(limiter.isLimited("k", t0.plus(60s)));
    EXPECT_FALSE(limiter.isLimited("k", t0.plus(60s + 1ms)));
    EXPECT_EQ(limiter.trackedKeys(), 0u);  // окно удалено при проверке
}

TEST_F(RateLimiterTest, FailureAfterWindowStartsNewWindow) {
    fail("k", 3, t0);
    EXPECT_EQ(limiter.recordFailure("k", t0.plus(61s)), 1);
    EXPECT_EQ(limiter.failureCount("k"), 1);
}

TEST_F(RateLimiterTest, WindowStartsAtFirstFailure) {
    limiter.recordFailure("k", t0);
    fail("k", 4, t0.plus(50s));

    // окно t0..t0+60s, последующие неудачи его не сдвигают
    EXPECT_TRUE(limiter.isLimited("k", t0.plus(55s)));
    EXPECT_FALSE(limiter.isLimited("k", t0.plus(61s)));
}

TEST_F(RateLimiterTest, KeysAreIndependent) {
    fail("a", 5, t0);
    EXPECT_TRUE(limiter.isLimited("a", t0));
    EXPECT_FALSE(limiter.isLimited("b", t0));
}

TEST_F(RateLimiterTest, PruneRemovesOnlyElapsedWindows) {
    fail("old", 2, t0);
    fail("fresh", 2, t0.plus(30s));

    EXPECT_EQ(limiter.prune(t0.plus(70s)), 1u);
    EXPECT_EQ(limiter.trackedKeys(), 1u);
    EXPECT_EQ(limiter.failureCount("fresh"), 2);
}
