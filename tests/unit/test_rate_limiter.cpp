#include <chrono>

#include <gtest/gtest.h>

#include "networking/rate_limiter.hpp"

using namespace dex_stream::networking;
using namespace std::chrono_literals;

class TokenBucketTest : public ::testing::Test {
  protected:
    TokenBucket::Clock::time_point start_{TokenBucket::Clock::now()};
};

TEST_F(TokenBucketTest, BurstIsImmediate) {
    TokenBucket bucket(2.0, 3, start_);

    EXPECT_EQ(bucket.reserve(start_), TokenBucket::Clock::duration::zero());
    EXPECT_EQ(bucket.reserve(start_), TokenBucket::Clock::duration::zero());
    EXPECT_EQ(bucket.reserve(start_), TokenBucket::Clock::duration::zero());
    EXPECT_GT(bucket.reserve(start_), TokenBucket::Clock::duration::zero());
}

TEST_F(TokenBucketTest, WaitMatchesRate) {
    TokenBucket bucket(4.0, 1, start_);

    EXPECT_EQ(bucket.reserve(start_), TokenBucket::Clock::duration::zero());
    const auto wait = bucket.reserve(start_);
    EXPECT_NEAR(std::chrono::duration<double>(wait).count(), 0.25, 1e-6);
}

TEST_F(TokenBucketTest, ReservationsQueueUp) {
    TokenBucket bucket(1.0, 1, start_);

    (void)bucket.reserve(start_);
    const auto second = bucket.reserve(start_);
    const auto third = bucket.reserve(start_);
    EXPECT_NEAR(std::chrono::duration<double>(second).count(), 1.0, 1e-6);
    EXPECT_NEAR(std::chrono::duration<double>(third).count(), 2.0, 1e-6);
    EXPECT_NEAR(bucket.available(start_), -2.0, 1e-9);
}

TEST_F(TokenBucketTest, RefillsOverTime) {
    TokenBucket bucket(2.0, 2, start_);

    (void)bucket.reserve(start_);
    (void)bucket.reserve(start_);
    EXPECT_NEAR(bucket.available(start_), 0.0, 1e-9);

    EXPECT_NEAR(bucket.available(start_ + 500ms), 1.0, 1e-9);
    EXPECT_EQ(bucket.reserve(start_ + 500ms), TokenBucket::Clock::duration::zero());
}

TEST_F(TokenBucketTest, RefillCappedAtBurst) {
    TokenBucket bucket(10.0, 2, start_);

    EXPECT_NEAR(bucket.available(start_ + 1h), 2.0, 1e-9);
}

TEST_F(TokenBucketTest, ClockGoingBackwardsIsIgnored) {
    TokenBucket bucket(1.0, 1, start_);

    (void)bucket.reserve(start_);
    EXPECT_NEAR(bucket.available(start_ - 10s), 0.0, 1e-9);
}

TEST_F(TokenBucketTest, Accessors) {
    TokenBucket bucket(2.5, 4, start_);
    EXPECT_DOUBLE_EQ(bucket.rate(), 2.5);
    EXPECT_DOUBLE_EQ(bucket.burst(), 4.0);
}
