#include <gtest/gtest.h>
#include "common/retry.hpp"

using namespace sightlink;

TEST(RetryTest, GatewayReconnectBackoff) {
    RetryState state(RetryPolicy::gateway_reconnect());
    EXPECT_EQ(state.delay_for(1), std::chrono::milliseconds(2000));
    EXPECT_EQ(state.delay_for(2), std::chrono::milliseconds(4000));
    EXPECT_EQ(state.delay_for(3), std::chrono::milliseconds(8000));
    EXPECT_EQ(state.delay_for(5), std::chrono::milliseconds(32000));
    // Capped
    EXPECT_EQ(state.delay_for(6), std::chrono::milliseconds(60000));
    EXPECT_EQ(state.delay_for(10), std::chrono::milliseconds(60000));
}

TEST(RetryTest, ExhaustsAfterMaxAttempts) {
    RetryPolicy policy;
    policy.max_attempts = 3;
    policy.initial_delay = std::chrono::milliseconds(10);
    RetryState state(policy);

    EXPECT_TRUE(state.should_retry());
    EXPECT_EQ(state.next_delay(), std::chrono::milliseconds(10));
    EXPECT_EQ(state.next_delay(), std::chrono::milliseconds(20));
    EXPECT_EQ(state.next_delay(), std::chrono::milliseconds(40));
    EXPECT_TRUE(state.exhausted());
    EXPECT_EQ(state.attempt(), 3u);

    state.reset();
    EXPECT_TRUE(state.should_retry());
    EXPECT_EQ(state.next_delay(), std::chrono::milliseconds(10));
}

TEST(RetryTest, InfiniteNeverExhausts) {
    RetryState state(RetryPolicy::infinite());
    for (int i = 0; i < 100; ++i) {
        auto delay = state.next_delay();
        EXPECT_LE(delay, std::chrono::milliseconds(66000));
    }
    EXPECT_TRUE(state.should_retry());
}
