#include <gtest/gtest.h>

#include "common/network/ConnectionState.hpp"

using namespace std::chrono_literals;

TEST(ReconnectPolicyTest, DelayDoublesUpToCap) {
    EXPECT_EQ(ReconnectPolicy::delayFor(0), 1.0);
    EXPECT_EQ(ReconnectPolicy::delayFor(1), 2.0);
    EXPECT_EQ(ReconnectPolicy::delayFor(3), 8.0);
    EXPECT_EQ(ReconnectPolicy::delayFor(8), 256.0);
    EXPECT_EQ(ReconnectPolicy::delayFor(9), 300.0);
    EXPECT_EQ(ReconnectPolicy::delayFor(40), 300.0);
}

TEST(ReconnectPolicyTest, BackoffWindowMeasuredFromLastAttempt) {
    ReconnectPolicy policy;
    auto t0 = ReconnectPolicy::Clock::now();
    EXPECT_FALSE(policy.inBackoff(t0));

    policy.recordAttempt(t0);
    policy.recordFailure();
    policy.recordFailure();   // 4 秒

    EXPECT_TRUE(policy.inBackoff(t0 + 3s));
    EXPECT_FALSE(policy.inBackoff(t0 + 4s));

    policy.reset();
    EXPECT_FALSE(policy.inBackoff(t0 + 1s));
}

TEST(ConnectionStateMachineTest, SuccessfulConnectResetsRetries) {
    ConnectionStateMachine fsm;
    EXPECT_EQ(fsm.status(), ConnectionStatus::Disconnected);
    EXPECT_EQ(fsm.statusString(), "disconnected");

    auto t0 = ConnectionStateMachine::Clock::now();
    fsm.onAttempt(t0);
    EXPECT_EQ(fsm.status(), ConnectionStatus::Connecting);
    fsm.onFailure("connection refused");
    EXPECT_EQ(fsm.status(), ConnectionStatus::Backoff);
    EXPECT_EQ(fsm.retryCount(), 1);
    EXPECT_EQ(fsm.lastError(), "connection refused");

    fsm.onAttempt(t0 + 3s);
    fsm.onConnected("2026-01-01 00:00:00");
    EXPECT_TRUE(fsm.isConnected());
    EXPECT_EQ(fsm.retryCount(), 0);
    EXPECT_TRUE(fsm.lastError().empty());
    EXPECT_EQ(fsm.lastConnectTime(), "2026-01-01 00:00:00");
}

TEST(ConnectionStateMachineTest, SkipsConnectWhileConnectedOrBackingOff) {
    ConnectionStateMachine fsm;
    auto t0 = ConnectionStateMachine::Clock::now();
    EXPECT_FALSE(fsm.shouldSkipConnect(t0));

    fsm.onAttempt(t0);
    fsm.onFailure("receive timeout");
    EXPECT_TRUE(fsm.shouldSkipConnect(t0 + 1s));
    EXPECT_FALSE(fsm.shouldSkipConnect(t0 + 2s));

    fsm.onAttempt(t0 + 2s);
    fsm.onConnected("now");
    EXPECT_TRUE(fsm.shouldSkipConnect(t0 + 100s));

    fsm.onDisconnect();
    EXPECT_EQ(fsm.statusString(), "disconnected");
    EXPECT_FALSE(fsm.shouldSkipConnect(t0 + 100s));
}

TEST(ConnectionStateMachineTest, ConsecutiveFailuresGrowDelay) {
    ConnectionStateMachine fsm;
    auto t = ConnectionStateMachine::Clock::now();
    for (int i = 0; i < 3; ++i) {
        fsm.onAttempt(t);
        fsm.onFailure("refused");
        t += 1000s;
    }
    EXPECT_EQ(fsm.retryCount(), 3);
    EXPECT_EQ(fsm.currentDelay(), 8.0);
}
