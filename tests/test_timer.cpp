/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rtbridge/timer.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <cmath>
#include <future>
#include <mutex>
#include <vector>

using namespace rtbridge;
using namespace std::chrono_literals;

TEST(TimerSchedulerTest, ScheduleRequiresRunning) {
    TimerScheduler timers;
    EXPECT_EQ(timers.schedule(10ms, [] {}), 0u);
}

TEST(TimerSchedulerTest, FiresCallback) {
    TimerScheduler timers;
    ASSERT_TRUE(timers.start());
    std::promise<void> fired;
    auto future = fired.get_future();
    EXPECT_NE(timers.schedule(20ms, [&fired] { fired.set_value(); }), 0u);
    EXPECT_EQ(future.wait_for(2s), std::future_status::ready);
}

TEST(TimerSchedulerTest, CancelledTimerNeverFires) {
    TimerScheduler timers;
    ASSERT_TRUE(timers.start());
    std::atomic<bool> fired{false};
    const auto id = timers.schedule(50ms, [&fired] { fired = true; });
    EXPECT_EQ(timers.pending(), 1u);
    EXPECT_TRUE(timers.cancel(id));
    EXPECT_FALSE(timers.cancel(id));
    EXPECT_EQ(timers.pending(), 0u);
    std::this_thread::sleep_for(120ms);
    EXPECT_FALSE(fired.load());
}

TEST(TimerSchedulerTest, FiresInDeadlineOrder) {
    TimerScheduler timers;
    ASSERT_TRUE(timers.start());
    std::mutex mutex;
    std::vector<int> order;
    std::promise<void> done;
    auto future = done.get_future();
    auto record = [&](int value) {
        std::lock_guard<std::mutex> lock(mutex);
        order.push_back(value);
        if (order.size() == 3) {
            done.set_value();
        }
    };
    (void)timers.schedule(60ms, [&] { record(3); });
    (void)timers.schedule(10ms, [&] { record(1); });
    (void)timers.schedule(30ms, [&] { record(2); });
    ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(TimerSchedulerTest, CallbackExceptionKeepsSchedulerAlive) {
    TimerScheduler timers;
    ASSERT_TRUE(timers.start());
    (void)timers.schedule(5ms, [] { throw std::runtime_error("timer boom"); });
    std::promise<void> fired;
    auto future = fired.get_future();
    (void)timers.schedule(30ms, [&fired] { fired.set_value(); });
    EXPECT_EQ(future.wait_for(2s), std::future_status::ready);
}

TEST(TimerSchedulerTest, StopDiscardsPendingTimers) {
    TimerScheduler timers;
    ASSERT_TRUE(timers.start());
    std::atomic<bool> fired{false};
    (void)timers.schedule(100ms, [&fired] { fired = true; });
    timers.stop();
    EXPECT_FALSE(timers.isRunning());
    std::this_thread::sleep_for(150ms);
    EXPECT_FALSE(fired.load());
}

TEST(TimerSchedulerTest, HugeDelayIsParkedInsteadOfFiring) {
    TimerScheduler timers;
    ASSERT_TRUE(timers.start());
    std::atomic<bool> fired{false};
    const auto id = timers.schedule(std::chrono::duration<double>(1e12), [&fired] { fired = true; });
    const auto forever = timers.schedule(std::chrono::duration<double>(HUGE_VAL), [&fired] { fired = true; });
    ASSERT_NE(id, 0u);
    std::this_thread::sleep_for(80ms);
    EXPECT_FALSE(fired.load());
    EXPECT_EQ(timers.pending(), 2u);
    EXPECT_TRUE(timers.cancel(id));
    EXPECT_TRUE(timers.cancel(forever));
}
