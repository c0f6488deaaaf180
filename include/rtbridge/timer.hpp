/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

namespace rtbridge {

// Runs delayed callbacks on its own thread. Callbacks must only signal other
// components; they never touch the foreign runtime.
class TimerScheduler final {
public:
    using TimerId = std::uint64_t;
    using Callback = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    explicit TimerScheduler(std::string name = "Timer") noexcept;
    ~TimerScheduler();

    TimerScheduler(const TimerScheduler&) = delete;
    TimerScheduler& operator=(const TimerScheduler&) = delete;
    TimerScheduler(TimerScheduler&&) = delete;
    TimerScheduler& operator=(TimerScheduler&&) = delete;

    [[nodiscard]] bool start();
    void stop() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    // Returns 0 when the scheduler is not running. Very long delays are capped
    // at about a century instead of overflowing the clock.
    [[nodiscard]] TimerId schedule(std::chrono::duration<double> delay, Callback callback);

    // True when the timer was removed before it fired.
    bool cancel(TimerId id) noexcept;

    [[nodiscard]] std::size_t pending() const noexcept;

private:
    void run();

    std::string name_;
    std::atomic<bool> running_{false};
    std::atomic<TimerId> nextId_{1};

    mutable std::mutex mutex_;
    std::condition_variable changed_;
    std::map<std::pair<Clock::time_point, TimerId>, Callback> timers_;
    std::unordered_map<TimerId, Clock::time_point> deadlines_;

    std::thread thread_;
};

}
