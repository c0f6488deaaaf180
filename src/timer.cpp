/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rtbridge/timer.hpp"
#include "rtbridge/logger.hpp"
#include <cmath>
#include <vector>

namespace rtbridge {

namespace {

// Delays beyond this are parked at the horizon; Clock::duration cannot hold them.
constexpr std::chrono::hours kMaxDelay{24 * 365 * 100};

TimerScheduler::Clock::duration clampDelay(std::chrono::duration<double> delay) noexcept {
    const std::chrono::duration<double> limit = kMaxDelay;
    if (std::isnan(delay.count()) || delay.count() <= 0.0) {
        return TimerScheduler::Clock::duration::zero();
    }
    if (delay >= limit) {
        return std::chrono::duration_cast<TimerScheduler::Clock::duration>(kMaxDelay);
    }
    return std::chrono::duration_cast<TimerScheduler::Clock::duration>(delay);
}

}

TimerScheduler::TimerScheduler(std::string name) noexcept : name_(std::move(name)) {}

TimerScheduler::~TimerScheduler() {
    stop();
}

bool TimerScheduler::start() {
    if (running_.load()) {
        LOG_WARN("Timer scheduler already running");
        return false;
    }

    running_.store(true);
    try {
        thread_ = std::thread(&TimerScheduler::run, this);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start timer scheduler: " + std::string(e.what()));
        running_.store(false);
        return false;
    }
    return true;
}

void TimerScheduler::stop() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        timers_.clear();
        deadlines_.clear();
    }
    changed_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_DEBUG("Timer scheduler stopped");
}

TimerScheduler::TimerId TimerScheduler::schedule(std::chrono::duration<double> delay, Callback callback) {
    if (!running_.load() || !callback) {
        return 0;
    }

    const TimerId id = nextId_.fetch_add(1);
    const auto deadline = Clock::now() + clampDelay(delay);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        timers_.emplace(std::make_pair(deadline, id), std::move(callback));
        deadlines_.emplace(id, deadline);
    }
    changed_.notify_one();
    return id;
}

bool TimerScheduler::cancel(TimerId id) noexcept {
    if (id == 0) {
        return false;
    }

    Callback removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = deadlines_.find(id);
        if (it == deadlines_.end()) {
            return false;
        }
        auto timer = timers_.find(std::make_pair(it->second, id));
        if (timer != timers_.end()) {
            removed = std::move(timer->second);
            timers_.erase(timer);
        }
        deadlines_.erase(it);
    }
    changed_.notify_one();
    return true;
}

std::size_t TimerScheduler::pending() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void TimerScheduler::run() {
    setThreadName(name_);

    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load()) {
        if (timers_.empty()) {
            changed_.wait(lock, [this] { return !running_.load() || !timers_.empty(); });
            continue;
        }

        const auto next = timers_.begin()->first.first;
        if (Clock::now() < next) {
            changed_.wait_until(lock, next);
            continue;
        }

        std::vector<Callback> due;
        const auto now = Clock::now();
        while (!timers_.empty() && timers_.begin()->first.first <= now) {
            auto it = timers_.begin();
            deadlines_.erase(it->first.second);
            due.push_back(std::move(it->second));
            timers_.erase(it);
        }

        lock.unlock();
        for (auto& callback : due) {
            try {
                callback();
            } catch (const std::exception& e) {
                LOG_ERROR("Timer callback error: " + std::string(e.what()));
            } catch (...) {
                LOG_ERROR("Unknown timer callback error");
            }
        }
        lock.lock();
    }
}

}
