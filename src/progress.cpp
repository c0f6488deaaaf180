/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rtbridge/progress.hpp"
#include "rtbridge/logger.hpp"

namespace rtbridge {

bool ProgressStream::push(ProgressEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (finished_) {
            LOG_TRACE("Progress event dropped after finish");
            return false;
        }
        events_.push_back(std::move(event));
    }
    available_.notify_one();
    return true;
}

void ProgressStream::finish() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++finishCalls_;
        if (finished_) {
            return;
        }
        finished_ = true;
    }
    available_.notify_all();
}

std::optional<ProgressEvent> ProgressStream::next() {
    std::unique_lock<std::mutex> lock(mutex_);
    available_.wait(lock, [this] { return finished_ || !events_.empty(); });
    if (events_.empty()) {
        return std::nullopt;
    }
    ProgressEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<ProgressEvent> ProgressStream::nextFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!available_.wait_for(lock, timeout, [this] { return finished_ || !events_.empty(); })) {
        return std::nullopt;
    }
    if (events_.empty()) {
        return std::nullopt;
    }
    ProgressEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<ProgressEvent> ProgressStream::tryNext() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
        return std::nullopt;
    }
    ProgressEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

bool ProgressStream::isFinished() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

bool ProgressStream::isDrained() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_ && events_.empty();
}

std::size_t ProgressStream::finishCalls() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return finishCalls_;
}

}
