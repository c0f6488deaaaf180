/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

#include "rtbridge/types.hpp"

namespace rtbridge {

// Ordered single-producer/single-consumer channel of progress events.
class ProgressStream final {
public:
    ProgressStream() = default;

    ProgressStream(const ProgressStream&) = delete;
    ProgressStream& operator=(const ProgressStream&) = delete;

    // Dropped (returns false) once finished.
    bool push(ProgressEvent event);

    // Idempotent. Only the first call closes the stream.
    void finish() noexcept;

    // Blocks until an event is available; nullopt once finished and drained.
    [[nodiscard]] std::optional<ProgressEvent> next();
    [[nodiscard]] std::optional<ProgressEvent> nextFor(std::chrono::milliseconds timeout);
    [[nodiscard]] std::optional<ProgressEvent> tryNext();

    [[nodiscard]] bool isFinished() const noexcept;
    [[nodiscard]] bool isDrained() const noexcept;

    // Number of finish() calls, closing or not.
    [[nodiscard]] std::size_t finishCalls() const noexcept;

private:
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<ProgressEvent> events_;
    bool finished_ = false;
    std::size_t finishCalls_ = 0;
};

}
