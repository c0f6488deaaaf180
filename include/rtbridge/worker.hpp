/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace rtbridge {

// The one thread allowed to call into the foreign runtime. Tasks run strictly
// FIFO and never concurrently.
class AffinityThread final {
public:
    using Task = std::function<void()>;

    explicit AffinityThread(std::string name = "Affinity") noexcept;
    ~AffinityThread();

    AffinityThread(const AffinityThread&) = delete;
    AffinityThread& operator=(const AffinityThread&) = delete;
    AffinityThread(AffinityThread&&) = delete;
    AffinityThread& operator=(AffinityThread&&) = delete;

    // Starts the worker and waits until it is ready to take tasks.
    [[nodiscard]] bool start();

    // Exits after the current task; queued tasks that have not started are dropped.
    void stop() noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] bool isCurrentThread() const noexcept;
    [[nodiscard]] std::size_t queueSize() const noexcept;

    // Blocks the caller until work has run on the worker; returns its value or
    // rethrows its exception. Runs inline when already on the worker.
    template <typename Work>
    auto perform(Work&& work) -> decltype(work()) {
        using Result = decltype(work());
        if (isCurrentThread()) {
            return work();
        }

        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Work>(work));
        auto future = task->get_future();
        if (!enqueue([task] { (*task)(); })) {
            throw std::runtime_error("affinity thread stopped");
        }

        try {
            return future.get();
        } catch (const std::future_error& e) {
            if (e.code() == std::future_errc::broken_promise) {
                throw std::runtime_error("affinity thread stopped");
            }
            throw;
        }
    }

    // Fire-and-forget. Returns false when the worker no longer accepts tasks.
    bool performAsync(Task task);

private:
    bool enqueue(Task task);
    void run();

    std::string name_;
    std::atomic<bool> running_{false};
    std::atomic<std::thread::id> workerId_{};

    mutable std::mutex queueMutex_;
    std::condition_variable taskAvailable_;
    std::deque<Task> tasks_;

    std::thread thread_;
};

}
