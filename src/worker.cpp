/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rtbridge/worker.hpp"
#include "rtbridge/logger.hpp"

namespace rtbridge {

AffinityThread::AffinityThread(std::string name) noexcept : name_(std::move(name)) {}

AffinityThread::~AffinityThread() {
    stop();
}

bool AffinityThread::start() {
    if (running_.load()) {
        LOG_WARN("Affinity thread already running");
        return false;
    }

    std::promise<void> ready;
    auto readyFuture = ready.get_future();
    running_.store(true);

    try {
        thread_ = std::thread([this, &ready] {
            setThreadName(name_);
            workerId_.store(std::this_thread::get_id());
            ready.set_value();
            run();
        });
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start affinity thread: " + std::string(e.what()));
        running_.store(false);
        return false;
    }

    readyFuture.wait();
    LOG_DEBUG("Affinity thread started: " + name_);
    return true;
}

void AffinityThread::stop() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_DEBUG("Stopping affinity thread...");
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
    }
    taskAvailable_.notify_all();

    if (thread_.joinable()) {
        if (isCurrentThread()) {
            LOG_ERROR("Affinity thread asked to stop itself; detaching");
            thread_.detach();
        } else {
            thread_.join();
        }
    }

    // Destroy dropped tasks outside the lock; their destructors may complete jobs.
    std::deque<Task> dropped;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        dropped.swap(tasks_);
    }
    if (!dropped.empty()) {
        LOG_DEBUG("Dropped " + std::to_string(dropped.size()) + " queued task(s)");
    }
    dropped.clear();

    LOG_DEBUG("Affinity thread stopped");
}

bool AffinityThread::isCurrentThread() const noexcept {
    return workerId_.load() == std::this_thread::get_id();
}

std::size_t AffinityThread::queueSize() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return tasks_.size();
}

bool AffinityThread::performAsync(Task task) {
    return enqueue(std::move(task));
}

bool AffinityThread::enqueue(Task task) {
    if (!task) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!running_.load()) {
            LOG_DEBUG("Cannot enqueue task on stopped affinity thread");
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    taskAvailable_.notify_one();
    return true;
}

void AffinityThread::run() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            taskAvailable_.wait(lock, [this] {
                return !tasks_.empty() || !running_.load();
            });

            if (!running_.load()) {
                break;
            }

            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("Affinity task error: " + std::string(e.what()));
        } catch (...) {
            LOG_ERROR("Unknown affinity task error");
        }
    }

    LOG_DEBUG("Affinity thread loop exited");
}

}
