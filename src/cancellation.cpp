/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rtbridge/cancellation.hpp"
#include "rtbridge/errors.hpp"
#include "rtbridge/logger.hpp"

namespace rtbridge {

void CancellationCoordinator::setInterruptHook(InterruptHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    hook_ = std::move(hook);
}

RunToken CancellationCoordinator::beginGeneration() {
    std::lock_guard<std::mutex> lock(mutex_);
    generation_ = nextToken_++;
    active_ = true;
    requested_ = false;
    source_.clear();
    LOG_DEBUG("Run generation " + std::to_string(generation_) + " started");
    return generation_;
}

void CancellationCoordinator::endGeneration(RunToken token) {
    CancellationPredicate dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (token != generation_ || !active_) {
            return;
        }
        active_ = false;
        requested_ = false;
        source_.clear();
        dropped = std::move(predicate_);
        predicate_ = nullptr;
    }
    LOG_DEBUG("Run generation " + std::to_string(token) + " ended");
}

RunToken CancellationCoordinator::currentGeneration() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

bool CancellationCoordinator::isActive(RunToken token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_ && token == generation_;
}

void CancellationCoordinator::setExternalPredicate(CancellationPredicate predicate) {
    std::lock_guard<std::mutex> lock(mutex_);
    predicate_ = std::move(predicate);
}

void CancellationCoordinator::clearExternalPredicate() {
    CancellationPredicate dropped;
    std::lock_guard<std::mutex> lock(mutex_);
    dropped.swap(predicate_);
}

void CancellationCoordinator::requestCancel(const std::string& source) {
    RunToken token = 0;
    bool active = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requested_ = true;
        source_ = source;
        token = generation_;
        active = active_;
    }
    LOG_INFO("Cancellation requested (source: " + source + ")");
    notify(token, active, source);
}

bool CancellationCoordinator::requestCancelIfCurrent(RunToken token, const std::string& source) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_ || token != generation_) {
            LOG_DEBUG("Ignoring cancel from stale run " + std::to_string(token) + " (" + source + ")");
            return false;
        }
        requested_ = true;
        source_ = source;
    }
    LOG_WARN("Cancellation requested for run " + std::to_string(token) + " (source: " + source + ")");
    notify(token, true, source);
    return true;
}

void CancellationCoordinator::clear() {
    bool was = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        was = requested_;
        requested_ = false;
        source_.clear();
    }
    if (was) {
        LOG_DEBUG("Cancellation request cleared");
    }
}

bool CancellationCoordinator::isCancelled() const {
    CancellationPredicate predicate;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (requested_) {
            LOG_TRACE("was_cancelled: internal_flag=true");
            return true;
        }
        predicate = predicate_;
    }

    if (predicate && predicate()) {
        LOG_TRACE("was_cancelled: external_predicate=true");
        return true;
    }
    return false;
}

void CancellationCoordinator::check() const {
    if (!isCancelled()) {
        return;
    }
    std::string source;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        source = requested_ ? source_ : "external";
    }
    throw Cancelled(source);
}

std::optional<std::string> CancellationCoordinator::cancelSource(RunToken token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (token != generation_ || !requested_) {
        return std::nullopt;
    }
    return source_;
}

void CancellationCoordinator::notify(RunToken token, bool active, const std::string& source) const {
    InterruptHook hook;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hook = hook_;
    }
    if (!hook || !active) {
        return;
    }
    try {
        hook(token, source);
    } catch (const std::exception& e) {
        LOG_ERROR("Interrupt hook failed: " + std::string(e.what()));
    }
}

}
