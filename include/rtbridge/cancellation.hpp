/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "rtbridge/types.hpp"

namespace rtbridge {

// Cancel flag, external predicate and generation token share one mutex, so a
// token compare and the flag set it guards are a single atomic step.
class CancellationCoordinator final {
public:
    // Called after the lock is released, with the generation that was current
    // when the request landed.
    using InterruptHook = std::function<void(RunToken token, const std::string& source)>;

    CancellationCoordinator() = default;

    CancellationCoordinator(const CancellationCoordinator&) = delete;
    CancellationCoordinator& operator=(const CancellationCoordinator&) = delete;
    CancellationCoordinator(CancellationCoordinator&&) = delete;
    CancellationCoordinator& operator=(CancellationCoordinator&&) = delete;

    void setInterruptHook(InterruptHook hook);

    // Mints a fresh token and clears any pending request.
    [[nodiscard]] RunToken beginGeneration();
    void endGeneration(RunToken token);

    [[nodiscard]] RunToken currentGeneration() const;
    [[nodiscard]] bool isActive(RunToken token) const;

    void setExternalPredicate(CancellationPredicate predicate);
    void clearExternalPredicate();

    void requestCancel(const std::string& source);

    // Sets the flag only when token is still the active generation.
    bool requestCancelIfCurrent(RunToken token, const std::string& source);

    void clear();

    [[nodiscard]] bool isCancelled() const;

    // Throws Cancelled when isCancelled().
    void check() const;

    // Source recorded for token's generation, if a request landed in it.
    [[nodiscard]] std::optional<std::string> cancelSource(RunToken token) const;

private:
    void notify(RunToken token, bool active, const std::string& source) const;

    mutable std::mutex mutex_;
    bool requested_ = false;
    std::string source_;
    RunToken generation_ = 0;
    RunToken nextToken_ = 1;
    bool active_ = false;
    CancellationPredicate predicate_;
    InterruptHook hook_;
};

}
