/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <exception>
#include <string>
#include <type_traits>
#include <utility>

#include "rtbridge/cancellation.hpp"
#include "rtbridge/interpreter.hpp"
#include "rtbridge/timeouts.hpp"
#include "rtbridge/timer.hpp"
#include "rtbridge/types.hpp"

namespace rtbridge {

struct Phase {
    std::string name;
    PhaseTimeouts timeouts;
};

// Runs job phases on the affinity thread, each under the runtime lock and
// bounded by its step timeout and the job's total timeout.
class PhaseSupervisor final {
public:
    using Clock = std::chrono::steady_clock;

    PhaseSupervisor(Interpreter& interpreter, CancellationCoordinator& cancellation,
                    TimerScheduler& timers, bool tracing) noexcept;

    PhaseSupervisor(const PhaseSupervisor&) = delete;
    PhaseSupervisor& operator=(const PhaseSupervisor&) = delete;

    template <typename Body>
    auto runPhase(const Phase& phase, RunToken token, Clock::time_point jobStart, Body&& body)
        -> decltype(body()) {
        using Result = decltype(body());

        enter(phase, jobStart);
        const auto timer = armStepTimer(phase, token);
        const auto started = Clock::now();
        try {
            if constexpr (std::is_void_v<Result>) {
                interpreter_.withLock([&] {
                    cancellation_.check();
                    body();
                });
                leave(phase, timer, started);
            } else {
                Result result = interpreter_.withLock([&]() -> Result {
                    cancellation_.check();
                    return body();
                });
                leave(phase, timer, started);
                return result;
            }
        } catch (...) {
            fail(phase, token, timer, started, std::current_exception());
        }
    }

    // Cancel source a fired step timer records for phase.
    [[nodiscard]] static std::string timerSource(const std::string& phase);

private:
    void enter(const Phase& phase, Clock::time_point jobStart);
    [[nodiscard]] TimerScheduler::TimerId armStepTimer(const Phase& phase, RunToken token);
    void leave(const Phase& phase, TimerScheduler::TimerId timer, Clock::time_point started);
    [[noreturn]] void fail(const Phase& phase, RunToken token, TimerScheduler::TimerId timer,
                           Clock::time_point started, std::exception_ptr error);

    Interpreter& interpreter_;
    CancellationCoordinator& cancellation_;
    TimerScheduler& timers_;
    bool tracing_;
};

}
