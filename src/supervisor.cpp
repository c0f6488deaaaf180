/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rtbridge/supervisor.hpp"
#include "rtbridge/errors.hpp"
#include "rtbridge/logger.hpp"
#include <iomanip>
#include <sstream>

namespace rtbridge {

namespace {

double secondsSince(PhaseSupervisor::Clock::time_point start) {
    return std::chrono::duration<double>(PhaseSupervisor::Clock::now() - start).count();
}

std::string fmt(double seconds) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << seconds << "s";
    return oss.str();
}

}

PhaseSupervisor::PhaseSupervisor(Interpreter& interpreter, CancellationCoordinator& cancellation,
                                 TimerScheduler& timers, bool tracing) noexcept
    : interpreter_(interpreter), cancellation_(cancellation), timers_(timers), tracing_(tracing) {}

std::string PhaseSupervisor::timerSource(const std::string& phase) {
    return "timeout_" + toUpperKey(phase);
}

void PhaseSupervisor::enter(const Phase& phase, Clock::time_point jobStart) {
    cancellation_.check();

    const auto& t = phase.timeouts;
    if (tracing_ || phase.name == "env_setup") {
        LOG_INFO("Timeout config for " + phase.name + ": step=" + fmt(t.step) + " total=" + fmt(t.total) +
                 (t.disabled ? " (disabled)" : ""));
    }

    if (t.timersEnabled() && t.total > 0) {
        const double elapsed = secondsSince(jobStart);
        if (elapsed > t.total) {
            LOG_ERROR("Total timeout exceeded before " + phase.name + ": " + fmt(elapsed) + " > " + fmt(t.total));
            throw PhaseTimeout(phase.name, elapsed, t.total, TimeoutScope::Total);
        }
    }
    LOG_DEBUG("Phase " + phase.name + " starting");
}

TimerScheduler::TimerId PhaseSupervisor::armStepTimer(const Phase& phase, RunToken token) {
    const auto& t = phase.timeouts;
    if (!t.timersEnabled() || t.step <= 0) {
        return 0;
    }

    const std::string source = timerSource(phase.name);
    const std::string name = phase.name;
    auto* cancellation = &cancellation_;
    const auto id = timers_.schedule(std::chrono::duration<double>(t.step), [cancellation, token, source, name] {
        LOG_WARN("Step timer fired for " + name + " (run " + std::to_string(token) + ")");
        if (!cancellation->requestCancelIfCurrent(token, source)) {
            LOG_DEBUG("Step timer for " + name + " belongs to a stale run; ignored");
        }
    });
    if (id == 0) {
        LOG_WARN("Step timer unavailable for " + phase.name);
    }
    return id;
}

void PhaseSupervisor::leave(const Phase& phase, TimerScheduler::TimerId timer, Clock::time_point started) {
    timers_.cancel(timer);

    const double elapsed = secondsSince(started);
    const auto& t = phase.timeouts;
    if (t.timersEnabled() && t.step > 0 && elapsed > t.step) {
        LOG_ERROR("Step timeout: " + phase.name + " took " + fmt(elapsed) + " > " + fmt(t.step));
        throw PhaseTimeout(phase.name, elapsed, t.step, TimeoutScope::Step);
    }

    cancellation_.check();
    LOG_INFO("Phase " + phase.name + " completed in " + fmt(elapsed));
}

void PhaseSupervisor::fail(const Phase& phase, RunToken token, TimerScheduler::TimerId timer,
                           Clock::time_point started, std::exception_ptr error) {
    timers_.cancel(timer);
    const double elapsed = secondsSince(started);

    bool unwoundByCancel = false;
    try {
        std::rethrow_exception(error);
    } catch (const Cancelled&) {
        unwoundByCancel = true;
    } catch (const ForeignException& e) {
        unwoundByCancel = e.interrupted();
    } catch (const std::exception& e) {
        LOG_DEBUG("Phase " + phase.name + " failed: " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR("Phase " + phase.name + " failed with unknown error");
    }

    if (unwoundByCancel) {
        const auto source = cancellation_.cancelSource(token);
        if (source && *source == timerSource(phase.name)) {
            LOG_ERROR("Step timeout: " + phase.name + " interrupted after " + fmt(elapsed) + " > " +
                      fmt(phase.timeouts.step));
            throw PhaseTimeout(phase.name, elapsed, phase.timeouts.step, TimeoutScope::Step);
        }
    }
    std::rethrow_exception(error);
}

}
