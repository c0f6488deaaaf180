/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rtbridge/errors.hpp"
#include <iomanip>
#include <sstream>
#include <utility>

namespace rtbridge {

namespace {

std::string seconds(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << "s";
    return oss.str();
}

std::string timeoutMessage(const std::string& phase, double elapsed, double limit, TimeoutScope scope) {
    if (scope == TimeoutScope::Total) {
        return "Total timeout exceeded (" + seconds(elapsed) + " > " + seconds(limit) + ") during: " + phase;
    }
    return "Step timeout: " + phase + " took " + seconds(elapsed) + " > " + seconds(limit);
}

std::string foreignMessage(const std::string& typeName, const std::string& message) {
    if (message.empty()) {
        return "Foreign exception " + typeName;
    }
    return "Foreign exception " + typeName + ": " + message;
}

}

RuntimeNotFound::RuntimeNotFound(const std::string& attempted)
    : BridgeError(ErrorKind::RuntimeNotFound,
                  attempted.empty() ? "Runtime not found" : "Runtime not found. Tried: " + attempted),
      attempted_(attempted) {}

RuntimeLoadFailed::RuntimeLoadFailed(const std::string& detail)
    : BridgeError(ErrorKind::RuntimeLoadFailed, "Runtime load failed: " + detail),
      detail_(detail) {}

PhaseTimeout::PhaseTimeout(std::string phase, double elapsed, double limit, TimeoutScope scope)
    : BridgeError(ErrorKind::PhaseTimeout, timeoutMessage(phase, elapsed, limit, scope)),
      phase_(std::move(phase)), elapsed_(elapsed), limit_(limit), scope_(scope) {}

Cancelled::Cancelled(std::string source)
    : BridgeError(ErrorKind::Cancelled, source.empty() ? "Cancelled" : "Cancelled (source: " + source + ")"),
      source_(std::move(source)) {}

ForeignException::ForeignException(std::string typeName, std::string message,
                                   std::string traceback, bool interrupted)
    : BridgeError(ErrorKind::ForeignException, foreignMessage(typeName, message)),
      typeName_(std::move(typeName)), message_(std::move(message)),
      traceback_(std::move(traceback)), interrupted_(interrupted) {}

UnexpectedResultShape::UnexpectedResultShape(const std::string& detail)
    : BridgeError(ErrorKind::UnexpectedResultShape, "Unexpected result shape: " + detail) {}

}
