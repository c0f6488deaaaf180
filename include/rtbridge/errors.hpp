/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace rtbridge {

enum class ErrorKind : std::uint8_t {
    RuntimeNotFound,
    RuntimeLoadFailed,
    PhaseTimeout,
    Cancelled,
    ForeignException,
    UnexpectedResultShape
};

class BridgeError : public std::runtime_error {
public:
    BridgeError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Fatal to bridge construction.
class RuntimeNotFound final : public BridgeError {
public:
    explicit RuntimeNotFound(const std::string& attempted);
    [[nodiscard]] const std::string& attempted() const noexcept { return attempted_; }

private:
    std::string attempted_;
};

// Fatal to bridge construction.
class RuntimeLoadFailed final : public BridgeError {
public:
    explicit RuntimeLoadFailed(const std::string& detail);
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

private:
    std::string detail_;
};

enum class TimeoutScope : std::uint8_t { Step, Total };

class PhaseTimeout final : public BridgeError {
public:
    PhaseTimeout(std::string phase, double elapsed, double limit, TimeoutScope scope);

    [[nodiscard]] const std::string& phase() const noexcept { return phase_; }
    [[nodiscard]] double elapsed() const noexcept { return elapsed_; }
    [[nodiscard]] double limit() const noexcept { return limit_; }
    [[nodiscard]] TimeoutScope scope() const noexcept { return scope_; }

private:
    std::string phase_;
    double elapsed_;
    double limit_;
    TimeoutScope scope_;
};

class Cancelled final : public BridgeError {
public:
    explicit Cancelled(std::string source = "");
    [[nodiscard]] const std::string& source() const noexcept { return source_; }

private:
    std::string source_;
};

class ForeignException final : public BridgeError {
public:
    ForeignException(std::string typeName, std::string message,
                     std::string traceback = "", bool interrupted = false);

    [[nodiscard]] const std::string& typeName() const noexcept { return typeName_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::string& traceback() const noexcept { return traceback_; }
    // True for the runtime's own "interrupted" exception.
    [[nodiscard]] bool interrupted() const noexcept { return interrupted_; }

private:
    std::string typeName_;
    std::string message_;
    std::string traceback_;
    bool interrupted_;
};

class UnexpectedResultShape final : public BridgeError {
public:
    explicit UnexpectedResultShape(const std::string& detail);
};

}
