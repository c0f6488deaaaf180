/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace rtbridge {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

// Process-wide logger. Lines go to stderr and, when set, to an append-only file.
// RTBRIDGE_LOG_LEVEL and RTBRIDGE_LOG_FILE are read on first use.
class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    // Empty path closes the file sink. Returns false when the file cannot be opened.
    static bool setLogFile(const std::filesystem::path& path) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    [[nodiscard]] static const char* levelName(LogLevel level) noexcept;
};

void setThreadName(const std::string& name);
[[nodiscard]] std::string currentThreadName();

// Tags this thread's log lines with a run generation until destroyed.
class LogRunScope final {
public:
    explicit LogRunScope(std::uint64_t run) noexcept;
    ~LogRunScope();

    LogRunScope(const LogRunScope&) = delete;
    LogRunScope& operator=(const LogRunScope&) = delete;

private:
    std::uint64_t previous_;
};

}

#define LOG_ERROR(msg) ::rtbridge::Logger::error(msg)
#define LOG_WARN(msg)  ::rtbridge::Logger::warn(msg)
#define LOG_INFO(msg)  ::rtbridge::Logger::info(msg)
#define LOG_DEBUG(msg) ::rtbridge::Logger::debug(msg)
#define LOG_TRACE(msg) ::rtbridge::Logger::trace(msg)
