/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rtbridge/logger.hpp"
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>

namespace rtbridge {

namespace {

struct LogState {
    std::mutex mutex;
    bool configured = false;
    LogLevel level = LogLevel::INFO;
    std::unordered_map<std::thread::id, std::string> threadNames;
    std::ofstream file;
};

LogState& state() {
    static LogState s;
    return s;
}

thread_local std::uint64_t t_run = 0;

LogLevel parseLevel(const char* raw) noexcept {
    if (!raw) return LogLevel::INFO;

    std::string value(raw);
    for (char& c : value) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (value == "error") return LogLevel::ERROR;
    if (value == "warn" || value == "warning") return LogLevel::WARN;
    if (value == "debug") return LogLevel::DEBUG;
    if (value == "trace") return LogLevel::TRACE;
    return LogLevel::INFO;
}

// Caller holds the state mutex.
void configureFromEnv(LogState& s) {
    if (s.configured) {
        return;
    }
    s.configured = true;
    s.level = parseLevel(std::getenv("RTBRIDGE_LOG_LEVEL"));
    if (const char* path = std::getenv("RTBRIDGE_LOG_FILE"); path && *path) {
        s.file.open(path, std::ios::app);
        if (!s.file) {
            std::cerr << "rtbridge: cannot open log file " << path << std::endl;
        }
    }
}

std::string threadLabel(LogState& s) {
    auto it = s.threadNames.find(std::this_thread::get_id());
    std::ostringstream oss;
    if (it != s.threadNames.end()) {
        oss << it->second;
    } else {
        oss << "T" << std::this_thread::get_id();
    }
    if (t_run != 0) {
        oss << "#" << t_run;
    }
    return oss.str();
}

}

void Logger::setLevel(LogLevel level) noexcept {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    configureFromEnv(s);
    s.level = level;
}

LogLevel Logger::level() noexcept {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    configureFromEnv(s);
    return s.level;
}

bool Logger::enabled(LogLevel level) noexcept {
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(Logger::level());
}

bool Logger::setLogFile(const std::filesystem::path& path) noexcept {
    try {
        auto& s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        configureFromEnv(s);
        if (s.file.is_open()) {
            s.file.close();
        }
        if (path.empty()) {
            return true;
        }
        s.file.clear();
        s.file.open(path, std::ios::app);
        return s.file.is_open();
    } catch (const std::exception& e) {
        std::cerr << "rtbridge: log file error: " << e.what() << std::endl;
        return false;
    }
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (!enabled(level)) {
            return;
        }

        const auto now = std::chrono::system_clock::now();
        const auto seconds = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        std::tm local{};
        localtime_r(&seconds, &local);

        auto& s = state();
        std::lock_guard<std::mutex> lock(s.mutex);

        std::ostringstream line;
        line << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
             << "." << std::setfill('0') << std::setw(3) << ms.count() << "]"
             << " [" << levelName(level) << "]"
             << " [" << threadLabel(s) << "] "
             << message;

        // stdout belongs to the CLI
        std::cerr << line.str() << std::endl;
        if (s.file.is_open()) {
            s.file << line.str() << '\n';
            s.file.flush();
        }
    } catch (const std::exception&) {
        // Logging must never throw into the caller.
    }
}

const char* Logger::levelName(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

void setThreadName(const std::string& name) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.threadNames[std::this_thread::get_id()] = name;
}

std::string currentThreadName() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return threadLabel(s);
}

LogRunScope::LogRunScope(std::uint64_t run) noexcept : previous_(t_run) {
    t_run = run;
}

LogRunScope::~LogRunScope() {
    t_run = previous_;
}

}
