/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rtbridge/timeouts.hpp"
#include "rtbridge/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace rtbridge {

std::string toUpperKey(const std::string& operation) {
    std::string key = operation;
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return c == '-' || c == '.' || c == ' ' ? '_' : static_cast<char>(std::toupper(c));
    });
    return key;
}

std::optional<std::string> EnvironmentOverrides::get(const std::string& name) const {
    if (const char* value = std::getenv(name.c_str())) {
        return std::string(value);
    }
    return std::nullopt;
}

MapOverrides::MapOverrides(std::map<std::string, std::string> values)
    : values_(std::move(values)) {}

void MapOverrides::set(const std::string& name, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[name] = value;
}

void MapOverrides::erase(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.erase(name);
}

std::optional<std::string> MapOverrides::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(name);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

TimeoutConfig::TimeoutConfig(std::shared_ptr<const OverrideSource> source, std::string prefix)
    : source_(source ? std::move(source) : std::make_shared<EnvironmentOverrides>()),
      prefix_(std::move(prefix)) {}

double TimeoutConfig::step(const std::string& operation, double defaultValue) const {
    return seconds(prefix_ + "_" + toUpperKey(operation) + "_STEP_TIMEOUT", defaultValue);
}

double TimeoutConfig::total(const std::string& operation, double defaultValue) const {
    return seconds(prefix_ + "_" + toUpperKey(operation) + "_TOTAL_TIMEOUT", defaultValue);
}

bool TimeoutConfig::disabled(const std::string& operation) const {
    if (flag(prefix_ + "_DISABLE_PY_TIMEOUTS")) {
        return true;
    }
    return flag(prefix_ + "_DISABLE_" + toUpperKey(operation) + "_TIMEOUT");
}

PhaseTimeouts TimeoutConfig::resolve(const std::string& operation, double defaultStep, double defaultTotal) const {
    PhaseTimeouts timeouts;
    timeouts.step = step(operation, defaultStep);
    timeouts.total = total(operation, defaultTotal);
    timeouts.disabled = disabled(operation);
    return timeouts;
}

bool TimeoutConfig::tracingEnabled() const {
    return flag(prefix_ + "_TRACE_PY_SETUP");
}

std::optional<std::string> TimeoutConfig::value(const std::string& name) const {
    auto raw = source_->get(prefix_ + "_" + name);
    if (!raw || raw->empty()) {
        return std::nullopt;
    }
    return raw;
}

double TimeoutConfig::seconds(const std::string& key, double defaultValue) const {
    auto raw = source_->get(key);
    if (!raw || raw->empty()) {
        return defaultValue;
    }

    try {
        std::size_t consumed = 0;
        double parsed = std::stod(*raw, &consumed);
        if (consumed != raw->size() || !std::isfinite(parsed) || parsed <= 0.0) {
            LOG_WARN("Ignoring timeout override " + key + "=" + *raw);
            return defaultValue;
        }
        return parsed;
    } catch (const std::exception&) {
        LOG_WARN("Ignoring unparsable timeout override " + key + "=" + *raw);
        return defaultValue;
    }
}

bool TimeoutConfig::flag(const std::string& key) const {
    auto raw = source_->get(key);
    if (!raw) {
        return false;
    }
    std::string value = *raw;
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value == "1" || value == "true" || value == "yes";
}

}
