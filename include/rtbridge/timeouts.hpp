/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace rtbridge {

// Where named configuration values come from. Tests inject a map instead of
// mutating the process environment.
class OverrideSource {
public:
    virtual ~OverrideSource() = default;
    [[nodiscard]] virtual std::optional<std::string> get(const std::string& name) const = 0;
};

class EnvironmentOverrides final : public OverrideSource {
public:
    [[nodiscard]] std::optional<std::string> get(const std::string& name) const override;
};

class MapOverrides final : public OverrideSource {
public:
    MapOverrides() = default;
    explicit MapOverrides(std::map<std::string, std::string> values);

    void set(const std::string& name, const std::string& value);
    void erase(const std::string& name);

    [[nodiscard]] std::optional<std::string> get(const std::string& name) const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> values_;
};

struct PhaseTimeouts {
    double step = 0.0;
    double total = 0.0;
    bool disabled = false;

    [[nodiscard]] bool timersEnabled() const noexcept { return !disabled; }
};

// Resolves <PREFIX>_<OPERATION>_STEP_TIMEOUT, <PREFIX>_<OPERATION>_TOTAL_TIMEOUT,
// <PREFIX>_DISABLE_PY_TIMEOUTS and <PREFIX>_DISABLE_<OPERATION>_TIMEOUT.
class TimeoutConfig final {
public:
    explicit TimeoutConfig(std::shared_ptr<const OverrideSource> source,
                           std::string prefix = "RTBRIDGE");

    [[nodiscard]] double step(const std::string& operation, double defaultValue) const;
    [[nodiscard]] double total(const std::string& operation, double defaultValue) const;
    [[nodiscard]] bool disabled(const std::string& operation) const;
    [[nodiscard]] PhaseTimeouts resolve(const std::string& operation, double defaultStep, double defaultTotal) const;

    [[nodiscard]] bool tracingEnabled() const;

    // <PREFIX>_<name>, unset or empty values yield nullopt.
    [[nodiscard]] std::optional<std::string> value(const std::string& name) const;

    [[nodiscard]] const std::string& prefix() const noexcept { return prefix_; }

private:
    std::shared_ptr<const OverrideSource> source_;
    std::string prefix_;

    [[nodiscard]] double seconds(const std::string& key, double defaultValue) const;
    [[nodiscard]] bool flag(const std::string& key) const;
};

[[nodiscard]] std::string toUpperKey(const std::string& operation);

}
