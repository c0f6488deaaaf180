/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "rtbridge/locator.hpp"

namespace rtbridge {

constexpr std::uint16_t kDefaultModelServicePort = 11434;

// Host variables that would leak an unrelated interpreter setup into ours.
[[nodiscard]] const std::vector<std::string>& leakedRuntimeVariables() noexcept;

[[nodiscard]] std::filesystem::path defaultIsolatedTempDir();

// Unsets leaked variables, wipes and recreates tempDir, then points TMPDIR at it.
void sanitizeProcessEnvironment(const std::filesystem::path& tempDir);

// PYTHONHOME / PYTHONPATH and friends for the located runtime.
void applyRuntimeEnvironment(const RuntimeConfig& config);

// Overwrites regular files with zeros before removing the tree.
bool secureEraseDirectory(const std::filesystem::path& dir) noexcept;
void secureEraseFile(const std::filesystem::path& file) noexcept;

// Wipe and recreate, leaving TMPDIR valid for later jobs.
bool resetIsolatedTempDir(const std::filesystem::path& dir) noexcept;

// Normalises "scheme://host:port/path" style values to 127.0.0.1:<port>.
[[nodiscard]] std::string resolveLoopbackHost(const std::optional<std::string>& raw,
                                              std::uint16_t fallbackPort = kDefaultModelServicePort);
[[nodiscard]] std::optional<std::uint16_t> portOf(const std::string& host);

[[nodiscard]] bool isPortReachable(std::uint16_t port,
                                   std::chrono::milliseconds timeout = std::chrono::milliseconds(1000)) noexcept;

}
