/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rtbridge {

// Resolved once per process; never mutated afterwards.
struct RuntimeConfig {
    std::string libraryPath;
    std::string home;
    std::vector<std::string> searchPaths;

    [[nodiscard]] std::string joinedSearchPath() const;
};

struct LocatorOptions {
    std::filesystem::path bundleDir;
    std::filesystem::path resourceDir;
    std::filesystem::path privateFrameworksDir;
    std::optional<std::filesystem::path> overrideRoot;

    std::string frameworkName = "Python.framework";
    std::string libraryName = "Python";
    std::string defaultVersion = "3.10";
    std::string siteDirName = "python_site";

    // Derives the bundle layout from the running executable. RTBRIDGE_RUNTIME_ROOT,
    // when set, is searched before any bundle location.
    [[nodiscard]] static LocatorOptions fromExecutable();
};

class Locator final {
public:
    explicit Locator(LocatorOptions options) noexcept;

    [[nodiscard]] std::optional<RuntimeConfig> locate() const;

    // Candidate framework roots in priority order, duplicates removed.
    [[nodiscard]] std::vector<std::filesystem::path> candidates() const;
    [[nodiscard]] std::string describeCandidates() const;

    [[nodiscard]] const LocatorOptions& options() const noexcept { return options_; }

private:
    LocatorOptions options_;

    [[nodiscard]] std::filesystem::path resolveVersionDir(const std::filesystem::path& root) const;
    [[nodiscard]] std::vector<std::string> searchPaths(const std::filesystem::path& stdlib) const;
};

}
