/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rtbridge/locator.hpp"
#include "rtbridge/logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <regex>

namespace fs = std::filesystem;

namespace rtbridge {

namespace {

bool pathExists(const fs::path& path) {
    std::error_code ec;
    return !path.empty() && fs::exists(path, ec);
}

fs::path executablePath() {
    std::error_code ec;
    auto exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return fs::current_path(ec) / "rtbrun";
    }
    return exe;
}

bool isVersionName(const std::string& name) {
    static const std::regex versionRegex("^[0-9]+\\.[0-9]+.*$");
    return std::regex_match(name, versionRegex);
}

}

std::string RuntimeConfig::joinedSearchPath() const {
    std::string joined;
    for (const auto& path : searchPaths) {
        if (!joined.empty()) joined += ":";
        joined += path;
    }
    return joined;
}

LocatorOptions LocatorOptions::fromExecutable() {
    LocatorOptions options;
    const fs::path exeDir = executablePath().parent_path();
    const fs::path parent = exeDir.parent_path();

    if (parent.filename() == "Contents") {
        // <bundle>/Contents/MacOS/<exe>
        options.bundleDir = parent.parent_path();
        options.privateFrameworksDir = parent / "Frameworks";
        options.resourceDir = parent / "Resources";
    } else {
        // <prefix>/bin/<exe>
        options.bundleDir = parent;
        options.privateFrameworksDir = parent / "lib";
        options.resourceDir = parent / "share" / "rtbridge";
    }

    if (const char* root = std::getenv("RTBRIDGE_RUNTIME_ROOT")) {
        if (*root) {
            options.overrideRoot = fs::path(root);
        }
    }
    return options;
}

Locator::Locator(LocatorOptions options) noexcept : options_(std::move(options)) {}

std::vector<fs::path> Locator::candidates() const {
    std::vector<fs::path> result;
    auto append = [&result](const fs::path& path) {
        if (path.empty()) return;
        auto normal = path.lexically_normal();
        if (std::find(result.begin(), result.end(), normal) == result.end()) {
            result.push_back(normal);
        }
    };

    if (options_.overrideRoot) {
        append(*options_.overrideRoot);
    }
    if (!options_.privateFrameworksDir.empty()) {
        append(options_.privateFrameworksDir / options_.frameworkName);
    }
    if (!options_.bundleDir.empty()) {
        append(options_.bundleDir / "Contents" / "Frameworks" / options_.frameworkName);
        append(options_.bundleDir / "Frameworks" / options_.frameworkName);
    }
    if (!options_.resourceDir.empty()) {
        append(options_.resourceDir / "Frameworks" / options_.frameworkName);
    }
    return result;
}

std::string Locator::describeCandidates() const {
    std::string described;
    for (const auto& candidate : candidates()) {
        if (!described.empty()) described += "; ";
        described += candidate.string();
    }
    return described;
}

std::optional<RuntimeConfig> Locator::locate() const {
    std::optional<fs::path> root;
    for (const auto& candidate : candidates()) {
        LOG_DEBUG("Checking runtime candidate: " + candidate.string());
        if (pathExists(candidate / options_.libraryName)) {
            root = candidate;
            break;
        }
    }

    if (!root) {
        LOG_ERROR("Runtime framework not found. Tried: " + describeCandidates());
        return std::nullopt;
    }

    const fs::path versionDir = resolveVersionDir(*root);
    const std::string version = versionDir.filename().string();
    const fs::path stdlib = versionDir / "lib" / ("python" + version);

    if (!pathExists(stdlib)) {
        LOG_ERROR("Runtime standard library missing: " + stdlib.string());
        return std::nullopt;
    }

    RuntimeConfig config;
    config.libraryPath = (*root / options_.libraryName).string();
    config.home = versionDir.string();
    config.searchPaths = searchPaths(stdlib);

    LOG_DEBUG("Runtime located: lib=" + config.libraryPath + " home=" + config.home);
    return config;
}

fs::path Locator::resolveVersionDir(const fs::path& root) const {
    const fs::path versionsDir = root / "Versions";
    const fs::path currentLink = versionsDir / "Current";

    std::error_code ec;
    if (fs::is_symlink(currentLink, ec)) {
        auto target = fs::read_symlink(currentLink, ec);
        if (!ec) {
            return target.is_absolute() ? target.lexically_normal()
                                        : (versionsDir / target).lexically_normal();
        }
    }

    std::vector<fs::path> versions;
    if (fs::is_directory(versionsDir, ec)) {
        for (const auto& entry : fs::directory_iterator(versionsDir, ec)) {
            const std::string name = entry.path().filename().string();
            if (name.empty() || name[0] == '.') continue;
            if (isVersionName(name)) {
                versions.push_back(entry.path());
            }
        }
    }

    if (!versions.empty()) {
        std::sort(versions.begin(), versions.end());
        return versions.front();
    }

    LOG_WARN("No runtime version directory found, assuming " + options_.defaultVersion);
    return versionsDir / options_.defaultVersion;
}

std::vector<std::string> Locator::searchPaths(const fs::path& stdlib) const {
    std::vector<std::string> paths;

    // App-vendored packages first so they shadow the runtime's own copies.
    std::vector<fs::path> siteCandidates;
    if (!options_.resourceDir.empty()) {
        siteCandidates.push_back(options_.resourceDir / options_.siteDirName);
    }
    if (!options_.bundleDir.empty()) {
        siteCandidates.push_back(options_.bundleDir / "Contents" / "Resources" / options_.siteDirName);
    }
    for (const auto& site : siteCandidates) {
        if (pathExists(site)) {
            paths.push_back(site.string());
            break;
        }
    }

    const fs::path sitePackages = stdlib / "site-packages";
    if (pathExists(sitePackages)) {
        paths.push_back(sitePackages.string());
    }

    paths.push_back(stdlib.string());
    return paths;
}

}
