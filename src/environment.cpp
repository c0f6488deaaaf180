/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rtbridge/environment.hpp"
#include "rtbridge/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace rtbridge {

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::optional<int> parsePort(const std::string& text) {
    if (text.empty() || text.size() > 5) {
        return std::nullopt;
    }
    if (!std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    int port = std::stoi(text);
    if (port < 1 || port > 65535) {
        return std::nullopt;
    }
    return port;
}

}

const std::vector<std::string>& leakedRuntimeVariables() noexcept {
    static const std::vector<std::string> keys = {
        "PYTHONHOME",
        "PYTHONPATH",
        "PYTHONSTARTUP",
        "PYTHONEXECUTABLE",
        "PYTHONUSERBASE",
        "PYTHONWARNINGS",
        "PYTHONNOUSERSITE",
        "PYTHONINSPECT",
        "PYENV_VERSION",
        "PYENV_ROOT",
        "CONDA_PREFIX",
        "CONDA_DEFAULT_ENV",
        "VIRTUAL_ENV"
    };
    return keys;
}

fs::path defaultIsolatedTempDir() {
    std::error_code ec;
    auto base = fs::temp_directory_path(ec);
    if (ec) {
        base = "/tmp";
    }
    return base / "rtbridge_py";
}

void sanitizeProcessEnvironment(const fs::path& tempDir) {
    for (const auto& key : leakedRuntimeVariables()) {
        if (std::getenv(key.c_str())) {
            ::unsetenv(key.c_str());
            LOG_DEBUG("Unset inherited variable: " + key);
        }
    }

    std::error_code ec;
    if (fs::exists(tempDir, ec)) {
        // Leftovers from a previous session or crash
        secureEraseDirectory(tempDir);
        LOG_DEBUG("Wiped isolated temp dir: " + tempDir.string());
    }

    fs::create_directories(tempDir, ec);
    if (ec) {
        LOG_ERROR("Failed to create isolated temp dir " + tempDir.string() + ": " + ec.message());
        return;
    }
    ::setenv("TMPDIR", tempDir.c_str(), 1);
    LOG_DEBUG("TMPDIR set: " + tempDir.string());
}

void applyRuntimeEnvironment(const RuntimeConfig& config) {
    ::setenv("PYTHONHOME", config.home.c_str(), 1);
    ::setenv("PYTHONPATH", config.joinedSearchPath().c_str(), 1);
    ::setenv("PYTHONNOUSERSITE", "1", 1);
    ::setenv("PYTHONDONTWRITEBYTECODE", "1", 1);
}

void secureEraseFile(const fs::path& file) noexcept {
    std::error_code ec;
    try {
        const auto size = fs::file_size(file, ec);
        if (!ec && size > 0) {
            std::fstream out(file, std::ios::in | std::ios::out | std::ios::binary);
            if (out) {
                constexpr std::uintmax_t chunkSize = 1'048'576;
                static const std::vector<char> zeros(chunkSize, 0);
                std::uintmax_t remaining = size;
                while (remaining > 0 && out) {
                    const auto writeSize = std::min(chunkSize, remaining);
                    out.write(zeros.data(), static_cast<std::streamsize>(writeSize));
                    remaining -= writeSize;
                }
                out.flush();
            }
        }
    } catch (const std::exception& e) {
        LOG_WARN("Secure erase failed for " + file.string() + ": " + e.what());
    }
    fs::remove(file, ec);
}

bool secureEraseDirectory(const fs::path& dir) noexcept {
    try {
        std::error_code ec;
        if (!fs::exists(dir, ec)) {
            return true;
        }

        for (auto it = fs::recursive_directory_iterator(dir, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file(ec) && !it->is_symlink(ec)) {
                secureEraseFile(it->path());
            }
        }

        fs::remove_all(dir, ec);
        if (ec) {
            LOG_WARN("Failed to remove " + dir.string() + ": " + ec.message());
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_WARN("Secure erase failed for " + dir.string() + ": " + e.what());
        return false;
    }
}

bool resetIsolatedTempDir(const fs::path& dir) noexcept {
    try {
        std::error_code ec;
        if (fs::exists(dir, ec)) {
            secureEraseDirectory(dir);
        }
        fs::create_directories(dir, ec);
        if (ec) {
            LOG_ERROR("Failed to recreate temp dir " + dir.string() + ": " + ec.message());
            return false;
        }
        LOG_DEBUG("Temp dir wiped and recreated: " + dir.string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Temp dir cleanup error: " + std::string(e.what()));
        return false;
    }
}

std::string resolveLoopbackHost(const std::optional<std::string>& raw, std::uint16_t fallbackPort) {
    int port = fallbackPort;
    std::string hostPort = raw ? trim(*raw) : "";

    if (!hostPort.empty()) {
        if (auto scheme = hostPort.find("://"); scheme != std::string::npos) {
            hostPort = hostPort.substr(scheme + 3);
        }
        if (auto slash = hostPort.find('/'); slash != std::string::npos) {
            hostPort = hostPort.substr(0, slash);
        }

        auto colon = hostPort.rfind(':');
        if (colon != std::string::npos) {
            if (auto parsed = parsePort(hostPort.substr(colon + 1))) {
                port = *parsed;
            }
        } else if (auto parsed = parsePort(hostPort)) {
            port = *parsed;
        }
    }

    return "127.0.0.1:" + std::to_string(port);
}

std::optional<std::uint16_t> portOf(const std::string& host) {
    auto colon = host.rfind(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }
    if (auto parsed = parsePort(host.substr(colon + 1))) {
        return static_cast<std::uint16_t>(*parsed);
    }
    return std::nullopt;
}

bool isPortReachable(std::uint16_t port, std::chrono::milliseconds timeout) noexcept {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return false;
    }

    int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    bool reachable = false;
    int rc = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (rc == 0) {
        reachable = true;
    } else if (errno == EINPROGRESS) {
        pollfd pfd{fd, POLLOUT, 0};
        if (::poll(&pfd, 1, static_cast<int>(timeout.count())) == 1) {
            int soError = 0;
            socklen_t len = sizeof(soError);
            if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) == 0 && soError == 0) {
                reachable = true;
            }
        }
    }

    ::close(fd);
    return reachable;
}

}
