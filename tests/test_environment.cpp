/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fake_runtime.hpp"
#include "rtbridge/environment.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>

using namespace rtbridge;
using namespace rtbridge::testing;
namespace fs = std::filesystem;

namespace {

// Restores TMPDIR so later tests keep using the shared scratch root.
class EnvironmentTest : public ::testing::Test {
protected:
    void SetUp() override {
        (void)testRoot();
        if (const char* tmp = std::getenv("TMPDIR")) {
            savedTmp_ = tmp;
        }
    }
    void TearDown() override {
        if (savedTmp_) {
            ::setenv("TMPDIR", savedTmp_->c_str(), 1);
        } else {
            ::unsetenv("TMPDIR");
        }
    }

private:
    std::optional<std::string> savedTmp_;
};

}

TEST_F(EnvironmentTest, SanitizeUnsetsLeakedVariablesAndRedirectsTemp) {
    ::setenv("PYTHONSTARTUP", "/home/user/.pythonrc", 1);
    ::setenv("VIRTUAL_ENV", "/home/user/venv", 1);
    const auto temp = uniqueDir("sanitize") / "isolated";
    fs::create_directories(temp);
    std::ofstream(temp / "leftover.txt") << "secret";

    sanitizeProcessEnvironment(temp);

    EXPECT_EQ(std::getenv("PYTHONSTARTUP"), nullptr);
    EXPECT_EQ(std::getenv("VIRTUAL_ENV"), nullptr);
    ASSERT_NE(std::getenv("TMPDIR"), nullptr);
    EXPECT_EQ(fs::path(std::getenv("TMPDIR")), temp);
    EXPECT_TRUE(fs::is_directory(temp));
    EXPECT_FALSE(fs::exists(temp / "leftover.txt"));
}

TEST_F(EnvironmentTest, ApplyRuntimeEnvironmentSetsHomeAndPath) {
    RuntimeConfig config;
    config.home = "/opt/runtime/Versions/3.11";
    config.searchPaths = {"/opt/site", "/opt/runtime/lib"};
    applyRuntimeEnvironment(config);
    EXPECT_STREQ(std::getenv("PYTHONHOME"), "/opt/runtime/Versions/3.11");
    EXPECT_STREQ(std::getenv("PYTHONPATH"), "/opt/site:/opt/runtime/lib");
    EXPECT_STREQ(std::getenv("PYTHONNOUSERSITE"), "1");
    ::unsetenv("PYTHONHOME");
    ::unsetenv("PYTHONPATH");
    ::unsetenv("PYTHONNOUSERSITE");
    ::unsetenv("PYTHONDONTWRITEBYTECODE");
}

TEST_F(EnvironmentTest, SecureEraseRemovesTree) {
    const auto dir = uniqueDir("erase");
    fs::create_directories(dir / "nested");
    std::ofstream(dir / "nested" / "a.bin") << std::string(4096, 'a');
    std::ofstream(dir / "empty.txt");
    EXPECT_TRUE(secureEraseDirectory(dir));
    EXPECT_FALSE(fs::exists(dir));
    EXPECT_TRUE(secureEraseDirectory(dir));
}

TEST_F(EnvironmentTest, ResetRecreatesEmptyDirectory) {
    const auto dir = uniqueDir("reset");
    std::ofstream(dir / "report.json") << "{}";
    EXPECT_TRUE(resetIsolatedTempDir(dir));
    EXPECT_TRUE(fs::is_directory(dir));
    EXPECT_TRUE(fs::is_empty(dir));
}

TEST(LoopbackHostTest, NormalisesToLoopback) {
    EXPECT_EQ(resolveLoopbackHost(std::nullopt), "127.0.0.1:11434");
    EXPECT_EQ(resolveLoopbackHost(std::string("")), "127.0.0.1:11434");
    EXPECT_EQ(resolveLoopbackHost(std::string("http://localhost:8080/api")), "127.0.0.1:8080");
    EXPECT_EQ(resolveLoopbackHost(std::string("  remote.example:9000  ")), "127.0.0.1:9000");
    EXPECT_EQ(resolveLoopbackHost(std::string("7000")), "127.0.0.1:7000");
    EXPECT_EQ(resolveLoopbackHost(std::string("host:notaport")), "127.0.0.1:11434");
    EXPECT_EQ(resolveLoopbackHost(std::string("host:70000"), 1234), "127.0.0.1:1234");
}

TEST(LoopbackHostTest, PortOf) {
    EXPECT_EQ(portOf("127.0.0.1:11434").value_or(0), 11434);
    EXPECT_FALSE(portOf("127.0.0.1").has_value());
    EXPECT_FALSE(portOf("127.0.0.1:0").has_value());
}

TEST(LoopbackHostTest, ClosedPortIsUnreachable) {
    // Port 1 needs root to listen on; nothing answers there in a test sandbox.
    EXPECT_FALSE(isPortReachable(1, std::chrono::milliseconds(100)));
}
