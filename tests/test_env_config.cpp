//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_env_config.cpp
// Purpose: Environment-driven configuration (STDIOMCP_* variables, log levels)
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "stdiomcp/StdioClient.h"
#include "stdiomcp/version.h"

using namespace stdiomcp;

namespace {
// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name(name) {
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() { ::unsetenv(name); }
private:
    const char* name;
};
} // namespace

TEST(EnvVars, GetEnvOrDefault) {
    ::unsetenv("STDIOMCP_TEST_UNSET");
    EXPECT_EQ(GetEnvOrDefault("STDIOMCP_TEST_UNSET", "fallback"), "fallback");
    ScopedEnv env("STDIOMCP_TEST_SET", "value");
    EXPECT_EQ(GetEnvOrDefault("STDIOMCP_TEST_SET", "fallback"), "value");
    EXPECT_EQ(GetEnvOrDefault(nullptr, "fallback"), "fallback");
}

TEST(EnvVars, ParseUnsigned) {
    EXPECT_EQ(ParseUnsigned("0"), 0u);
    EXPECT_EQ(ParseUnsigned("2500"), 2500u);
    EXPECT_FALSE(ParseUnsigned("").has_value());
    EXPECT_FALSE(ParseUnsigned("-1").has_value());
    EXPECT_FALSE(ParseUnsigned("10ms").has_value());
    EXPECT_FALSE(ParseUnsigned("99999999999999999999999").has_value());
}

TEST(Logger, LevelFromString) {
    EXPECT_EQ(Logger::levelFromString("debug"), LogLevel::LOG_DEBUG_LEVEL);
    EXPECT_EQ(Logger::levelFromString("Warning"), LogLevel::LOG_WARN_LEVEL);
    EXPECT_EQ(Logger::levelFromString("ERROR"), LogLevel::LOG_ERROR_LEVEL);
    EXPECT_EQ(Logger::levelFromString("bogus", LogLevel::LOG_WARN_LEVEL), LogLevel::LOG_WARN_LEVEL);
}

TEST(ClientOptions, DefaultsIdentifyTheClient) {
    ClientOptions o;
    EXPECT_EQ(o.clientInfo.name, CLIENT_NAME);
    EXPECT_EQ(o.clientInfo.version, getVersionString());
    EXPECT_EQ(o.framing, FramingMode::NewlineDelimited);
    EXPECT_EQ(o.stderrMode, StderrMode::Inherit);
    EXPECT_EQ(o.requestTimeoutMs, 0u);
    EXPECT_EQ(o.initializeTimeout.count(), 30000);
}

TEST(ClientOptions, FromEnvironmentReadsOverrides) {
    ScopedEnv framing("STDIOMCP_FRAMING", "content-length");
    ScopedEnv timeout("STDIOMCP_REQUEST_TIMEOUT_MS", "1500");
    ScopedEnv term("STDIOMCP_TERMINATE_TIMEOUT_MS", "250");
    ScopedEnv kill("STDIOMCP_KILL_TIMEOUT_MS", "300");
    ScopedEnv init("STDIOMCP_INITIALIZE_TIMEOUT_MS", "4000");
    ScopedEnv stderrMode("STDIOMCP_SERVER_STDERR", "Discard");

    ClientOptions o = ClientOptions::FromEnvironment();
    EXPECT_EQ(o.framing, FramingMode::ContentLength);
    EXPECT_EQ(o.requestTimeoutMs, 1500u);
    EXPECT_EQ(o.terminateTimeout.count(), 250);
    EXPECT_EQ(o.killTimeout.count(), 300);
    EXPECT_EQ(o.initializeTimeout.count(), 4000);
    EXPECT_EQ(o.stderrMode, StderrMode::Discard);
}

TEST(ClientOptions, MalformedValuesKeepDefaults) {
    ScopedEnv framing("STDIOMCP_FRAMING", "carrier-pigeon");
    ScopedEnv timeout("STDIOMCP_REQUEST_TIMEOUT_MS", "soon");
    ScopedEnv term("STDIOMCP_TERMINATE_TIMEOUT_MS", "-5");
    ScopedEnv stderrMode("STDIOMCP_SERVER_STDERR", "somewhere");

    ClientOptions o = ClientOptions::FromEnvironment();
    EXPECT_EQ(o.framing, FramingMode::NewlineDelimited);
    EXPECT_EQ(o.requestTimeoutMs, 0u);
    EXPECT_EQ(o.terminateTimeout.count(), 2000);
    EXPECT_EQ(o.stderrMode, StderrMode::Inherit);
}

TEST(Version, StringMatchesComponents) {
    const auto v = getVersion();
    EXPECT_EQ(getVersionString(), std::to_string(v.major) + "." + std::to_string(v.minor) + "." + std::to_string(v.patch));
}
