//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_logger.cpp
// Purpose: GoogleTests for Logger formatting, level parsing and file sink; env helpers and version
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "sso/version.h"

TEST(Logger, FormatSubstitutesPlaceholdersInOrder) {
    EXPECT_EQ(Logger::format("broker={} token={}", std::string("demo"), "tok1"), std::string("broker=demo token=tok1"));
    EXPECT_EQ(Logger::format("{} of {}", 1, 2), std::string("1 of 2"));
    EXPECT_EQ(Logger::format("no args"), std::string("no args"));
}

TEST(Logger, FormatEscapesAndSurplus) {
    EXPECT_EQ(Logger::format("{{}} {}", 5), std::string("{} 5"));
    EXPECT_EQ(Logger::format("{{literal}}"), std::string("{literal}"));
    EXPECT_EQ(Logger::format("a={} b={}", 1), std::string("a=1 b={}"));
    EXPECT_EQ(Logger::format("only {}", 1, 2, 3), std::string("only 1"));
    EXPECT_EQ(Logger::format(nullptr), std::string(""));
}

TEST(Logger, LevelFromString) {
    EXPECT_EQ(Logger::levelFromString("debug"), LogLevel::LOG_DEBUG_LEVEL);
    EXPECT_EQ(Logger::levelFromString("Info"), LogLevel::LOG_INFO_LEVEL);
    EXPECT_EQ(Logger::levelFromString("WARNING"), LogLevel::LOG_WARN_LEVEL);
    EXPECT_EQ(Logger::levelFromString("warn"), LogLevel::LOG_WARN_LEVEL);
    EXPECT_EQ(Logger::levelFromString("error"), LogLevel::LOG_ERROR_LEVEL);
    EXPECT_EQ(Logger::levelFromString("FATAL"), LogLevel::LOG_FATAL_LEVEL);
    EXPECT_EQ(Logger::levelFromString("bogus"), LogLevel::LOG_DEBUG_LEVEL);
}

TEST(Logger, FileSinkReceivesMessagesAtOrAboveLevel) {
    const std::string path = ::testing::TempDir() + "sso_logger_test.log";
    std::remove(path.c_str());

    const LogLevel saved = Logger::sLogLevel;
    Logger::setLogFile(path);
    Logger::setLogLevel(LogLevel::LOG_WARN_LEVEL);
    LOG_INFO("hidden {}", 1);
    LOG_WARN("Invalid {} checksum (broker={})", "attach", "demo");
    Logger::setLogLevel(saved);

    std::ifstream in(path);
    std::stringstream contents;
    contents << in.rdbuf();
    const std::string text = contents.str();
    EXPECT_NE(text.find("=== Log opened at"), std::string::npos);
    EXPECT_NE(text.find("Invalid attach checksum (broker=demo)"), std::string::npos);
    EXPECT_EQ(text.find("hidden 1"), std::string::npos);
}

TEST(EnvVars, GetEnvOrDefaultAndFlag) {
    ::unsetenv("SSO_TEST_UNSET");
    EXPECT_EQ(GetEnvOrDefault("SSO_TEST_UNSET", "fallback"), std::string("fallback"));
    EXPECT_EQ(GetEnvOrDefault(nullptr, "fallback"), std::string("fallback"));
    EXPECT_FALSE(GetEnvFlag("SSO_TEST_UNSET", false));
    EXPECT_TRUE(GetEnvFlag("SSO_TEST_UNSET", true));

    ::setenv("SSO_TEST_FLAG", "true", 1);
    EXPECT_EQ(GetEnvOrDefault("SSO_TEST_FLAG", "x"), std::string("true"));
    EXPECT_TRUE(GetEnvFlag("SSO_TEST_FLAG", false));
    ::setenv("SSO_TEST_FLAG", "no", 1);
    EXPECT_FALSE(GetEnvFlag("SSO_TEST_FLAG", true));
    ::unsetenv("SSO_TEST_FLAG");
}

TEST(Version, StringMatchesComponents) {
    const auto v = sso::getVersion();
    EXPECT_EQ(sso::getVersionString(),
              std::to_string(v.major) + "." + std::to_string(v.minor) + "." + std::to_string(v.patch));
}
