//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_logger.cpp
// Purpose: Logger level parsing, key=value rendering and file sink tests
//==========================================================================================================

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include <unistd.h>

#include "logging/Logger.h"

TEST(Logger, ParseLevelIsCaseInsensitive) {
    LogLevel level = LogLevel::LOG_INFO_LEVEL;
    EXPECT_TRUE(Logger::parseLevel("debug", level));
    EXPECT_EQ(level, LogLevel::LOG_DEBUG_LEVEL);
    EXPECT_TRUE(Logger::parseLevel("Warn", level));
    EXPECT_EQ(level, LogLevel::LOG_WARN_LEVEL);
    EXPECT_FALSE(Logger::parseLevel("verbose", level));
    EXPECT_EQ(level, LogLevel::LOG_WARN_LEVEL);
}

TEST(Logger, UnknownLevelKeepsCurrent) {
    Logger::setLogLevel(LogLevel::LOG_ERROR_LEVEL);
    EXPECT_FALSE(Logger::setLogLevelFromString("chatty"));
    EXPECT_EQ(Logger::sLogLevel, LogLevel::LOG_ERROR_LEVEL);
    EXPECT_TRUE(Logger::setLogLevelFromString("info"));
    EXPECT_EQ(Logger::sLogLevel, LogLevel::LOG_INFO_LEVEL);
}

TEST(Logger, KvQuotesOnlyWhenNeeded) {
    EXPECT_EQ(Logger::kv("pid", "42"), "pid=42");
    EXPECT_EQ(Logger::kv("msg", ""), "msg=\"\"");
    EXPECT_EQ(Logger::kv("msg", "two words"), "msg=\"two words\"");
    EXPECT_EQ(Logger::kv("stderr", "line1\n\"q\""), "stderr=\"line1\\n\\\"q\\\"\"");
}

TEST(Logger, FileSinkReceivesFilteredMessages) {
    const std::string path = "/tmp/mcphttp_logger_" + std::to_string(::getpid()) + ".log";
    std::remove(path.c_str());
    ASSERT_TRUE(Logger::setLogFile(path));

    Logger::setLogLevel(LogLevel::LOG_WARN_LEVEL);
    LOG_INFO("hidden-info-line {}", 1);
    LOG_WARN("visible-warn-line {}", Logger::kv("k", "v w"));
    Logger::setLogLevel(LogLevel::LOG_INFO_LEVEL);

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    const std::string text = ss.str();
    EXPECT_EQ(text.find("hidden-info-line"), std::string::npos);
    EXPECT_NE(text.find("visible-warn-line k=\"v w\""), std::string::npos);
    EXPECT_NE(text.find("WARN"), std::string::npos);
    std::remove(path.c_str());
}

TEST(Logger, SetLogFileFailsForMissingDirectory) {
    EXPECT_FALSE(Logger::setLogFile("/nonexistent-dir-for-mcphttp/log.txt"));
}
