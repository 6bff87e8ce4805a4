/**
 * @file test_logger.cpp
 * @brief Unit tests for the spdlog wrapper
 */

#include <gtest/gtest.h>
#include "logging/logger.h"

using common::Logger;

TEST(LoggerTest, ParseLevel_KnownNames) {
    EXPECT_EQ(Logger::parseLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(Logger::parseLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(Logger::parseLevel("info"), spdlog::level::info);
    EXPECT_EQ(Logger::parseLevel("warn"), spdlog::level::warn);
    EXPECT_EQ(Logger::parseLevel("error"), spdlog::level::err);
    EXPECT_EQ(Logger::parseLevel("critical"), spdlog::level::critical);
}

TEST(LoggerTest, ParseLevel_UnknownFallsBackToInfo) {
    EXPECT_EQ(Logger::parseLevel("verbose"), spdlog::level::info);
    EXPECT_EQ(Logger::parseLevel(""), spdlog::level::info);
}

TEST(LoggerTest, InitializeInstallsDefaultLogger) {
    Logger::initialize("pesel-test", "warn");
    EXPECT_EQ(spdlog::default_logger()->name(), "pesel-test");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::warn);

    Logger::setLevel("error");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::err);

    Logger::setLevel("info");
    Logger::flush();
}
