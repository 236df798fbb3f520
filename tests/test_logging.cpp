/**
 * @file test_logging.cpp
 * @brief Tests for the shared spdlog logger (GoogleTest)
 */

#include <gtest/gtest.h>
#include "jpatch/Logging.hpp"
#include "jpatch/Errors.hpp"

using namespace jpatch;

TEST(Logging, LoggerIsRegisteredUnderItsName) {
    auto log = logger();
    ASSERT_NE(log, nullptr);
    EXPECT_EQ(log->name(), kLoggerName);
    EXPECT_EQ(spdlog::get(kLoggerName), log);
}

TEST(Logging, InitReconfiguresTheSameLogger) {
    auto first = logger();
    auto again = init_logging(spdlog::level::debug);
    EXPECT_EQ(first, again);
    EXPECT_EQ(again->level(), spdlog::level::debug);
    EXPECT_EQ(again->sinks().size(), 1u);

    init_logging(spdlog::level::off);
    EXPECT_EQ(logger()->level(), spdlog::level::off);
}

TEST(Logging, ParseLevelNames) {
    EXPECT_EQ(parse_log_level("trace"), spdlog::level::trace);
    EXPECT_EQ(parse_log_level("info"), spdlog::level::info);
    EXPECT_EQ(parse_log_level("error"), spdlog::level::err);
    EXPECT_EQ(parse_log_level("off"), spdlog::level::off);
    EXPECT_THROW(parse_log_level("verbose"), ConfigError);
}
