#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include "logging.hpp"

using namespace core;

class LoggingTest : public ::testing::Test {};

TEST_F(LoggingTest, FallbackLoggerIsAvailableWithoutInitialize) {
    auto& logger = logging::getLogger();
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->name(), "BacktestLogger");
    EXPECT_NO_THROW(logger->info("fallback logger works"));
}

TEST_F(LoggingTest, GetLoggerReturnsSameInstance) {
    auto first = logging::getLogger();
    auto second = logging::getLogger();
    EXPECT_EQ(first.get(), second.get());
}

TEST_F(LoggingTest, LevelFromString) {
    EXPECT_EQ(logging::level_from_string("trace"), spdlog::level::trace);
    EXPECT_EQ(logging::level_from_string("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(logging::level_from_string("Warning"), spdlog::level::warn);
    EXPECT_EQ(logging::level_from_string("err"), spdlog::level::err);
    EXPECT_EQ(logging::level_from_string("off"), spdlog::level::off);
    EXPECT_EQ(logging::level_from_string("bogus"), spdlog::level::info);
}
