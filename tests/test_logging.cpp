#include <gtest/gtest.h>
#include <common/logging.hpp>

using namespace bikefit;

TEST(LoggingTest, ParsesLevelNames) {
    EXPECT_EQ(logging::parse_level("trace", spdlog::level::info), spdlog::level::trace);
    EXPECT_EQ(logging::parse_level("debug", spdlog::level::info), spdlog::level::debug);
    EXPECT_EQ(logging::parse_level("warn", spdlog::level::info), spdlog::level::warn);
    EXPECT_EQ(logging::parse_level("error", spdlog::level::info), spdlog::level::err);
    EXPECT_EQ(logging::parse_level("off", spdlog::level::info), spdlog::level::off);
}

TEST(LoggingTest, FallsBackForUnsetOrUnknownNames) {
    EXPECT_EQ(logging::parse_level(nullptr, spdlog::level::info), spdlog::level::info);
    EXPECT_EQ(logging::parse_level("chatty", spdlog::level::warn), spdlog::level::warn);
}

TEST(LoggingTest, SharedLogger) {
    auto a = logging::get_logger();
    auto b = logging::get_logger();
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a->name(), "bikefit");
}
