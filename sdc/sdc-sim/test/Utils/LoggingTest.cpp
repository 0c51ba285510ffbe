#include <gtest/gtest.h>

#include <spdlog/spdlog.h>

#include "sdc-sim/src/Utils/Logging.hpp"

using namespace sdc_sim;

TEST(LoggingTest, DefaultLoggerIsSharedAndRegistered)
{
  auto const first = logging::defaultLogger();
  auto const second = logging::defaultLogger();

  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first, second);
  EXPECT_EQ(first->name(), logging::kLoggerName);
  EXPECT_EQ(spdlog::get(logging::kLoggerName), first);
}

TEST(LoggingTest, SetLevelAppliesToLibraryLogger)
{
  auto const logger = logging::defaultLogger();
  auto const previous = logger->level();

  logging::setLevel(spdlog::level::warn);
  EXPECT_EQ(logger->level(), spdlog::level::warn);
  EXPECT_FALSE(logger->should_log(spdlog::level::info));

  logging::setLevel(previous);
  EXPECT_EQ(logger->level(), previous);
}
