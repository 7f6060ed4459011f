#include "deskbridge/core/logger.h"

#include <string>

#include "absl/strings/str_cat.h"
#include "gtest/gtest.h"

namespace deskbridge {
namespace core {
namespace {

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Logger& logger = Logger::GetInstance();
    logger.SetConsoleOutput(false);
    logger.SetMinLevel(LogLevel::kInfo);
    logger.Clear();
  }
  void TearDown() override {
    Logger::GetInstance().SetMinLevel(LogLevel::kInfo);
    Logger::GetInstance().Clear();
  }
};

TEST_F(LoggerTest, FiltersBelowMinimumLevel) {
  DESKBRIDGE_LOG_DEBUG("hidden");
  DESKBRIDGE_LOG_INFO("shown");
  DESKBRIDGE_LOG_ERROR("also shown");

  auto entries = Logger::GetInstance().GetEntries();
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].message, "shown");
  EXPECT_EQ(entries[0].level, LogLevel::kInfo);
  EXPECT_FALSE(entries[0].timestamp.empty());
  EXPECT_EQ(entries[1].level, LogLevel::kError);
}

TEST_F(LoggerTest, TraceEnabledOnlyWhenRequested) {
  Logger& logger = Logger::GetInstance();
  EXPECT_FALSE(logger.IsEnabled(LogLevel::kTrace));
  logger.SetMinLevel(LogLevel::kTrace);
  EXPECT_TRUE(logger.IsEnabled(LogLevel::kTrace));
  DESKBRIDGE_LOG_TRACE("invoke #1");
  EXPECT_EQ(logger.GetEntries().size(), 1u);
}

TEST_F(LoggerTest, HistoryIsCapped) {
  for (int i = 0; i < 1200; ++i) {
    DESKBRIDGE_LOG_INFO(absl::StrCat("line ", i));
  }
  auto entries = Logger::GetInstance().GetEntries();
  EXPECT_LE(entries.size(), 1000u);
  EXPECT_EQ(entries.back().message, "line 1199");
}

TEST_F(LoggerTest, ParsesLevelNames) {
  LogLevel level = LogLevel::kInfo;
  EXPECT_TRUE(Logger::ParseLevel("DEBUG", &level));
  EXPECT_EQ(level, LogLevel::kDebug);
  EXPECT_TRUE(Logger::ParseLevel("warning", &level));
  EXPECT_EQ(level, LogLevel::kWarn);
  EXPECT_FALSE(Logger::ParseLevel("loud", &level));
  EXPECT_EQ(level, LogLevel::kWarn);
  EXPECT_STREQ(Logger::LevelToString(LogLevel::kError), "ERROR");
}

}  // namespace
}  // namespace core
}  // namespace deskbridge
