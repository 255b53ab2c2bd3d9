/**
 * @file test_log.cpp
 * @brief Unit tests for leveled logging
 */

#include <gtest/gtest.h>
#include <pdrop/log.h>

#include <string>
#include <vector>

using namespace pdrop;

namespace {

struct Line {
  log::Level level;
  std::string func;
  std::string msg;
};

} // namespace

class LogTest : public ::testing::Test {
protected:
  void SetUp() override {
    saved_ = log::level();
    log::set_sink([this](log::Level level, const char *func,
                         const std::string &msg) {
      lines_.push_back(Line{level, func, msg});
    });
  }

  void TearDown() override {
    log::set_sink(nullptr);
    log::set_level(saved_);
  }

  std::vector<Line> lines_;
  log::Level saved_ = log::Level::Info;
};

TEST_F(LogTest, FormatsAndReportsFunction) {
  log::set_level(log::Level::Debug);
  PDROP_LOG_INFO("backend '%s' started in %d ms", "ble", 42);

  ASSERT_EQ(lines_.size(), 1u);
  EXPECT_EQ(lines_[0].level, log::Level::Info);
  EXPECT_EQ(lines_[0].msg, "backend 'ble' started in 42 ms");
  EXPECT_EQ(lines_[0].func, "TestBody");
}

TEST_F(LogTest, LevelFilters) {
  log::set_level(log::Level::Warning);
  PDROP_LOG_DEBUG("hidden");
  PDROP_LOG_INFO("hidden");
  PDROP_LOG_WARN("shown");
  PDROP_LOG_ERROR("shown");

  ASSERT_EQ(lines_.size(), 2u);
  EXPECT_EQ(lines_[0].level, log::Level::Warning);
  EXPECT_EQ(lines_[1].level, log::Level::Error);
}

TEST_F(LogTest, OffSilencesEverything) {
  log::set_level(log::Level::Off);
  PDROP_LOG_ERROR("nothing");
  EXPECT_TRUE(lines_.empty());
  EXPECT_FALSE(log::enabled(log::Level::Error));
  EXPECT_FALSE(log::enabled(log::Level::Off));
}

TEST_F(LogTest, TrailingNewlinesStripped) {
  log::set_level(log::Level::Info);
  PDROP_LOG_INFO("line\n\n");
  ASSERT_EQ(lines_.size(), 1u);
  EXPECT_EQ(lines_[0].msg, "line");
}

TEST_F(LogTest, SetLevelByName) {
  EXPECT_TRUE(log::set_level_by_name("ERROR"));
  EXPECT_EQ(log::level(), log::Level::Error);

  EXPECT_FALSE(log::set_level_by_name("verbose"));
  EXPECT_EQ(log::level(), log::Level::Error);
}

TEST(LogLevelTest, ParseLevel) {
  log::Level out = log::Level::Off;
  EXPECT_TRUE(log::parse_level("debug", out));
  EXPECT_EQ(out, log::Level::Debug);
  EXPECT_TRUE(log::parse_level("warning", out));
  EXPECT_EQ(out, log::Level::Warning);
  EXPECT_TRUE(log::parse_level("none", out));
  EXPECT_EQ(out, log::Level::Off);
  EXPECT_FALSE(log::parse_level("", out));
}

TEST(LogLevelTest, Names) {
  EXPECT_STREQ(log::level_name(log::Level::Debug), "DEBUG");
  EXPECT_STREQ(log::level_name(log::Level::Warning), "WARN");
  EXPECT_STREQ(log::level_name(log::Level::Off), "OFF");
}
