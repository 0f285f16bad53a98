#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "util/log.hpp"

using namespace lensgen;

namespace {

// Keeps every message in memory.
class LogMemoryDest : public LogDestination {
 public:
  void Write(const LogMessage& msg) override { messages_.emplace_back(msg); }

  std::vector<LogMessage> messages_;
};


// The logger is a process-wide singleton without removal, so each destination is registered only once.
std::shared_ptr<LogMemoryDest> AllLevelDest() {
  static auto dest = [] {
    auto d = std::make_shared<LogMemoryDest>();
    Logger::GetInstance()->AddDestination(
        { LogLevel::kDebug, LogLevel::kVerbose, LogLevel::kInfo, LogLevel::kWarning, LogLevel::kError }, d);
    return d;
  }();
  return dest;
}

std::shared_ptr<LogMemoryDest> ProblemDest() {
  static auto dest = [] {
    auto d = std::make_shared<LogMemoryDest>();
    Logger::GetInstance()->AddDestination({ LogLevel::kWarning, LogLevel::kError }, d);
    // Registered twice on purpose. Messages must still arrive once.
    Logger::GetInstance()->AddDestination({ LogLevel::kError }, d);
    return d;
  }();
  return dest;
}


class LogTest : public ::testing::Test {
 protected:
  void SetUp() override {
    all_ = AllLevelDest();
    problem_ = ProblemDest();
    all_->messages_.clear();
    problem_->messages_.clear();
  }

  std::shared_ptr<LogMemoryDest> all_;
  std::shared_ptr<LogMemoryDest> problem_;
};


TEST_F(LogTest, RouteByLevel) {
  LOG_DEBUG("debug %d", 1);
  LOG_WARNING("warning %d", 2);
  LOG_ERROR("error %s", "three");

  ASSERT_EQ(all_->messages_.size(), 3u);
  EXPECT_EQ(all_->messages_[0].level, LogLevel::kDebug);
  EXPECT_EQ(all_->messages_[0].text, "debug 1");

  ASSERT_EQ(problem_->messages_.size(), 2u);
  EXPECT_EQ(problem_->messages_[0].text, "warning 2");
  EXPECT_EQ(problem_->messages_[1].level, LogLevel::kError);
  EXPECT_EQ(problem_->messages_[1].text, "error three");
}

TEST_F(LogTest, Tag) {
  LOG_TAG_DEBUG("march", "slice %d", 4);
  LOG_INFO("plain");

  ASSERT_EQ(all_->messages_.size(), 2u);
  EXPECT_EQ(all_->messages_[0].tag, "march");
  EXPECT_EQ(all_->messages_[0].text, "slice 4");
  EXPECT_TRUE(all_->messages_[1].tag.empty());
  EXPECT_TRUE(problem_->messages_.empty());
}

TEST_F(LogTest, LongMessageTruncated) {
  std::string long_text(Logger::kMaxMessageLength * 2, 'x');
  LOG_INFO("%s", long_text.c_str());

  ASSERT_EQ(all_->messages_.size(), 1u);
  EXPECT_EQ(all_->messages_[0].text.size(), Logger::kMaxMessageLength - 1);
}

TEST_F(LogTest, Format) {
  LogMessage msg{ LogLevel::kWarning, std::chrono::system_clock::now(), "march", "hello" };
  auto s = FormatLogMessage(msg);
  EXPECT_NE(s.find("[WARNING]<march> hello"), std::string::npos);
  EXPECT_EQ(s[2], ':');

  msg.tag.clear();
  s = FormatLogMessage(msg);
  EXPECT_NE(s.find("[WARNING] hello"), std::string::npos);
  EXPECT_EQ(s.find('<'), std::string::npos);
}

}  // namespace
