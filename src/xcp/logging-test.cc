// This file is part of the "libxcp" project
//
// Licensed under the MIT License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of
// the License at: http://opensource.org/licenses/MIT

#include <gtest/gtest.h>
#include <xcp/logging.h>
#include <xcp/RuntimeError.h>
#include <string>
#include <vector>

using namespace xcp;

class CollectingLogTarget : public LogTarget {
 public:
  void log(LogLevel level, const std::string& message) override {
    messages.push_back(as_string(level) + ": " + message);
  }

  std::vector<std::string> messages;
};

TEST(logging, make_loglevel) {
  EXPECT_EQ(LogLevel::Trace, make_loglevel("trace"));
  EXPECT_EQ(LogLevel::Debug, make_loglevel("DEBUG"));
  EXPECT_EQ(LogLevel::Warning, make_loglevel("warn"));
  EXPECT_EQ(LogLevel::Error, make_loglevel("error"));
  EXPECT_THROW(make_loglevel("loud"), RuntimeError);
}

TEST(logging, minimumLevel) {
  CollectingLogTarget target;
  Logger* logger = Logger::get();
  const LogLevel saved = logger->getMinimumLogLevel();

  logger->addTarget(&target);
  logger->setMinimumLogLevel(LogLevel::Warning);

  logError("copied {} bytes", 42);
  logNotice("not shown");
  logWarning("{} and {}", "this", "that");

  logger->removeTarget(&target);
  logger->setMinimumLogLevel(saved);

  ASSERT_EQ(2, target.messages.size());
  EXPECT_EQ(as_string(LogLevel::Error) + ": copied 42 bytes", target.messages[0]);
  EXPECT_EQ(as_string(LogLevel::Warning) + ": this and that", target.messages[1]);
}

TEST(logging, removedTargetSlotIsReused) {
  CollectingLogTarget target;
  Logger* logger = Logger::get();

  for (size_t i = 0; i < 2 * Logger::MaxTargets; ++i) {
    logger->addTarget(&target);
    logger->removeTarget(&target);
  }

  logger->addTarget(&target);
  logError("still {}", "listening");
  logger->removeTarget(&target);

  ASSERT_EQ(1, target.messages.size());
  EXPECT_EQ(as_string(LogLevel::Error) + ": still listening", target.messages[0]);
}

TEST(logging, tooManyTargets) {
  std::vector<CollectingLogTarget> targets(Logger::MaxTargets + 1);
  Logger* logger = Logger::get();

  EXPECT_THROW({
    for (CollectingLogTarget& target : targets) {
      logger->addTarget(&target);
    }
  }, RuntimeError);

  for (CollectingLogTarget& target : targets)
    logger->removeTarget(&target);

  CollectingLogTarget last;
  logger->addTarget(&last);
  logError("after cleanup");
  logger->removeTarget(&last);

  EXPECT_EQ(1, last.messages.size());
}
