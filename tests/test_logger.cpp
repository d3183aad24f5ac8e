#include "core/config.hpp"
#include "core/logger.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

class LoggerTest : public ::testing::Test {
protected:
  void SetUp() override {
    Config::LoggingConfig config;
    config.log_levels[LogComponent::CLUSTERING] = LogLevel::DEBUG;
    config.log_levels[LogComponent::METRICS] = LogLevel::INFO;
    LogManager::instance().configure(config);
    LogManager::instance().set_sink(captured);
  }

  void TearDown() override {
    LogManager::instance().set_sink(std::clog);
    LogManager::instance().configure(Config::default_logging_config());
  }

  std::vector<std::string> lines() const {
    std::vector<std::string> result;
    std::istringstream input(captured.str());
    std::string line;
    while (std::getline(input, line))
      result.push_back(line);
    return result;
  }

  std::ostringstream captured;
};

TEST_F(LoggerTest, WritesLevelComponentAndMessage) {
  LOG(LogLevel::INFO, LogComponent::CLUSTERING, "k=" << 3 << " chosen");

  auto output = lines();
  ASSERT_EQ(output.size(), 1u);
  EXPECT_NE(output[0].find("[INFO] [clustering]"), std::string::npos);
  EXPECT_NE(output[0].find("test_logger.cpp:"), std::string::npos);
  EXPECT_EQ(output[0].substr(output[0].size() - 10), "k=3 chosen");
}

TEST_F(LoggerTest, LevelsBelowThresholdAreSkipped) {
  int evaluations = 0;
  auto counted = [&evaluations]() {
    ++evaluations;
    return "value";
  };

  LOG(LogLevel::TRACE, LogComponent::CLUSTERING, counted());
  LOG(LogLevel::DEBUG, LogComponent::METRICS, counted());
  LOG(LogLevel::ERROR, LogComponent::RECOMMEND, counted()); // Not configured

  EXPECT_TRUE(captured.str().empty());
  EXPECT_EQ(evaluations, 0);

  LOG(LogLevel::WARN, LogComponent::METRICS, counted());
  EXPECT_EQ(lines().size(), 1u);
  EXPECT_EQ(evaluations, 1);
}

TEST_F(LoggerTest, ConcurrentWritersKeepLinesWhole) {
  const int threads = 4;
  const int per_thread = 50;
  std::vector<std::thread> workers;
  for (int t = 0; t < threads; ++t) {
    workers.emplace_back([t]() {
      for (int i = 0; i < per_thread; ++i)
        LOG(LogLevel::INFO, LogComponent::METRICS,
            "worker " << t << " line " << i << " end");
    });
  }
  for (auto &worker : workers)
    worker.join();

  auto output = lines();
  ASSERT_EQ(output.size(), static_cast<size_t>(threads * per_thread));
  for (const auto &line : output) {
    EXPECT_NE(line.find("[INFO] [metrics.aggregate]"), std::string::npos);
    EXPECT_EQ(line.substr(line.size() - 4), " end");
  }
}
