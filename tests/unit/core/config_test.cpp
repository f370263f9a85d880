#include <gtest/gtest.h>

#include <fstream>

#include "common/utilities_test.hpp"
#include "core/Config.hpp"
#include "core/Logger.hpp"

namespace aniflow_tests {

using aniflow::core::Config;

class ConfigTest : public TempDirTestBase {
 protected:
  void SetUp() override {
    TempDirTestBase::SetUp();
    Config::instance().setDefaults();
  }

  void TearDown() override {
    Config::instance().setDefaults();
    TempDirTestBase::TearDown();
  }

  std::string writeConfig(const std::string& content) {
    auto path = temp_dir_ / "config.json";
    std::ofstream file(path);
    file << content;
    return path.string();
  }
};

TEST_F(ConfigTest, DefaultsCoverEngineSettings) {
  auto& config = Config::instance();

  EXPECT_EQ(config.get<std::string>("openlist.url"), "http://localhost:5244");
  EXPECT_EQ(config.get<std::string>("openlist.offlineDownloadTool"), "qBittorrent");
  EXPECT_EQ(config.get<int>("downloads.maxConcurrent"), 3);
  EXPECT_EQ(config.get<int>("downloads.maxDetectAttempts"), 10);
  EXPECT_EQ(config.get<std::string>("downloads.stateFile"), "data/pending_downloads.json");
}

TEST_F(ConfigTest, MissingKeyReturnsFallback) {
  auto& config = Config::instance();

  EXPECT_EQ(config.get<int>("downloads.nope", 17), 17);
  EXPECT_FALSE(config.has("downloads.nope"));
}

TEST_F(ConfigTest, WrongTypeReturnsFallback) {
  auto& config = Config::instance();
  config.set("downloads.maxConcurrent", std::string("many"));

  EXPECT_EQ(config.get<int>("downloads.maxConcurrent", 3), 3);
}

TEST_F(ConfigTest, LoadOverlaysFileOnDefaults) {
  auto path = writeConfig(R"({"openlist": {"url": "https://files.example", "token": "abc"}})");
  auto& config = Config::instance();

  ASSERT_TRUE(config.load(path));

  EXPECT_EQ(config.get<std::string>("openlist.url"), "https://files.example");
  EXPECT_EQ(config.get<std::string>("openlist.token"), "abc");
  EXPECT_EQ(config.get<int>("openlist.maxConcurrentRequests"), 4);
}

TEST_F(ConfigTest, LoadRejectsBrokenFiles) {
  auto& config = Config::instance();

  EXPECT_FALSE(config.load(writeConfig("{ broken")));
  EXPECT_FALSE(config.load(writeConfig("[1, 2]")));
  EXPECT_FALSE(config.load((temp_dir_ / "missing.json").string()));
}

TEST_F(ConfigTest, SaveWritesLoadableFile) {
  auto& config = Config::instance();
  config.set("openlist.token", std::string("secret"));

  auto path = (temp_dir_ / "nested" / "config.json").string();
  ASSERT_TRUE(config.save(path));

  config.setDefaults();
  ASSERT_TRUE(config.load(path));
  EXPECT_EQ(config.get<std::string>("openlist.token"), "secret");
}

TEST_F(ConfigTest, ValidateReportsMissingSettings) {
  auto& config = Config::instance();

  auto problems = config.validate();
  ASSERT_EQ(problems.size(), 1u);
  EXPECT_NE(problems[0].find("openlist.token"), std::string::npos);

  config.set("openlist.token", std::string("abc"));
  config.set("openlist.offlineDownloadTool", std::string("transmission"));
  config.set("openlist.renameFormat", std::string(""));
  config.set("downloads.maxConcurrent", 0);

  EXPECT_EQ(config.validate().size(), 3u);
}

TEST_F(ConfigTest, ValidateLimitsRejectsNegativeValues) {
  auto& config = Config::instance();
  EXPECT_TRUE(config.validateLimits().empty());

  config.set("downloads.maxConcurrent", -1);
  config.set("openlist.maxConcurrentRequests", 0);
  config.set("downloads.renameSettleDelay", -5);

  auto problems = config.validateLimits();
  ASSERT_EQ(problems.size(), 3u);
  EXPECT_NE(problems[0].find("downloads.maxConcurrent"), std::string::npos);
  EXPECT_NE(problems[2].find("downloads.renameSettleDelay"), std::string::npos);
}

TEST(LoggerLevelTest, ParseLevelAcceptsSpdlogNames) {
  using aniflow::core::LogLevel;
  using aniflow::core::Logger;

  EXPECT_EQ(Logger::parseLevel("DEBUG"), LogLevel::Debug);
  EXPECT_EQ(Logger::parseLevel("warning"), LogLevel::Warn);
  EXPECT_EQ(Logger::parseLevel("off"), LogLevel::Off);
  EXPECT_EQ(Logger::parseLevel("loud", LogLevel::Error), LogLevel::Error);
}

}  // namespace aniflow_tests
