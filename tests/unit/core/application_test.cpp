#include <gtest/gtest.h>

#include "common/utilities_test.hpp"
#include "core/Application.hpp"
#include "core/Config.hpp"

namespace aniflow_tests {

using aniflow::core::AppState;
using aniflow::core::Application;
using aniflow::core::Config;

class ApplicationTest : public TempDirTestBase {
 protected:
  void SetUp() override {
    TempDirTestBase::SetUp();
    Config::instance().setDefaults();
    Config::instance().set("downloads.stateFile", (temp_dir_ / "pending_downloads.json").string());
  }

  void TearDown() override {
    Config::instance().setDefaults();
    TempDirTestBase::TearDown();
  }
};

TEST_F(ApplicationTest, InitializeRefusesNegativeConcurrency) {
  Config::instance().set("downloads.maxConcurrent", -1);

  Application app;
  EXPECT_FALSE(app.initialize());
  EXPECT_EQ(app.getState(), AppState::Error);
  EXPECT_EQ(app.getDownloadManager(), nullptr);
}

TEST_F(ApplicationTest, InitializeRefusesZeroRequestLimit) {
  Config::instance().set("openlist.maxConcurrentRequests", 0);

  Application app;
  EXPECT_FALSE(app.initialize());
  EXPECT_EQ(app.getState(), AppState::Error);
}

TEST_F(ApplicationTest, EnqueueBeforeInitializeSubmitsNothing) {
  Application app;
  EXPECT_EQ(app.enqueue({TestUtilities::create_test_resource()}), 0u);
}

}  // namespace aniflow_tests
