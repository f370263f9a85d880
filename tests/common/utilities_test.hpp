#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "core/downloader/DownloadTask.hpp"
#include "core/models/Models.hpp"
#include "core/openlist/OpenListModels.hpp"

namespace aniflow_tests {

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Temporary files
  static std::filesystem::path create_temp_dir(const std::string& prefix = "aniflow_test");
  static void cleanup_temp_dir(const std::filesystem::path& dir);

  // Test data creation
  static aniflow::ResourceInfo create_test_resource(
      const std::string& anime_name = "Frieren",
      int season = 1,
      int episode = 3,
      const std::string& download_url = "magnet:?xt=urn:btih:0123456789abcdef");

  static aniflow::core::openlist::OpenListTask create_remote_task(
      const std::string& id,
      aniflow::core::openlist::TaskState state,
      const std::string& name = "",
      double progress = 0.0);

  static aniflow::core::openlist::FileEntry create_file_entry(
      const std::string& name, int64_t size = 1024, bool is_dir = false);

  // OpenList response envelope around `data`
  static std::string envelope(const nlohmann::json& data, int code = 200,
                              const std::string& message = "success");
};

/**
 * Fixture that owns a scratch directory for the duration of a test
 */
class TempDirTestBase : public ::testing::Test {
 protected:
  void SetUp() override { temp_dir_ = TestUtilities::create_temp_dir(); }
  void TearDown() override { TestUtilities::cleanup_temp_dir(temp_dir_); }

  std::filesystem::path temp_dir_;
};

}  // namespace aniflow_tests
