#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <vector>

#include "common/mocks_test.hpp"
#include "common/utilities_test.hpp"
#include "core/downloader/OpenListDownloader.hpp"

namespace aniflow_tests {

using aniflow::core::downloader::DownloadTask;
using aniflow::core::downloader::OpenListDownloader;
using aniflow::core::downloader::OpenListDownloaderOptions;
using aniflow::core::openlist::TaskState;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

// Counts pauses instead of sleeping
class TestableDownloader : public OpenListDownloader {
 public:
  using OpenListDownloader::OpenListDownloader;

  int pauses = 0;
  std::vector<std::chrono::milliseconds> pauseDelays;

 protected:
  void pause(std::chrono::milliseconds delay) override {
    ++pauses;
    pauseDelays.push_back(delay);
  }
};

class OpenListDownloaderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    client_ = std::make_shared<NiceMock<MockOpenListClient>>();
    options_.pollInterval = std::chrono::milliseconds(1);
    options_.transferCheckDelay = std::chrono::milliseconds(1);
    options_.maxDetectAttempts = 2;
    task_ = DownloadTask::create(TestUtilities::create_test_resource(), "/anime");
  }

  std::unique_ptr<TestableDownloader> makeDownloader() {
    return std::make_unique<TestableDownloader>(client_, options_);
  }

  std::string tempPath() const { return "/anime/" + task_.id; }

  // Task whose remote job finished and whose transfer was already seen
  void prepareForDetection() {
    task_.tempPath = tempPath();
    task_.extraData["task_id"] = "job-1";
    task_.extraData["download_finished"] = true;
    task_.extraData["transfer_checked"] = true;
  }

  void prepareForTransfer(const std::string& filename) {
    task_.tempPath = tempPath();
    task_.downloadedFilename = filename;
  }

  std::shared_ptr<NiceMock<MockOpenListClient>> client_;
  OpenListDownloaderOptions options_;
  DownloadTask task_;
};

// -- Construction and server checks --

TEST_F(OpenListDownloaderTest, ConstructorRejectsIncompleteSettings) {
  EXPECT_THROW(std::make_unique<OpenListDownloader>(nullptr, options_), std::invalid_argument);

  auto noTool = options_;
  noTool.tool.clear();
  EXPECT_THROW(std::make_unique<OpenListDownloader>(client_, noTool), std::invalid_argument);

  auto noFormat = options_;
  noFormat.renameFormat.clear();
  EXPECT_THROW(std::make_unique<OpenListDownloader>(client_, noFormat), std::invalid_argument);
}

TEST_F(OpenListDownloaderTest, VerifyServerRequiresConfiguredTool) {
  auto downloader = makeDownloader();

  EXPECT_CALL(*client_, checkHealth()).WillRepeatedly(Return(true));
  EXPECT_CALL(*client_, getOfflineDownloadTools())
      .WillOnce(Return(std::vector<std::string>{"aria2", "PikPak"}))
      .WillOnce(Return(std::vector<std::string>{"aria2", "qBittorrent"}));

  EXPECT_FALSE(downloader->verifyServer());
  EXPECT_TRUE(downloader->verifyServer());
}

TEST_F(OpenListDownloaderTest, VerifyServerFailsWhenUnreachable) {
  auto downloader = makeDownloader();

  EXPECT_CALL(*client_, checkHealth()).WillOnce(Return(false));
  EXPECT_CALL(*client_, getOfflineDownloadTools()).Times(0);

  EXPECT_FALSE(downloader->verifyServer());
}

// -- Pending --

TEST_F(OpenListDownloaderTest, PendingCreatesWorkspaceAndStartsJob) {
  auto downloader = makeDownloader();
  task_.extraData["detect_attempts"] = 7;

  EXPECT_CALL(*client_, mkdir(tempPath())).WillOnce(Return(true));
  EXPECT_CALL(*client_, listFiles(tempPath()))
      .WillOnce(Return(std::vector<FileEntry>{TestUtilities::create_file_entry("leftover.txt")}));
  EXPECT_CALL(*client_, addOfflineDownload(ElementsAre(task_.resourceInfo.downloadUrl), tempPath(), "qBittorrent"))
      .WillOnce(Return(std::vector<OpenListTask>{TestUtilities::create_remote_task("job-1", TaskState::Pending)}));

  auto result = downloader->onPending(task_);

  ASSERT_TRUE(result.isDone()) << result.errorMessage;
  EXPECT_EQ(task_.tempPath, tempPath());
  EXPECT_THAT(task_.initialFiles, ElementsAre("leftover.txt"));
  EXPECT_EQ(task_.extraData["task_id"], "job-1");
  EXPECT_FALSE(task_.extraData.contains("detect_attempts"));
}

TEST_F(OpenListDownloaderTest, PendingFailsWhenWorkspaceCannotBeCreated) {
  auto downloader = makeDownloader();

  EXPECT_CALL(*client_, mkdir(_)).WillOnce(Return(false));
  EXPECT_CALL(*client_, addOfflineDownload(_, _, _)).Times(0);

  auto result = downloader->onPending(task_);

  ASSERT_TRUE(result.isFailed());
  EXPECT_THAT(result.errorMessage, HasSubstr("Failed to create temporary directory"));
}

TEST_F(OpenListDownloaderTest, PendingFailsWhenJobIsNotCreated) {
  auto downloader = makeDownloader();

  ON_CALL(*client_, mkdir(_)).WillByDefault(Return(true));
  ON_CALL(*client_, listFiles(_)).WillByDefault(Return(std::vector<FileEntry>{}));
  EXPECT_CALL(*client_, addOfflineDownload(_, _, _)).WillOnce(Return(std::vector<OpenListTask>{}));

  auto result = downloader->onPending(task_);

  ASSERT_TRUE(result.isFailed());
  EXPECT_EQ(result.errorMessage, "Failed to create offline download task");
}

// -- Downloading --

TEST_F(OpenListDownloaderTest, DownloadingWithoutJobIdFails) {
  auto downloader = makeDownloader();

  auto result = downloader->onDownloading(task_);

  ASSERT_TRUE(result.isFailed());
  EXPECT_EQ(result.errorMessage, "No task ID available");
}

TEST_F(OpenListDownloaderTest, DownloadingPollsWhileJobRuns) {
  auto downloader = makeDownloader();
  task_.extraData["task_id"] = "job-1";

  EXPECT_CALL(*client_, getOfflineDownloadUndone())
      .WillOnce(Return(std::vector<OpenListTask>{
          TestUtilities::create_remote_task("job-1", TaskState::Running, "", 40.0)}));
  EXPECT_CALL(*client_, getOfflineDownloadDone()).Times(0);

  auto result = downloader->onDownloading(task_);

  ASSERT_TRUE(result.isPoll());
  EXPECT_EQ(result.pollDelay, std::chrono::milliseconds(1));
  EXPECT_FALSE(task_.extraData.contains("download_finished"));
}

TEST_F(OpenListDownloaderTest, DownloadingPollsWhenListIsUnavailable) {
  auto downloader = makeDownloader();
  task_.extraData["task_id"] = "job-1";

  EXPECT_CALL(*client_, getOfflineDownloadUndone()).WillOnce(Return(std::nullopt));

  EXPECT_TRUE(downloader->onDownloading(task_).isPoll());
}

TEST_F(OpenListDownloaderTest, DownloadingFailsWhenRemoteJobFailed) {
  auto downloader = makeDownloader();
  task_.extraData["task_id"] = "job-1";

  auto failedJob = TestUtilities::create_remote_task("job-1", TaskState::Errored);
  failedJob.error = "tracker unreachable";
  ON_CALL(*client_, getOfflineDownloadUndone()).WillByDefault(Return(std::vector<OpenListTask>{}));
  EXPECT_CALL(*client_, getOfflineDownloadDone()).WillOnce(Return(std::vector<OpenListTask>{failedJob}));

  auto result = downloader->onDownloading(task_);

  ASSERT_TRUE(result.isFailed());
  EXPECT_THAT(result.errorMessage, HasSubstr("Task failed with state"));
  EXPECT_THAT(result.errorMessage, HasSubstr("tracker unreachable"));
}

TEST_F(OpenListDownloaderTest, DownloadingFailsWhenJobVanished) {
  auto downloader = makeDownloader();
  task_.extraData["task_id"] = "job-1";

  ON_CALL(*client_, getOfflineDownloadUndone()).WillByDefault(Return(std::vector<OpenListTask>{}));
  ON_CALL(*client_, getOfflineDownloadDone()).WillByDefault(Return(std::vector<OpenListTask>{}));

  auto result = downloader->onDownloading(task_);

  ASSERT_TRUE(result.isFailed());
  EXPECT_EQ(result.errorMessage, "Task job-1 not found");
}

TEST_F(OpenListDownloaderTest, DownloadingWaitsForRunningTransfer) {
  auto downloader = makeDownloader();
  task_.tempPath = tempPath();
  task_.extraData["task_id"] = "job-1";

  ON_CALL(*client_, getOfflineDownloadUndone()).WillByDefault(Return(std::vector<OpenListTask>{}));
  ON_CALL(*client_, getOfflineDownloadDone())
      .WillByDefault(Return(std::vector<OpenListTask>{
          TestUtilities::create_remote_task("job-1", TaskState::Succeeded)}));
  EXPECT_CALL(*client_, getTransferUndone())
      .WillOnce(Return(std::vector<OpenListTask>{TestUtilities::create_remote_task(
          "xfer-1", TaskState::Running, "transfer [/anime/" + task_.id + "/ep.mkv]", 60.0)}));

  auto result = downloader->onDownloading(task_);

  ASSERT_TRUE(result.isPoll());
  EXPECT_EQ(task_.extraData["download_finished"], true);
  EXPECT_FALSE(task_.extraData.contains("transfer_checked"));

  // The finished download is not looked up again
  EXPECT_CALL(*client_, getOfflineDownloadUndone()).Times(0);
  EXPECT_CALL(*client_, getTransferUndone()).WillOnce(Return(std::vector<OpenListTask>{}));
  EXPECT_CALL(*client_, getTransferDone())
      .WillOnce(Return(std::vector<OpenListTask>{TestUtilities::create_remote_task(
          "xfer-1", TaskState::Succeeded, "transfer [/anime/" + task_.id + "/ep.mkv]")}));
  EXPECT_CALL(*client_, listFiles(_))
      .WillOnce(Return(std::vector<FileEntry>{TestUtilities::create_file_entry("ep.mkv", 900)}));

  auto second = downloader->onDownloading(task_);

  ASSERT_TRUE(second.isDone()) << second.errorMessage;
  EXPECT_EQ(task_.downloadedFilename, "ep.mkv");
}

TEST_F(OpenListDownloaderTest, MissingTransferIsRetriedThenSkipped) {
  auto downloader = makeDownloader();
  task_.tempPath = tempPath();
  task_.extraData["task_id"] = "job-1";
  task_.extraData["download_finished"] = true;

  EXPECT_CALL(*client_, getTransferUndone()).Times(3).WillRepeatedly(Return(std::vector<OpenListTask>{}));
  EXPECT_CALL(*client_, getTransferDone()).Times(3).WillRepeatedly(Return(std::nullopt));
  EXPECT_CALL(*client_, listFiles(tempPath()))
      .WillOnce(Return(std::vector<FileEntry>{TestUtilities::create_file_entry("ep.mkv", 900)}));

  auto result = downloader->onDownloading(task_);

  ASSERT_TRUE(result.isDone()) << result.errorMessage;
  EXPECT_EQ(downloader->pauses, 2);
  EXPECT_EQ(task_.extraData["transfer_checked"], true);
}

TEST_F(OpenListDownloaderTest, FailedTransferFailsTheTask) {
  auto downloader = makeDownloader();
  task_.extraData["task_id"] = "job-1";
  task_.extraData["download_finished"] = true;

  ON_CALL(*client_, getTransferUndone()).WillByDefault(Return(std::vector<OpenListTask>{}));
  EXPECT_CALL(*client_, getTransferDone())
      .WillOnce(Return(std::vector<OpenListTask>{TestUtilities::create_remote_task(
          "xfer-1", TaskState::Failed, "transfer " + task_.id)}));

  auto result = downloader->onDownloading(task_);

  ASSERT_TRUE(result.isFailed());
  EXPECT_THAT(result.errorMessage, HasSubstr("Transfer failed with state"));
}

TEST_F(OpenListDownloaderTest, DetectionGivesUpAfterMaxAttempts) {
  auto downloader = makeDownloader();
  prepareForDetection();

  ON_CALL(*client_, listFiles(_)).WillByDefault(Return(std::vector<FileEntry>{}));

  EXPECT_TRUE(downloader->onDownloading(task_).isPoll());
  EXPECT_TRUE(downloader->onDownloading(task_).isPoll());

  auto result = downloader->onDownloading(task_);

  ASSERT_TRUE(result.isFailed());
  EXPECT_EQ(result.errorMessage, "Download completed but no file found");
  EXPECT_EQ(task_.extraData["detect_attempts"], 3);
}

// -- Detection --

TEST_F(OpenListDownloaderTest, DetectionPicksLargestNewVideo) {
  auto downloader = makeDownloader();
  prepareForDetection();
  task_.initialFiles = {"old.mkv"};

  EXPECT_CALL(*client_, listFiles(tempPath()))
      .WillOnce(Return(std::vector<FileEntry>{
          TestUtilities::create_file_entry("old.mkv", 99999),
          TestUtilities::create_file_entry("small.mp4", 100),
          TestUtilities::create_file_entry("notes.txt", 50000),
          TestUtilities::create_file_entry("huge.mkv.aria2", 70000),
          TestUtilities::create_file_entry("Show", 0, true)}));
  EXPECT_CALL(*client_, listFiles(tempPath() + "/Show"))
      .WillOnce(Return(std::vector<FileEntry>{TestUtilities::create_file_entry("ep03.MKV", 5000)}));

  EXPECT_EQ(downloader->detectDownloadedFile(task_), "Show/ep03.MKV");
}

TEST_F(OpenListDownloaderTest, DetectionReturnsNothingWhenListingFails) {
  auto downloader = makeDownloader();
  prepareForDetection();

  EXPECT_CALL(*client_, listFiles(_)).WillOnce(Return(std::nullopt));

  EXPECT_FALSE(downloader->detectDownloadedFile(task_).has_value());
}

// -- Naming --

TEST_F(OpenListDownloaderTest, FinalFilenameUsesTemplate) {
  options_.renameFormat = "[{fansub}] {anime_name} - {episode:03d} [{quality}][{languages}]";
  auto downloader = makeDownloader();

  auto resource = TestUtilities::create_test_resource("Frieren", 1, 7);

  EXPECT_EQ(downloader->buildFinalFilename(resource, ".mkv"), "[Fansub] Frieren - 007 [1080p][简日].mkv");
}

TEST_F(OpenListDownloaderTest, FinalFilenameAppendsVersion) {
  auto downloader = makeDownloader();
  auto resource = TestUtilities::create_test_resource("Frieren", 2, 12);
  resource.version = 2;

  EXPECT_EQ(downloader->buildFinalFilename(resource, ".mp4"), "Frieren S02E12 v2.mp4");
}

TEST_F(OpenListDownloaderTest, FinalFilenameFallsBackOnMissingValues) {
  auto downloader = makeDownloader();
  auto resource = TestUtilities::create_test_resource("Re:Zero", 1, 4);
  resource.season.reset();

  EXPECT_EQ(downloader->buildFinalFilename(resource, ".mkv"), "Re Zero S01E04.mkv");
}

TEST_F(OpenListDownloaderTest, FinalFilenameFallsBackOnBadTemplate) {
  options_.renameFormat = "{title} {episode";
  auto downloader = makeDownloader();

  EXPECT_EQ(downloader->buildFinalFilename(TestUtilities::create_test_resource(), ".mkv"),
            "Frieren S01E03.mkv");
}

// -- Transferring --

TEST_F(OpenListDownloaderTest, TransferringRenamesAndMoves) {
  options_.renameSettleDelay = std::chrono::milliseconds(7);
  auto downloader = makeDownloader();
  prepareForTransfer("ep03.mkv");

  EXPECT_CALL(*client_, mkdir("/anime/Frieren/Season 1")).WillOnce(Return(true));
  EXPECT_CALL(*client_, renameFile(tempPath() + "/ep03.mkv", "Frieren S01E03.mkv")).WillOnce(Return(true));
  EXPECT_CALL(*client_, moveFile(tempPath(), "/anime/Frieren/Season 1", ElementsAre("Frieren S01E03.mkv")))
      .WillOnce(Invoke([&](const std::string&, const std::string&, const std::vector<std::string>&) {
        // The listing gets time to catch up with the rename first
        EXPECT_EQ(downloader->pauses, 1);
        return true;
      }));

  auto result = downloader->onTransferring(task_);

  ASSERT_TRUE(result.isDone()) << result.errorMessage;
  EXPECT_EQ(task_.finalPath, "/anime/Frieren/Season 1/Frieren S01E03.mkv");
  EXPECT_EQ(downloader->pauseDelays, std::vector<std::chrono::milliseconds>{std::chrono::milliseconds(7)});
}

TEST_F(OpenListDownloaderTest, TransferringMovesOriginalWhenRenameFails) {
  auto downloader = makeDownloader();
  prepareForTransfer("Batch/ep03.mkv");

  ON_CALL(*client_, mkdir(_)).WillByDefault(Return(true));
  EXPECT_CALL(*client_, renameFile(tempPath() + "/Batch/ep03.mkv", _)).WillOnce(Return(false));
  EXPECT_CALL(*client_, moveFile(tempPath() + "/Batch", "/anime/Frieren/Season 1", ElementsAre("ep03.mkv")))
      .WillOnce(Return(true));

  auto result = downloader->onTransferring(task_);

  ASSERT_TRUE(result.isDone()) << result.errorMessage;
  EXPECT_EQ(task_.finalPath, "/anime/Frieren/Season 1/ep03.mkv");
  EXPECT_EQ(downloader->pauses, 0);
}

TEST_F(OpenListDownloaderTest, TransferringSkipsRenameWhenNameMatches) {
  auto downloader = makeDownloader();
  prepareForTransfer("Frieren S01E03.mkv");

  ON_CALL(*client_, mkdir(_)).WillByDefault(Return(true));
  ON_CALL(*client_, moveFile(_, _, _)).WillByDefault(Return(true));
  EXPECT_CALL(*client_, renameFile(_, _)).Times(0);

  EXPECT_TRUE(downloader->onTransferring(task_).isDone());
  EXPECT_EQ(downloader->pauses, 0);
}

TEST_F(OpenListDownloaderTest, TransferringFailsWithoutDetectedFile) {
  auto downloader = makeDownloader();
  task_.tempPath = tempPath();

  auto result = downloader->onTransferring(task_);

  ASSERT_TRUE(result.isFailed());
  EXPECT_EQ(result.errorMessage, "No downloaded filename available");
}

TEST_F(OpenListDownloaderTest, TransferringFailsWhenMoveFails) {
  auto downloader = makeDownloader();
  prepareForTransfer("ep03.mkv");

  ON_CALL(*client_, mkdir(_)).WillByDefault(Return(true));
  ON_CALL(*client_, renameFile(_, _)).WillByDefault(Return(true));
  EXPECT_CALL(*client_, moveFile(_, _, _)).WillOnce(Return(false));

  auto result = downloader->onTransferring(task_);

  ASSERT_TRUE(result.isFailed());
  EXPECT_THAT(result.errorMessage, HasSubstr("Failed to move file to"));
  EXPECT_FALSE(task_.finalPath.has_value());
}

// -- Cleaning up --

TEST_F(OpenListDownloaderTest, CleaningUpRemovesWorkspace) {
  auto downloader = makeDownloader();
  task_.tempPath = tempPath();

  EXPECT_CALL(*client_, removePath("/anime", ElementsAre(task_.id))).WillOnce(Return(true));

  EXPECT_TRUE(downloader->onCleaningUp(task_).isDone());
}

TEST_F(OpenListDownloaderTest, CleaningUpSucceedsWhenRemovalFails) {
  auto downloader = makeDownloader();
  task_.tempPath = tempPath();

  EXPECT_CALL(*client_, removePath(_, _)).WillOnce(Return(false));

  EXPECT_TRUE(downloader->onCleaningUp(task_).isDone());
}

TEST_F(OpenListDownloaderTest, FailureAndCancelHooksRemoveWorkspace) {
  auto downloader = makeDownloader();
  task_.tempPath = tempPath();

  EXPECT_CALL(*client_, removePath("/anime", ElementsAre(task_.id))).Times(2).WillRepeatedly(Return(true));

  downloader->onFailed(task_);
  downloader->onCancelled(task_);
}

TEST_F(OpenListDownloaderTest, HooksWithoutWorkspaceDoNothing) {
  auto downloader = makeDownloader();

  EXPECT_CALL(*client_, removePath(_, _)).Times(0);

  downloader->onFailed(task_);
  EXPECT_TRUE(downloader->cleanup(task_).ok);
}

TEST_F(OpenListDownloaderTest, CleaningUpTwiceWithoutWorkspaceIsNoOp) {
  auto downloader = makeDownloader();
  ASSERT_FALSE(task_.tempPath.has_value());

  EXPECT_CALL(*client_, removePath(_, _)).Times(0);

  EXPECT_TRUE(downloader->onCleaningUp(task_).isDone());
  EXPECT_TRUE(downloader->onCleaningUp(task_).isDone());
}

// -- Interruption --

TEST_F(OpenListDownloaderTest, InterruptCutsTransferWaitShort) {
  options_.transferCheckDelay = std::chrono::seconds(30);
  OpenListDownloader downloader(client_, options_);
  task_.tempPath = tempPath();
  task_.extraData["task_id"] = "job-1";
  task_.extraData["download_finished"] = true;

  EXPECT_CALL(*client_, getTransferUndone()).Times(1).WillOnce(Return(std::vector<OpenListTask>{}));
  EXPECT_CALL(*client_, getTransferDone()).Times(1).WillOnce(Return(std::nullopt));
  EXPECT_CALL(*client_, listFiles(_)).Times(0);

  downloader.interrupt();

  auto start = std::chrono::steady_clock::now();
  auto result = downloader.onDownloading(task_);
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_TRUE(result.isPoll());
  EXPECT_FALSE(task_.extraData.contains("transfer_checked"));
  EXPECT_LT(elapsed, std::chrono::seconds(5));
}

// -- Progress --

TEST_F(OpenListDownloaderTest, ProgressLogsOncePerQuarter) {
  auto downloader = makeDownloader();

  int milestones = 0;
  for (double progress : {1.0, 10.0, 24.0, 25.0, 30.0, 49.0, 50.0, 74.0, 75.0, 90.0, 100.0}) {
    if (downloader->logProgress(task_, "download", progress)) ++milestones;
  }

  EXPECT_EQ(milestones, 4);
}

TEST_F(OpenListDownloaderTest, ProgressPhasesAreTrackedSeparately) {
  auto downloader = makeDownloader();

  EXPECT_TRUE(downloader->logProgress(task_, "download", 80.0));
  EXPECT_TRUE(downloader->logProgress(task_, "transfer", 10.0));
  EXPECT_FALSE(downloader->logProgress(task_, "download", 85.0));
}

// -- Helpers --

TEST(OpenListDownloaderHelpersTest, SanitizeFilenameReplacesReservedCharacters) {
  EXPECT_EQ(aniflow::core::downloader::sanitizeFilename("Re:Zero / Part?2*"), "Re Zero   Part 2");
  EXPECT_EQ(aniflow::core::downloader::sanitizeFilename("  plain  "), "plain");
}

TEST(OpenListDownloaderHelpersTest, EpisodeLabelMarksMissingValues) {
  EXPECT_EQ(aniflow::core::downloader::formatAnimeEpisode(std::string("Show"), 1, 5), "Show S01E05");
  EXPECT_EQ(aniflow::core::downloader::formatAnimeEpisode(std::nullopt, std::nullopt, 12), "Unknown S??E12");
}

TEST(OpenListDownloaderHelpersTest, FileClassification) {
  EXPECT_TRUE(aniflow::core::downloader::isVideoFile("a.MKV"));
  EXPECT_TRUE(aniflow::core::downloader::isVideoFile("dir/b.mp4"));
  EXPECT_FALSE(aniflow::core::downloader::isVideoFile("c.srt"));
  EXPECT_FALSE(aniflow::core::downloader::isVideoFile("mkv"));

  EXPECT_TRUE(aniflow::core::downloader::isPartialFile("a.mkv.aria2"));
  EXPECT_TRUE(aniflow::core::downloader::isPartialFile("a.mkv.!qB"));
  EXPECT_TRUE(aniflow::core::downloader::isPartialFile("a.mkv.part"));
  EXPECT_FALSE(aniflow::core::downloader::isPartialFile("a.mkv"));
}

}  // namespace aniflow_tests
