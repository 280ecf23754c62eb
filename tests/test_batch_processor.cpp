#include <chrono>
#include <filesystem>
#include <thread>

#include <gtest/gtest.h>

#include "fake_share_client.hpp"
#include "media_fixture.hpp"
#include "media_relay/batch_processor.hpp"

using namespace media_relay;
using test_support::FakeShareClient;
using test_support::TempDir;

namespace fs = std::filesystem;

namespace {

class BatchTest : public ::testing::Test {
protected:
  TempDir dir;
  Settings settings;
  std::unique_ptr<Ledger> ledger;
  CancellationToken cancel;

  void SetUp() override {
    settings.source_dir = dir.file("incoming");
    settings.temp_dir = dir.file("tmp");
    settings.ledger_path = dir.file("ledger.db");
    settings.parallel_workers = 2;
    settings.transfer.retry_base_delay_ms = 0;
    settings.transfer.retry_max_delay_ms = 0;
    settings.share.backend = "local";
    settings.share.local_root = dir.file("share");
    settings.share.base_path = "media";
    fs::create_directories(settings.source_dir);
    fs::create_directories(settings.share.local_root);
    ledger.reset(new Ledger(settings.ledger_path));
  }

  std::string media(const std::string &name,
                    const std::vector<std::string> &audio) {
    std::string path = dir.file("incoming/" + name);
    EXPECT_TRUE(test_support::write_media_fixture(
        path, test_support::video_with_audio(audio)));
    return path;
  }

  bool on_share(const std::string &relative) const {
    return fs::is_regular_file(dir.file("share/media/" + relative));
  }
};

} // namespace

TEST_F(BatchTest, ProcessesDirectoryWithSeveralWorkers) {
  media("Inception.2010.mkv", {"eng"});
  media("Show/Season 1/Show.S01E02.mkv", {"mal", "eng"});
  media("The.Matrix.1999.mkv", {"eng", "hin"});
  ASSERT_TRUE(test_support::write_file(dir.file("incoming/readme.txt"), "x"));
  ASSERT_TRUE(test_support::write_file(dir.file("incoming/.hidden.mkv"), "x"));

  BatchProcessor batch(settings, *ledger, cancel);
  EXPECT_EQ(batch.process({settings.source_dir}), 0);

  auto results = batch.results();
  ASSERT_EQ(results.size(), 3u);
  for (const auto &r : results)
    EXPECT_EQ(r.state, PipelineState::CleanedUp) << r.source_path;

  EXPECT_TRUE(on_share("movies/Inception.2010.mkv"));
  EXPECT_TRUE(on_share("movies/The.Matrix.1999.mkv"));
  EXPECT_TRUE(on_share("malayalam-tv-shows/Show.S01E02.mkv"));
  EXPECT_FALSE(fs::exists(dir.file("incoming/Show")));
  EXPECT_TRUE(fs::exists(dir.file("incoming/readme.txt")));
}

TEST_F(BatchTest, CountsFailuresAndSkips) {
  std::string broken = dir.file("incoming/Broken.2001.mkv");
  ASSERT_TRUE(test_support::write_file(broken, std::string(1024, '\x02')));
  media("Inception.2010.mkv", {"eng"});

  BatchProcessor batch(settings, *ledger, cancel);
  EXPECT_EQ(batch.process({settings.source_dir, dir.file("missing.mkv")}), 2);
  EXPECT_EQ(batch.results().size(), 3u);

  // Finished records are left alone on the next scan
  EXPECT_EQ(batch.process({settings.source_dir}), 0);
  for (const auto &r : batch.results())
    EXPECT_TRUE(r.existing) << r.source_path;
}

TEST_F(BatchTest, ResumesInterruptedRecordsFirst) {
  std::string src = media("Inception.2010.mkv", {"eng"});
  bool created = false;
  PipelineRecord rec =
      ledger->discover(src, src, fs::file_size(src), false, created);
  ASSERT_TRUE(ledger->transition(rec, PipelineState::Classified));
  ledger->set_destination(rec.id, "movies/Inception.2010.mkv");
  ASSERT_TRUE(ledger->transition(rec, PipelineState::Transferring));

  BatchProcessor batch(settings, *ledger, cancel);
  EXPECT_EQ(batch.process({}), 0);

  ASSERT_EQ(batch.results().size(), 1u);
  EXPECT_EQ(batch.results()[0].record_id, rec.id);
  EXPECT_EQ(batch.results()[0].state, PipelineState::CleanedUp);
  EXPECT_TRUE(on_share("movies/Inception.2010.mkv"));
  EXPECT_EQ(ledger->history(src).size(), 5u);
}

TEST_F(BatchTest, OneSessionPerWorker) {
  settings.parallel_workers = 3;
  media("Inception.2010.mkv", {"eng"});

  int created = 0;
  BatchProcessor batch(settings, *ledger, cancel,
                       [&](const ShareSettings &) -> std::unique_ptr<ShareClient> {
                         ++created;
                         return std::unique_ptr<ShareClient>(new FakeShareClient);
                       });
  EXPECT_EQ(batch.process({settings.source_dir}), 0);
  EXPECT_EQ(created, 3);
}

TEST_F(BatchTest, UnknownBackendStopsBeforeWork) {
  settings.share.backend = "ftp";
  media("Inception.2010.mkv", {"eng"});

  BatchProcessor batch(settings, *ledger, cancel);
  EXPECT_EQ(batch.process({settings.source_dir}), -1);
  EXPECT_TRUE(ledger->resumable().empty());
}

TEST_F(BatchTest, DryRunPlansWithoutRecording) {
  settings.dry_run = true;
  std::string src = media("Inception.2010.mkv", {"eng"});

  BatchProcessor batch(settings, *ledger, cancel);
  EXPECT_EQ(batch.process({settings.source_dir}), 0);
  ASSERT_EQ(batch.results().size(), 1u);
  EXPECT_TRUE(batch.results()[0].planned);

  PipelineRecord rec;
  EXPECT_FALSE(ledger->latest(src, rec));
  EXPECT_TRUE(fs::exists(src));
}

TEST_F(BatchTest, EmptyInputIsNotAnError) {
  BatchProcessor batch(settings, *ledger, cancel);
  EXPECT_EQ(batch.process({settings.source_dir}), 0);
  EXPECT_TRUE(batch.results().empty());
}

TEST_F(BatchTest, WatchPicksUpStableFilesUntilCancelled) {
  settings.stable_seconds = 0;
  settings.watch_interval_sec = 1;
  std::string src = media("Inception.2010.mkv", {"eng"});

  BatchProcessor batch(settings, *ledger, cancel);
  int failures = -2;
  std::thread watcher([&] { failures = batch.watch(settings.source_dir); });

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(20);
  PipelineRecord rec;
  while (std::chrono::steady_clock::now() < deadline) {
    if (ledger->latest(src, rec) && is_terminal(rec.state))
      break;
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  cancel.request();
  watcher.join();

  EXPECT_EQ(failures, 0);
  EXPECT_EQ(rec.state, PipelineState::CleanedUp);
  EXPECT_TRUE(on_share("movies/Inception.2010.mkv"));
}

TEST(JobQueue, RejectsActivePathsUntilCompleted) {
  JobQueue queue;
  EXPECT_TRUE(queue.push({"/in/a.mkv", 0}));
  EXPECT_FALSE(queue.push({"/in/a.mkv", 0}));
  EXPECT_TRUE(queue.contains("/in/a.mkv"));

  PipelineJob job;
  ASSERT_TRUE(queue.pop(job));
  EXPECT_EQ(job.source_path, "/in/a.mkv");
  EXPECT_FALSE(queue.push({"/in/a.mkv", 0}));

  queue.complete("/in/a.mkv");
  EXPECT_TRUE(queue.push({"/in/a.mkv", 0}));

  queue.finish();
  EXPECT_FALSE(queue.push({"/in/b.mkv", 0}));
  ASSERT_TRUE(queue.pop(job));
  EXPECT_FALSE(queue.pop(job));

  queue.reopen();
  EXPECT_TRUE(queue.push({"/in/b.mkv", 0}));
}
