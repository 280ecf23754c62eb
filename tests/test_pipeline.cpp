#include <algorithm>
#include <filesystem>
#include <memory>

#include <gtest/gtest.h>

#include "fake_share_client.hpp"
#include "media_fixture.hpp"
#include "media_relay/checksum.hpp"
#include "media_relay/pipeline.hpp"

using namespace media_relay;
using test_support::FakeShareClient;
using test_support::TempDir;

namespace fs = std::filesystem;

namespace {

class PipelineTest : public ::testing::Test {
protected:
  TempDir dir;
  Settings settings;
  std::unique_ptr<Ledger> ledger;
  FakeShareClient share;

  void SetUp() override {
    settings.source_dir = dir.file("incoming");
    settings.temp_dir = dir.file("tmp");
    settings.ledger_path = dir.file("ledger.db");
    settings.transfer.retry_base_delay_ms = 0;
    settings.transfer.retry_max_delay_ms = 0;
    fs::create_directories(settings.source_dir);
    ledger.reset(new Ledger(settings.ledger_path));
  }

  std::string media(const std::string &name,
                    const std::vector<std::string> &audio) {
    std::string path = dir.file("incoming/" + name);
    EXPECT_TRUE(test_support::write_media_fixture(
        path, test_support::video_with_audio(audio)));
    return path;
  }

  FileOutcome run(const std::string &path, const CancellationToken *cancel = nullptr) {
    FilePipeline pipeline(settings, *ledger, share, cancel);
    return pipeline.run(path);
  }

  std::vector<std::string> states(const std::string &path) const {
    std::vector<std::string> out;
    for (const auto &h : ledger->history(path))
      out.push_back(h.to_state);
    return out;
  }
};

} // namespace

TEST_F(PipelineTest, EnglishMovieGoesStraightToTheShare) {
  std::string src = media("Inception.2010.mkv", {"eng"});
  std::string original = test_support::read_file(src);

  FileOutcome out = run(src);
  EXPECT_EQ(out.state, PipelineState::CleanedUp);
  EXPECT_TRUE(out.recorded);
  EXPECT_FALSE(out.failed());
  EXPECT_EQ(out.destination, "movies/Inception.2010.mkv");
  EXPECT_EQ(out.attempts, 1);

  EXPECT_EQ(share.files["movies/Inception.2010.mkv"], original);
  EXPECT_FALSE(fs::exists(src));
  EXPECT_TRUE(fs::is_directory(settings.source_dir));

  EXPECT_EQ(states(src),
            (std::vector<std::string>{"DISCOVERED", "CLASSIFIED",
                                      "TRANSFERRING", "VERIFIED",
                                      "CLEANED_UP"}));

  PipelineRecord rec;
  ASSERT_TRUE(ledger->latest(src, rec));
  EXPECT_EQ(rec.kind, "movie");
  EXPECT_EQ(rec.language, "english");
  Sha256 sha;
  sha.update(original.data(), original.size());
  EXPECT_EQ(rec.checksum, sha.hex_digest());
  EXPECT_EQ(rec.bytes_transferred, original.size());
}

TEST_F(PipelineTest, MalayalamEpisodeIsRemuxedBeforeTransfer) {
  std::string src = media("Show.S01E02.mkv", {"mal", "eng", "mal"});

  FileOutcome out = run(src);
  ASSERT_EQ(out.state, PipelineState::CleanedUp) << out.reason;
  EXPECT_EQ(out.destination, "malayalam-tv-shows/Show.S01E02.mkv");
  EXPECT_EQ(states(src),
            (std::vector<std::string>{"DISCOVERED", "CLASSIFIED", "REMUXING",
                                      "TRANSFERRING", "VERIFIED",
                                      "CLEANED_UP"}));

  // The remote copy holds the video and both Malayalam tracks only
  std::string copy = dir.file("remote.mkv");
  ASSERT_TRUE(test_support::write_file(
      copy, share.files["malayalam-tv-shows/Show.S01E02.mkv"]));
  MediaInfo info;
  ASSERT_EQ(ContainerInspector().inspect(copy, info), ErrorKind::None);
  ASSERT_EQ(info.tracks.size(), 3u);
  EXPECT_EQ(info.tracks[1].language, "mal");
  EXPECT_EQ(info.tracks[2].language, "mal");

  PipelineRecord rec;
  ASSERT_TRUE(ledger->latest(src, rec));
  EXPECT_FALSE(fs::exists(remux_path_for(settings.temp_dir, src, rec.id)));
}

TEST_F(PipelineTest, SecondRunOfSameFileDoesNothing) {
  settings.clean_original_files = false;
  std::string src = media("Inception.2010.mkv", {"eng"});

  ASSERT_EQ(run(src).state, PipelineState::CleanedUp);
  uint64_t written = share.bytes_written;

  FileOutcome again = run(src);
  EXPECT_TRUE(again.existing);
  EXPECT_FALSE(again.failed());
  EXPECT_EQ(again.state, PipelineState::CleanedUp);
  EXPECT_EQ(share.bytes_written, written);
  EXPECT_EQ(states(src).size(), 5u);
}

TEST_F(PipelineTest, DryRunWritesNothing) {
  settings.dry_run = true;
  std::string src = media("Show.S01E02.mkv", {"mal", "eng"});

  FileOutcome out = run(src);
  EXPECT_TRUE(out.planned);
  EXPECT_FALSE(out.recorded);
  EXPECT_EQ(out.destination, "malayalam-tv-shows/Show.S01E02.mkv");

  PipelineRecord rec;
  EXPECT_FALSE(ledger->latest(src, rec));
  EXPECT_TRUE(share.files.empty());
  EXPECT_EQ(share.connect_calls, 0);
  EXPECT_TRUE(fs::exists(src));
}

TEST_F(PipelineTest, FileWithoutVideoIsSkipped) {
  std::string src = dir.file("incoming/Podcast.mkv");
  test_support::FixtureLayout layout;
  test_support::FixtureTrack audio;
  audio.language = "eng";
  layout.tracks.push_back(audio);
  ASSERT_TRUE(test_support::write_media_fixture(src, layout));

  FileOutcome out = run(src);
  EXPECT_EQ(out.state, PipelineState::Skipped);
  EXPECT_EQ(out.reason, "UnclassifiedMedia");
  EXPECT_FALSE(out.failed());
  EXPECT_TRUE(share.files.empty());
  EXPECT_TRUE(fs::exists(src));
}

TEST_F(PipelineTest, UnreadableContainerFails) {
  std::string src = dir.file("incoming/Broken.2001.mkv");
  ASSERT_TRUE(test_support::write_file(src, std::string(2048, '\x01')));

  FileOutcome out = run(src);
  EXPECT_TRUE(out.failed());
  EXPECT_EQ(out.reason, "UnreadableContainer");
  EXPECT_TRUE(fs::exists(src));
}

TEST_F(PipelineTest, MissingFileCreatesNoRecord) {
  FileOutcome out = run(dir.file("incoming/Gone.mkv"));
  EXPECT_FALSE(out.recorded);
  EXPECT_EQ(out.reason, "NotFound");
  EXPECT_TRUE(ledger->resumable().empty());
}

TEST_F(PipelineTest, AuthenticationFailureFailsWithoutRetry) {
  share.connect_failures = {ErrorKind::AuthenticationFailed};
  std::string src = media("Inception.2010.mkv", {"eng"});

  FileOutcome out = run(src);
  EXPECT_TRUE(out.failed());
  EXPECT_EQ(out.reason, "AuthenticationFailed");
  EXPECT_EQ(out.attempts, 1);
  EXPECT_TRUE(fs::exists(src));

  PipelineRecord rec;
  ASSERT_TRUE(ledger->latest(src, rec));
  EXPECT_NE(rec.last_error.find("CONNECTING"), std::string::npos);
}

TEST_F(PipelineTest, ProcessCancellationFailsTheRecord) {
  CancellationToken token;
  token.request();
  std::string src = media("Inception.2010.mkv", {"eng"});

  FileOutcome out = run(src, &token);
  EXPECT_TRUE(out.failed());
  EXPECT_EQ(out.reason, "Cancelled");
  EXPECT_TRUE(share.files.empty());
}

TEST_F(PipelineTest, LedgerCancelRequestIsHonouredOnResume) {
  std::string src = media("Inception.2010.mkv", {"eng"});
  bool created = false;
  PipelineRecord rec = ledger->discover(src, src, fs::file_size(src), false,
                                        created);
  ASSERT_TRUE(created);
  ASSERT_TRUE(ledger->request_cancel(src));
  ASSERT_TRUE(ledger->find(rec.id, rec));

  FilePipeline pipeline(settings, *ledger, share);
  FileOutcome out = pipeline.resume(rec);
  EXPECT_EQ(out.state, PipelineState::Failed);
  EXPECT_EQ(out.reason, "Cancelled");
}

TEST_F(PipelineTest, ResumesInterruptedTransferFromLedgerOffset) {
  std::string src = media("Inception.2010.mkv", {"eng"});
  std::string content = test_support::read_file(src);
  const uint64_t done = content.size() / 2;

  bool created = false;
  PipelineRecord rec =
      ledger->discover(src, src, content.size(), false, created);
  ledger->set_classification(rec.id, "movie", "english");
  ledger->set_destination(rec.id, "movies/Inception.2010.mkv");
  ASSERT_TRUE(ledger->transition(rec, PipelineState::Classified));
  ASSERT_TRUE(ledger->transition(rec, PipelineState::Transferring));
  ledger->update_progress(rec.id, done);
  share.files["movies/Inception.2010.mkv.part"] = content.substr(0, done);
  ASSERT_TRUE(ledger->find(rec.id, rec));

  FilePipeline pipeline(settings, *ledger, share);
  FileOutcome out = pipeline.resume(rec);
  ASSERT_EQ(out.state, PipelineState::CleanedUp) << out.reason;
  EXPECT_EQ(share.bytes_written, content.size() - done);
  EXPECT_EQ(share.files["movies/Inception.2010.mkv"], content);
}

TEST_F(PipelineTest, CleanupDisabledStopsAtVerified) {
  settings.cleanup_enabled = false;
  std::string src = media("Inception.2010.mkv", {"eng"});

  FileOutcome out = run(src);
  EXPECT_EQ(out.state, PipelineState::Verified);
  EXPECT_TRUE(fs::exists(src));
  EXPECT_EQ(ledger->resumable().size(), 1u);
}

TEST_F(PipelineTest, RemuxFailureFallsBackToOriginal) {
  // A regular file where the temp directory should be
  ASSERT_TRUE(test_support::write_file(dir.file("blocker"), "x"));
  settings.temp_dir = dir.file("blocker/tmp");
  std::string src = media("Show.S01E02.mkv", {"mal", "eng"});
  std::string original = test_support::read_file(src);

  FileOutcome out = run(src);
  ASSERT_EQ(out.state, PipelineState::CleanedUp) << out.reason;
  EXPECT_EQ(share.files["malayalam-tv-shows/Show.S01E02.mkv"], original);
}

TEST_F(PipelineTest, RemuxFailureWithoutFallbackFails) {
  ASSERT_TRUE(test_support::write_file(dir.file("blocker"), "x"));
  settings.temp_dir = dir.file("blocker/tmp");
  settings.language_policy.fallback_to_original = false;
  std::string src = media("Show.S01E02.mkv", {"mal", "eng"});

  FileOutcome out = run(src);
  EXPECT_TRUE(out.failed());
  EXPECT_EQ(out.reason, "RemuxFailed");
  EXPECT_TRUE(share.files.empty());
}

TEST_F(PipelineTest, DuplicateContentIsSkippedWithHashKeys) {
  settings.dedup_by_hash = true;
  settings.clean_original_files = false;
  std::string first = media("Inception.2010.mkv", {"eng"});
  std::string second = dir.file("incoming/copy/Inception.2010.mkv");
  fs::create_directories(dir.file("incoming/copy"));
  fs::copy_file(first, second);

  ASSERT_EQ(run(first).state, PipelineState::CleanedUp);
  FileOutcome dup = run(second);
  EXPECT_TRUE(dup.existing);
  EXPECT_EQ(dup.source_path, first);

  PipelineRecord rec;
  ASSERT_TRUE(ledger->latest(first, rec));
  EXPECT_EQ(rec.record_key.compare(0, 7, "sha256:"), 0);
}

TEST_F(PipelineTest, ConnectionFailuresAreRetriedUntilVerified) {
  share.connect_failures = {ErrorKind::ConnectionFailed,
                            ErrorKind::ConnectionFailed,
                            ErrorKind::ConnectionFailed};
  std::string src = media("Inception.2010.mkv", {"eng"});

  FileOutcome out = run(src);
  ASSERT_EQ(out.state, PipelineState::CleanedUp) << out.reason;
  EXPECT_EQ(out.attempts, 4);

  PipelineRecord rec;
  ASSERT_TRUE(ledger->latest(src, rec));
  EXPECT_EQ(rec.attempt_count, 4);
  std::vector<std::string> seen = states(src);
  EXPECT_NE(std::find(seen.begin(), seen.end(), "VERIFIED"), seen.end());
  EXPECT_EQ(std::find(seen.begin(), seen.end(), "FAILED"), seen.end());
}

TEST_F(PipelineTest, SameNamedSourcesKeepSeparateRemuxArtifacts) {
  settings.cleanup_enabled = false;
  fs::create_directories(dir.file("incoming/ShowA"));
  fs::create_directories(dir.file("incoming/ShowB"));
  std::string a = media("ShowA/Show.S01E02.mkv", {"mal", "eng"});
  std::string b = media("ShowB/Show.S01E02.mkv", {"mal", "eng", "mal"});

  ASSERT_EQ(run(a).state, PipelineState::Verified);
  ASSERT_EQ(run(b).state, PipelineState::Verified);

  PipelineRecord rec_a, rec_b;
  ASSERT_TRUE(ledger->latest(a, rec_a));
  ASSERT_TRUE(ledger->latest(b, rec_b));
  ASSERT_NE(rec_a.remux_path, rec_b.remux_path);

  // Remuxing B left A's artifact untouched
  MediaInfo info_a, info_b;
  ASSERT_EQ(ContainerInspector().inspect(rec_a.remux_path, info_a),
            ErrorKind::None);
  ASSERT_EQ(ContainerInspector().inspect(rec_b.remux_path, info_b),
            ErrorKind::None);
  EXPECT_EQ(info_a.tracks.size(), 2u);
  EXPECT_EQ(info_b.tracks.size(), 3u);

  Sha256 sha;
  std::string artifact_a = test_support::read_file(rec_a.remux_path);
  sha.update(artifact_a.data(), artifact_a.size());
  EXPECT_EQ(rec_a.checksum, sha.hex_digest());

  // Both route to one destination; the second run names the first source
  std::vector<HistoryEntry> h = ledger->history(b);
  bool noted = false;
  for (const auto &e : h)
    if (e.detail.find(a) != std::string::npos)
      noted = true;
  EXPECT_TRUE(noted);
}

TEST_F(PipelineTest, MissingRemuxArtifactRestartsTheUploadOfTheOriginal) {
  std::string src = media("Show.S01E02.mkv", {"mal", "eng"});
  std::string original = test_support::read_file(src);
  const uint64_t done = original.size() / 2;
  const std::string dest = "malayalam-tv-shows/Show.S01E02.mkv";

  bool created = false;
  PipelineRecord rec =
      ledger->discover(src, src, original.size(), false, created);
  ledger->set_classification(rec.id, "episode", "malayalam");
  ledger->set_destination(rec.id, dest);
  ledger->set_remux_path(rec.id, dir.file("tmp/gone.remux.mkv"));
  ASSERT_TRUE(ledger->transition(rec, PipelineState::Classified));
  ASSERT_TRUE(ledger->transition(rec, PipelineState::Remuxing));
  ASSERT_TRUE(ledger->transition(rec, PipelineState::Transferring));

  // Half of the lost remuxed file already reached the share
  ledger->update_progress(rec.id, done);
  share.files[dest + ".part"] = std::string(done, 'R');
  ASSERT_TRUE(ledger->find(rec.id, rec));

  FilePipeline pipeline(settings, *ledger, share);
  FileOutcome out = pipeline.resume(rec);
  ASSERT_EQ(out.state, PipelineState::CleanedUp) << out.reason;
  EXPECT_EQ(share.files[dest], original);
  EXPECT_EQ(share.bytes_written, original.size());
}
