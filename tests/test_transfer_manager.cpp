#include <gtest/gtest.h>

#include "fake_share_client.hpp"
#include "media_fixture.hpp"
#include "media_relay/checksum.hpp"
#include "media_relay/transfer_manager.hpp"

using namespace media_relay;
using test_support::FakeShareClient;
using test_support::TempDir;

namespace {

constexpr const char *CONTENT = "0123456789abcdefghij"; //< 20 bytes
constexpr const char *DEST = "movies/Inception.2010.mkv";
constexpr const char *PART = "movies/Inception.2010.mkv.part";

class TransferTest : public ::testing::Test {
protected:
  TempDir dir;
  std::string local = dir.file("Inception.2010.mkv");
  FakeShareClient share;
  TransferOptions options;

  void SetUp() override {
    ASSERT_TRUE(test_support::write_file(local, CONTENT));
    options.chunk_size = 4;
    options.retry_base_delay_ms = 0;
    options.retry_max_delay_ms = 0;
  }

  TransferRequest request(uint64_t resume = 0) const {
    TransferRequest r;
    r.local_path = local;
    r.remote_path = DEST;
    r.resume_offset = resume;
    return r;
  }
};

} // namespace

TEST_F(TransferTest, CopiesVerifiesAndRenames) {
  TransferManager tm(share, options);
  std::vector<TransferPhase> phases;
  TransferHooks hooks;
  hooks.on_phase = [&](TransferPhase p) { phases.push_back(p); };

  TransferResult r = tm.transfer(request(), hooks);
  ASSERT_EQ(r.error, ErrorKind::None);
  EXPECT_EQ(r.phase, TransferPhase::Confirmed);
  EXPECT_EQ(r.attempts, 1);
  EXPECT_EQ(r.bytes, 20u);
  EXPECT_FALSE(r.already_present);

  std::string expected;
  ASSERT_TRUE(sha256_file(local, expected));
  EXPECT_EQ(r.checksum, expected);

  EXPECT_EQ(share.files[DEST], CONTENT);
  EXPECT_EQ(share.files.count(PART), 0u);
  EXPECT_EQ(share.dirs.count("movies"), 1u);

  std::vector<TransferPhase> want = {
      TransferPhase::Connecting, TransferPhase::Writing,
      TransferPhase::Verifying, TransferPhase::Confirmed};
  EXPECT_EQ(phases, want);
}

TEST_F(TransferTest, RetriesConnectionFailuresUntilSuccess) {
  share.connect_failures = {ErrorKind::ConnectionFailed,
                            ErrorKind::ConnectionFailed,
                            ErrorKind::ConnectionFailed};
  int attempts_seen = 0;
  TransferHooks hooks;
  hooks.on_attempt = [&](int attempt) { attempts_seen = attempt; };

  TransferManager tm(share, options);
  TransferResult r = tm.transfer(request(), hooks);
  ASSERT_EQ(r.error, ErrorKind::None);
  EXPECT_EQ(r.attempts, 4);
  EXPECT_EQ(attempts_seen, 4);
  EXPECT_EQ(share.connect_calls, 4);
  EXPECT_EQ(share.files[DEST], CONTENT);
}

TEST_F(TransferTest, GivesUpAfterFiveConnectionFailures) {
  share.connect_failures.assign(6, ErrorKind::ConnectionFailed);
  TransferManager tm(share, options);
  TransferResult r = tm.transfer(request());
  EXPECT_EQ(r.error, ErrorKind::ConnectionFailed);
  EXPECT_EQ(r.phase, TransferPhase::Failed);
  EXPECT_EQ(r.attempts, 5);
  EXPECT_TRUE(share.files.empty());
}

TEST_F(TransferTest, AuthenticationFailureIsNotRetried) {
  share.connect_failures = {ErrorKind::AuthenticationFailed};
  TransferManager tm(share, options);
  TransferResult r = tm.transfer(request());
  EXPECT_EQ(r.error, ErrorKind::AuthenticationFailed);
  EXPECT_EQ(r.attempts, 1);
  EXPECT_EQ(share.connect_calls, 1);
}

TEST_F(TransferTest, ResumesFromPartialFileOfEarlierRun) {
  share.files[PART] = std::string(CONTENT, 8);

  TransferManager tm(share, options);
  TransferResult r = tm.transfer(request(8));
  ASSERT_EQ(r.error, ErrorKind::None);
  EXPECT_EQ(share.bytes_written, 12u);
  EXPECT_EQ(share.files[DEST], CONTENT);
}

TEST_F(TransferTest, ResumeOffsetIsClampedToBytesOnShare) {
  share.files[PART] = std::string(CONTENT, 4);

  TransferManager tm(share, options);
  TransferResult r = tm.transfer(request(16));
  ASSERT_EQ(r.error, ErrorKind::None);
  EXPECT_EQ(share.bytes_written, 16u);
  EXPECT_EQ(share.files[DEST], CONTENT);
}

TEST_F(TransferTest, RetryAfterDroppedConnectionContinuesAtLastOffset) {
  std::vector<uint64_t> progress;
  TransferHooks hooks;
  hooks.on_progress = [&](uint64_t bytes) {
    progress.push_back(bytes);
    if (bytes == 8 && share.write_failures.empty() && share.connect_calls == 1)
      share.write_failures.push_back(ErrorKind::ConnectionFailed);
  };

  TransferManager tm(share, options);
  TransferResult r = tm.transfer(request(), hooks);
  ASSERT_EQ(r.error, ErrorKind::None);
  EXPECT_EQ(r.attempts, 2);
  EXPECT_EQ(share.connect_calls, 2);
  EXPECT_EQ(share.bytes_written, 20u);
  EXPECT_EQ(share.files[DEST], CONTENT);

  for (size_t i = 1; i < progress.size(); ++i)
    EXPECT_GE(progress[i], progress[i - 1]);
}

TEST_F(TransferTest, ChecksumMismatchDiscardsPartAndIsNotRetried) {
  share.corrupt_writes = 1;
  uint64_t last_progress = 99;
  TransferHooks hooks;
  hooks.on_progress = [&](uint64_t bytes) { last_progress = bytes; };

  TransferManager tm(share, options);
  TransferResult r = tm.transfer(request(), hooks);
  EXPECT_EQ(r.error, ErrorKind::ChecksumMismatch);
  EXPECT_EQ(r.attempts, 1);
  EXPECT_EQ(last_progress, 0u);
  EXPECT_EQ(share.files.count(PART), 0u);
  EXPECT_EQ(share.files.count(DEST), 0u);
}

TEST_F(TransferTest, MatchingFileOnShareIsConfirmedWithoutCopy) {
  share.files[DEST] = CONTENT;
  TransferManager tm(share, options);
  TransferResult r = tm.transfer(request());
  ASSERT_EQ(r.error, ErrorKind::None);
  EXPECT_TRUE(r.already_present);
  EXPECT_EQ(share.bytes_written, 0u);
}

TEST_F(TransferTest, DifferentFileOfSameSizeIsReplaced) {
  share.files[DEST] = std::string(20, 'x');
  TransferManager tm(share, options);
  TransferResult r = tm.transfer(request());
  ASSERT_EQ(r.error, ErrorKind::None);
  EXPECT_FALSE(r.already_present);
  EXPECT_EQ(share.files[DEST], CONTENT);
}

TEST_F(TransferTest, CancelStopsBetweenChunksAndKeepsPart) {
  bool stop = false;
  TransferHooks hooks;
  hooks.should_cancel = [&] { return stop; };
  hooks.on_progress = [&](uint64_t bytes) { stop = bytes >= 8; };

  TransferManager tm(share, options);
  TransferResult r = tm.transfer(request(), hooks);
  EXPECT_EQ(r.error, ErrorKind::Cancelled);
  EXPECT_EQ(r.phase, TransferPhase::Failed);
  EXPECT_EQ(share.files.count(DEST), 0u);
  EXPECT_EQ(share.files[PART].size(), 8u);
  EXPECT_FALSE(share.connected());
}

TEST_F(TransferTest, TokenCancelledBeforeStartMakesNoAttempt) {
  CancellationToken token;
  token.request();
  TransferManager tm(share, options, &token);
  TransferResult r = tm.transfer(request());
  EXPECT_EQ(r.error, ErrorKind::Cancelled);
  EXPECT_EQ(r.attempts, 0);
  EXPECT_EQ(share.connect_calls, 0);
}

TEST_F(TransferTest, MissingLocalFile) {
  TransferRequest req = request();
  req.local_path = dir.file("missing.mkv");
  TransferManager tm(share, options);
  EXPECT_EQ(tm.transfer(req).error, ErrorKind::NotFound);
}

TEST(TransferBackoff, DoublesUpToTheCap) {
  FakeShareClient share;
  TransferOptions options;
  options.retry_base_delay_ms = 100;
  options.retry_max_delay_ms = 1000;
  TransferManager tm(share, options);
  EXPECT_EQ(tm.backoff_delay(1).count(), 100);
  EXPECT_EQ(tm.backoff_delay(2).count(), 200);
  EXPECT_EQ(tm.backoff_delay(3).count(), 400);
  EXPECT_EQ(tm.backoff_delay(4).count(), 800);
  EXPECT_EQ(tm.backoff_delay(5).count(), 1000);
  EXPECT_EQ(tm.backoff_delay(9).count(), 1000);
}
