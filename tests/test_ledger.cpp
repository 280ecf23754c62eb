#include <atomic>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "media_relay/ledger.hpp"
#include "media_fixture.hpp"

using namespace media_relay;
using test_support::TempDir;

namespace {

class LedgerTest : public ::testing::Test {
protected:
  TempDir dir;
  std::string db_path = dir.file("state/ledger.db");
  Ledger ledger{db_path};

  PipelineRecord fresh(const std::string &path) {
    bool created = false;
    PipelineRecord r = ledger.discover(path, path, 1000, false, created);
    EXPECT_TRUE(created);
    return r;
  }
};

} // namespace

TEST_F(LedgerTest, DiscoverIsIdempotentWhileLive) {
  PipelineRecord a = fresh("/in/a.mkv");
  EXPECT_EQ(a.state, PipelineState::Discovered);
  EXPECT_EQ(a.file_size, 1000u);

  bool created = true;
  PipelineRecord again = ledger.discover("/in/a.mkv", "/in/a.mkv", 1000, false,
                                         created);
  EXPECT_FALSE(created);
  EXPECT_EQ(again.id, a.id);
}

TEST_F(LedgerTest, CompareAndSetRejectsStaleFromState) {
  PipelineRecord r = fresh("/in/a.mkv");
  EXPECT_EQ(ledger.transition(r.id, PipelineState::Discovered,
                              PipelineState::Classified),
            PipelineState::Classified);

  // A second worker still believing the record is DISCOVERED loses
  EXPECT_EQ(ledger.transition(r.id, PipelineState::Discovered,
                              PipelineState::Classified),
            PipelineState::Classified);
  EXPECT_EQ(ledger.history("/in/a.mkv").size(), 2u);
}

TEST_F(LedgerTest, InvalidEdgesAreNotWritten) {
  PipelineRecord r = fresh("/in/a.mkv");
  EXPECT_FALSE(ledger.transition(r, PipelineState::Verified));
  EXPECT_EQ(r.state, PipelineState::Discovered);

  ASSERT_TRUE(ledger.transition(r, PipelineState::Skipped,
                                ErrorKind::UnclassifiedMedia));
  EXPECT_EQ(r.reason, "UnclassifiedMedia");

  // Terminal states have no outgoing edges
  EXPECT_FALSE(ledger.transition(r, PipelineState::Classified));
  EXPECT_EQ(r.state, PipelineState::Skipped);

  EXPECT_FALSE(is_valid_transition(PipelineState::Remuxing,
                                   PipelineState::Verified));
  EXPECT_TRUE(is_valid_transition(PipelineState::Verified,
                                  PipelineState::CleanedUpPartial));
}

TEST_F(LedgerTest, HistoryRecordsEveryCommittedTransition) {
  PipelineRecord r = fresh("/in/a.mkv");
  ASSERT_TRUE(ledger.transition(r, PipelineState::Classified));
  ASSERT_TRUE(ledger.transition(r, PipelineState::Transferring));
  ASSERT_TRUE(ledger.transition(r, PipelineState::Failed,
                                ErrorKind::ConnectionFailed, "host down"));

  auto h = ledger.history("/in/a.mkv");
  ASSERT_EQ(h.size(), 4u);
  EXPECT_EQ(h[0].from_state, "");
  EXPECT_EQ(h[0].to_state, "DISCOVERED");
  EXPECT_EQ(h[3].from_state, "TRANSFERRING");
  EXPECT_EQ(h[3].to_state, "FAILED");
  EXPECT_EQ(h[3].detail, "ConnectionFailed: host down");

  PipelineRecord stored;
  ASSERT_TRUE(ledger.find(r.id, stored));
  EXPECT_EQ(stored.last_error, "host down");
  EXPECT_EQ(stored.reason, "ConnectionFailed");
}

TEST_F(LedgerTest, FinishedRecordsAreReturnedUnlessRetryingFailures) {
  PipelineRecord r = fresh("/in/a.mkv");
  ASSERT_TRUE(ledger.transition(r, PipelineState::Failed,
                                ErrorKind::UnreadableContainer));

  bool created = true;
  PipelineRecord same =
      ledger.discover("/in/a.mkv", "/in/a.mkv", 1000, false, created);
  EXPECT_FALSE(created);
  EXPECT_EQ(same.id, r.id);
  EXPECT_EQ(same.state, PipelineState::Failed);

  PipelineRecord retry =
      ledger.discover("/in/a.mkv", "/in/a.mkv", 1000, true, created);
  EXPECT_TRUE(created);
  EXPECT_NE(retry.id, r.id);
  EXPECT_EQ(retry.state, PipelineState::Discovered);

  // Both attempts share the source path's history
  EXPECT_EQ(ledger.history("/in/a.mkv").size(), 3u);
}

TEST_F(LedgerTest, ConcurrentDiscoveryYieldsOneRecordAndOneWinner) {
  constexpr int THREADS = 8;
  std::atomic<int> created_count{0};
  std::atomic<int> advanced{0};
  std::vector<std::thread> threads;

  for (int i = 0; i < THREADS; ++i) {
    threads.emplace_back([&] {
      // Separate connections, as separate processes would have
      Ledger own(db_path);
      bool created = false;
      PipelineRecord r =
          own.discover("/in/race.mkv", "/in/race.mkv", 5, false, created);
      if (created)
        created_count++;
      if (own.transition(r, PipelineState::Classified))
        advanced++;
    });
  }
  for (auto &t : threads)
    t.join();

  EXPECT_EQ(created_count.load(), 1);
  EXPECT_EQ(advanced.load(), 1);
  EXPECT_EQ(ledger.history("/in/race.mkv").size(), 2u);
}

TEST_F(LedgerTest, ResumableListsLiveRecordsOldestFirst) {
  PipelineRecord a = fresh("/in/a.mkv");
  PipelineRecord b = fresh("/in/b.mkv");
  PipelineRecord c = fresh("/in/c.mkv");
  ASSERT_TRUE(ledger.transition(b, PipelineState::Skipped,
                                ErrorKind::UnclassifiedMedia));
  ASSERT_TRUE(ledger.transition(c, PipelineState::Classified));

  auto live = ledger.resumable();
  ASSERT_EQ(live.size(), 2u);
  EXPECT_EQ(live[0].id, a.id);
  EXPECT_EQ(live[1].id, c.id);
  EXPECT_EQ(live[1].state, PipelineState::Classified);
}

TEST_F(LedgerTest, ProgressAttemptsAndFields) {
  PipelineRecord r = fresh("/in/a.mkv");
  EXPECT_EQ(ledger.record_attempt(r.id), 1);
  EXPECT_EQ(ledger.record_attempt(r.id), 2);
  ledger.update_progress(r.id, 4096);
  ledger.set_destination(r.id, "movies/a.mkv");
  ledger.set_classification(r.id, "movie", "english");
  ledger.set_checksum(r.id, "abc");

  PipelineRecord stored;
  ASSERT_TRUE(ledger.find(r.id, stored));
  EXPECT_EQ(stored.attempt_count, 2);
  EXPECT_EQ(stored.bytes_transferred, 4096u);
  EXPECT_EQ(stored.destination_path, "movies/a.mkv");
  EXPECT_EQ(stored.kind, "movie");
  EXPECT_EQ(stored.language, "english");
  EXPECT_EQ(stored.checksum, "abc");

  PipelineRecord by_path;
  ASSERT_TRUE(ledger.latest("/in/a.mkv", by_path));
  EXPECT_EQ(by_path.id, r.id);
  EXPECT_FALSE(ledger.latest("/in/missing.mkv", by_path));
}

TEST_F(LedgerTest, CancelOnlyFlagsLiveRecords) {
  PipelineRecord r = fresh("/in/a.mkv");
  EXPECT_FALSE(ledger.cancel_requested(r.id));
  EXPECT_TRUE(ledger.request_cancel("/in/a.mkv"));
  EXPECT_TRUE(ledger.cancel_requested(r.id));

  ASSERT_TRUE(ledger.transition(r, PipelineState::Failed, ErrorKind::Cancelled));
  EXPECT_FALSE(ledger.request_cancel("/in/a.mkv"));
  EXPECT_FALSE(ledger.request_cancel("/in/unknown.mkv"));
}

TEST_F(LedgerTest, StatisticsGroupByStateReasonAndClass) {
  PipelineRecord a = fresh("/in/a.mkv");
  ledger.set_classification(a.id, "movie", "english");
  ASSERT_TRUE(ledger.transition(a, PipelineState::Classified));
  ASSERT_TRUE(ledger.transition(a, PipelineState::Transferring));
  ASSERT_TRUE(ledger.transition(a, PipelineState::Verified));

  PipelineRecord b = fresh("/in/b.mkv");
  ASSERT_TRUE(ledger.transition(b, PipelineState::Failed,
                                ErrorKind::UnreadableContainer));
  fresh("/in/c.mkv");

  LedgerStats s = ledger.statistics();
  EXPECT_EQ(s.total, 3);
  EXPECT_EQ(s.by_state["VERIFIED"], 1);
  EXPECT_EQ(s.by_state["FAILED"], 1);
  EXPECT_EQ(s.by_state["DISCOVERED"], 1);
  EXPECT_EQ(s.failures_by_reason["UnreadableContainer"], 1);
  EXPECT_EQ(s.by_destination_class["movie/english"], 1);
  EXPECT_EQ(s.bytes_transferred, 1000u);
}

TEST_F(LedgerTest, PurgeRemovesOnlyOldTerminalRecords) {
  PipelineRecord done = fresh("/in/a.mkv");
  ASSERT_TRUE(ledger.transition(done, PipelineState::Skipped,
                                ErrorKind::UnclassifiedMedia));
  PipelineRecord live = fresh("/in/b.mkv");

  EXPECT_EQ(ledger.purge_terminal_before(unix_now() - 3600), 0);
  EXPECT_EQ(ledger.purge_terminal_before(unix_now() + 10), 1);

  PipelineRecord out;
  EXPECT_FALSE(ledger.find(done.id, out));
  EXPECT_TRUE(ledger.history("/in/a.mkv").empty());
  EXPECT_TRUE(ledger.find(live.id, out));
}

TEST_F(LedgerTest, BackupIsAReadableCopy) {
  PipelineRecord r = fresh("/in/a.mkv");
  std::string copy = dir.file("backup.db");
  ledger.backup_to(copy);

  Ledger restored(copy);
  PipelineRecord out;
  ASSERT_TRUE(restored.find(r.id, out));
  EXPECT_EQ(out.source_path, "/in/a.mkv");
}

TEST(LedgerOpen, UnwritableLocationThrows) {
  EXPECT_THROW(Ledger("/proc/media_relay/ledger.db"), LedgerError);
}

TEST_F(LedgerTest, DestinationHolderIgnoresOwnAndAbandonedRecords) {
  PipelineRecord a = fresh("/in/ShowA/Show.S01E02.mkv");
  ledger.set_destination(a.id, "tv-shows/Show.S01E02.mkv");
  PipelineRecord b = fresh("/in/ShowB/Show.S01E02.mkv");
  ledger.set_destination(b.id, "tv-shows/Show.S01E02.mkv");

  PipelineRecord holder;
  ASSERT_TRUE(ledger.destination_holder("tv-shows/Show.S01E02.mkv",
                                        b.source_path, holder));
  EXPECT_EQ(holder.id, a.id);
  EXPECT_FALSE(ledger.destination_holder("tv-shows/Other.S01E01.mkv",
                                         b.source_path, holder));

  ASSERT_TRUE(ledger.transition(a, PipelineState::Failed,
                                ErrorKind::ConnectionFailed));
  EXPECT_FALSE(ledger.destination_holder("tv-shows/Show.S01E02.mkv",
                                         b.source_path, holder));
}
