/**
 * @file ledger.hpp
 * @brief Persisted per-file pipeline state machine
 *
 * @details SQLite-backed ledger with two tables:
 *
 *          - pipeline_records: one row per attempt at moving one file. A
 *            partial unique index allows at most one non-terminal row per
 *            record key.
 *
 *          - pipeline_history: append-only log of committed transitions.
 *
 * @attention STATE MACHINE:
 *
 *   DISCOVERED   -> CLASSIFIED | SKIPPED | FAILED
 *
 *   CLASSIFIED   -> REMUXING | TRANSFERRING | SKIPPED | FAILED
 *
 *   REMUXING     -> TRANSFERRING | FAILED
 *
 *   TRANSFERRING -> VERIFIED | FAILED
 *
 *   VERIFIED     -> CLEANED_UP | CLEANED_UP_PARTIAL | FAILED
 *
 * @note transition() is a compare-and-set (UPDATE ... WHERE id=? AND
 *       state=?). It is the only mutual exclusion between workers and
 *       between processes sharing the database file.
 */

#ifndef MEDIA_RELAY_LEDGER_HPP
#define MEDIA_RELAY_LEDGER_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "errors.hpp"
#include "types.hpp"

struct sqlite3;

namespace media_relay {

/// Storage-level failure (cannot open, SQL error, disk full)
class LedgerError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

bool is_valid_transition(PipelineState from, PipelineState to);

/**
 * @struct LedgerStats
 * @brief Aggregates for the stats command and dashboards.
 */
struct LedgerStats {
  long total = 0;
  std::map<std::string, long> by_state;
  std::map<std::string, long> failures_by_reason;
  std::map<std::string, long> by_destination_class; //< "kind/language"
  uint64_t bytes_transferred = 0; //< Sum over records that reached VERIFIED
};

class Ledger {
  sqlite3 *db_ = nullptr;
  std::string path_;
  mutable std::mutex mutex_;

  void exec(const char *sql) const;
  void set_text(int64_t id, const char *column, const std::string &value);

public:
  /**
   * @brief Open (and create) the ledger database.
   * @throws LedgerError when the file cannot be opened or migrated
   */
  explicit Ledger(const std::string &path);
  ~Ledger();

  Ledger(const Ledger &) = delete;
  Ledger &operator=(const Ledger &) = delete;

  const std::string &path() const { return path_; }

  /**
   * @brief Find or create the record of a detected file.
   *
   * @details Returns the live (non-terminal) record of key when there is
   *          one. Otherwise returns the newest finished record, unless it is
   *          FAILED and retry_failed is set, in which case (or when the key
   *          was never seen) a new DISCOVERED record is inserted.
   *
   * @param created Output: true when a new record was inserted
   */
  PipelineRecord discover(const std::string &key,
                          const std::string &source_path, uint64_t file_size,
                          bool retry_failed, bool &created);

  /**
   * @brief Atomic compare-and-set of a record's state.
   * @param reason Error kind stored with FAILED/SKIPPED/CLEANED_UP_PARTIAL
   * @param detail Free text for the history row (and last_error on FAILED)
   * @return The state after the call: to on success, otherwise the current
   *         state (invalid edge or lost race; nothing is written)
   */
  PipelineState transition(int64_t id, PipelineState from, PipelineState to,
                           ErrorKind reason = ErrorKind::None,
                           const std::string &detail = "");

  /// CAS from record.state; updates record on success
  bool transition(PipelineRecord &record, PipelineState to,
                  ErrorKind reason = ErrorKind::None,
                  const std::string &detail = "");

  bool find(int64_t id, PipelineRecord &out) const;

  /// Newest record whose key or source path equals key_or_path
  bool latest(const std::string &key_or_path, PipelineRecord &out) const;

  /// Newest record of another source that was routed to destination
  bool destination_holder(const std::string &destination,
                          const std::string &source_path,
                          PipelineRecord &out) const;

  /// Transitions of every record of a source path, oldest first
  std::vector<HistoryEntry> history(const std::string &source_path) const;

  /// Every record in a non-terminal state, oldest first
  std::vector<PipelineRecord> resumable() const;

  /// Count one more transfer attempt; returns the new count
  int record_attempt(int64_t id);
  void update_progress(int64_t id, uint64_t bytes);
  void set_destination(int64_t id, const std::string &path);
  void set_classification(int64_t id, const std::string &kind,
                          const std::string &language);
  void set_remux_path(int64_t id, const std::string &path);
  void set_checksum(int64_t id, const std::string &hex);
  void set_last_error(int64_t id, const std::string &text);

  /**
   * @brief Flag the live record of a path (or key) for cancellation.
   * @return false when no live record matches
   */
  bool request_cancel(const std::string &key_or_path);
  bool cancel_requested(int64_t id) const;

  LedgerStats statistics() const;

  /**
   * @brief Delete terminal records (and their history) last updated before
   *        cutoff (unix seconds).
   * @return Number of records removed
   */
  int purge_terminal_before(int64_t cutoff);

  /// Online copy of the database to dest_path
  void backup_to(const std::string &dest_path) const;
};

/// Current time in unix seconds
int64_t unix_now();

} // namespace media_relay

#endif // MEDIA_RELAY_LEDGER_HPP
