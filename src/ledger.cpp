/**
 * @file ledger.cpp
 * @brief SQLite implementation of the pipeline ledger
 *
 * @details One connection per Ledger, serialized by a mutex. Every write
 *          runs inside BEGIN IMMEDIATE so that concurrent processes on the
 *          same file queue on the write lock (busy_timeout) instead of
 *          failing. synchronous=FULL makes each COMMIT durable before the
 *          pipeline moves on to the next stage.
 */

#include "media_relay/ledger.hpp"

#include <chrono>
#include <filesystem>

#include <fmt/core.h>
#include <sqlite3.h>

#include "media_relay/logging.hpp"

namespace media_relay {

namespace {

constexpr const char *RECORD_COLUMNS =
    "id, record_key, source_path, state, reason, destination_path, "
    "remux_path, checksum, kind, language, attempt_count, last_error, "
    "file_size, bytes_transferred, cancel_requested, created_at, updated_at";

constexpr const char *TERMINAL_STATES =
    "('CLEANED_UP', 'CLEANED_UP_PARTIAL', 'FAILED', 'SKIPPED')";

constexpr const char *SCHEMA = R"SQL(
  CREATE TABLE IF NOT EXISTS pipeline_records (
    id                INTEGER PRIMARY KEY AUTOINCREMENT,
    record_key        TEXT    NOT NULL,
    source_path       TEXT    NOT NULL,
    state             TEXT    NOT NULL,
    reason            TEXT    NOT NULL DEFAULT '',
    destination_path  TEXT    NOT NULL DEFAULT '',
    remux_path        TEXT    NOT NULL DEFAULT '',
    checksum          TEXT    NOT NULL DEFAULT '',
    kind              TEXT    NOT NULL DEFAULT '',
    language          TEXT    NOT NULL DEFAULT '',
    attempt_count     INTEGER NOT NULL DEFAULT 0,
    last_error        TEXT    NOT NULL DEFAULT '',
    file_size         INTEGER NOT NULL DEFAULT 0,
    bytes_transferred INTEGER NOT NULL DEFAULT 0,
    cancel_requested  INTEGER NOT NULL DEFAULT 0,
    created_at        INTEGER NOT NULL,
    updated_at        INTEGER NOT NULL
  );

  CREATE UNIQUE INDEX IF NOT EXISTS pipeline_records_live_key
    ON pipeline_records(record_key)
    WHERE state NOT IN ('CLEANED_UP', 'CLEANED_UP_PARTIAL', 'FAILED', 'SKIPPED');

  CREATE INDEX IF NOT EXISTS pipeline_records_source
    ON pipeline_records(source_path);

  CREATE TABLE IF NOT EXISTS pipeline_history (
    id          INTEGER PRIMARY KEY AUTOINCREMENT,
    record_id   INTEGER NOT NULL,
    source_path TEXT    NOT NULL,
    from_state  TEXT    NOT NULL,
    to_state    TEXT    NOT NULL,
    detail      TEXT    NOT NULL DEFAULT '',
    at          INTEGER NOT NULL
  );

  CREATE INDEX IF NOT EXISTS pipeline_history_record
    ON pipeline_history(record_id);

  CREATE TRIGGER IF NOT EXISTS pipeline_history_append_only
    BEFORE UPDATE ON pipeline_history
  BEGIN
    SELECT RAISE(ABORT, 'pipeline_history is append-only');
  END;
)SQL";

/**
 * @class Statement
 * @brief Prepared statement, finalized on destruction.
 */
class Statement {
  sqlite3 *db_;
  sqlite3_stmt *st_ = nullptr;

public:
  Statement(sqlite3 *db, const std::string &sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK) {
      std::string err = sqlite3_errmsg(db);
      sqlite3_finalize(st_);
      throw LedgerError("prepare failed: " + err);
    }
  }
  ~Statement() { sqlite3_finalize(st_); }

  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  Statement &bind(int i, const std::string &v) {
    sqlite3_bind_text(st_, i, v.c_str(), -1, SQLITE_TRANSIENT);
    return *this;
  }
  Statement &bind(int i, int64_t v) {
    sqlite3_bind_int64(st_, i, v);
    return *this;
  }

  /// true while rows are produced, false when done
  bool step() {
    int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW)
      return true;
    if (rc == SQLITE_DONE)
      return false;
    throw LedgerError(fmt::format("step failed: {}", sqlite3_errmsg(db_)));
  }

  std::string text(int col) const {
    const unsigned char *p = sqlite3_column_text(st_, col);
    return p ? reinterpret_cast<const char *>(p) : "";
  }
  int64_t integer(int col) const { return sqlite3_column_int64(st_, col); }
};

/**
 * @class Transaction
 * @brief BEGIN IMMEDIATE ... COMMIT; rolled back unless committed.
 */
class Transaction {
  sqlite3 *db_;
  bool done_ = false;

public:
  explicit Transaction(sqlite3 *db) : db_(db) {
    char *err = nullptr;
    if (sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, &err) !=
        SQLITE_OK) {
      std::string msg = err ? err : "unknown error";
      sqlite3_free(err);
      throw LedgerError("BEGIN failed: " + msg);
    }
  }

  ~Transaction() {
    if (done_)
      return;
    if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK)
      LOG_ERROR("Ledger ROLLBACK failed: {}", sqlite3_errmsg(db_));
  }

  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  void commit() {
    char *err = nullptr;
    if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, &err) != SQLITE_OK) {
      std::string msg = err ? err : "unknown error";
      sqlite3_free(err);
      throw LedgerError("COMMIT failed: " + msg);
    }
    done_ = true;
  }
};

PipelineRecord read_record(const Statement &st) {
  PipelineRecord r;
  r.id = st.integer(0);
  r.record_key = st.text(1);
  r.source_path = st.text(2);
  if (!parse_state(st.text(3), r.state))
    throw LedgerError("unknown state '" + st.text(3) + "'");
  r.reason = st.text(4);
  r.destination_path = st.text(5);
  r.remux_path = st.text(6);
  r.checksum = st.text(7);
  r.kind = st.text(8);
  r.language = st.text(9);
  r.attempt_count = static_cast<int>(st.integer(10));
  r.last_error = st.text(11);
  r.file_size = static_cast<uint64_t>(st.integer(12));
  r.bytes_transferred = static_cast<uint64_t>(st.integer(13));
  r.cancel_requested = st.integer(14) != 0;
  r.created_at = st.integer(15);
  r.updated_at = st.integer(16);
  return r;
}

void insert_history(sqlite3 *db, int64_t id, const std::string &from,
                    const std::string &to, const std::string &detail) {
  Statement st(db, "INSERT INTO pipeline_history "
                   "(record_id, source_path, from_state, to_state, detail, at) "
                   "SELECT id, source_path, ?1, ?2, ?3, ?4 "
                   "FROM pipeline_records WHERE id = ?5");
  st.bind(1, from).bind(2, to).bind(3, detail).bind(4, unix_now()).bind(5, id);
  st.step();
}

bool select_one(sqlite3 *db, const std::string &where, const std::string &arg,
                PipelineRecord &out) {
  Statement st(db, fmt::format("SELECT {} FROM pipeline_records WHERE {}",
                               RECORD_COLUMNS, where));
  st.bind(1, arg);
  if (!st.step())
    return false;
  out = read_record(st);
  return true;
}

bool select_by_id(sqlite3 *db, int64_t id, PipelineRecord &out) {
  Statement st(db, fmt::format("SELECT {} FROM pipeline_records WHERE id = ?1",
                               RECORD_COLUMNS));
  st.bind(1, id);
  if (!st.step())
    return false;
  out = read_record(st);
  return true;
}

} // namespace

int64_t unix_now() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

// **----- STATE MACHINE -----**

bool is_valid_transition(PipelineState from, PipelineState to) {
  using S = PipelineState;
  switch (from) {
  case S::Discovered:
    return to == S::Classified || to == S::Skipped || to == S::Failed;
  case S::Classified:
    return to == S::Remuxing || to == S::Transferring || to == S::Skipped ||
           to == S::Failed;
  case S::Remuxing:
    return to == S::Transferring || to == S::Failed;
  case S::Transferring:
    return to == S::Verified || to == S::Failed;
  case S::Verified:
    return to == S::CleanedUp || to == S::CleanedUpPartial || to == S::Failed;
  default:
    return false;
  }
}

// **----- LIFECYCLE -----**

Ledger::Ledger(const std::string &path) : path_(path) {
  namespace fs = std::filesystem;
  std::error_code ec;
  fs::path parent = fs::path(path).parent_path();
  if (!parent.empty())
    fs::create_directories(parent, ec);

  int rc = sqlite3_open_v2(path.c_str(), &db_,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                               SQLITE_OPEN_FULLMUTEX,
                           nullptr);
  if (rc != SQLITE_OK) {
    std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw LedgerError(fmt::format("cannot open ledger {}: {}", path, err));
  }

  try {
    sqlite3_busy_timeout(db_, 10000);
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA synchronous=FULL;");
    exec(SCHEMA);
    exec("PRAGMA user_version=1;");
  } catch (const LedgerError &) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

Ledger::~Ledger() {
  if (db_)
    sqlite3_close(db_);
}

void Ledger::exec(const char *sql) const {
  char *err = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw LedgerError("SQLite exec failed: " + msg);
  }
}

// **----- RECORDS -----**

PipelineRecord Ledger::discover(const std::string &key,
                                const std::string &source_path,
                                uint64_t file_size, bool retry_failed,
                                bool &created) {
  std::lock_guard<std::mutex> lock(mutex_);
  created = false;

  Transaction tx(db_);
  PipelineRecord rec;

  if (select_one(db_,
                 fmt::format("record_key = ?1 AND state NOT IN {} LIMIT 1",
                             TERMINAL_STATES),
                 key, rec)) {
    tx.commit();
    return rec;
  }

  if (select_one(db_, "record_key = ?1 ORDER BY id DESC LIMIT 1", key, rec) &&
      !(retry_failed && rec.state == PipelineState::Failed)) {
    tx.commit();
    return rec;
  }

  int64_t now = unix_now();
  Statement ins(db_, "INSERT INTO pipeline_records "
                     "(record_key, source_path, state, file_size, created_at, "
                     "updated_at) VALUES (?1, ?2, ?3, ?4, ?5, ?5)");
  ins.bind(1, key)
      .bind(2, source_path)
      .bind(3, std::string(to_string(PipelineState::Discovered)))
      .bind(4, static_cast<int64_t>(file_size))
      .bind(5, now);
  ins.step();

  int64_t id = sqlite3_last_insert_rowid(db_);
  insert_history(db_, id, "", to_string(PipelineState::Discovered),
                 fmt::format("{} bytes", file_size));
  if (!select_by_id(db_, id, rec))
    throw LedgerError("inserted record vanished");
  tx.commit();

  created = true;
  return rec;
}

PipelineState Ledger::transition(int64_t id, PipelineState from,
                                 PipelineState to, ErrorKind reason,
                                 const std::string &detail) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction tx(db_);

  if (is_valid_transition(from, to)) {
    Statement up(db_,
                 "UPDATE pipeline_records SET state = ?1, reason = ?2, "
                 "updated_at = ?3, last_error = CASE WHEN ?1 = 'FAILED' AND "
                 "?4 <> '' THEN ?4 ELSE last_error END "
                 "WHERE id = ?5 AND state = ?6");
    up.bind(1, std::string(to_string(to)))
        .bind(2, std::string(reason == ErrorKind::None ? "" : error_name(reason)))
        .bind(3, unix_now())
        .bind(4, detail)
        .bind(5, id)
        .bind(6, std::string(to_string(from)));
    up.step();

    if (sqlite3_changes(db_) == 1) {
      std::string text = detail;
      if (reason != ErrorKind::None)
        text = detail.empty() ? error_name(reason)
                              : fmt::format("{}: {}", error_name(reason), detail);
      insert_history(db_, id, to_string(from), to_string(to), text);
      tx.commit();
      return to;
    }
  } else {
    LOG_WARN("Rejected transition {} -> {} for record {}", to_string(from),
             to_string(to), id);
  }

  PipelineRecord current;
  if (!select_by_id(db_, id, current))
    throw LedgerError(fmt::format("record {} does not exist", id));
  tx.commit();
  return current.state;
}

bool Ledger::transition(PipelineRecord &record, PipelineState to,
                        ErrorKind reason, const std::string &detail) {
  PipelineState now = transition(record.id, record.state, to, reason, detail);
  bool moved = now == to && record.state != to;
  record.state = now;
  if (moved && reason != ErrorKind::None)
    record.reason = error_name(reason);
  return moved;
}

bool Ledger::find(int64_t id, PipelineRecord &out) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return select_by_id(db_, id, out);
}

bool Ledger::latest(const std::string &key_or_path, PipelineRecord &out) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return select_one(db_,
                    "record_key = ?1 OR source_path = ?1 ORDER BY id DESC LIMIT 1",
                    key_or_path, out);
}

bool Ledger::destination_holder(const std::string &destination,
                                const std::string &source_path,
                                PipelineRecord &out) const {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement st(db_, fmt::format("SELECT {} FROM pipeline_records "
                                "WHERE destination_path = ?1 AND "
                                "source_path != ?2 AND "
                                "state NOT IN ('SKIPPED', 'FAILED') "
                                "ORDER BY id DESC LIMIT 1",
                                RECORD_COLUMNS));
  st.bind(1, destination).bind(2, source_path);
  if (!st.step())
    return false;
  out = read_record(st);
  return true;
}

std::vector<HistoryEntry> Ledger::history(const std::string &source_path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement st(db_, "SELECT record_id, source_path, from_state, to_state, "
                    "detail, at FROM pipeline_history WHERE source_path = ?1 "
                    "ORDER BY id");
  st.bind(1, source_path);

  std::vector<HistoryEntry> out;
  while (st.step()) {
    HistoryEntry h;
    h.record_id = st.integer(0);
    h.source_path = st.text(1);
    h.from_state = st.text(2);
    h.to_state = st.text(3);
    h.detail = st.text(4);
    h.at = st.integer(5);
    out.push_back(std::move(h));
  }
  return out;
}

std::vector<PipelineRecord> Ledger::resumable() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement st(db_, fmt::format("SELECT {} FROM pipeline_records WHERE state "
                                "NOT IN {} ORDER BY id",
                                RECORD_COLUMNS, TERMINAL_STATES));
  std::vector<PipelineRecord> out;
  while (st.step())
    out.push_back(read_record(st));
  return out;
}

int Ledger::record_attempt(int64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement up(db_, "UPDATE pipeline_records SET attempt_count = "
                    "attempt_count + 1, updated_at = ?1 WHERE id = ?2");
  up.bind(1, unix_now()).bind(2, id);
  up.step();

  Statement sel(db_, "SELECT attempt_count FROM pipeline_records WHERE id = ?1");
  sel.bind(1, id);
  return sel.step() ? static_cast<int>(sel.integer(0)) : 0;
}

void Ledger::update_progress(int64_t id, uint64_t bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement up(db_, "UPDATE pipeline_records SET bytes_transferred = ?1, "
                    "updated_at = ?2 WHERE id = ?3");
  up.bind(1, static_cast<int64_t>(bytes)).bind(2, unix_now()).bind(3, id);
  up.step();
}

void Ledger::set_text(int64_t id, const char *column, const std::string &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement up(db_, fmt::format("UPDATE pipeline_records SET {} = ?1, "
                                "updated_at = ?2 WHERE id = ?3",
                                column));
  up.bind(1, value).bind(2, unix_now()).bind(3, id);
  up.step();
}

void Ledger::set_destination(int64_t id, const std::string &path) {
  set_text(id, "destination_path", path);
}

void Ledger::set_classification(int64_t id, const std::string &kind,
                                const std::string &language) {
  set_text(id, "kind", kind);
  set_text(id, "language", language);
}

void Ledger::set_remux_path(int64_t id, const std::string &path) {
  set_text(id, "remux_path", path);
}

void Ledger::set_checksum(int64_t id, const std::string &hex) {
  set_text(id, "checksum", hex);
}

void Ledger::set_last_error(int64_t id, const std::string &text) {
  set_text(id, "last_error", text);
}

bool Ledger::request_cancel(const std::string &key_or_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement up(db_, fmt::format("UPDATE pipeline_records SET "
                                "cancel_requested = 1, updated_at = ?2 WHERE "
                                "(record_key = ?1 OR source_path = ?1) AND "
                                "state NOT IN {}",
                                TERMINAL_STATES));
  up.bind(1, key_or_path).bind(2, unix_now());
  up.step();
  return sqlite3_changes(db_) > 0;
}

bool Ledger::cancel_requested(int64_t id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement st(db_,
               "SELECT cancel_requested FROM pipeline_records WHERE id = ?1");
  st.bind(1, id);
  return st.step() && st.integer(0) != 0;
}

// **----- MAINTENANCE -----**

LedgerStats Ledger::statistics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  LedgerStats stats;

  {
    Statement st(db_, "SELECT state, COUNT(*) FROM pipeline_records "
                      "GROUP BY state");
    while (st.step()) {
      stats.by_state[st.text(0)] = static_cast<long>(st.integer(1));
      stats.total += static_cast<long>(st.integer(1));
    }
  }
  {
    Statement st(db_, "SELECT reason, COUNT(*) FROM pipeline_records "
                      "WHERE state = 'FAILED' GROUP BY reason");
    while (st.step())
      stats.failures_by_reason[st.text(0)] = static_cast<long>(st.integer(1));
  }
  {
    Statement st(db_, "SELECT kind || '/' || language, COUNT(*), "
                      "SUM(file_size) FROM pipeline_records WHERE state IN "
                      "('VERIFIED', 'CLEANED_UP', 'CLEANED_UP_PARTIAL') "
                      "GROUP BY 1");
    while (st.step()) {
      stats.by_destination_class[st.text(0)] = static_cast<long>(st.integer(1));
      stats.bytes_transferred += static_cast<uint64_t>(st.integer(2));
    }
  }
  return stats;
}

int Ledger::purge_terminal_before(int64_t cutoff) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction tx(db_);

  std::string victims = fmt::format(
      "SELECT id FROM pipeline_records WHERE state IN {} AND updated_at < ?1",
      TERMINAL_STATES);

  Statement hist(db_, fmt::format("DELETE FROM pipeline_history WHERE "
                                  "record_id IN ({})",
                                  victims));
  hist.bind(1, cutoff);
  hist.step();

  Statement rec(db_, fmt::format("DELETE FROM pipeline_records WHERE id IN ({})",
                                 victims));
  rec.bind(1, cutoff);
  rec.step();
  int removed = sqlite3_changes(db_);

  tx.commit();
  return removed;
}

void Ledger::backup_to(const std::string &dest_path) const {
  std::lock_guard<std::mutex> lock(mutex_);

  sqlite3 *dest = nullptr;
  if (sqlite3_open(dest_path.c_str(), &dest) != SQLITE_OK) {
    std::string err = dest ? sqlite3_errmsg(dest) : "out of memory";
    sqlite3_close(dest);
    throw LedgerError(fmt::format("cannot open {}: {}", dest_path, err));
  }

  sqlite3_backup *backup = sqlite3_backup_init(dest, "main", db_, "main");
  if (!backup) {
    std::string err = sqlite3_errmsg(dest);
    sqlite3_close(dest);
    throw LedgerError(fmt::format("backup to {} failed: {}", dest_path, err));
  }
  int rc = sqlite3_backup_step(backup, -1);
  sqlite3_backup_finish(backup);
  if (rc != SQLITE_DONE) {
    std::string err = sqlite3_errstr(rc);
    sqlite3_close(dest);
    throw LedgerError(fmt::format("backup to {} failed: {}", dest_path, err));
  }
  sqlite3_close(dest);
}

} // namespace media_relay
