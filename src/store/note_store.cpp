// Copyright (c) 2025 The Notekeep Developers
// Distributed under the MIT software license

#include "store/note_store.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include <sqlite3.h>

namespace notekeep {
namespace store {

using util::ErrorKind;
using util::OpState;

namespace {

// Whitespace set in the CHECK clauses matches util::TrimWhitespace
constexpr const char *SCHEMA_SQL = R"SQL(
  CREATE TABLE IF NOT EXISTS notes (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    title TEXT NOT NULL
      CHECK (length(trim(title, ' ' || char(9, 10, 11, 12, 13))) > 0),
    body TEXT NOT NULL
      CHECK (length(trim(body, ' ' || char(9, 10, 11, 12, 13))) > 0
             AND length(body) <= 2000),
    created_at INTEGER NOT NULL
      DEFAULT (CAST(strftime('%s', 'now') AS INTEGER))
  );
)SQL";

constexpr const char *INSERT_SQL =
    "INSERT INTO notes (title, body, created_at) VALUES (?1, ?2, ?3)";
constexpr const char *UPDATE_SQL =
    "UPDATE notes SET title = ?1, body = ?2 WHERE id = ?3";
constexpr const char *DELETE_SQL = "DELETE FROM notes WHERE id = ?1";
constexpr const char *LIST_SQL =
    "SELECT id, title, body, created_at FROM notes ORDER BY id DESC";
constexpr const char *GET_SQL =
    "SELECT id, title, body, created_at FROM notes WHERE id = ?1";
constexpr const char *SEARCH_SQL =
    "SELECT id, title, body, created_at FROM notes "
    "WHERE title LIKE ?1 ESCAPE '\\' OR body LIKE ?1 ESCAPE '\\' "
    "ORDER BY id DESC";
constexpr const char *COUNT_SQL = "SELECT COUNT(*) FROM notes";

std::string ColumnText(sqlite3_stmt *stmt, int col) {
  const unsigned char *text = sqlite3_column_text(stmt, col);
  if (!text) {
    return "";
  }
  return std::string(reinterpret_cast<const char *>(text),
                     static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
}

Note ReadNote(sqlite3_stmt *stmt) {
  Note note;
  note.id = sqlite3_column_int64(stmt, 0);
  note.title = ColumnText(stmt, 1);
  note.body = ColumnText(stmt, 2);
  note.created_at = sqlite3_column_int64(stmt, 3);
  return note;
}

// Escape LIKE wildcards so the needle matches literally
std::string LikePattern(const std::string &needle) {
  std::string pattern = "%";
  for (char c : needle) {
    if (c == '%' || c == '_' || c == '\\') {
      pattern += '\\';
    }
    pattern += c;
  }
  pattern += '%';
  return pattern;
}

int BindText(sqlite3_stmt *stmt, int index, const std::string &value) {
  return sqlite3_bind_text(stmt, index, value.data(),
                           static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

} // anonymous namespace

void NoteStore::DatabaseCloser::operator()(sqlite3 *db) const {
  sqlite3_close_v2(db);
}

void NoteStore::StatementFinalizer::operator()(sqlite3_stmt *stmt) const {
  sqlite3_finalize(stmt);
}

NoteStore::NoteStore(Options options) : options_(std::move(options)) {}

NoteStore::~NoteStore() { Close(); }

bool NoteStore::FailFromSqlite(int rc, const std::string &operation,
                               OpState &state) const {
  std::string detail = operation + ": ";
  detail += db_ ? sqlite3_errmsg(db_.get()) : sqlite3_errstr(rc);

  switch (rc & 0xff) {
  case SQLITE_CONSTRAINT:
    LOG_STORE_DEBUG("{} rejected by storage constraint: {}", operation, detail);
    return state.Fail(ErrorKind::ValidationFailed,
                      "note violates storage constraints", detail);
  case SQLITE_BUSY:
  case SQLITE_LOCKED:
    LOG_STORE_WARN("{} timed out waiting for lock on {}", operation,
                   options_.db_path.string());
    return state.Fail(ErrorKind::StoreBusy, options_.db_path.string(), detail);
  default:
    LOG_STORE_ERROR("{} failed on {}: {}", operation,
                    options_.db_path.string(), detail);
    return state.Fail(ErrorKind::StoreUnavailable, options_.db_path.string(),
                      detail);
  }
}

bool NoteStore::OpenLocked(OpState &state) {
  if (db_) {
    return true;
  }

  sqlite3 *raw = nullptr;
  int rc = sqlite3_open_v2(options_.db_path.c_str(), &raw,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  // sqlite3_open_v2 hands back a handle even on failure; it must be closed
  DatabasePtr db(raw);
  if (rc != SQLITE_OK) {
    std::string detail = raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
    LOG_STORE_ERROR("cannot open {}: {}", options_.db_path.string(), detail);
    return state.Fail(ErrorKind::StoreUnavailable, options_.db_path.string(),
                      "open: " + detail);
  }

  sqlite3_extended_result_codes(db.get(), 1);
  sqlite3_busy_timeout(db.get(),
                       static_cast<int>(options_.busy_timeout.count()));
  db_ = std::move(db);

  // Readers must not block on an in-flight writer
  StatementPtr stmt = PrepareLocked("PRAGMA journal_mode=WAL", state);
  if (!stmt) {
    db_.reset();
    return false;
  }
  rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_ROW) {
    FailFromSqlite(rc, "enable WAL", state);
    stmt.reset();
    db_.reset();
    return false;
  }
  std::string mode = ColumnText(stmt.get(), 0);
  if (mode != "wal") {
    LOG_STORE_WARN("{} is in journal mode '{}', WAL unavailable",
                   options_.db_path.string(), mode);
  }

  LOG_STORE_DEBUG("opened {} (journal_mode={}, busy_timeout={}ms)",
                  options_.db_path.string(), mode,
                  options_.busy_timeout.count());
  return true;
}

bool NoteStore::RequireOpenLocked(OpState &state) const {
  if (!db_) {
    return state.Fail(ErrorKind::StoreUnavailable, options_.db_path.string(),
                      "store is not open");
  }
  return true;
}

NoteStore::StatementPtr NoteStore::PrepareLocked(const char *sql,
                                                 OpState &state) const {
  sqlite3_stmt *raw = nullptr;
  int rc = sqlite3_prepare_v2(db_.get(), sql, -1, &raw, nullptr);
  StatementPtr stmt(raw);
  if (rc != SQLITE_OK) {
    FailFromSqlite(rc, "prepare", state);
    return nullptr;
  }
  return stmt;
}

std::optional<std::vector<Note>>
NoteStore::CollectLocked(sqlite3_stmt *stmt, OpState &state) const {
  std::vector<Note> notes;
  int rc;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    notes.push_back(ReadNote(stmt));
  }
  if (rc != SQLITE_DONE) {
    FailFromSqlite(rc, "read notes", state);
    return std::nullopt;
  }
  return notes;
}

bool NoteStore::Init(OpState &state) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!OpenLocked(state)) {
    return false;
  }

  char *err_msg = nullptr;
  int rc = sqlite3_exec(db_.get(), SCHEMA_SQL, nullptr, nullptr, &err_msg);
  if (err_msg) {
    sqlite3_free(err_msg);
  }
  if (rc != SQLITE_OK) {
    return FailFromSqlite(rc, "create schema", state);
  }

  LOG_STORE_DEBUG("notes schema ready in {}", options_.db_path.string());
  return true;
}

std::optional<int64_t> NoteStore::Insert(const std::string &title,
                                         const std::string &body,
                                         OpState &state) {
  auto fields = NormalizeNoteFields(title, body, state);
  if (!fields) {
    return std::nullopt;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (!RequireOpenLocked(state)) {
    return std::nullopt;
  }

  StatementPtr stmt = PrepareLocked(INSERT_SQL, state);
  if (!stmt) {
    return std::nullopt;
  }
  int rc = BindText(stmt.get(), 1, fields->title);
  if (rc == SQLITE_OK)
    rc = BindText(stmt.get(), 2, fields->body);
  if (rc == SQLITE_OK)
    rc = sqlite3_bind_int64(stmt.get(), 3, util::GetTime());
  if (rc != SQLITE_OK) {
    FailFromSqlite(rc, "bind insert", state);
    return std::nullopt;
  }

  rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    FailFromSqlite(rc, "insert note", state);
    return std::nullopt;
  }

  int64_t id = sqlite3_last_insert_rowid(db_.get());
  LOG_STORE_DEBUG("inserted note {}", id);
  return id;
}

bool NoteStore::Update(int64_t id, const std::string &title,
                       const std::string &body, OpState &state) {
  auto fields = NormalizeNoteFields(title, body, state);
  if (!fields) {
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (!RequireOpenLocked(state)) {
    return false;
  }

  StatementPtr stmt = PrepareLocked(UPDATE_SQL, state);
  if (!stmt) {
    return false;
  }
  int rc = BindText(stmt.get(), 1, fields->title);
  if (rc == SQLITE_OK)
    rc = BindText(stmt.get(), 2, fields->body);
  if (rc == SQLITE_OK)
    rc = sqlite3_bind_int64(stmt.get(), 3, id);
  if (rc != SQLITE_OK) {
    return FailFromSqlite(rc, "bind update", state);
  }

  rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    return FailFromSqlite(rc, "update note", state);
  }

  if (sqlite3_changes(db_.get()) == 0) {
    LOG_STORE_DEBUG("update of missing note {}", id);
    return state.Fail(ErrorKind::NotFound, "note " + std::to_string(id),
                      "no row updated");
  }

  LOG_STORE_DEBUG("updated note {}", id);
  return true;
}

bool NoteStore::Delete(int64_t id, OpState &state) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!RequireOpenLocked(state)) {
    return false;
  }

  StatementPtr stmt = PrepareLocked(DELETE_SQL, state);
  if (!stmt) {
    return false;
  }
  int rc = sqlite3_bind_int64(stmt.get(), 1, id);
  if (rc != SQLITE_OK) {
    return FailFromSqlite(rc, "bind delete", state);
  }

  rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    return FailFromSqlite(rc, "delete note", state);
  }

  if (sqlite3_changes(db_.get()) == 0) {
    LOG_STORE_DEBUG("delete of missing note {}", id);
    return state.Fail(ErrorKind::NotFound, "note " + std::to_string(id),
                      "no row deleted");
  }

  LOG_STORE_DEBUG("deleted note {}", id);
  return true;
}

std::optional<std::vector<Note>> NoteStore::ListAll(OpState &state) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!RequireOpenLocked(state)) {
    return std::nullopt;
  }

  StatementPtr stmt = PrepareLocked(LIST_SQL, state);
  if (!stmt) {
    return std::nullopt;
  }
  return CollectLocked(stmt.get(), state);
}

std::optional<Note> NoteStore::Get(int64_t id, OpState &state) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!RequireOpenLocked(state)) {
    return std::nullopt;
  }

  StatementPtr stmt = PrepareLocked(GET_SQL, state);
  if (!stmt) {
    return std::nullopt;
  }
  int rc = sqlite3_bind_int64(stmt.get(), 1, id);
  if (rc != SQLITE_OK) {
    FailFromSqlite(rc, "bind get", state);
    return std::nullopt;
  }

  rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_ROW) {
    return ReadNote(stmt.get());
  }
  if (rc == SQLITE_DONE) {
    state.Fail(ErrorKind::NotFound, "note " + std::to_string(id),
               "no such row");
    return std::nullopt;
  }
  FailFromSqlite(rc, "get note", state);
  return std::nullopt;
}

std::optional<std::vector<Note>> NoteStore::Search(const std::string &text,
                                                   OpState &state) const {
  std::string needle = util::TrimWhitespace(text);

  std::lock_guard<std::mutex> lock(mutex_);
  if (!RequireOpenLocked(state)) {
    return std::nullopt;
  }

  StatementPtr stmt = PrepareLocked(needle.empty() ? LIST_SQL : SEARCH_SQL,
                                    state);
  if (!stmt) {
    return std::nullopt;
  }
  if (!needle.empty()) {
    int rc = BindText(stmt.get(), 1, LikePattern(needle));
    if (rc != SQLITE_OK) {
      FailFromSqlite(rc, "bind search", state);
      return std::nullopt;
    }
  }
  return CollectLocked(stmt.get(), state);
}

std::optional<int64_t> NoteStore::Count(OpState &state) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!RequireOpenLocked(state)) {
    return std::nullopt;
  }

  StatementPtr stmt = PrepareLocked(COUNT_SQL, state);
  if (!stmt) {
    return std::nullopt;
  }
  int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_ROW) {
    FailFromSqlite(rc, "count notes", state);
    return std::nullopt;
  }
  return sqlite3_column_int64(stmt.get(), 0);
}

std::optional<std::string> NoteStore::JournalMode(OpState &state) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!RequireOpenLocked(state)) {
    return std::nullopt;
  }

  StatementPtr stmt = PrepareLocked("PRAGMA journal_mode", state);
  if (!stmt) {
    return std::nullopt;
  }
  int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_ROW) {
    FailFromSqlite(rc, "read journal mode", state);
    return std::nullopt;
  }
  return ColumnText(stmt.get(), 0);
}

void NoteStore::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_) {
    LOG_STORE_DEBUG("closing {}", options_.db_path.string());
    db_.reset();
  }
}

bool NoteStore::IsOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<bool>(db_);
}

} // namespace store
} // namespace notekeep
