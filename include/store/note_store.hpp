// Copyright (c) 2025 The Notekeep Developers
// Distributed under the MIT software license

#pragma once

/*
 NoteStore - durable CRUD for notes in a single SQLite file

 Purpose
 - Own one connection to the notes database
 - Enforce note constraints at the store boundary, independent of callers
 - Keep readers unblocked by writers (WAL) and bound writer waits

 Key responsibilities
 1. Init(): open the database and create the notes table if absent
 2. Insert / Update / Delete with validation and NotFound reporting
 3. ListAll / Get / Search / Count snapshots, newest first

 Concurrency
 - journal_mode=WAL: readers on other connections proceed while a write
   is in flight
 - busy_timeout bounds how long a write waits for the lock; on expiry the
   operation fails with ErrorKind::StoreBusy
 - One connection per NoteStore, serialized by an internal mutex. Threads
   that want parallel reads open their own NoteStore on the same file.

 Nothing is retried internally; every failure lands in the caller's OpState.
*/

#include "store/note.hpp"
#include "util/op_state.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace notekeep {
namespace store {

class NoteStore {
public:
  struct Options {
    std::filesystem::path db_path;
    std::chrono::milliseconds busy_timeout{5000};
  };

  explicit NoteStore(Options options);
  ~NoteStore();

  // Non-copyable
  NoteStore(const NoteStore &) = delete;
  NoteStore &operator=(const NoteStore &) = delete;

  /**
   * Open the database (if not yet open) and create the notes table
   * Idempotent; never touches existing rows.
   */
  bool Init(util::OpState &state);

  /**
   * Insert a note
   * @return the new id, assigned by the store and never reused
   */
  std::optional<int64_t> Insert(const std::string &title,
                                const std::string &body,
                                util::OpState &state);

  /**
   * Replace title and body of an existing note
   * created_at is left as is. Reports NotFound if id does not exist.
   */
  bool Update(int64_t id, const std::string &title, const std::string &body,
              util::OpState &state);

  /**
   * Delete a note
   * Reports NotFound if id does not exist, so a repeated delete fails.
   */
  bool Delete(int64_t id, util::OpState &state);

  /**
   * All notes, ordered by id descending
   */
  std::optional<std::vector<Note>> ListAll(util::OpState &state) const;

  std::optional<Note> Get(int64_t id, util::OpState &state) const;

  /**
   * Notes whose title or body contains text (ASCII case-insensitive),
   * ordered by id descending. Blank text matches everything.
   */
  std::optional<std::vector<Note>> Search(const std::string &text,
                                          util::OpState &state) const;

  std::optional<int64_t> Count(util::OpState &state) const;

  // Current journal mode as reported by SQLite ("wal" once initialized)
  std::optional<std::string> JournalMode(util::OpState &state) const;

  void Close();
  bool IsOpen() const;

  const std::filesystem::path &db_path() const { return options_.db_path; }

private:
  struct DatabaseCloser {
    void operator()(sqlite3 *db) const;
  };
  struct StatementFinalizer {
    void operator()(sqlite3_stmt *stmt) const;
  };
  using DatabasePtr = std::unique_ptr<sqlite3, DatabaseCloser>;
  using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

  bool OpenLocked(util::OpState &state);
  bool RequireOpenLocked(util::OpState &state) const;
  StatementPtr PrepareLocked(const char *sql, util::OpState &state) const;
  std::optional<std::vector<Note>> CollectLocked(sqlite3_stmt *stmt,
                                                 util::OpState &state) const;
  bool FailFromSqlite(int rc, const std::string &operation,
                      util::OpState &state) const;

  Options options_;
  mutable std::mutex mutex_;
  DatabasePtr db_;
};

} // namespace store
} // namespace notekeep
