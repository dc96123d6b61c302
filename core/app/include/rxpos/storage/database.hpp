#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace rxpos {
namespace storage {

// -----------------------------------------------------------------------------
// StorageError
// -----------------------------------------------------------------------------
// Thrown by Database and Statement on any SQLite failure (open, prepare,
// bind, step). The message carries sqlite3_errmsg() text. Repositories catch
// it at their public boundary and turn it into PosError::persistFailed().
// -----------------------------------------------------------------------------
class StorageError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class Database;

// -----------------------------------------------------------------------------
// Statement: RAII prepared statement
// -----------------------------------------------------------------------------
//
// @brief  Owns one sqlite3_stmt; finalizes it on destruction.
//
// @details
// Parameter indexes are 1-based (SQLite convention); column indexes are
// 0-based. Text is bound with SQLITE_TRANSIENT so callers may pass
// temporaries.
//
// NULL columns read back as "" / 0 / 0.0 through the plain accessors; use
// columnIsNull() or the optional accessors where NULL is meaningful.
//
// Thread model:
//   A Statement belongs to the thread that prepared it, and that thread must
//   hold Database::mutex() for the statement's whole lifetime.
// -----------------------------------------------------------------------------
class Statement {
 public:
  Statement(Database& db, const std::string& sql);
  ~Statement();

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;
  Statement(Statement&&) = delete;
  Statement& operator=(Statement&&) = delete;

  void bind(int index, std::int64_t value);
  void bind(int index, int value);
  void bind(int index, double value);
  void bind(int index, const std::string& value);
  void bind(int index, const std::optional<std::string>& value);
  void bind(int index, const std::optional<std::int64_t>& value);
  void bindNull(int index);

  // -------------------------------------------------------------------------
  // step()
  // -------------------------------------------------------------------------
  // @return true if a row is available (SQLITE_ROW), false when the statement
  //         has finished (SQLITE_DONE).
  //
  // Throws StorageError on any other result code (SQLITE_BUSY after the
  // busy timeout expired, constraint violations, I/O errors).
  // -------------------------------------------------------------------------
  bool step();

  std::int64_t columnInt64(int col) const;
  int columnInt(int col) const;
  double columnDouble(int col) const;
  std::string columnText(int col) const;
  bool columnIsNull(int col) const;
  std::optional<std::string> columnOptionalText(int col) const;
  std::optional<std::int64_t> columnOptionalInt64(int col) const;

 private:
  void check(int rc, const char* what) const;

  sqlite3* db_{nullptr};
  sqlite3_stmt* stmt_{nullptr};
};

// -----------------------------------------------------------------------------
// Database: RAII SQLite connection
// -----------------------------------------------------------------------------
//
// @brief  Opens one SQLite connection, configures it, and creates the rxpos
//         schema.
//
// @details
// On construction:
//   - opens (or creates) the file at `path`; ":memory:" gives a private
//     in-memory database
//   - PRAGMA foreign_keys = ON
//   - busy timeout of kBusyTimeoutMs, so a writer on another connection makes
//     this one wait instead of failing immediately
//
// createSchema() is idempotent (CREATE TABLE IF NOT EXISTS) and is called by
// PosEngine on every start-up.
//
// Thread model:
//   One connection is shared by both repositories and may be reached from
//   the IPC thread and the main thread. Callers lock mutex() around every
//   prepare/step/changes() sequence. changes() and lastInsertRowId() are
//   per-connection, so reading them without the lock would race with another
//   thread's statement.
//
// Ownership:
//   Owned by PosEngine (or a test fixture). Repositories hold a reference and
//   must not outlive it.
// -----------------------------------------------------------------------------
class Database {
 public:
  static constexpr int kBusyTimeoutMs = 30000;

  // Throws StorageError if the file cannot be opened.
  explicit Database(const std::string& path);
  ~Database();

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;
  Database(Database&&) = delete;
  Database& operator=(Database&&) = delete;

  // Runs one or more ';'-separated statements with no parameters.
  void exec(const std::string& sql);

  // Creates the medicines and sales tables and their indexes.
  void createSchema();

  // Rows touched by the most recent INSERT/UPDATE/DELETE on this connection.
  int changes() const;

  std::int64_t lastInsertRowId() const;

  std::mutex& mutex() { return mutex_; }
  sqlite3* handle() { return db_; }
  const std::string& path() const { return path_; }

 private:
  std::string path_;
  sqlite3* db_{nullptr};
  std::mutex mutex_;
};

}  // namespace storage
}  // namespace rxpos
