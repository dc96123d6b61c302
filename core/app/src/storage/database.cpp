#include "rxpos/storage/database.hpp"

#include <iostream>

namespace rxpos {
namespace storage {

namespace {

// Monetary columns are REAL holding values already rounded to 2 decimals.
// Dates are ISO TEXT so that string comparison is date comparison.
constexpr const char* kSchema =
    "CREATE TABLE IF NOT EXISTS medicines ("
    "  id             INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  name           TEXT NOT NULL,"
    "  category       TEXT NOT NULL,"
    "  batch_no       TEXT NOT NULL,"
    "  expiry_date    TEXT NOT NULL,"
    "  quantity       INTEGER NOT NULL DEFAULT 0 CHECK (quantity >= 0),"
    "  purchase_price REAL NOT NULL DEFAULT 0,"
    "  selling_price  REAL NOT NULL DEFAULT 0,"
    "  barcode        TEXT UNIQUE,"
    "  created_at     TEXT NOT NULL,"
    "  updated_at     TEXT NOT NULL"
    ");"

    "CREATE TABLE IF NOT EXISTS sales ("
    "  id             INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  date           TEXT NOT NULL,"
    "  items          TEXT NOT NULL,"
    "  subtotal       REAL NOT NULL,"
    "  discount       REAL NOT NULL DEFAULT 0,"
    "  tax            REAL NOT NULL DEFAULT 0,"
    "  total          REAL NOT NULL,"
    "  payment_method TEXT NOT NULL,"
    "  cashier_id     INTEGER,"
    "  customer_name  TEXT,"
    "  created_at     TEXT NOT NULL"
    ");"

    "CREATE INDEX IF NOT EXISTS idx_medicines_name ON medicines(name);"
    "CREATE INDEX IF NOT EXISTS idx_medicines_expiry ON medicines(expiry_date);"
    "CREATE INDEX IF NOT EXISTS idx_sales_date ON sales(date);"
    "CREATE INDEX IF NOT EXISTS idx_sales_cashier ON sales(cashier_id);";

}  // namespace

// =============================================================================
// Statement
// =============================================================================

Statement::Statement(Database& db, const std::string& sql)
    : db_(db.handle()) {
  int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = "prepare failed: ";
    msg += sqlite3_errmsg(db_);
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
    throw StorageError(msg);
  }
}

Statement::~Statement() {
  if (stmt_ != nullptr) {
    sqlite3_finalize(stmt_);
  }
}

void Statement::check(int rc, const char* what) const {
  if (rc != SQLITE_OK) {
    throw StorageError(std::string(what) + " failed: " + sqlite3_errmsg(db_));
  }
}

void Statement::bind(int index, std::int64_t value) {
  check(sqlite3_bind_int64(stmt_, index, value), "bind");
}

void Statement::bind(int index, int value) {
  check(sqlite3_bind_int(stmt_, index, value), "bind");
}

void Statement::bind(int index, double value) {
  check(sqlite3_bind_double(stmt_, index, value), "bind");
}

void Statement::bind(int index, const std::string& value) {
  check(sqlite3_bind_text(stmt_, index, value.c_str(),
                          static_cast<int>(value.size()), SQLITE_TRANSIENT),
        "bind");
}

void Statement::bind(int index, const std::optional<std::string>& value) {
  if (value) {
    bind(index, *value);
  } else {
    bindNull(index);
  }
}

void Statement::bind(int index, const std::optional<std::int64_t>& value) {
  if (value) {
    bind(index, *value);
  } else {
    bindNull(index);
  }
}

void Statement::bindNull(int index) {
  check(sqlite3_bind_null(stmt_, index), "bind");
}

bool Statement::step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  throw StorageError(std::string("step failed: ") + sqlite3_errmsg(db_));
}

std::int64_t Statement::columnInt64(int col) const {
  return sqlite3_column_int64(stmt_, col);
}

int Statement::columnInt(int col) const {
  return sqlite3_column_int(stmt_, col);
}

double Statement::columnDouble(int col) const {
  return sqlite3_column_double(stmt_, col);
}

std::string Statement::columnText(int col) const {
  const unsigned char* text = sqlite3_column_text(stmt_, col);
  if (text == nullptr) {
    return {};
  }
  return std::string(reinterpret_cast<const char*>(text),
                     static_cast<std::size_t>(sqlite3_column_bytes(stmt_, col)));
}

bool Statement::columnIsNull(int col) const {
  return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

std::optional<std::string> Statement::columnOptionalText(int col) const {
  if (columnIsNull(col)) {
    return std::nullopt;
  }
  return columnText(col);
}

std::optional<std::int64_t> Statement::columnOptionalInt64(int col) const {
  if (columnIsNull(col)) {
    return std::nullopt;
  }
  return columnInt64(col);
}

// =============================================================================
// Database
// =============================================================================

Database::Database(const std::string& path) : path_(path) {
  if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
    std::string msg = "Failed to open database '" + path_ + "': " +
                      (db_ != nullptr ? sqlite3_errmsg(db_) : "out of memory");
    // sqlite3_open allocates a handle even on failure.
    sqlite3_close(db_);
    db_ = nullptr;
    throw StorageError(msg);
  }

  sqlite3_busy_timeout(db_, kBusyTimeoutMs);
  try {
    exec("PRAGMA foreign_keys = ON;");
  } catch (const StorageError&) {
    // The destructor does not run for a half-built object.
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }

  std::cout << "[Database] opened " << path_ << "\n";
}

Database::~Database() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

void Database::exec(const std::string& sql) {
  char* err = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = "SQL error: ";
    msg += (err != nullptr ? err : sqlite3_errmsg(db_));
    sqlite3_free(err);
    throw StorageError(msg);
  }
}

void Database::createSchema() {
  std::lock_guard lock(mutex_);
  exec(kSchema);
}

int Database::changes() const {
  return sqlite3_changes(db_);
}

std::int64_t Database::lastInsertRowId() const {
  return sqlite3_last_insert_rowid(db_);
}

}  // namespace storage
}  // namespace rxpos
