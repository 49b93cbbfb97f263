#include "core/db/Database.hpp"
#include "core/storage/StorageErrors.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <utility>

namespace pkgstore {

// -------- Statement --------

Statement::Statement(sqlite3* db, const std::string& sql) : db_(db), st_(nullptr), sql_(sql) {
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK) {
    std::string err = sqlite3_errmsg(db_);
    sqlite3_finalize(st_);
    st_ = nullptr;
    throw StorageBackendError("sqlite prepare failed: " + err);
  }
}

Statement::~Statement() {
  if (st_) sqlite3_finalize(st_);
}

Statement::Statement(Statement&& other) noexcept
  : db_(other.db_), st_(other.st_), sql_(std::move(other.sql_)) {
  other.st_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
  if (this != &other) {
    if (st_) sqlite3_finalize(st_);
    db_ = other.db_;
    st_ = other.st_;
    sql_ = std::move(other.sql_);
    other.st_ = nullptr;
  }
  return *this;
}

void Statement::fail(const std::string& what) const {
  throw StorageBackendError(what + ": " + sqlite3_errmsg(db_));
}

Statement& Statement::bind(int idx, int64_t value) {
  if (sqlite3_bind_int64(st_, idx, value) != SQLITE_OK) fail("sqlite bind failed");
  return *this;
}

Statement& Statement::bind(int idx, const std::string& value) {
  if (sqlite3_bind_text(st_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK)
    fail("sqlite bind failed");
  return *this;
}

Statement& Statement::bindBlob(int idx, std::string_view bytes) {
  // zeroblob keeps empty blobs non-NULL
  const int rc = bytes.empty()
    ? sqlite3_bind_zeroblob(st_, idx, 0)
    : sqlite3_bind_blob64(st_, idx, bytes.data(), bytes.size(), SQLITE_TRANSIENT);
  if (rc != SQLITE_OK) fail("sqlite bind failed");
  return *this;
}

bool Statement::step() {
  const int rc = sqlite3_step(st_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  fail("sqlite step failed");
}

void Statement::run() {
  if (step()) throw StorageBackendError("statement returned rows: " + sql_);
}

void Statement::reset() {
  sqlite3_reset(st_);
  sqlite3_clear_bindings(st_);
}

int64_t Statement::columnInt64(int col) const {
  return sqlite3_column_int64(st_, col);
}

std::string Statement::columnText(int col) const {
  const auto* p = reinterpret_cast<const char*>(sqlite3_column_text(st_, col));
  return p ? std::string(p, static_cast<size_t>(sqlite3_column_bytes(st_, col))) : std::string();
}

std::string Statement::columnBlob(int col) const {
  const auto* p = static_cast<const char*>(sqlite3_column_blob(st_, col));
  const int n = sqlite3_column_bytes(st_, col);
  return (p && n > 0) ? std::string(p, static_cast<size_t>(n)) : std::string();
}

bool Statement::columnIsNull(int col) const {
  return sqlite3_column_type(st_, col) == SQLITE_NULL;
}

// -------- Database --------

Database::Database(const std::string& path) : path_(path) {
  int rc = sqlite3_open_v2(
    path.c_str(),
    &db_,
    SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
    nullptr
  );
  if (rc != SQLITE_OK) {
    std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw StorageBackendError("Failed to open DB " + path + ": " + err);
  }
  try {
    exec("PRAGMA foreign_keys=ON;");
    exec("PRAGMA busy_timeout=5000;");
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
  spdlog::debug("opened database {}", path);
}

Database::~Database() {
  if (db_) sqlite3_close(db_);
}

void Database::exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw StorageBackendError("SQLite exec failed: " + msg);
  }
}

Statement Database::prepare(const std::string& sql) {
  return Statement(db_, sql);
}

int64_t Database::lastInsertId() const {
  return sqlite3_last_insert_rowid(db_);
}

// -------- Transaction --------

Transaction::Transaction(Database& db) : db_(db) {
  db_.exec("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
  if (done_) return;
  try {
    db_.exec("ROLLBACK;");
  } catch (const std::exception& e) {
    spdlog::error("rollback failed: {}", e.what());
  }
}

void Transaction::commit() {
  db_.exec("COMMIT;");
  done_ = true;
}

} // namespace pkgstore
