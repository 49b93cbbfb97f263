#pragma once
#include <cstdint>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace pkgstore {

// Prepared statement bound to one Database. Move-only.
// Bind indexes are 1-based, column indexes 0-based (sqlite conventions).
class Statement {
public:
  Statement(sqlite3* db, const std::string& sql);
  ~Statement();

  Statement(Statement&& other) noexcept;
  Statement& operator=(Statement&& other) noexcept;
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  Statement& bind(int idx, int64_t value);
  Statement& bind(int idx, int value) { return bind(idx, static_cast<int64_t>(value)); }
  Statement& bind(int idx, const std::string& value);
  Statement& bindBlob(int idx, std::string_view bytes);

  // true while a row is available, false once the statement is done.
  bool step();
  // For statements that must not return rows.
  void run();
  void reset();

  int64_t     columnInt64(int col) const;
  std::string columnText(int col) const;
  std::string columnBlob(int col) const;
  bool        columnIsNull(int col) const;

private:
  [[noreturn]] void fail(const std::string& what) const;

  sqlite3*      db_;
  sqlite3_stmt* st_;
  std::string   sql_;
};

// Owns a sqlite3 connection opened in serialized mode with foreign keys on.
class Database {
public:
  // ":memory:" gives a private in-memory database.
  explicit Database(const std::string& path);
  ~Database();

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  void      exec(const std::string& sql);
  Statement prepare(const std::string& sql);

  int64_t lastInsertId() const;
  const std::string& path() const { return path_; }

private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

// BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless commit() ran.
class Transaction {
public:
  explicit Transaction(Database& db);
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit();

private:
  Database& db_;
  bool      done_ = false;
};

} // namespace pkgstore
