#pragma once

#include "kisancpp/sqlite_backend.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sqlite3.h>

namespace kisancpp {

// One serialized (FULLMUTEX) handle shared by every store. Writers also take
// write_mutex so a write never lands inside another thread's transaction.
struct SqliteBackend::Connection {
  sqlite3* db = nullptr;
  std::mutex write_mutex;

  ~Connection();
};

namespace core {

[[noreturn]] void ThrowSqlite(sqlite3* db, const std::string& context);

void Exec(sqlite3* db, const char* sql);

class Statement final {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const { return stmt_; }

  void Reset();
  void BindText(int index, const std::string& value);
  void BindOptionalText(int index, const std::optional<std::string>& value);
  void BindInt64(int index, std::int64_t value);
  void BindOptionalInt64(int index, const std::optional<std::int64_t>& value);
  void BindDouble(int index, double value);
  void BindBlob(int index, const std::vector<std::byte>& value);
  void BindNull(int index);

  // True while a row is available; false once the statement is done.
  bool Step();
  void StepDone();

  [[nodiscard]] std::string ColumnText(int column) const;
  [[nodiscard]] std::optional<std::string> ColumnOptionalText(int column) const;
  [[nodiscard]] std::int64_t ColumnInt64(int column) const;
  [[nodiscard]] std::optional<std::int64_t> ColumnOptionalInt64(int column) const;
  [[nodiscard]] double ColumnDouble(int column) const;
  [[nodiscard]] std::vector<std::byte> ColumnBlob(int column) const;
  [[nodiscard]] bool ColumnIsNull(int column) const;

 private:
  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

// Held for every write statement that runs outside a Transaction.
class WriteLock final {
 public:
  explicit WriteLock(SqliteBackend::Connection& connection) : lock_(connection.write_mutex) {}

 private:
  std::unique_lock<std::mutex> lock_;
};

// Takes the write lock, then BEGIN IMMEDIATE. ROLLBACK on destruction unless committed.
class Transaction final {
 public:
  explicit Transaction(SqliteBackend::Connection& connection);
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void Commit();

 private:
  WriteLock lock_;
  sqlite3* db_ = nullptr;
  bool finished_ = false;
};

}  // namespace core
}  // namespace kisancpp
