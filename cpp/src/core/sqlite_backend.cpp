#include "kisancpp/sqlite_backend.hpp"
#include "kisancpp/errors.hpp"

#include "sqlite_statement.hpp"

#include <spdlog/spdlog.h>

#include <cstring>
#include <limits>
#include <string>
#include <utility>

namespace kisancpp {

SqliteBackend::Connection::~Connection() {
  if (db != nullptr) {
    sqlite3_close(db);
    db = nullptr;
  }
}

namespace core {

void ThrowSqlite(sqlite3* db, const std::string& context) {
  const char* message = db != nullptr ? sqlite3_errmsg(db) : "no database handle";
  throw ProviderError("sqlite " + context + " failed: " + message);
}

void Exec(sqlite3* db, const char* sql) {
  char* err = nullptr;
  const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
  if (rc == SQLITE_OK) {
    return;
  }
  std::string message = err != nullptr ? err : "sqlite exec failed";
  if (err != nullptr) {
    sqlite3_free(err);
  }
  throw ProviderError("sqlite exec failed: " + message);
}

Statement::Statement(sqlite3* db, const char* sql) : db_(db) {
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
    ThrowSqlite(db_, "prepare");
  }
}

Statement::~Statement() {
  if (stmt_ != nullptr) {
    sqlite3_finalize(stmt_);
  }
}

void Statement::Reset() {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

void Statement::BindText(int index, const std::string& value) {
  if (sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT) !=
      SQLITE_OK) {
    ThrowSqlite(db_, "bind");
  }
}

void Statement::BindOptionalText(int index, const std::optional<std::string>& value) {
  if (value.has_value()) {
    BindText(index, *value);
    return;
  }
  BindNull(index);
}

void Statement::BindInt64(int index, std::int64_t value) {
  if (sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)) != SQLITE_OK) {
    ThrowSqlite(db_, "bind");
  }
}

void Statement::BindOptionalInt64(int index, const std::optional<std::int64_t>& value) {
  if (value.has_value()) {
    BindInt64(index, *value);
    return;
  }
  BindNull(index);
}

void Statement::BindDouble(int index, double value) {
  if (sqlite3_bind_double(stmt_, index, value) != SQLITE_OK) {
    ThrowSqlite(db_, "bind");
  }
}

void Statement::BindBlob(int index, const std::vector<std::byte>& value) {
  if (value.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    throw ValidationError("sqlite blob exceeds int length");
  }
  // A zero-length blob still needs a non-null pointer to stay distinct from NULL.
  static const std::byte kEmpty{};
  const void* data = value.empty() ? static_cast<const void*>(&kEmpty) : static_cast<const void*>(value.data());
  if (sqlite3_bind_blob(stmt_, index, data, static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
    ThrowSqlite(db_, "bind");
  }
}

void Statement::BindNull(int index) {
  if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
    ThrowSqlite(db_, "bind");
  }
}

bool Statement::Step() {
  const int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  ThrowSqlite(db_, "step");
}

void Statement::StepDone() {
  const int rc = sqlite3_step(stmt_);
  if (rc != SQLITE_DONE) {
    ThrowSqlite(db_, "write");
  }
}

std::string Statement::ColumnText(int column) const {
  const auto* text = sqlite3_column_text(stmt_, column);
  if (text == nullptr) {
    return {};
  }
  const int length = sqlite3_column_bytes(stmt_, column);
  return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(length));
}

std::optional<std::string> Statement::ColumnOptionalText(int column) const {
  if (ColumnIsNull(column)) {
    return std::nullopt;
  }
  return ColumnText(column);
}

std::int64_t Statement::ColumnInt64(int column) const {
  return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, column));
}

std::optional<std::int64_t> Statement::ColumnOptionalInt64(int column) const {
  if (ColumnIsNull(column)) {
    return std::nullopt;
  }
  return ColumnInt64(column);
}

double Statement::ColumnDouble(int column) const {
  return sqlite3_column_double(stmt_, column);
}

std::vector<std::byte> Statement::ColumnBlob(int column) const {
  const auto* data = static_cast<const std::byte*>(sqlite3_column_blob(stmt_, column));
  const int length = sqlite3_column_bytes(stmt_, column);
  if (data == nullptr || length <= 0) {
    return {};
  }
  return std::vector<std::byte>(data, data + length);
}

bool Statement::ColumnIsNull(int column) const {
  return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

Transaction::Transaction(SqliteBackend::Connection& connection) : lock_(connection), db_(connection.db) {
  Exec(db_, "BEGIN IMMEDIATE TRANSACTION;");
}

Transaction::~Transaction() {
  if (finished_) {
    return;
  }
  char* err = nullptr;
  if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
    spdlog::warn("sqlite rollback failed: {}", err != nullptr ? err : "unknown error");
  }
  if (err != nullptr) {
    sqlite3_free(err);
  }
}

void Transaction::Commit() {
  Exec(db_, "COMMIT;");
  finished_ = true;
}

}  // namespace core

SqliteBackend::SqliteBackend(const StoreConfig& config)
    : path_(config.database_path), connection_(std::make_unique<Connection>()) {
  if (path_.empty()) {
    throw ValidationError("SqliteBackend database path must be non-empty");
  }
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path_.c_str(), &connection_->db, flags, nullptr) != SQLITE_OK) {
    std::string message = connection_->db != nullptr ? sqlite3_errmsg(connection_->db) : "out of memory";
    throw ProviderError("sqlite open failed for '" + path_ + "': " + message);
  }
  if (sqlite3_busy_timeout(connection_->db, config.busy_timeout_ms) != SQLITE_OK) {
    core::ThrowSqlite(connection_->db, "busy_timeout");
  }
  if (path_ != ":memory:") {
    core::Exec(connection_->db, "PRAGMA journal_mode=WAL;");
  }
  core::Exec(connection_->db, "PRAGMA synchronous=NORMAL;");
  spdlog::info("opened knowledge store at {}", path_);
}

SqliteBackend::~SqliteBackend() = default;

const std::string& SqliteBackend::path() const {
  return path_;
}

SqliteBackend::Connection& SqliteBackend::connection() const {
  return *connection_;
}

}  // namespace kisancpp
