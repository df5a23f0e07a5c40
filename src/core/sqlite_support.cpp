#include "sqlite_support.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>

namespace nyayacpp::sqlite {

Database::Database(const std::filesystem::path& path) {
  const auto rc = sqlite3_open_v2(path.string().c_str(),
                                  &db_,
                                  SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                  nullptr);
  if (rc != SQLITE_OK) {
    std::string message = db_ != nullptr ? sqlite3_errmsg(db_) : "out of memory";
    if (db_ != nullptr) {
      sqlite3_close(db_);
      db_ = nullptr;
    }
    throw std::runtime_error("sqlite open failed for " + path.string() + ": " + message);
  }
  sqlite3_busy_timeout(db_, 5000);
}

Database::~Database() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

Statement::Statement(sqlite3* db, const char* sql) : db_(db) {
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db_));
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
  if (sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite bind failed: ") + sqlite3_errmsg(db_));
  }
}

void Statement::BindInt64(int index, std::int64_t value) {
  if (sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite bind failed: ") + sqlite3_errmsg(db_));
  }
}

void Statement::BindBlob(int index, const void* data, std::size_t size) {
  if (sqlite3_bind_blob(stmt_, index, data, static_cast<int>(size), SQLITE_TRANSIENT) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite bind failed: ") + sqlite3_errmsg(db_));
  }
}

void Statement::BindNull(int index) {
  if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite bind failed: ") + sqlite3_errmsg(db_));
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
  throw std::runtime_error(std::string("sqlite step failed: ") + sqlite3_errmsg(db_));
}

void Statement::Run() {
  if (Step()) {
    throw std::runtime_error("sqlite statement unexpectedly returned rows");
  }
}

std::string Statement::ColumnText(int index) const {
  const auto* data = sqlite3_column_text(stmt_, index);
  const auto size = sqlite3_column_bytes(stmt_, index);
  if (data == nullptr || size <= 0) {
    return {};
  }
  return std::string(reinterpret_cast<const char*>(data), static_cast<std::size_t>(size));
}

std::int64_t Statement::ColumnInt64(int index) const {
  return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, index));
}

std::string Statement::ColumnBlob(int index) const {
  const auto* data = sqlite3_column_blob(stmt_, index);
  const auto size = sqlite3_column_bytes(stmt_, index);
  if (data == nullptr || size <= 0) {
    return {};
  }
  return std::string(static_cast<const char*>(data), static_cast<std::size_t>(size));
}

bool Statement::ColumnIsNull(int index) const {
  return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
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
  throw std::runtime_error(message);
}

Transaction::Transaction(sqlite3* db) : db_(db) {
  Exec(db_, "BEGIN IMMEDIATE TRANSACTION;");
}

Transaction::~Transaction() {
  if (finished_) {
    return;
  }
  char* err = nullptr;
  if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
    spdlog::error("sqlite rollback failed: {}", err != nullptr ? err : "unknown error");
  }
  if (err != nullptr) {
    sqlite3_free(err);
  }
}

void Transaction::Commit() {
  Exec(db_, "COMMIT;");
  finished_ = true;
}

}  // namespace nyayacpp::sqlite
