#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <filesystem>
#include <string>

namespace nyayacpp::sqlite {

class Database final {
 public:
  explicit Database(const std::filesystem::path& path);
  ~Database();

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  sqlite3* get() const { return db_; }

 private:
  sqlite3* db_ = nullptr;
};

class Statement final {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const { return stmt_; }

  void Reset();
  void BindText(int index, const std::string& value);
  void BindInt64(int index, std::int64_t value);
  void BindBlob(int index, const void* data, std::size_t size);
  void BindNull(int index);

  // Returns true while a row is available.
  bool Step();
  // Runs a statement that must not produce rows.
  void Run();

  std::string ColumnText(int index) const;
  std::int64_t ColumnInt64(int index) const;
  std::string ColumnBlob(int index) const;
  bool ColumnIsNull(int index) const;

 private:
  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

void Exec(sqlite3* db, const char* sql);

// BEGIN IMMEDIATE on construction; rolls back on destruction unless committed.
class Transaction final {
 public:
  explicit Transaction(sqlite3* db);
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void Commit();

 private:
  sqlite3* db_ = nullptr;
  bool finished_ = false;
};

}  // namespace nyayacpp::sqlite
