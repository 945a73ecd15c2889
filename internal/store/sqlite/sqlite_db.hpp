#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <string>

namespace seat::store::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& path() const {
    return path_;
  }

  // Execute a SQL string (pragmas, schema, transaction control)
  void Exec(const std::string& sql);

  // Configure PRAGMAs (WAL, foreign keys, busy timeout)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

/*
  Prepared statement, finalized on destruction.

  Bind indexes are 1-based, column indexes 0-based (sqlite convention).
*/
class Statement {
 public:
  Statement(SqliteDB& db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  void BindText(int idx, const std::string& value);
  void BindInt64(int idx, std::int64_t value);

  // true while a row is available; throws on error.
  bool Step();

  // Runs a statement that returns no rows, then resets it for reuse.
  void Run();

  std::string  ColText(int col) const;
  std::int64_t ColInt64(int col) const;

 private:
  sqlite3*      db_   = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace seat::store::sqlite
