#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace engram::index::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

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

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Throws util::IndexError when the statement does not compile.
  Statement Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  // Creates the index schema if missing.
  void Migrate();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace engram::index::sqlite
