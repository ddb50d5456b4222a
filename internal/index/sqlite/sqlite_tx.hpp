#pragma once

#include <memory>

#include "internal/index/sqlite/sqlite_db.hpp"

namespace engram::index::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - a batch never upgrades from a read lock half way through

  Rolls back on destruction unless committed.
*/
class SqliteTransaction final {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit();
  void Rollback();
  bool IsFinished() const {
    return finished_;
  }

 private:
  std::shared_ptr<SqliteDB> db_;
  bool                      finished_ = false;
};

} // namespace engram::index::sqlite
