#include "internal/index/sqlite/sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace engram::index::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::IndexError(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::IndexError("open " + path_ + ": " + msg);
  }

  Configure();
  Migrate();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw util::IndexError(msg);
  }
}

Statement SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    sqlite3_finalize(stmt);
    ThrowIf(rc, db_, "sqlite prepare");
  }
  return Statement(stmt);
}

void SqliteDB::Configure() {
  // WAL lets the scheduler read while a request writes
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // record_fields cascade from records
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

void SqliteDB::Migrate() {
  Exec(R"sql(
CREATE TABLE IF NOT EXISTS collections (
  name                    TEXT PRIMARY KEY,
  embedding_model         TEXT NOT NULL DEFAULT '',
  embedding_model_version TEXT NOT NULL DEFAULT '',
  dimension               INTEGER NOT NULL DEFAULT 0
);

CREATE TABLE IF NOT EXISTS records (
  collection TEXT NOT NULL REFERENCES collections(name) ON DELETE CASCADE,
  id         TEXT NOT NULL,
  document   TEXT NOT NULL DEFAULT '',
  vector     BLOB,
  PRIMARY KEY (collection, id)
);

CREATE TABLE IF NOT EXISTS record_fields (
  collection TEXT NOT NULL,
  id         TEXT NOT NULL,
  key        TEXT NOT NULL,
  kind       INTEGER NOT NULL,
  text_value TEXT,
  int_value  INTEGER,
  real_value REAL,
  PRIMARY KEY (collection, id, key),
  FOREIGN KEY (collection, id) REFERENCES records(collection, id) ON DELETE CASCADE
);

CREATE INDEX IF NOT EXISTS record_fields_text ON record_fields(collection, key, text_value);
CREATE INDEX IF NOT EXISTS record_fields_int ON record_fields(collection, key, int_value);
)sql");
}

} // namespace engram::index::sqlite
