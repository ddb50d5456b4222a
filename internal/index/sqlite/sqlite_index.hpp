#pragma once

#include <memory>
#include <mutex>

#include "internal/index/api/vector_index.hpp"
#include "internal/index/sqlite/sqlite_db.hpp"

namespace engram::index::sqlite {

class SqliteTransaction;

/*
  Durable index on a single SQLite connection.

  Payload keys live in a typed side table so equality filters run in SQL;
  similarity is a cosine scan over the filtered rows.
*/
class SqliteIndex final : public VectorIndex {
 public:
  explicit SqliteIndex(std::shared_ptr<SqliteDB> db);

  Result                        EnsureCollection(const CollectionInfo& info) override;
  std::optional<CollectionInfo> DescribeCollection(const std::string& name) override;
  Result                        SetCollectionInfo(const CollectionInfo& info) override;

  Result Apply(const WriteBatch& batch) override;

  std::vector<Record> Get(const std::string& collection, const std::vector<std::string>& ids) override;
  std::vector<Record> Find(const std::string& collection, const Filter& filter, std::size_t limit = 0) override;
  std::vector<Hit>    SimilarityQuery(const std::string& collection, const std::vector<float>& vector, const Filter& filter,
                                      std::size_t limit) override;
  std::size_t         Count(const std::string& collection) override;

 private:
  static Result Translate(sqlite3* db, int rc);

  std::optional<CollectionInfo> DescribeLocked(const std::string& name);

  Result ApplyUpsert(sqlite3* db, const WriteBatch::Op& op);
  Result ApplyMergePayload(sqlite3* db, const WriteBatch::Op& op);
  Result ApplySetVector(sqlite3* db, const WriteBatch::Op& op);
  Result ApplyDelete(sqlite3* db, const WriteBatch::Op& op);
  Result WriteField(sqlite3* db, const std::string& collection, const std::string& id, const std::string& key, const PayloadValue& value);

  Payload             LoadPayload(const std::string& collection, const std::string& id);
  std::vector<Record> FindLocked(const std::string& collection, const Filter& filter, std::size_t limit);

  std::shared_ptr<SqliteDB> db_;
  // one connection: transactions must not interleave
  std::mutex mutex_;
};

} // namespace engram::index::sqlite
