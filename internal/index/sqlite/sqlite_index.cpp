#include "internal/index/sqlite/sqlite_index.hpp"

#include <algorithm>
#include <cstring>
#include <map>

#include "internal/index/sqlite/sqlite_tx.hpp"
#include "internal/index/vector_math.hpp"
#include "internal/util/errors.hpp"

namespace engram::index::sqlite {

namespace {

enum FieldKind : int {
  kText  = 0,
  kInt   = 1,
  kReal  = 2,
  kBool  = 3,
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindVector(sqlite3_stmt* st, int idx, const std::vector<float>& v) {
  if (v.empty()) {
    sqlite3_bind_null(st, idx);
    return;
  }
  sqlite3_bind_blob(st, idx, v.data(), static_cast<int>(v.size() * sizeof(float)), SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::vector<float> ColVector(sqlite3_stmt* st, int col) {
  const void* blob  = sqlite3_column_blob(st, col);
  const int   bytes = sqlite3_column_bytes(st, col);
  if (!blob || bytes <= 0) return {};

  std::vector<float> v(static_cast<std::size_t>(bytes) / sizeof(float));
  std::memcpy(v.data(), blob, v.size() * sizeof(float));
  return v;
}

int KindOf(const PayloadValue& value) {
  switch (value.index()) {
    case 0:
      return kText;
    case 1:
      return kInt;
    case 2:
      return kReal;
    default:
      return kBool;
  }
}

// Binds `value` to the column matching its kind; the other two stay NULL.
void BindFieldValue(sqlite3_stmt* st, int text_idx, int int_idx, int real_idx, const PayloadValue& value) {
  sqlite3_bind_null(st, text_idx);
  sqlite3_bind_null(st, int_idx);
  sqlite3_bind_null(st, real_idx);

  if (const auto* s = std::get_if<std::string>(&value)) {
    BindText(st, text_idx, *s);
  } else if (const auto* i = std::get_if<std::int64_t>(&value)) {
    BindI64(st, int_idx, *i);
  } else if (const auto* d = std::get_if<double>(&value)) {
    sqlite3_bind_double(st, real_idx, *d);
  } else if (const auto* b = std::get_if<bool>(&value)) {
    BindI64(st, int_idx, *b ? 1 : 0);
  }
}

const char* ValueColumn(int kind) {
  switch (kind) {
    case kText:
      return "text_value";
    case kReal:
      return "real_value";
    default:
      return "int_value";
  }
}

void ThrowIfStepFailed(sqlite3* db, int rc, const std::string& what) {
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    throw util::IndexError(what + ": " + sqlite3_errmsg(db));
  }
}

} // namespace

SqliteIndex::SqliteIndex(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

Result SqliteIndex::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Collections
// ------------------------------------------------------------------

Result SqliteIndex::EnsureCollection(const CollectionInfo& info) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto*                       db = db_->Handle();

  const char*   sql = "INSERT OR IGNORE INTO collections(name,embedding_model,embedding_model_version,dimension) VALUES(?,?,?,?);";
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
    sqlite3_finalize(raw);
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Statement st(raw);

  BindText(st.get(), 1, info.name);
  BindText(st.get(), 2, info.embedding_model);
  BindText(st.get(), 3, info.embedding_model_version);
  BindI64(st.get(), 4, static_cast<std::int64_t>(info.dimension));

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<CollectionInfo> SqliteIndex::DescribeCollection(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return DescribeLocked(name);
}

std::optional<CollectionInfo> SqliteIndex::DescribeLocked(const std::string& name) {
  auto st = db_->Prepare("SELECT name,embedding_model,embedding_model_version,dimension FROM collections WHERE name=?;");
  BindText(st.get(), 1, name);

  int rc = sqlite3_step(st.get());
  ThrowIfStepFailed(db_->Handle(), rc, "describe collection " + name);
  if (rc != SQLITE_ROW) return std::nullopt;

  CollectionInfo info;
  info.name                    = ColText(st.get(), 0);
  info.embedding_model         = ColText(st.get(), 1);
  info.embedding_model_version = ColText(st.get(), 2);
  info.dimension               = static_cast<std::size_t>(sqlite3_column_int64(st.get(), 3));
  return info;
}

Result SqliteIndex::SetCollectionInfo(const CollectionInfo& info) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto*                       db = db_->Handle();

  const char*   sql = "UPDATE collections SET embedding_model=?,embedding_model_version=?,dimension=? WHERE name=?;";
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
    sqlite3_finalize(raw);
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Statement st(raw);

  BindText(st.get(), 1, info.embedding_model);
  BindText(st.get(), 2, info.embedding_model_version);
  BindI64(st.get(), 3, static_cast<std::int64_t>(info.dimension));
  BindText(st.get(), 4, info.name);

  auto status = Translate(db, sqlite3_step(st.get()));
  if (!status) return status;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "unknown collection " + info.name);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Writes
// ------------------------------------------------------------------

Result SqliteIndex::Apply(const WriteBatch& batch) {
  if (batch.Empty()) return Result::Ok();

  std::lock_guard<std::mutex> lock(mutex_);

  try {
    std::map<std::string, std::size_t> dimensions;
    for (const auto& op : batch.Ops()) {
      if (dimensions.contains(op.collection)) continue;
      auto info = DescribeLocked(op.collection);
      if (!info) return Result::Err(ErrorCode::NotFound, "unknown collection " + op.collection);
      dimensions[op.collection] = info->dimension;
    }

    SqliteTransaction tx(db_);
    auto*             db = tx.Handle();

    for (const auto& op : batch.Ops()) {
      if (op.record.id.empty()) {
        tx.Rollback();
        return Result::Err(ErrorCode::ConstraintViolation, "record id is empty");
      }

      const auto dimension  = dimensions[op.collection];
      const bool has_vector = op.kind == WriteBatch::OpKind::kUpsert || op.kind == WriteBatch::OpKind::kSetVector;
      if (has_vector && !op.record.vector.empty() && dimension != 0 && op.record.vector.size() != dimension) {
        tx.Rollback();
        return Result::Err(ErrorCode::DimensionMismatch, "vector dimension " + std::to_string(op.record.vector.size()) + " != " +
                                                             std::to_string(dimension) + " in " + op.collection);
      }

      Result status;
      switch (op.kind) {
        case WriteBatch::OpKind::kUpsert:
          status = ApplyUpsert(db, op);
          break;
        case WriteBatch::OpKind::kMergePayload:
          status = ApplyMergePayload(db, op);
          break;
        case WriteBatch::OpKind::kSetVector:
          status = ApplySetVector(db, op);
          break;
        case WriteBatch::OpKind::kDelete:
          status = ApplyDelete(db, op);
          break;
      }

      if (!status) {
        tx.Rollback();
        return status;
      }
    }

    tx.Commit();
  } catch (const util::IndexError& e) {
    // BEGIN/COMMIT failures surface here (busy timeout, I/O)
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Ok();
}

Result SqliteIndex::ApplyUpsert(sqlite3* db, const WriteBatch::Op& op) {
  {
    const char* sql =
        "INSERT INTO records(collection,id,document,vector) VALUES(?,?,?,?) "
        "ON CONFLICT(collection,id) DO UPDATE SET document=excluded.document, vector=excluded.vector;";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
      sqlite3_finalize(raw);
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
    Statement st(raw);

    BindText(st.get(), 1, op.collection);
    BindText(st.get(), 2, op.record.id);
    BindText(st.get(), 3, op.record.document);
    BindVector(st.get(), 4, op.record.vector);

    auto status = Translate(db, sqlite3_step(st.get()));
    if (!status) return status;
  }

  {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM record_fields WHERE collection=? AND id=?;", -1, &raw, nullptr) != SQLITE_OK) {
      sqlite3_finalize(raw);
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
    Statement st(raw);
    BindText(st.get(), 1, op.collection);
    BindText(st.get(), 2, op.record.id);

    auto status = Translate(db, sqlite3_step(st.get()));
    if (!status) return status;
  }

  for (const auto& [key, value] : op.record.payload) {
    auto status = WriteField(db, op.collection, op.record.id, key, value);
    if (!status) return status;
  }
  return Result::Ok();
}

Result SqliteIndex::ApplyMergePayload(sqlite3* db, const WriteBatch::Op& op) {
  {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT 1 FROM records WHERE collection=? AND id=?;", -1, &raw, nullptr) != SQLITE_OK) {
      sqlite3_finalize(raw);
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
    Statement st(raw);
    BindText(st.get(), 1, op.collection);
    BindText(st.get(), 2, op.record.id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return Result::Err(ErrorCode::NotFound, "record " + op.record.id + " not found in " + op.collection);
    if (rc != SQLITE_ROW) return Translate(db, rc);
  }

  for (const auto& [key, value] : op.record.payload) {
    auto status = WriteField(db, op.collection, op.record.id, key, value);
    if (!status) return status;
  }
  return Result::Ok();
}

Result SqliteIndex::ApplySetVector(sqlite3* db, const WriteBatch::Op& op) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, "UPDATE records SET vector=? WHERE collection=? AND id=?;", -1, &raw, nullptr) != SQLITE_OK) {
    sqlite3_finalize(raw);
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Statement st(raw);
  BindVector(st.get(), 1, op.record.vector);
  BindText(st.get(), 2, op.collection);
  BindText(st.get(), 3, op.record.id);

  auto status = Translate(db, sqlite3_step(st.get()));
  if (!status) return status;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "record " + op.record.id + " not found in " + op.collection);
  return Result::Ok();
}

Result SqliteIndex::ApplyDelete(sqlite3* db, const WriteBatch::Op& op) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, "DELETE FROM records WHERE collection=? AND id=?;", -1, &raw, nullptr) != SQLITE_OK) {
    sqlite3_finalize(raw);
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Statement st(raw);
  BindText(st.get(), 1, op.collection);
  BindText(st.get(), 2, op.record.id);

  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteIndex::WriteField(sqlite3* db, const std::string& collection, const std::string& id, const std::string& key,
                               const PayloadValue& value) {
  const char* sql =
      "INSERT INTO record_fields(collection,id,key,kind,text_value,int_value,real_value) VALUES(?,?,?,?,?,?,?) "
      "ON CONFLICT(collection,id,key) DO UPDATE SET kind=excluded.kind, text_value=excluded.text_value, "
      "int_value=excluded.int_value, real_value=excluded.real_value;";

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
    sqlite3_finalize(raw);
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Statement st(raw);

  BindText(st.get(), 1, collection);
  BindText(st.get(), 2, id);
  BindText(st.get(), 3, key);
  BindI64(st.get(), 4, KindOf(value));
  BindFieldValue(st.get(), 5, 6, 7, value);

  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

Payload SqliteIndex::LoadPayload(const std::string& collection, const std::string& id) {
  auto st = db_->Prepare("SELECT key,kind,text_value,int_value,real_value FROM record_fields WHERE collection=? AND id=?;");
  BindText(st.get(), 1, collection);
  BindText(st.get(), 2, id);

  Payload payload;
  int     rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    auto key  = ColText(st.get(), 0);
    int  kind = sqlite3_column_int(st.get(), 1);
    switch (kind) {
      case kText:
        payload[key] = ColText(st.get(), 2);
        break;
      case kInt:
        payload[key] = static_cast<std::int64_t>(sqlite3_column_int64(st.get(), 3));
        break;
      case kReal:
        payload[key] = sqlite3_column_double(st.get(), 4);
        break;
      case kBool:
        payload[key] = sqlite3_column_int64(st.get(), 3) != 0;
        break;
      default:
        break;
    }
  }
  ThrowIfStepFailed(db_->Handle(), rc, "load payload " + id);
  return payload;
}

std::vector<Record> SqliteIndex::Get(const std::string& collection, const std::vector<std::string>& ids) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<Record> out;
  for (const auto& id : ids) {
    auto st = db_->Prepare("SELECT id,document,vector FROM records WHERE collection=? AND id=?;");
    BindText(st.get(), 1, collection);
    BindText(st.get(), 2, id);

    int rc = sqlite3_step(st.get());
    ThrowIfStepFailed(db_->Handle(), rc, "get " + id);
    if (rc != SQLITE_ROW) continue;

    Record record;
    record.id       = ColText(st.get(), 0);
    record.document = ColText(st.get(), 1);
    record.vector   = ColVector(st.get(), 2);
    st.reset();

    record.payload = LoadPayload(collection, record.id);
    out.push_back(std::move(record));
  }
  return out;
}

std::vector<Record> SqliteIndex::Find(const std::string& collection, const Filter& filter, std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  return FindLocked(collection, filter, limit);
}

std::vector<Record> SqliteIndex::FindLocked(const std::string& collection, const Filter& filter, std::size_t limit) {
  std::string sql = "SELECT r.id,r.document,r.vector FROM records r WHERE r.collection=?";
  for (const auto& condition : filter) {
    sql += " AND EXISTS (SELECT 1 FROM record_fields f WHERE f.collection=r.collection AND f.id=r.id AND f.key=? AND f.kind=? AND f.";
    sql += ValueColumn(KindOf(condition.value));
    sql += "=?)";
  }
  sql += " ORDER BY r.rowid";
  if (limit != 0) sql += " LIMIT " + std::to_string(limit);
  sql += ";";

  auto st  = db_->Prepare(sql);
  int  idx = 1;
  BindText(st.get(), idx++, collection);
  for (const auto& condition : filter) {
    BindText(st.get(), idx++, condition.key);
    BindI64(st.get(), idx++, KindOf(condition.value));

    const auto& value = condition.value;
    if (const auto* s = std::get_if<std::string>(&value)) {
      BindText(st.get(), idx++, *s);
    } else if (const auto* i = std::get_if<std::int64_t>(&value)) {
      BindI64(st.get(), idx++, *i);
    } else if (const auto* d = std::get_if<double>(&value)) {
      sqlite3_bind_double(st.get(), idx++, *d);
    } else if (const auto* b = std::get_if<bool>(&value)) {
      BindI64(st.get(), idx++, *b ? 1 : 0);
    }
  }

  std::vector<Record> out;
  int                 rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    Record record;
    record.id       = ColText(st.get(), 0);
    record.document = ColText(st.get(), 1);
    record.vector   = ColVector(st.get(), 2);
    out.push_back(std::move(record));
  }
  ThrowIfStepFailed(db_->Handle(), rc, "find in " + collection);
  st.reset();

  for (auto& record : out) {
    record.payload = LoadPayload(collection, record.id);
  }
  return out;
}

std::vector<Hit> SqliteIndex::SimilarityQuery(const std::string& collection, const std::vector<float>& vector, const Filter& filter,
                                              std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<Hit> hits;
  if (vector.empty() || limit == 0) return hits;

  for (auto& record : FindLocked(collection, filter, 0)) {
    if (record.vector.size() != vector.size()) continue;
    const double distance = CosineDistance(vector, record.vector);
    hits.push_back(Hit{std::move(record), distance});
  }

  std::stable_sort(hits.begin(), hits.end(), [](const Hit& a, const Hit& b) {
    return a.distance < b.distance;
  });
  if (hits.size() > limit) hits.resize(limit);
  return hits;
}

std::size_t SqliteIndex::Count(const std::string& collection) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto st = db_->Prepare("SELECT COUNT(*) FROM records WHERE collection=?;");
  BindText(st.get(), 1, collection);

  int rc = sqlite3_step(st.get());
  ThrowIfStepFailed(db_->Handle(), rc, "count " + collection);
  return rc == SQLITE_ROW ? static_cast<std::size_t>(sqlite3_column_int64(st.get(), 0)) : 0;
}

} // namespace engram::index::sqlite
