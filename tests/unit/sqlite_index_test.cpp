#include "internal/index/sqlite/sqlite_index.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/index/sqlite/sqlite_db.hpp"
#include "internal/util/errors.hpp"
#include "support/index_conformance.hpp"

namespace {

using engram::index::CollectionInfo;
using engram::index::Payload;
using engram::index::Record;
using engram::index::sqlite::SqliteDB;
using engram::index::sqlite::SqliteIndex;

std::filesystem::path FreshDbPath(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "engram_sqlite_index_tests";
  std::filesystem::create_directories(dir);

  const auto path = dir / (name + ".sqlite");
  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path.string() + suffix);
  }
  return path;
}

void TestConformance() {
  SqliteIndex idx(std::make_shared<SqliteDB>(FreshDbPath("conformance").string()));
  engram::testing::RunVectorIndexConformance(idx);
}

void TestRecordsSurviveReopen() {
  const auto path = FreshDbPath("reopen");
  {
    SqliteIndex idx(std::make_shared<SqliteDB>(path.string()));
    assert(idx.EnsureCollection(CollectionInfo{"learnings", "hashing-embedder", "1", 2}));
    assert(idx.Upsert("learnings", {Record{"l1", {0.6f, 0.8f}, "port is 8080",
                                           Payload{{"status", std::string("active")}, {"version", std::int64_t{2}}, {"importance", 0.25}}}}));
  }

  SqliteIndex reopened(std::make_shared<SqliteDB>(path.string()));
  auto        info = reopened.DescribeCollection("learnings");
  assert(info.has_value() && info->dimension == 2);

  auto records = reopened.Find("learnings", {{"status", std::string("active")}});
  assert(records.size() == 1);
  assert(records.front().document == "port is 8080");
  assert(records.front().vector.size() == 2);
  assert(engram::index::GetInt(records.front().payload, "version") == std::int64_t{2});
  assert(engram::index::GetNumber(records.front().payload, "importance") == 0.25);
}

void TestUnopenableFileThrows() {
  bool threw = false;
  try {
    SqliteDB db("/nonexistent-dir/engram/index.sqlite");
  } catch (const engram::util::IndexError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestConformance();
  TestRecordsSurviveReopen();
  TestUnopenableFileThrows();

  std::cout << "engram_unit_sqlite_index: pass" << std::endl;
  return 0;
}
