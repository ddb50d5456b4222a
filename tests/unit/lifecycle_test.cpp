#include "internal/lifecycle/lifecycle_manager.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/lifecycle/lifecycle_scheduler.hpp"
#include "internal/util/errors.hpp"
#include "support/store_fixture.hpp"

namespace {

using engram::index::Record;
using engram::lifecycle::LifecycleManager;
using engram::lifecycle::LifecycleOptions;
using engram::lifecycle::LifecycleScheduler;
using engram::model::Collection;
using engram::model::EntryMetadata;
using engram::model::EntryStatus;
using engram::testing::Axis;
using engram::testing::kFixtureDimension;
using engram::testing::MakeStoreFixture;
using engram::testing::StoreFixture;

constexpr std::int64_t kDay = 86400;

std::int64_t NowUnix() {
  return engram::util::ToUnixSeconds(engram::util::Now());
}

// Writes a record as if created `age_days` ago; age < 0 leaves created_at_unix unset.
void Put(StoreFixture& f, const std::string& collection, const std::string& id, int age_days, EntryMetadata metadata = {}) {
  metadata.created_at_unix = age_days < 0 ? 0 : NowUnix() - age_days * kDay;
  assert(f.index->Upsert(collection, {Record{id, Axis(kFixtureDimension, 0), "document " + id, engram::model::ToPayload(metadata)}}));
}

std::shared_ptr<LifecycleManager> Manager(StoreFixture& f, LifecycleOptions options = {}) {
  return std::make_shared<LifecycleManager>(f.index, f.embedder, options);
}

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestExpiry() {
  auto f = MakeStoreFixture();
  Put(f, "facts", "old-fact", 100);
  Put(f, "facts", "new-fact", 10);
  Put(f, "facts", "undated-fact", -1);
  Put(f, "files", "old-chunk", 31);
  Put(f, "files", "new-chunk", 29);
  Put(f, "learnings", "ancient-learning", 1000);

  auto manager = Manager(f);
  assert(manager->TtlDays(Collection::kFacts) == 90);
  assert(manager->TtlDays(Collection::kLearnings) == 0);

  auto expired = manager->GetExpiredIds(Collection::kFacts, 90);
  assert(expired == std::vector<std::string>{"old-fact"});
  assert(manager->GetExpiredIds(Collection::kFacts, 5).size() == 2);
  assert(manager->GetExpiredIds(Collection::kFacts, 0).empty());

  // the scan is relative to the supplied clock
  const auto future = engram::util::Now() + std::chrono::hours(24 * 365);
  assert(manager->GetExpiredIds(Collection::kFacts, 90, future).size() == 2);

  auto counts = manager->GetExpiredCounts();
  assert(counts.at("facts") == 1);
  assert(counts.at("files") == 1);
  assert(counts.at("learnings") == 0);

  assert(Throws<engram::util::InvalidArgument>([&] { manager->GetExpiredIds(Collection::kSkills, 10); }));
  assert(Throws<engram::util::InvalidArgument>([&] { manager->CleanupExpired(Collection::kAudit); }));
}

void TestCleanup() {
  auto f = MakeStoreFixture();
  Put(f, "facts", "old-fact", 100);
  Put(f, "facts", "new-fact", 10);
  Put(f, "files", "old-chunk", 31);
  Put(f, "learnings", "ancient-learning", 1000);

  // expiry ignores status
  EntryMetadata deleted;
  deleted.status = EntryStatus::kDeleted;
  Put(f, "files", "trashed-chunk", 45, deleted);

  auto manager = Manager(f);
  auto only    = manager->CleanupExpired(Collection::kFacts);
  assert(only.total_deleted == 1);
  assert(only.by_collection.at("facts") == 1);
  assert(f.index->Count("files") == 2);

  auto report = manager->CleanupExpired();
  assert(report.total_deleted == 2);
  assert(report.by_collection.at("facts") == 0);
  assert(report.by_collection.at("files") == 2);
  assert(report.by_collection.count("learnings") == 0);
  assert(f.index->Count("facts") == 1);
  assert(f.index->Count("files") == 0);
  assert(f.index->Count("learnings") == 1);

  assert(manager->CleanupExpired().total_deleted == 0);

  // a failing backend skips the sweep rather than aborting it
  Put(f, "facts", "old-again", 100);
  f.index->fail_writes = true;
  assert(manager->CleanupExpired().total_deleted == 0);
  f.index->fail_writes = false;
  f.index->fail_reads  = true;
  assert(manager->GetExpiredIds(Collection::kFacts, 90).empty());
  f.index->fail_reads = false;
  assert(manager->CleanupExpired().total_deleted == 1);
}

void TestReindexDetection() {
  auto f = MakeStoreFixture();
  f.store->AddFact("first fact");
  f.store->AddFact("second fact");

  auto same = Manager(f)->CheckReindexNeeded();
  assert(!same.needs_reindex);
  assert(same.collections.size() == 3);
  assert(same.collections.at("facts").stored_model == "scripted");

  auto upgraded    = std::make_shared<engram::testing::ScriptedEmbedder>(kFixtureDimension, "scripted", "2");
  auto manager     = std::make_shared<LifecycleManager>(f.index, upgraded, LifecycleOptions{});
  auto drift       = manager->CheckReindexNeeded();
  const auto& fact = drift.collections.at("facts");
  assert(drift.needs_reindex);
  assert(fact.needs_reindex);
  assert(fact.stored_version == "1");
  assert(fact.current_version == "2");

  assert(manager->ReindexCollection(Collection::kFacts) == 2);
  assert(f.index->DescribeCollection("facts")->embedding_model_version == "2");
  assert(!manager->CheckReindexNeeded().collections.at("facts").needs_reindex);
  // nothing left to do unless forced
  assert(manager->ReindexCollection(Collection::kFacts) == 0);
  assert(manager->ReindexCollection(Collection::kFacts, true) == 2);

  // ids and payloads survive a reindex
  auto facts = f.store->ListEntries(Collection::kFacts);
  assert(facts.size() == 2);
  for (const auto& entry : facts) assert(entry.metadata.status == EntryStatus::kActive);

  auto all = manager->ReindexAll();
  assert(all.at("facts") == 0);
  assert(all.at("learnings") == 0);
  assert(!manager->CheckReindexNeeded().needs_reindex);
}

void TestReindexToNewDimension() {
  auto f = MakeStoreFixture();
  f.store->AddFact("first fact");

  auto smaller = std::make_shared<engram::testing::ScriptedEmbedder>(8, "compact", "1");
  auto manager = std::make_shared<LifecycleManager>(f.index, smaller, LifecycleOptions{});
  assert(manager->ReindexCollection(Collection::kFacts) == 1);

  auto info = f.index->DescribeCollection("facts");
  assert(info->dimension == 8);
  assert(info->embedding_model == "compact");
  assert(f.index->SimilarityQuery("facts", smaller->Encode("first fact"), {}, 1).size() == 1);
}

void TestReindexRestoresStampOnFailure() {
  auto f = MakeStoreFixture();
  f.store->AddFact("first fact");

  auto upgraded = std::make_shared<engram::testing::ScriptedEmbedder>(kFixtureDimension, "scripted", "2");
  auto manager  = std::make_shared<LifecycleManager>(f.index, upgraded, LifecycleOptions{});

  f.index->fail_writes = true;
  assert(Throws<engram::util::IndexError>([&] { manager->ReindexCollection(Collection::kFacts); }));
  f.index->fail_writes = false;

  assert(f.index->DescribeCollection("facts")->embedding_model_version == "1");
  assert(manager->CheckReindexNeeded().collections.at("facts").needs_reindex);

  // ReindexAll reports the failure as zero and keeps going
  f.index->fail_writes = true;
  auto counts          = manager->ReindexAll(true);
  f.index->fail_writes = false;
  assert(counts.at("facts") == 0);
  assert(counts.size() == 3);
}

void TestSchedulerValidation() {
  auto f       = MakeStoreFixture();
  auto manager = Manager(f);

  assert(Throws<std::invalid_argument>([&] { LifecycleScheduler(nullptr, f.store, std::chrono::milliseconds(10)); }));
  assert(Throws<std::invalid_argument>([&] { LifecycleScheduler(manager, f.store, std::chrono::milliseconds(0)); }));
}

void TestSchedulerTick() {
  auto f = MakeStoreFixture();
  Put(f, "facts", "old-fact", 100);

  // two active versions left by an outside writer
  for (std::uint32_t version : {1u, 2u}) {
    EntryMetadata metadata;
    metadata.model_name   = "assistant";
    metadata.category     = "fact";
    metadata.learning_key = "assistant::fact";
    metadata.version      = version;
    Put(f, "learnings", "v" + std::to_string(version), 1, metadata);
  }

  LifecycleScheduler scheduler(Manager(f), f.store, std::chrono::milliseconds(50));
  scheduler.RunOnce();
  assert(scheduler.Ticks() == 1);
  assert(f.index->Count("facts") == 0);
  assert(f.store->GetEntry(Collection::kLearnings, "v1")->metadata.status == EntryStatus::kSuperseded);
  assert(f.store->GetEntry(Collection::kLearnings, "v2")->metadata.status == EntryStatus::kActive);

  // a failing tick is absorbed
  f.index->fail_reads = true;
  scheduler.RunOnce();
  f.index->fail_reads = false;
  assert(scheduler.Ticks() == 2);
}

void TestSchedulerStartStop() {
  auto f = MakeStoreFixture();

  LifecycleScheduler scheduler(Manager(f), nullptr, std::chrono::milliseconds(10));
  assert(!scheduler.Running());
  scheduler.Start();
  scheduler.Start();
  assert(scheduler.Running());

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (scheduler.Ticks() < 3 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  assert(scheduler.Ticks() >= 3);

  scheduler.Stop();
  assert(!scheduler.Running());
  const auto ticks = scheduler.Ticks();
  scheduler.Stop();
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  assert(scheduler.Ticks() == ticks);

  // restartable after a stop
  scheduler.Start();
  assert(scheduler.Running());
  scheduler.Stop();
}

} // namespace

int main() {
  TestExpiry();
  TestCleanup();
  TestReindexDetection();
  TestReindexToNewDimension();
  TestReindexRestoresStampOnFailure();
  TestSchedulerValidation();
  TestSchedulerTick();
  TestSchedulerStartStop();

  std::cout << "engram_unit_lifecycle: pass" << std::endl;
  return 0;
}
