#include "internal/knowledge/knowledge_store.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "support/store_fixture.hpp"

namespace {

using engram::index::Record;
using engram::knowledge::KnowledgeStore;
using engram::knowledge::LearningInput;
using engram::knowledge::SearchRequest;
using engram::knowledge::StoreOptions;
using engram::model::Collection;
using engram::model::EntryMetadata;
using engram::model::EntryStatus;
using engram::testing::Axis;
using engram::testing::kFixtureDimension;
using engram::testing::MakeStoreFixture;
using engram::testing::Tilted;

LearningInput Learning(const std::string& text, const std::string& category = "fact", const std::string& workspace = {}) {
  LearningInput input;
  input.text         = text;
  input.model_name   = "assistant";
  input.agent_name   = "planner";
  input.category     = category;
  input.workspace_id = workspace;
  return input;
}

std::size_t CountActive(const std::vector<engram::model::KnowledgeEntry>& entries) {
  return static_cast<std::size_t>(std::count_if(entries.begin(), entries.end(), [](const engram::model::KnowledgeEntry& e) {
    return e.metadata.status == EntryStatus::kActive;
  }));
}

void TestAddFact() {
  StoreOptions options;
  options.max_text_length = 64;
  auto f                  = MakeStoreFixture(options);

  const auto id = f.store->AddFact("Water boils at 100C at sea level");
  assert(!id.empty());
  auto entry = f.store->GetEntry(Collection::kFacts, id);
  assert(entry.has_value());
  assert(entry->text == "Water boils at 100C at sea level");
  assert(entry->metadata.status == EntryStatus::kActive);
  assert(entry->metadata.version == 1);
  assert(!entry->metadata.created_at.empty());
  assert(entry->metadata.created_at_unix > 0);

  // rejected texts yield the empty id
  assert(f.store->AddFact("   ").empty());
  assert(f.store->AddFact(std::string(65, 'x')).empty());

  EntryMetadata bad;
  bad.importance = 1.5;
  bool threw     = false;
  try {
    f.store->AddFact("valid text", bad);
  } catch (const engram::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)f.store->GetEntry(Collection::kSkills, id);
  } catch (const engram::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(!f.store->GetEntry(Collection::kFacts, "missing").has_value());
}

void TestLearningVersions() {
  auto f = MakeStoreFixture();

  const auto v1 = f.store->AddLearning(Learning("Port is 80"));
  assert(!v1.id.empty());
  assert(v1.version == 1);
  assert(v1.learning_key == "assistant::fact");
  assert(!v1.conflict_detected);
  assert(v1.previous_version_id.empty());

  const auto v2 = f.store->AddLearning(Learning("Port is 8080"));
  assert(v2.version == 2);
  assert(v2.previous_version_id == v1.id);
  assert(v2.conflict_detected);

  // same statement modulo case and spacing: new version, no conflict
  const auto v3 = f.store->AddLearning(Learning("  port IS 8080 "));
  assert(v3.version == 3);
  assert(!v3.conflict_detected);

  auto versions = f.store->ListVersions("assistant");
  assert(versions.size() == 3);
  assert(versions[0].metadata.version == 1 && versions[1].metadata.version == 2 && versions[2].metadata.version == 3);
  assert(CountActive(versions) == 1);
  assert(versions[2].id == v3.id);
  assert(versions[0].metadata.status == EntryStatus::kSuperseded);
  assert(versions[0].metadata.superseded_by == v2.id);
  assert(!versions[0].metadata.superseded_at.empty());
  assert(versions[1].metadata.superseded_by == v3.id);

  const auto events = f.store->ListAuditLogs(50, "", "assistant");
  std::size_t added = 0, versioned = 0;
  for (const auto& event : events) {
    if (event.event_type == "learning_added") ++added;
    if (event.event_type == "learning_versioned") ++versioned;
  }
  assert(added == 1);
  assert(versioned == 2);

  // each workspace keeps its own key
  const auto scoped = f.store->AddLearning(Learning("Port is 443", "fact", "team-a"));
  assert(scoped.version == 1);
  assert(scoped.learning_key == "team-a::assistant::fact");
}

void TestLearningRejectsAndCategories() {
  auto f = MakeStoreFixture();

  assert(f.store->AddLearning(Learning("   ")).id.empty());

  auto no_model       = Learning("something");
  no_model.model_name = " ";
  bool threw          = false;
  try {
    f.store->AddLearning(no_model);
  } catch (const engram::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  assert(KnowledgeStore::NormalizeCategory(" Preference ") == "preference");
  assert(KnowledgeStore::NormalizeCategory("") == "general");
  assert(KnowledgeStore::NormalizeCategory("weird") == "general");
  assert(KnowledgeStore::LearningKey("", "m", "fact") == "m::fact");
  assert(KnowledgeStore::LearningKey("ws", "m", "fact") == "ws::m::fact");

  const auto stored = f.store->AddLearning(Learning("likes dark mode", "Weird"));
  assert(stored.learning_key == "assistant::general");

  // case differences in Cyrillic text are not a conflict
  f.store->AddLearning(Learning("Порт равен 80", "correction"));
  const auto same = f.store->AddLearning(Learning("ПОРТ  равен 80", "correction"));
  assert(same.version == 2);
  assert(!same.conflict_detected);
  const auto changed = f.store->AddLearning(Learning("Порт равен 8080", "correction"));
  assert(changed.conflict_detected);
}

void TestContradictionAcrossCategories() {
  engram::knowledge::ContradictionOptions detection;
  detection.link_in_graph = true;
  auto f                  = MakeStoreFixture({}, detection);

  f.embedder->Script("The server listens on port 80", Axis(kFixtureDimension, 0));
  f.embedder->Script("The server listens on port 8080", Tilted(kFixtureDimension, 0, 1, 0.95));

  const auto first  = f.store->AddLearning(Learning("The server listens on port 80", "fact"));
  const auto second = f.store->AddLearning(Learning("The server listens on port 8080", "general"));
  assert(second.version == 1);
  assert(!second.conflict_detected);
  assert(second.contradictions.size() == 1);
  assert(second.contradictions.front().id == first.id);
  assert(std::fabs(second.contradictions.front().similarity - 0.95) < 1e-5);

  auto stored = f.store->GetEntry(Collection::kLearnings, second.id);
  assert(stored->metadata.contradiction_ids == std::vector<std::string>{first.id});

  auto edges = f.graph->GetNeighbors(second.id);
  assert(edges.size() == 1);
  assert(edges.front().relationship_type == "contradicts");
  assert(edges.front().source_id == second.id);
  assert(edges.front().target_id == first.id);
  assert(std::fabs(*engram::index::GetNumber(edges.front().metadata, "similarity") - 0.95) < 1e-4);
}

void TestSearch() {
  auto f = MakeStoreFixture();
  f.embedder->Script("how to deploy", Axis(kFixtureDimension, 2));
  f.embedder->Script("deploy with docker", Axis(kFixtureDimension, 2));
  f.embedder->Script("deploy with podman", Tilted(kFixtureDimension, 2, 3, 0.8));
  f.embedder->Script("bake bread", Axis(kFixtureDimension, 5));

  EntryMetadata team_a;
  team_a.workspace_id = "team-a";
  assert(!f.store->AddFact("deploy with docker", team_a).empty());
  assert(!f.store->AddFact("deploy with podman", team_a).empty());
  assert(!f.store->AddFact("bake bread", team_a).empty());
  // duplicate text collapses to one result
  assert(!f.store->AddFact("deploy with docker", team_a).empty());

  SearchRequest request;
  request.query        = "how to deploy";
  request.top_k        = 3;
  request.workspace_id = "team-a";
  auto results         = f.store->SearchFacts(request);
  assert(results.size() == 2);
  assert(results[0].text == "deploy with docker");
  assert(results[0].source == "facts");
  assert(results[0].similarity == 1.0);
  assert(results[1].text == "deploy with podman");
  for (std::size_t i = 1; i < results.size(); ++i) assert(results[i - 1].score >= results[i].score);

  request.workspace_id = "team-b";
  assert(f.store->SearchFacts(request).empty());

  request.query = "   ";
  assert(f.store->SearchFacts(request).empty());

  request.query = std::string(5001, 'q');
  bool threw    = false;
  try {
    f.store->SearchFacts(request);
  } catch (const engram::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  const auto metrics = f.store->GetRetrievalMetrics();
  assert(metrics.requests_total == 3);
  assert(metrics.errors_total == 0);
}

void TestSearchPriorityAndFiles() {
  auto f = MakeStoreFixture();
  f.embedder->Script("incident runbook", Axis(kFixtureDimension, 7));
  f.embedder->Script("pinned runbook", Tilted(kFixtureDimension, 7, 8, 0.9));
  f.embedder->Script("normal runbook", Tilted(kFixtureDimension, 7, 9, 0.9));
  f.embedder->Script("runbook chunk", Tilted(kFixtureDimension, 7, 10, 0.9));

  EntryMetadata pinned;
  pinned.priority = "pinned";
  EntryMetadata normal;
  normal.priority = "normal";
  f.store->AddFact("pinned runbook", pinned);
  f.store->AddFact("normal runbook", normal);

  engram::knowledge::FileChunkInput chunk;
  chunk.file_name = "runbook.md";
  f.store->AddFileChunk("runbook chunk", chunk);

  SearchRequest request;
  request.query = "incident runbook";
  request.top_k = 5;
  auto all      = f.store->SearchFacts(request);
  assert(all.size() == 3);
  // equal similarity: pinned outranks normal through the priority signal
  assert(all[0].text == "pinned runbook");

  request.include_files = false;
  assert(f.store->SearchFacts(request).size() == 2);

  request.min_priority = "pinned";
  auto high            = f.store->SearchFacts(request);
  assert(high.size() == 1);
  assert(high.front().text == "pinned runbook");
}

void TestSearchLearningsSkipsOldVersions() {
  auto f = MakeStoreFixture();
  f.store->AddLearning(Learning("Port is 80"));
  f.store->AddLearning(Learning("Port is 8080"));
  f.store->AddLearning(Learning("Prefers tabs", "preference"));

  SearchRequest request;
  request.query      = "Port";
  request.model_name = "assistant";
  request.top_k      = 10;
  auto results       = f.store->SearchLearnings(request);
  assert(results.size() == 2);
  for (const auto& result : results) {
    assert(result.text != "Port is 80");
    assert(result.metadata.status == EntryStatus::kActive);
  }

  request.category = "preference";
  results          = f.store->SearchLearnings(request);
  assert(results.size() == 1 && results.front().text == "Prefers tabs");

  request.category   = "";
  request.model_name = "someone-else";
  assert(f.store->SearchLearnings(request).empty());
}

void TestReadsDegradeWritesThrow() {
  auto f = MakeStoreFixture();
  const auto fact_id = f.store->AddFact("stable fact");
  const auto v1 = f.store->AddLearning(Learning("Port is 80"));

  f.index->fail_reads = true;
  SearchRequest request;
  request.query = "stable";
  assert(f.store->SearchFacts(request).empty());
  assert(f.store->GetRetrievalMetrics().errors_total == 1);
  assert(f.store->ListEntries(Collection::kFacts).empty());
  assert(!f.store->GetEntry(Collection::kFacts, fact_id).has_value());
  assert(f.store->ListAuditLogs().empty());
  assert(f.store->GetCollectionStats().facts == 0);
  f.index->fail_reads = false;

  f.index->fail_writes = true;
  bool threw           = false;
  try {
    f.store->AddFact("never stored");
  } catch (const engram::util::IndexError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.store->AddLearning(Learning("Port is 8080"));
  } catch (const engram::util::IndexError&) {
    threw = true;
  }
  assert(threw);
  f.index->fail_writes = false;

  // the failed version left nothing behind
  auto versions = f.store->ListVersions("assistant");
  assert(versions.size() == 1);
  assert(versions.front().id == v1.id);
  assert(versions.front().metadata.status == EntryStatus::kActive);
  assert(f.store->GetCollectionStats().facts == 1);
}

void TestDeleteModelLearnings() {
  auto f = MakeStoreFixture();
  f.store->AddLearning(Learning("Port is 80"));
  f.store->AddLearning(Learning("Port is 8080"));
  f.store->AddLearning(Learning("Prefers tabs", "preference"));

  auto other       = Learning("Unrelated");
  other.model_name = "other-model";
  f.store->AddLearning(other);

  assert(f.store->DeleteModelLearnings("assistant", std::string("preference")) == 1);
  assert(f.store->DeleteModelLearnings("assistant") == 1);
  assert(f.store->DeleteModelLearnings("assistant") == 0);

  auto versions = f.store->ListVersions("assistant");
  assert(versions.size() == 3);
  assert(CountActive(versions) == 0);
  assert(f.store->ListVersions("other-model").front().metadata.status == EntryStatus::kActive);

  const auto stats = f.store->GetLearningStats();
  assert(stats.total_active == 1);
  assert(stats.by_model.at("other-model") == 1);

  bool seen = false;
  for (const auto& event : f.store->ListAuditLogs(50, "", "assistant")) seen = seen || event.event_type == "learnings_deleted";
  assert(seen);
}

void TestReconcileActiveVersions() {
  auto f = MakeStoreFixture();

  // two writers outside this process both left an active version behind
  for (std::uint32_t version : {1u, 2u}) {
    EntryMetadata metadata;
    metadata.model_name      = "assistant";
    metadata.category        = "fact";
    metadata.learning_key    = "assistant::fact";
    metadata.version         = version;
    metadata.created_at      = "2024-05-01T12:00:0" + std::to_string(version) + ".000Z";
    metadata.created_at_unix = 1714564800 + version;
    assert(f.index->Upsert("learnings", {Record{"v" + std::to_string(version), Axis(kFixtureDimension, version), "value " +
                                                std::to_string(version), engram::model::ToPayload(metadata)}}));
  }

  assert(f.store->ReconcileActiveVersions() == 1);
  assert(f.store->GetEntry(Collection::kLearnings, "v2")->metadata.status == EntryStatus::kActive);
  auto loser = f.store->GetEntry(Collection::kLearnings, "v1");
  assert(loser->metadata.status == EntryStatus::kSuperseded);
  assert(loser->metadata.superseded_by == "v2");
  assert(f.store->ReconcileActiveVersions() == 0);

  // the next write builds on the survivor
  const auto next = f.store->AddLearning(Learning("value 3"));
  assert(next.version == 3);
  assert(next.previous_version_id == "v2");
}

void TestConcurrentWritersToOneKey() {
  auto f = MakeStoreFixture();

  std::vector<std::thread> writers;
  for (int i = 0; i < 8; ++i) {
    writers.emplace_back([&f, i] { f.store->AddLearning(Learning("value " + std::to_string(i))); });
  }
  for (auto& writer : writers) writer.join();

  auto versions = f.store->ListVersions("assistant");
  assert(versions.size() == 8);
  assert(CountActive(versions) == 1);

  std::set<std::uint32_t> numbers;
  for (const auto& entry : versions) numbers.insert(entry.metadata.version);
  assert(numbers.size() == 8);
  assert(*numbers.begin() == 1 && *numbers.rbegin() == 8);
}

void TestStats() {
  auto f = MakeStoreFixture();
  f.store->AddFact("one");
  f.store->AddFact("two");
  f.store->AddLearning(Learning("Port is 80"));
  f.store->AddLearning(Learning("Prefers tabs", "preference"));

  const auto counts = f.store->GetCollectionStats();
  assert(counts.facts == 2);
  assert(counts.files == 0);
  assert(counts.learnings == 2);

  const auto stats = f.store->GetLearningStats();
  assert(stats.total_active == 2);
  assert(stats.by_category.at("fact") == 1);
  assert(stats.by_category.at("preference") == 1);

  const auto embedding = f.store->GetEmbeddingStatus();
  assert(embedding.status == "ready");
  assert(embedding.model == "scripted");
  assert(embedding.vector_size == kFixtureDimension);
  assert(embedding.collections.at("facts") == 2);
}

} // namespace

int main() {
  TestAddFact();
  TestLearningVersions();
  TestLearningRejectsAndCategories();
  TestContradictionAcrossCategories();
  TestSearch();
  TestSearchPriorityAndFiles();
  TestSearchLearningsSkipsOldVersions();
  TestReadsDegradeWritesThrow();
  TestDeleteModelLearnings();
  TestReconcileActiveVersions();
  TestConcurrentWritersToOneKey();
  TestStats();

  std::cout << "engram_unit_knowledge_store: pass" << std::endl;
  return 0;
}
