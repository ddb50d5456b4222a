#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/factory.hpp"
#include "internal/index/memory/memory_index.hpp"
#include "internal/index/sqlite/sqlite_db.hpp"
#include "internal/index/sqlite/sqlite_index.hpp"
#include "support/scripted_embedder.hpp"

namespace {

using engram::factory::Application;
using engram::index::VectorIndex;
using engram::model::EntryStatus;
using engram::testing::Axis;
using engram::testing::ScriptedEmbedder;
using engram::testing::Tilted;

constexpr std::size_t kDim = 16;

struct BackendFactory {
  std::string                                   name;
  std::function<std::shared_ptr<VectorIndex>()> make_index;
  std::function<void()>                         cleanup;
};

// Observable outcome of the scenario, free of generated ids and timestamps.
struct Summary {
  std::vector<std::string>   version_texts;
  std::vector<std::uint32_t> versions;
  std::size_t                active_versions = 0;
  bool                       conflict        = false;
  std::size_t                contradictions  = 0;
  std::vector<std::string>   search_texts;
  std::vector<std::string>   learning_search_texts;
  std::vector<std::string>   file_statuses;
  std::size_t                traversal_nodes = 0;
  std::size_t                graph_edges     = 0;
  std::size_t                active_skills   = 0;
  std::size_t                all_skills      = 0;
  double                     skill_confidence = 0.0;
  std::size_t                audit_events     = 0;
  std::size_t                expired_facts    = 0;
  bool                       needs_reindex    = true;
};

std::shared_ptr<ScriptedEmbedder> MakeEmbedder() {
  auto embedder = std::make_shared<ScriptedEmbedder>(kDim, "scripted", "1");
  embedder->Script("The API listens on port 80", Axis(kDim, 0));
  embedder->Script("The API listens on port 8080", Tilted(kDim, 0, 1, 0.95));
  embedder->Script("release checklist", Axis(kDim, 4));
  embedder->Script("Tag the release in git", Tilted(kDim, 4, 5, 0.9));
  embedder->Script("Publish release notes", Tilted(kDim, 4, 6, 0.7));
  embedder->Script("Order team lunch", Axis(kDim, 9));
  embedder->Script("Release checklist chunk", Tilted(kDim, 4, 7, 0.8));
  return embedder;
}

Application BuildApp(const std::shared_ptr<VectorIndex>& index) {
  engram::config::Settings settings;
  settings.contradiction.link_in_graph = true;
  settings.lifecycle.scheduler_enabled = false;
  return engram::factory::Build(settings, index, MakeEmbedder());
}

Summary RunScenario(const std::shared_ptr<VectorIndex>& index) {
  auto    app = BuildApp(index);
  Summary summary;

  engram::knowledge::LearningInput learning;
  learning.model_name = "assistant";
  learning.category   = "fact";
  for (const char* text : {"Deploys run at noon", "Deploys run at 3pm", "deploys  RUN at 3pm"}) {
    learning.text = text;
    app.store->AddLearning(learning);
  }

  learning.text       = "The API listens on port 80";
  const auto port_80  = app.store->AddLearning(learning);
  learning.category   = "general";
  learning.text       = "The API listens on port 8080";
  const auto port_new = app.store->AddLearning(learning);
  summary.conflict       = port_new.conflict_detected;
  summary.contradictions = port_new.contradictions.size();
  assert(port_80.version == 4);

  for (const auto& entry : app.store->ListVersions("assistant", std::string("fact"))) {
    summary.version_texts.push_back(entry.text);
    summary.versions.push_back(entry.metadata.version);
    if (entry.metadata.status == EntryStatus::kActive) ++summary.active_versions;
  }

  app.store->AddFact("Tag the release in git");
  app.store->AddFact("Publish release notes");
  app.store->AddFact("Order team lunch");

  engram::knowledge::FileChunkInput chunk;
  chunk.file_name = "release.md";
  chunk.file_id   = "file-release";
  app.store->AddFileChunk("Release checklist chunk", chunk);
  chunk.file_name = "old.md";
  chunk.file_id   = "file-old";
  app.store->AddFileChunk("Old process", chunk);
  app.store->SoftDeleteFile("file-old");

  engram::knowledge::SearchRequest request;
  request.query = "release checklist";
  request.top_k = 3;
  for (const auto& result : app.store->SearchFacts(request)) summary.search_texts.push_back(result.text);

  request.query      = "deploys";
  request.model_name = "assistant";
  request.top_k      = 10;
  for (const auto& result : app.store->SearchLearnings(request)) summary.learning_search_texts.push_back(result.text);
  std::sort(summary.learning_search_texts.begin(), summary.learning_search_texts.end());

  for (const auto& file : app.store->ListFiles({}, true)) summary.file_statuses.push_back(file.file_name + "=" + file.status);

  summary.traversal_nodes = app.graph->Traverse(port_new.id).nodes.size();
  summary.graph_edges     = app.graph->ListRelationships().size();

  engram::skills::SkillInput skill;
  skill.goal       = "Cut a release";
  skill.steps      = {"tag", "publish"};
  skill.confidence = 0.6;
  const auto first = app.skills->CreateSkill(skill);
  engram::skills::SkillUpdate update;
  update.steps = std::vector<std::string>{"tag", "build", "publish"};
  const auto second = app.skills->UpdateSkill(first.id, update);
  app.skills->RecordUsage(second->id);
  summary.active_skills    = app.skills->ListSkills().size();
  summary.all_skills       = app.skills->ListSkills({}, std::nullopt).size();
  summary.skill_confidence = app.skills->GetSkill(second->id)->confidence;

  summary.audit_events  = app.store->ListAuditLogs(0).size();
  summary.expired_facts = app.lifecycle->GetExpiredCounts().at("facts");
  summary.needs_reindex = app.lifecycle->CheckReindexNeeded().needs_reindex;
  return summary;
}

void AssertSameSummary(const Summary& a, const Summary& b) {
  assert(a.version_texts == b.version_texts);
  assert(a.versions == b.versions);
  assert(a.active_versions == b.active_versions);
  assert(a.conflict == b.conflict);
  assert(a.contradictions == b.contradictions);
  assert(a.search_texts == b.search_texts);
  assert(a.learning_search_texts == b.learning_search_texts);
  assert(a.file_statuses == b.file_statuses);
  assert(a.traversal_nodes == b.traversal_nodes);
  assert(a.graph_edges == b.graph_edges);
  assert(a.active_skills == b.active_skills);
  assert(a.all_skills == b.all_skills);
  assert(std::fabs(a.skill_confidence - b.skill_confidence) < 1e-9);
  assert(a.audit_events == b.audit_events);
  assert(a.expired_facts == b.expired_facts);
  assert(a.needs_reindex == b.needs_reindex);
}

void AssertExpectedSummary(const Summary& s) {
  assert((s.versions == std::vector<std::uint32_t>{1, 2, 3, 4}));
  assert(s.version_texts.front() == "Deploys run at noon");
  assert(s.version_texts.back() == "The API listens on port 80");
  assert(s.active_versions == 1);
  assert(!s.conflict);
  assert(s.contradictions == 1);
  // per-collection top_k; the chunk matches both query words and wins on keywords
  assert((s.search_texts ==
          std::vector<std::string>{"Release checklist chunk", "Tag the release in git", "Publish release notes", "Order team lunch"}));
  assert((s.learning_search_texts == std::vector<std::string>{"The API listens on port 80", "The API listens on port 8080"}));
  assert((s.file_statuses == std::vector<std::string>{"old.md=deleted", "release.md=active"}));
  assert(s.traversal_nodes == 2);
  assert(s.graph_edges == 1);
  assert(s.active_skills == 1);
  assert(s.all_skills == 2);
  assert(s.skill_confidence > 0.6);
  assert(s.expired_facts == 0);
  assert(!s.needs_reindex);
  // 5 learning writes, 2 chunk adds, 1 soft delete
  assert(s.audit_events == 8);
}

std::filesystem::path SqlitePath() {
  const auto dir = std::filesystem::temp_directory_path() / "engram_index_parity_tests";
  std::filesystem::create_directories(dir);
  return dir / "parity.sqlite";
}

void RemoveSqliteFiles() {
  const auto path = SqlitePath();
  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path.string() + suffix);
  }
}

void TestSqliteStatePersists() {
  RemoveSqliteFiles();
  {
    auto index = std::make_shared<engram::index::sqlite::SqliteIndex>(std::make_shared<engram::index::sqlite::SqliteDB>(SqlitePath().string()));
    auto app   = BuildApp(index);

    engram::knowledge::LearningInput learning;
    learning.model_name = "assistant";
    learning.text       = "Prefers short answers";
    app.store->AddLearning(learning);
    learning.text = "Prefers detailed answers";
    app.store->AddLearning(learning);
  }
  {
    auto index = std::make_shared<engram::index::sqlite::SqliteIndex>(std::make_shared<engram::index::sqlite::SqliteDB>(SqlitePath().string()));
    auto app   = BuildApp(index);

    auto versions = app.store->ListVersions("assistant");
    assert(versions.size() == 2);
    assert(versions.back().metadata.status == EntryStatus::kActive);
    assert(versions.front().metadata.superseded_by == versions.back().id);

    // the next writer continues the persisted chain
    engram::knowledge::LearningInput learning;
    learning.model_name = "assistant";
    learning.text       = "Prefers bullet points";
    assert(app.store->AddLearning(learning).version == 3);
  }
  RemoveSqliteFiles();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(BackendFactory{"memory", [] { return std::make_shared<engram::index::memory::MemoryIndex>(); }, [] {}});
  backends.push_back(BackendFactory{"sqlite",
                                    [] {
                                      RemoveSqliteFiles();
                                      return std::make_shared<engram::index::sqlite::SqliteIndex>(
                                          std::make_shared<engram::index::sqlite::SqliteDB>(SqlitePath().string()));
                                    },
                                    [] { RemoveSqliteFiles(); }});

  std::vector<Summary> summaries;
  for (const auto& backend : backends) {
    summaries.push_back(RunScenario(backend.make_index()));
    AssertExpectedSummary(summaries.back());
    backend.cleanup();
    std::cout << "  " << backend.name << ": ok" << std::endl;
  }
  AssertSameSummary(summaries[0], summaries[1]);

  TestSqliteStatePersists();

  std::cout << "engram_integration_index_parity: pass" << std::endl;
  return 0;
}
