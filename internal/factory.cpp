#include "internal/factory.hpp"

#include <chrono>

#include "internal/embedding/hashing_embedder.hpp"
#include "internal/graph/relationship_store.hpp"
#include "internal/index/collections.hpp"
#include "internal/index/memory/memory_index.hpp"
#include "internal/index/sqlite/sqlite_db.hpp"
#include "internal/index/sqlite/sqlite_index.hpp"
#include "internal/knowledge/contradiction_detector.hpp"
#include "internal/observability/logging.hpp"
#include "internal/ranking/ranking_engine.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace engram::factory {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

IndexBackend ResolveIndexBackend(const std::string& name) {
  const auto backend = util::ToLower(util::Trim(name));
  if (backend.empty() || backend == "memory") return IndexBackend::kMemory;
  if (backend == "sqlite") return IndexBackend::kSqlite;
  throw util::UnsupportedBackend("unsupported index backend '" + name + "' (expected memory or sqlite)");
}

std::shared_ptr<index::VectorIndex> BuildIndex(const config::IndexSettings& settings) {
  switch (ResolveIndexBackend(settings.backend)) {
    case IndexBackend::kSqlite: {
      auto db = std::make_shared<index::sqlite::SqliteDB>(settings.sqlite_path);
      ENGRAM_LOG_INFO("sqlite index opened", {StringField("path", settings.sqlite_path)});
      return std::make_shared<index::sqlite::SqliteIndex>(std::move(db));
    }
    case IndexBackend::kMemory:
      break;
  }
  return std::make_shared<index::memory::MemoryIndex>();
}

Application Build(const engram::runtime::config::RuntimeConfig& config) {
  return Build(config::ResolveSettings(config));
}

Application Build(const config::Settings& settings, std::shared_ptr<index::VectorIndex> index,
                  std::shared_ptr<embedding::Embedder> embedder) {
  Application app;
  app.settings = settings;

  // ------------------------------------------------------------------
  // Index + embedder
  // ------------------------------------------------------------------
  app.index    = index ? std::move(index) : BuildIndex(settings.index);
  app.embedder = embedder ? std::move(embedder)
                          : std::make_shared<embedding::HashingEmbedder>(settings.embedding.model, settings.embedding.model_version,
                                                                         settings.embedding.dimension);
  index::EnsureCollections(*app.index, *app.embedder);

  app.metrics = std::make_shared<observability::RetrievalMetrics>();

  // ------------------------------------------------------------------
  // Engines
  // ------------------------------------------------------------------
  app.graph = std::make_shared<graph::GraphEngine>(std::make_shared<graph::IndexRelationshipStore>(app.index), app.embedder,
                                                   settings.graph);

  knowledge::StoreDependencies deps;
  deps.index    = app.index;
  deps.embedder = app.embedder;
  deps.ranking  = std::make_shared<ranking::RankingEngine>(settings.ranking);
  deps.detector = std::make_shared<knowledge::ContradictionDetector>(app.index, settings.contradiction);
  deps.graph    = app.graph;
  deps.metrics  = app.metrics;
  app.store     = std::make_shared<knowledge::KnowledgeStore>(std::move(deps), settings.store);

  app.skills    = std::make_shared<skills::SkillEngine>(app.index, app.embedder, settings.skills);
  app.lifecycle = std::make_shared<lifecycle::LifecycleManager>(app.index, app.embedder, settings.lifecycle);

  if (settings.lifecycle.scheduler_enabled) {
    app.scheduler = std::make_unique<lifecycle::LifecycleScheduler>(
        app.lifecycle, app.store, std::chrono::seconds(settings.lifecycle.check_interval_seconds));
  }

  ENGRAM_LOG_INFO("runtime built", {StringField("index", settings.index.backend.empty() ? "memory" : settings.index.backend),
                                    StringField("embedding_model", app.embedder->ModelName()),
                                    IntField("dimension", static_cast<std::int64_t>(app.embedder->Dimension())),
                                    BoolField("scheduler", settings.lifecycle.scheduler_enabled)});
  return app;
}

} // namespace engram::factory
