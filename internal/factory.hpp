#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"

#include "internal/config/settings.hpp"
#include "internal/embedding/embedder.hpp"
#include "internal/graph/graph_engine.hpp"
#include "internal/index/api/vector_index.hpp"
#include "internal/knowledge/knowledge_store.hpp"
#include "internal/lifecycle/lifecycle_manager.hpp"
#include "internal/lifecycle/lifecycle_scheduler.hpp"
#include "internal/observability/retrieval_metrics.hpp"
#include "internal/skills/skill_engine.hpp"

namespace engram::factory {

enum class IndexBackend {
  kMemory,
  kSqlite,
};

// Trimmed, case-insensitive; empty selects memory. Throws util::UnsupportedBackend.
IndexBackend ResolveIndexBackend(const std::string& name);

std::shared_ptr<index::VectorIndex> BuildIndex(const config::IndexSettings& settings);

/*
  Application

  Owns every long-lived engine. Everything here lives for the lifetime of
  the process. `scheduler` is null when lifecycle.scheduler_enabled is off;
  it is created stopped.
*/
struct Application {
  config::Settings settings;

  std::shared_ptr<index::VectorIndex>               index;
  std::shared_ptr<embedding::Embedder>              embedder;
  std::shared_ptr<observability::RetrievalMetrics> metrics;

  std::shared_ptr<graph::GraphEngine>          graph;
  std::shared_ptr<knowledge::KnowledgeStore>   store;
  std::shared_ptr<skills::SkillEngine>         skills;
  std::shared_ptr<lifecycle::LifecycleManager> lifecycle;

  std::unique_ptr<lifecycle::LifecycleScheduler> scheduler;
};

/*
  Build

  Composition root. The only place that knows concrete index and embedder
  types. `index`/`embedder` override the configured ones when given.
*/
Application Build(const engram::runtime::config::RuntimeConfig& config);
Application Build(const config::Settings& settings, std::shared_ptr<index::VectorIndex> index = nullptr,
                  std::shared_ptr<embedding::Embedder> embedder = nullptr);

} // namespace engram::factory
