#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

#include "internal/graph/graph_engine.hpp"
#include "internal/knowledge/contradiction_detector.hpp"
#include "internal/knowledge/knowledge_store.hpp"
#include "internal/lifecycle/lifecycle_manager.hpp"
#include "internal/ranking/ranking_engine.hpp"
#include "internal/skills/skill_engine.hpp"

namespace engram::config {

struct EmbeddingSettings {
  std::string   model         = "hashing-embedder";
  std::string   model_version = "1";
  std::uint32_t dimension     = 384;
};

struct IndexSettings {
  std::string backend;
  std::string sqlite_path = "engram.db";
};

/*
  Plain option structs for every engine, resolved from RuntimeConfig.
  Unset config fields keep the struct defaults.
*/
struct Settings {
  IndexSettings                   index;
  EmbeddingSettings               embedding;
  knowledge::StoreOptions         store;
  ranking::RankingOptions         ranking;
  knowledge::ContradictionOptions contradiction;
  skills::SkillOptions            skills;
  graph::GraphOptions             graph;
  lifecycle::LifecycleOptions     lifecycle;
};

// Throws util::ConfigError for negative weights, thresholds outside [0, 1] or zero sizes.
Settings ResolveSettings(const engram::runtime::config::RuntimeConfig& config);

} // namespace engram::config
