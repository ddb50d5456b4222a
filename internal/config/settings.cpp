#include "internal/config/settings.hpp"

#include <cmath>
#include <set>

#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace engram::config {

namespace {

void RequireNonNegative(const char* name, double value) {
  if (!std::isfinite(value) || value < 0.0) {
    throw util::ConfigError(std::string(name) + " must be a non-negative number");
  }
}

void RequireUnit(const char* name, double value) {
  if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
    throw util::ConfigError(std::string(name) + " must be within [0, 1]");
  }
}

void RequirePositive(const char* name, std::uint64_t value) {
  if (value == 0) throw util::ConfigError(std::string(name) + " must be greater than zero");
}

} // namespace

Settings ResolveSettings(const engram::runtime::config::RuntimeConfig& config) {
  Settings settings;

  // ------------------------------------------------------------
  // Index / embedding
  // ------------------------------------------------------------
  settings.index.backend = config.index().backend();
  if (!config.index().sqlite().path().empty()) settings.index.sqlite_path = config.index().sqlite().path();

  const auto& embedding = config.embedding();
  if (!embedding.model().empty()) settings.embedding.model = embedding.model();
  if (!embedding.model_version().empty()) settings.embedding.model_version = embedding.model_version();
  if (embedding.dimension() != 0) settings.embedding.dimension = embedding.dimension();

  // ------------------------------------------------------------
  // Retrieval / ranking
  // ------------------------------------------------------------
  const auto& retrieval = config.retrieval();
  if (retrieval.has_default_top_k()) settings.store.default_top_k = retrieval.default_top_k();
  if (retrieval.has_max_text_length()) settings.store.max_text_length = retrieval.max_text_length();
  if (retrieval.has_max_query_length()) settings.store.max_query_length = retrieval.max_query_length();
  if (retrieval.has_semantic_weight()) settings.ranking.semantic_weight = retrieval.semantic_weight();
  if (retrieval.has_keyword_weight()) settings.ranking.keyword_weight = retrieval.keyword_weight();
  RequirePositive("retrieval.default_top_k", settings.store.default_top_k);
  RequirePositive("retrieval.max_text_length", settings.store.max_text_length);
  RequirePositive("retrieval.max_query_length", settings.store.max_query_length);
  RequireNonNegative("retrieval.semantic_weight", settings.ranking.semantic_weight);
  RequireNonNegative("retrieval.keyword_weight", settings.ranking.keyword_weight);

  const auto& ranking = config.ranking();
  auto&       weights = settings.ranking;
  if (ranking.has_weight_relevance()) weights.weight_relevance = ranking.weight_relevance();
  if (ranking.has_weight_importance()) weights.weight_importance = ranking.weight_importance();
  if (ranking.has_weight_reliability()) weights.weight_reliability = ranking.weight_reliability();
  if (ranking.has_weight_recency()) weights.weight_recency = ranking.weight_recency();
  if (ranking.has_weight_frequency()) weights.weight_frequency = ranking.weight_frequency();
  if (ranking.has_weight_priority()) weights.weight_priority = ranking.weight_priority();
  if (ranking.has_recency_window_days()) weights.recency_window_days = ranking.recency_window_days();
  RequireNonNegative("ranking.weight_relevance", weights.weight_relevance);
  RequireNonNegative("ranking.weight_importance", weights.weight_importance);
  RequireNonNegative("ranking.weight_reliability", weights.weight_reliability);
  RequireNonNegative("ranking.weight_recency", weights.weight_recency);
  RequireNonNegative("ranking.weight_frequency", weights.weight_frequency);
  RequireNonNegative("ranking.weight_priority", weights.weight_priority);
  RequirePositive("ranking.recency_window_days", weights.recency_window_days);

  // ------------------------------------------------------------
  // Contradiction / skills
  // ------------------------------------------------------------
  const auto& contradiction = config.contradiction();
  if (contradiction.has_similarity_threshold()) settings.contradiction.similarity_threshold = contradiction.similarity_threshold();
  if (contradiction.has_candidate_count()) settings.contradiction.candidate_count = contradiction.candidate_count();
  settings.contradiction.link_in_graph = contradiction.link_in_graph();
  RequireUnit("contradiction.similarity_threshold", settings.contradiction.similarity_threshold);

  const auto& skills = config.skills();
  if (skills.has_default_confidence()) settings.skills.default_confidence = skills.default_confidence();
  if (skills.has_min_confidence()) settings.skills.min_confidence = skills.min_confidence();
  if (skills.has_search_top_k()) settings.skills.search_top_k = skills.search_top_k();
  if (skills.has_usage_boost_rate()) settings.skills.usage_boost_rate = skills.usage_boost_rate();
  RequireUnit("skills.default_confidence", settings.skills.default_confidence);
  RequireUnit("skills.min_confidence", settings.skills.min_confidence);
  RequireUnit("skills.usage_boost_rate", settings.skills.usage_boost_rate);
  RequirePositive("skills.search_top_k", settings.skills.search_top_k);

  // ------------------------------------------------------------
  // Graph
  // ------------------------------------------------------------
  const auto& graph = config.graph();
  if (graph.has_max_depth()) settings.graph.max_depth = graph.max_depth();
  if (graph.has_max_neighbors()) settings.graph.max_neighbors = graph.max_neighbors();
  if (graph.has_default_max_nodes()) settings.graph.default_max_nodes = graph.default_max_nodes();
  RequirePositive("graph.max_depth", settings.graph.max_depth);
  RequirePositive("graph.max_neighbors", settings.graph.max_neighbors);
  RequirePositive("graph.default_max_nodes", settings.graph.default_max_nodes);

  if (graph.relationship_types_size() > 0) {
    std::set<std::string> seen;
    settings.graph.relationship_types.clear();
    for (const auto& raw : graph.relationship_types()) {
      auto type = util::Trim(raw);
      if (type.empty()) throw util::ConfigError("graph.relationship_types must not contain blank entries");
      if (seen.insert(type).second) settings.graph.relationship_types.push_back(std::move(type));
    }
  }

  // ------------------------------------------------------------
  // Lifecycle
  // ------------------------------------------------------------
  const auto& lifecycle = config.lifecycle();
  if (lifecycle.has_facts_ttl_days()) settings.lifecycle.facts_ttl_days = lifecycle.facts_ttl_days();
  if (lifecycle.has_files_ttl_days()) settings.lifecycle.files_ttl_days = lifecycle.files_ttl_days();
  if (lifecycle.has_learnings_ttl_days()) settings.lifecycle.learnings_ttl_days = lifecycle.learnings_ttl_days();
  if (lifecycle.has_check_interval_seconds()) settings.lifecycle.check_interval_seconds = lifecycle.check_interval_seconds();
  if (lifecycle.has_scheduler_enabled()) settings.lifecycle.scheduler_enabled = lifecycle.scheduler_enabled();
  RequirePositive("lifecycle.check_interval_seconds", settings.lifecycle.check_interval_seconds);

  return settings;
}

} // namespace engram::config
