#include "internal/index/collections.hpp"
#include "internal/knowledge/knowledge_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace engram::knowledge {

using model::Collection;
using observability::StringField;

namespace {

std::size_t SafeCount(index::VectorIndex& index, const std::string& collection) {
  try {
    return index.Count(collection);
  } catch (const util::IndexError& e) {
    ENGRAM_LOG_WARN("collection count failed", {StringField("collection", collection), StringField("error", e.what())});
  }
  return 0;
}

} // namespace

CollectionStats KnowledgeStore::GetCollectionStats() {
  CollectionStats stats;
  stats.facts     = SafeCount(*index_, index::CollectionKey(Collection::kFacts));
  stats.files     = SafeCount(*index_, index::CollectionKey(Collection::kFiles));
  stats.learnings = SafeCount(*index_, index::CollectionKey(Collection::kLearnings));

  auto& metrics = observability::Metrics::Instance();
  metrics.SetCollectionSize("facts", stats.facts);
  metrics.SetCollectionSize("files", stats.files);
  metrics.SetCollectionSize("learnings", stats.learnings);
  return stats;
}

LearningStats KnowledgeStore::GetLearningStats(const std::string& workspace_id) {
  index::Filter filter = {{"status", std::string(model::ToString(model::EntryStatus::kActive))}};
  if (!workspace_id.empty()) filter.push_back({"workspace_id", workspace_id});

  LearningStats stats;
  for (const auto& entry : ListEntries(Collection::kLearnings, filter)) {
    ++stats.total_active;
    ++stats.by_model[entry.metadata.model_name];
    ++stats.by_category[entry.metadata.category];
  }
  return stats;
}

EmbeddingStatus KnowledgeStore::GetEmbeddingStatus() {
  EmbeddingStatus status;
  status.model       = embedder_->ModelName();
  status.version     = embedder_->ModelVersion();
  status.vector_size = embedder_->Dimension();
  status.status      = "ready";

  for (auto collection : model::kKnowledgeCollections) {
    const auto name = index::CollectionKey(collection);
    status.collections[name] = SafeCount(*index_, name);

    try {
      auto info = index_->DescribeCollection(name);
      if (info && (info->embedding_model != status.model || info->embedding_model_version != status.version)) {
        status.status = "reindex_required";
      }
    } catch (const util::IndexError& e) {
      ENGRAM_LOG_WARN("collection describe failed", {StringField("collection", name), StringField("error", e.what())});
    }
  }
  return status;
}

observability::RetrievalMetricsSnapshot KnowledgeStore::GetRetrievalMetrics() const {
  return metrics_->Snapshot();
}

std::vector<model::AuditEvent> KnowledgeStore::ListAuditLogs(std::size_t top_k, const std::string& workspace_id,
                                                             const std::string& model_name) const {
  return audit_.List(top_k, workspace_id, model_name);
}

} // namespace engram::knowledge
