#include "internal/lifecycle/lifecycle_manager.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "internal/index/collections.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/observe.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace engram::lifecycle {

using model::Collection;
using observability::IntField;
using observability::StringField;

namespace {

constexpr std::int64_t kSecondsPerDay   = 86400;
constexpr std::size_t  kReindexBatchSize = 256;

bool IsKnowledgeCollection(Collection collection) {
  return std::find(model::kKnowledgeCollections.begin(), model::kKnowledgeCollections.end(), collection) != model::kKnowledgeCollections.end();
}

void RequireKnowledgeCollection(Collection collection) {
  if (!IsKnowledgeCollection(collection)) {
    throw util::InvalidArgument("collection has no lifecycle: " + index::CollectionKey(collection));
  }
}

} // namespace

LifecycleManager::LifecycleManager(std::shared_ptr<index::VectorIndex> index, std::shared_ptr<embedding::Embedder> embedder,
                                   LifecycleOptions options)
    : index_(std::move(index)), embedder_(std::move(embedder)), options_(options) {
  if (!index_) throw std::invalid_argument("LifecycleManager: index is null");
  if (!embedder_) throw std::invalid_argument("LifecycleManager: embedder is null");
}

std::uint32_t LifecycleManager::TtlDays(Collection collection) const {
  switch (collection) {
    case Collection::kFacts:
      return options_.facts_ttl_days;
    case Collection::kFiles:
      return options_.files_ttl_days;
    case Collection::kLearnings:
      return options_.learnings_ttl_days;
    default:
      return 0;
  }
}

// ------------------------------------------------------------
// TTL
// ------------------------------------------------------------

std::vector<std::string> LifecycleManager::GetExpiredIds(Collection collection, std::uint32_t ttl_days, util::TimePoint now) {
  RequireKnowledgeCollection(collection);
  if (ttl_days == 0) return {};

  const auto         name   = index::CollectionKey(collection);
  const std::int64_t cutoff = util::ToUnixSeconds(now) - static_cast<std::int64_t>(ttl_days) * kSecondsPerDay;

  std::vector<std::string> expired;
  try {
    for (const auto& record : index_->Find(name, {})) {
      const auto created = index::GetInt(record.payload, "created_at_unix").value_or(0);
      if (created > 0 && created < cutoff) expired.push_back(record.id);
    }
  } catch (const util::IndexError& e) {
    ENGRAM_LOG_ERROR("ttl scan failed", {StringField("collection", name), StringField("error", e.what())});
    return {};
  }
  return expired;
}

std::map<std::string, std::size_t> LifecycleManager::GetExpiredCounts() {
  std::map<std::string, std::size_t> counts;
  for (auto collection : model::kKnowledgeCollections) {
    counts[index::CollectionKey(collection)] = GetExpiredIds(collection, TtlDays(collection)).size();
  }
  return counts;
}

CleanupReport LifecycleManager::CleanupExpired(std::optional<Collection> collection) {
  return observability::ObserveOperation("lifecycle.cleanup", [&] {
    if (collection) RequireKnowledgeCollection(*collection);

    std::vector<Collection> targets;
    if (collection) {
      targets.push_back(*collection);
    } else {
      targets.assign(model::kKnowledgeCollections.begin(), model::kKnowledgeCollections.end());
    }

    CleanupReport report;
    for (auto target : targets) {
      const auto ttl = TtlDays(target);
      if (ttl == 0) continue;

      const auto name    = index::CollectionKey(target);
      const auto expired = GetExpiredIds(target, ttl);
      report.by_collection[name] = 0;
      if (expired.empty()) continue;

      if (auto status = index_->Delete(name, expired); !status) {
        ENGRAM_LOG_ERROR("ttl delete failed", {StringField("collection", name), StringField("error", status.message)});
        continue;
      }
      report.by_collection[name] = expired.size();
      report.total_deleted += expired.size();
      observability::Metrics::Instance().RecordLifecycleSweep(name, expired.size());
      ENGRAM_LOG_INFO("ttl cleanup", {StringField("collection", name), IntField("deleted", static_cast<std::int64_t>(expired.size())),
                                      IntField("ttl_days", ttl)});
    }
    return report;
  });
}

// ------------------------------------------------------------
// Reindex
// ------------------------------------------------------------

ReindexStatus LifecycleManager::CheckReindexNeeded() {
  ReindexStatus status;
  for (auto collection : model::kKnowledgeCollections) {
    const auto name = index::CollectionKey(collection);

    CollectionReindexStatus entry;
    entry.current_model   = embedder_->ModelName();
    entry.current_version = embedder_->ModelVersion();
    try {
      if (auto info = index_->DescribeCollection(name)) {
        entry.stored_model   = info->embedding_model;
        entry.stored_version = info->embedding_model_version;
      }
    } catch (const util::IndexError& e) {
      ENGRAM_LOG_WARN("collection describe failed", {StringField("collection", name), StringField("error", e.what())});
    }

    // an empty stamp means the collection predates stamping; nothing to compare
    entry.needs_reindex = (!entry.stored_model.empty() && entry.stored_model != entry.current_model) ||
                          (!entry.stored_version.empty() && entry.stored_version != entry.current_version);
    status.needs_reindex = status.needs_reindex || entry.needs_reindex;
    status.collections.emplace(name, std::move(entry));
  }
  return status;
}

std::size_t LifecycleManager::ReindexCollection(Collection collection, bool force) {
  return observability::ObserveOperation("lifecycle.reindex", [&]() -> std::size_t {
    RequireKnowledgeCollection(collection);
    const auto name = index::CollectionKey(collection);

    if (!force && !CheckReindexNeeded().collections[name].needs_reindex) {
      ENGRAM_LOG_INFO("reindex not required", {StringField("collection", name)});
      return 0;
    }

    const auto records = index_->Find(name, {});

    auto previous = index_->DescribeCollection(name);
    if (!previous) throw util::NotFound("collection " + name + " does not exist");

    index::CollectionInfo current = *previous;
    current.embedding_model         = embedder_->ModelName();
    current.embedding_model_version = embedder_->ModelVersion();
    current.dimension               = embedder_->Dimension();
    // stamped first so vectors of a new dimension validate
    index::ThrowIfIndexError(index_->SetCollectionInfo(current), "stamp collection " + name);

    std::size_t reindexed = 0;
    try {
      for (std::size_t start = 0; start < records.size(); start += kReindexBatchSize) {
        const auto end = std::min(records.size(), start + kReindexBatchSize);

        std::vector<std::pair<std::string, std::vector<float>>> vectors;
        vectors.reserve(end - start);
        for (std::size_t i = start; i < end; ++i) vectors.emplace_back(records[i].id, embedder_->Encode(records[i].document));

        index::ThrowIfIndexError(index_->UpdateVectors(name, vectors), "reindex " + name);
        reindexed += vectors.size();
      }
    } catch (const std::exception& e) {
      ENGRAM_LOG_ERROR("reindex aborted; restoring collection stamp",
                       {StringField("collection", name), IntField("reindexed", static_cast<std::int64_t>(reindexed)), StringField("error", e.what())});
      if (auto status = index_->SetCollectionInfo(*previous); !status) {
        ENGRAM_LOG_ERROR("failed to restore collection stamp", {StringField("collection", name), StringField("error", status.message)});
      }
      throw;
    }

    ENGRAM_LOG_INFO("collection reindexed", {StringField("collection", name), IntField("documents", static_cast<std::int64_t>(reindexed)),
                                             StringField("model", current.embedding_model), StringField("version", current.embedding_model_version)});
    return reindexed;
  });
}

std::map<std::string, std::size_t> LifecycleManager::ReindexAll(bool force) {
  std::map<std::string, std::size_t> counts;
  for (auto collection : model::kKnowledgeCollections) {
    const auto name = index::CollectionKey(collection);
    try {
      counts[name] = ReindexCollection(collection, force);
    } catch (const std::exception& e) {
      ENGRAM_LOG_ERROR("reindex failed", {StringField("collection", name), StringField("error", e.what())});
      counts[name] = 0;
    }
  }
  return counts;
}

} // namespace engram::lifecycle
