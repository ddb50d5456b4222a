#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/embedding/embedder.hpp"
#include "internal/index/api/vector_index.hpp"
#include "internal/model/collection.hpp"
#include "internal/util/time.hpp"

namespace engram::lifecycle {

// TTL in days per collection; 0 disables expiry.
struct LifecycleOptions {
  std::uint32_t facts_ttl_days         = 90;
  std::uint32_t files_ttl_days         = 30;
  std::uint32_t learnings_ttl_days     = 0;
  std::uint32_t check_interval_seconds = 3600;
  bool          scheduler_enabled      = true;
};

struct CleanupReport {
  std::size_t                        total_deleted = 0;
  std::map<std::string, std::size_t> by_collection;
};

struct CollectionReindexStatus {
  std::string stored_model;
  std::string stored_version;
  std::string current_model;
  std::string current_version;
  bool        needs_reindex = false;
};

struct ReindexStatus {
  bool                                           needs_reindex = false;
  std::map<std::string, CollectionReindexStatus> collections;
};

/*
  TTL sweeps and embedding-model drift for the facts, files and learnings
  collections.

  Expiry is judged on the stored created_at_unix; entries without one never
  expire. Expired entries are hard-deleted regardless of status.
*/
class LifecycleManager {
 public:
  LifecycleManager(std::shared_ptr<index::VectorIndex> index, std::shared_ptr<embedding::Embedder> embedder, LifecycleOptions options);

  std::uint32_t TtlDays(model::Collection collection) const;

  // Throws util::InvalidArgument for collections without a TTL.
  std::vector<std::string> GetExpiredIds(model::Collection collection, std::uint32_t ttl_days, util::TimePoint now = util::Now());

  std::map<std::string, std::size_t> GetExpiredCounts();

  // nullopt sweeps every knowledge collection.
  CleanupReport CleanupExpired(std::optional<model::Collection> collection = std::nullopt);

  ReindexStatus CheckReindexNeeded();

  /*
    Re-embeds every document of `collection` in place (ids and payloads
    kept) and stamps the collection with the current model. Without
    `force` it only runs when CheckReindexNeeded() flags the collection.
    Returns the number of documents re-embedded; throws util::IndexError.
  */
  std::size_t ReindexCollection(model::Collection collection, bool force = false);

  // Per-collection counts; a failing collection is logged and reported as 0.
  std::map<std::string, std::size_t> ReindexAll(bool force = false);

  const LifecycleOptions& Options() const {
    return options_;
  }

 private:
  std::shared_ptr<index::VectorIndex>  index_;
  std::shared_ptr<embedding::Embedder> embedder_;
  LifecycleOptions                     options_;
};

} // namespace engram::lifecycle
