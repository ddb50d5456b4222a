#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/embedding/embedder.hpp"
#include "internal/index/api/vector_index.hpp"
#include "internal/knowledge/audit_log.hpp"
#include "internal/knowledge/contradiction_detector.hpp"
#include "internal/model/collection.hpp"
#include "internal/model/knowledge_entry.hpp"
#include "internal/observability/retrieval_metrics.hpp"
#include "internal/ranking/ranking_engine.hpp"

namespace engram::graph {
class GraphEngine;
}

namespace engram::knowledge {

inline constexpr std::array<std::string_view, 5> kLearningCategories = {"general", "preference", "fact", "skill", "correction"};
inline constexpr std::string_view                kDefaultCategory    = "general";

struct StoreOptions {
  std::size_t default_top_k    = 5;
  std::size_t max_text_length  = 10 * 1024 * 1024;
  std::size_t max_query_length = 5000;
};

/*
  Dependency container for KnowledgeStore.
  `graph` is optional and only used to link detected contradictions.
*/
struct StoreDependencies {
  std::shared_ptr<index::VectorIndex>               index;
  std::shared_ptr<embedding::Embedder>              embedder;
  std::shared_ptr<ranking::RankingEngine>           ranking;
  std::shared_ptr<ContradictionDetector>            detector;
  std::shared_ptr<graph::GraphEngine>               graph;
  std::shared_ptr<observability::RetrievalMetrics> metrics;
};

struct FileChunkInput {
  std::string                 file_name;
  std::string                 file_id; // generated when empty
  std::optional<std::int64_t> chunk_index;
  std::string                 folder;
  std::string                 workspace_id;
  model::EntryMetadata        metadata;
};

struct LearningInput {
  std::string          text;
  std::string          model_name;
  std::string          agent_name;
  std::string          category{kDefaultCategory};
  std::string          workspace_id;
  model::EntryMetadata metadata;
};

struct LearningWriteResult {
  std::string                       id; // empty when the text was rejected
  std::uint32_t                     version = 0;
  std::string                       learning_key;
  bool                              conflict_detected = false;
  std::string                       previous_version_id;
  std::vector<model::Contradiction> contradictions;
};

struct SearchRequest {
  std::string                query;
  std::optional<std::size_t> top_k;
  std::string                workspace_id;
  std::string                agent_name;
  std::string                model_name;
  std::string                category;
  bool                       include_files = true; // facts search only
  std::optional<std::string> min_priority;
};

struct SearchResult {
  std::string          id;
  std::string          text;
  std::string          source; // collection name
  double               similarity = 0.0;
  double               relevance  = 0.0;
  double               score      = 0.0;
  model::EntryMetadata metadata;
};

struct FileSummary {
  std::string file_id;
  std::string file_name;
  std::string folder;
  std::string workspace_id;
  std::string status;
  bool        pinned      = false;
  std::size_t chunk_count = 0;
  std::string created_at;
};

struct CollectionStats {
  std::size_t facts     = 0;
  std::size_t files     = 0;
  std::size_t learnings = 0;
};

struct LearningStats {
  std::size_t                        total_active = 0;
  std::map<std::string, std::size_t> by_model;
  std::map<std::string, std::size_t> by_category;
};

struct EmbeddingStatus {
  std::string                        model;
  std::string                        version;
  std::size_t                        vector_size = 0;
  std::string                        status; // "ready" | "reindex_required"
  std::map<std::string, std::size_t> collections;
};

/*
  KnowledgeStore

  Owns facts, file chunks and learnings. Embeds on write, ranks on read,
  versions learnings per learning_key and keeps an audit trail.

  VERSIONING:

  - the supersede of the previous version, the insert of the new one and
    the audit event go to the index as one WriteBatch
  - writers to the same learning_key in this process are serialized
  - ReconcileActiveVersions() repairs keys left with several active
    versions by writers outside this process

  Read paths (search, listing, stats) log backend failures and return
  empty answers. Write paths throw util::IndexError.
*/
class KnowledgeStore {
 public:
  KnowledgeStore(StoreDependencies deps, StoreOptions options);

  // ---------------------------------------------------------------------
  // Writes
  // ---------------------------------------------------------------------

  // Returns "" for blank or oversized text.
  std::string AddFact(const std::string& text, model::EntryMetadata metadata = {});

  // Throws util::InvalidArgument for blank text or file name.
  std::string AddFileChunk(const std::string& text, const FileChunkInput& input);

  // Returns a result with an empty id for blank or oversized text.
  LearningWriteResult AddLearning(const LearningInput& input);

  // Soft-deletes active learnings of `model_name`. Returns how many changed state.
  std::size_t DeleteModelLearnings(const std::string& model_name, const std::optional<std::string>& category = std::nullopt,
                                   const std::optional<std::string>& workspace_id = std::nullopt);

  // Supersedes all but the newest active version of every learning_key. Returns entries changed.
  std::size_t ReconcileActiveVersions();

  // ---------------------------------------------------------------------
  // Reads
  // ---------------------------------------------------------------------

  std::vector<SearchResult> SearchFacts(const SearchRequest& request);
  std::vector<SearchResult> SearchLearnings(const SearchRequest& request);

  // Every version of the model's learnings, ordered by learning_key then version.
  std::vector<model::KnowledgeEntry> ListVersions(const std::string& model_name, const std::optional<std::string>& category = std::nullopt,
                                                  const std::optional<std::string>& workspace_id = std::nullopt);

  std::optional<model::KnowledgeEntry> GetEntry(model::Collection collection, const std::string& id);
  std::vector<model::KnowledgeEntry>   ListEntries(model::Collection collection, const index::Filter& filter = {}, std::size_t limit = 0);

  // ---------------------------------------------------------------------
  // Files (knowledge_files.cpp)
  // ---------------------------------------------------------------------

  std::vector<FileSummary> ListFiles(const std::string& workspace_id = {}, bool include_deleted = false);

  std::size_t SoftDeleteFile(const std::string& file_id);
  std::size_t RestoreFile(const std::string& file_id);
  std::size_t PinFile(const std::string& file_id, bool pinned = true);
  std::size_t MoveFile(const std::string& file_id, const std::string& folder);
  std::size_t RenameFile(const std::string& file_id, const std::string& new_name);

  // Hard deletes, any status.
  std::size_t DeleteFile(const std::string& file_id);
  std::size_t DeleteFileByName(const std::string& file_name, const std::string& workspace_id = {});

  // ---------------------------------------------------------------------
  // Stats (knowledge_stats.cpp)
  // ---------------------------------------------------------------------

  CollectionStats                         GetCollectionStats();
  LearningStats                           GetLearningStats(const std::string& workspace_id = {});
  EmbeddingStatus                         GetEmbeddingStatus();
  observability::RetrievalMetricsSnapshot GetRetrievalMetrics() const;
  std::vector<model::AuditEvent>          ListAuditLogs(std::size_t top_k = 50, const std::string& workspace_id = {},
                                                        const std::string& model_name = {}) const;

  static std::string LearningKey(const std::string& workspace_id, const std::string& model_name, const std::string& category);
  static std::string NormalizeCategory(const std::string& category);

 private:
  std::vector<SearchResult> Search(const SearchRequest& request, const std::vector<model::Collection>& collections, bool learnings);
  std::vector<SearchResult> QueryCollection(model::Collection collection, const SearchRequest& request, const std::vector<float>& vector,
                                            bool learnings, std::size_t top_k);

  std::optional<model::KnowledgeEntry> FindActiveVersion(const std::string& learning_key);
  void                                 LinkContradictions(const std::string& id, const std::string& workspace_id,
                                                          const std::vector<model::Contradiction>& contradictions);

  // Fills `patch` for one chunk; returning false leaves the chunk untouched.
  using PatchFn = std::function<bool(const model::EntryMetadata& current, const std::string& now, index::Payload& patch)>;

  std::size_t RewriteFileChunks(const std::string& file_id, const std::string& event_type, const PatchFn& patch,
                                std::map<std::string, std::string> details = {});
  std::size_t HardDeleteFileChunks(const index::Filter& filter, const std::string& event_type, const std::string& subject);

  std::shared_ptr<std::mutex> KeyMutex(const std::string& learning_key);

  std::shared_ptr<index::VectorIndex>               index_;
  std::shared_ptr<embedding::Embedder>              embedder_;
  std::shared_ptr<ranking::RankingEngine>           ranking_;
  std::shared_ptr<ContradictionDetector>            detector_;
  std::shared_ptr<graph::GraphEngine>               graph_;
  std::shared_ptr<observability::RetrievalMetrics> metrics_;
  AuditLog                                          audit_;
  StoreOptions                                      options_;

  std::mutex                                                   key_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> key_mutexes_;
};

} // namespace engram::knowledge
