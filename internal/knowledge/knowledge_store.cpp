#include "internal/knowledge/knowledge_store.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <unordered_set>

#include "internal/graph/graph_engine.hpp"
#include "internal/index/collections.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/observe.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace engram::knowledge {

using model::Collection;
using model::EntryStatus;
using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

std::string StatusValue(EntryStatus status) {
  return std::string(model::ToString(status));
}

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

ranking::RankSignals SignalsOf(const model::EntryMetadata& metadata) {
  ranking::RankSignals signals;
  signals.importance  = metadata.importance;
  signals.reliability = metadata.reliability;
  signals.frequency   = metadata.frequency;
  signals.priority    = metadata.priority;
  signals.created_at  = metadata.created_at;
  return signals;
}

} // namespace

KnowledgeStore::KnowledgeStore(StoreDependencies deps, StoreOptions options)
    : index_(std::move(deps.index)),
      embedder_(std::move(deps.embedder)),
      ranking_(std::move(deps.ranking)),
      detector_(std::move(deps.detector)),
      graph_(std::move(deps.graph)),
      metrics_(std::move(deps.metrics)),
      audit_(index_),
      options_(options) {
  if (!index_) throw std::invalid_argument("KnowledgeStore: index is null");
  if (!embedder_) throw std::invalid_argument("KnowledgeStore: embedder is null");
  if (!ranking_) ranking_ = std::make_shared<ranking::RankingEngine>();
  if (!detector_) detector_ = std::make_shared<ContradictionDetector>(index_, ContradictionOptions{});
  if (!metrics_) metrics_ = std::make_shared<observability::RetrievalMetrics>();
}

std::string KnowledgeStore::LearningKey(const std::string& workspace_id, const std::string& model_name, const std::string& category) {
  std::string key = model_name + "::" + category;
  if (!workspace_id.empty()) key = workspace_id + "::" + key;
  return key;
}

std::string KnowledgeStore::NormalizeCategory(const std::string& category) {
  const auto normalized = util::ToLower(util::Trim(category));
  if (normalized.empty()) return std::string(kDefaultCategory);
  if (std::find(kLearningCategories.begin(), kLearningCategories.end(), normalized) != kLearningCategories.end()) return normalized;

  ENGRAM_LOG_WARN("unknown learning category; storing as general", {StringField("category", category)});
  return std::string(kDefaultCategory);
}

std::shared_ptr<std::mutex> KnowledgeStore::KeyMutex(const std::string& learning_key) {
  std::lock_guard<std::mutex> lock(key_mutexes_guard_);
  auto&                       key_mutex = key_mutexes_[learning_key];
  if (!key_mutex) {
    key_mutex = std::make_shared<std::mutex>();
  }
  return key_mutex;
}

// ------------------------------------------------------------
// Writes
// ------------------------------------------------------------

std::string KnowledgeStore::AddFact(const std::string& text, model::EntryMetadata metadata) {
  return observability::ObserveOperation("store.add_fact", [&]() -> std::string {
    const auto clean = util::StripNul(text);
    if (util::IsBlank(clean) || clean.size() > options_.max_text_length) {
      ENGRAM_LOG_WARN("fact rejected", {IntField("length", static_cast<std::int64_t>(clean.size()))});
      return {};
    }
    model::ValidateMetadata(metadata);

    const auto now           = util::Now();
    metadata.status          = EntryStatus::kActive;
    metadata.version         = 1;
    metadata.created_at      = util::ToIso8601(now);
    metadata.created_at_unix = util::ToUnixSeconds(now);

    index::Record record;
    record.id       = util::NewId();
    record.vector   = embedder_->Encode(clean);
    record.document = clean;
    record.payload  = model::ToPayload(metadata);

    index::ThrowIfIndexError(index_->Upsert(index::CollectionKey(Collection::kFacts), {record}), "add fact");
    return record.id;
  });
}

std::string KnowledgeStore::AddFileChunk(const std::string& text, const FileChunkInput& input) {
  return observability::ObserveOperation("store.add_file_chunk", [&] {
    const auto clean     = util::StripNul(text);
    const auto file_name = util::Trim(input.file_name);
    if (util::IsBlank(clean)) throw util::InvalidArgument("file chunk text must not be blank");
    if (clean.size() > options_.max_text_length) {
      throw util::InvalidArgument("file chunk exceeds " + std::to_string(options_.max_text_length) + " bytes");
    }
    if (file_name.empty()) throw util::InvalidArgument("file_name must not be blank");

    auto metadata = input.metadata;
    model::ValidateMetadata(metadata);

    const auto now           = util::Now();
    metadata.workspace_id    = input.workspace_id;
    metadata.file_name       = file_name;
    metadata.file_id         = input.file_id.empty() ? util::NewId() : input.file_id;
    metadata.folder          = util::Trim(input.folder);
    metadata.chunk_index     = input.chunk_index;
    metadata.status          = EntryStatus::kActive;
    metadata.version         = 1;
    metadata.created_at      = util::ToIso8601(now);
    metadata.created_at_unix = util::ToUnixSeconds(now);
    if (metadata.priority.empty()) metadata.priority = metadata.pinned ? "pinned" : "normal";

    index::Record record;
    record.id       = util::NewId();
    record.vector   = embedder_->Encode(clean);
    record.document = clean;
    record.payload  = model::ToPayload(metadata);

    model::AuditEvent event;
    event.event_type   = "file_chunk_added";
    event.workspace_id = metadata.workspace_id;
    event.entry_id     = record.id;
    event.details      = {{"file_id", metadata.file_id}, {"file_name", metadata.file_name}};

    index::WriteBatch batch;
    batch.Upsert(index::CollectionKey(Collection::kFiles), record);
    audit_.Stage(batch, std::move(event));
    index::ThrowIfIndexError(index_->Apply(batch), "add file chunk");
    return record.id;
  });
}

std::optional<model::KnowledgeEntry> KnowledgeStore::FindActiveVersion(const std::string& learning_key) {
  const index::Filter filter = {{"learning_key", learning_key}, {"status", StatusValue(EntryStatus::kActive)}};

  std::optional<model::KnowledgeEntry> latest;
  for (const auto& record : index_->Find(index::CollectionKey(Collection::kLearnings), filter)) {
    auto entry = model::FromRecord(record);
    if (!latest || entry.metadata.version > latest->metadata.version) latest = std::move(entry);
  }
  return latest;
}

LearningWriteResult KnowledgeStore::AddLearning(const LearningInput& input) {
  return observability::ObserveOperation("store.add_learning", [&] {
    LearningWriteResult result;

    const auto text = util::StripNul(input.text);
    if (util::IsBlank(text) || text.size() > options_.max_text_length) {
      ENGRAM_LOG_WARN("learning rejected", {StringField("model", input.model_name), IntField("length", static_cast<std::int64_t>(text.size()))});
      return result;
    }
    if (util::IsBlank(input.model_name)) throw util::InvalidArgument("model_name is required for learnings");
    model::ValidateMetadata(input.metadata);

    const auto category = NormalizeCategory(input.category);
    const auto key      = LearningKey(input.workspace_id, input.model_name, category);
    const auto id       = util::NewId();
    const auto now      = util::Now();
    const auto now_iso  = util::ToIso8601(now);

    auto key_mutex = KeyMutex(key);
    {
      std::lock_guard<std::mutex> key_lock(*key_mutex);

      const auto current   = FindActiveVersion(key);
      const auto embedding = embedder_->Encode(text);

      DetectionRequest detection;
      detection.text         = text;
      detection.embedding    = &embedding;
      detection.model_name   = input.model_name;
      detection.workspace_id = input.workspace_id;
      detection.exclude_id   = current ? current->id : std::string();
      result.contradictions  = detector_->Detect(detection);

      auto metadata            = input.metadata;
      metadata.workspace_id    = input.workspace_id;
      metadata.model_name      = input.model_name;
      metadata.agent_name      = input.agent_name;
      metadata.category        = category;
      metadata.learning_key    = key;
      metadata.status          = EntryStatus::kActive;
      metadata.version         = current ? current->metadata.version + 1 : 1;
      metadata.created_at      = now_iso;
      metadata.created_at_unix = util::ToUnixSeconds(now);
      metadata.previous_version_id.clear();
      metadata.contradiction_ids.clear();
      metadata.conflict_detected = false;

      index::WriteBatch batch;
      if (current) {
        metadata.previous_version_id = current->id;
        metadata.conflict_detected   = util::NormalizeText(current->text) != util::NormalizeText(text);
        batch.MergePayload(index::CollectionKey(Collection::kLearnings), current->id,
                           {{"status", StatusValue(EntryStatus::kSuperseded)},
                            {"superseded_at", now_iso},
                            {"superseded_by", id},
                            {"updated_at", now_iso}});
      }
      for (const auto& contradiction : result.contradictions) metadata.contradiction_ids.push_back(contradiction.id);

      index::Record record;
      record.id       = id;
      record.vector   = embedding;
      record.document = text;
      record.payload  = model::ToPayload(metadata);
      batch.Upsert(index::CollectionKey(Collection::kLearnings), std::move(record));

      model::AuditEvent event;
      event.event_type   = current ? "learning_versioned" : "learning_added";
      event.model_name   = input.model_name;
      event.workspace_id = input.workspace_id;
      event.entry_id     = id;
      event.details      = {
          {"learning_key", key},
          {"version", std::to_string(metadata.version)},
          {"conflict_detected", metadata.conflict_detected ? "true" : "false"},
          {"contradictions", std::to_string(result.contradictions.size())},
      };
      if (current) event.details["previous_version_id"] = current->id;
      audit_.Stage(batch, std::move(event));

      index::ThrowIfIndexError(index_->Apply(batch), "add learning " + key);

      result.id                  = id;
      result.version             = metadata.version;
      result.learning_key        = key;
      result.conflict_detected   = metadata.conflict_detected;
      result.previous_version_id = metadata.previous_version_id;
    }

    ENGRAM_LOG_INFO("learning stored", {StringField("id", result.id), StringField("learning_key", key),
                                        IntField("version", result.version), BoolField("conflict", result.conflict_detected),
                                        IntField("contradictions", static_cast<std::int64_t>(result.contradictions.size()))});

    if (detector_->Options().link_in_graph) LinkContradictions(result.id, input.workspace_id, result.contradictions);
    return result;
  });
}

void KnowledgeStore::LinkContradictions(const std::string& id, const std::string& workspace_id,
                                        const std::vector<model::Contradiction>& contradictions) {
  if (!graph_) return;
  for (const auto& contradiction : contradictions) {
    try {
      graph_->CreateContradictionRelationship(id, contradiction.id, contradiction.similarity, workspace_id);
    } catch (const std::exception& e) {
      ENGRAM_LOG_WARN("failed to link contradiction in graph",
                      {StringField("id", id), StringField("contradicts", contradiction.id), StringField("error", e.what())});
    }
  }
}

std::size_t KnowledgeStore::DeleteModelLearnings(const std::string& model_name, const std::optional<std::string>& category,
                                                 const std::optional<std::string>& workspace_id) {
  return observability::ObserveOperation("store.delete_model_learnings", [&]() -> std::size_t {
    if (util::IsBlank(model_name)) throw util::InvalidArgument("model_name is required");

    index::Filter filter = {{"model_name", model_name}, {"status", StatusValue(EntryStatus::kActive)}};
    if (category) filter.push_back({"category", NormalizeCategory(*category)});
    if (workspace_id) filter.push_back({"workspace_id", *workspace_id});

    const auto collection = index::CollectionKey(Collection::kLearnings);
    const auto now_iso    = util::ToIso8601(util::Now());

    index::WriteBatch batch;
    std::size_t       deleted = 0;
    for (const auto& record : index_->Find(collection, filter)) {
      // already superseded or deleted entries are not recounted
      if (model::MetadataFromPayload(record.payload).status != EntryStatus::kActive) continue;
      batch.MergePayload(collection, record.id,
                         {{"status", StatusValue(EntryStatus::kDeleted)}, {"deleted_at", now_iso}, {"updated_at", now_iso}});
      ++deleted;
    }
    if (deleted == 0) return 0;

    model::AuditEvent event;
    event.event_type   = "learnings_deleted";
    event.model_name   = model_name;
    event.workspace_id = workspace_id.value_or("");
    event.details      = {{"count", std::to_string(deleted)}};
    if (category) event.details["category"] = *category;
    audit_.Stage(batch, std::move(event));

    index::ThrowIfIndexError(index_->Apply(batch), "delete learnings of " + model_name);
    ENGRAM_LOG_INFO("learnings deleted", {StringField("model", model_name), IntField("count", static_cast<std::int64_t>(deleted))});
    return deleted;
  });
}

std::size_t KnowledgeStore::ReconcileActiveVersions() {
  return observability::ObserveOperation("store.reconcile_versions", [&]() -> std::size_t {
    const auto collection = index::CollectionKey(Collection::kLearnings);

    std::map<std::string, std::vector<model::KnowledgeEntry>> by_key;
    for (const auto& record : index_->Find(collection, {{"status", StatusValue(EntryStatus::kActive)}})) {
      auto entry = model::FromRecord(record);
      if (entry.metadata.learning_key.empty()) continue;
      by_key[entry.metadata.learning_key].push_back(std::move(entry));
    }

    const auto        now_iso = util::ToIso8601(util::Now());
    index::WriteBatch batch;
    std::size_t       superseded = 0;

    for (auto& [key, entries] : by_key) {
      if (entries.size() < 2) continue;

      std::sort(entries.begin(), entries.end(), [](const model::KnowledgeEntry& a, const model::KnowledgeEntry& b) {
        if (a.metadata.version != b.metadata.version) return a.metadata.version > b.metadata.version;
        return a.metadata.created_at > b.metadata.created_at;
      });

      const auto& winner = entries.front();
      for (std::size_t i = 1; i < entries.size(); ++i) {
        batch.MergePayload(collection, entries[i].id,
                           {{"status", StatusValue(EntryStatus::kSuperseded)},
                            {"superseded_at", now_iso},
                            {"superseded_by", winner.id},
                            {"updated_at", now_iso}});
        ++superseded;
      }

      model::AuditEvent event;
      event.event_type   = "versions_reconciled";
      event.model_name   = winner.metadata.model_name;
      event.workspace_id = winner.metadata.workspace_id;
      event.entry_id     = winner.id;
      event.details      = {{"learning_key", key}, {"superseded", std::to_string(entries.size() - 1)}};
      audit_.Stage(batch, std::move(event));

      ENGRAM_LOG_WARN("several active versions for one learning key; keeping the newest",
                      {StringField("learning_key", key), StringField("kept", winner.id),
                       IntField("superseded", static_cast<std::int64_t>(entries.size() - 1))});
    }

    if (batch.Empty()) return 0;
    index::ThrowIfIndexError(index_->Apply(batch), "reconcile active versions");
    return superseded;
  });
}

// ------------------------------------------------------------
// Search
// ------------------------------------------------------------

std::vector<SearchResult> KnowledgeStore::SearchFacts(const SearchRequest& request) {
  std::vector<Collection> collections = {Collection::kFacts};
  if (request.include_files) collections.push_back(Collection::kFiles);
  return Search(request, collections, false);
}

std::vector<SearchResult> KnowledgeStore::SearchLearnings(const SearchRequest& request) {
  return Search(request, {Collection::kLearnings}, true);
}

std::vector<SearchResult> KnowledgeStore::QueryCollection(Collection collection, const SearchRequest& request, const std::vector<float>& vector,
                                                          bool learnings, std::size_t top_k) {
  index::Filter filter = {{"status", StatusValue(EntryStatus::kActive)}};
  if (!request.workspace_id.empty()) filter.push_back({"workspace_id", request.workspace_id});
  if (!request.agent_name.empty()) filter.push_back({"agent_name", request.agent_name});
  if (learnings && !request.model_name.empty()) filter.push_back({"model_name", request.model_name});
  if (!request.category.empty()) {
    filter.push_back({"category", learnings ? NormalizeCategory(request.category) : request.category});
  }

  std::vector<SearchResult> results;
  for (const auto& hit : index_->SimilarityQuery(index::CollectionKey(collection), vector, filter, top_k)) {
    auto metadata = model::MetadataFromPayload(hit.record.payload);
    if (metadata.status != EntryStatus::kActive) continue;

    const double similarity = std::max(0.0, 1.0 - hit.distance);
    const double keyword    = util::KeywordOverlap(request.query, hit.record.document);
    const double relevance  = ranking_->BlendRelevance(similarity, keyword);

    SearchResult result;
    result.id         = hit.record.id;
    result.text       = hit.record.document;
    result.source     = index::CollectionKey(collection);
    result.similarity = ranking::RoundScore(ranking::Clamp01(similarity));
    result.relevance  = relevance;
    result.score      = ranking_->BuildRankScore(relevance, SignalsOf(metadata));
    result.metadata   = std::move(metadata);
    results.push_back(std::move(result));
  }
  return results;
}

std::vector<SearchResult> KnowledgeStore::Search(const SearchRequest& request, const std::vector<Collection>& collections, bool learnings) {
  return observability::ObserveOperation(learnings ? "store.search_learnings" : "store.search_facts", [&] {
    if (request.query.size() > options_.max_query_length) {
      throw util::InvalidArgument("query exceeds " + std::to_string(options_.max_query_length) + " characters");
    }

    const auto started_at = std::chrono::steady_clock::now();
    const auto query      = util::StripNul(request.query);
    if (util::IsBlank(query)) {
      metrics_->RecordSearch(ElapsedMs(started_at), 0);
      return std::vector<SearchResult>{};
    }

    const std::size_t top_k = request.top_k.value_or(0) == 0 ? options_.default_top_k : *request.top_k;

    std::vector<SearchResult> merged;
    try {
      const auto vector = embedder_->Encode(query);
      for (auto collection : collections) {
        auto results = QueryCollection(collection, request, vector, learnings, top_k);
        merged.insert(merged.end(), std::make_move_iterator(results.begin()), std::make_move_iterator(results.end()));
      }
    } catch (const util::IndexError& e) {
      ENGRAM_LOG_WARN("search failed; returning no results",
                      {StringField("query", query.substr(0, 64)), StringField("model", request.model_name), StringField("error", e.what())});
      metrics_->RecordError(ElapsedMs(started_at));
      return std::vector<SearchResult>{};
    }

    if (request.min_priority && !util::IsBlank(*request.min_priority)) {
      const double floor = ranking::RankingEngine::ResolvePriorityScore(*request.min_priority);
      merged.erase(std::remove_if(merged.begin(), merged.end(),
                                  [&](const SearchResult& r) {
                                    return ranking::RankingEngine::ResolvePriorityScore(r.metadata.priority) < floor;
                                  }),
                   merged.end());
    }

    std::stable_sort(merged.begin(), merged.end(), [](const SearchResult& a, const SearchResult& b) { return a.score > b.score; });

    std::unordered_set<std::string> seen_texts;
    std::vector<SearchResult>       results;
    for (auto& result : merged) {
      if (!seen_texts.insert(result.text).second) continue;
      results.push_back(std::move(result));
    }

    metrics_->RecordSearch(ElapsedMs(started_at), results.size());
    return results;
  });
}

// ------------------------------------------------------------
// Listing
// ------------------------------------------------------------

std::vector<model::KnowledgeEntry> KnowledgeStore::ListVersions(const std::string& model_name, const std::optional<std::string>& category,
                                                                const std::optional<std::string>& workspace_id) {
  index::Filter filter = {{"model_name", model_name}};
  if (category) filter.push_back({"category", NormalizeCategory(*category)});
  if (workspace_id) filter.push_back({"workspace_id", *workspace_id});

  auto entries = ListEntries(Collection::kLearnings, filter);
  std::sort(entries.begin(), entries.end(), [](const model::KnowledgeEntry& a, const model::KnowledgeEntry& b) {
    if (a.metadata.learning_key != b.metadata.learning_key) return a.metadata.learning_key < b.metadata.learning_key;
    return a.metadata.version < b.metadata.version;
  });
  return entries;
}

std::optional<model::KnowledgeEntry> KnowledgeStore::GetEntry(Collection collection, const std::string& id) {
  if (std::find(model::kKnowledgeCollections.begin(), model::kKnowledgeCollections.end(), collection) == model::kKnowledgeCollections.end()) {
    throw util::InvalidArgument("not a knowledge collection: " + index::CollectionKey(collection));
  }
  try {
    auto records = index_->Get(index::CollectionKey(collection), {id});
    if (!records.empty()) return model::FromRecord(records.front());
  } catch (const util::IndexError& e) {
    ENGRAM_LOG_WARN("entry lookup failed", {StringField("collection", index::CollectionKey(collection)), StringField("id", id),
                                            StringField("error", e.what())});
  }
  return std::nullopt;
}

std::vector<model::KnowledgeEntry> KnowledgeStore::ListEntries(Collection collection, const index::Filter& filter, std::size_t limit) {
  if (std::find(model::kKnowledgeCollections.begin(), model::kKnowledgeCollections.end(), collection) == model::kKnowledgeCollections.end()) {
    throw util::InvalidArgument("not a knowledge collection: " + index::CollectionKey(collection));
  }
  std::vector<model::KnowledgeEntry> entries;
  try {
    for (const auto& record : index_->Find(index::CollectionKey(collection), filter, limit)) {
      entries.push_back(model::FromRecord(record));
    }
  } catch (const util::IndexError& e) {
    ENGRAM_LOG_WARN("entry listing failed", {StringField("collection", index::CollectionKey(collection)), StringField("error", e.what())});
    return {};
  }
  return entries;
}

} // namespace engram::knowledge
