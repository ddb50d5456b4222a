#include <algorithm>
#include <map>

#include "internal/index/collections.hpp"
#include "internal/knowledge/knowledge_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/observe.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"
#include "internal/util/time.hpp"

/*
  File management for the knowledge store.

  Chunks of one file share a file_id. Every operation here rewrites chunk
  metadata only; text and vectors stay as they were written.
*/

namespace engram::knowledge {

using model::Collection;
using model::EntryStatus;
using observability::IntField;
using observability::StringField;

namespace {

std::string StatusValue(EntryStatus status) {
  return std::string(model::ToString(status));
}

} // namespace

std::vector<FileSummary> KnowledgeStore::ListFiles(const std::string& workspace_id, bool include_deleted) {
  index::Filter filter;
  if (!workspace_id.empty()) filter.push_back({"workspace_id", workspace_id});

  std::map<std::string, FileSummary> files;
  for (const auto& entry : ListEntries(Collection::kFiles, filter)) {
    const auto& m = entry.metadata;
    if (m.status == EntryStatus::kDeleted && !include_deleted) continue;
    if (m.status == EntryStatus::kSuperseded) continue;

    const auto& key     = m.file_id.empty() ? m.file_name : m.file_id;
    auto [it, inserted] = files.try_emplace(key);
    auto& summary       = it->second;
    if (inserted) {
      summary.file_id      = m.file_id;
      summary.file_name    = m.file_name;
      summary.folder       = m.folder;
      summary.workspace_id = m.workspace_id;
      summary.status       = StatusValue(m.status);
      summary.created_at   = m.created_at;
    }
    // a file counts as active while any chunk is
    if (m.status == EntryStatus::kActive) summary.status = StatusValue(EntryStatus::kActive);
    summary.pinned = summary.pinned || m.pinned;
    if (!m.created_at.empty() && (summary.created_at.empty() || m.created_at < summary.created_at)) summary.created_at = m.created_at;
    ++summary.chunk_count;
  }

  std::vector<FileSummary> summaries;
  summaries.reserve(files.size());
  for (auto& [_, summary] : files) summaries.push_back(std::move(summary));

  std::sort(summaries.begin(), summaries.end(), [](const FileSummary& a, const FileSummary& b) {
    if (a.file_name != b.file_name) return a.file_name < b.file_name;
    return a.file_id < b.file_id;
  });
  return summaries;
}

std::size_t KnowledgeStore::RewriteFileChunks(const std::string& file_id, const std::string& event_type, const PatchFn& patch,
                                              std::map<std::string, std::string> details) {
  return observability::ObserveOperation("store." + event_type, [&]() -> std::size_t {
    if (util::IsBlank(file_id)) throw util::InvalidArgument("file_id must not be blank");

    const auto collection = index::CollectionKey(Collection::kFiles);
    const auto now_iso    = util::ToIso8601(util::Now());

    index::WriteBatch batch;
    model::AuditEvent event;
    std::size_t       changed = 0;
    for (const auto& record : index_->Find(collection, {{"file_id", file_id}})) {
      const auto     metadata = model::MetadataFromPayload(record.payload);
      index::Payload fields;
      if (!patch(metadata, now_iso, fields)) continue;
      fields["updated_at"] = now_iso;
      batch.MergePayload(collection, record.id, std::move(fields));
      if (changed++ == 0) {
        event.workspace_id = metadata.workspace_id;
        event.model_name   = metadata.model_name;
      }
    }
    if (changed == 0) return 0;

    event.event_type = event_type;
    event.entry_id   = file_id;
    event.details    = std::move(details);
    event.details["file_id"] = file_id;
    event.details["chunks"]  = std::to_string(changed);
    audit_.Stage(batch, std::move(event));

    index::ThrowIfIndexError(index_->Apply(batch), event_type + " " + file_id);
    ENGRAM_LOG_INFO("file updated", {StringField("operation", event_type), StringField("file_id", file_id),
                                     IntField("chunks", static_cast<std::int64_t>(changed))});
    return changed;
  });
}

std::size_t KnowledgeStore::SoftDeleteFile(const std::string& file_id) {
  return RewriteFileChunks(file_id, "file_soft_deleted", [](const model::EntryMetadata& m, const std::string& now, index::Payload& patch) {
    if (m.status != EntryStatus::kActive) return false;
    patch["status"]     = StatusValue(EntryStatus::kDeleted);
    patch["deleted_at"] = now;
    return true;
  });
}

std::size_t KnowledgeStore::RestoreFile(const std::string& file_id) {
  return RewriteFileChunks(file_id, "file_restored", [](const model::EntryMetadata& m, const std::string&, index::Payload& patch) {
    if (!model::CanRestore(m.status)) return false;
    patch["status"]     = StatusValue(EntryStatus::kActive);
    patch["deleted_at"] = std::string();
    return true;
  });
}

std::size_t KnowledgeStore::PinFile(const std::string& file_id, bool pinned) {
  return RewriteFileChunks(
      file_id, pinned ? "file_pinned" : "file_unpinned",
      [pinned](const model::EntryMetadata& m, const std::string&, index::Payload& patch) {
        if (m.status != EntryStatus::kActive) return false;
        patch["pinned"]   = pinned;
        patch["priority"] = std::string(pinned ? "pinned" : "normal");
        return true;
      });
}

std::size_t KnowledgeStore::MoveFile(const std::string& file_id, const std::string& folder) {
  const auto target = util::Trim(folder);
  return RewriteFileChunks(
      file_id, "file_moved",
      [&target](const model::EntryMetadata& m, const std::string&, index::Payload& patch) {
        if (m.status == EntryStatus::kSuperseded) return false;
        patch["folder"] = target;
        return true;
      },
      {{"folder", target}});
}

std::size_t KnowledgeStore::RenameFile(const std::string& file_id, const std::string& new_name) {
  const auto name = util::Trim(new_name);
  if (name.empty()) {
    ENGRAM_LOG_WARN("rename ignored: blank file name", {StringField("file_id", file_id)});
    return 0;
  }
  return RewriteFileChunks(
      file_id, "file_renamed",
      [&name](const model::EntryMetadata& m, const std::string&, index::Payload& patch) {
        if (m.status == EntryStatus::kSuperseded) return false;
        patch["file_name"] = name;
        return true;
      },
      {{"file_name", name}});
}

std::size_t KnowledgeStore::HardDeleteFileChunks(const index::Filter& filter, const std::string& event_type, const std::string& subject) {
  return observability::ObserveOperation("store." + event_type, [&]() -> std::size_t {
    const auto collection = index::CollectionKey(Collection::kFiles);

    index::WriteBatch batch;
    model::AuditEvent event;
    std::size_t       removed = 0;
    for (const auto& record : index_->Find(collection, filter)) {
      batch.Delete(collection, record.id);
      if (removed++ == 0) {
        const auto metadata = model::MetadataFromPayload(record.payload);
        event.workspace_id  = metadata.workspace_id;
        event.model_name    = metadata.model_name;
      }
    }
    if (removed == 0) return 0;

    event.event_type = event_type;
    event.details    = {{"subject", subject}, {"chunks", std::to_string(removed)}};
    audit_.Stage(batch, std::move(event));

    index::ThrowIfIndexError(index_->Apply(batch), event_type + " " + subject);
    ENGRAM_LOG_INFO("file deleted", {StringField("subject", subject), IntField("chunks", static_cast<std::int64_t>(removed))});
    return removed;
  });
}

std::size_t KnowledgeStore::DeleteFile(const std::string& file_id) {
  if (util::IsBlank(file_id)) throw util::InvalidArgument("file_id must not be blank");
  return HardDeleteFileChunks({{"file_id", file_id}}, "file_deleted", file_id);
}

std::size_t KnowledgeStore::DeleteFileByName(const std::string& file_name, const std::string& workspace_id) {
  const auto name = util::Trim(file_name);
  if (name.empty()) throw util::InvalidArgument("file_name must not be blank");

  index::Filter filter = {{"file_name", name}};
  if (!workspace_id.empty()) filter.push_back({"workspace_id", workspace_id});
  return HardDeleteFileChunks(filter, "file_deleted", name);
}

} // namespace engram::knowledge
