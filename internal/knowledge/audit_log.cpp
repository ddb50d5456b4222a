#include "internal/knowledge/audit_log.hpp"

#include <algorithm>

#include "internal/index/collections.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace engram::knowledge {

using observability::StringField;

AuditLog::AuditLog(std::shared_ptr<index::VectorIndex> index)
    : index_(std::move(index)), collection_(index::CollectionKey(model::Collection::kAudit)) {
}

void AuditLog::Stage(index::WriteBatch& batch, model::AuditEvent event) const {
  if (event.id.empty()) event.id = util::NewId();
  if (event.created_at.empty()) {
    const auto now        = util::Now();
    event.created_at      = util::ToIso8601(now);
    event.created_at_unix = util::ToUnixSeconds(now);
  }

  index::Record record;
  record.id       = event.id;
  record.document = event.event_type + " " + event.entry_id;
  record.payload  = model::ToPayload(event);
  batch.Upsert(collection_, std::move(record));
}

std::vector<model::AuditEvent> AuditLog::List(std::size_t top_k, const std::string& workspace_id, const std::string& model_name) const {
  index::Filter filter;
  if (!workspace_id.empty()) filter.push_back({"workspace_id", workspace_id});
  if (!model_name.empty()) filter.push_back({"model_name", model_name});

  std::vector<model::AuditEvent> events;
  try {
    for (const auto& record : index_->Find(collection_, filter)) {
      events.push_back(model::AuditEventFromRecord(record));
    }
  } catch (const std::exception& e) {
    ENGRAM_LOG_WARN("audit listing failed", {StringField("error", e.what())});
    return {};
  }

  std::sort(events.begin(), events.end(), [](const model::AuditEvent& a, const model::AuditEvent& b) {
    return a.created_at > b.created_at;
  });
  if (top_k != 0 && events.size() > top_k) events.resize(top_k);
  return events;
}

} // namespace engram::knowledge
