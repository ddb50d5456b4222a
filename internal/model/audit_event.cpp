#include "internal/model/audit_event.hpp"

namespace engram::model {

namespace {

constexpr std::string_view kDetailPrefix = "detail.";

} // namespace

index::Payload ToPayload(const AuditEvent& event) {
  index::Payload payload;
  payload["event_type"]      = event.event_type;
  payload["model_name"]      = event.model_name;
  payload["workspace_id"]    = event.workspace_id;
  payload["entry_id"]        = event.entry_id;
  payload["created_at"]      = event.created_at;
  payload["created_at_unix"] = event.created_at_unix;
  for (const auto& [key, value] : event.details) {
    payload[std::string(kDetailPrefix) + key] = value;
  }
  return payload;
}

AuditEvent AuditEventFromRecord(const index::Record& record) {
  using index::StringOr;

  AuditEvent event;
  event.id              = record.id;
  event.event_type      = StringOr(record.payload, "event_type");
  event.model_name      = StringOr(record.payload, "model_name");
  event.workspace_id    = StringOr(record.payload, "workspace_id");
  event.entry_id        = StringOr(record.payload, "entry_id");
  event.created_at      = StringOr(record.payload, "created_at");
  event.created_at_unix = index::GetInt(record.payload, "created_at_unix").value_or(0);

  for (const auto& [key, value] : record.payload) {
    if (key.compare(0, kDetailPrefix.size(), kDetailPrefix) != 0) continue;
    if (const auto* s = std::get_if<std::string>(&value)) {
      event.details[key.substr(kDetailPrefix.size())] = *s;
    }
  }
  return event;
}

} // namespace engram::model
