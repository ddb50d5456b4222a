#include "internal/model/knowledge_entry.hpp"

#include <cmath>

#include "internal/util/errors.hpp"
#include "internal/util/string_list.hpp"

namespace engram::model {

namespace {

constexpr char kExtensionPrefix[] = "ext.";

void ValidateScalar(const char* name, const std::optional<double>& value) {
  if (!value) return;
  if (!std::isfinite(*value) || *value < 0.0 || *value > 1.0) {
    throw util::InvalidArgument(std::string(name) + " must be within [0, 1]");
  }
}

void PutString(index::Payload& payload, const char* key, const std::string& value) {
  if (!value.empty()) payload[key] = value;
}

void PutNumber(index::Payload& payload, const char* key, const std::optional<double>& value) {
  if (value) payload[key] = *value;
}

std::optional<double> NumberOrEmpty(const index::Payload& payload, const char* key) {
  auto value = index::GetNumber(payload, key);
  if (value && !std::isfinite(*value)) return std::nullopt;
  return value;
}

} // namespace

void ValidateMetadata(const EntryMetadata& metadata) {
  ValidateScalar("importance", metadata.importance);
  ValidateScalar("reliability", metadata.reliability);
  ValidateScalar("frequency", metadata.frequency);

  if (metadata.extensions.size() > kMaxExtensionFields) {
    throw util::InvalidArgument("too many metadata extension fields (max " + std::to_string(kMaxExtensionFields) + ")");
  }
  for (const auto& [key, value] : metadata.extensions) {
    if (key.empty() || key.size() > kMaxExtensionKeyBytes) {
      throw util::InvalidArgument("metadata extension key must be 1.." + std::to_string(kMaxExtensionKeyBytes) + " bytes");
    }
    if (value.size() > kMaxExtensionValueBytes) {
      throw util::InvalidArgument("metadata extension '" + key + "' exceeds " + std::to_string(kMaxExtensionValueBytes) + " bytes");
    }
  }
}

index::Payload ToPayload(const EntryMetadata& m) {
  index::Payload payload;

  // always present so equality filters on them work for every entry
  payload["workspace_id"]    = m.workspace_id;
  payload["status"]          = std::string(ToString(m.status));
  payload["version"]         = static_cast<std::int64_t>(m.version);
  payload["created_at"]      = m.created_at;
  payload["created_at_unix"] = m.created_at_unix;

  PutString(payload, "agent_name", m.agent_name);
  PutString(payload, "model_name", m.model_name);
  PutString(payload, "category", m.category);
  PutString(payload, "source", m.source);
  PutString(payload, "learning_key", m.learning_key);
  PutString(payload, "priority", m.priority);
  PutNumber(payload, "importance", m.importance);
  PutNumber(payload, "reliability", m.reliability);
  PutNumber(payload, "frequency", m.frequency);
  PutString(payload, "updated_at", m.updated_at);

  PutString(payload, "file_id", m.file_id);
  PutString(payload, "file_name", m.file_name);
  if (!m.file_id.empty() || !m.file_name.empty()) {
    payload["folder"] = m.folder;
    payload["pinned"] = m.pinned;
  }
  if (m.chunk_index) payload["chunk_index"] = *m.chunk_index;

  PutString(payload, "previous_version_id", m.previous_version_id);
  PutString(payload, "superseded_by", m.superseded_by);
  PutString(payload, "superseded_at", m.superseded_at);
  PutString(payload, "deleted_at", m.deleted_at);

  if (m.conflict_detected) payload["conflict_detected"] = true;
  if (!m.contradiction_ids.empty()) {
    payload["contradiction_ids"]   = util::EncodeStringList(m.contradiction_ids);
    payload["contradiction_count"] = static_cast<std::int64_t>(m.contradiction_ids.size());
  }

  for (const auto& [key, value] : m.extensions) {
    payload[kExtensionPrefix + key] = value;
  }
  return payload;
}

EntryMetadata MetadataFromPayload(const index::Payload& payload) {
  using index::GetBool;
  using index::GetInt;
  using index::StringOr;

  EntryMetadata m;
  m.workspace_id = StringOr(payload, "workspace_id");
  m.agent_name   = StringOr(payload, "agent_name");
  m.model_name   = StringOr(payload, "model_name");
  m.category     = StringOr(payload, "category");
  m.source       = StringOr(payload, "source");

  // entries written before status existed count as active
  m.status       = ParseStatus(StringOr(payload, "status")).value_or(EntryStatus::kActive);
  m.version      = static_cast<std::uint32_t>(GetInt(payload, "version").value_or(1));
  m.learning_key = StringOr(payload, "learning_key");

  m.priority    = StringOr(payload, "priority");
  m.importance  = NumberOrEmpty(payload, "importance");
  m.reliability = NumberOrEmpty(payload, "reliability");
  m.frequency   = NumberOrEmpty(payload, "frequency");

  m.created_at      = StringOr(payload, "created_at");
  m.created_at_unix = GetInt(payload, "created_at_unix").value_or(0);
  m.updated_at      = StringOr(payload, "updated_at");

  m.file_id     = StringOr(payload, "file_id");
  m.file_name   = StringOr(payload, "file_name");
  m.folder      = StringOr(payload, "folder");
  m.chunk_index = GetInt(payload, "chunk_index");
  m.pinned      = GetBool(payload, "pinned").value_or(false);

  m.previous_version_id = StringOr(payload, "previous_version_id");
  m.superseded_by       = StringOr(payload, "superseded_by");
  m.superseded_at       = StringOr(payload, "superseded_at");
  m.deleted_at          = StringOr(payload, "deleted_at");

  m.conflict_detected = GetBool(payload, "conflict_detected").value_or(false);
  if (auto ids = index::GetString(payload, "contradiction_ids")) {
    m.contradiction_ids = util::DecodeStringList(*ids);
  }

  const std::string prefix = kExtensionPrefix;
  for (const auto& [key, value] : payload) {
    if (key.compare(0, prefix.size(), prefix) != 0) continue;
    if (const auto* s = std::get_if<std::string>(&value)) {
      m.extensions[key.substr(prefix.size())] = *s;
    }
  }
  return m;
}

KnowledgeEntry FromRecord(const index::Record& record) {
  KnowledgeEntry entry;
  entry.id        = record.id;
  entry.text      = record.document;
  entry.embedding = record.vector;
  entry.metadata  = MetadataFromPayload(record.payload);
  return entry;
}

} // namespace engram::model
