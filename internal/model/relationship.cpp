#include "internal/model/relationship.hpp"

namespace engram::model {

namespace {

constexpr std::string_view kMetaPrefix = "meta_";

} // namespace

std::string DescribeRelationship(const Relationship& edge) {
  return edge.source_type + ":" + edge.source_id + " " + edge.relationship_type + " " + edge.target_type + ":" + edge.target_id;
}

index::Payload ToPayload(const Relationship& edge) {
  index::Payload payload;
  payload["source_id"]         = edge.source_id;
  payload["target_id"]         = edge.target_id;
  payload["relationship_type"] = edge.relationship_type;
  payload["source_type"]       = edge.source_type;
  payload["target_type"]       = edge.target_type;
  payload["workspace_id"]      = edge.workspace_id;
  payload["created_at"]        = edge.created_at;

  for (const auto& [key, value] : edge.metadata) {
    payload[std::string(kMetaPrefix) + key] = value;
  }
  return payload;
}

Relationship RelationshipFromRecord(const index::Record& record) {
  using index::StringOr;

  Relationship edge;
  edge.id                = record.id;
  edge.source_id         = StringOr(record.payload, "source_id");
  edge.target_id         = StringOr(record.payload, "target_id");
  edge.relationship_type = StringOr(record.payload, "relationship_type");
  edge.source_type       = StringOr(record.payload, "source_type", std::string(kDefaultNodeType));
  edge.target_type       = StringOr(record.payload, "target_type", std::string(kDefaultNodeType));
  edge.workspace_id      = StringOr(record.payload, "workspace_id");
  edge.created_at        = StringOr(record.payload, "created_at");

  for (const auto& [key, value] : record.payload) {
    if (key.compare(0, kMetaPrefix.size(), kMetaPrefix) == 0) {
      edge.metadata[key.substr(kMetaPrefix.size())] = value;
    }
  }
  return edge;
}

} // namespace engram::model
