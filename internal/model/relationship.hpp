#pragma once

#include <array>
#include <string>
#include <string_view>

#include "internal/index/api/payload.hpp"

namespace engram::model {

inline constexpr std::array<std::string_view, 5> kDefaultRelationshipTypes = {
    "relates_to", "contradicts", "depends_on", "supersedes", "derived_from",
};

inline constexpr std::string_view kContradictsType = "contradicts";
inline constexpr std::string_view kDefaultNodeType = "memory";

// Directed edge between two knowledge-graph nodes. Never versioned.
struct Relationship {
  std::string    id;
  std::string    source_id;
  std::string    target_id;
  std::string    relationship_type;
  std::string    source_type{kDefaultNodeType};
  std::string    target_type{kDefaultNodeType};
  index::Payload metadata;
  std::string    workspace_id;
  std::string    created_at;
};

// "{source_type}:{source_id} {type} {target_type}:{target_id}"
std::string DescribeRelationship(const Relationship& edge);

index::Payload ToPayload(const Relationship& edge);
Relationship   RelationshipFromRecord(const index::Record& record);

} // namespace engram::model
