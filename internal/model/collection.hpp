#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace engram::model {

enum class Collection : std::uint8_t {
  kFacts,
  kFiles,
  kLearnings,
  kAudit,
  kSkills,
  kGraph,
};

// Collections owned by the knowledge store; TTL and reindex apply to these.
inline constexpr std::array<Collection, 3> kKnowledgeCollections = {Collection::kFacts, Collection::kFiles, Collection::kLearnings};

inline constexpr std::array<Collection, 6> kAllCollections = {Collection::kFacts, Collection::kFiles,  Collection::kLearnings,
                                                              Collection::kAudit, Collection::kSkills, Collection::kGraph};

constexpr std::string_view CollectionName(Collection collection) {
  switch (collection) {
    case Collection::kFacts:
      return "facts";
    case Collection::kFiles:
      return "files";
    case Collection::kLearnings:
      return "learnings";
    case Collection::kAudit:
      return "audit_log";
    case Collection::kSkills:
      return "skills";
    case Collection::kGraph:
      return "knowledge_graph";
  }
  return "facts";
}

constexpr std::optional<Collection> ParseCollection(std::string_view name) {
  for (auto collection : kAllCollections) {
    if (CollectionName(collection) == name) return collection;
  }
  return std::nullopt;
}

} // namespace engram::model
