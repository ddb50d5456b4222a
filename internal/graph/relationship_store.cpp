#include "internal/graph/relationship_store.hpp"

#include <unordered_set>

#include "internal/index/collections.hpp"

namespace engram::graph {

IndexRelationshipStore::IndexRelationshipStore(std::shared_ptr<index::VectorIndex> index)
    : index_(std::move(index)), collection_(index::CollectionKey(model::Collection::kGraph)) {
}

void IndexRelationshipStore::Insert(const model::Relationship& edge, const std::vector<float>& embedding) {
  index::Record record;
  record.id       = edge.id;
  record.vector   = embedding;
  record.document = model::DescribeRelationship(edge);
  record.payload  = model::ToPayload(edge);

  index::ThrowIfIndexError(index_->Upsert(collection_, {record}), "insert relationship " + edge.id);
}

std::optional<model::Relationship> IndexRelationshipStore::Get(const std::string& id) {
  auto records = index_->Get(collection_, {id});
  if (records.empty()) return std::nullopt;
  return model::RelationshipFromRecord(records.front());
}

bool IndexRelationshipStore::Delete(const std::string& id) {
  if (index_->Get(collection_, {id}).empty()) return false;
  index::ThrowIfIndexError(index_->Delete(collection_, {id}), "delete relationship " + id);
  return true;
}

std::vector<model::Relationship> IndexRelationshipStore::List(const std::string& workspace_id, const std::string& type, std::size_t limit) {
  index::Filter filter;
  if (!workspace_id.empty()) filter.push_back({"workspace_id", workspace_id});
  if (!type.empty()) filter.push_back({"relationship_type", type});

  std::vector<model::Relationship> edges;
  for (const auto& record : index_->Find(collection_, filter, limit)) {
    edges.push_back(model::RelationshipFromRecord(record));
  }
  return edges;
}

std::vector<model::Relationship> IndexRelationshipStore::Neighbors(const std::string& node_id, const std::string& type, std::size_t limit) {
  std::vector<model::Relationship> edges;
  std::unordered_set<std::string>  seen;

  for (const char* end : {"source_id", "target_id"}) {
    index::Filter filter = {{end, node_id}};
    if (!type.empty()) filter.push_back({"relationship_type", type});

    for (const auto& record : index_->Find(collection_, filter, limit)) {
      if (!seen.insert(record.id).second) continue;
      edges.push_back(model::RelationshipFromRecord(record));
      if (limit != 0 && edges.size() >= limit) return edges;
    }
  }
  return edges;
}

} // namespace engram::graph
