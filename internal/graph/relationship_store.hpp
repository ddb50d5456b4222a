#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/index/api/vector_index.hpp"
#include "internal/model/relationship.hpp"

namespace engram::graph {

/*
  Edge storage seen by the graph engine. Reads and writes throw
  util::IndexError on backend failure.
*/
class RelationshipStore {
 public:
  virtual ~RelationshipStore() = default;

  virtual void Insert(const model::Relationship& edge, const std::vector<float>& embedding) = 0;

  virtual std::optional<model::Relationship> Get(const std::string& id) = 0;

  // false when the edge does not exist
  virtual bool Delete(const std::string& id) = 0;

  // Empty workspace/type match everything; limit 0 is unbounded.
  virtual std::vector<model::Relationship> List(const std::string& workspace_id, const std::string& type, std::size_t limit) = 0;

  // Edges with `node_id` at either end, each edge once. Empty type matches all.
  virtual std::vector<model::Relationship> Neighbors(const std::string& node_id, const std::string& type, std::size_t limit) = 0;
};

/*
  RelationshipStore over a VectorIndex collection. The index filters are
  conjunctions only, so Neighbors() runs one query per edge direction and
  merges the results.
*/
class IndexRelationshipStore final : public RelationshipStore {
 public:
  explicit IndexRelationshipStore(std::shared_ptr<index::VectorIndex> index);

  void                               Insert(const model::Relationship& edge, const std::vector<float>& embedding) override;
  std::optional<model::Relationship> Get(const std::string& id) override;
  bool                               Delete(const std::string& id) override;
  std::vector<model::Relationship>   List(const std::string& workspace_id, const std::string& type, std::size_t limit) override;
  std::vector<model::Relationship>   Neighbors(const std::string& node_id, const std::string& type, std::size_t limit) override;

 private:
  std::shared_ptr<index::VectorIndex> index_;
  std::string                         collection_;
};

} // namespace engram::graph
