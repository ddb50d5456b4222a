#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/embedding/embedder.hpp"
#include "internal/graph/relationship_store.hpp"
#include "internal/model/relationship.hpp"

namespace engram::graph {

struct GraphOptions {
  std::uint32_t            max_depth         = 3;
  std::size_t              max_neighbors     = 100;
  std::size_t              default_max_nodes = 50;
  std::vector<std::string> relationship_types{model::kDefaultRelationshipTypes.begin(), model::kDefaultRelationshipTypes.end()};
};

struct RelationshipRequest {
  std::string    source_id;
  std::string    target_id;
  std::string    relationship_type;
  std::string    source_type{model::kDefaultNodeType};
  std::string    target_type{model::kDefaultNodeType};
  index::Payload metadata;
  std::string    workspace_id;
};

struct CreateRelationshipResult {
  std::string id;
  std::string status;
};

struct TraversalNode {
  std::string                      node_id;
  std::uint32_t                    depth = 0;
  std::vector<model::Relationship> relationships;
};

struct TraversalResult {
  std::string                start_node_id;
  std::vector<TraversalNode> nodes;
  std::size_t                total_relationships = 0;
  std::uint32_t              max_depth_reached   = 0;
};

/*
  Typed relationship graph over the knowledge_graph collection.

  Writes validate the edge type against the configured set and reject
  self loops. Reads (neighbors, listing, traversal) are best effort: a
  backend failure is logged and yields an empty answer.

  Traverse() is a bounded BFS. Each node id is visited at most once, so
  cycles terminate, and the result never exceeds max_nodes entries or the
  configured depth ceiling.
*/
class GraphEngine {
 public:
  GraphEngine(std::shared_ptr<RelationshipStore> store, std::shared_ptr<embedding::Embedder> embedder, GraphOptions options);

  // Throws util::InvalidRelationshipType, util::SelfLoop, util::InvalidArgument, util::IndexError.
  CreateRelationshipResult CreateRelationship(const RelationshipRequest& request);

  // "contradicts" edge new_id -> existing_id carrying the similarity.
  CreateRelationshipResult CreateContradictionRelationship(const std::string& new_id, const std::string& existing_id, double similarity,
                                                           const std::string& workspace_id = {});

  std::optional<model::Relationship> GetRelationship(const std::string& id);

  bool DeleteRelationship(const std::string& id);

  // limit 0 uses max_neighbors
  std::vector<model::Relationship> ListRelationships(const std::string& workspace_id = {}, const std::string& type = {},
                                                     std::size_t limit = 0);

  std::vector<model::Relationship> GetNeighbors(const std::string& node_id, const std::string& type = {},
                                                std::optional<std::size_t> max_results = std::nullopt);

  TraversalResult Traverse(const std::string& start_node_id, std::optional<std::uint32_t> max_depth = std::nullopt,
                           const std::vector<std::string>& types = {}, std::optional<std::size_t> max_nodes = std::nullopt);

  bool IsAllowedType(const std::string& type) const;

  const GraphOptions& Options() const {
    return options_;
  }

 private:
  std::vector<model::Relationship> NeighborsForTraversal(const std::string& node_id, const std::vector<std::string>& types);

  std::shared_ptr<RelationshipStore>   store_;
  std::shared_ptr<embedding::Embedder> embedder_;
  GraphOptions                         options_;
};

} // namespace engram::graph
