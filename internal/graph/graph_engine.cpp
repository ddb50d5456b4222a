#include "internal/graph/graph_engine.hpp"

#include <algorithm>
#include <deque>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/observe.hpp"
#include "internal/ranking/ranking_engine.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace engram::graph {

using observability::IntField;
using observability::StringField;

GraphEngine::GraphEngine(std::shared_ptr<RelationshipStore> store, std::shared_ptr<embedding::Embedder> embedder, GraphOptions options)
    : store_(std::move(store)), embedder_(std::move(embedder)), options_(std::move(options)) {
  if (!store_) throw std::invalid_argument("GraphEngine: relationship store is null");
  if (!embedder_) throw std::invalid_argument("GraphEngine: embedder is null");
}

bool GraphEngine::IsAllowedType(const std::string& type) const {
  return std::find(options_.relationship_types.begin(), options_.relationship_types.end(), type) != options_.relationship_types.end();
}

// ------------------------------------------------------------
// Writes
// ------------------------------------------------------------

CreateRelationshipResult GraphEngine::CreateRelationship(const RelationshipRequest& request) {
  return observability::ObserveOperation("graph.create_relationship", [&] {
    if (util::IsBlank(request.source_id) || util::IsBlank(request.target_id)) {
      throw util::InvalidArgument("relationship endpoints must not be blank");
    }
    if (!IsAllowedType(request.relationship_type)) {
      throw util::InvalidRelationshipType("relationship type '" + request.relationship_type + "' is not allowed; expected one of: " +
                                          util::Join(options_.relationship_types, ", "));
    }
    if (request.source_id == request.target_id) {
      throw util::SelfLoop("relationship source and target are the same node: " + request.source_id);
    }

    model::Relationship edge;
    edge.id                = util::NewId();
    edge.source_id         = request.source_id;
    edge.target_id         = request.target_id;
    edge.relationship_type = request.relationship_type;
    edge.source_type       = request.source_type.empty() ? std::string(model::kDefaultNodeType) : request.source_type;
    edge.target_type       = request.target_type.empty() ? std::string(model::kDefaultNodeType) : request.target_type;
    edge.metadata          = request.metadata;
    edge.workspace_id      = request.workspace_id;
    edge.created_at        = util::ToIso8601(util::Now());

    store_->Insert(edge, embedder_->Encode(model::DescribeRelationship(edge)));

    ENGRAM_LOG_DEBUG("relationship created", {StringField("id", edge.id), StringField("type", edge.relationship_type),
                                              StringField("source", edge.source_id), StringField("target", edge.target_id)});
    return CreateRelationshipResult{edge.id, "created"};
  });
}

CreateRelationshipResult GraphEngine::CreateContradictionRelationship(const std::string& new_id, const std::string& existing_id,
                                                                      double similarity, const std::string& workspace_id) {
  RelationshipRequest request;
  request.source_id         = new_id;
  request.target_id         = existing_id;
  request.relationship_type = std::string(model::kContradictsType);
  request.workspace_id      = workspace_id;
  request.metadata["similarity"] = ranking::RoundScore(similarity);
  return CreateRelationship(request);
}

bool GraphEngine::DeleteRelationship(const std::string& id) {
  return observability::ObserveOperation("graph.delete_relationship", [&] { return store_->Delete(id); });
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

std::optional<model::Relationship> GraphEngine::GetRelationship(const std::string& id) {
  try {
    return store_->Get(id);
  } catch (const util::IndexError& e) {
    ENGRAM_LOG_WARN("relationship lookup failed", {StringField("id", id), StringField("error", e.what())});
  }
  return std::nullopt;
}

std::vector<model::Relationship> GraphEngine::ListRelationships(const std::string& workspace_id, const std::string& type, std::size_t limit) {
  try {
    return store_->List(workspace_id, type, limit == 0 ? options_.max_neighbors : limit);
  } catch (const util::IndexError& e) {
    ENGRAM_LOG_WARN("relationship listing failed", {StringField("workspace", workspace_id), StringField("error", e.what())});
  }
  return {};
}

std::vector<model::Relationship> GraphEngine::GetNeighbors(const std::string& node_id, const std::string& type,
                                                           std::optional<std::size_t> max_results) {
  const std::size_t limit = max_results.value_or(options_.max_neighbors);
  try {
    return store_->Neighbors(node_id, type, limit);
  } catch (const util::IndexError& e) {
    ENGRAM_LOG_WARN("neighbor lookup failed", {StringField("node", node_id), StringField("error", e.what())});
  }
  return {};
}

std::vector<model::Relationship> GraphEngine::NeighborsForTraversal(const std::string& node_id, const std::vector<std::string>& types) {
  if (types.size() == 1) return GetNeighbors(node_id, types.front());

  auto edges = GetNeighbors(node_id);
  const auto& allowed = types.empty() ? options_.relationship_types : types;
  edges.erase(std::remove_if(edges.begin(), edges.end(),
                             [&](const model::Relationship& edge) {
                               return std::find(allowed.begin(), allowed.end(), edge.relationship_type) == allowed.end();
                             }),
              edges.end());
  return edges;
}

TraversalResult GraphEngine::Traverse(const std::string& start_node_id, std::optional<std::uint32_t> max_depth,
                                      const std::vector<std::string>& types, std::optional<std::size_t> max_nodes) {
  return observability::ObserveOperation("graph.traverse", [&] {
    const std::uint32_t requested   = max_depth.value_or(0);
    const std::uint32_t depth_limit = requested == 0 ? options_.max_depth : std::min(requested, options_.max_depth);
    const std::size_t   node_limit  = max_nodes.value_or(0) == 0 ? options_.default_max_nodes : *max_nodes;

    TraversalResult result;
    result.start_node_id = start_node_id;

    std::deque<std::pair<std::string, std::uint32_t>> queue;
    std::unordered_set<std::string>                   visited{start_node_id};
    std::unordered_set<std::string>                   edges_seen;
    queue.emplace_back(start_node_id, 0);

    while (!queue.empty() && result.nodes.size() < node_limit) {
      auto [node_id, depth] = std::move(queue.front());
      queue.pop_front();
      if (depth > depth_limit) continue;

      auto edges = NeighborsForTraversal(node_id, types);
      for (const auto& edge : edges) edges_seen.insert(edge.id);
      result.max_depth_reached = std::max(result.max_depth_reached, depth);

      if (depth < depth_limit) {
        for (const auto& edge : edges) {
          const auto& other = edge.source_id == node_id ? edge.target_id : edge.source_id;
          if (visited.count(other) != 0) continue;
          if (result.nodes.size() + 1 + queue.size() >= node_limit) break;
          visited.insert(other);
          queue.emplace_back(other, depth + 1);
        }
      }

      result.nodes.push_back(TraversalNode{std::move(node_id), depth, std::move(edges)});
    }

    result.total_relationships = edges_seen.size();
    ENGRAM_LOG_DEBUG("graph traversal finished", {StringField("start", start_node_id), IntField("nodes", result.nodes.size()),
                                                  IntField("relationships", result.total_relationships)});
    return result;
  });
}

} // namespace engram::graph
