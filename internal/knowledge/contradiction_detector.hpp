#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/index/api/vector_index.hpp"
#include "internal/model/knowledge_entry.hpp"

namespace engram::knowledge {

struct ContradictionOptions {
  double      similarity_threshold = 0.85;
  std::size_t candidate_count      = 5;
  // also record each hit as a "contradicts" graph edge
  bool link_in_graph = false;
};

struct DetectionRequest {
  std::string               text;
  const std::vector<float>* embedding = nullptr;
  std::string               model_name;
  std::string               workspace_id;
  std::string               exclude_id;
};

/*
  Flags active entries of the same model/workspace that embed close to the
  new text (similarity >= threshold) but say something different after
  normalization. Best effort: backend failures are logged and yield no hits.
*/
class ContradictionDetector {
 public:
  ContradictionDetector(std::shared_ptr<index::VectorIndex> index, ContradictionOptions options);

  std::vector<model::Contradiction> Detect(const DetectionRequest& request) const noexcept;

  const ContradictionOptions& Options() const {
    return options_;
  }

 private:
  std::vector<model::Contradiction> Query(const DetectionRequest& request) const;

  std::shared_ptr<index::VectorIndex> index_;
  ContradictionOptions                options_;
  std::string                         collection_;
};

} // namespace engram::knowledge
