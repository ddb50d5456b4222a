#include "internal/knowledge/contradiction_detector.hpp"

#include "internal/index/collections.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/text.hpp"

namespace engram::knowledge {

using observability::StringField;

ContradictionDetector::ContradictionDetector(std::shared_ptr<index::VectorIndex> index, ContradictionOptions options)
    : index_(std::move(index)), options_(options), collection_(index::CollectionKey(model::Collection::kLearnings)) {
}

std::vector<model::Contradiction> ContradictionDetector::Detect(const DetectionRequest& request) const noexcept {
  try {
    return Query(request);
  } catch (const std::exception& e) {
    ENGRAM_LOG_WARN("contradiction detection failed; continuing without it",
                    {StringField("model", request.model_name), StringField("workspace", request.workspace_id), StringField("error", e.what())});
  }
  return {};
}

std::vector<model::Contradiction> ContradictionDetector::Query(const DetectionRequest& request) const {
  std::vector<model::Contradiction> found;
  if (!request.embedding || request.embedding->empty() || options_.candidate_count == 0) return found;
  if (index_->Count(collection_) == 0) return found;

  index::Filter filter = {
      {"model_name", request.model_name},
      {"workspace_id", request.workspace_id},
      {"status", std::string(model::ToString(model::EntryStatus::kActive))},
  };

  const auto normalized = util::NormalizeText(request.text);
  for (const auto& hit : index_->SimilarityQuery(collection_, *request.embedding, filter, options_.candidate_count)) {
    if (hit.record.id == request.exclude_id) continue;

    const auto metadata = model::MetadataFromPayload(hit.record.payload);
    if (metadata.status != model::EntryStatus::kActive) continue;

    const double similarity = 1.0 - hit.distance;
    if (similarity < options_.similarity_threshold) continue;
    if (util::NormalizeText(hit.record.document) == normalized) continue;

    found.push_back(model::Contradiction{hit.record.id, hit.record.document, similarity, metadata.learning_key});
  }
  return found;
}

} // namespace engram::knowledge
