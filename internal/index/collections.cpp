#include "internal/index/collections.hpp"

#include "internal/observability/logging.hpp"

namespace engram::index {

using observability::StringField;

std::string CollectionKey(model::Collection collection) {
  return std::string(model::CollectionName(collection));
}

void EnsureCollections(VectorIndex& index, const embedding::Embedder& embedder) {
  for (auto collection : model::kAllCollections) {
    CollectionInfo info;
    info.name                    = CollectionKey(collection);
    info.embedding_model         = embedder.ModelName();
    info.embedding_model_version = embedder.ModelVersion();
    // audit records carry no vector
    info.dimension = collection == model::Collection::kAudit ? 0 : embedder.Dimension();

    ThrowIfIndexError(index.EnsureCollection(info), "ensure collection " + info.name);

    auto stored = index.DescribeCollection(info.name);
    if (!stored || collection == model::Collection::kAudit) continue;

    if (stored->embedding_model != info.embedding_model || stored->embedding_model_version != info.embedding_model_version) {
      ENGRAM_LOG_WARN("collection embedded with a different model; reindex required",
                      {StringField("collection", info.name), StringField("stored_model", stored->embedding_model),
                       StringField("stored_version", stored->embedding_model_version), StringField("current_model", info.embedding_model),
                       StringField("current_version", info.embedding_model_version)});
    }
  }
}

} // namespace engram::index
