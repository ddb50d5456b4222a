#pragma once

#include <string>

#include "internal/embedding/embedder.hpp"
#include "internal/index/api/vector_index.hpp"
#include "internal/model/collection.hpp"

namespace engram::index {

std::string CollectionKey(model::Collection collection);

/*
  Creates every engram collection that is missing, stamped with the
  embedder's model name/version and dimension. Existing collections keep
  their stored stamp; a stamp that differs from the embedder is logged.
  Throws util::IndexError when a collection cannot be created.
*/
void EnsureCollections(VectorIndex& index, const embedding::Embedder& embedder);

} // namespace engram::index
