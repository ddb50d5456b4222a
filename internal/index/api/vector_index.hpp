#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/index/api/payload.hpp"
#include "internal/index/api/result.hpp"

namespace engram::index {

struct CollectionInfo {
  std::string name;
  std::string embedding_model;
  std::string embedding_model_version;
  std::size_t dimension = 0;
};

/*
  Ordered list of writes applied all-or-nothing by VectorIndex::Apply.
*/
class WriteBatch {
 public:
  enum class OpKind {
    kUpsert,
    kMergePayload,
    kSetVector,
    kDelete,
  };

  struct Op {
    OpKind      kind;
    std::string collection;
    Record      record; // kUpsert: full record; kMergePayload: id + payload patch; kSetVector: id + vector; kDelete: id
  };

  void Upsert(std::string collection, Record record);
  void MergePayload(std::string collection, std::string id, Payload patch);
  void SetVector(std::string collection, std::string id, std::vector<float> vector);
  void Delete(std::string collection, std::string id);

  const std::vector<Op>& Ops() const {
    return ops_;
  }

  bool Empty() const {
    return ops_.empty();
  }

 private:
  std::vector<Op> ops_;
};

/*
  Vector index adapter.

  GUARANTEES:

  - Apply() commits every op of a batch or none of them
  - MergePayload overwrites only the keys present in the patch
  - SimilarityQuery returns hits ordered by ascending cosine distance,
    considering only records whose vector matches the query dimension
  - Reads throw util::IndexError on backend failure; reads of an unknown
    collection return nothing
*/
class VectorIndex {
 public:
  virtual ~VectorIndex() = default;

  // ---------------------------------------------------------------------
  // Collections
  // ---------------------------------------------------------------------

  // Creates the collection if absent; an existing collection keeps its info.
  virtual Result EnsureCollection(const CollectionInfo& info) = 0;

  virtual std::optional<CollectionInfo> DescribeCollection(const std::string& name) = 0;

  virtual Result SetCollectionInfo(const CollectionInfo& info) = 0;

  // ---------------------------------------------------------------------
  // Writes
  // ---------------------------------------------------------------------

  virtual Result Apply(const WriteBatch& batch) = 0;

  Result Upsert(const std::string& collection, const std::vector<Record>& records);
  Result UpdateMetadata(const std::string& collection, const std::vector<std::pair<std::string, Payload>>& patches);
  Result UpdateVectors(const std::string& collection, const std::vector<std::pair<std::string, std::vector<float>>>& vectors);
  Result Delete(const std::string& collection, const std::vector<std::string>& ids);

  // ---------------------------------------------------------------------
  // Reads
  // ---------------------------------------------------------------------

  virtual std::vector<Record> Get(const std::string& collection, const std::vector<std::string>& ids) = 0;

  // limit == 0 means unbounded
  virtual std::vector<Record> Find(const std::string& collection, const Filter& filter, std::size_t limit = 0) = 0;

  virtual std::vector<Hit> SimilarityQuery(const std::string& collection, const std::vector<float>& vector, const Filter& filter,
                                           std::size_t limit) = 0;

  virtual std::size_t Count(const std::string& collection) = 0;
};

} // namespace engram::index
