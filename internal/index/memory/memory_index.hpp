#pragma once

#include <map>
#include <mutex>
#include <string>

#include "internal/index/api/vector_index.hpp"

namespace engram::index::memory {

/*
  In-process index. Brute-force cosine scan under a single mutex.

  Apply() validates the whole batch before touching state, so a rejected
  batch leaves nothing behind.
*/
class MemoryIndex final : public VectorIndex {
 public:
  MemoryIndex();

  Result                        EnsureCollection(const CollectionInfo& info) override;
  std::optional<CollectionInfo> DescribeCollection(const std::string& name) override;
  Result                        SetCollectionInfo(const CollectionInfo& info) override;

  Result Apply(const WriteBatch& batch) override;

  std::vector<Record> Get(const std::string& collection, const std::vector<std::string>& ids) override;
  std::vector<Record> Find(const std::string& collection, const Filter& filter, std::size_t limit = 0) override;
  std::vector<Hit>    SimilarityQuery(const std::string& collection, const std::vector<float>& vector, const Filter& filter,
                                      std::size_t limit) override;
  std::size_t         Count(const std::string& collection) override;

 private:
  struct CollectionState {
    CollectionInfo                info;
    std::map<std::string, Record> records;
  };

  Result Validate(const WriteBatch& batch) const;

  std::mutex                             mutex_;
  std::map<std::string, CollectionState> collections_;
};

} // namespace engram::index::memory
