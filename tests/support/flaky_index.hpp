#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "internal/index/api/vector_index.hpp"
#include "internal/index/memory/memory_index.hpp"
#include "internal/util/errors.hpp"

namespace engram::testing {

/*
  MemoryIndex wrapper whose reads or writes can be switched to fail, the
  way an unreachable backend would: reads throw util::IndexError, writes
  return ErrorCode::IOError.
*/
class FlakyIndex final : public index::VectorIndex {
 public:
  FlakyIndex() : inner_(std::make_shared<index::memory::MemoryIndex>()) {
  }

  std::atomic<bool> fail_reads{false};
  std::atomic<bool> fail_writes{false};
  // fail writes after this many successful Apply() calls; negative disables
  std::atomic<int> fail_writes_after{-1};

  index::Result EnsureCollection(const index::CollectionInfo& info) override {
    return inner_->EnsureCollection(info);
  }

  std::optional<index::CollectionInfo> DescribeCollection(const std::string& name) override {
    ThrowIfReadsFail("describe");
    return inner_->DescribeCollection(name);
  }

  index::Result SetCollectionInfo(const index::CollectionInfo& info) override {
    return inner_->SetCollectionInfo(info);
  }

  index::Result Apply(const index::WriteBatch& batch) override {
    if (fail_writes) return index::Result::Err(index::ErrorCode::IOError, "backend unavailable");
    if (fail_writes_after >= 0) {
      if (fail_writes_after == 0) return index::Result::Err(index::ErrorCode::IOError, "backend unavailable");
      --fail_writes_after;
    }
    return inner_->Apply(batch);
  }

  std::vector<index::Record> Get(const std::string& collection, const std::vector<std::string>& ids) override {
    ThrowIfReadsFail("get");
    return inner_->Get(collection, ids);
  }

  std::vector<index::Record> Find(const std::string& collection, const index::Filter& filter, std::size_t limit = 0) override {
    ThrowIfReadsFail("find");
    return inner_->Find(collection, filter, limit);
  }

  std::vector<index::Hit> SimilarityQuery(const std::string& collection, const std::vector<float>& vector, const index::Filter& filter,
                                          std::size_t limit) override {
    ThrowIfReadsFail("query");
    return inner_->SimilarityQuery(collection, vector, filter, limit);
  }

  std::size_t Count(const std::string& collection) override {
    ThrowIfReadsFail("count");
    return inner_->Count(collection);
  }

 private:
  void ThrowIfReadsFail(const char* operation) const {
    if (fail_reads) throw util::IndexError(std::string(operation) + ": backend unavailable");
  }

  std::shared_ptr<index::memory::MemoryIndex> inner_;
};

} // namespace engram::testing
