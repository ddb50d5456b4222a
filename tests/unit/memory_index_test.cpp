#include "internal/index/memory/memory_index.hpp"

#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

#include "support/index_conformance.hpp"

namespace {

using engram::index::CollectionInfo;
using engram::index::Payload;
using engram::index::Record;
using engram::index::memory::MemoryIndex;

void TestConformance() {
  MemoryIndex idx;
  engram::testing::RunVectorIndexConformance(idx);
}

void TestConcurrentWriters() {
  MemoryIndex idx;
  assert(idx.EnsureCollection(CollectionInfo{"facts", "m", "1", 2}));

  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&idx, t] {
      for (int i = 0; i < 50; ++i) {
        const auto id = std::to_string(t) + "-" + std::to_string(i);
        assert(idx.Upsert("facts", {Record{id, {1.0f, static_cast<float>(i)}, "doc", Payload{{"writer", std::int64_t{t}}}}}));
      }
    });
  }
  for (auto& writer : writers) writer.join();

  assert(idx.Count("facts") == 200);
  assert(idx.Find("facts", {{"writer", std::int64_t{2}}}).size() == 50);
}

} // namespace

int main() {
  TestConformance();
  TestConcurrentWriters();

  std::cout << "engram_unit_memory_index: pass" << std::endl;
  return 0;
}
