#include "internal/knowledge/contradiction_detector.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>

#include "internal/index/collections.hpp"
#include "internal/index/memory/memory_index.hpp"
#include "support/flaky_index.hpp"
#include "support/scripted_embedder.hpp"

namespace {

using engram::index::Record;
using engram::knowledge::ContradictionDetector;
using engram::knowledge::ContradictionOptions;
using engram::knowledge::DetectionRequest;
using engram::model::EntryMetadata;
using engram::model::EntryStatus;
using engram::testing::Axis;
using engram::testing::Tilted;

constexpr std::size_t kDim = 8;

std::shared_ptr<engram::index::VectorIndex> SeededIndex(std::shared_ptr<engram::index::VectorIndex> idx) {
  engram::testing::ScriptedEmbedder embedder(kDim);
  engram::index::EnsureCollections(*idx, embedder);

  auto put = [&](const std::string& id, const std::string& text, const std::string& model, EntryStatus status) {
    EntryMetadata metadata;
    metadata.model_name   = model;
    metadata.category     = "fact";
    metadata.learning_key = model + "::fact";
    metadata.status       = status;
    assert(idx->Upsert("learnings", {Record{id, Axis(kDim, 0), text, engram::model::ToPayload(metadata)}}));
  };
  put("port-80", "The server listens on port 80", "assistant", EntryStatus::kActive);
  put("old-port", "The server listens on port 22", "assistant", EntryStatus::kSuperseded);
  put("other-model", "The server listens on port 443", "other", EntryStatus::kActive);
  return idx;
}

DetectionRequest Request(const std::string& text, const std::vector<float>& embedding) {
  DetectionRequest request;
  request.text       = text;
  request.embedding  = &embedding;
  request.model_name = "assistant";
  return request;
}

void TestFlagsCloseButDifferentText() {
  auto                  idx = SeededIndex(std::make_shared<engram::index::memory::MemoryIndex>());
  ContradictionDetector detector(idx, ContradictionOptions{});

  const auto embedding = Tilted(kDim, 0, 1, 0.95);
  const auto found     = detector.Detect(Request("The server listens on port 8080", embedding));
  assert(found.size() == 1);
  assert(found.front().id == "port-80");
  assert(found.front().text == "The server listens on port 80");
  assert(found.front().learning_key == "assistant::fact");
  assert(std::fabs(found.front().similarity - 0.95) < 1e-5);
}

void TestSameTextAndFarTextAreNotContradictions() {
  auto                  idx = SeededIndex(std::make_shared<engram::index::memory::MemoryIndex>());
  ContradictionDetector detector(idx, ContradictionOptions{});

  const auto same = Axis(kDim, 0);
  assert(detector.Detect(Request("  the server LISTENS on port 80 ", same)).empty());

  const auto far = Tilted(kDim, 0, 1, 0.5);
  assert(detector.Detect(Request("Something else entirely", far)).empty());
}

void TestScopeAndExclusion() {
  auto                  idx = SeededIndex(std::make_shared<engram::index::memory::MemoryIndex>());
  ContradictionDetector detector(idx, ContradictionOptions{});
  const auto            embedding = Tilted(kDim, 0, 1, 0.95);

  auto excluded       = Request("The server listens on port 8080", embedding);
  excluded.exclude_id = "port-80";
  assert(detector.Detect(excluded).empty());

  auto other_workspace         = Request("The server listens on port 8080", embedding);
  other_workspace.workspace_id = "team-b";
  assert(detector.Detect(other_workspace).empty());

  ContradictionOptions strict;
  strict.similarity_threshold = 0.99;
  ContradictionDetector strict_detector(idx, strict);
  assert(strict_detector.Detect(Request("The server listens on port 8080", embedding)).empty());

  ContradictionOptions disabled;
  disabled.candidate_count = 0;
  ContradictionDetector disabled_detector(idx, disabled);
  assert(disabled_detector.Detect(Request("The server listens on port 8080", embedding)).empty());
}

void TestEmptyAndFailingIndex() {
  auto                          empty = std::make_shared<engram::index::memory::MemoryIndex>();
  engram::testing::ScriptedEmbedder embedder(kDim);
  engram::index::EnsureCollections(*empty, embedder);
  ContradictionDetector empty_detector(empty, ContradictionOptions{});
  const auto            embedding = Axis(kDim, 0);
  assert(empty_detector.Detect(Request("anything", embedding)).empty());
  assert(empty_detector.Detect(DetectionRequest{}).empty());

  auto flaky = std::make_shared<engram::testing::FlakyIndex>();
  SeededIndex(flaky);
  flaky->fail_reads = true;
  ContradictionDetector flaky_detector(flaky, ContradictionOptions{});
  assert(flaky_detector.Detect(Request("The server listens on port 8080", embedding)).empty());
}

} // namespace

int main() {
  TestFlagsCloseButDifferentText();
  TestSameTextAndFarTextAreNotContradictions();
  TestScopeAndExclusion();
  TestEmptyAndFailingIndex();

  std::cout << "engram_unit_contradiction_detector: pass" << std::endl;
  return 0;
}
