#include "internal/index/memory/memory_index.hpp"

#include <algorithm>
#include <set>

#include "internal/index/vector_math.hpp"

namespace engram::index::memory {

MemoryIndex::MemoryIndex() = default;

Result MemoryIndex::EnsureCollection(const CollectionInfo& info) {
  if (info.name.empty()) return Result::Err(ErrorCode::InternalError, "collection name is empty");

  std::lock_guard<std::mutex> lock(mutex_);
  if (!collections_.contains(info.name)) {
    collections_[info.name].info = info;
  }
  return Result::Ok();
}

std::optional<CollectionInfo> MemoryIndex::DescribeCollection(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = collections_.find(name);
  if (it == collections_.end()) return std::nullopt;
  return it->second.info;
}

Result MemoryIndex::SetCollectionInfo(const CollectionInfo& info) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = collections_.find(info.name);
  if (it == collections_.end()) return Result::Err(ErrorCode::NotFound, "unknown collection " + info.name);
  it->second.info = info;
  return Result::Ok();
}

Result MemoryIndex::Validate(const WriteBatch& batch) const {
  // ids upserted earlier in the same batch count as present for later ops
  std::set<std::pair<std::string, std::string>> staged;

  for (const auto& op : batch.Ops()) {
    auto it = collections_.find(op.collection);
    if (it == collections_.end()) {
      return Result::Err(ErrorCode::NotFound, "unknown collection " + op.collection);
    }
    const auto& state = it->second;
    const auto  key   = std::make_pair(op.collection, op.record.id);

    if (op.record.id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "record id is empty");

    switch (op.kind) {
      case WriteBatch::OpKind::kUpsert:
      case WriteBatch::OpKind::kSetVector:
        if (!op.record.vector.empty() && state.info.dimension != 0 && op.record.vector.size() != state.info.dimension) {
          return Result::Err(ErrorCode::DimensionMismatch, "vector dimension " + std::to_string(op.record.vector.size()) + " != " +
                                                               std::to_string(state.info.dimension) + " in " + op.collection);
        }
        if (op.kind == WriteBatch::OpKind::kUpsert) {
          staged.insert(key);
        } else if (!state.records.contains(op.record.id) && !staged.contains(key)) {
          return Result::Err(ErrorCode::NotFound, "record " + op.record.id + " not found in " + op.collection);
        }
        break;
      case WriteBatch::OpKind::kMergePayload:
        if (!state.records.contains(op.record.id) && !staged.contains(key)) {
          return Result::Err(ErrorCode::NotFound, "record " + op.record.id + " not found in " + op.collection);
        }
        break;
      case WriteBatch::OpKind::kDelete:
        staged.erase(key);
        break;
    }
  }
  return Result::Ok();
}

Result MemoryIndex::Apply(const WriteBatch& batch) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (auto status = Validate(batch); !status) {
    return status;
  }

  for (const auto& op : batch.Ops()) {
    auto& records = collections_[op.collection].records;
    switch (op.kind) {
      case WriteBatch::OpKind::kUpsert:
        records[op.record.id] = op.record;
        break;
      case WriteBatch::OpKind::kMergePayload: {
        auto it = records.find(op.record.id);
        if (it == records.end()) break;
        for (const auto& [key, value] : op.record.payload) {
          it->second.payload[key] = value;
        }
        break;
      }
      case WriteBatch::OpKind::kSetVector: {
        auto it = records.find(op.record.id);
        if (it != records.end()) it->second.vector = op.record.vector;
        break;
      }
      case WriteBatch::OpKind::kDelete:
        records.erase(op.record.id);
        break;
    }
  }
  return Result::Ok();
}

std::vector<Record> MemoryIndex::Get(const std::string& collection, const std::vector<std::string>& ids) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<Record> out;
  auto                it = collections_.find(collection);
  if (it == collections_.end()) return out;

  for (const auto& id : ids) {
    auto record = it->second.records.find(id);
    if (record != it->second.records.end()) out.push_back(record->second);
  }
  return out;
}

std::vector<Record> MemoryIndex::Find(const std::string& collection, const Filter& filter, std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<Record> out;
  auto                it = collections_.find(collection);
  if (it == collections_.end()) return out;

  for (const auto& [_, record] : it->second.records) {
    if (!Matches(record.payload, filter)) continue;
    out.push_back(record);
    if (limit != 0 && out.size() >= limit) break;
  }
  return out;
}

std::vector<Hit> MemoryIndex::SimilarityQuery(const std::string& collection, const std::vector<float>& vector, const Filter& filter,
                                              std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<Hit> hits;
  auto             it = collections_.find(collection);
  if (it == collections_.end() || vector.empty() || limit == 0) return hits;

  for (const auto& [_, record] : it->second.records) {
    if (record.vector.size() != vector.size()) continue;
    if (!Matches(record.payload, filter)) continue;
    hits.push_back(Hit{record, CosineDistance(vector, record.vector)});
  }

  std::stable_sort(hits.begin(), hits.end(), [](const Hit& a, const Hit& b) {
    return a.distance < b.distance;
  });
  if (hits.size() > limit) hits.resize(limit);
  return hits;
}

std::size_t MemoryIndex::Count(const std::string& collection) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto                        it = collections_.find(collection);
  return it == collections_.end() ? 0 : it->second.records.size();
}

} // namespace engram::index::memory
