#include "internal/index/api/vector_index.hpp"

namespace engram::index {

void WriteBatch::Upsert(std::string collection, Record record) {
  ops_.push_back(Op{OpKind::kUpsert, std::move(collection), std::move(record)});
}

void WriteBatch::MergePayload(std::string collection, std::string id, Payload patch) {
  Record record;
  record.id      = std::move(id);
  record.payload = std::move(patch);
  ops_.push_back(Op{OpKind::kMergePayload, std::move(collection), std::move(record)});
}

void WriteBatch::SetVector(std::string collection, std::string id, std::vector<float> vector) {
  Record record;
  record.id     = std::move(id);
  record.vector = std::move(vector);
  ops_.push_back(Op{OpKind::kSetVector, std::move(collection), std::move(record)});
}

void WriteBatch::Delete(std::string collection, std::string id) {
  Record record;
  record.id = std::move(id);
  ops_.push_back(Op{OpKind::kDelete, std::move(collection), std::move(record)});
}

Result VectorIndex::Upsert(const std::string& collection, const std::vector<Record>& records) {
  WriteBatch batch;
  for (const auto& record : records) {
    batch.Upsert(collection, record);
  }
  return Apply(batch);
}

Result VectorIndex::UpdateMetadata(const std::string& collection, const std::vector<std::pair<std::string, Payload>>& patches) {
  WriteBatch batch;
  for (const auto& [id, patch] : patches) {
    batch.MergePayload(collection, id, patch);
  }
  return Apply(batch);
}

Result VectorIndex::UpdateVectors(const std::string& collection, const std::vector<std::pair<std::string, std::vector<float>>>& vectors) {
  WriteBatch batch;
  for (const auto& [id, vector] : vectors) {
    batch.SetVector(collection, id, vector);
  }
  return Apply(batch);
}

Result VectorIndex::Delete(const std::string& collection, const std::vector<std::string>& ids) {
  WriteBatch batch;
  for (const auto& id : ids) {
    batch.Delete(collection, id);
  }
  return Apply(batch);
}

} // namespace engram::index
