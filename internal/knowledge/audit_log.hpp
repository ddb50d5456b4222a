#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/index/api/vector_index.hpp"
#include "internal/model/audit_event.hpp"

namespace engram::knowledge {

/*
  Append-only audit trail kept in its own collection.
*/
class AuditLog {
 public:
  explicit AuditLog(std::shared_ptr<index::VectorIndex> index);

  // Fills id/timestamps if empty and adds the insert to `batch`.
  void Stage(index::WriteBatch& batch, model::AuditEvent event) const;

  // Newest first. Empty filters match everything; backend errors yield nothing.
  std::vector<model::AuditEvent> List(std::size_t top_k, const std::string& workspace_id = {}, const std::string& model_name = {}) const;

 private:
  std::shared_ptr<index::VectorIndex> index_;
  std::string                         collection_;
};

} // namespace engram::knowledge
