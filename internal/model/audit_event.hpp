#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "internal/index/api/payload.hpp"

namespace engram::model {

// Append-only; never updated or removed by normal operation.
struct AuditEvent {
  std::string                        id;
  std::string                        event_type;
  std::string                        model_name;
  std::string                        workspace_id;
  std::string                        entry_id;
  std::string                        created_at;
  std::int64_t                       created_at_unix = 0;
  std::map<std::string, std::string> details;
};

index::Payload ToPayload(const AuditEvent& event);
AuditEvent     AuditEventFromRecord(const index::Record& record);

} // namespace engram::model
