#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/index/api/payload.hpp"
#include "internal/model/lifecycle.hpp"

namespace engram::model {

/*
  One version of a reusable skill. All versions share `canonical_id`;
  confidence stays within [0, 1].
*/
struct Skill {
  std::string id;
  std::string canonical_id;
  std::string previous_version_id;

  std::string              goal;
  std::vector<std::string> steps;
  std::vector<std::string> examples;
  std::vector<std::string> constraints;
  std::vector<std::string> sources;
  std::vector<std::string> tags;

  double        confidence = 0.5;
  std::uint32_t version    = 1;
  EntryStatus   status     = EntryStatus::kActive;

  std::string   model_name;
  std::string   workspace_id;
  std::uint64_t usage_count = 0;

  std::string created_at;
  std::string updated_at;
  std::string superseded_at;
  std::string deleted_at;
};

// Text embedded for search: goal | Steps: ... | Examples: ... | Constraints: ...
std::string SkillDocument(const Skill& skill);

index::Payload ToPayload(const Skill& skill);
Skill          SkillFromRecord(const index::Record& record);

} // namespace engram::model
