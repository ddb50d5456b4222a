#include "internal/model/skill.hpp"

#include "internal/util/string_list.hpp"
#include "internal/util/text.hpp"

namespace engram::model {

std::string SkillDocument(const Skill& skill) {
  std::vector<std::string> parts;
  parts.push_back(skill.goal);
  if (!skill.steps.empty()) parts.push_back("Steps: " + util::Join(skill.steps, "; "));
  if (!skill.examples.empty()) parts.push_back("Examples: " + util::Join(skill.examples, "; "));
  if (!skill.constraints.empty()) parts.push_back("Constraints: " + util::Join(skill.constraints, "; "));
  return util::Join(parts, " | ");
}

index::Payload ToPayload(const Skill& skill) {
  index::Payload payload;
  payload["canonical_id"]        = skill.canonical_id;
  payload["previous_version_id"] = skill.previous_version_id;
  payload["goal"]                = skill.goal;
  payload["steps"]               = util::EncodeStringList(skill.steps);
  payload["examples"]            = util::EncodeStringList(skill.examples);
  payload["constraints"]         = util::EncodeStringList(skill.constraints);
  payload["sources"]             = util::EncodeStringList(skill.sources);
  payload["tags"]                = util::EncodeStringList(skill.tags);
  payload["confidence"]          = skill.confidence;
  payload["version"]             = static_cast<std::int64_t>(skill.version);
  payload["status"]              = std::string(ToString(skill.status));
  payload["model_name"]          = skill.model_name;
  payload["workspace_id"]        = skill.workspace_id;
  payload["usage_count"]         = static_cast<std::int64_t>(skill.usage_count);
  payload["created_at"]          = skill.created_at;
  payload["updated_at"]          = skill.updated_at;
  if (!skill.superseded_at.empty()) payload["superseded_at"] = skill.superseded_at;
  if (!skill.deleted_at.empty()) payload["deleted_at"] = skill.deleted_at;
  return payload;
}

Skill SkillFromRecord(const index::Record& record) {
  using index::StringOr;
  const auto& p = record.payload;

  Skill skill;
  skill.id                  = record.id;
  skill.canonical_id        = StringOr(p, "canonical_id", record.id);
  skill.previous_version_id = StringOr(p, "previous_version_id");
  skill.goal                = StringOr(p, "goal");
  skill.steps               = util::DecodeStringList(StringOr(p, "steps"));
  skill.examples            = util::DecodeStringList(StringOr(p, "examples"));
  skill.constraints         = util::DecodeStringList(StringOr(p, "constraints"));
  skill.sources             = util::DecodeStringList(StringOr(p, "sources"));
  skill.tags                = util::DecodeStringList(StringOr(p, "tags"));
  skill.confidence          = index::GetNumber(p, "confidence").value_or(0.5);
  skill.version             = static_cast<std::uint32_t>(index::GetInt(p, "version").value_or(1));
  skill.status              = ParseStatus(StringOr(p, "status")).value_or(EntryStatus::kActive);
  skill.model_name          = StringOr(p, "model_name");
  skill.workspace_id        = StringOr(p, "workspace_id");
  skill.usage_count         = static_cast<std::uint64_t>(index::GetInt(p, "usage_count").value_or(0));
  skill.created_at          = StringOr(p, "created_at");
  skill.updated_at          = StringOr(p, "updated_at");
  skill.superseded_at       = StringOr(p, "superseded_at");
  skill.deleted_at          = StringOr(p, "deleted_at");
  return skill;
}

} // namespace engram::model
