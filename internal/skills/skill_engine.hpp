#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/embedding/embedder.hpp"
#include "internal/index/api/vector_index.hpp"
#include "internal/model/skill.hpp"

namespace engram::skills {

struct SkillOptions {
  double      default_confidence = 0.5;
  double      min_confidence     = 0.0;
  std::size_t search_top_k       = 5;
  double      usage_boost_rate   = 0.05;
};

struct SkillInput {
  std::string              goal;
  std::vector<std::string> steps;
  std::vector<std::string> examples;
  std::vector<std::string> constraints;
  std::vector<std::string> sources;
  std::optional<double>    confidence;
  std::vector<std::string> tags;
  std::string              model_name;
  std::string              workspace_id;
};

// Unset fields keep the value of the version being replaced.
struct SkillUpdate {
  std::optional<std::string>              goal;
  std::optional<std::vector<std::string>> steps;
  std::optional<std::vector<std::string>> examples;
  std::optional<std::vector<std::string>> constraints;
  std::optional<std::vector<std::string>> sources;
  std::optional<double>                   confidence;
  std::optional<std::vector<std::string>> tags;
};

struct SkillSearchRequest {
  std::string                query;
  std::optional<std::size_t> top_k;
  std::optional<double>      min_confidence;
  std::string                workspace_id;
};

struct SkillHit {
  model::Skill skill;
  double       relevance = 0.0;
};

/*
  SkillEngine

  Versioned, confidence-scored skills in their own collection. An update
  supersedes the current record and writes a new one with the same
  canonical id; both writes go to the index as one batch. Deleted is
  terminal.

  Search and listing degrade to empty results on backend failure.
*/
class SkillEngine {
 public:
  SkillEngine(std::shared_ptr<index::VectorIndex> index, std::shared_ptr<embedding::Embedder> embedder, SkillOptions options);

  // Throws util::InvalidArgument for a blank goal or confidence outside [0, 1].
  model::Skill CreateSkill(const SkillInput& input);

  std::optional<model::Skill> GetSkill(const std::string& id);

  // Newest first. nullopt status lists every status.
  std::vector<model::Skill> ListSkills(const std::string& workspace_id = {},
                                       std::optional<model::EntryStatus> status = model::EntryStatus::kActive);

  // nullopt when the skill is missing or deleted; util::InvalidState for a superseded version.
  std::optional<model::Skill> UpdateSkill(const std::string& id, const SkillUpdate& update);

  bool DeleteSkill(const std::string& id);

  std::vector<SkillHit> SearchSkills(const SkillSearchRequest& request);

  // Active skills only: bumps usage_count and reinforces confidence toward 1.0.
  bool RecordUsage(const std::string& id);

  model::Skill CreateFromDialog(const std::string& text, const std::string& model_name = {}, const std::string& workspace_id = {});

  const SkillOptions& Options() const {
    return options_;
  }

 private:
  std::optional<model::Skill> Load(const std::string& id);
  index::Record               ToRecord(const model::Skill& skill);

  std::shared_ptr<index::VectorIndex>  index_;
  std::shared_ptr<embedding::Embedder> embedder_;
  SkillOptions                         options_;
  std::string                          collection_;

  // serializes read-modify-write of skill records
  std::mutex write_mutex_;
};

} // namespace engram::skills
