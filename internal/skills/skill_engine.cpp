#include "internal/skills/skill_engine.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>

#include "internal/index/collections.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/observe.hpp"
#include "internal/ranking/ranking_engine.hpp"
#include "internal/skills/dialog_extractor.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace engram::skills {

using model::EntryStatus;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

constexpr char kSkillIdPrefix[] = "skill-";

void ValidateConfidence(double confidence) {
  if (!std::isfinite(confidence) || confidence < 0.0 || confidence > 1.0) {
    throw util::InvalidArgument("skill confidence must be within [0, 1]");
  }
}

std::string StatusValue(EntryStatus status) {
  return std::string(model::ToString(status));
}

} // namespace

SkillEngine::SkillEngine(std::shared_ptr<index::VectorIndex> index, std::shared_ptr<embedding::Embedder> embedder, SkillOptions options)
    : index_(std::move(index)), embedder_(std::move(embedder)), options_(options), collection_(index::CollectionKey(model::Collection::kSkills)) {
  if (!index_) throw std::invalid_argument("SkillEngine: index is null");
  if (!embedder_) throw std::invalid_argument("SkillEngine: embedder is null");
}

index::Record SkillEngine::ToRecord(const model::Skill& skill) {
  index::Record record;
  record.id       = skill.id;
  record.document = model::SkillDocument(skill);
  record.vector   = embedder_->Encode(record.document);
  record.payload  = model::ToPayload(skill);
  return record;
}

std::optional<model::Skill> SkillEngine::Load(const std::string& id) {
  auto records = index_->Get(collection_, {id});
  if (records.empty()) return std::nullopt;
  return model::SkillFromRecord(records.front());
}

// ------------------------------------------------------------
// Writes
// ------------------------------------------------------------

model::Skill SkillEngine::CreateSkill(const SkillInput& input) {
  return observability::ObserveOperation("skills.create", [&] {
    const auto goal = util::Trim(input.goal);
    if (goal.empty()) throw util::InvalidArgument("skill goal must not be blank");

    model::Skill skill;
    skill.id           = util::NewShortId(kSkillIdPrefix);
    skill.canonical_id = skill.id;
    skill.goal         = goal;
    skill.steps        = input.steps;
    skill.examples     = input.examples;
    skill.constraints  = input.constraints;
    skill.sources      = input.sources;
    skill.tags         = input.tags;
    skill.confidence   = input.confidence.value_or(options_.default_confidence);
    skill.version      = 1;
    skill.status       = EntryStatus::kActive;
    skill.model_name   = input.model_name;
    skill.workspace_id = input.workspace_id;
    skill.created_at   = util::ToIso8601(util::Now());
    skill.updated_at   = skill.created_at;
    ValidateConfidence(skill.confidence);

    index::ThrowIfIndexError(index_->Upsert(collection_, {ToRecord(skill)}), "create skill " + skill.id);
    ENGRAM_LOG_INFO("skill created", {StringField("id", skill.id), StringField("goal", goal), DoubleField("confidence", skill.confidence)});
    return skill;
  });
}

std::optional<model::Skill> SkillEngine::UpdateSkill(const std::string& id, const SkillUpdate& update) {
  return observability::ObserveOperation("skills.update", [&]() -> std::optional<model::Skill> {
    std::lock_guard<std::mutex> lock(write_mutex_);

    auto current = Load(id);
    if (!current || current->status == EntryStatus::kDeleted) return std::nullopt;
    if (current->status == EntryStatus::kSuperseded) {
      throw util::InvalidState("skill " + id + " was superseded by a newer version");
    }

    model::Skill next = *current;
    next.id                  = util::NewShortId(kSkillIdPrefix);
    next.previous_version_id = current->id;
    next.version             = current->version + 1;
    next.status              = EntryStatus::kActive;
    next.updated_at          = util::ToIso8601(util::Now());
    next.superseded_at.clear();
    next.deleted_at.clear();

    if (update.goal) {
      next.goal = util::Trim(*update.goal);
      if (next.goal.empty()) throw util::InvalidArgument("skill goal must not be blank");
    }
    if (update.steps) next.steps = *update.steps;
    if (update.examples) next.examples = *update.examples;
    if (update.constraints) next.constraints = *update.constraints;
    if (update.sources) next.sources = *update.sources;
    if (update.tags) next.tags = *update.tags;
    if (update.confidence) next.confidence = *update.confidence;
    ValidateConfidence(next.confidence);

    index::WriteBatch batch;
    batch.MergePayload(collection_, current->id,
                       {{"status", StatusValue(EntryStatus::kSuperseded)},
                        {"superseded_at", next.updated_at},
                        {"updated_at", next.updated_at}});
    batch.Upsert(collection_, ToRecord(next));
    index::ThrowIfIndexError(index_->Apply(batch), "update skill " + id);

    ENGRAM_LOG_INFO("skill updated", {StringField("id", current->id), StringField("new_id", next.id),
                                      StringField("canonical_id", next.canonical_id), IntField("version", next.version)});
    return next;
  });
}

bool SkillEngine::DeleteSkill(const std::string& id) {
  return observability::ObserveOperation("skills.delete", [&] {
    std::lock_guard<std::mutex> lock(write_mutex_);

    auto current = Load(id);
    // deleted is terminal; superseded history can still be retired
    if (!current || current->status == EntryStatus::kDeleted) return false;

    const auto     now_iso = util::ToIso8601(util::Now());
    index::Payload patch   = {{"status", StatusValue(EntryStatus::kDeleted)}, {"deleted_at", now_iso}, {"updated_at", now_iso}};
    index::ThrowIfIndexError(index_->UpdateMetadata(collection_, {{id, std::move(patch)}}), "delete skill " + id);
    ENGRAM_LOG_INFO("skill deleted", {StringField("id", id)});
    return true;
  });
}

bool SkillEngine::RecordUsage(const std::string& id) {
  return observability::ObserveOperation("skills.record_usage", [&] {
    std::lock_guard<std::mutex> lock(write_mutex_);

    auto current = Load(id);
    if (!current || current->status != EntryStatus::kActive) return false;

    const double old_confidence = std::clamp(current->confidence, 0.0, 1.0);
    const double boosted        = old_confidence + (1.0 - old_confidence) * options_.usage_boost_rate;
    double       rounded        = ranking::RoundScore(boosted);
    // rounding must not carry confidence up to 1.0
    if (rounded >= 1.0) rounded = std::min(boosted, std::nextafter(1.0, 0.0));
    // nor move it backwards
    const double confidence  = std::max(old_confidence, rounded);
    const auto   usage_count = static_cast<std::int64_t>(current->usage_count + 1);

    index::Payload patch = {{"usage_count", usage_count}, {"confidence", confidence}, {"updated_at", util::ToIso8601(util::Now())}};
    index::ThrowIfIndexError(index_->UpdateMetadata(collection_, {{id, std::move(patch)}}), "record usage " + id);
    ENGRAM_LOG_DEBUG("skill used", {StringField("id", id), IntField("usage_count", usage_count), DoubleField("confidence", confidence)});
    return true;
  });
}

model::Skill SkillEngine::CreateFromDialog(const std::string& text, const std::string& model_name, const std::string& workspace_id) {
  auto extracted = ExtractSkillFromDialog(text);

  SkillInput input;
  input.goal         = std::move(extracted.goal);
  input.steps        = std::move(extracted.steps);
  input.examples     = std::move(extracted.examples);
  input.constraints  = std::move(extracted.constraints);
  input.sources      = {"dialog"};
  input.model_name   = model_name;
  input.workspace_id = workspace_id;
  return CreateSkill(input);
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

std::optional<model::Skill> SkillEngine::GetSkill(const std::string& id) {
  try {
    return Load(id);
  } catch (const util::IndexError& e) {
    ENGRAM_LOG_WARN("skill lookup failed", {StringField("id", id), StringField("error", e.what())});
  }
  return std::nullopt;
}

std::vector<model::Skill> SkillEngine::ListSkills(const std::string& workspace_id, std::optional<EntryStatus> status) {
  index::Filter filter;
  if (status) filter.push_back({"status", StatusValue(*status)});
  if (!workspace_id.empty()) filter.push_back({"workspace_id", workspace_id});

  std::vector<model::Skill> skills;
  try {
    for (const auto& record : index_->Find(collection_, filter)) skills.push_back(model::SkillFromRecord(record));
  } catch (const util::IndexError& e) {
    ENGRAM_LOG_WARN("skill listing failed", {StringField("workspace", workspace_id), StringField("error", e.what())});
    return {};
  }

  std::sort(skills.begin(), skills.end(), [](const model::Skill& a, const model::Skill& b) { return a.updated_at > b.updated_at; });
  return skills;
}

std::vector<SkillHit> SkillEngine::SearchSkills(const SkillSearchRequest& request) {
  return observability::ObserveOperation("skills.search", [&] {
    std::vector<SkillHit> hits;
    if (util::IsBlank(request.query)) return hits;

    const std::size_t top_k     = request.top_k.value_or(0) == 0 ? options_.search_top_k : *request.top_k;
    const double      threshold = request.min_confidence.value_or(options_.min_confidence);

    index::Filter filter = {{"status", StatusValue(EntryStatus::kActive)}};
    if (!request.workspace_id.empty()) filter.push_back({"workspace_id", request.workspace_id});

    try {
      for (const auto& hit : index_->SimilarityQuery(collection_, embedder_->Encode(request.query), filter, top_k)) {
        auto skill = model::SkillFromRecord(hit.record);
        if (skill.status != EntryStatus::kActive || skill.confidence < threshold) continue;
        hits.push_back(SkillHit{std::move(skill), ranking::RoundScore(ranking::Clamp01(1.0 - hit.distance))});
      }
    } catch (const util::IndexError& e) {
      ENGRAM_LOG_WARN("skill search failed; returning no results", {StringField("error", e.what())});
      return std::vector<SkillHit>{};
    }
    return hits;
  });
}

} // namespace engram::skills
