#include "internal/ranking/ranking_engine.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>

#include "internal/util/text.hpp"

namespace engram::ranking {

namespace {

constexpr std::array<std::pair<std::string_view, double>, 5> kPriorityScores = {{
    {"critical", 1.0},
    {"pinned", 0.9},
    {"reinforced", 0.75},
    {"normal", 0.5},
    {"archived", 0.1},
}};

constexpr double kDefaultPriorityScore = 0.5;

double Scalar(const std::optional<double>& value) {
  if (!value || !std::isfinite(*value)) return kNeutralScore;
  return Clamp01(*value);
}

} // namespace

double Clamp01(double value) {
  if (!std::isfinite(value)) return 0.0;
  return std::clamp(value, 0.0, 1.0);
}

double RoundScore(double value) {
  const double scale = std::pow(10.0, kScoreDigits);
  return std::round(value * scale) / scale;
}

RankingEngine::RankingEngine(RankingOptions options) : options_(std::move(options)) {
}

double RankingEngine::BlendRelevance(double semantic, double keyword) const {
  const double s = Clamp01(semantic);
  const double k = Clamp01(keyword);

  const double ws    = std::max(0.0, options_.semantic_weight);
  const double wk    = std::max(0.0, options_.keyword_weight);
  const double total = ws + wk;
  if (total <= 0.0) {
    return RoundScore(s);
  }
  return RoundScore(Clamp01((s * ws + k * wk) / total));
}

double RankingEngine::ResolvePriorityScore(std::string_view tag) {
  const auto key = util::ToLower(util::Trim(tag));
  for (const auto& [name, score] : kPriorityScores) {
    if (name == key) return score;
  }
  return kDefaultPriorityScore;
}

double RankingEngine::RecencyScore(std::string_view created_at, util::TimePoint now) const {
  auto created = util::ParseIso8601(created_at);
  if (!created) return kNeutralScore;

  const double window   = std::max(1u, options_.recency_window_days);
  const double age_days = std::chrono::duration<double>(now - *created).count() / 86400.0;
  return Clamp01(1.0 - std::max(0.0, age_days) / window);
}

double RankingEngine::BuildRankScore(double relevance, const RankSignals& signals) const {
  return BuildRankScore(relevance, signals, util::Now());
}

double RankingEngine::BuildRankScore(double relevance, const RankSignals& signals, util::TimePoint now) const {
  const double score = Clamp01(relevance) * options_.weight_relevance + Scalar(signals.importance) * options_.weight_importance +
                       Scalar(signals.reliability) * options_.weight_reliability +
                       RecencyScore(signals.created_at, now) * options_.weight_recency +
                       Scalar(signals.frequency) * options_.weight_frequency +
                       ResolvePriorityScore(signals.priority) * options_.weight_priority;
  return RoundScore(Clamp01(score));
}

} // namespace engram::ranking
