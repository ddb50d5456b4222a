#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace engram::ranking {

struct RankingOptions {
  double semantic_weight = 0.8;
  double keyword_weight  = 0.2;

  double weight_relevance   = 0.50;
  double weight_importance  = 0.15;
  double weight_reliability = 0.15;
  double weight_recency     = 0.10;
  double weight_frequency   = 0.05;
  double weight_priority    = 0.05;

  unsigned recency_window_days = 30;
};

// Scoring inputs taken from an entry's metadata. Absent scalars score 0.5.
struct RankSignals {
  std::optional<double> importance;
  std::optional<double> reliability;
  std::optional<double> frequency;
  std::string           priority;
  std::string           created_at;
};

inline constexpr double kNeutralScore = 0.5;
inline constexpr int    kScoreDigits  = 4;

/*
  Composite relevance scoring.

  Every output is clamped to [0, 1] and rounded to kScoreDigits decimals.
  Stateless apart from options; safe to share between threads.
*/
class RankingEngine {
 public:
  explicit RankingEngine(RankingOptions options = {});

  double BlendRelevance(double semantic, double keyword) const;

  // critical > pinned > reinforced > normal > archived; unknown tags score as normal
  static double ResolvePriorityScore(std::string_view tag);

  double RecencyScore(std::string_view created_at, util::TimePoint now) const;

  double BuildRankScore(double relevance, const RankSignals& signals) const;
  double BuildRankScore(double relevance, const RankSignals& signals, util::TimePoint now) const;

  const RankingOptions& Options() const {
    return options_;
  }

 private:
  RankingOptions options_;
};

double Clamp01(double value);
double RoundScore(double value);

} // namespace engram::ranking
