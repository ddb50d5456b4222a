#include "internal/index/vector_math.hpp"

#include <algorithm>
#include <cmath>

namespace engram::index {

double CosineDistance(const std::vector<float>& a, const std::vector<float>& b) {
  const std::size_t n = std::min(a.size(), b.size());

  double dot    = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    norm_a += static_cast<double>(a[i]) * a[i];
    norm_b += static_cast<double>(b[i]) * b[i];
  }

  if (norm_a == 0.0 || norm_b == 0.0) return 1.0;

  const double cosine = std::clamp(dot / (std::sqrt(norm_a) * std::sqrt(norm_b)), -1.0, 1.0);
  return 1.0 - cosine;
}

void Normalize(std::vector<float>& v) {
  double norm = 0.0;
  for (float x : v)
    norm += static_cast<double>(x) * x;
  if (norm == 0.0) return;

  const double scale = 1.0 / std::sqrt(norm);
  for (auto& x : v)
    x = static_cast<float>(x * scale);
}

} // namespace engram::index
