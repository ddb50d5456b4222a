#include "internal/embedding/hashing_embedder.hpp"

#include <cstdint>
#include <stdexcept>

#include "internal/index/vector_math.hpp"
#include "internal/util/text.hpp"

namespace engram::embedding {

namespace {

constexpr std::uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr std::uint64_t kFnvPrime  = 1099511628211ULL;

std::uint64_t Fnv1a(std::string_view data, std::uint64_t seed) {
  std::uint64_t h = kFnvOffset ^ seed;
  for (unsigned char c : data) {
    h ^= c;
    h *= kFnvPrime;
  }
  return h;
}

constexpr float kWordWeight    = 1.0f;
constexpr float kTrigramWeight = 0.5f;

} // namespace

HashingEmbedder::HashingEmbedder(std::string model_name, std::string model_version, std::size_t dimension)
    : model_name_(std::move(model_name)), model_version_(std::move(model_version)), dimension_(dimension) {
  if (dimension_ == 0) {
    throw std::invalid_argument("embedding dimension must be positive");
  }
}

void HashingEmbedder::AddFeature(std::vector<float>& v, std::string_view feature, float weight) const {
  const auto h      = Fnv1a(feature, 0);
  const auto bucket = static_cast<std::size_t>(h % dimension_);
  // independent bit decides the sign so collisions tend to cancel
  const float sign = (Fnv1a(feature, 0x9E3779B97F4A7C15ULL) & 1ULL) ? 1.0f : -1.0f;
  v[bucket] += sign * weight;
}

std::vector<float> HashingEmbedder::Encode(std::string_view text) {
  std::vector<float> v(dimension_, 0.0f);

  for (const auto& token : util::Tokenize(text)) {
    AddFeature(v, token, kWordWeight);

    const std::string padded = "<" + token + ">";
    for (std::size_t i = 0; i + 3 <= padded.size(); ++i) {
      AddFeature(v, std::string_view(padded).substr(i, 3), kTrigramWeight);
    }
  }

  index::Normalize(v);
  return v;
}

} // namespace engram::embedding
