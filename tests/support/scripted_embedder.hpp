#pragma once

#include <cmath>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/embedding/embedder.hpp"
#include "internal/embedding/hashing_embedder.hpp"

namespace engram::testing {

/*
  Embedder with pinned vectors for chosen texts. Anything not scripted
  falls back to the hashing embedder of the same dimension.
*/
class ScriptedEmbedder final : public embedding::Embedder {
 public:
  explicit ScriptedEmbedder(std::size_t dimension = 32, std::string model = "scripted", std::string version = "1")
      : fallback_(model, version, dimension), model_(std::move(model)), version_(std::move(version)), dimension_(dimension) {
  }

  void Script(const std::string& text, std::vector<float> vector) {
    std::lock_guard<std::mutex> lock(mutex_);
    scripted_[text] = std::move(vector);
  }

  std::vector<float> Encode(std::string_view text) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto                        it = scripted_.find(std::string(text));
      if (it != scripted_.end()) return it->second;
    }
    return fallback_.Encode(text);
  }

  std::size_t Dimension() const override {
    return dimension_;
  }

  const std::string& ModelName() const override {
    return model_;
  }

  const std::string& ModelVersion() const override {
    return version_;
  }

 private:
  embedding::HashingEmbedder                          fallback_;
  std::string                                         model_;
  std::string                                         version_;
  std::size_t                                         dimension_;
  std::mutex                                          mutex_;
  std::unordered_map<std::string, std::vector<float>> scripted_;
};

// Unit vector along `axis`.
inline std::vector<float> Axis(std::size_t dimension, std::size_t axis) {
  std::vector<float> v(dimension, 0.0f);
  v[axis] = 1.0f;
  return v;
}

// Unit vector whose cosine with Axis(dimension, from) is `cosine`, tilted toward `toward`.
inline std::vector<float> Tilted(std::size_t dimension, std::size_t from, std::size_t toward, double cosine) {
  std::vector<float> v(dimension, 0.0f);
  v[from]   = static_cast<float>(cosine);
  v[toward] = static_cast<float>(std::sqrt(1.0 - cosine * cosine));
  return v;
}

} // namespace engram::testing
