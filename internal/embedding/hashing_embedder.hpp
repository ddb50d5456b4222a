#pragma once

#include "internal/embedding/embedder.hpp"

namespace engram::embedding {

/*
  Deterministic feature-hashing embedder.

  Lowercased word tokens and character trigrams are hashed (FNV-1a) into
  `dimension` signed buckets, then the vector is L2-normalized. Texts that
  share vocabulary land close together; no model files are needed.
*/
class HashingEmbedder final : public Embedder {
 public:
  HashingEmbedder(std::string model_name, std::string model_version, std::size_t dimension);

  std::vector<float> Encode(std::string_view text) override;

  std::size_t Dimension() const override {
    return dimension_;
  }

  const std::string& ModelName() const override {
    return model_name_;
  }

  const std::string& ModelVersion() const override {
    return model_version_;
  }

 private:
  void AddFeature(std::vector<float>& v, std::string_view feature, float weight) const;

  std::string model_name_;
  std::string model_version_;
  std::size_t dimension_;
};

} // namespace engram::embedding
