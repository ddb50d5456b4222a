#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace engram::embedding {

/*
  Text -> fixed-length vector.

  Implementations must be safe to call from several threads at once.
*/
class Embedder {
 public:
  virtual ~Embedder() = default;

  virtual std::vector<float> Encode(std::string_view text) = 0;

  virtual std::size_t Dimension() const = 0;

  virtual const std::string& ModelName() const    = 0;
  virtual const std::string& ModelVersion() const = 0;
};

} // namespace engram::embedding
