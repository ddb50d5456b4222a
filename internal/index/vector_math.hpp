#pragma once

#include <vector>

namespace engram::index {

// 1 - cosine similarity. Zero vectors are treated as orthogonal (distance 1).
double CosineDistance(const std::vector<float>& a, const std::vector<float>& b);

// Scales to unit L2 norm in place; zero vectors are left untouched.
void Normalize(std::vector<float>& v);

} // namespace engram::index
