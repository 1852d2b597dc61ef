#pragma once

#include <vector>

namespace engram {

// Cosine similarity in [-1, 1]. Returns 0 when either vector has zero
// magnitude or the lengths differ.
double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

} // namespace engram
