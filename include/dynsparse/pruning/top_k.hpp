#pragma once

#include "dynsparse/tensor.hpp"
#include <cstdint>
#include <vector>

namespace dynsparse {
namespace pruning {

/// Select the `keep_count` highest scores.
///
/// Returns a new 0/1 vector of length `total_count` with exactly
/// `keep_count` ones. Ties at the boundary go to the lower index; NaN
/// ranks below every number except -inf, which callers use as the
/// sentinel for excluded positions. Inputs are never modified.
///
/// Throws std::invalid_argument if total_count != scores.size() or
/// keep_count is outside [0, total_count].
std::vector<float> select_top_k(const std::vector<float>& scores,
                                int64_t keep_count,
                                int64_t total_count);

/// Tensor overload: mask has the shape of `scores`
Tensor select_top_k(const Tensor& scores, int64_t keep_count);

} // namespace pruning
} // namespace dynsparse
