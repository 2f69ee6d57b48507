#include "dynsparse/pruning/top_k.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

namespace dynsparse {
namespace pruning {

namespace {

/// NaN sorts just above -inf
inline float rank_key(float v) {
    return std::isnan(v) ? std::numeric_limits<float>::lowest() : v;
}

} // anonymous namespace

std::vector<float> select_top_k(const std::vector<float>& scores,
                                int64_t keep_count,
                                int64_t total_count)
{
    if (total_count != static_cast<int64_t>(scores.size())) {
        throw std::invalid_argument(
            "select_top_k: total_count " + std::to_string(total_count) +
            " does not match " + std::to_string(scores.size()) + " scores");
    }
    if (keep_count < 0 || keep_count > total_count) {
        throw std::invalid_argument(
            "select_top_k: keep_count " + std::to_string(keep_count) +
            " outside [0, " + std::to_string(total_count) + "]");
    }

    std::vector<float> mask(scores.size(), 0.0f);
    if (keep_count == 0) {
        return mask;
    }
    if (keep_count == total_count) {
        std::fill(mask.begin(), mask.end(), 1.0f);
        return mask;
    }

    std::vector<int64_t> order(scores.size());
    std::iota(order.begin(), order.end(), int64_t{0});

    // Strict total order: higher score first, then lower index
    auto before = [&scores](int64_t a, int64_t b) {
        float ka = rank_key(scores[static_cast<size_t>(a)]);
        float kb = rank_key(scores[static_cast<size_t>(b)]);
        if (ka != kb) return ka > kb;
        return a < b;
    };

    std::nth_element(order.begin(), order.begin() + (keep_count - 1), order.end(), before);

    for (int64_t i = 0; i < keep_count; ++i) {
        mask[static_cast<size_t>(order[static_cast<size_t>(i)])] = 1.0f;
    }
    return mask;
}

Tensor select_top_k(const Tensor& scores, int64_t keep_count) {
    if (scores.dtype() != DType::Float32) {
        throw std::invalid_argument(
            "select_top_k expects float32 scores, got " + dtype_name(scores.dtype()));
    }
    std::vector<float> flat = scores.to_vector<float>();
    std::vector<float> mask = select_top_k(flat, keep_count,
                                           static_cast<int64_t>(flat.size()));
    return Tensor::from_vector(scores.shape(), mask);
}

} // namespace pruning
} // namespace dynsparse
