#include "dynsparse/pruning/sparse_distribution.hpp"
#include "dynsparse/pruning/block_pooling.hpp"
#include "dynsparse/errors.hpp"
#include <algorithm>
#include <cmath>
#include <set>

namespace dynsparse {
namespace pruning {

int64_t round_half_to_even(double x) {
    double floor_x = std::floor(x);
    double diff = x - floor_x;
    if (diff > 0.5) return static_cast<int64_t>(floor_x) + 1;
    if (diff < 0.5) return static_cast<int64_t>(floor_x);
    int64_t lower = static_cast<int64_t>(floor_x);
    return (lower % 2 == 0) ? lower : lower + 1;
}

int64_t active_count(int64_t total, double sparsity) {
    if (!(sparsity >= 0.0 && sparsity < 1.0)) {
        throw ConfigurationError("sparsity must be in [0, 1) (got " +
                                 std::to_string(sparsity) + ")");
    }
    int64_t active = round_half_to_even((1.0 - sparsity) * static_cast<double>(total));
    if (total > 0 && active <= 0) {
        throw ConfigurationError("sparsity " + std::to_string(sparsity) +
            " leaves no active positions out of " + std::to_string(total));
    }
    return std::min(active, total);
}

// ============================================================================
// PermuteOnes
// ============================================================================

std::vector<float> PermuteOnes::initial_mask(int64_t total, double sparsity,
                                             RandomStream& rng) const {
    int64_t n_ones = active_count(total, sparsity);
    std::vector<float> mask(static_cast<size_t>(total), 0.0f);
    std::vector<int64_t> perm = rng.permutation(total);
    for (int64_t i = 0; i < n_ones; ++i) {
        mask[static_cast<size_t>(perm[static_cast<size_t>(i)])] = 1.0f;
    }
    return mask;
}

std::vector<float> density_initial_mask(const std::vector<float>& block_density,
                                        double sparsity,
                                        RandomStream& rng) {
    const int64_t total = static_cast<int64_t>(block_density.size());
    int64_t n_ones = active_count(total, sparsity);

    std::vector<int64_t> perm = rng.permutation(total);
    std::vector<int64_t> rank(perm.size());
    for (size_t i = 0; i < perm.size(); ++i) {
        rank[static_cast<size_t>(perm[i])] = static_cast<int64_t>(i);
    }

    std::vector<int64_t> order(perm.size());
    for (size_t i = 0; i < order.size(); ++i) order[i] = static_cast<int64_t>(i);
    std::sort(order.begin(), order.end(), [&](int64_t a, int64_t b) {
        float da = block_density[static_cast<size_t>(a)];
        float db = block_density[static_cast<size_t>(b)];
        if (da != db) return da > db;
        return rank[static_cast<size_t>(a)] < rank[static_cast<size_t>(b)];
    });

    std::vector<float> mask(perm.size(), 0.0f);
    for (int64_t i = 0; i < n_ones; ++i) {
        mask[static_cast<size_t>(order[static_cast<size_t>(i)])] = 1.0f;
    }
    return mask;
}

std::shared_ptr<SparseDistribution> make_sparse_distribution(const std::string& name) {
    if (name == "permute_ones") {
        return std::make_shared<PermuteOnes>();
    }
    throw ConfigurationError("Unknown sparse distribution: '" + name +
                             "'. Supported: permute_ones");
}

Tensor initial_mask_density(const std::vector<int64_t>& shape,
                            double target_sparsity,
                            int64_t seed,
                            int64_t seed_offset,
                            BlockSize block)
{
    BlockLayout layout = BlockLayout::make(shape, block);
    RandomStream rng(seed, seed_offset, 0, StreamPurpose::InitialMask);
    std::vector<float> block_mask =
        PermuteOnes().initial_mask(layout.num_blocks(), target_sparsity, rng);

    Tensor mask(shape, DType::Float32);
    expand(block_mask, layout, mask.data_ptr<float>());
    return mask;
}

// ============================================================================
// Layer distributions
// ============================================================================

LayerDistribution layer_distribution_from_name(const std::string& name) {
    if (name == "uniform") return LayerDistribution::Uniform;
    if (name == "erdos_renyi" || name == "erk") return LayerDistribution::ErdosRenyi;
    throw ConfigurationError("Unknown layer sparsity distribution: '" + name +
                             "'. Supported: uniform, erdos_renyi");
}

std::string layer_distribution_name(LayerDistribution distribution) {
    switch (distribution) {
        case LayerDistribution::Uniform: return "uniform";
        case LayerDistribution::ErdosRenyi: return "erdos_renyi";
    }
    return "unknown";
}

std::vector<double> layer_sparsities(const std::vector<std::vector<int64_t>>& shapes,
                                     double overall_sparsity,
                                     LayerDistribution distribution)
{
    if (!(overall_sparsity >= 0.0 && overall_sparsity < 1.0)) {
        throw ConfigurationError("sparsity must be in [0, 1) (got " +
                                 std::to_string(overall_sparsity) + ")");
    }

    std::vector<double> result(shapes.size(), overall_sparsity);
    if (distribution == LayerDistribution::Uniform || shapes.empty()) {
        return result;
    }

    std::vector<double> n_params(shapes.size());
    std::vector<double> raw_density(shapes.size());
    for (size_t i = 0; i < shapes.size(); ++i) {
        int64_t prod = checked_product(shapes[i]);
        if (shapes[i].empty() || prod == 0) {
            throw ConfigurationError("Cannot assign sparsity to empty shape " +
                                     dims_to_string(shapes[i]));
        }
        int64_t sum = 0;
        for (int64_t d : shapes[i]) sum += d;
        n_params[i] = static_cast<double>(prod);
        raw_density[i] = static_cast<double>(sum) / static_cast<double>(prod);
    }

    // Solve eps * sum(raw_i * n_i) == overall density budget, moving layers
    // whose density would exceed 1 to the dense set until eps is feasible.
    std::set<size_t> dense;
    double eps = 0.0;
    while (true) {
        double rhs = 0.0;
        double divisor = 0.0;
        for (size_t i = 0; i < shapes.size(); ++i) {
            double n_zeros = n_params[i] * overall_sparsity;
            double n_ones = n_params[i] * (1.0 - overall_sparsity);
            if (dense.count(i)) {
                rhs -= n_zeros;
            } else {
                rhs += n_ones;
                divisor += raw_density[i] * n_params[i];
            }
        }
        if (divisor <= 0.0) {
            break;
        }
        eps = rhs / divisor;

        double max_raw = 0.0;
        for (size_t i = 0; i < shapes.size(); ++i) {
            if (!dense.count(i)) max_raw = std::max(max_raw, raw_density[i]);
        }
        if (max_raw * eps <= 1.0) {
            break;
        }
        for (size_t i = 0; i < shapes.size(); ++i) {
            if (!dense.count(i) && raw_density[i] == max_raw) {
                dense.insert(i);
            }
        }
    }

    for (size_t i = 0; i < shapes.size(); ++i) {
        result[i] = dense.count(i) ? 0.0 : 1.0 - eps * raw_density[i];
    }
    return result;
}

} // namespace pruning
} // namespace dynsparse
