#pragma once

#include "dynsparse/tensor.hpp"
#include "dynsparse/types.hpp"
#include "dynsparse/pruning/random_stream.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace dynsparse {
namespace pruning {

/// Round to nearest, ties to even. Used for every count derived from a
/// fraction (initial active count, drop count).
int64_t round_half_to_even(double x);

/// Number of active positions for `total` positions at `sparsity`.
/// Throws ConfigurationError if sparsity is outside [0, 1) or the
/// result is not positive.
int64_t active_count(int64_t total, double sparsity);

// ============================================================================
// Initial mask
// ============================================================================

/// Chooses the initial active set of a freshly created mask
class SparseDistribution {
public:
    virtual ~SparseDistribution() = default;

    /// 0/1 vector of length `total` with exactly active_count(total, sparsity) ones
    virtual std::vector<float> initial_mask(int64_t total, double sparsity,
                                            RandomStream& rng) const = 0;

    virtual std::string name() const = 0;
};

/// Uniformly permute positions, activate the first N
class PermuteOnes : public SparseDistribution {
public:
    std::vector<float> initial_mask(int64_t total, double sparsity,
                                    RandomStream& rng) const override;

    std::string name() const override { return "permute_ones"; }
};

/// Create a distribution by name ("permute_ones")
std::shared_ptr<SparseDistribution> make_sparse_distribution(const std::string& name);

/// 0/1 vector with exactly active_count(size, sparsity) ones placed on the
/// highest `block_density` values. Equal densities are ordered by a
/// permutation drawn from `rng`.
std::vector<float> density_initial_mask(const std::vector<float>& block_density,
                                        double sparsity,
                                        RandomStream& rng);

/// Element-resolution initial mask for `shape`, one decision per block
Tensor initial_mask_density(const std::vector<int64_t>& shape,
                            double target_sparsity,
                            int64_t seed,
                            int64_t seed_offset = 0,
                            BlockSize block = BlockSize{});

// ============================================================================
// Layer-level sparsity assignment
// ============================================================================

/// How an overall sparsity target is spread across layers
enum class LayerDistribution {
    Uniform,      // Every layer gets the overall sparsity
    ErdosRenyi    // Density proportional to sum(shape) / prod(shape)
};

LayerDistribution layer_distribution_from_name(const std::string& name);
std::string layer_distribution_name(LayerDistribution distribution);

/// Per-layer sparsities whose parameter-weighted mean equals `overall_sparsity`.
/// Erdos-Renyi layers that would exceed density 1 are kept dense.
std::vector<double> layer_sparsities(const std::vector<std::vector<int64_t>>& shapes,
                                     double overall_sparsity,
                                     LayerDistribution distribution);

} // namespace pruning
} // namespace dynsparse
