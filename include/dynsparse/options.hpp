#pragma once

#include "dynsparse/types.hpp"
#include "dynsparse/tensor.hpp"
#include "dynsparse/pruning/schedule.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace dynsparse {

/// Configuration of one RigL pruner (one weight group).
/// Immutable once handed to a RiglPruner.
struct RiglConfig {
    // When to update and how much to drop
    std::shared_ptr<pruning::UpdateSchedule> schedule;

    // Fraction of inactive positions, in [0, 1)
    double sparsity = 0.5;

    // Selection granularity
    BlockSize block_size{1, 1};
    std::string block_pooling = "average";  // "average" (or "avg") or "max"

    // Initial mask
    std::string sparse_distribution = "permute_ones";

    // Optional per-element probability of starting active, shaped like the
    // weight. When set, the initial mask keeps the blocks with the highest
    // average density (exactly as many as `sparsity` allows) and ignores
    // `sparse_distribution`.
    std::shared_ptr<const Tensor> density;

    // Randomness
    int64_t seed = 0;
    int64_t seed_offset = 0;
    double noise_std = 0.0;  // Stddev of noise added to grow scores

    // Grown connections
    // "zeros", "random_normal" (alias "randomized"), "random_uniform", "constant"
    std::string grow_init = "zeros";
    double grow_init_value = 0.01;    // Constant value, normal stddev, or uniform half-width
    bool reinit_when_same = false;    // Dropped-and-regrown positions count as new
    bool reset_momentum = false;      // Zero the momentum slot at new connections

    // Allocate a zero-initialized "momentum" slot alongside the mask
    bool momentum_buffer = false;

    // Log each committed update to stderr
    bool verbose = false;

    /// Validate configuration, returns list of errors
    std::vector<std::string> validate() const;
};

/// Options for the reference SGD host optimizer
struct OptimizerOptions {
    double learning_rate = 0.01;
    double momentum = 0.0;  // 0 disables the momentum buffer

    // Logging
    std::string log_level = "warning";  // "debug", "info", "warning", "error"

    /// Validate options, returns list of errors
    std::vector<std::string> validate() const;
};

/// Numeric severity of a log level name ("debug" = 0 ... "error" = 3)
int log_level_rank(const std::string& level);

} // namespace dynsparse
