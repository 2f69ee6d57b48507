#pragma once

#include "dynsparse/tensor.hpp"
#include "dynsparse/options.hpp"
#include "dynsparse/pruning/block_pooling.hpp"
#include "dynsparse/pruning/schedule.hpp"
#include "dynsparse/pruning/slot_store.hpp"
#include "dynsparse/pruning/sparse_distribution.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace dynsparse {
namespace pruning {

/// Value assigned to weights at newly grown connections
enum class GrowInit {
    Zeros,          // Explicit zero
    RandomNormal,   // N(0, grow_init_value^2)
    RandomUniform,  // U(-grow_init_value, grow_init_value)
    Constant        // grow_init_value
};

/// Parse grow-init policy ("zeros", "random_normal" or "randomized",
/// "random_uniform", "constant")
GrowInit grow_init_from_name(const std::string& name);
std::string grow_init_name(GrowInit init);

/// Summary of what postprocess committed
struct MaskUpdateResult {
    bool updated = false;
    int64_t step = -1;
    int64_t active = 0;           // Active blocks before and after
    int64_t dropped = 0;          // Blocks removed by the drop pass
    int64_t grown = 0;            // Blocks selected by the grow pass
    int64_t new_connections = 0;  // Elements reinitialized
};

/// RigL mask-update engine for one weight group.
///
/// The pruner holds only immutable configuration; every per-variable
/// state (mask, momentum, the pending update between preprocess and
/// postprocess) lives in the caller's SlotStore, so one pruner may serve
/// several weights of the same layer.
///
/// Per step the host calls preprocess() with the pre-update weight and
/// gradient, applies its own weight update, then calls postprocess().
class RiglPruner {
public:
    /// Throws ConfigurationError if `config` is invalid
    explicit RiglPruner(RiglConfig config);

    /// Allocate the mask (and momentum, if configured) for `weight`.
    /// No-op if the mask already exists.
    void create_slots(SlotStore& store, const Tensor& weight) const;

    /// Compute the drop/grow decision on update steps. Returns the
    /// gradient unchanged; noise only perturbs grow scores.
    Tensor preprocess(SlotStore& store, const Tensor& weight,
                      const Tensor& gradient, int64_t step) const;

    /// Commit the decision made by preprocess() for the same step:
    /// write the new mask, reinitialize new connections, optionally
    /// reset their momentum. No-op on non-update steps.
    MaskUpdateResult postprocess(SlotStore& store, Tensor& weight,
                                 const Tensor& gradient, int64_t step) const;

    /// preprocess() followed by postprocess() with no weight update in between
    MaskUpdateResult update_mask(SlotStore& store, Tensor& weight,
                                 const Tensor& gradient, int64_t step) const;

    /// Grow scores at block resolution: pooled |gradient|, plus seeded
    /// noise at positions where `mask` is zero
    std::vector<float> get_grow_scores(const Tensor& mask, const Tensor& gradient,
                                       int64_t step) const;

    const RiglConfig& config() const { return config_; }
    const UpdateSchedule& schedule() const { return *config_.schedule; }
    double target_sparsity() const { return config_.sparsity; }
    PoolingKind pooling() const { return pooling_; }
    GrowInit grow_init() const { return grow_init_; }

private:
    PendingMaskUpdate plan_update(std::vector<float> block_mask,
                                  const Tensor& weight,
                                  const Tensor& gradient,
                                  const BlockLayout& layout,
                                  int64_t active,
                                  int64_t drop_count,
                                  int64_t step) const;

    std::vector<float> grow_scores(const std::vector<float>& block_mask,
                                   const Tensor& gradient,
                                   const BlockLayout& layout,
                                   int64_t step) const;

    void check_operands(const SlotStore& store, const Tensor& weight,
                        const Tensor& gradient) const;

    RiglConfig config_;
    PoolingKind pooling_;
    GrowInit grow_init_;
    std::shared_ptr<SparseDistribution> distribution_;
};

} // namespace pruning
} // namespace dynsparse
