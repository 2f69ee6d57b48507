#pragma once

#include "dynsparse/tensor.hpp"
#include "dynsparse/options.hpp"
#include "dynsparse/pruning/pruning_config.hpp"
#include "dynsparse/pruning/slot_store.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace dynsparse {
namespace training {

/// A weight and the gradient of the loss with respect to it
struct GradientPair {
    Tensor* weight;
    Tensor gradient;
};

/// Produces the gradients for one training step
using GradientProvider = std::function<std::vector<GradientPair>(int64_t step)>;

/// Per-step summary returned by apply_gradients
struct StepResult {
    int64_t step = -1;
    int64_t mask_updates = 0;      // Variables whose mask changed
    int64_t new_connections = 0;   // Elements regrown across all variables
};

/// SGD (optionally with momentum) that drives the RigL pruners of a model.
///
/// Owns the SlotStore and the iteration counter. For every weight of a
/// step: preprocess, masked SGD update, postprocess, then re-apply the
/// (possibly new) mask so inactive weights stay exactly zero.
///
/// The weights referenced by the PrunerMap must outlive the optimizer.
class PruningOptimizer {
public:
    /// Allocates pruner slots for every prunable weight and zeroes the
    /// weights outside their initial masks.
    /// Throws ConfigurationError if `options` are invalid.
    PruningOptimizer(std::shared_ptr<const pruning::PrunerMap> pruners,
                     OptimizerOptions options = {});

    /// Eager execution: one optimizer step. All pairs are checked first;
    /// if any is rejected nothing is updated and the step is not counted.
    StepResult apply_gradients(const std::vector<GradientPair>& grads_and_vars);

    /// Batched execution: `num_steps` steps in one call. Update steps of
    /// the window are planned from the schedules up front; results are
    /// identical to calling apply_gradients once per step.
    std::vector<StepResult> run_steps(int64_t num_steps, const GradientProvider& provider);

    /// Steps in [first, last) on which at least one pruner updates
    std::vector<int64_t> planned_update_steps(int64_t first, int64_t last) const;

    int64_t iterations() const { return iterations_; }
    const OptimizerOptions& options() const { return options_; }

    pruning::SlotStore& slots() { return store_; }
    const pruning::SlotStore& slots() const { return store_; }
    const pruning::PrunerMap& pruner_map() const { return *pruners_; }

    /// Mask of `weight`; throws UnconfiguredStateError for dense weights
    const Tensor& mask(const Tensor& weight) const;

private:
    StepResult step(const std::vector<GradientPair>& grads_and_vars, bool may_update);

    void sgd_update(Tensor& weight, const Tensor& gradient, const Tensor* mask);

    void log(const std::string& level, const std::string& message) const;

    std::shared_ptr<const pruning::PrunerMap> pruners_;
    OptimizerOptions options_;
    pruning::SlotStore store_;
    int64_t iterations_ = 0;
};

} // namespace training
} // namespace dynsparse
