#include "dynsparse/training/pruning_optimizer.hpp"
#include "dynsparse/errors.hpp"
#include <iostream>
#include <set>
#include <stdexcept>

namespace dynsparse {
namespace training {

using pruning::kMaskSlot;
using pruning::kMomentumSlot;

namespace {

void apply_mask(Tensor& weight, const Tensor& mask) {
    float* w = weight.data_ptr<float>();
    const float* m = mask.data_ptr<float>();
    const int64_t n = weight.num_elements();
    for (int64_t i = 0; i < n; ++i) {
        if (m[i] == 0.0f) {
            w[i] = 0.0f;
        }
    }
}

} // anonymous namespace

PruningOptimizer::PruningOptimizer(std::shared_ptr<const pruning::PrunerMap> pruners,
                                   OptimizerOptions options)
    : pruners_(std::move(pruners))
    , options_(std::move(options))
{
    auto errors = options_.validate();
    if (!pruners_) {
        errors.push_back("pruner map must be set");
    }
    if (!errors.empty()) {
        throw ConfigurationError(errors);
    }

    for (Tensor* weight : pruners_->weights()) {
        store_.name_variable(*weight, pruners_->name_of(*weight));

        if (auto pruner = pruners_->get_pruner(*weight)) {
            pruner->create_slots(store_, *weight);
            apply_mask(*weight, store_.get_slot(*weight, kMaskSlot));
        }
        if (options_.momentum > 0.0) {
            if (weight->dtype() != DType::Float32) {
                throw DTypeMismatchError(store_.variable_name(*weight), "float32",
                                         dtype_name(weight->dtype()));
            }
            store_.create_slot(*weight, kMomentumSlot,
                               Tensor(weight->shape(), DType::Float32));
        }
    }

    log("debug", "Configured " + std::to_string(pruners_->size()) + " variables (" +
                 std::to_string(pruners_->num_prunable()) + " prunable)");
}

const Tensor& PruningOptimizer::mask(const Tensor& weight) const {
    return store_.get_slot(weight, kMaskSlot);
}

// ============================================================================
// Execution
// ============================================================================

StepResult PruningOptimizer::apply_gradients(const std::vector<GradientPair>& grads_and_vars) {
    return step(grads_and_vars, true);
}

std::vector<StepResult> PruningOptimizer::run_steps(int64_t num_steps,
                                                    const GradientProvider& provider) {
    if (num_steps < 0) {
        throw std::invalid_argument("run_steps: num_steps must be >= 0, got " +
                                    std::to_string(num_steps));
    }
    if (!provider) {
        throw std::invalid_argument("run_steps: gradient provider is empty");
    }

    const int64_t first = iterations_;
    const std::vector<int64_t> plan = planned_update_steps(first, first + num_steps);
    log("debug", "Planned " + std::to_string(plan.size()) + " mask updates in steps [" +
                 std::to_string(first) + ", " + std::to_string(first + num_steps) + ")");

    std::vector<StepResult> results;
    results.reserve(static_cast<size_t>(num_steps));
    auto next_update = plan.begin();
    for (int64_t s = 0; s < num_steps; ++s) {
        const int64_t current = iterations_;
        bool may_update = next_update != plan.end() && *next_update == current;
        if (may_update) {
            ++next_update;
        }
        results.push_back(step(provider(current), may_update));
    }
    return results;
}

std::vector<int64_t> PruningOptimizer::planned_update_steps(int64_t first, int64_t last) const {
    std::set<int64_t> steps;
    for (const auto& pruner : pruners_->pruners()) {
        for (int64_t s : pruner->schedule().update_steps(first, last)) {
            steps.insert(s);
        }
    }
    return std::vector<int64_t>(steps.begin(), steps.end());
}

StepResult PruningOptimizer::step(const std::vector<GradientPair>& grads_and_vars,
                                  bool may_update) {
    StepResult result;
    result.step = iterations_;

    // Validate every pair before touching any weight, so a rejected step
    // leaves weights, masks and the iteration counter unchanged
    std::vector<std::shared_ptr<pruning::RiglPruner>> pruners;
    pruners.reserve(grads_and_vars.size());
    for (const auto& gv : grads_and_vars) {
        if (gv.weight == nullptr) {
            throw std::invalid_argument("apply_gradients: null weight");
        }
        const Tensor& weight = *gv.weight;
        auto pruner = pruners_->get_pruner(weight);

        if (gv.gradient.dtype() != DType::Float32) {
            throw DTypeMismatchError(store_.variable_name(weight) + "/gradient", "float32",
                                     dtype_name(gv.gradient.dtype()));
        }
        if (gv.gradient.num_elements() != weight.num_elements()) {
            throw ShapeMismatchError(store_.variable_name(weight) + "/gradient",
                                     dims_to_string(weight.shape()),
                                     dims_to_string(gv.gradient.shape()));
        }
        if (pruner) {
            store_.get_slot(weight, kMaskSlot);
        }
        if (options_.momentum > 0.0) {
            store_.get_slot(weight, kMomentumSlot);
        }
        pruners.push_back(std::move(pruner));
    }

    for (size_t i = 0; i < grads_and_vars.size(); ++i) {
        const GradientPair& gv = grads_and_vars[i];
        Tensor& weight = *gv.weight;
        const auto& pruner = pruners[i];

        if (!pruner) {
            sgd_update(weight, gv.gradient, nullptr);
            continue;
        }

        if (!may_update) {
            sgd_update(weight, gv.gradient, &store_.get_slot(weight, kMaskSlot));
            continue;
        }

        Tensor gradient = pruner->preprocess(store_, weight, gv.gradient, result.step);
        sgd_update(weight, gradient, &store_.get_slot(weight, kMaskSlot));
        pruning::MaskUpdateResult update =
            pruner->postprocess(store_, weight, gradient, result.step);
        apply_mask(weight, store_.get_slot(weight, kMaskSlot));

        if (update.updated) {
            ++result.mask_updates;
            result.new_connections += update.new_connections;
            log("info", "step " + std::to_string(result.step) + ": '" +
                        store_.variable_name(weight) + "' dropped " +
                        std::to_string(update.dropped) + ", grew " +
                        std::to_string(update.grown) + " blocks");
        }
    }

    log("debug", "step " + std::to_string(result.step) + " done (" +
                 std::to_string(result.mask_updates) + " mask updates)");
    ++iterations_;
    return result;
}

void PruningOptimizer::sgd_update(Tensor& weight, const Tensor& gradient, const Tensor* mask) {
    float* w = weight.data_ptr<float>();
    const float* g = gradient.data_ptr<float>();
    const float* m = mask ? mask->data_ptr<float>() : nullptr;
    const float lr = static_cast<float>(options_.learning_rate);
    const int64_t n = weight.num_elements();

    if (options_.momentum > 0.0) {
        float* v = store_.get_slot(weight, kMomentumSlot).data_ptr<float>();
        const float mu = static_cast<float>(options_.momentum);
        for (int64_t i = 0; i < n; ++i) {
            float gi = m ? g[i] * m[i] : g[i];
            v[i] = mu * v[i] + gi;
            w[i] -= lr * v[i];
        }
        return;
    }

    for (int64_t i = 0; i < n; ++i) {
        float gi = m ? g[i] * m[i] : g[i];
        w[i] -= lr * gi;
    }
}

void PruningOptimizer::log(const std::string& level, const std::string& message) const {
    if (log_level_rank(level) < log_level_rank(options_.log_level)) {
        return;
    }
    std::cerr << "[dynsparse:" << level << "] " << message << "\n";
}

} // namespace training
} // namespace dynsparse
