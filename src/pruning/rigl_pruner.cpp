#include "dynsparse/pruning/rigl_pruner.hpp"
#include "dynsparse/pruning/random_stream.hpp"
#include "dynsparse/pruning/top_k.hpp"
#include "dynsparse/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace dynsparse {
namespace pruning {

namespace {

constexpr float kExcluded = -std::numeric_limits<float>::infinity();

int64_t count_ones(const std::vector<float>& mask) {
    return static_cast<int64_t>(std::count_if(mask.begin(), mask.end(),
        [](float v) { return v != 0.0f; }));
}

} // anonymous namespace

GrowInit grow_init_from_name(const std::string& name) {
    if (name == "zeros") return GrowInit::Zeros;
    if (name == "random_normal" || name == "randomized") return GrowInit::RandomNormal;
    if (name == "random_uniform") return GrowInit::RandomUniform;
    if (name == "constant") return GrowInit::Constant;
    throw ConfigurationError("Unsupported grow_init: '" + name +
        "'. Supported: zeros, random_normal, random_uniform, constant");
}

std::string grow_init_name(GrowInit init) {
    switch (init) {
        case GrowInit::Zeros: return "zeros";
        case GrowInit::RandomNormal: return "random_normal";
        case GrowInit::RandomUniform: return "random_uniform";
        case GrowInit::Constant: return "constant";
    }
    return "unknown";
}

// ============================================================================
// Construction and slots
// ============================================================================

RiglPruner::RiglPruner(RiglConfig config)
    : config_(std::move(config))
{
    auto errors = config_.validate();
    if (!errors.empty()) {
        throw ConfigurationError(errors);
    }
    pooling_ = pooling_from_name(config_.block_pooling);
    grow_init_ = grow_init_from_name(config_.grow_init);
    distribution_ = make_sparse_distribution(config_.sparse_distribution);
}

void RiglPruner::create_slots(SlotStore& store, const Tensor& weight) const {
    if (store.has_slot(weight, kMaskSlot)) {
        return;
    }
    if (weight.dtype() != DType::Float32) {
        throw DTypeMismatchError(store.variable_name(weight), "float32",
                                 dtype_name(weight.dtype()));
    }

    BlockLayout layout = BlockLayout::make(weight.shape(), config_.block_size);
    RandomStream rng(config_.seed, config_.seed_offset, 0, StreamPurpose::InitialMask);
    std::vector<float> block_mask;
    if (config_.density) {
        if (config_.density->shape() != weight.shape()) {
            throw ShapeMismatchError(store.variable_name(weight) + "/density",
                                     dims_to_string(weight.shape()),
                                     dims_to_string(config_.density->shape()));
        }
        std::vector<float> block_density =
            pool_abs(config_.density->data_ptr<float>(), layout, PoolingKind::Average);
        block_mask = density_initial_mask(block_density, config_.sparsity, rng);
    } else {
        block_mask = distribution_->initial_mask(layout.num_blocks(), config_.sparsity, rng);
    }

    Tensor mask(weight.shape(), DType::Float32);
    expand(block_mask, layout, mask.data_ptr<float>());
    store.create_slot(weight, kMaskSlot, std::move(mask));

    if (config_.momentum_buffer) {
        store.create_slot(weight, kMomentumSlot, Tensor(weight.shape(), DType::Float32));
    }
}

void RiglPruner::check_operands(const SlotStore& store, const Tensor& weight,
                                const Tensor& gradient) const {
    if (gradient.dtype() != DType::Float32) {
        throw DTypeMismatchError(store.variable_name(weight) + "/gradient", "float32",
                                 dtype_name(gradient.dtype()));
    }
    if (gradient.num_elements() != weight.num_elements()) {
        throw ShapeMismatchError(store.variable_name(weight) + "/gradient",
                                 dims_to_string(weight.shape()),
                                 dims_to_string(gradient.shape()));
    }
}

// ============================================================================
// Scoring
// ============================================================================

std::vector<float> RiglPruner::grow_scores(const std::vector<float>& block_mask,
                                           const Tensor& gradient,
                                           const BlockLayout& layout,
                                           int64_t step) const {
    std::vector<float> scores = pool_abs(gradient.data_ptr<float>(), layout, pooling_);
    if (config_.noise_std > 0.0) {
        // One draw per block in index order, applied to inactive blocks only
        RandomStream rng(config_.seed, config_.seed_offset, step, StreamPurpose::GrowNoise);
        for (size_t b = 0; b < scores.size(); ++b) {
            float noise = static_cast<float>(rng.normal(config_.noise_std));
            if (block_mask[b] == 0.0f) {
                scores[b] += noise;
            }
        }
    }
    return scores;
}

std::vector<float> RiglPruner::get_grow_scores(const Tensor& mask, const Tensor& gradient,
                                               int64_t step) const {
    if (mask.num_elements() != gradient.num_elements()) {
        throw ShapeMismatchError("gradient", dims_to_string(mask.shape()),
                                 dims_to_string(gradient.shape()));
    }
    BlockLayout layout = BlockLayout::make(mask.shape(), config_.block_size);
    return grow_scores(pool_mask(mask.data_ptr<float>(), layout), gradient, layout, step);
}

PendingMaskUpdate RiglPruner::plan_update(std::vector<float> block_mask,
                                          const Tensor& weight,
                                          const Tensor& gradient,
                                          const BlockLayout& layout,
                                          int64_t active,
                                          int64_t drop_count,
                                          int64_t step) const {
    const int64_t nb = layout.num_blocks();

    // Drop pass: keep the strongest active blocks; inactive ones can't be kept
    std::vector<float> drop_scores = pool_abs(weight.data_ptr<float>(), layout, pooling_);
    for (int64_t b = 0; b < nb; ++b) {
        if (block_mask[b] == 0.0f) {
            drop_scores[b] = kExcluded;
        }
    }
    std::vector<float> kept = select_top_k(drop_scores, active - drop_count, nb);

    // Grow pass: best gradients among everything not kept
    std::vector<float> scores = grow_scores(kept, gradient, layout, step);
    for (int64_t b = 0; b < nb; ++b) {
        if (kept[b] != 0.0f) {
            scores[b] = kExcluded;
        }
    }
    std::vector<float> grown = select_top_k(scores, drop_count, nb);

    PendingMaskUpdate update;
    update.step = step;
    update.old_mask = std::move(block_mask);
    update.kept_mask = std::move(kept);
    update.grown_mask = std::move(grown);
    update.dropped = drop_count;
    return update;
}

// ============================================================================
// Step protocol
// ============================================================================

Tensor RiglPruner::preprocess(SlotStore& store, const Tensor& weight,
                              const Tensor& gradient, int64_t step) const {
    const Tensor& mask = store.get_slot(weight, kMaskSlot);
    if (!config_.schedule->should_update(step)) {
        return gradient.clone();
    }
    check_operands(store, weight, gradient);

    BlockLayout layout = BlockLayout::make(weight.shape(), config_.block_size);
    std::vector<float> block_mask = pool_mask(mask.data_ptr<float>(), layout);
    const int64_t active = count_ones(block_mask);

    int64_t drop_count = round_half_to_even(
        config_.schedule->drop_fraction(step) * static_cast<double>(active));
    drop_count = std::clamp<int64_t>(drop_count, 0, active);

    if (drop_count == 0) {
        // Nothing moves; make sure no stale decision survives either
        store.take_pending(weight);
        return gradient.clone();
    }

    store.set_pending(weight, plan_update(std::move(block_mask), weight, gradient,
                                          layout, active, drop_count, step));
    return gradient.clone();
}

MaskUpdateResult RiglPruner::postprocess(SlotStore& store, Tensor& weight,
                                         const Tensor& /*gradient*/, int64_t step) const {
    MaskUpdateResult result;
    result.step = step;

    Tensor& mask = store.get_slot(weight, kMaskSlot);
    std::optional<PendingMaskUpdate> pending = store.take_pending(weight);
    if (!pending.has_value()) {
        return result;
    }
    if (pending->step != step) {
        if (config_.verbose) {
            std::cerr << "Warning: discarding mask update planned at step "
                      << pending->step << " for '" << store.variable_name(weight)
                      << "' (postprocess called at step " << step << ")\n";
        }
        return result;
    }

    BlockLayout layout = BlockLayout::make(weight.shape(), config_.block_size);
    const int64_t nb = layout.num_blocks();

    std::vector<float> new_mask(static_cast<size_t>(nb), 0.0f);
    std::vector<char> is_new(static_cast<size_t>(nb), 0);
    for (int64_t b = 0; b < nb; ++b) {
        bool grown = pending->grown_mask[b] != 0.0f;
        new_mask[b] = (pending->kept_mask[b] != 0.0f || grown) ? 1.0f : 0.0f;
        is_new[b] = grown && (config_.reinit_when_same || pending->old_mask[b] == 0.0f);
    }
    expand(new_mask, layout, mask.data_ptr<float>());

    // Reinitialize new connections, element by element in index order
    float* w = weight.data_ptr<float>();
    float* momentum = nullptr;
    if (config_.reset_momentum && store.has_slot(weight, kMomentumSlot)) {
        momentum = store.get_slot(weight, kMomentumSlot).data_ptr<float>();
    }
    RandomStream rng(config_.seed, config_.seed_offset, step, StreamPurpose::GrowInit);
    const float scale = static_cast<float>(config_.grow_init_value);

    int64_t new_connections = 0;
    const int64_t n = layout.num_elements();
    for (int64_t i = 0; i < n; ++i) {
        if (!is_new[layout.block_of(i)]) {
            continue;
        }
        switch (grow_init_) {
            case GrowInit::Zeros:
                w[i] = 0.0f;
                break;
            case GrowInit::Constant:
                w[i] = scale;
                break;
            case GrowInit::RandomNormal:
                w[i] = static_cast<float>(rng.normal(config_.grow_init_value));
                break;
            case GrowInit::RandomUniform:
                w[i] = static_cast<float>(rng.uniform(-config_.grow_init_value,
                                                      config_.grow_init_value));
                break;
        }
        if (momentum) {
            momentum[i] = 0.0f;
        }
        ++new_connections;
    }

    result.updated = true;
    result.active = count_ones(new_mask);
    result.dropped = pending->dropped;
    result.grown = count_ones(pending->grown_mask);
    result.new_connections = new_connections;

    if (config_.verbose) {
        std::cerr << "RigL update: variable=" << store.variable_name(weight)
                  << " step=" << step
                  << " active=" << result.active
                  << " dropped=" << result.dropped
                  << " grown=" << result.grown
                  << " new_connections=" << result.new_connections
                  << "\n";
    }
    return result;
}

MaskUpdateResult RiglPruner::update_mask(SlotStore& store, Tensor& weight,
                                         const Tensor& gradient, int64_t step) const {
    Tensor grad = preprocess(store, weight, gradient, step);
    return postprocess(store, weight, grad, step);
}

} // namespace pruning
} // namespace dynsparse
