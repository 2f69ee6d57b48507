#include <gtest/gtest.h>
#include "dynsparse/training/pruning_optimizer.hpp"
#include "dynsparse/errors.hpp"

#include <cmath>
#include <cstdint>

using namespace dynsparse;
using namespace dynsparse::pruning;
using namespace dynsparse::training;

namespace {

// Deterministic values in [-1, 1) from (seed, index)
float hashed_value(uint32_t seed, int64_t index) {
    uint32_t x = seed * 2654435761u + static_cast<uint32_t>(index) * 40503u + 1u;
    x ^= x << 13;
    x ^= x >> 17;
    x ^= x << 5;
    return static_cast<float>(x % 20000u) / 10000.0f - 1.0f;
}

Tensor hashed_tensor(const std::vector<int64_t>& shape, uint32_t seed) {
    Tensor t(shape, DType::Float32);
    float* p = t.data_ptr<float>();
    for (int64_t i = 0; i < t.num_elements(); ++i) {
        p[i] = hashed_value(seed, i);
    }
    return t;
}

/// Two-layer model with a dense bias on each layer
struct TinyModel {
    Tensor k1 = hashed_tensor({8, 6}, 1);
    Tensor b1 = hashed_tensor({6}, 2);
    Tensor k2 = hashed_tensor({6, 4}, 3);
    Tensor b2 = hashed_tensor({4}, 4);

    std::vector<LayerSpec> layers() {
        LayerSpec l1;
        l1.name = "dense_1";
        l1.type = "Dense";
        l1.weights = {&k1, &b1};
        l1.weight_names = {"kernel", "bias"};

        LayerSpec l2 = l1;
        l2.name = "dense_2";
        l2.weights = {&k2, &b2};
        return {l1, l2};
    }

    std::vector<GradientPair> gradients(int64_t step) {
        uint32_t s = static_cast<uint32_t>(100 + step * 7);
        return {
            {&k1, hashed_tensor(k1.shape(), s)},
            {&b1, hashed_tensor(b1.shape(), s + 1)},
            {&k2, hashed_tensor(k2.shape(), s + 2)},
            {&b2, hashed_tensor(b2.shape(), s + 3)},
        };
    }
};

RiglPruningConfig make_pruning_config() {
    RiglPruningConfig config;
    config.pruner.schedule = std::make_shared<ConstantSchedule>(0.3, 0, 20, 3);
    config.pruner.sparsity = 0.6;
    config.pruner.noise_std = 0.5;
    config.pruner.seed = 42;
    return config;
}

} // anonymous namespace

class PruningOptimizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        PruneRegistry::instance().reset_defaults();
        map_ = std::make_shared<PrunerMap>(make_pruning_config().build(model_.layers()));
    }

    std::unique_ptr<PruningOptimizer> make_optimizer(OptimizerOptions options = {}) {
        options.log_level = "error";
        return std::make_unique<PruningOptimizer>(map_, options);
    }

    TinyModel model_;
    std::shared_ptr<PrunerMap> map_;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(PruningOptimizerTest, ConstructionAppliesInitialMask) {
    auto opt = make_optimizer();

    const Tensor& mask = opt->mask(model_.k1);
    EXPECT_EQ(mask.count_nonzero(), 19);  // round(0.4 * 48)
    const float* w = model_.k1.data_ptr<float>();
    const float* m = mask.data_ptr<float>();
    for (int64_t i = 0; i < mask.num_elements(); ++i) {
        if (m[i] == 0.0f) {
            EXPECT_EQ(w[i], 0.0f);
        }
    }
    EXPECT_EQ(opt->slots().variable_name(model_.k1), "dense_1/kernel");
}

TEST_F(PruningOptimizerTest, DenseWeightsHaveNoMask) {
    auto opt = make_optimizer();
    EXPECT_THROW(opt->mask(model_.b1), UnconfiguredStateError);
}

TEST_F(PruningOptimizerTest, MomentumSlotForEveryWeight) {
    OptimizerOptions options;
    options.momentum = 0.9;
    auto opt = make_optimizer(options);

    EXPECT_TRUE(opt->slots().has_slot(model_.k1, kMomentumSlot));
    EXPECT_TRUE(opt->slots().has_slot(model_.b1, kMomentumSlot));
    EXPECT_FALSE(opt->slots().has_slot(model_.b1, kMaskSlot));
}

TEST_F(PruningOptimizerTest, InvalidOptions) {
    OptimizerOptions options;
    options.learning_rate = -1.0;
    EXPECT_THROW(PruningOptimizer opt(map_, options), ConfigurationError);

    options = OptimizerOptions{};
    options.log_level = "chatty";
    EXPECT_THROW(PruningOptimizer opt(map_, options), ConfigurationError);

    EXPECT_THROW(PruningOptimizer opt(nullptr), ConfigurationError);
}

// ============================================================================
// Stepping
// ============================================================================

TEST_F(PruningOptimizerTest, InactiveWeightsStayZero) {
    auto opt = make_optimizer();

    for (int64_t step = 0; step < 12; ++step) {
        opt->apply_gradients(model_.gradients(step));

        for (Tensor* w : {&model_.k1, &model_.k2}) {
            const float* wp = w->data_ptr<float>();
            const float* mp = opt->mask(*w).data_ptr<float>();
            for (int64_t i = 0; i < w->num_elements(); ++i) {
                if (mp[i] == 0.0f) {
                    ASSERT_EQ(wp[i], 0.0f) << "step " << step << " index " << i;
                }
            }
        }
    }
    EXPECT_EQ(opt->iterations(), 12);
}

TEST_F(PruningOptimizerTest, SparsityPreservedAcrossUpdates) {
    auto opt = make_optimizer();
    const int64_t active1 = opt->mask(model_.k1).count_nonzero();
    const int64_t active2 = opt->mask(model_.k2).count_nonzero();

    int64_t updates = 0;
    for (int64_t step = 0; step < 20; ++step) {
        StepResult r = opt->apply_gradients(model_.gradients(step));
        EXPECT_EQ(r.step, step);
        updates += r.mask_updates;
        EXPECT_EQ(opt->mask(model_.k1).count_nonzero(), active1);
        EXPECT_EQ(opt->mask(model_.k2).count_nonzero(), active2);
    }
    EXPECT_GT(updates, 0);
}

TEST_F(PruningOptimizerTest, MaskOnlyChangesOnUpdateSteps) {
    auto opt = make_optimizer();

    for (int64_t step = 0; step < 10; ++step) {
        Tensor before = opt->mask(model_.k1).clone();
        StepResult r = opt->apply_gradients(model_.gradients(step));
        if (step % 3 != 0) {
            EXPECT_EQ(r.mask_updates, 0);
            EXPECT_TRUE(opt->mask(model_.k1).equals(before)) << "step " << step;
        }
    }
}

TEST_F(PruningOptimizerTest, DenseBiasGetsPlainSgd) {
    OptimizerOptions options;
    options.learning_rate = 0.5;
    auto opt = make_optimizer(options);

    std::vector<float> before = model_.b1.to_vector<float>();
    auto grads = model_.gradients(0);
    std::vector<float> g = grads[1].gradient.to_vector<float>();
    opt->apply_gradients(grads);

    std::vector<float> after = model_.b1.to_vector<float>();
    for (size_t i = 0; i < after.size(); ++i) {
        EXPECT_FLOAT_EQ(after[i], before[i] - 0.5f * g[i]);
    }
}

TEST_F(PruningOptimizerTest, UnknownWeightRejected) {
    auto opt = make_optimizer();
    Tensor stranger({3}, DType::Float32);
    std::vector<GradientPair> grads;
    grads.push_back({&stranger, Tensor({3}, DType::Float32)});
    EXPECT_THROW(opt->apply_gradients(grads), UnconfiguredStateError);
}

TEST_F(PruningOptimizerTest, GradientShapeChecked) {
    auto opt = make_optimizer();
    std::vector<GradientPair> grads;
    grads.push_back({&model_.k1, Tensor({5}, DType::Float32)});
    EXPECT_THROW(opt->apply_gradients(grads), ShapeMismatchError);
}

TEST_F(PruningOptimizerTest, RejectedStepChangesNothing) {
    auto opt = make_optimizer();
    Tensor k1_before = model_.k1.clone();
    Tensor b1_before = model_.b1.clone();
    Tensor mask_before = opt->mask(model_.k1).clone();

    // Step 0 is an update step; the bad pair comes after k1 and b1
    auto grads = model_.gradients(0);
    grads[3].gradient = Tensor({3}, DType::Float32);
    EXPECT_THROW(opt->apply_gradients(grads), ShapeMismatchError);

    Tensor stranger({3}, DType::Float32);
    grads = model_.gradients(0);
    grads.push_back({&stranger, Tensor({3}, DType::Float32)});
    EXPECT_THROW(opt->apply_gradients(grads), UnconfiguredStateError);

    EXPECT_EQ(opt->iterations(), 0);
    EXPECT_TRUE(model_.k1.equals(k1_before));
    EXPECT_TRUE(model_.b1.equals(b1_before));
    EXPECT_TRUE(opt->mask(model_.k1).equals(mask_before));
    EXPECT_FALSE(opt->slots().has_pending(model_.k1));

    StepResult r = opt->apply_gradients(model_.gradients(0));
    EXPECT_EQ(r.step, 0);
    EXPECT_EQ(opt->iterations(), 1);
}

// ============================================================================
// Batched execution
// ============================================================================

TEST_F(PruningOptimizerTest, PlannedUpdateSteps) {
    auto opt = make_optimizer();
    EXPECT_EQ(opt->planned_update_steps(0, 10), (std::vector<int64_t>{0, 3, 6, 9}));
    EXPECT_EQ(opt->planned_update_steps(19, 30), (std::vector<int64_t>{}));
}

TEST_F(PruningOptimizerTest, BatchedMatchesEager) {
    auto eager = make_optimizer();
    for (int64_t step = 0; step < 16; ++step) {
        eager->apply_gradients(model_.gradients(step));
    }

    TinyModel batched_model;
    auto batched_map = std::make_shared<PrunerMap>(
        make_pruning_config().build(batched_model.layers()));
    OptimizerOptions options;
    options.log_level = "error";
    PruningOptimizer batched(batched_map, options);

    auto provider = [&batched_model](int64_t step) { return batched_model.gradients(step); };
    auto first = batched.run_steps(7, provider);
    auto second = batched.run_steps(9, provider);
    EXPECT_EQ(first.size(), 7u);
    EXPECT_EQ(second.front().step, 7);
    EXPECT_EQ(batched.iterations(), 16);

    EXPECT_TRUE(batched.mask(batched_model.k1).equals(eager->mask(model_.k1)));
    EXPECT_TRUE(batched.mask(batched_model.k2).equals(eager->mask(model_.k2)));
    EXPECT_TRUE(batched_model.k1.equals(model_.k1));
    EXPECT_TRUE(batched_model.k2.equals(model_.k2));
    EXPECT_TRUE(batched_model.b2.equals(model_.b2));
}

TEST_F(PruningOptimizerTest, RunStepsRejectsBadArguments) {
    auto opt = make_optimizer();
    auto provider = [this](int64_t step) { return model_.gradients(step); };
    EXPECT_THROW(opt->run_steps(-1, provider), std::invalid_argument);
    EXPECT_THROW(opt->run_steps(3, GradientProvider{}), std::invalid_argument);
    EXPECT_TRUE(opt->run_steps(0, provider).empty());
}
