#include <gtest/gtest.h>
#include "dynsparse/pruning/slot_store.hpp"
#include "dynsparse/errors.hpp"

using namespace dynsparse;
using namespace dynsparse::pruning;

TEST(SlotStoreTest, CreateAndGet) {
    SlotStore store;
    Tensor weight({4}, DType::Float32);

    EXPECT_FALSE(store.has_variable(weight));
    store.create_slot(weight, kMaskSlot, Tensor::from_vector({4}, {1, 0, 1, 0}));

    EXPECT_TRUE(store.has_variable(weight));
    EXPECT_TRUE(store.has_slot(weight, kMaskSlot));
    EXPECT_FALSE(store.has_slot(weight, kMomentumSlot));
    EXPECT_EQ(store.get_slot(weight, kMaskSlot).count_nonzero(), 2);
    EXPECT_EQ(store.num_variables(), 1);
}

TEST(SlotStoreTest, CreateIsIdempotent) {
    SlotStore store;
    Tensor weight({2}, DType::Float32);

    store.create_slot(weight, kMaskSlot, Tensor::from_vector({2}, {1, 0}));
    Tensor& again = store.create_slot(weight, kMaskSlot, Tensor::from_vector({2}, {1, 1}));
    EXPECT_EQ(again.count_nonzero(), 1);
}

TEST(SlotStoreTest, KeyedByIdentity) {
    SlotStore store;
    Tensor a({2}, DType::Float32);
    Tensor b({2}, DType::Float32);

    store.create_slot(a, kMaskSlot, Tensor::from_vector({2}, {1, 0}));
    EXPECT_FALSE(store.has_variable(b));
    EXPECT_THROW(store.get_slot(b, kMaskSlot), UnconfiguredStateError);
}

TEST(SlotStoreTest, MissingSlotNamesIt) {
    SlotStore store;
    Tensor weight({2}, DType::Float32);
    store.name_variable(weight, "dense/kernel");
    store.create_slot(weight, kMaskSlot, Tensor({2}, DType::Float32));

    try {
        store.get_slot(weight, kMomentumSlot);
        FAIL() << "expected UnconfiguredStateError";
    } catch (const UnconfiguredStateError& e) {
        EXPECT_EQ(e.variable(), "dense/kernel");
        ASSERT_TRUE(e.slot().has_value());
        EXPECT_EQ(e.slot().value(), kMomentumSlot);
    }
}

TEST(SlotStoreTest, SlotNamesSorted) {
    SlotStore store;
    Tensor weight({2}, DType::Float32);
    store.create_slot(weight, kMomentumSlot, Tensor({2}, DType::Float32));
    store.create_slot(weight, kMaskSlot, Tensor({2}, DType::Float32));
    EXPECT_EQ(store.slot_names(weight), (std::vector<std::string>{"mask", "momentum"}));
}

TEST(SlotStoreTest, Release) {
    SlotStore store;
    Tensor weight({2}, DType::Float32);
    store.create_slot(weight, kMaskSlot, Tensor({2}, DType::Float32));

    EXPECT_TRUE(store.release(weight));
    EXPECT_FALSE(store.has_variable(weight));
    EXPECT_FALSE(store.release(weight));
    EXPECT_EQ(store.num_variables(), 0);
}

TEST(SlotStoreTest, PendingUpdateIsNotASlot) {
    SlotStore store;
    Tensor weight({2}, DType::Float32);
    store.create_slot(weight, kMaskSlot, Tensor({2}, DType::Float32));

    PendingMaskUpdate update;
    update.step = 3;
    update.dropped = 1;
    store.set_pending(weight, update);

    EXPECT_TRUE(store.has_pending(weight));
    EXPECT_EQ(store.slot_names(weight), (std::vector<std::string>{"mask"}));

    auto taken = store.take_pending(weight);
    ASSERT_TRUE(taken.has_value());
    EXPECT_EQ(taken->step, 3);
    EXPECT_FALSE(store.has_pending(weight));
    EXPECT_FALSE(store.take_pending(weight).has_value());
}

TEST(SlotStoreTest, PendingRequiresVariable) {
    SlotStore store;
    Tensor weight({2}, DType::Float32);
    EXPECT_THROW(store.set_pending(weight, PendingMaskUpdate{}), UnconfiguredStateError);
}

TEST(SlotStoreTest, DefaultVariableName) {
    SlotStore store;
    Tensor weight({2}, DType::Float32);
    EXPECT_EQ(store.variable_name(weight).rfind("variable@", 0), 0);
    store.name_variable(weight, "w");
    EXPECT_EQ(store.variable_name(weight), "w");
}

TEST(SlotStoreTest, ReplacedTensorAtSameAddressIsRejected) {
    SlotStore store;
    Tensor weight({4}, DType::Float32);
    store.create_slot(weight, kMaskSlot, Tensor::from_vector({4}, {1, 0, 1, 0}));

    // Same object, new contents of a different shape, no release()
    weight = Tensor({2, 3}, DType::Float32);

    EXPECT_TRUE(store.has_variable(weight));
    EXPECT_THROW(store.get_slot(weight, kMaskSlot), ShapeMismatchError);
    EXPECT_THROW(store.create_slot(weight, kMomentumSlot, Tensor({2, 3}, DType::Float32)),
                 ShapeMismatchError);

    EXPECT_TRUE(store.release(weight));
    store.create_slot(weight, kMaskSlot, Tensor({2, 3}, DType::Float32));
    EXPECT_EQ(store.get_slot(weight, kMaskSlot).shape(), (std::vector<int64_t>{2, 3}));
}
