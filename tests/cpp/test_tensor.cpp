#include <gtest/gtest.h>
#include "dynsparse/tensor.hpp"

using namespace dynsparse;

TEST(TensorTest, DefaultConstruction) {
    Tensor t;
    EXPECT_FALSE(t.is_valid());
    EXPECT_EQ(t.num_elements(), 0);
}

TEST(TensorTest, Construction) {
    Tensor t({2, 3, 4}, DType::Float32);
    EXPECT_TRUE(t.is_valid());
    EXPECT_EQ(t.ndim(), 3);
    EXPECT_EQ(t.shape()[0], 2);
    EXPECT_EQ(t.shape()[1], 3);
    EXPECT_EQ(t.shape()[2], 4);
    EXPECT_EQ(t.num_elements(), 24);
    EXPECT_EQ(t.size_bytes(), 24 * 4);
}

TEST(TensorTest, ZeroFilledOnConstruction) {
    Tensor t({16}, DType::Float32);
    EXPECT_EQ(t.count_nonzero(), 0);
}

TEST(TensorTest, DifferentDTypes) {
    Tensor f32({10}, DType::Float32);
    EXPECT_EQ(f32.size_bytes(), 10 * 4);

    Tensor i64({10}, DType::Int64);
    EXPECT_EQ(i64.size_bytes(), 10 * 8);

    Tensor u8({10}, DType::UInt8);
    EXPECT_EQ(u8.size_bytes(), 10);
}

TEST(TensorTest, NegativeDimensionRejected) {
    EXPECT_THROW(Tensor({2, -1}, DType::Float32), std::invalid_argument);
}

TEST(TensorTest, Fill) {
    Tensor t({2, 2}, DType::Float32);
    t.fill(3.14f);

    const float* data = t.data_ptr<float>();
    for (int i = 0; i < 4; ++i) {
        EXPECT_FLOAT_EQ(data[i], 3.14f);
    }
}

TEST(TensorTest, FillWrongTypeSize) {
    Tensor t({2}, DType::Float32);
    EXPECT_THROW(t.fill(1.0), std::invalid_argument);
}

TEST(TensorTest, Zero) {
    Tensor t({4}, DType::Float32);
    t.fill(1.0f);
    t.zero();
    EXPECT_EQ(t.count_nonzero(), 0);
}

TEST(TensorTest, FromVector) {
    Tensor t = Tensor::from_vector({2, 3}, {1, 0, 2, 0, 0, 3});
    EXPECT_EQ(t.dtype(), DType::Float32);
    EXPECT_EQ(t.num_elements(), 6);
    EXPECT_EQ(t.count_nonzero(), 3);
    EXPECT_FLOAT_EQ(t.data_ptr<float>()[5], 3.0f);

    EXPECT_THROW(Tensor::from_vector({2, 2}, {1, 2, 3}), std::invalid_argument);
}

TEST(TensorTest, ToVector) {
    std::vector<float> values = {0.5f, -1.0f, 2.0f};
    Tensor t = Tensor::from_vector({3}, values);
    EXPECT_EQ(t.to_vector<float>(), values);
}

TEST(TensorTest, Clone) {
    Tensor t({2, 2}, DType::Float32);
    t.fill(1.0f);

    Tensor clone = t.clone();
    EXPECT_NE(clone.data(), t.data());
    EXPECT_TRUE(clone.equals(t));

    t.fill(2.0f);
    EXPECT_FLOAT_EQ(clone.data_ptr<float>()[0], 1.0f);
    EXPECT_FALSE(clone.equals(t));
}

TEST(TensorTest, MoveConstruction) {
    Tensor t1({2, 2}, DType::Float32);
    void* original_data = t1.data();

    Tensor t2 = std::move(t1);

    EXPECT_EQ(t2.data(), original_data);
    EXPECT_FALSE(t1.is_valid());
    EXPECT_TRUE(t2.is_valid());
}

TEST(TensorTest, CopyAssignment) {
    Tensor t1 = Tensor::from_vector({2}, {4.0f, 5.0f});
    Tensor t2({7}, DType::Int32);
    t2 = t1;

    EXPECT_NE(t1.data(), t2.data());
    EXPECT_TRUE(t2.equals(t1));
}

TEST(TensorTest, EqualsComparesShapeAndDType) {
    Tensor a({4}, DType::Float32);
    Tensor b({2, 2}, DType::Float32);
    Tensor c({4}, DType::Int32);
    EXPECT_FALSE(a.equals(b));
    EXPECT_FALSE(a.equals(c));
    EXPECT_TRUE(a.equals(Tensor({4}, DType::Float32)));
}

TEST(TensorTest, EmptyTensor) {
    Tensor t({0}, DType::Float32);
    EXPECT_EQ(t.num_elements(), 0);
    EXPECT_EQ(t.size_bytes(), 0);
    EXPECT_EQ(t.count_nonzero(), 0);
}
