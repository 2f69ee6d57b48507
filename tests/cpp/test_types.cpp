#include <gtest/gtest.h>
#include "dynsparse/types.hpp"
#include "dynsparse/errors.hpp"

using namespace dynsparse;

TEST(DTypeTest, Size) {
    EXPECT_EQ(dtype_size(DType::Float32), 4);
    EXPECT_EQ(dtype_size(DType::Float64), 8);
    EXPECT_EQ(dtype_size(DType::Int64), 8);
    EXPECT_EQ(dtype_size(DType::Int32), 4);
    EXPECT_EQ(dtype_size(DType::UInt8), 1);
    EXPECT_EQ(dtype_size(DType::Bool), 1);
}

TEST(DTypeTest, Name) {
    EXPECT_EQ(dtype_name(DType::Float32), "float32");
    EXPECT_EQ(dtype_name(DType::Int64), "int64");
    EXPECT_EQ(dtype_name(DType::Bool), "bool");
}

TEST(DTypeTest, FromName) {
    EXPECT_EQ(dtype_from_name("float32"), DType::Float32);
    EXPECT_EQ(dtype_from_name("uint8"), DType::UInt8);
    EXPECT_THROW(dtype_from_name("float16"), std::invalid_argument);
}

TEST(DimsTest, ToString) {
    EXPECT_EQ(dims_to_string({1, 3, 224}), "[1, 3, 224]");
    EXPECT_EQ(dims_to_string({}), "[]");
}

TEST(DimsTest, CheckedProduct) {
    EXPECT_EQ(checked_product({2, 3, 4}), 24);
    EXPECT_EQ(checked_product({2, 0, 4}), 0);
    EXPECT_THROW(checked_product({1LL << 40, 1LL << 40}), std::overflow_error);
}

TEST(BlockSizeTest, Unit) {
    EXPECT_TRUE(BlockSize{}.is_unit());
    EXPECT_FALSE((BlockSize{1, 4}).is_unit());
    EXPECT_EQ((BlockSize{2, 2}), (BlockSize{2, 2}));
    EXPECT_NE((BlockSize{2, 1}), (BlockSize{1, 2}));
}

TEST(ErrorsTest, ConfigurationErrorListsEveryProblem) {
    ConfigurationError err(std::vector<std::string>{"first problem", "second problem"});
    std::string msg = err.what();
    EXPECT_NE(msg.find("first problem"), std::string::npos);
    EXPECT_NE(msg.find("second problem"), std::string::npos);
    EXPECT_EQ(err.errors().size(), 2);
}

TEST(ErrorsTest, UnconfiguredStateNamesSlot) {
    UnconfiguredStateError no_slot("dense/kernel", std::string("mask"));
    EXPECT_EQ(no_slot.variable(), "dense/kernel");
    ASSERT_TRUE(no_slot.slot().has_value());
    EXPECT_EQ(no_slot.slot().value(), "mask");

    UnconfiguredStateError no_var("dense/kernel");
    EXPECT_FALSE(no_var.slot().has_value());
    EXPECT_NE(std::string(no_var.what()).find("create_slots"), std::string::npos);
}

TEST(ErrorsTest, Hierarchy) {
    EXPECT_THROW(throw ShapeMismatchError("g", "[2]", "[3]"), DynSparseError);
    EXPECT_THROW(throw DTypeMismatchError("g", "float32", "int32"), DynSparseError);
    EXPECT_THROW(throw ConfigurationError("bad"), DynSparseError);
}
