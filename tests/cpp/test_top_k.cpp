#include <gtest/gtest.h>
#include "dynsparse/pruning/top_k.hpp"

#include <cmath>
#include <limits>
#include <numeric>

using namespace dynsparse;
using namespace dynsparse::pruning;

namespace {

int64_t count_ones(const std::vector<float>& mask) {
    return static_cast<int64_t>(std::accumulate(mask.begin(), mask.end(), 0.0f));
}

} // namespace

TEST(TopKTest, SelectsHighestScores) {
    std::vector<float> scores = {0.1f, 0.9f, 0.5f, 0.7f, 0.3f};
    auto mask = select_top_k(scores, 2, 5);
    EXPECT_EQ(mask, (std::vector<float>{0, 1, 0, 1, 0}));
}

TEST(TopKTest, ExactCount) {
    std::vector<float> scores(1000);
    for (size_t i = 0; i < scores.size(); ++i) {
        scores[i] = static_cast<float>((i * 7919) % 613);
    }
    for (int64_t k : {0, 1, 17, 500, 999, 1000}) {
        EXPECT_EQ(count_ones(select_top_k(scores, k, 1000)), k);
    }
}

TEST(TopKTest, TiesGoToLowerIndex) {
    std::vector<float> scores = {1.0f, 2.0f, 2.0f, 2.0f, 1.0f};
    auto mask = select_top_k(scores, 2, 5);
    EXPECT_EQ(mask, (std::vector<float>{0, 1, 1, 0, 0}));

    std::vector<float> flat(8, 0.0f);
    EXPECT_EQ(select_top_k(flat, 3, 8), (std::vector<float>{1, 1, 1, 0, 0, 0, 0, 0}));
}

TEST(TopKTest, NegativeInfinityIsNeverPreferred) {
    const float ninf = -std::numeric_limits<float>::infinity();
    std::vector<float> scores = {ninf, -5.0f, ninf, -10.0f};
    auto mask = select_top_k(scores, 2, 4);
    EXPECT_EQ(mask, (std::vector<float>{0, 1, 0, 1}));
}

TEST(TopKTest, NaNRanksBetweenNumbersAndNegativeInfinity) {
    const float ninf = -std::numeric_limits<float>::infinity();
    const float nan = std::numeric_limits<float>::quiet_NaN();
    std::vector<float> scores = {ninf, nan, -1e30f, ninf};
    EXPECT_EQ(select_top_k(scores, 1, 4), (std::vector<float>{0, 0, 1, 0}));
    EXPECT_EQ(select_top_k(scores, 2, 4), (std::vector<float>{0, 1, 1, 0}));
}

TEST(TopKTest, InputUnchanged) {
    std::vector<float> scores = {3.0f, 1.0f, 2.0f};
    std::vector<float> copy = scores;
    select_top_k(scores, 1, 3);
    EXPECT_EQ(scores, copy);
}

TEST(TopKTest, InvalidArguments) {
    std::vector<float> scores = {1.0f, 2.0f, 3.0f};
    EXPECT_THROW(select_top_k(scores, 4, 3), std::invalid_argument);
    EXPECT_THROW(select_top_k(scores, -1, 3), std::invalid_argument);
    EXPECT_THROW(select_top_k(scores, 1, 4), std::invalid_argument);
}

TEST(TopKTest, TensorOverloadKeepsShape) {
    Tensor scores = Tensor::from_vector({2, 3}, {6, 5, 4, 3, 2, 1});
    Tensor mask = select_top_k(scores, 3);
    EXPECT_EQ(mask.shape(), scores.shape());
    EXPECT_EQ(mask.to_vector<float>(), (std::vector<float>{1, 1, 1, 0, 0, 0}));
}
