#pragma once

#include "dynsparse/types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace dynsparse {
namespace pruning {

/// How element scores are reduced to one score per block
enum class PoolingKind {
    Average,
    Max
};

/// Parse pooling kind ("average"/"avg", "max"; case-insensitive)
PoolingKind pooling_from_name(const std::string& name);
std::string pooling_name(PoolingKind kind);

/// 2-D blocked view of a weight tensor.
///
/// A weight of shape [d0, ..., dk] is viewed as a [d0*...*d(k-1), dk]
/// matrix (rank-1 weights as [1, d0]) and tiled by `block`. Blocks must
/// tile the matrix exactly.
struct BlockLayout {
    int64_t rows = 0;
    int64_t cols = 0;
    BlockSize block;

    /// Throws ConfigurationError if the shape is empty or not tiled exactly
    static BlockLayout make(const std::vector<int64_t>& shape, BlockSize block);

    int64_t block_rows() const { return rows / block.rows; }
    int64_t block_cols() const { return cols / block.cols; }
    int64_t num_blocks() const { return block_rows() * block_cols(); }
    int64_t num_elements() const { return rows * cols; }

    /// Block index owning flat element index `i`
    int64_t block_of(int64_t i) const {
        int64_t r = i / cols;
        int64_t c = i % cols;
        return (r / block.rows) * block_cols() + c / block.cols;
    }
};

/// One value per block: average or max of |x| over the block
std::vector<float> pool_abs(const float* values, const BlockLayout& layout, PoolingKind kind);

/// One value per block from a block-uniform 0/1 mask
std::vector<float> pool_mask(const float* mask, const BlockLayout& layout);

/// Broadcast block values back to element resolution
void expand(const std::vector<float>& block_values, const BlockLayout& layout, float* out);

} // namespace pruning
} // namespace dynsparse
