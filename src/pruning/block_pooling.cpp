#include "dynsparse/pruning/block_pooling.hpp"
#include "dynsparse/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace dynsparse {
namespace pruning {

PoolingKind pooling_from_name(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "average" || lower == "avg") return PoolingKind::Average;
    if (lower == "max") return PoolingKind::Max;
    throw ConfigurationError("Unsupported block pooling kind: '" + name +
                             "'. Supported: average, max");
}

std::string pooling_name(PoolingKind kind) {
    switch (kind) {
        case PoolingKind::Average: return "average";
        case PoolingKind::Max: return "max";
    }
    return "unknown";
}

BlockLayout BlockLayout::make(const std::vector<int64_t>& shape, BlockSize block) {
    if (shape.empty()) {
        throw ConfigurationError("Cannot prune a scalar weight");
    }
    if (block.rows < 1 || block.cols < 1) {
        throw ConfigurationError("block_size entries must be >= 1 (got " +
            std::to_string(block.rows) + "x" + std::to_string(block.cols) + ")");
    }

    BlockLayout layout;
    layout.block = block;
    layout.cols = shape.back();
    layout.rows = 1;
    for (size_t i = 0; i + 1 < shape.size(); ++i) {
        layout.rows = checked_multiply(layout.rows, shape[i]);
    }

    if (layout.rows == 0 || layout.cols == 0) {
        throw ConfigurationError("Cannot prune an empty weight of shape " +
                                 dims_to_string(shape));
    }
    if (layout.rows % block.rows != 0 || layout.cols % block.cols != 0) {
        throw ConfigurationError("Block size " + std::to_string(block.rows) + "x" +
            std::to_string(block.cols) + " does not tile weight of shape " +
            dims_to_string(shape) + " (viewed as " + std::to_string(layout.rows) +
            "x" + std::to_string(layout.cols) + ")");
    }
    return layout;
}

std::vector<float> pool_abs(const float* values, const BlockLayout& layout, PoolingKind kind) {
    const int64_t n = layout.num_elements();

    if (layout.block.is_unit()) {
        std::vector<float> out(static_cast<size_t>(n));
        for (int64_t i = 0; i < n; ++i) {
            out[i] = std::abs(values[i]);
        }
        return out;
    }

    const int64_t nb = layout.num_blocks();
    // |x| >= 0, so zero is the identity for both sum and max
    std::vector<float> out(static_cast<size_t>(nb), 0.0f);

    // Accumulate in row-major element order so results don't depend on blocking
    for (int64_t i = 0; i < n; ++i) {
        float v = std::abs(values[i]);
        float& acc = out[static_cast<size_t>(layout.block_of(i))];
        if (kind == PoolingKind::Max) {
            acc = std::max(acc, v);
        } else {
            acc += v;
        }
    }

    if (kind == PoolingKind::Average) {
        const float inv = 1.0f / static_cast<float>(layout.block.rows * layout.block.cols);
        for (auto& v : out) {
            v *= inv;
        }
    }
    return out;
}

std::vector<float> pool_mask(const float* mask, const BlockLayout& layout) {
    const int64_t n = layout.num_elements();
    std::vector<float> out(static_cast<size_t>(layout.num_blocks()), 0.0f);
    for (int64_t i = 0; i < n; ++i) {
        if (mask[i] != 0.0f) {
            out[static_cast<size_t>(layout.block_of(i))] = 1.0f;
        }
    }
    return out;
}

void expand(const std::vector<float>& block_values, const BlockLayout& layout, float* out) {
    const int64_t n = layout.num_elements();
    if (layout.block.is_unit()) {
        std::copy(block_values.begin(), block_values.end(), out);
        return;
    }
    for (int64_t i = 0; i < n; ++i) {
        out[i] = block_values[static_cast<size_t>(layout.block_of(i))];
    }
}

} // namespace pruning
} // namespace dynsparse
