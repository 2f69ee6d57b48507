#pragma once

#include <cstdint>
#include <random>
#include <vector>

namespace dynsparse {
namespace pruning {

/// What a stream is drawn for. Each purpose gets an independent stream
/// so adding draws for one never shifts another.
enum class StreamPurpose : uint64_t {
    InitialMask = 1,
    GrowNoise = 2,
    GrowInit = 3
};

/// Deterministic pseudo-random stream keyed by (seed, seed_offset, step, purpose).
///
/// A stream is created fresh for every use and advanced explicitly per
/// draw, so the sequence a pruner sees depends only on its configuration
/// and the step, never on call order across variables or steps.
class RandomStream {
public:
    RandomStream(int64_t seed, int64_t seed_offset, int64_t step, StreamPurpose purpose);

    /// Standard-normal draw scaled by stddev
    double normal(double stddev);

    /// Uniform draw in [low, high)
    double uniform(double low, double high);

    /// Random permutation of [0, n) (Fisher-Yates)
    std::vector<int64_t> permutation(int64_t n);

    /// Mixed 64-bit seed for the given key
    static uint64_t mix_seed(int64_t seed, int64_t seed_offset, int64_t step,
                             StreamPurpose purpose);

private:
    std::mt19937_64 engine_;
    std::normal_distribution<double> normal_{0.0, 1.0};
};

} // namespace pruning
} // namespace dynsparse
