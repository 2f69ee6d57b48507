#include "dynsparse/pruning/random_stream.hpp"
#include <limits>
#include <numeric>
#include <utility>

namespace dynsparse {
namespace pruning {

namespace {

// SplitMix64 finalizer
uint64_t splitmix64(uint64_t x) {
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

} // anonymous namespace

uint64_t RandomStream::mix_seed(int64_t seed, int64_t seed_offset, int64_t step,
                                StreamPurpose purpose) {
    uint64_t h = splitmix64(static_cast<uint64_t>(seed));
    h = splitmix64(h ^ static_cast<uint64_t>(seed_offset));
    h = splitmix64(h ^ static_cast<uint64_t>(step));
    h = splitmix64(h ^ static_cast<uint64_t>(purpose));
    return h;
}

RandomStream::RandomStream(int64_t seed, int64_t seed_offset, int64_t step,
                           StreamPurpose purpose)
    : engine_(mix_seed(seed, seed_offset, step, purpose))
{
}

double RandomStream::normal(double stddev) {
    return normal_(engine_) * stddev;
}

double RandomStream::uniform(double low, double high) {
    // 53 random bits mapped to [0, 1)
    double u = static_cast<double>(engine_() >> 11) * (1.0 / 9007199254740992.0);
    return low + (high - low) * u;
}

std::vector<int64_t> RandomStream::permutation(int64_t n) {
    std::vector<int64_t> perm(static_cast<size_t>(n));
    std::iota(perm.begin(), perm.end(), int64_t{0});
    for (int64_t i = n - 1; i > 0; --i) {
        // Unbiased bounded draw in [0, i]
        uint64_t bound = static_cast<uint64_t>(i) + 1;
        uint64_t limit = std::numeric_limits<uint64_t>::max() -
                         std::numeric_limits<uint64_t>::max() % bound;
        uint64_t r;
        do {
            r = engine_();
        } while (r >= limit);
        std::swap(perm[static_cast<size_t>(i)], perm[static_cast<size_t>(r % bound)]);
    }
    return perm;
}

} // namespace pruning
} // namespace dynsparse
