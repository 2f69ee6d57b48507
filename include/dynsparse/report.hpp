#pragma once

#include "dynsparse/pruning/pruning_config.hpp"
#include "dynsparse/pruning/slot_store.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace dynsparse {

/// Sparsity of one variable
struct VariableStats {
    std::string name;
    std::vector<int64_t> shape;
    int64_t total_params = 0;
    int64_t active_params = 0;      // Nonzero mask entries (all params if dense)
    double sparsity = 0.0;
    double target_sparsity = 0.0;
    bool prunable = false;
};

/// Sparsity statistics of a configured model
struct SparsityStats {
    std::vector<VariableStats> variables;  // Model traversal order

    /// Totals over all variables, dense ones included
    int64_t total_params = 0;
    int64_t active_params = 0;
    double overall_sparsity = 0.0;

    /// Totals over prunable variables only
    int64_t prunable_params = 0;
    int64_t prunable_active_params = 0;
    double prunable_sparsity = 0.0;
};

/// Read mask state from `store` for every variable of `pruners`.
/// Throws UnconfiguredStateError if a prunable variable has no mask.
SparsityStats collect_stats(const pruning::PrunerMap& pruners,
                            const pruning::SlotStore& store);

/// Human-readable text report
std::string format_report(const SparsityStats& stats);

} // namespace dynsparse
