#include "dynsparse/report.hpp"
#include <iomanip>
#include <sstream>

namespace dynsparse {

namespace {

double fraction_inactive(int64_t active, int64_t total) {
    return total > 0 ? 1.0 - static_cast<double>(active) / static_cast<double>(total) : 0.0;
}

} // anonymous namespace

SparsityStats collect_stats(const pruning::PrunerMap& pruners,
                            const pruning::SlotStore& store) {
    SparsityStats stats;
    stats.variables.reserve(pruners.size());

    for (const Tensor* weight : pruners.weights()) {
        VariableStats var;
        var.name = pruners.name_of(*weight);
        var.shape = weight->shape();
        var.total_params = weight->num_elements();

        if (auto pruner = pruners.get_pruner(*weight)) {
            var.prunable = true;
            var.target_sparsity = pruner->target_sparsity();
            var.active_params = store.get_slot(*weight, pruning::kMaskSlot).count_nonzero();
            stats.prunable_params += var.total_params;
            stats.prunable_active_params += var.active_params;
        } else {
            var.active_params = var.total_params;
        }
        var.sparsity = fraction_inactive(var.active_params, var.total_params);

        stats.total_params += var.total_params;
        stats.active_params += var.active_params;
        stats.variables.push_back(std::move(var));
    }

    stats.overall_sparsity = fraction_inactive(stats.active_params, stats.total_params);
    stats.prunable_sparsity = fraction_inactive(stats.prunable_active_params,
                                                stats.prunable_params);
    return stats;
}

std::string format_report(const SparsityStats& stats) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "Sparsity Report\n";
    oss << "===============\n\n";
    oss << "Totals:\n";
    oss << "  Total parameters: " << stats.total_params << "\n";
    oss << "  Active parameters: " << stats.active_params << "\n";
    oss << "  Overall sparsity: " << stats.overall_sparsity * 100 << "%\n";
    oss << "  Prunable parameters: " << stats.prunable_params << "\n";
    oss << "  Prunable sparsity: " << stats.prunable_sparsity * 100 << "%\n";
    oss << "\nPer-variable sparsity:\n";
    for (const auto& var : stats.variables) {
        oss << "  " << var.name << " " << dims_to_string(var.shape) << ": ";
        if (var.prunable) {
            oss << var.sparsity * 100 << "% (target " << var.target_sparsity * 100 << "%, "
                << var.active_params << "/" << var.total_params << " active)\n";
        } else {
            oss << "dense (" << var.total_params << " params)\n";
        }
    }
    return oss.str();
}

} // namespace dynsparse
