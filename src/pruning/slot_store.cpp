#include "dynsparse/pruning/slot_store.hpp"
#include "dynsparse/errors.hpp"
#include <algorithm>
#include <sstream>

namespace dynsparse {
namespace pruning {

void SlotStore::name_variable(const Tensor& var, const std::string& name) {
    names_[&var] = name;
}

std::string SlotStore::variable_name(const Tensor& var) const {
    auto it = names_.find(&var);
    if (it != names_.end()) {
        return it->second;
    }
    std::ostringstream oss;
    oss << "variable@" << static_cast<const void*>(&var);
    return oss.str();
}

Tensor& SlotStore::create_slot(const Tensor& var, const std::string& slot, Tensor init) {
    auto [entry, inserted] = variables_.try_emplace(&var);
    auto& state = entry->second;
    if (inserted) {
        state.shape = var.shape();
    } else {
        check_shape(var, state);
    }
    auto it = state.slots.find(slot);
    if (it != state.slots.end()) {
        return it->second;
    }
    return state.slots.emplace(slot, std::move(init)).first->second;
}

void SlotStore::check_shape(const Tensor& var, const VariableState& state) const {
    // Another tensor now lives at the address of a weight that was never released
    if (var.shape() != state.shape) {
        throw ShapeMismatchError(variable_name(var) + " (stale slots)",
                                 dims_to_string(state.shape),
                                 dims_to_string(var.shape()));
    }
}

bool SlotStore::has_variable(const Tensor& var) const {
    return variables_.count(&var) > 0;
}

bool SlotStore::has_slot(const Tensor& var, const std::string& slot) const {
    auto it = variables_.find(&var);
    return it != variables_.end() && it->second.slots.count(slot) > 0;
}

SlotStore::VariableState& SlotStore::state_for(const Tensor& var) {
    auto it = variables_.find(&var);
    if (it == variables_.end()) {
        throw UnconfiguredStateError(variable_name(var));
    }
    check_shape(var, it->second);
    return it->second;
}

const SlotStore::VariableState& SlotStore::state_for(const Tensor& var) const {
    auto it = variables_.find(&var);
    if (it == variables_.end()) {
        throw UnconfiguredStateError(variable_name(var));
    }
    check_shape(var, it->second);
    return it->second;
}

Tensor& SlotStore::get_slot(const Tensor& var, const std::string& slot) {
    auto& state = state_for(var);
    auto it = state.slots.find(slot);
    if (it == state.slots.end()) {
        throw UnconfiguredStateError(variable_name(var), slot);
    }
    return it->second;
}

const Tensor& SlotStore::get_slot(const Tensor& var, const std::string& slot) const {
    const auto& state = state_for(var);
    auto it = state.slots.find(slot);
    if (it == state.slots.end()) {
        throw UnconfiguredStateError(variable_name(var), slot);
    }
    return it->second;
}

std::vector<std::string> SlotStore::slot_names(const Tensor& var) const {
    const auto& state = state_for(var);
    std::vector<std::string> names;
    names.reserve(state.slots.size());
    for (const auto& [name, _] : state.slots) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool SlotStore::release(const Tensor& var) {
    names_.erase(&var);
    return variables_.erase(&var) > 0;
}

void SlotStore::set_pending(const Tensor& var, PendingMaskUpdate update) {
    state_for(var).pending = std::move(update);
}

std::optional<PendingMaskUpdate> SlotStore::take_pending(const Tensor& var) {
    auto& state = state_for(var);
    std::optional<PendingMaskUpdate> out = std::move(state.pending);
    state.pending.reset();
    return out;
}

bool SlotStore::has_pending(const Tensor& var) const {
    return state_for(var).pending.has_value();
}

} // namespace pruning
} // namespace dynsparse
