#pragma once

#include "dynsparse/tensor.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dynsparse {
namespace pruning {

/// Slot names used by the pruner
inline constexpr const char* kMaskSlot = "mask";
inline constexpr const char* kMomentumSlot = "momentum";

/// Drop/grow decision computed by preprocess and committed by postprocess.
/// All vectors are at block resolution.
struct PendingMaskUpdate {
    int64_t step = -1;
    std::vector<float> old_mask;
    std::vector<float> kept_mask;    // old_mask minus the dropped blocks
    std::vector<float> grown_mask;   // disjoint from kept_mask
    int64_t dropped = 0;
};

/// Per-variable auxiliary state (mask, momentum, ...) keyed by the
/// identity of the weight tensor it belongs to.
///
/// Owned by the training loop and passed by reference into the pruner;
/// the pruner allocates slots but never outlives or replaces the store.
///
/// Identity is the tensor's address. Call release() before destroying a
/// weight: a later tensor allocated at the same address would otherwise
/// find its slots. The shape recorded with the first slot is checked on
/// every access, so such a tensor is rejected with ShapeMismatchError
/// unless its shape happens to match.
class SlotStore {
public:
    SlotStore() = default;
    SlotStore(const SlotStore&) = delete;
    SlotStore& operator=(const SlotStore&) = delete;
    SlotStore(SlotStore&&) = default;
    SlotStore& operator=(SlotStore&&) = default;

    /// Attach a human-readable name used in errors, logs and reports
    void name_variable(const Tensor& var, const std::string& name);
    std::string variable_name(const Tensor& var) const;

    /// Create `slot` for `var` from `init`. If the slot already exists it
    /// is left untouched and returned.
    Tensor& create_slot(const Tensor& var, const std::string& slot, Tensor init);

    bool has_variable(const Tensor& var) const;
    bool has_slot(const Tensor& var, const std::string& slot) const;

    /// Throws UnconfiguredStateError if `var` or `slot` is missing and
    /// ShapeMismatchError if `var` no longer has the shape its slots were
    /// created for
    Tensor& get_slot(const Tensor& var, const std::string& slot);
    const Tensor& get_slot(const Tensor& var, const std::string& slot) const;

    /// Slot names of `var`, sorted
    std::vector<std::string> slot_names(const Tensor& var) const;

    /// Destroy all state of `var`. Returns false if it had none.
    bool release(const Tensor& var);

    size_t num_variables() const { return variables_.size(); }

    // Hand-off between preprocess and postprocess of the same step.
    // Not visible through get_slot().
    void set_pending(const Tensor& var, PendingMaskUpdate update);
    std::optional<PendingMaskUpdate> take_pending(const Tensor& var);
    bool has_pending(const Tensor& var) const;

private:
    struct VariableState {
        std::vector<int64_t> shape;  // Shape of the variable at first create_slot
        std::unordered_map<std::string, Tensor> slots;
        std::optional<PendingMaskUpdate> pending;
    };

    VariableState& state_for(const Tensor& var);
    void check_shape(const Tensor& var, const VariableState& state) const;
    const VariableState& state_for(const Tensor& var) const;

    std::unordered_map<const Tensor*, VariableState> variables_;
    std::unordered_map<const Tensor*, std::string> names_;
};

} // namespace pruning
} // namespace dynsparse
