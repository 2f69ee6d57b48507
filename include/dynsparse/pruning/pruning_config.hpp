#pragma once

#include "dynsparse/tensor.hpp"
#include "dynsparse/options.hpp"
#include "dynsparse/pruning/rigl_pruner.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace dynsparse {
namespace pruning {

/// One layer of the model being trained, as seen by the pruning configuration.
/// The configuration never owns the weights; they must outlive any
/// PrunerMap built from the layer.
struct LayerSpec {
    std::string name;
    std::string type;                        // Looked up in the PruneRegistry
    std::vector<Tensor*> weights;            // Trainable weights, in layer order
    std::vector<std::string> weight_names;   // Optional, parallel to weights

    // Layers that know their own prunable weights set this and list them
    bool natively_prunable = false;
    std::vector<size_t> prunable_weights;    // Indices into weights

    std::vector<LayerSpec> sublayers;        // Processed before the layer itself

    /// Display name of weight `index` ("<layer>/<weight name>" or "<layer>/weight_<i>")
    std::string weight_name(size_t index) const;
};

// ============================================================================
// Prunability capability
// ============================================================================

enum class Prunability {
    NativelyPrunable,   // Layer declares its prunable weights
    RegistrySupported,  // Layer type is known to the PruneRegistry
    NotPrunable
};

std::string prunability_name(Prunability kind);

/// Resolved once per layer at configuration time
class PrunabilityCapability {
public:
    virtual ~PrunabilityCapability() = default;

    virtual Prunability kind() const = 0;

    /// Weights of `layer` that receive a pruner
    virtual std::vector<size_t> prunable_weights(const LayerSpec& layer) const = 0;
};

class NativelyPrunable : public PrunabilityCapability {
public:
    Prunability kind() const override { return Prunability::NativelyPrunable; }
    std::vector<size_t> prunable_weights(const LayerSpec& layer) const override;
};

class RegistrySupported : public PrunabilityCapability {
public:
    explicit RegistrySupported(std::vector<size_t> weight_indices)
        : weight_indices_(std::move(weight_indices)) {}

    Prunability kind() const override { return Prunability::RegistrySupported; }
    std::vector<size_t> prunable_weights(const LayerSpec& layer) const override;

private:
    std::vector<size_t> weight_indices_;
};

class NotPrunable : public PrunabilityCapability {
public:
    Prunability kind() const override { return Prunability::NotPrunable; }
    std::vector<size_t> prunable_weights(const LayerSpec&) const override { return {}; }
};

/// Native declaration wins over the registry; anything else is not prunable
std::unique_ptr<PrunabilityCapability> resolve_capability(const LayerSpec& layer);

// ============================================================================
// Layer registry
// ============================================================================

/// Maps layer types to the indices of their prunable weights
class PruneRegistry {
public:
    /// Get singleton instance
    static PruneRegistry& instance();

    /// Register (or replace) the prunable weights of a layer type
    void register_layer(const std::string& layer_type, std::vector<size_t> weight_indices);

    /// Prunable weight indices of `layer_type`, or nullptr if unsupported
    const std::vector<size_t>* get(const std::string& layer_type) const;

    bool supports(const std::string& layer_type) const;

    /// List all registered layer types
    std::vector<std::string> list_layers() const;

    bool unregister_layer(const std::string& layer_type);

    /// Clear all registrations (for testing)
    void clear();

    /// Restore the built-in layer types
    void reset_defaults();

private:
    PruneRegistry();
    std::unordered_map<std::string, std::vector<size_t>> layers_;
};

// ============================================================================
// Weight -> pruner mapping
// ============================================================================

/// Mapping from weight identity to the pruner assigned to it.
/// Every trainable weight of the configured model has an entry; entries
/// of non-prunable weights hold a null pruner.
class PrunerMap {
public:
    void assign(Tensor& weight, const std::string& name,
                std::shared_ptr<RiglPruner> pruner);

    /// Throws UnconfiguredStateError if `weight` was not part of the model
    std::shared_ptr<RiglPruner> get_pruner(const Tensor& weight) const;

    bool contains(const Tensor& weight) const;
    const std::string& name_of(const Tensor& weight) const;

    /// All weights in model traversal order
    const std::vector<Tensor*>& weights() const { return order_; }

    /// Distinct pruners, in order of first appearance
    std::vector<std::shared_ptr<RiglPruner>> pruners() const;

    size_t size() const { return order_.size(); }
    size_t num_prunable() const;

private:
    struct Entry {
        std::string name;
        std::shared_ptr<RiglPruner> pruner;
    };

    std::vector<Tensor*> order_;
    std::unordered_map<const Tensor*, Entry> entries_;
};

/// Builds one RigL pruner per prunable layer of a model
struct RiglPruningConfig {
    /// Template for every layer's pruner. Its `sparsity` is the overall
    /// target; per-layer values come from `layer_distribution`.
    RiglConfig pruner;

    /// Layer i (in traversal order) gets seed_offset = base_seed + i
    int64_t base_seed = 0;

    std::string layer_distribution = "uniform";  // "uniform", "erdos_renyi"

    /// Validate configuration, returns list of errors
    std::vector<std::string> validate() const;

    /// Throws ConfigurationError if the configuration is invalid or the
    /// model has no layers
    PrunerMap build(const std::vector<LayerSpec>& model) const;
};

} // namespace pruning
} // namespace dynsparse
