#include "dynsparse/pruning/pruning_config.hpp"
#include "dynsparse/pruning/sparse_distribution.hpp"
#include "dynsparse/errors.hpp"
#include <algorithm>
#include <sstream>
#include <unordered_set>

namespace dynsparse {
namespace pruning {

std::string LayerSpec::weight_name(size_t index) const {
    if (index < weight_names.size() && !weight_names[index].empty()) {
        return name + "/" + weight_names[index];
    }
    return name + "/weight_" + std::to_string(index);
}

std::string prunability_name(Prunability kind) {
    switch (kind) {
        case Prunability::NativelyPrunable: return "natively_prunable";
        case Prunability::RegistrySupported: return "registry_supported";
        case Prunability::NotPrunable: return "not_prunable";
    }
    return "unknown";
}

namespace {

std::vector<size_t> checked_indices(const LayerSpec& layer,
                                    const std::vector<size_t>& indices) {
    for (size_t idx : indices) {
        if (idx >= layer.weights.size()) {
            throw ConfigurationError("Layer '" + layer.name + "' (" + layer.type +
                                     ") has no weight at index " + std::to_string(idx));
        }
    }
    return indices;
}

} // anonymous namespace

std::vector<size_t> NativelyPrunable::prunable_weights(const LayerSpec& layer) const {
    return checked_indices(layer, layer.prunable_weights);
}

std::vector<size_t> RegistrySupported::prunable_weights(const LayerSpec& layer) const {
    return checked_indices(layer, weight_indices_);
}

std::unique_ptr<PrunabilityCapability> resolve_capability(const LayerSpec& layer) {
    if (layer.natively_prunable) {
        return std::make_unique<NativelyPrunable>();
    }
    if (const auto* indices = PruneRegistry::instance().get(layer.type)) {
        return std::make_unique<RegistrySupported>(*indices);
    }
    return std::make_unique<NotPrunable>();
}

// ============================================================================
// PruneRegistry
// ============================================================================

PruneRegistry& PruneRegistry::instance() {
    static PruneRegistry registry;
    return registry;
}

PruneRegistry::PruneRegistry() {
    reset_defaults();
}

void PruneRegistry::reset_defaults() {
    layers_.clear();
    // Kernel only; biases stay dense
    for (const char* type : {"Dense", "Conv1D", "Conv2D", "Conv3D",
                             "Conv2DTranspose", "Conv3DTranspose",
                             "DepthwiseConv2D", "Embedding"}) {
        layers_[type] = {0};
    }
    // Input kernel and recurrent kernel
    for (const char* type : {"SimpleRNN", "LSTM", "GRU"}) {
        layers_[type] = {0, 1};
    }
    // Depthwise and pointwise kernels
    layers_["SeparableConv2D"] = {0, 1};
}

void PruneRegistry::register_layer(const std::string& layer_type,
                                   std::vector<size_t> weight_indices) {
    layers_[layer_type] = std::move(weight_indices);
}

const std::vector<size_t>* PruneRegistry::get(const std::string& layer_type) const {
    auto it = layers_.find(layer_type);
    return it != layers_.end() ? &it->second : nullptr;
}

bool PruneRegistry::supports(const std::string& layer_type) const {
    return layers_.count(layer_type) > 0;
}

std::vector<std::string> PruneRegistry::list_layers() const {
    std::vector<std::string> result;
    result.reserve(layers_.size());
    for (const auto& [type, _] : layers_) {
        result.push_back(type);
    }
    std::sort(result.begin(), result.end());
    return result;
}

bool PruneRegistry::unregister_layer(const std::string& layer_type) {
    return layers_.erase(layer_type) > 0;
}

void PruneRegistry::clear() {
    layers_.clear();
}

// ============================================================================
// PrunerMap
// ============================================================================

namespace {

std::string unknown_weight_name(const Tensor& weight) {
    std::ostringstream oss;
    oss << "weight@" << static_cast<const void*>(&weight) << " "
        << dims_to_string(weight.shape());
    return oss.str();
}

} // anonymous namespace

void PrunerMap::assign(Tensor& weight, const std::string& name,
                       std::shared_ptr<RiglPruner> pruner) {
    auto it = entries_.find(&weight);
    if (it == entries_.end()) {
        order_.push_back(&weight);
        entries_.emplace(&weight, Entry{name, std::move(pruner)});
        return;
    }
    // A weight shared between layers keeps the last assignment
    it->second.name = name;
    it->second.pruner = std::move(pruner);
}

std::shared_ptr<RiglPruner> PrunerMap::get_pruner(const Tensor& weight) const {
    auto it = entries_.find(&weight);
    if (it == entries_.end()) {
        throw UnconfiguredStateError(unknown_weight_name(weight), std::string("pruner"));
    }
    return it->second.pruner;
}

bool PrunerMap::contains(const Tensor& weight) const {
    return entries_.count(&weight) > 0;
}

const std::string& PrunerMap::name_of(const Tensor& weight) const {
    auto it = entries_.find(&weight);
    if (it == entries_.end()) {
        throw UnconfiguredStateError(unknown_weight_name(weight), std::string("pruner"));
    }
    return it->second.name;
}

std::vector<std::shared_ptr<RiglPruner>> PrunerMap::pruners() const {
    std::vector<std::shared_ptr<RiglPruner>> result;
    std::unordered_set<const RiglPruner*> seen;
    for (const Tensor* w : order_) {
        const auto& pruner = entries_.at(w).pruner;
        if (pruner && seen.insert(pruner.get()).second) {
            result.push_back(pruner);
        }
    }
    return result;
}

size_t PrunerMap::num_prunable() const {
    return static_cast<size_t>(std::count_if(order_.begin(), order_.end(),
        [this](const Tensor* w) { return entries_.at(w).pruner != nullptr; }));
}

// ============================================================================
// RiglPruningConfig
// ============================================================================

std::vector<std::string> RiglPruningConfig::validate() const {
    std::vector<std::string> errors = pruner.validate();

    static const std::unordered_set<std::string> valid_distributions = {
        "uniform", "erdos_renyi", "erk"
    };
    if (valid_distributions.find(layer_distribution) == valid_distributions.end()) {
        errors.push_back("Unsupported layer_distribution: '" + layer_distribution + "'");
    }

    if (pruner.density) {
        errors.push_back("density applies to a single weight; set it on a RiglPruner directly");
    }

    if (base_seed < 0) {
        errors.push_back("base_seed must be >= 0");
    }

    return errors;
}

namespace {

struct PrunableLayer {
    const LayerSpec* layer;
    std::vector<size_t> indices;
};

void collect_layers(const LayerSpec& layer,
                    std::vector<const LayerSpec*>& all,
                    std::vector<PrunableLayer>& prunable) {
    for (const auto& sub : layer.sublayers) {
        collect_layers(sub, all, prunable);
    }
    all.push_back(&layer);

    auto capability = resolve_capability(layer);
    std::vector<size_t> indices = capability->prunable_weights(layer);
    if (!indices.empty()) {
        prunable.push_back(PrunableLayer{&layer, std::move(indices)});
    }
}

} // anonymous namespace

PrunerMap RiglPruningConfig::build(const std::vector<LayerSpec>& model) const {
    auto errors = validate();
    if (!errors.empty()) {
        throw ConfigurationError(errors);
    }
    if (model.empty()) {
        throw ConfigurationError("model has no layers to configure");
    }

    std::vector<const LayerSpec*> all_layers;
    std::vector<PrunableLayer> prunable;
    for (const auto& layer : model) {
        collect_layers(layer, all_layers, prunable);
    }

    for (const LayerSpec* layer : all_layers) {
        for (size_t i = 0; i < layer->weights.size(); ++i) {
            if (layer->weights[i] == nullptr) {
                throw ConfigurationError("Layer '" + layer->name +
                                         "' has a null weight at index " + std::to_string(i));
            }
        }
    }

    // The first prunable weight of a layer stands for the whole layer
    std::vector<std::vector<int64_t>> shapes;
    shapes.reserve(prunable.size());
    for (const auto& p : prunable) {
        shapes.push_back(p.layer->weights[p.indices.front()]->shape());
    }
    std::vector<double> sparsities = layer_sparsities(
        shapes, pruner.sparsity, layer_distribution_from_name(layer_distribution));

    PrunerMap map;
    for (const LayerSpec* layer : all_layers) {
        for (size_t i = 0; i < layer->weights.size(); ++i) {
            map.assign(*layer->weights[i], layer->weight_name(i), nullptr);
        }
    }

    for (size_t l = 0; l < prunable.size(); ++l) {
        RiglConfig layer_config = pruner;
        layer_config.sparsity = sparsities[l];
        layer_config.seed_offset = base_seed + static_cast<int64_t>(l);
        auto layer_pruner = std::make_shared<RiglPruner>(std::move(layer_config));

        const LayerSpec& layer = *prunable[l].layer;
        for (size_t idx : prunable[l].indices) {
            map.assign(*layer.weights[idx], layer.weight_name(idx), layer_pruner);
        }
    }
    return map;
}

} // namespace pruning
} // namespace dynsparse
