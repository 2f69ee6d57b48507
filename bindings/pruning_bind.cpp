#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "dynsparse/pruning/schedule.hpp"
#include "dynsparse/pruning/slot_store.hpp"
#include "dynsparse/pruning/sparse_distribution.hpp"
#include "dynsparse/pruning/top_k.hpp"
#include "dynsparse/pruning/rigl_pruner.hpp"
#include "dynsparse/pruning/pruning_config.hpp"
#include "dynsparse/report.hpp"

namespace py = pybind11;
using namespace dynsparse;
using namespace dynsparse::pruning;

void bind_pruning(py::module_& m) {
    auto pruning = m.def_submodule("pruning",
        "RigL dynamic sparse training");

    // ========================================================================
    // Schedules
    // ========================================================================

    py::enum_<ScheduleKind>(pruning, "ScheduleKind",
        "Drop-fraction curve")
        .value("CONSTANT", ScheduleKind::Constant,
            "Same drop fraction at every update step")
        .value("COSINE", ScheduleKind::Cosine,
            "Cosine-annealed drop fraction");

    py::class_<UpdateSchedule, std::shared_ptr<UpdateSchedule>>(pruning, "UpdateSchedule",
        "When to update the mask and how much to drop")
        .def("should_update", &UpdateSchedule::should_update, py::arg("step"))
        .def("drop_fraction", &UpdateSchedule::drop_fraction, py::arg("step"))
        .def("update_steps", &UpdateSchedule::update_steps,
            py::arg("first"), py::arg("last"),
            "Update steps in [first, last)")
        .def_property_readonly("kind", &UpdateSchedule::kind)
        .def_property_readonly("name", &UpdateSchedule::name)
        .def_property_readonly("begin_step", &UpdateSchedule::begin_step)
        .def_property_readonly("end_step", &UpdateSchedule::end_step)
        .def_property_readonly("frequency", &UpdateSchedule::frequency);

    py::class_<ConstantSchedule, UpdateSchedule, std::shared_ptr<ConstantSchedule>>(
        pruning, "ConstantSchedule")
        .def(py::init<double, int64_t, int64_t, int64_t>(),
            py::arg("drop_fraction"), py::arg("begin_step"),
            py::arg("end_step"), py::arg("frequency") = 100);

    py::class_<CosineSchedule, UpdateSchedule, std::shared_ptr<CosineSchedule>>(
        pruning, "CosineSchedule")
        .def(py::init<double, int64_t, int64_t, int64_t>(),
            py::arg("initial_drop_fraction"), py::arg("begin_step"),
            py::arg("end_step"), py::arg("frequency") = 100);

    pruning.def("make_schedule", [](const std::string& kind, double drop_fraction,
                                    int64_t begin_step, int64_t end_step, int64_t frequency) {
            return make_schedule(schedule_kind_from_name(kind), drop_fraction,
                                 begin_step, end_step, frequency);
        },
        py::arg("kind"), py::arg("drop_fraction"), py::arg("begin_step"),
        py::arg("end_step"), py::arg("frequency") = 100,
        "Create a schedule by name ('constant', 'cosine')");

    // ========================================================================
    // Slot store
    // ========================================================================

    py::class_<SlotStore>(pruning, "SlotStore",
        "Per-variable mask and momentum slots, keyed by tensor identity")
        .def(py::init<>())
        .def("name_variable", &SlotStore::name_variable,
            py::arg("var"), py::arg("name"))
        .def("variable_name", &SlotStore::variable_name, py::arg("var"))
        .def("has_variable", &SlotStore::has_variable, py::arg("var"))
        .def("has_slot", &SlotStore::has_slot, py::arg("var"), py::arg("slot"))
        .def("get_slot",
            py::overload_cast<const Tensor&, const std::string&>(&SlotStore::get_slot),
            py::arg("var"), py::arg("slot"),
            py::return_value_policy::reference_internal)
        .def("slot_names", &SlotStore::slot_names, py::arg("var"))
        .def("release", &SlotStore::release, py::arg("var"))
        .def_property_readonly("num_variables", &SlotStore::num_variables);

    // ========================================================================
    // Pruner
    // ========================================================================

    py::class_<MaskUpdateResult>(pruning, "MaskUpdateResult",
        "Summary of a committed mask update")
        .def_readonly("updated", &MaskUpdateResult::updated)
        .def_readonly("step", &MaskUpdateResult::step)
        .def_readonly("active", &MaskUpdateResult::active)
        .def_readonly("dropped", &MaskUpdateResult::dropped)
        .def_readonly("grown", &MaskUpdateResult::grown)
        .def_readonly("new_connections", &MaskUpdateResult::new_connections)
        .def("__repr__", [](const MaskUpdateResult& r) {
            return "MaskUpdateResult(updated=" + std::string(r.updated ? "True" : "False") +
                   ", step=" + std::to_string(r.step) +
                   ", dropped=" + std::to_string(r.dropped) +
                   ", grown=" + std::to_string(r.grown) + ")";
        });

    py::class_<RiglPruner, std::shared_ptr<RiglPruner>>(pruning, "RiglPruner",
        "RigL drop/grow mask-update engine")
        .def(py::init<RiglConfig>(), py::arg("config"))
        .def("create_slots", &RiglPruner::create_slots,
            py::arg("store"), py::arg("weight"))
        .def("preprocess", &RiglPruner::preprocess,
            py::arg("store"), py::arg("weight"), py::arg("gradient"), py::arg("step"))
        .def("postprocess", &RiglPruner::postprocess,
            py::arg("store"), py::arg("weight"), py::arg("gradient"), py::arg("step"))
        .def("update_mask", &RiglPruner::update_mask,
            py::arg("store"), py::arg("weight"), py::arg("gradient"), py::arg("step"),
            "preprocess followed by postprocess")
        .def("get_grow_scores", &RiglPruner::get_grow_scores,
            py::arg("mask"), py::arg("gradient"), py::arg("step"))
        .def_property_readonly("config", &RiglPruner::config)
        .def_property_readonly("target_sparsity", &RiglPruner::target_sparsity);

    // ========================================================================
    // Utilities
    // ========================================================================

    pruning.def("initial_mask_density", &initial_mask_density,
        py::arg("shape"), py::arg("target_sparsity"), py::arg("seed"),
        py::arg("seed_offset") = 0, py::arg("block_size") = BlockSize{},
        "Initial mask with exactly round((1 - sparsity) * blocks) active blocks");

    pruning.def("layer_sparsities", [](const std::vector<std::vector<int64_t>>& shapes,
                                       double overall_sparsity,
                                       const std::string& distribution) {
            return layer_sparsities(shapes, overall_sparsity,
                                    layer_distribution_from_name(distribution));
        },
        py::arg("shapes"), py::arg("overall_sparsity"), py::arg("distribution") = "uniform");

    pruning.def("select_top_k",
        py::overload_cast<const Tensor&, int64_t>(&select_top_k),
        py::arg("scores"), py::arg("keep_count"),
        "0/1 mask of the keep_count highest scores (ties to the lower index)");

    // ========================================================================
    // Model configuration
    // ========================================================================

    py::enum_<Prunability>(pruning, "Prunability")
        .value("NATIVELY_PRUNABLE", Prunability::NativelyPrunable)
        .value("REGISTRY_SUPPORTED", Prunability::RegistrySupported)
        .value("NOT_PRUNABLE", Prunability::NotPrunable);

    py::class_<LayerSpec>(pruning, "LayerSpec",
        "Layer description; weights are referenced, not copied")
        .def(py::init<>())
        .def_readwrite("name", &LayerSpec::name)
        .def_readwrite("type", &LayerSpec::type)
        .def_property("weights",
            [](const LayerSpec& l) {
                py::list out;
                for (Tensor* w : l.weights) {
                    out.append(py::cast(w, py::return_value_policy::reference));
                }
                return out;
            },
            [](LayerSpec& l, const std::vector<Tensor*>& weights) { l.weights = weights; })
        .def_readwrite("weight_names", &LayerSpec::weight_names)
        .def_readwrite("natively_prunable", &LayerSpec::natively_prunable)
        .def_readwrite("prunable_weights", &LayerSpec::prunable_weights)
        .def_readwrite("sublayers", &LayerSpec::sublayers);

    pruning.def("resolve_capability", [](const LayerSpec& layer) {
            return resolve_capability(layer)->kind();
        }, py::arg("layer"));

    py::class_<PruneRegistry, std::unique_ptr<PruneRegistry, py::nodelete>>(
        pruning, "PruneRegistry", "Prunable weights per layer type")
        .def_static("instance", &PruneRegistry::instance,
            py::return_value_policy::reference)
        .def("register_layer", &PruneRegistry::register_layer,
            py::arg("layer_type"), py::arg("weight_indices"))
        .def("supports", &PruneRegistry::supports, py::arg("layer_type"))
        .def("list_layers", &PruneRegistry::list_layers)
        .def("unregister_layer", &PruneRegistry::unregister_layer, py::arg("layer_type"))
        .def("reset_defaults", &PruneRegistry::reset_defaults);

    py::class_<PrunerMap, std::shared_ptr<PrunerMap>>(pruning, "PrunerMap",
        "Weight -> pruner assignment of a configured model")
        .def("get_pruner", &PrunerMap::get_pruner, py::arg("weight"))
        .def("contains", &PrunerMap::contains, py::arg("weight"))
        .def("name_of", &PrunerMap::name_of, py::arg("weight"))
        .def("pruners", &PrunerMap::pruners)
        .def_property_readonly("num_prunable", &PrunerMap::num_prunable)
        .def("__len__", &PrunerMap::size);

    py::class_<RiglPruningConfig>(pruning, "RiglPruningConfig",
        "Builds one RigL pruner per prunable layer")
        .def(py::init<>())
        .def_readwrite("pruner", &RiglPruningConfig::pruner)
        .def_readwrite("base_seed", &RiglPruningConfig::base_seed)
        .def_readwrite("layer_distribution", &RiglPruningConfig::layer_distribution)
        .def("validate", &RiglPruningConfig::validate)
        .def("build", [](const RiglPruningConfig& self, const std::vector<LayerSpec>& model) {
                return std::make_shared<PrunerMap>(self.build(model));
            }, py::arg("model"),
            "The model's weights must outlive the returned map");

    // ========================================================================
    // Report
    // ========================================================================

    py::class_<VariableStats>(pruning, "VariableStats")
        .def_readonly("name", &VariableStats::name)
        .def_readonly("shape", &VariableStats::shape)
        .def_readonly("total_params", &VariableStats::total_params)
        .def_readonly("active_params", &VariableStats::active_params)
        .def_readonly("sparsity", &VariableStats::sparsity)
        .def_readonly("target_sparsity", &VariableStats::target_sparsity)
        .def_readonly("prunable", &VariableStats::prunable);

    py::class_<SparsityStats>(pruning, "SparsityStats")
        .def_readonly("variables", &SparsityStats::variables)
        .def_readonly("total_params", &SparsityStats::total_params)
        .def_readonly("active_params", &SparsityStats::active_params)
        .def_readonly("overall_sparsity", &SparsityStats::overall_sparsity)
        .def_readonly("prunable_params", &SparsityStats::prunable_params)
        .def_readonly("prunable_sparsity", &SparsityStats::prunable_sparsity)
        .def("__str__", &format_report);

    pruning.def("collect_stats", &collect_stats,
        py::arg("pruners"), py::arg("store"));
    pruning.def("format_report", &format_report, py::arg("stats"));
}
