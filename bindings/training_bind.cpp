#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "dynsparse/training/pruning_optimizer.hpp"

namespace py = pybind11;
using namespace dynsparse;
using namespace dynsparse::training;

namespace {

using PyGradients = std::vector<std::pair<Tensor*, Tensor*>>;

std::vector<GradientPair> to_gradient_pairs(const PyGradients& grads_and_vars) {
    std::vector<GradientPair> out;
    out.reserve(grads_and_vars.size());
    for (const auto& [weight, gradient] : grads_and_vars) {
        if (gradient == nullptr) {
            throw std::invalid_argument("gradient must not be None");
        }
        out.push_back(GradientPair{weight, *gradient});
    }
    return out;
}

} // anonymous namespace

void bind_training(py::module_& m) {
    auto training = m.def_submodule("training",
        "Reference SGD host driving the RigL pruners");

    py::class_<StepResult>(training, "StepResult")
        .def_readonly("step", &StepResult::step)
        .def_readonly("mask_updates", &StepResult::mask_updates)
        .def_readonly("new_connections", &StepResult::new_connections);

    py::class_<PruningOptimizer>(training, "PruningOptimizer",
        "SGD with masked gradients and periodic RigL mask updates")
        .def(py::init([](std::shared_ptr<pruning::PrunerMap> pruners,
                         const OptimizerOptions& options) {
                return std::make_unique<PruningOptimizer>(std::move(pruners), options);
            }),
            py::arg("pruners"), py::arg("options") = OptimizerOptions{},
            py::keep_alive<1, 2>())
        .def("apply_gradients", [](PruningOptimizer& self, const PyGradients& grads_and_vars) {
                return self.apply_gradients(to_gradient_pairs(grads_and_vars));
            }, py::arg("grads_and_vars"),
            "One optimizer step from [(weight, gradient), ...]")
        .def("run_steps", [](PruningOptimizer& self, int64_t num_steps, py::function provider) {
                return self.run_steps(num_steps, [&provider](int64_t step) {
                    return to_gradient_pairs(provider(step).cast<PyGradients>());
                });
            }, py::arg("num_steps"), py::arg("provider"),
            "Run num_steps steps; provider(step) returns [(weight, gradient), ...]")
        .def("planned_update_steps", &PruningOptimizer::planned_update_steps,
            py::arg("first"), py::arg("last"))
        .def("mask", &PruningOptimizer::mask, py::arg("weight"),
            py::return_value_policy::reference_internal)
        .def_property_readonly("iterations", &PruningOptimizer::iterations)
        .def_property_readonly("slots",
            py::overload_cast<>(&PruningOptimizer::slots, py::const_),
            py::return_value_policy::reference_internal);
}
