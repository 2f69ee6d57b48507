#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <optional>
#include "dynsparse/types.hpp"
#include "dynsparse/options.hpp"
#include "dynsparse/tensor.hpp"
#include "dynsparse/errors.hpp"

namespace py = pybind11;
using namespace dynsparse;

void bind_types(py::module_& m) {
    // DType enum
    py::enum_<DType>(m, "DType", "Tensor data types")
        .value("Float32", DType::Float32, "32-bit floating point")
        .value("Float64", DType::Float64, "64-bit floating point")
        .value("Int64", DType::Int64, "64-bit signed integer")
        .value("Int32", DType::Int32, "32-bit signed integer")
        .value("UInt8", DType::UInt8, "8-bit unsigned integer")
        .value("Bool", DType::Bool, "Boolean")
        .export_values();

    // BlockSize
    py::class_<BlockSize>(m, "BlockSize", "Selection block shape (rows, cols)")
        .def(py::init<>())
        .def(py::init([](int64_t rows, int64_t cols) {
            return BlockSize{rows, cols};
        }), py::arg("rows"), py::arg("cols"))
        .def_readwrite("rows", &BlockSize::rows)
        .def_readwrite("cols", &BlockSize::cols)
        .def("is_unit", &BlockSize::is_unit)
        .def("__repr__", [](const BlockSize& b) {
            return "BlockSize(" + std::to_string(b.rows) + ", " +
                   std::to_string(b.cols) + ")";
        });

    // RiglConfig
    py::class_<RiglConfig>(m, "RiglConfig", "RigL pruner configuration")
        .def(py::init<>())
        .def_readwrite("schedule", &RiglConfig::schedule,
                       "Update schedule (ConstantSchedule or CosineSchedule)")
        .def_readwrite("sparsity", &RiglConfig::sparsity,
                       "Target fraction of inactive positions, in [0, 1)")
        .def_readwrite("block_size", &RiglConfig::block_size)
        .def_readwrite("block_pooling", &RiglConfig::block_pooling,
                       "Block pooling: 'average' or 'max'")
        .def_readwrite("sparse_distribution", &RiglConfig::sparse_distribution)
        .def_property("density",
            [](const RiglConfig& c) -> std::optional<Tensor> {
                if (!c.density) return std::nullopt;
                return *c.density;
            },
            [](RiglConfig& c, std::optional<Tensor> density) {
                if (density) {
                    c.density = std::make_shared<const Tensor>(std::move(*density));
                } else {
                    c.density.reset();
                }
            },
            "Per-element probability of starting active (same shape as the weight), or None")
        .def_readwrite("seed", &RiglConfig::seed)
        .def_readwrite("seed_offset", &RiglConfig::seed_offset)
        .def_readwrite("noise_std", &RiglConfig::noise_std,
                       "Stddev of noise added to grow scores of inactive positions")
        .def_readwrite("grow_init", &RiglConfig::grow_init,
                       "'zeros', 'random_normal', 'random_uniform' or 'constant'")
        .def_readwrite("grow_init_value", &RiglConfig::grow_init_value)
        .def_readwrite("reinit_when_same", &RiglConfig::reinit_when_same)
        .def_readwrite("reset_momentum", &RiglConfig::reset_momentum)
        .def_readwrite("momentum_buffer", &RiglConfig::momentum_buffer)
        .def_readwrite("verbose", &RiglConfig::verbose)
        .def("validate", &RiglConfig::validate, "Validate configuration");

    // OptimizerOptions
    py::class_<OptimizerOptions>(m, "OptimizerOptions", "Host optimizer options")
        .def(py::init<>())
        .def_readwrite("learning_rate", &OptimizerOptions::learning_rate)
        .def_readwrite("momentum", &OptimizerOptions::momentum)
        .def_readwrite("log_level", &OptimizerOptions::log_level,
                       "Log level: 'debug', 'info', 'warning', 'error'")
        .def("validate", &OptimizerOptions::validate, "Validate options");

    // Exceptions
    py::register_exception<DynSparseError>(m, "DynSparseError",
        PyExc_RuntimeError);
    py::register_exception<ConfigurationError>(m, "ConfigurationError",
        m.attr("DynSparseError").ptr());
    py::register_exception<UnconfiguredStateError>(m, "UnconfiguredStateError",
        m.attr("DynSparseError").ptr());
    py::register_exception<ShapeMismatchError>(m, "ShapeMismatchError",
        m.attr("DynSparseError").ptr());
    py::register_exception<DTypeMismatchError>(m, "DTypeMismatchError",
        m.attr("DynSparseError").ptr());
}
